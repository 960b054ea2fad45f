#include "BalloonMatcher.hpp"
#include <iostream>
#include <cmath>
#include <limits>

using namespace cv;
using namespace std;

namespace BalloonTrace {

double BalloonMatcher::intersectionOverUnion(const Rect2d& a, const Rect2d& b) {
    double intersection = (a & b).area();
    double unionArea = a.area() + b.area() - intersection;
    if (unionArea <= 0.0) return 0.0;
    return intersection / unionArea;
}

double BalloonMatcher::centerDistance(const Rect2d& a, const Rect2d& b) {
    double dx = (a.x + a.width / 2.0) - (b.x + b.width / 2.0);
    double dy = (a.y + a.height / 2.0) - (b.y + b.height / 2.0);
    return std::hypot(dx, dy);
}

vector<RegionMatch> BalloonMatcher::matchRegions(const vector<Rect2d>& textRects,
                                                 const vector<Rect2d>& balloonRects,
                                                 const ImageProcessor::ProcessingParams& params) {
    ImageProcessor::validateParams(params);

    vector<RegionMatch> matches(textRects.size());
    vector<bool> claimed(balloonRects.size(), false);

    // Stage A: best overlap among unclaimed balloons
    for (size_t t = 0; t < textRects.size(); ++t) {
        matches[t].textIndex = t;

        double bestIoU = 0.0;
        optional<size_t> best;
        for (size_t b = 0; b < balloonRects.size(); ++b) {
            if (claimed[b]) continue;
            double iou = intersectionOverUnion(textRects[t], balloonRects[b]);
            if (iou > params.minMatchIoU && iou > bestIoU) {
                bestIoU = iou;
                best = b;
            }
        }

        if (best) {
            claimed[*best] = true;
            matches[t].balloonIndex = best;
            matches[t].score = bestIoU;
            matches[t].method = RegionMatch::Method::Overlap;
            if (params.verboseOutput) {
                cout << "[INFO] Text " << t << " matched balloon " << *best << " (IoU " << bestIoU << ")" << endl;
            }
        }
    }

    // Stage B: nearest unclaimed centre for the rest
    for (size_t t = 0; t < textRects.size(); ++t) {
        if (matches[t].balloonIndex) continue;

        double minDistance = numeric_limits<double>::max();
        optional<size_t> closest;
        for (size_t b = 0; b < balloonRects.size(); ++b) {
            if (claimed[b]) continue;
            double distance = centerDistance(textRects[t], balloonRects[b]);
            if (distance < minDistance) {
                minDistance = distance;
                closest = b;
            }
        }

        if (closest && minDistance < params.maxMatchDistance) {
            claimed[*closest] = true;
            matches[t].balloonIndex = closest;
            matches[t].score = minDistance;
            matches[t].method = RegionMatch::Method::Distance;
            if (params.verboseOutput) {
                cout << "[INFO] Text " << t << " fell back to balloon " << *closest
                     << " (distance " << minDistance << ")" << endl;
            }
        } else if (params.verboseOutput) {
            cout << "[INFO] Text " << t << " has no free balloon nearby" << endl;
        }
    }

    return matches;
}

} // namespace BalloonTrace
