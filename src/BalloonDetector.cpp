#include "BalloonDetector.hpp"
#include <iostream>
#include <algorithm>
#include <cmath>
#include <climits>

using namespace cv;
using namespace std;

namespace BalloonTrace {

DetectionResult::DetectionResult(const Mat& markedImage,
                                 vector<Rect2d> balloonRects,
                                 vector<Contour> contours)
    : m_markedImage(markedImage.clone()),
      m_balloonRects(std::move(balloonRects)),
      m_contours(std::move(contours)) {
    if (m_balloonRects.size() != m_contours.size()) {
        throw ProcessingError("Detection result has " + to_string(m_balloonRects.size()) + " rectangles but " +
                              to_string(m_contours.size()) + " contours");
    }
}

vector<Contour> BalloonDetector::extractContours(const Mat& binaryImg) {
    ImageProcessor::validateImage(binaryImg, "Contour extraction");
    if (binaryImg.channels() != 1) {
        throw InvalidInputError("Contour extraction: expected a single-channel binary image, got " +
                                to_string(binaryImg.channels()) + " channels");
    }

    return guardStage("Contour extraction", [&] {
        vector<Contour> contours;
        findContours(binaryImg, contours, RETR_EXTERNAL, CHAIN_APPROX_SIMPLE);
        return contours;
    });
}

Rect2d BalloonDetector::normalizeRect(const Rect& rect, const Size& imageSize) {
    if (imageSize.width <= 0 || imageSize.height <= 0) {
        throw InvalidInputError("Cannot normalize against an empty image size");
    }

    Rect clipped = rect & Rect(0, 0, imageSize.width, imageSize.height);
    double width = imageSize.width;
    double height = imageSize.height;

    auto unit = [](double v) { return std::min(1.0, std::max(0.0, v)); };
    return Rect2d(unit(clipped.x / width), unit(clipped.y / height),
                  unit(clipped.width / width), unit(clipped.height / height));
}

double BalloonDetector::meanBrightness(const Mat& gray, const Contour& contour) {
    ImageProcessor::validateImage(gray, "Brightness check");
    if (gray.channels() != 1) {
        throw InvalidInputError("Brightness check: expected a grayscale image");
    }

    Rect rect = boundingRect(contour) & Rect(0, 0, gray.cols, gray.rows);
    if (rect.empty()) return 0.0;

    return guardStage("Brightness check", [&] {
        Mat mask = Mat::zeros(rect.size(), CV_8UC1);
        vector<Contour> single = {contour};
        drawContours(mask, single, 0, Scalar(255), FILLED, LINE_8, noArray(), INT_MAX, -rect.tl());
        return mean(gray(rect), mask)[0];
    });
}

vector<BalloonCandidate> BalloonDetector::selectCandidates(const vector<Contour>& contours,
                                                           const Size& imageSize,
                                                           const ProcessingParams& params) {
    return select(contours, imageSize, Mat(), params);
}

vector<BalloonCandidate> BalloonDetector::selectCandidates(const vector<Contour>& contours,
                                                           const Mat& image,
                                                           const ProcessingParams& params) {
    ImageProcessor::validateImage(image, "Candidate filtering");
    Mat gray = ImageProcessor::convertToGrayscale(image);
    return select(contours, image.size(), gray, params);
}

vector<BalloonCandidate> BalloonDetector::select(const vector<Contour>& contours, const Size& imageSize,
                                                 const Mat& gray, const ProcessingParams& params) {
    if (imageSize.width <= 0 || imageSize.height <= 0) {
        throw InvalidInputError("Candidate filtering: image dimensions must be positive");
    }
    ImageProcessor::validateParams(params);

    const double imageArea = static_cast<double>(imageSize.width) * imageSize.height;
    vector<BalloonCandidate> candidates;
    int filteredCount = 0;

    for (const auto& contour : contours) {
        if (contour.empty()) {
            filteredCount++;
            continue;
        }

        Rect rect = boundingRect(contour);
        double areaRatio = rect.area() / imageArea;

        if (areaRatio < params.minAreaRatio) {
            if (params.verboseOutput) {
                cout << "[INFO] Filtered (too small): area ratio=" << areaRatio << endl;
            }
            filteredCount++;
            continue;
        }
        if (areaRatio > params.maxAreaRatio) {
            if (params.verboseOutput) {
                cout << "[INFO] Filtered (too large): area ratio=" << areaRatio << endl;
            }
            filteredCount++;
            continue;
        }

        double aspectRatio = static_cast<double>(rect.width) / rect.height;
        if (aspectRatio < params.minAspectRatio || aspectRatio > params.maxAspectRatio) {
            if (params.verboseOutput) {
                cout << "[INFO] Filtered (bad aspect): aspect=" << aspectRatio << endl;
            }
            filteredCount++;
            continue;
        }

        if (params.minSolidity > 0.0) {
            Contour hull;
            convexHull(contour, hull);
            double hullArea = contourArea(hull);
            double solidity = hullArea > 0.0 ? contourArea(contour) / hullArea : 0.0;
            if (solidity < params.minSolidity) {
                if (params.verboseOutput) {
                    cout << "[INFO] Filtered (low solidity): solidity=" << solidity << endl;
                }
                filteredCount++;
                continue;
            }
        }

        // Balloon interiors are near white
        if (params.minMeanBrightness > 0.0 && !gray.empty()) {
            double brightness = meanBrightness(gray, contour);
            if (brightness < params.minMeanBrightness) {
                if (params.verboseOutput) {
                    cout << "[INFO] Filtered (too dark): mean brightness=" << brightness << endl;
                }
                filteredCount++;
                continue;
            }
        }

        BalloonCandidate candidate;
        candidate.contour = contour;
        candidate.pixelRect = rect;
        candidate.normalizedRect = normalizeRect(rect, imageSize);
        candidate.areaRatio = areaRatio;

        Moments m = moments(contour);
        if (m.m00 > 0.0) {
            candidate.center = Point2d(m.m10 / m.m00, m.m01 / m.m00);
        } else {
            candidate.center = Point2d(rect.x + rect.width / 2.0, rect.y + rect.height / 2.0);
        }

        candidates.push_back(std::move(candidate));
    }

    if (params.verboseOutput) {
        cout << "[INFO] Accepted " << candidates.size() << " balloon candidates (filtered out "
             << filteredCount << ")" << endl;
    }
    return candidates;
}

vector<Rect2d> BalloonDetector::filterCandidates(const vector<Contour>& contours,
                                                 const Size& imageSize,
                                                 const ProcessingParams& params) {
    vector<Rect2d> rects;
    for (const auto& candidate : selectCandidates(contours, imageSize, params)) {
        rects.push_back(candidate.normalizedRect);
    }
    return rects;
}

vector<BalloonCandidate> BalloonDetector::sortReadingOrder(vector<BalloonCandidate> candidates,
                                                           int rowTolerance) {
    if (candidates.size() < 2) return candidates;

    stable_sort(candidates.begin(), candidates.end(),
                [](const BalloonCandidate& a, const BalloonCandidate& b) { return a.center.y < b.center.y; });

    // Each row is anchored on its first (topmost) member.
    vector<vector<BalloonCandidate>> rows;
    rows.push_back({candidates[0]});
    for (size_t i = 1; i < candidates.size(); ++i) {
        auto& lastRow = rows.back();
        if (std::abs(candidates[i].center.y - lastRow[0].center.y) < rowTolerance) {
            lastRow.push_back(candidates[i]);
        } else {
            rows.push_back({candidates[i]});
        }
    }

    vector<BalloonCandidate> ordered;
    ordered.reserve(candidates.size());
    for (auto& row : rows) {
        stable_sort(row.begin(), row.end(),
                    [](const BalloonCandidate& a, const BalloonCandidate& b) { return a.center.x < b.center.x; });
        for (auto& candidate : row) {
            ordered.push_back(std::move(candidate));
        }
    }
    return ordered;
}

Mat BalloonDetector::annotate(const Mat& image, const vector<BalloonCandidate>& candidates) {
    Mat marked = ImageProcessor::convertToBGR(image);

    return guardStage("Annotation", [&] {
        const int fontFace = FONT_HERSHEY_SIMPLEX;
        const double fontScale = std::max(0.4, std::min(marked.cols, marked.rows) / 500.0);
        const int thickness = std::max(1, cvRound(fontScale * 1.5));

        for (size_t i = 0; i < candidates.size(); ++i) {
            const auto& candidate = candidates[i];
            vector<Contour> single = {candidate.contour};
            drawContours(marked, single, 0, Scalar(0, 255, 0), 2);

            string label = to_string(i + 1);
            int baseline = 0;
            Size textSize = getTextSize(label, fontFace, fontScale, thickness, &baseline);
            Point origin(cvRound(candidate.center.x) - textSize.width / 2,
                         cvRound(candidate.center.y) + textSize.height / 2);

            // Black outline under red fill for readability on any background
            putText(marked, label, origin, fontFace, fontScale, Scalar(0, 0, 0), thickness + 2);
            putText(marked, label, origin, fontFace, fontScale, Scalar(0, 0, 255), thickness);
        }
        return marked;
    });
}

DetectionResult BalloonDetector::detectAndMarkBalloons(const Mat& image, const ProcessingParams& params) {
    ImageProcessor::validateImage(image, "Balloon detection");
    ImageProcessor::validateParams(params);

    if (params.verboseOutput) {
        cout << "[INFO] Starting balloon detection pipeline..." << endl;
    }

    ImageProcessor::DebugStack debug;
    ImageProcessor::pushDebugImage(debug, image, "original", params);

    Mat edges = ImageProcessor::preprocess(image, params, debug);
    vector<Contour> contours = extractContours(edges);
    ImageProcessor::pushDebugContours(debug, image, contours, "all_contours", params);

    if (params.verboseOutput) {
        cout << "[INFO] Found " << contours.size() << " total contours" << endl;
    }

    vector<BalloonCandidate> candidates = selectCandidates(contours, image, params);
    candidates = sortReadingOrder(std::move(candidates), params.readingOrderRowTolerance);

    Mat marked = annotate(image, candidates);
    ImageProcessor::pushDebugImage(debug, marked, "marked_balloons", params);

    vector<Rect2d> rects;
    vector<Contour> accepted;
    rects.reserve(candidates.size());
    accepted.reserve(candidates.size());
    for (auto& candidate : candidates) {
        rects.push_back(candidate.normalizedRect);
        accepted.push_back(std::move(candidate.contour));
    }

    ImageProcessor::flushDebugStack(debug, params);

    if (params.verboseOutput) {
        cout << "[INFO] Detected " << rects.size() << " balloons" << endl;
    }
    return DetectionResult(marked, std::move(rects), std::move(accepted));
}

DetectionResult BalloonDetector::detectAndMarkBalloons(const Mat& image) {
    ProcessingParams params;
    return detectAndMarkBalloons(image, params);
}

} // namespace BalloonTrace
