#include "TextRegionExpander.hpp"
#include <iostream>
#include <algorithm>

using namespace cv;
using namespace std;

namespace BalloonTrace {

namespace {

// GrabCut fits five-component GMMs with k-means, which needs at least that many samples per side.
const int kMinGmmSamples = 10;

// GrabCut draws its k-means centres from the thread's RNG. Pin it for the call, then put it back.
class ScopedRngSeed {
public:
    explicit ScopedRngSeed(uint64_t seed) : m_saved(theRNG()) { theRNG() = RNG(seed); }
    ~ScopedRngSeed() { theRNG() = m_saved; }

    ScopedRngSeed(const ScopedRngSeed&) = delete;
    ScopedRngSeed& operator=(const ScopedRngSeed&) = delete;

private:
    RNG m_saved;
};

Mat foregroundOf(const Mat& mask) {
    return (mask == GC_FGD) | (mask == GC_PR_FGD);
}

Rect marginRegion(const Rect& seed, const Size& imageSize, double expansionMargin) {
    int margin = std::max(1, cvRound(expansionMargin * std::max(seed.width, seed.height)));
    Rect region(seed.x - margin, seed.y - margin, seed.width + 2 * margin, seed.height + 2 * margin);
    return region & Rect(0, 0, imageSize.width, imageSize.height);
}

} // namespace

Rect TextRegionExpander::clampToImage(const Rect& rect, const Size& imageSize) {
    return rect & Rect(0, 0, imageSize.width, imageSize.height);
}

Mat TextRegionExpander::buildSeedMask(const Size& imageSize, const Rect& seed, const ProcessingParams& params) {
    Mat mask(imageSize, CV_8UC1, Scalar(GC_BGD));
    Rect region = marginRegion(seed, imageSize, params.expansionMargin);
    mask(region).setTo(Scalar(GC_PR_BGD));
    mask(seed).setTo(Scalar(GC_PR_FGD));
    return mask;
}

optional<TextRegionExpander::Segmentation> TextRegionExpander::segment(const Mat& image, const Rect& textRect,
                                                                       const ProcessingParams& params) {
    ImageProcessor::validateImage(image, "Text region expansion");
    ImageProcessor::validateParams(params);
    if (textRect.width <= 0 || textRect.height <= 0) {
        throw InvalidInputError("Text rectangle must have positive width and height");
    }

    Segmentation result;
    result.seed = clampToImage(textRect, image.size());
    const Rect& seed = result.seed;

    if (seed.empty()) {
        cout << "[WARN] Text rectangle lies outside the image, nothing to expand" << endl;
        return nullopt;
    }

    const int imageArea = image.rows * image.cols;
    if (seed.area() == imageArea) {
        if (params.verboseOutput) {
            cout << "[INFO] Text rectangle covers the whole image, no room to expand" << endl;
        }
        return nullopt;
    }
    if (seed.area() < kMinGmmSamples || imageArea - seed.area() < kMinGmmSamples) {
        cout << "[WARN] Not enough foreground or background pixels to seed segmentation" << endl;
        return nullopt;
    }

    if (params.verboseOutput) {
        cout << "[INFO] GrabCut seed: " << seed.x << "," << seed.y << " " << seed.width << "x" << seed.height << endl;
    }

    ImageProcessor::DebugStack debug;
    Mat bgr = ImageProcessor::convertToBGR(image);
    Mat mask = buildSeedMask(image.size(), seed, params);
    ImageProcessor::pushDebugImage(debug, mask * 80, "grabcut_seed", params);

    const double regionArea = marginRegion(seed, image.size(), params.expansionMargin).area();

    guardStage("GrabCut segmentation", [&] {
        ScopedRngSeed rngSeed(params.segmentationSeed);
        Mat bgdModel, fgdModel;
        Mat previous = foregroundOf(mask);

        while (result.iterations < params.grabCutIterations) {
            int mode = result.iterations == 0 ? GC_INIT_WITH_MASK : GC_EVAL;
            grabCut(bgr, mask, Rect(), bgdModel, fgdModel, 1, mode);
            result.iterations++;

            Mat current = foregroundOf(mask);
            double changed = countNonZero(current != previous) / regionArea;
            previous = current;
            if (changed <= params.convergenceEpsilon) {
                result.converged = true;
                break;
            }
        }
    });

    if (params.verboseOutput) {
        cout << "[INFO] GrabCut ran " << result.iterations << " iteration(s), "
             << (result.converged ? "converged" : "hit the iteration cap") << endl;
    }

    Mat foreground = foregroundOf(mask);
    ImageProcessor::pushDebugImage(debug, foreground, "grabcut_foreground", params);
    ImageProcessor::flushDebugStack(debug, params);

    vector<Contour> contours = guardStage("Foreground contour extraction", [&] {
        vector<Contour> found;
        findContours(foreground, found, RETR_EXTERNAL, CHAIN_APPROX_SIMPLE);
        return found;
    });

    double maxArea = -1.0;
    int maxIdx = -1;
    for (size_t i = 0; i < contours.size(); i++) {
        double area = contourArea(contours[i]);
        if (area > maxArea) {
            maxArea = area;
            maxIdx = static_cast<int>(i);
        }
    }

    if (maxIdx < 0) {
        if (params.verboseOutput) {
            cout << "[INFO] Segmentation left no foreground" << endl;
        }
        return nullopt;
    }

    result.contour = contours[maxIdx];
    return result;
}

optional<Rect2d> TextRegionExpander::expandTextToBalloon(const Mat& image, const Rect& textRect,
                                                         const ProcessingParams& params) {
    optional<Segmentation> segmentation = segment(image, textRect, params);
    if (!segmentation) {
        return nullopt;
    }

    Rect balloon = clampToImage(boundingRect(segmentation->contour), image.size());
    if (balloon.area() <= segmentation->seed.area()) {
        if (params.verboseOutput) {
            cout << "[INFO] No enclosing balloon found for text region" << endl;
        }
        return nullopt;
    }

    if (params.verboseOutput) {
        cout << "[INFO] Found balloon: rect=(" << balloon.x << "," << balloon.y << ","
             << balloon.width << "," << balloon.height << ")" << endl;
    }

    double width = image.cols;
    double height = image.rows;
    return Rect2d(balloon.x / width, balloon.y / height, balloon.width / width, balloon.height / height);
}

optional<Rect2d> TextRegionExpander::expandTextToBalloon(const Mat& image, const Rect& textRect) {
    ProcessingParams params;
    return expandTextToBalloon(image, textRect, params);
}

Contour TextRegionExpander::refineContour(const Mat& image, const Rect& textRect, const ProcessingParams& params) {
    optional<Segmentation> segmentation = segment(image, textRect, params);
    if (!segmentation) {
        return {};
    }

    if (params.contourEpsilon <= 0.0) {
        return segmentation->contour;
    }

    return guardStage("Contour simplification", [&] {
        Contour approx;
        approxPolyDP(segmentation->contour, approx, params.contourEpsilon, true);
        return approx;
    });
}

Contour TextRegionExpander::refineContour(const Mat& image, const Rect& textRect) {
    ProcessingParams params;
    return refineContour(image, textRect, params);
}

} // namespace BalloonTrace
