#pragma once

#include "ImageProcessor.hpp"
#include <optional>
#include <vector>

namespace BalloonTrace {

struct RegionMatch {
    enum class Method { None, Overlap, Distance };

    size_t textIndex = 0;
    std::optional<size_t> balloonIndex;
    double score = 0.0;          // IoU for Overlap, centre distance for Distance
    Method method = Method::None;
};

// Pairs text boxes (e.g. from OCR) with detected balloon boxes. All rectangles are normalized.
class BalloonMatcher {
public:
    static double intersectionOverUnion(const cv::Rect2d& a, const cv::Rect2d& b);
    static double centerDistance(const cv::Rect2d& a, const cv::Rect2d& b);

    // One entry per text rect, in input order. Each balloon is claimed at most once.
    static std::vector<RegionMatch> matchRegions(const std::vector<cv::Rect2d>& textRects,
                                                 const std::vector<cv::Rect2d>& balloonRects,
                                                 const ImageProcessor::ProcessingParams& params);
};

} // namespace BalloonTrace
