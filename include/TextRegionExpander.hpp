#pragma once

#include "ImageProcessor.hpp"
#include <optional>

namespace BalloonTrace {

// Grows a known text box (pixel space) into the surrounding balloon with GrabCut.
class TextRegionExpander {
public:
    using ProcessingParams = ImageProcessor::ProcessingParams;

    struct Segmentation {
        Contour contour;     // Outer contour of the largest foreground component, pixels
        cv::Rect seed;       // Text box after clamping to the image
        int iterations = 0;
        bool converged = false;
    };

    // Normalized balloon box, or nullopt when no region larger than the text box is found.
    static std::optional<cv::Rect2d> expandTextToBalloon(const cv::Mat& image, const cv::Rect& textRect,
                                                         const ProcessingParams& params);
    static std::optional<cv::Rect2d> expandTextToBalloon(const cv::Mat& image, const cv::Rect& textRect);

    // Simplified balloon outline in pixels, empty when segmentation finds nothing.
    static Contour refineContour(const cv::Mat& image, const cv::Rect& textRect, const ProcessingParams& params);
    static Contour refineContour(const cv::Mat& image, const cv::Rect& textRect);

    static cv::Rect clampToImage(const cv::Rect& rect, const cv::Size& imageSize);

    // GC_PR_FGD inside the seed, GC_PR_BGD in the margin around it, GC_BGD elsewhere.
    static cv::Mat buildSeedMask(const cv::Size& imageSize, const cv::Rect& seed, const ProcessingParams& params);

    static std::optional<Segmentation> segment(const cv::Mat& image, const cv::Rect& textRect,
                                               const ProcessingParams& params);
};

} // namespace BalloonTrace
