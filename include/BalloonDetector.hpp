#pragma once

#include "ImageProcessor.hpp"
#include <vector>

namespace BalloonTrace {

// An accepted contour together with its pixel and normalized bounding boxes.
struct BalloonCandidate {
    Contour contour;
    cv::Rect pixelRect;
    cv::Rect2d normalizedRect;
    cv::Point2d center;
    double areaRatio = 0.0;
};

// Annotated image plus positionally paired balloon rectangles (normalized) and contours (pixels).
class DetectionResult {
public:
    DetectionResult() = default;
    DetectionResult(const cv::Mat& markedImage,
                    std::vector<cv::Rect2d> balloonRects,
                    std::vector<Contour> contours);

    const cv::Mat& markedImage() const { return m_markedImage; }
    const std::vector<cv::Rect2d>& balloonRects() const { return m_balloonRects; }
    const std::vector<Contour>& contours() const { return m_contours; }

    size_t size() const { return m_balloonRects.size(); }
    bool empty() const { return m_balloonRects.empty(); }

private:
    cv::Mat m_markedImage;
    std::vector<cv::Rect2d> m_balloonRects;
    std::vector<Contour> m_contours;
};

class BalloonDetector {
public:
    using ProcessingParams = ImageProcessor::ProcessingParams;

    // Outer contours of a single-channel binary image, in tracing order.
    static std::vector<Contour> extractContours(const cv::Mat& binaryImg);

    static cv::Rect2d normalizeRect(const cv::Rect& rect, const cv::Size& imageSize);

    // Mean gray level of `gray` inside the filled contour.
    static double meanBrightness(const cv::Mat& gray, const Contour& contour);

    // Geometry only: area band, aspect band, solidity.
    static std::vector<BalloonCandidate> selectCandidates(const std::vector<Contour>& contours,
                                                          const cv::Size& imageSize,
                                                          const ProcessingParams& params);
    // Geometry plus the mean brightness of each contour's interior in `image`.
    static std::vector<BalloonCandidate> selectCandidates(const std::vector<Contour>& contours,
                                                          const cv::Mat& image,
                                                          const ProcessingParams& params);
    static std::vector<cv::Rect2d> filterCandidates(const std::vector<Contour>& contours,
                                                    const cv::Size& imageSize,
                                                    const ProcessingParams& params);

    // Top-to-bottom rows, left-to-right within a row.
    static std::vector<BalloonCandidate> sortReadingOrder(std::vector<BalloonCandidate> candidates,
                                                          int rowTolerance);

    // BGR copy of the image with each contour and its 1-based index drawn on it.
    static cv::Mat annotate(const cv::Mat& image, const std::vector<BalloonCandidate>& candidates);

    static DetectionResult detectAndMarkBalloons(const cv::Mat& image, const ProcessingParams& params);
    static DetectionResult detectAndMarkBalloons(const cv::Mat& image);

private:
    static std::vector<BalloonCandidate> select(const std::vector<Contour>& contours, const cv::Size& imageSize,
                                                const cv::Mat& gray, const ProcessingParams& params);
};

} // namespace BalloonTrace
