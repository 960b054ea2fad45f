#pragma once

#include <opencv2/opencv.hpp>
#include <opencv2/photo.hpp>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace BalloonTrace {

using Contour = std::vector<cv::Point>;

// Null, empty or unsupported image, malformed rectangle.
class InvalidInputError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// Threshold, kernel size or band outside its accepted range.
class InvalidParameterError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// The underlying library failed while running a stage. No partial result exists.
class ProcessingError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Runs an OpenCV-backed stage and rethrows library failures as ProcessingError.
template <typename Fn>
auto guardStage(const char* stage, Fn&& fn) -> decltype(fn()) {
    try {
        return fn();
    } catch (const cv::Exception& e) {
        throw ProcessingError(std::string(stage) + " failed: " + e.what());
    }
}

class ImageProcessor {
public:
    struct ProcessingParams {
        // Preprocessing: blur -> Canny -> closing
        int blurKernelSize = 5;
        double cannyLower = 30.0;
        double cannyUpper = 90.0;
        int morphKernelSize = 15;        // Elliptical kernel, must be odd

        // Candidate acceptance band (bounding box area / image area)
        double minAreaRatio = 0.001;
        double maxAreaRatio = 0.5;
        double minAspectRatio = 0.2;     // width / height
        double maxAspectRatio = 5.0;
        double minSolidity = 0.0;        // contour area / hull area, 0 = disabled
        double minMeanBrightness = 215.0; // mean gray level inside the filled contour, 0 = disabled

        // Reading order: centres closer than this (pixels) share a row
        int readingOrderRowTolerance = 50;

        // Text-seeded expansion (GrabCut)
        int grabCutIterations = 5;       // Iteration cap
        double expansionMargin = 1.0;    // Probable-background margin, multiple of the longer text side
        double convergenceEpsilon = 0.001; // Fraction of changed foreground pixels that ends iteration
        uint64_t segmentationSeed = 0x5EED;
        double contourEpsilon = 2.0;     // approxPolyDP tolerance in pixels, 0 = keep raw contour

        // OCR enhancement
        double claheClipLimit = 2.0;
        int claheTileSize = 8;
        float denoiseStrength = 5.0f;    // fastNlMeansDenoising h, 0 = disabled
        double sharpenAmount = 0.5;
        double sharpenSigma = 3.0;

        // Region matching (normalized units)
        double minMatchIoU = 0.1;
        double maxMatchDistance = 0.3;

        // Debug visualization
        bool enableDebugOutput = false;
        bool verboseOutput = false;
        std::string debugOutputPath = "./debug/";
    };

    // Intermediate images collected during one call and written out at its end.
    struct DebugStack {
        std::vector<std::pair<cv::Mat, std::string>> images;
    };

    static void validateImage(const cv::Mat& img, const std::string& stage);
    static void validateParams(const ProcessingParams& params);

    static cv::Mat convertToGrayscale(const cv::Mat& img);
    static cv::Mat convertToBGR(const cv::Mat& img);
    static cv::Mat gaussianBlur(const cv::Mat& img, int kernelSize);
    static cv::Mat cannyEdge(const cv::Mat& img, double low, double high);
    static cv::Mat morphClose(const cv::Mat& img, int kernelSize);

    // Grayscale -> Gaussian blur -> Canny -> morphological closing
    static cv::Mat preprocess(const cv::Mat& img, const ProcessingParams& params, DebugStack& debug);
    static cv::Mat preprocess(const cv::Mat& img, const ProcessingParams& params);
    static cv::Mat preprocess(const cv::Mat& img);

    // CLAHE -> denoise -> unsharp mask. Output is single channel, same size as input.
    static cv::Mat enhanceForOCR(const cv::Mat& img, const ProcessingParams& params);
    static cv::Mat enhanceForOCR(const cv::Mat& img);

    static void pushDebugImage(DebugStack& debug, const cv::Mat& image, const std::string& name,
                               const ProcessingParams& params);
    static void pushDebugContours(DebugStack& debug, const cv::Mat& image, const std::vector<Contour>& contours,
                                  const std::string& name, const ProcessingParams& params);
    static void flushDebugStack(DebugStack& debug, const ProcessingParams& params);
};

} // namespace BalloonTrace
