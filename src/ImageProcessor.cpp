#include "ImageProcessor.hpp"
#include <iostream>
#include <filesystem>
#include <cstdio>

using namespace cv;
using namespace std;

namespace BalloonTrace {

namespace {

bool isPositiveOdd(int value) {
    return value > 0 && value % 2 == 1;
}

} // namespace

void ImageProcessor::validateImage(const Mat& img, const string& stage) {
    if (img.empty() || img.rows <= 0 || img.cols <= 0) {
        throw InvalidInputError(stage + ": image is empty");
    }
    if (img.depth() != CV_8U) {
        throw InvalidInputError(stage + ": only 8-bit images are supported");
    }
    int channels = img.channels();
    if (channels != 1 && channels != 3 && channels != 4) {
        throw InvalidInputError(stage + ": unsupported channel count " + to_string(channels));
    }
}

void ImageProcessor::validateParams(const ProcessingParams& params) {
    if (!isPositiveOdd(params.blurKernelSize)) {
        throw InvalidParameterError("Blur kernel size must be a positive odd integer");
    }
    if (params.cannyLower <= 0.0 || params.cannyUpper <= 0.0 || params.cannyLower > params.cannyUpper) {
        throw InvalidParameterError("Canny thresholds must be positive with lower <= upper");
    }
    if (!isPositiveOdd(params.morphKernelSize)) {
        throw InvalidParameterError("Morphological kernel size must be a positive odd integer");
    }
    if (params.minAreaRatio < 0.0 || params.maxAreaRatio > 1.0 || params.minAreaRatio >= params.maxAreaRatio) {
        throw InvalidParameterError("Area band must satisfy 0 <= min < max <= 1");
    }
    if (params.minAspectRatio <= 0.0 || params.minAspectRatio > params.maxAspectRatio) {
        throw InvalidParameterError("Aspect ratio band must satisfy 0 < min <= max");
    }
    if (params.minSolidity < 0.0 || params.minSolidity > 1.0) {
        throw InvalidParameterError("Minimum solidity must be within [0, 1]");
    }
    if (params.minMeanBrightness < 0.0 || params.minMeanBrightness > 255.0) {
        throw InvalidParameterError("Minimum mean brightness must be within [0, 255]");
    }
    if (params.readingOrderRowTolerance < 0) {
        throw InvalidParameterError("Reading order row tolerance cannot be negative");
    }
    if (params.grabCutIterations < 1 || params.grabCutIterations > 100) {
        throw InvalidParameterError("GrabCut iteration cap must be within [1, 100]");
    }
    if (params.expansionMargin <= 0.0 || params.expansionMargin > 10.0) {
        throw InvalidParameterError("Expansion margin must be within (0, 10]");
    }
    if (params.convergenceEpsilon < 0.0 || params.convergenceEpsilon >= 1.0) {
        throw InvalidParameterError("Convergence epsilon must be within [0, 1)");
    }
    if (params.contourEpsilon < 0.0) {
        throw InvalidParameterError("Contour epsilon cannot be negative");
    }
    if (params.claheClipLimit <= 0.0 || params.claheTileSize < 1) {
        throw InvalidParameterError("CLAHE clip limit and tile size must be positive");
    }
    if (params.denoiseStrength < 0.0f) {
        throw InvalidParameterError("Denoise strength cannot be negative");
    }
    if (params.sharpenAmount < 0.0 || params.sharpenSigma <= 0.0) {
        throw InvalidParameterError("Sharpen amount must be >= 0 and sigma > 0");
    }
    if (params.minMatchIoU < 0.0 || params.minMatchIoU > 1.0 || params.maxMatchDistance < 0.0) {
        throw InvalidParameterError("Match IoU must be within [0, 1] and distance >= 0");
    }
}

Mat ImageProcessor::convertToGrayscale(const Mat& img) {
    validateImage(img, "Grayscale conversion");

    return guardStage("Grayscale conversion", [&] {
        Mat gray;
        switch (img.channels()) {
            case 1: gray = img.clone(); break;
            case 3: cvtColor(img, gray, COLOR_BGR2GRAY); break;
            default: cvtColor(img, gray, COLOR_BGRA2GRAY); break;
        }
        return gray;
    });
}

Mat ImageProcessor::convertToBGR(const Mat& img) {
    validateImage(img, "BGR conversion");

    return guardStage("BGR conversion", [&] {
        Mat bgr;
        switch (img.channels()) {
            case 1: cvtColor(img, bgr, COLOR_GRAY2BGR); break;
            case 3: bgr = img.clone(); break;
            default: cvtColor(img, bgr, COLOR_BGRA2BGR); break;
        }
        return bgr;
    });
}

Mat ImageProcessor::gaussianBlur(const Mat& img, int kernelSize) {
    validateImage(img, "Gaussian blur");
    if (!isPositiveOdd(kernelSize)) {
        throw InvalidParameterError("Blur kernel size must be a positive odd integer, got " + to_string(kernelSize));
    }

    return guardStage("Gaussian blur", [&] {
        Mat blurred;
        GaussianBlur(img, blurred, Size(kernelSize, kernelSize), 0);
        return blurred;
    });
}

Mat ImageProcessor::cannyEdge(const Mat& img, double low, double high) {
    validateImage(img, "Canny edge detection");
    if (low <= 0.0 || high <= 0.0) {
        throw InvalidParameterError("Canny thresholds must be positive");
    }
    if (low > high) {
        throw InvalidParameterError("Canny lower threshold must not exceed the upper threshold");
    }

    Mat gray = convertToGrayscale(img);
    return guardStage("Canny edge detection", [&] {
        Mat edges;
        Canny(gray, edges, low, high);
        return edges;
    });
}

Mat ImageProcessor::morphClose(const Mat& img, int kernelSize) {
    validateImage(img, "Morphological closing");
    if (!isPositiveOdd(kernelSize)) {
        throw InvalidParameterError("Morphological kernel size must be a positive odd integer, got " +
                                    to_string(kernelSize));
    }

    return guardStage("Morphological closing", [&] {
        Mat kernel = getStructuringElement(MORPH_ELLIPSE, Size(kernelSize, kernelSize));
        Mat closed;
        morphologyEx(img, closed, MORPH_CLOSE, kernel);
        return closed;
    });
}

Mat ImageProcessor::preprocess(const Mat& img, const ProcessingParams& params, DebugStack& debug) {
    validateImage(img, "Preprocessing");
    validateParams(params);

    if (params.verboseOutput) {
        cout << "[INFO] Preprocessing " << img.cols << "x" << img.rows << " image: blur "
             << params.blurKernelSize << ", Canny " << params.cannyLower << "-" << params.cannyUpper
             << ", closing " << params.morphKernelSize << endl;
    }

    Mat gray = convertToGrayscale(img);
    pushDebugImage(debug, gray, "grayscale", params);

    Mat blurred = gaussianBlur(gray, params.blurKernelSize);
    pushDebugImage(debug, blurred, "blurred", params);

    Mat edges = cannyEdge(blurred, params.cannyLower, params.cannyUpper);
    pushDebugImage(debug, edges, "canny_edges", params);

    Mat closed = morphClose(edges, params.morphKernelSize);
    pushDebugImage(debug, closed, "closed_edges", params);

    return closed;
}

Mat ImageProcessor::preprocess(const Mat& img, const ProcessingParams& params) {
    DebugStack debug;
    Mat result = preprocess(img, params, debug);
    flushDebugStack(debug, params);
    return result;
}

Mat ImageProcessor::preprocess(const Mat& img) {
    ProcessingParams params;
    return preprocess(img, params);
}

Mat ImageProcessor::enhanceForOCR(const Mat& img, const ProcessingParams& params) {
    validateImage(img, "OCR enhancement");
    validateParams(params);

    if (params.verboseOutput) {
        cout << "[INFO] Enhancing image for OCR: CLAHE clip " << params.claheClipLimit
             << ", denoise " << params.denoiseStrength << ", sharpen " << params.sharpenAmount << endl;
    }

    DebugStack debug;
    Mat gray = convertToGrayscale(img);

    Mat enhanced = guardStage("OCR enhancement", [&] {
        Mat equalized;
        auto clahe = createCLAHE();
        clahe->setClipLimit(params.claheClipLimit);
        clahe->setTilesGridSize(Size(params.claheTileSize, params.claheTileSize));
        clahe->apply(gray, equalized);
        pushDebugImage(debug, equalized, "ocr_clahe", params);

        Mat denoised;
        if (params.denoiseStrength > 0.0f) {
            fastNlMeansDenoising(equalized, denoised, params.denoiseStrength);
            pushDebugImage(debug, denoised, "ocr_denoised", params);
        } else {
            denoised = equalized;
        }

        Mat sharpened = denoised.clone();
        if (params.sharpenAmount > 0.0) {
            Mat blurred;
            GaussianBlur(denoised, blurred, Size(0, 0), params.sharpenSigma);
            addWeighted(denoised, 1.0 + params.sharpenAmount, blurred, -params.sharpenAmount, 0, sharpened);
        }
        return sharpened;
    });

    pushDebugImage(debug, enhanced, "ocr_enhanced", params);
    flushDebugStack(debug, params);
    return enhanced;
}

Mat ImageProcessor::enhanceForOCR(const Mat& img) {
    ProcessingParams params;
    return enhanceForOCR(img, params);
}

void ImageProcessor::pushDebugImage(DebugStack& debug, const Mat& image, const string& name,
                                    const ProcessingParams& params) {
    if (!params.enableDebugOutput) return;

    debug.images.emplace_back(image.clone(), name);
}

void ImageProcessor::pushDebugContours(DebugStack& debug, const Mat& image, const vector<Contour>& contours,
                                       const string& name, const ProcessingParams& params) {
    if (!params.enableDebugOutput) return;

    Mat debugImg = convertToBGR(image);
    for (size_t i = 0; i < contours.size(); i++) {
        drawContours(debugImg, contours, static_cast<int>(i), Scalar(0, 255, 0), 2);
    }

    debug.images.emplace_back(debugImg, name);
}

void ImageProcessor::flushDebugStack(DebugStack& debug, const ProcessingParams& params) {
    if (!params.enableDebugOutput || debug.images.empty()) return;

    cout << "[DEBUG] Flushing " << debug.images.size() << " debug images..." << endl;

    error_code ec;
    filesystem::create_directories(params.debugOutputPath, ec);
    if (ec) {
        cout << "[WARN] Could not create debug directory " << params.debugOutputPath << ": " << ec.message() << endl;
        debug.images.clear();
        return;
    }

    for (size_t i = 0; i < debug.images.size(); i++) {
        const auto& [image, name] = debug.images[i];

        // Format: 01_name.jpg, 02_name.jpg, etc.
        char indexStr[8];
        snprintf(indexStr, sizeof(indexStr), "%02zu", i + 1);
        string filename = string(indexStr) + "_" + name + ".jpg";
        string fullPath = (filesystem::path(params.debugOutputPath) / filename).string();

        bool success = false;
        try {
            success = imwrite(fullPath, image);
        } catch (const cv::Exception& e) {
            cout << "[WARN] " << e.what() << endl;
        }

        if (success) {
            cout << "[DEBUG] Saved: " << filename << endl;
        } else {
            cout << "[WARN] Failed to save: " << filename << endl;
        }
    }

    debug.images.clear();
    cout << "[DEBUG] Debug stack flushed and cleared" << endl;
}

} // namespace BalloonTrace
