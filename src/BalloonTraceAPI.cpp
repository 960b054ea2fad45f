#include "BalloonTraceAPI.h"
#include "ImageProcessor.hpp"
#include "BalloonDetector.hpp"
#include "TextRegionExpander.hpp"
#include "BalloonMatcher.hpp"
#include <iostream>
#include <cstring>
#include <cstdlib>
#include <new>

using namespace BalloonTrace;

// Internal helper functions
namespace {

    using ProcessingParams = ImageProcessor::ProcessingParams;

    // Convert C parameters to C++ parameters
    ProcessingParams convertParams(const BalloonTraceParams* params) {
        ProcessingParams cpp_params;
        if (params) {
            cpp_params.blurKernelSize = params->blur_kernel_size;
            cpp_params.cannyLower = params->canny_lower;
            cpp_params.cannyUpper = params->canny_upper;
            cpp_params.morphKernelSize = params->morph_kernel_size;

            cpp_params.minAreaRatio = params->min_area_ratio;
            cpp_params.maxAreaRatio = params->max_area_ratio;
            cpp_params.minAspectRatio = params->min_aspect_ratio;
            cpp_params.maxAspectRatio = params->max_aspect_ratio;
            cpp_params.minSolidity = params->min_solidity;
            cpp_params.minMeanBrightness = params->min_mean_brightness;
            cpp_params.readingOrderRowTolerance = params->reading_order_row_tolerance;

            cpp_params.grabCutIterations = params->grabcut_iterations;
            cpp_params.expansionMargin = params->expansion_margin;
            cpp_params.convergenceEpsilon = params->convergence_epsilon;
            cpp_params.segmentationSeed = params->segmentation_seed;
            cpp_params.contourEpsilon = params->contour_epsilon;

            cpp_params.claheClipLimit = params->clahe_clip_limit;
            cpp_params.claheTileSize = params->clahe_tile_size;
            cpp_params.denoiseStrength = static_cast<float>(params->denoise_strength);
            cpp_params.sharpenAmount = params->sharpen_amount;
            cpp_params.sharpenSigma = params->sharpen_sigma;

            cpp_params.minMatchIoU = params->min_match_iou;
            cpp_params.maxMatchDistance = params->max_match_distance;

            cpp_params.enableDebugOutput = params->enable_debug_output;
            cpp_params.verboseOutput = params->verbose_output;
        }
        return cpp_params;
    }

    // Wrap a caller-owned buffer without copying
    cv::Mat wrapImage(const BalloonTraceImage* image) {
        if (!image || !image->data) {
            throw InvalidInputError("Image buffer is null");
        }
        if (image->width <= 0 || image->height <= 0) {
            throw InvalidInputError("Image has zero dimension");
        }
        if (image->channels != 1 && image->channels != 3 && image->channels != 4) {
            throw InvalidInputError("Image must have 1, 3 or 4 channels");
        }

        size_t rowBytes = static_cast<size_t>(image->width) * image->channels;
        size_t step = image->stride > 0 ? static_cast<size_t>(image->stride) : rowBytes;
        if (step < rowBytes) {
            throw InvalidInputError("Image stride is smaller than one row of pixels");
        }

        return cv::Mat(image->height, image->width, CV_8UC(image->channels), image->data, step);
    }

    // Copy a Mat into a tightly packed, malloc-owned buffer
    void exportImage(const cv::Mat& mat, BalloonTraceImage* out) {
        cv::Mat packed = mat.isContinuous() ? mat : mat.clone();
        size_t bytes = packed.total() * packed.elemSize();

        uint8_t* data = static_cast<uint8_t*>(malloc(bytes));
        if (!data) {
            throw std::bad_alloc();
        }
        std::memcpy(data, packed.data, bytes);

        out->data = data;
        out->width = packed.cols;
        out->height = packed.rows;
        out->channels = packed.channels();
        out->stride = static_cast<int32_t>(packed.cols * packed.elemSize());
    }

    // Convert a pixel-space contour to normalized C points
    void exportContour(const Contour& contour, const cv::Size& imageSize, BalloonTraceContour* out) {
        out->points = nullptr;
        out->point_count = 0;
        if (contour.empty()) return;

        auto* points = static_cast<BalloonTracePoint*>(malloc(sizeof(BalloonTracePoint) * contour.size()));
        if (!points) {
            throw std::bad_alloc();
        }

        for (size_t i = 0; i < contour.size(); i++) {
            points[i].x = static_cast<double>(contour[i].x) / imageSize.width;
            points[i].y = static_cast<double>(contour[i].y) / imageSize.height;
        }
        out->points = points;
        out->point_count = static_cast<int32_t>(contour.size());
    }

    cv::Rect toPixelRect(const BalloonTraceRect& rect) {
        return cv::Rect(cvFloor(rect.x), cvFloor(rect.y), cvRound(rect.width), cvRound(rect.height));
    }

    cv::Rect2d toRect2d(const BalloonTraceRect& rect) {
        return cv::Rect2d(rect.x, rect.y, rect.width, rect.height);
    }

    BalloonTraceRect fromRect2d(const cv::Rect2d& rect) {
        return BalloonTraceRect{rect.x, rect.y, rect.width, rect.height};
    }

    BalloonTraceResult reportError(BalloonTraceResult code, const char* message, BalloonTraceErrorCallback error_callback) {
        if (error_callback) {
            error_callback(code, message);
        }
        return code;
    }

    // Map C++ exceptions to error codes; nothing may escape across the C boundary
    template <typename Fn>
    BalloonTraceResult runGuarded(BalloonTraceErrorCallback error_callback, Fn&& fn) {
        try {
            fn();
            return BALLOON_TRACE_SUCCESS;
        } catch (const InvalidParameterError& e) {
            return reportError(BALLOON_TRACE_ERROR_INVALID_PARAMETERS, e.what(), error_callback);
        } catch (const InvalidInputError& e) {
            return reportError(BALLOON_TRACE_ERROR_INVALID_INPUT, e.what(), error_callback);
        } catch (const std::bad_alloc& e) {
            return reportError(BALLOON_TRACE_ERROR_OUT_OF_MEMORY, e.what(), error_callback);
        } catch (const std::exception& e) {
            return reportError(BALLOON_TRACE_ERROR_PROCESSING_FAILED, e.what(), error_callback);
        } catch (...) {
            return reportError(BALLOON_TRACE_ERROR_PROCESSING_FAILED, "Unknown error during processing", error_callback);
        }
    }

    // Progress reporting helper
    void reportProgress(BalloonTraceProgressCallback callback, double progress, const char* stage) {
        if (callback) {
            callback(progress, stage);
        }
    }

    void clearImage(BalloonTraceImage* image) {
        image->data = nullptr;
        image->width = 0;
        image->height = 0;
        image->channels = 0;
        image->stride = 0;
    }
}

// API Implementation

void balloon_trace_get_default_params(BalloonTraceParams* params) {
    if (!params) return;

    ProcessingParams defaults;

    params->blur_kernel_size = defaults.blurKernelSize;
    params->canny_lower = defaults.cannyLower;
    params->canny_upper = defaults.cannyUpper;
    params->morph_kernel_size = defaults.morphKernelSize;

    params->min_area_ratio = defaults.minAreaRatio;
    params->max_area_ratio = defaults.maxAreaRatio;
    params->min_aspect_ratio = defaults.minAspectRatio;
    params->max_aspect_ratio = defaults.maxAspectRatio;
    params->min_solidity = defaults.minSolidity;
    params->min_mean_brightness = defaults.minMeanBrightness;
    params->reading_order_row_tolerance = defaults.readingOrderRowTolerance;

    params->grabcut_iterations = defaults.grabCutIterations;
    params->expansion_margin = defaults.expansionMargin;
    params->convergence_epsilon = defaults.convergenceEpsilon;
    params->segmentation_seed = defaults.segmentationSeed;
    params->contour_epsilon = defaults.contourEpsilon;

    params->clahe_clip_limit = defaults.claheClipLimit;
    params->clahe_tile_size = defaults.claheTileSize;
    params->denoise_strength = defaults.denoiseStrength;
    params->sharpen_amount = defaults.sharpenAmount;
    params->sharpen_sigma = defaults.sharpenSigma;

    params->min_match_iou = defaults.minMatchIoU;
    params->max_match_distance = defaults.maxMatchDistance;

    params->enable_debug_output = defaults.enableDebugOutput;
    params->verbose_output = defaults.verboseOutput;
}

BalloonTraceResult balloon_trace_validate_params(const BalloonTraceParams* params) {
    if (!params) return BALLOON_TRACE_ERROR_INVALID_PARAMETERS;

    return runGuarded(nullptr, [&] {
        ImageProcessor::validateParams(convertParams(params));
    });
}

BalloonTraceResult balloon_trace_preprocess(
    const BalloonTraceImage* image,
    const BalloonTraceParams* params,
    BalloonTraceImage* output,
    BalloonTraceErrorCallback error_callback
) {
    if (!output) {
        return reportError(BALLOON_TRACE_ERROR_INVALID_INPUT, "Output image is null", error_callback);
    }
    clearImage(output);

    return runGuarded(error_callback, [&] {
        cv::Mat edges = ImageProcessor::preprocess(wrapImage(image), convertParams(params));
        exportImage(edges, output);
    });
}

BalloonTraceResult balloon_trace_canny_edge(
    const BalloonTraceImage* image,
    double low_threshold,
    double high_threshold,
    BalloonTraceImage* output,
    BalloonTraceErrorCallback error_callback
) {
    if (!output) {
        return reportError(BALLOON_TRACE_ERROR_INVALID_INPUT, "Output image is null", error_callback);
    }
    clearImage(output);

    return runGuarded(error_callback, [&] {
        cv::Mat edges = ImageProcessor::cannyEdge(wrapImage(image), low_threshold, high_threshold);
        exportImage(edges, output);
    });
}

BalloonTraceResult balloon_trace_morph_close(
    const BalloonTraceImage* image,
    int32_t kernel_size,
    BalloonTraceImage* output,
    BalloonTraceErrorCallback error_callback
) {
    if (!output) {
        return reportError(BALLOON_TRACE_ERROR_INVALID_INPUT, "Output image is null", error_callback);
    }
    clearImage(output);

    return runGuarded(error_callback, [&] {
        cv::Mat closed = ImageProcessor::morphClose(wrapImage(image), kernel_size);
        exportImage(closed, output);
    });
}

BalloonTraceResult balloon_trace_enhance_for_ocr(
    const BalloonTraceImage* image,
    const BalloonTraceParams* params,
    BalloonTraceImage* output,
    BalloonTraceErrorCallback error_callback
) {
    if (!output) {
        return reportError(BALLOON_TRACE_ERROR_INVALID_INPUT, "Output image is null", error_callback);
    }
    clearImage(output);

    return runGuarded(error_callback, [&] {
        cv::Mat enhanced = ImageProcessor::enhanceForOCR(wrapImage(image), convertParams(params));
        exportImage(enhanced, output);
    });
}

BalloonTraceResult balloon_trace_detect_balloons(
    const BalloonTraceImage* image,
    const BalloonTraceParams* params,
    BalloonTraceDetection* detection,
    BalloonTraceProgressCallback progress_callback,
    BalloonTraceErrorCallback error_callback
) {
    if (!detection) {
        return reportError(BALLOON_TRACE_ERROR_INVALID_INPUT, "Detection output is null", error_callback);
    }
    clearImage(&detection->marked_image);
    detection->rects = nullptr;
    detection->contours = nullptr;
    detection->count = 0;

    BalloonTraceResult result = runGuarded(error_callback, [&] {
        reportProgress(progress_callback, 0.0, "Starting balloon detection");

        cv::Mat src = wrapImage(image);
        DetectionResult found = BalloonDetector::detectAndMarkBalloons(src, convertParams(params));

        reportProgress(progress_callback, 0.8, "Converting detection data");

        exportImage(found.markedImage(), &detection->marked_image);

        size_t count = found.size();
        if (count > 0) {
            detection->rects = static_cast<BalloonTraceRect*>(calloc(count, sizeof(BalloonTraceRect)));
            detection->contours = static_cast<BalloonTraceContour*>(calloc(count, sizeof(BalloonTraceContour)));
            if (!detection->rects || !detection->contours) {
                throw std::bad_alloc();
            }
            detection->count = static_cast<int32_t>(count);

            for (size_t i = 0; i < count; i++) {
                detection->rects[i] = fromRect2d(found.balloonRects()[i]);
                exportContour(found.contours()[i], src.size(), &detection->contours[i]);
            }
        }

        reportProgress(progress_callback, 1.0, "Balloon detection complete");
    });

    if (result != BALLOON_TRACE_SUCCESS) {
        // No partial results cross the boundary
        balloon_trace_free_detection(detection);
    }
    return result;
}

BalloonTraceResult balloon_trace_expand_text_region(
    const BalloonTraceImage* image,
    BalloonTraceRect text_rect,
    const BalloonTraceParams* params,
    BalloonTraceRect* balloon_rect,
    bool* found,
    BalloonTraceErrorCallback error_callback
) {
    if (!balloon_rect || !found) {
        return reportError(BALLOON_TRACE_ERROR_INVALID_INPUT, "Output pointers are null", error_callback);
    }
    *balloon_rect = BalloonTraceRect{0.0, 0.0, 0.0, 0.0};
    *found = false;

    return runGuarded(error_callback, [&] {
        auto balloon = TextRegionExpander::expandTextToBalloon(wrapImage(image), toPixelRect(text_rect),
                                                               convertParams(params));
        if (balloon) {
            *balloon_rect = fromRect2d(*balloon);
            *found = true;
        }
    });
}

BalloonTraceResult balloon_trace_refine_contour(
    const BalloonTraceImage* image,
    BalloonTraceRect text_rect,
    const BalloonTraceParams* params,
    BalloonTraceContour* contour,
    BalloonTraceErrorCallback error_callback
) {
    if (!contour) {
        return reportError(BALLOON_TRACE_ERROR_INVALID_INPUT, "Contour output is null", error_callback);
    }
    contour->points = nullptr;
    contour->point_count = 0;

    return runGuarded(error_callback, [&] {
        cv::Mat src = wrapImage(image);
        Contour outline = TextRegionExpander::refineContour(src, toPixelRect(text_rect), convertParams(params));
        exportContour(outline, src.size(), contour);
    });
}

BalloonTraceResult balloon_trace_match_regions(
    const BalloonTraceRect* text_rects,
    int32_t text_count,
    const BalloonTraceRect* balloon_rects,
    int32_t balloon_count,
    const BalloonTraceParams* params,
    int32_t* balloon_indices,
    BalloonTraceErrorCallback error_callback
) {
    if (text_count < 0 || balloon_count < 0 ||
        (text_count > 0 && (!text_rects || !balloon_indices)) ||
        (balloon_count > 0 && !balloon_rects)) {
        return reportError(BALLOON_TRACE_ERROR_INVALID_INPUT, "Invalid rectangle arrays", error_callback);
    }

    return runGuarded(error_callback, [&] {
        std::vector<cv::Rect2d> texts, balloons;
        for (int32_t i = 0; i < text_count; i++) texts.push_back(toRect2d(text_rects[i]));
        for (int32_t i = 0; i < balloon_count; i++) balloons.push_back(toRect2d(balloon_rects[i]));

        std::vector<RegionMatch> matches = BalloonMatcher::matchRegions(texts, balloons, convertParams(params));
        for (const auto& match : matches) {
            balloon_indices[match.textIndex] =
                match.balloonIndex ? static_cast<int32_t>(*match.balloonIndex) : -1;
        }
    });
}

void balloon_trace_free_image(BalloonTraceImage* image) {
    if (image && image->data) {
        free(image->data);
        clearImage(image);
    }
}

void balloon_trace_free_contour(BalloonTraceContour* contour) {
    if (contour && contour->points) {
        free(contour->points);
        contour->points = nullptr;
        contour->point_count = 0;
    }
}

void balloon_trace_free_detection(BalloonTraceDetection* detection) {
    if (!detection) return;

    balloon_trace_free_image(&detection->marked_image);
    if (detection->contours) {
        // calloc'd, so entries never filled are null and safe to free
        for (int32_t i = 0; i < detection->count; i++) {
            balloon_trace_free_contour(&detection->contours[i]);
        }
        free(detection->contours);
        detection->contours = nullptr;
    }
    free(detection->rects);
    detection->rects = nullptr;
    detection->count = 0;
}

const char* balloon_trace_get_error_message(BalloonTraceResult error_code) {
    switch (error_code) {
        case BALLOON_TRACE_SUCCESS: return "Success";
        case BALLOON_TRACE_ERROR_INVALID_INPUT: return "Invalid input - image must be non-empty 8-bit with 1, 3 or 4 channels";
        case BALLOON_TRACE_ERROR_INVALID_PARAMETERS: return "Invalid processing parameters - check parameter ranges";
        case BALLOON_TRACE_ERROR_PROCESSING_FAILED: return "Image processing failed - see error callback for details";
        case BALLOON_TRACE_ERROR_OUT_OF_MEMORY: return "Out of memory while building results";
        default: return "Unknown error";
    }
}

const char* balloon_trace_get_version(void) {
    return "1.0.0";
}
