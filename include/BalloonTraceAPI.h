#ifndef BALLOON_TRACE_API_H
#define BALLOON_TRACE_API_H

#ifdef __cplusplus
extern "C" {
#endif

#include <stdint.h>
#include <stdbool.h>

// Version information
#define BALLOON_TRACE_VERSION_MAJOR 1
#define BALLOON_TRACE_VERSION_MINOR 0
#define BALLOON_TRACE_VERSION_PATCH 0

// Error codes
typedef enum {
    BALLOON_TRACE_SUCCESS = 0,
    BALLOON_TRACE_ERROR_INVALID_INPUT = -1,
    BALLOON_TRACE_ERROR_INVALID_PARAMETERS = -2,
    BALLOON_TRACE_ERROR_PROCESSING_FAILED = -3,
    BALLOON_TRACE_ERROR_OUT_OF_MEMORY = -4
} BalloonTraceResult;

// Processing parameters structure
typedef struct {
    // Preprocessing
    int32_t blur_kernel_size;       // Gaussian blur kernel, odd (default: 5)
    double canny_lower;             // Canny lower threshold (default: 30.0)
    double canny_upper;             // Canny upper threshold (default: 90.0)
    int32_t morph_kernel_size;      // Closing kernel, odd (default: 15)

    // Candidate filtering
    double min_area_ratio;          // Minimum box area / image area (default: 0.001)
    double max_area_ratio;          // Maximum box area / image area (default: 0.5)
    double min_aspect_ratio;        // Minimum width / height (default: 0.2)
    double max_aspect_ratio;        // Maximum width / height (default: 5.0)
    double min_solidity;            // Minimum area / hull area, 0 disables (default: 0.0)
    double min_mean_brightness;     // Minimum mean gray level inside a contour, 0 disables (default: 215.0)
    int32_t reading_order_row_tolerance; // Pixels between centres of one row (default: 50)

    // Text-seeded expansion
    int32_t grabcut_iterations;     // Iteration cap (default: 5)
    double expansion_margin;        // Background margin as multiple of text size (default: 1.0)
    double convergence_epsilon;     // Changed-pixel fraction that stops iteration (default: 0.001)
    uint64_t segmentation_seed;     // Seed for GrabCut's k-means (default: 0x5EED)
    double contour_epsilon;         // Outline simplification in pixels (default: 2.0)

    // OCR enhancement
    double clahe_clip_limit;        // CLAHE clip limit (default: 2.0)
    int32_t clahe_tile_size;        // CLAHE tile grid size (default: 8)
    double denoise_strength;        // Non-local means h, 0 disables (default: 5.0)
    double sharpen_amount;          // Unsharp mask weight (default: 0.5)
    double sharpen_sigma;           // Unsharp mask blur sigma (default: 3.0)

    // Region matching
    double min_match_iou;           // Minimum IoU for an overlap match (default: 0.1)
    double max_match_distance;      // Maximum centre distance for a fallback match (default: 0.3)

    // Debug visualization
    bool enable_debug_output;       // Save intermediate images (default: false)
    bool verbose_output;            // Log each stage to stdout (default: false)
} BalloonTraceParams;

// Interleaved 8-bit pixel buffer: 1 = gray, 3 = BGR, 4 = BGRA
typedef struct {
    uint8_t* data;
    int32_t width;
    int32_t height;
    int32_t channels;
    int32_t stride;                 // Bytes per row, 0 = tightly packed
} BalloonTraceImage;

// Rectangle, pixel or normalized space depending on the call
typedef struct {
    double x;
    double y;
    double width;
    double height;
} BalloonTraceRect;

typedef struct {
    double x;
    double y;
} BalloonTracePoint;

// Contour with normalized [0,1] points
typedef struct {
    BalloonTracePoint* points;
    int32_t point_count;
} BalloonTraceContour;

// Detection output; rects[i] and contours[i] describe the same balloon
typedef struct {
    BalloonTraceImage marked_image;
    BalloonTraceRect* rects;
    BalloonTraceContour* contours;
    int32_t count;
} BalloonTraceDetection;

// Progress callback, progress in [0, 1]
typedef void (*BalloonTraceProgressCallback)(double progress, const char* stage);

// Error callback function type for detailed error reporting
typedef void (*BalloonTraceErrorCallback)(BalloonTraceResult error_code, const char* error_message);

// Configuration

/**
 * Get default processing parameters
 * @param params Pointer to parameters structure to fill
 */
void balloon_trace_get_default_params(BalloonTraceParams* params);

/**
 * Validate processing parameters
 * @param params Pointer to parameters to validate
 * @return BALLOON_TRACE_SUCCESS if valid, error code otherwise
 */
BalloonTraceResult balloon_trace_validate_params(const BalloonTraceParams* params);

// Filter stages. Output images are allocated by the library; release with balloon_trace_free_image.

/**
 * Grayscale -> blur -> Canny -> closing
 * @param image Input image
 * @param params Processing parameters (defaults if NULL)
 * @param output Single-channel edge map
 */
BalloonTraceResult balloon_trace_preprocess(
    const BalloonTraceImage* image,
    const BalloonTraceParams* params,
    BalloonTraceImage* output,
    BalloonTraceErrorCallback error_callback
);

BalloonTraceResult balloon_trace_canny_edge(
    const BalloonTraceImage* image,
    double low_threshold,
    double high_threshold,
    BalloonTraceImage* output,
    BalloonTraceErrorCallback error_callback
);

BalloonTraceResult balloon_trace_morph_close(
    const BalloonTraceImage* image,
    int32_t kernel_size,
    BalloonTraceImage* output,
    BalloonTraceErrorCallback error_callback
);

/**
 * Contrast normalization and denoising before text recognition. Dimensions are preserved.
 */
BalloonTraceResult balloon_trace_enhance_for_ocr(
    const BalloonTraceImage* image,
    const BalloonTraceParams* params,
    BalloonTraceImage* output,
    BalloonTraceErrorCallback error_callback
);

// Detection

/**
 * Detect balloons and draw numbered markers on a copy of the image
 * @param detection Filled on success (caller must free with balloon_trace_free_detection)
 */
BalloonTraceResult balloon_trace_detect_balloons(
    const BalloonTraceImage* image,
    const BalloonTraceParams* params,
    BalloonTraceDetection* detection,
    BalloonTraceProgressCallback progress_callback,
    BalloonTraceErrorCallback error_callback
);

/**
 * Grow a pixel-space text rectangle into its enclosing balloon
 * @param balloon_rect Normalized balloon rectangle, valid when *found is true
 * @param found Set to false when no enclosing balloon exists (not an error)
 */
BalloonTraceResult balloon_trace_expand_text_region(
    const BalloonTraceImage* image,
    BalloonTraceRect text_rect,
    const BalloonTraceParams* params,
    BalloonTraceRect* balloon_rect,
    bool* found,
    BalloonTraceErrorCallback error_callback
);

/**
 * Balloon outline around a pixel-space text rectangle
 * @param contour Normalized outline, empty when nothing was found (free with balloon_trace_free_contour)
 */
BalloonTraceResult balloon_trace_refine_contour(
    const BalloonTraceImage* image,
    BalloonTraceRect text_rect,
    const BalloonTraceParams* params,
    BalloonTraceContour* contour,
    BalloonTraceErrorCallback error_callback
);

/**
 * Pair normalized text rectangles with normalized balloon rectangles
 * @param balloon_indices Array of text_count entries; balloon index or -1 when unmatched
 */
BalloonTraceResult balloon_trace_match_regions(
    const BalloonTraceRect* text_rects,
    int32_t text_count,
    const BalloonTraceRect* balloon_rects,
    int32_t balloon_count,
    const BalloonTraceParams* params,
    int32_t* balloon_indices,
    BalloonTraceErrorCallback error_callback
);

// Memory management functions

void balloon_trace_free_image(BalloonTraceImage* image);
void balloon_trace_free_contour(BalloonTraceContour* contour);
void balloon_trace_free_detection(BalloonTraceDetection* detection);

// Utility functions

/**
 * Get human-readable error message for error code
 * @return Static string describing the error (do not free)
 */
const char* balloon_trace_get_error_message(BalloonTraceResult error_code);

/**
 * Get library version string
 * @return Static version string in format "major.minor.patch" (do not free)
 */
const char* balloon_trace_get_version(void);

#ifdef __cplusplus
}
#endif

#endif // BALLOON_TRACE_API_H
