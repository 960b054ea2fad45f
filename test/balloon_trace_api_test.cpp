#include <gtest/gtest.h>

#include <cstring>

#include "BalloonTraceAPI.h"
#include "TestImages.hpp"

namespace {

int g_errorCount = 0;
BalloonTraceResult g_lastError = BALLOON_TRACE_SUCCESS;
int g_progressCount = 0;
double g_lastProgress = -1.0;

void countErrors(BalloonTraceResult code, const char* message) {
  g_errorCount++;
  g_lastError = code;
  EXPECT_NE(message, nullptr);
}

void countProgress(double progress, const char* stage) {
  g_progressCount++;
  EXPECT_GE(progress, g_lastProgress);
  g_lastProgress = progress;
  EXPECT_NE(stage, nullptr);
}

void throwNonStandard(double, const char*) {
  throw 42;
}

// Borrows the Mat's pixels; the Mat must outlive the view.
BalloonTraceImage view(const cv::Mat& mat) {
  BalloonTraceImage img;
  img.data = mat.data;
  img.width = mat.cols;
  img.height = mat.rows;
  img.channels = mat.channels();
  img.stride = static_cast<int32_t>(mat.step);
  return img;
}

class BalloonTraceApiTest : public ::testing::Test {
 protected:
  void SetUp() override {
    g_errorCount = 0;
    g_lastError = BALLOON_TRACE_SUCCESS;
    g_progressCount = 0;
    g_lastProgress = -1.0;
    balloon_trace_get_default_params(&params_);
  }

  BalloonTraceParams params_;
};

}  // namespace

TEST_F(BalloonTraceApiTest, DefaultParamsValidate) {
  EXPECT_EQ(balloon_trace_validate_params(&params_), BALLOON_TRACE_SUCCESS);
  EXPECT_EQ(params_.blur_kernel_size, 5);
  EXPECT_EQ(params_.morph_kernel_size, 15);
  EXPECT_DOUBLE_EQ(params_.canny_lower, 30.0);
  EXPECT_DOUBLE_EQ(params_.canny_upper, 90.0);
  EXPECT_FALSE(params_.enable_debug_output);
  EXPECT_DOUBLE_EQ(params_.min_mean_brightness, 215.0);
  EXPECT_DOUBLE_EQ(params_.sharpen_sigma, 3.0);
}

TEST_F(BalloonTraceApiTest, SharpenSigmaReachesValidation) {
  params_.sharpen_sigma = 0.0;
  EXPECT_EQ(balloon_trace_validate_params(&params_), BALLOON_TRACE_ERROR_INVALID_PARAMETERS);

  cv::Mat page = testimages::speechBalloon();
  BalloonTraceImage input = view(page);
  BalloonTraceImage output;
  EXPECT_EQ(balloon_trace_enhance_for_ocr(&input, &params_, &output, countErrors),
            BALLOON_TRACE_ERROR_INVALID_PARAMETERS);
  EXPECT_EQ(output.data, nullptr);

  params_.sharpen_sigma = 1.5;
  ASSERT_EQ(balloon_trace_enhance_for_ocr(&input, &params_, &output, countErrors), BALLOON_TRACE_SUCCESS);
  balloon_trace_free_image(&output);
}

TEST_F(BalloonTraceApiTest, BrightnessFloorIsConfigurable) {
  cv::Mat page = testimages::darkBlobAndBalloon();
  BalloonTraceImage input = view(page);
  BalloonTraceDetection detection;

  ASSERT_EQ(balloon_trace_detect_balloons(&input, &params_, &detection, nullptr, countErrors),
            BALLOON_TRACE_SUCCESS);
  EXPECT_EQ(detection.count, 1);
  balloon_trace_free_detection(&detection);

  params_.min_mean_brightness = 0.0;
  ASSERT_EQ(balloon_trace_detect_balloons(&input, &params_, &detection, nullptr, countErrors),
            BALLOON_TRACE_SUCCESS);
  EXPECT_EQ(detection.count, 2);
  balloon_trace_free_detection(&detection);

  params_.min_mean_brightness = 256.0;
  EXPECT_EQ(balloon_trace_validate_params(&params_), BALLOON_TRACE_ERROR_INVALID_PARAMETERS);
}

TEST_F(BalloonTraceApiTest, NonStandardExceptionStaysInsideTheLibrary) {
  cv::Mat page = testimages::comicPage();
  BalloonTraceImage input = view(page);
  BalloonTraceDetection detection;

  EXPECT_EQ(balloon_trace_detect_balloons(&input, &params_, &detection, throwNonStandard, countErrors),
            BALLOON_TRACE_ERROR_PROCESSING_FAILED);
  EXPECT_EQ(g_errorCount, 1);
  EXPECT_EQ(g_lastError, BALLOON_TRACE_ERROR_PROCESSING_FAILED);
  EXPECT_EQ(detection.count, 0);
  EXPECT_EQ(detection.rects, nullptr);
  EXPECT_EQ(detection.marked_image.data, nullptr);
}

TEST_F(BalloonTraceApiTest, InvalidParamsAreReported) {
  params_.canny_lower = 120.0;
  params_.canny_upper = 60.0;
  EXPECT_EQ(balloon_trace_validate_params(&params_), BALLOON_TRACE_ERROR_INVALID_PARAMETERS);
  EXPECT_EQ(balloon_trace_validate_params(nullptr), BALLOON_TRACE_ERROR_INVALID_PARAMETERS);

  cv::Mat square = testimages::blackSquare();
  BalloonTraceImage input = view(square);
  BalloonTraceImage output;
  EXPECT_EQ(balloon_trace_preprocess(&input, &params_, &output, countErrors),
            BALLOON_TRACE_ERROR_INVALID_PARAMETERS);
  EXPECT_EQ(output.data, nullptr);
  EXPECT_EQ(g_errorCount, 1);
  EXPECT_EQ(g_lastError, BALLOON_TRACE_ERROR_INVALID_PARAMETERS);
}

TEST_F(BalloonTraceApiTest, NullImageIsInvalidInput) {
  BalloonTraceImage output;
  EXPECT_EQ(balloon_trace_preprocess(nullptr, &params_, &output, countErrors), BALLOON_TRACE_ERROR_INVALID_INPUT);
  EXPECT_EQ(g_errorCount, 1);

  BalloonTraceImage empty = {nullptr, 10, 10, 3, 0};
  EXPECT_EQ(balloon_trace_canny_edge(&empty, 10, 20, &output, nullptr), BALLOON_TRACE_ERROR_INVALID_INPUT);

  cv::Mat square = testimages::blackSquare();
  BalloonTraceImage badChannels = view(square);
  badChannels.channels = 2;
  EXPECT_EQ(balloon_trace_canny_edge(&badChannels, 10, 20, &output, nullptr), BALLOON_TRACE_ERROR_INVALID_INPUT);
}

TEST_F(BalloonTraceApiTest, CannyEdgeWithEqualThresholds) {
  cv::Mat square = testimages::blackSquare();
  BalloonTraceImage input = view(square);
  BalloonTraceImage output;

  ASSERT_EQ(balloon_trace_canny_edge(&input, 50, 50, &output, countErrors), BALLOON_TRACE_SUCCESS);
  EXPECT_EQ(output.width, 100);
  EXPECT_EQ(output.height, 100);
  EXPECT_EQ(output.channels, 1);
  ASSERT_NE(output.data, nullptr);

  int nonZero = 0;
  for (int i = 0; i < output.height * output.stride; ++i) {
    EXPECT_TRUE(output.data[i] == 0 || output.data[i] == 255);
    if (output.data[i]) nonZero++;
  }
  EXPECT_GT(nonZero, 0);

  balloon_trace_free_image(&output);
  EXPECT_EQ(output.data, nullptr);
  EXPECT_EQ(g_errorCount, 0);
}

TEST_F(BalloonTraceApiTest, MorphCloseRejectsEvenKernel) {
  cv::Mat binary = testimages::uniform(20, 20, 1, 0);
  BalloonTraceImage input = view(binary);
  BalloonTraceImage output;
  EXPECT_EQ(balloon_trace_morph_close(&input, 4, &output, countErrors), BALLOON_TRACE_ERROR_INVALID_PARAMETERS);
  EXPECT_EQ(g_lastError, BALLOON_TRACE_ERROR_INVALID_PARAMETERS);
}

TEST_F(BalloonTraceApiTest, EnhanceKeepsDimensions) {
  cv::Mat page = testimages::speechBalloon();
  BalloonTraceImage input = view(page);
  BalloonTraceImage output;

  ASSERT_EQ(balloon_trace_enhance_for_ocr(&input, nullptr, &output, countErrors), BALLOON_TRACE_SUCCESS);
  EXPECT_EQ(output.width, page.cols);
  EXPECT_EQ(output.height, page.rows);
  EXPECT_EQ(output.channels, 1);
  balloon_trace_free_image(&output);
}

TEST_F(BalloonTraceApiTest, DetectBalloonsReturnsPairedResults) {
  cv::Mat page = testimages::comicPage();
  BalloonTraceImage input = view(page);
  BalloonTraceDetection detection;

  ASSERT_EQ(balloon_trace_detect_balloons(&input, &params_, &detection, countProgress, countErrors),
            BALLOON_TRACE_SUCCESS);
  EXPECT_EQ(detection.count, 3);
  EXPECT_GE(g_progressCount, 2);
  EXPECT_DOUBLE_EQ(g_lastProgress, 1.0);

  EXPECT_EQ(detection.marked_image.width, page.cols);
  EXPECT_EQ(detection.marked_image.height, page.rows);
  EXPECT_EQ(detection.marked_image.channels, 3);

  for (int32_t i = 0; i < detection.count; ++i) {
    const BalloonTraceRect& r = detection.rects[i];
    EXPECT_GE(r.x, 0.0);
    EXPECT_GE(r.y, 0.0);
    EXPECT_LE(r.x + r.width, 1.0 + 1e-9);
    EXPECT_LE(r.y + r.height, 1.0 + 1e-9);

    const BalloonTraceContour& c = detection.contours[i];
    ASSERT_GT(c.point_count, 0);
    for (int32_t p = 0; p < c.point_count; ++p) {
      EXPECT_GE(c.points[p].x, r.x - 1e-9);
      EXPECT_LE(c.points[p].x, r.x + r.width + 1e-9);
      EXPECT_GE(c.points[p].y, r.y - 1e-9);
      EXPECT_LE(c.points[p].y, r.y + r.height + 1e-9);
    }
  }

  balloon_trace_free_detection(&detection);
  EXPECT_EQ(detection.count, 0);
  EXPECT_EQ(detection.rects, nullptr);
  EXPECT_EQ(detection.contours, nullptr);
  EXPECT_EQ(detection.marked_image.data, nullptr);
}

TEST_F(BalloonTraceApiTest, FailedDetectionLeavesNothingToFree) {
  BalloonTraceDetection detection;
  EXPECT_EQ(balloon_trace_detect_balloons(nullptr, &params_, &detection, nullptr, countErrors),
            BALLOON_TRACE_ERROR_INVALID_INPUT);
  EXPECT_EQ(detection.count, 0);
  EXPECT_EQ(detection.rects, nullptr);
  EXPECT_EQ(detection.marked_image.data, nullptr);
  balloon_trace_free_detection(&detection);
}

TEST_F(BalloonTraceApiTest, ExpandTextRegion) {
  cv::Mat page = testimages::speechBalloon();
  BalloonTraceImage input = view(page);
  cv::Rect text = testimages::speechBalloonText();
  BalloonTraceRect textRect = {double(text.x), double(text.y), double(text.width), double(text.height)};

  BalloonTraceRect balloon;
  bool found = false;
  ASSERT_EQ(balloon_trace_expand_text_region(&input, textRect, &params_, &balloon, &found, countErrors),
            BALLOON_TRACE_SUCCESS);
  ASSERT_TRUE(found);
  EXPECT_GT(balloon.width * page.cols, text.width);
  EXPECT_GT(balloon.height * page.rows, text.height);

  BalloonTraceRect whole = {0.0, 0.0, double(page.cols), double(page.rows)};
  ASSERT_EQ(balloon_trace_expand_text_region(&input, whole, &params_, &balloon, &found, countErrors),
            BALLOON_TRACE_SUCCESS);
  EXPECT_FALSE(found);

  BalloonTraceRect negative = {10.0, 10.0, -4.0, 10.0};
  EXPECT_EQ(balloon_trace_expand_text_region(&input, negative, &params_, &balloon, &found, countErrors),
            BALLOON_TRACE_ERROR_INVALID_INPUT);
}

TEST_F(BalloonTraceApiTest, RefineContourIsNormalized) {
  cv::Mat page = testimages::speechBalloon();
  BalloonTraceImage input = view(page);
  cv::Rect text = testimages::speechBalloonText();
  BalloonTraceRect textRect = {double(text.x), double(text.y), double(text.width), double(text.height)};

  BalloonTraceContour contour;
  ASSERT_EQ(balloon_trace_refine_contour(&input, textRect, &params_, &contour, countErrors), BALLOON_TRACE_SUCCESS);
  ASSERT_GE(contour.point_count, 4);
  for (int32_t i = 0; i < contour.point_count; ++i) {
    EXPECT_GE(contour.points[i].x, 0.0);
    EXPECT_LE(contour.points[i].x, 1.0);
    EXPECT_GE(contour.points[i].y, 0.0);
    EXPECT_LE(contour.points[i].y, 1.0);
  }
  balloon_trace_free_contour(&contour);
  EXPECT_EQ(contour.points, nullptr);
  EXPECT_EQ(contour.point_count, 0);
}

TEST_F(BalloonTraceApiTest, MatchRegions) {
  BalloonTraceRect texts[] = {{0.10, 0.1, 0.2, 0.2}, {0.9, 0.9, 0.05, 0.05}};
  BalloonTraceRect balloons[] = {{0.1, 0.1, 0.25, 0.25}};
  int32_t indices[2] = {42, 42};

  ASSERT_EQ(balloon_trace_match_regions(texts, 2, balloons, 1, &params_, indices, countErrors),
            BALLOON_TRACE_SUCCESS);
  EXPECT_EQ(indices[0], 0);
  EXPECT_EQ(indices[1], -1);

  EXPECT_EQ(balloon_trace_match_regions(texts, -1, balloons, 1, &params_, indices, countErrors),
            BALLOON_TRACE_ERROR_INVALID_INPUT);
  EXPECT_EQ(balloon_trace_match_regions(texts, 2, nullptr, 1, &params_, indices, countErrors),
            BALLOON_TRACE_ERROR_INVALID_INPUT);
}

TEST_F(BalloonTraceApiTest, FreeFunctionsAcceptNull) {
  balloon_trace_free_image(nullptr);
  balloon_trace_free_contour(nullptr);
  balloon_trace_free_detection(nullptr);
  SUCCEED();
}

TEST_F(BalloonTraceApiTest, UtilityStrings) {
  EXPECT_STREQ(balloon_trace_get_version(), "1.0.0");
  EXPECT_STREQ(balloon_trace_get_error_message(BALLOON_TRACE_SUCCESS), "Success");
  EXPECT_GT(std::strlen(balloon_trace_get_error_message(BALLOON_TRACE_ERROR_INVALID_INPUT)), 0u);
  EXPECT_STREQ(balloon_trace_get_error_message(static_cast<BalloonTraceResult>(99)), "Unknown error");
}
