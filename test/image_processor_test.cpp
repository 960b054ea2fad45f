#include <gtest/gtest.h>

#include "ImageProcessor.hpp"
#include "TestImages.hpp"

using BalloonTrace::ImageProcessor;
using BalloonTrace::InvalidInputError;
using BalloonTrace::InvalidParameterError;

namespace {

int countRegions(const cv::Mat& binary) {
  cv::Mat labels;
  // Label 0 is the background.
  return cv::connectedComponents(binary, labels, 8) - 1;
}

bool isBinary(const cv::Mat& img) {
  cv::Mat other = (img != 0) & (img != 255);
  return cv::countNonZero(other) == 0;
}

}  // namespace

TEST(ImageProcessorTest, GrayscaleHandlesAllChannelCounts) {
  for (int channels : {1, 3, 4}) {
    cv::Mat gray = ImageProcessor::convertToGrayscale(testimages::uniform(10, 12, channels, 200));
    EXPECT_EQ(gray.channels(), 1);
    EXPECT_EQ(gray.size(), cv::Size(12, 10));
  }
}

TEST(ImageProcessorTest, RejectsEmptyImages) {
  cv::Mat empty;
  EXPECT_THROW(ImageProcessor::convertToGrayscale(empty), InvalidInputError);
  EXPECT_THROW(ImageProcessor::cannyEdge(empty, 10, 20), InvalidInputError);
  EXPECT_THROW(ImageProcessor::morphClose(empty, 3), InvalidInputError);
  EXPECT_THROW(ImageProcessor::preprocess(empty), InvalidInputError);
  EXPECT_THROW(ImageProcessor::enhanceForOCR(empty), InvalidInputError);
}

TEST(ImageProcessorTest, RejectsNonByteImages) {
  cv::Mat floats(10, 10, CV_32FC1, cv::Scalar(0.5));
  EXPECT_THROW(ImageProcessor::preprocess(floats), InvalidInputError);
}

TEST(ImageProcessorTest, CannyRejectsBadThresholds) {
  cv::Mat img = testimages::blackSquare();
  EXPECT_THROW(ImageProcessor::cannyEdge(img, 100, 50), InvalidParameterError);
  EXPECT_THROW(ImageProcessor::cannyEdge(img, 0, 50), InvalidParameterError);
  EXPECT_THROW(ImageProcessor::cannyEdge(img, -5, -1), InvalidParameterError);
}

TEST(ImageProcessorTest, CannyWithEqualThresholdsReturnsBinaryMap) {
  cv::Mat img = testimages::blackSquare();
  cv::Mat edges = ImageProcessor::cannyEdge(img, 50, 50);
  ASSERT_FALSE(edges.empty());
  EXPECT_EQ(edges.type(), CV_8UC1);
  EXPECT_EQ(edges.size(), img.size());
  EXPECT_TRUE(isBinary(edges));
  EXPECT_GT(cv::countNonZero(edges), 0);
}

TEST(ImageProcessorTest, CannyOnUniformImageFindsNothing) {
  cv::Mat edges = ImageProcessor::cannyEdge(testimages::uniform(50, 50, 3, 128), 30, 90);
  EXPECT_EQ(cv::countNonZero(edges), 0);
}

TEST(ImageProcessorTest, MorphCloseRejectsEvenOrNonPositiveKernel) {
  cv::Mat img = testimages::uniform(20, 20, 1, 0);
  EXPECT_THROW(ImageProcessor::morphClose(img, 4), InvalidParameterError);
  EXPECT_THROW(ImageProcessor::morphClose(img, 0), InvalidParameterError);
  EXPECT_THROW(ImageProcessor::morphClose(img, -3), InvalidParameterError);
}

TEST(ImageProcessorTest, MorphCloseMergesNearbyFragments) {
  cv::Mat img = testimages::uniform(60, 60, 1, 0);
  cv::rectangle(img, cv::Point(10, 20), cv::Point(27, 40), cv::Scalar(255), cv::FILLED);
  cv::rectangle(img, cv::Point(30, 20), cv::Point(47, 40), cv::Scalar(255), cv::FILLED);
  ASSERT_EQ(countRegions(img), 2);

  cv::Mat closed = ImageProcessor::morphClose(img, 7);
  EXPECT_EQ(countRegions(closed), 1);
  EXPECT_EQ(closed.size(), img.size());
}

TEST(ImageProcessorTest, MorphCloseTwiceKeepsRegionCount) {
  cv::Mat img = testimages::uniform(120, 120, 1, 0);
  cv::circle(img, cv::Point(30, 30), 10, cv::Scalar(255), 2);
  cv::rectangle(img, cv::Point(60, 10), cv::Point(100, 20), cv::Scalar(255), 1);
  cv::line(img, cv::Point(10, 80), cv::Point(50, 110), cv::Scalar(255), 1);
  cv::line(img, cv::Point(54, 110), cv::Point(90, 80), cv::Scalar(255), 1);
  cv::rectangle(img, cv::Point(95, 95), cv::Point(110, 110), cv::Scalar(255), cv::FILLED);

  for (int k : {3, 5, 9}) {
    cv::Mat once = ImageProcessor::morphClose(img, k);
    cv::Mat twice = ImageProcessor::morphClose(once, k);
    EXPECT_EQ(countRegions(twice), countRegions(once)) << "kernel " << k;
  }
}

TEST(ImageProcessorTest, PreprocessProducesBinaryEdgeMap) {
  cv::Mat img = testimages::blackSquare();
  cv::Mat processed = ImageProcessor::preprocess(img);
  EXPECT_EQ(processed.type(), CV_8UC1);
  EXPECT_EQ(processed.size(), img.size());
  EXPECT_TRUE(isBinary(processed));
  EXPECT_GT(cv::countNonZero(processed), 0);
}

TEST(ImageProcessorTest, PreprocessIsDeterministic) {
  cv::Mat img = testimages::comicPage();
  cv::Mat a = ImageProcessor::preprocess(img);
  cv::Mat b = ImageProcessor::preprocess(img);
  EXPECT_EQ(cv::norm(a, b, cv::NORM_INF), 0.0);
}

TEST(ImageProcessorTest, PreprocessHonoursParameters) {
  ImageProcessor::ProcessingParams params;
  params.morphKernelSize = 8;
  EXPECT_THROW(ImageProcessor::preprocess(testimages::blackSquare(), params), InvalidParameterError);

  params.morphKernelSize = 3;
  params.cannyLower = 200;
  params.cannyUpper = 100;
  EXPECT_THROW(ImageProcessor::preprocess(testimages::blackSquare(), params), InvalidParameterError);
}

TEST(ImageProcessorTest, EnhanceForOCRKeepsDimensions) {
  cv::Mat page = testimages::speechBalloon();
  cv::Mat enhanced = ImageProcessor::enhanceForOCR(page);
  EXPECT_EQ(enhanced.size(), page.size());
  EXPECT_EQ(enhanced.channels(), 1);
  EXPECT_EQ(enhanced.depth(), CV_8U);
}

TEST(ImageProcessorTest, EnhanceForOCRIsDeterministic) {
  cv::Mat page = testimages::speechBalloon();
  cv::Mat a = ImageProcessor::enhanceForOCR(page);
  cv::Mat b = ImageProcessor::enhanceForOCR(page);
  EXPECT_EQ(cv::norm(a, b, cv::NORM_INF), 0.0);
}

TEST(ImageProcessorTest, EnhanceForOCRWithoutDenoiseOrSharpen) {
  ImageProcessor::ProcessingParams params;
  params.denoiseStrength = 0.0f;
  params.sharpenAmount = 0.0;
  cv::Mat enhanced = ImageProcessor::enhanceForOCR(testimages::blackSquare(), params);
  EXPECT_EQ(enhanced.size(), cv::Size(100, 100));
}

TEST(ImageProcessorTest, DefaultParamsAreValid) {
  ImageProcessor::ProcessingParams params;
  EXPECT_NO_THROW(ImageProcessor::validateParams(params));
}

TEST(ImageProcessorTest, ValidateParamsRejectsBadBands) {
  ImageProcessor::ProcessingParams params;
  params.minAreaRatio = 0.6;
  params.maxAreaRatio = 0.5;
  EXPECT_THROW(ImageProcessor::validateParams(params), InvalidParameterError);

  params = ImageProcessor::ProcessingParams();
  params.grabCutIterations = 0;
  EXPECT_THROW(ImageProcessor::validateParams(params), InvalidParameterError);

  params = ImageProcessor::ProcessingParams();
  params.blurKernelSize = 2;
  EXPECT_THROW(ImageProcessor::validateParams(params), InvalidParameterError);
}
