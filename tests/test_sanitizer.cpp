/**
 * @file test_sanitizer.cpp
 * @brief Unit tests for the image cleaning filters
 */

#include <gtest/gtest.h>
#include <lext/ImageSanitizer.hpp>

#include <opencv2/imgproc.hpp>

#include <algorithm>

using namespace lext;

namespace {

// White page with solid black "text" bars, as a digital render looks
cv::Mat cleanDigitalScan() {
  cv::Mat page(200, 200, CV_8UC1, cv::Scalar(255));
  for (int row = 20; row < 180; row += 20) {
    cv::rectangle(page, cv::Rect(20, row, 150, 6), cv::Scalar(0), cv::FILLED);
  }
  return page;
}

// White page sprinkled with isolated black pixels
cv::Mat saltAndPepper() {
  cv::Mat page(200, 200, CV_8UC1, cv::Scalar(255));
  for (int y = 2; y < 200; y += 5) {
    for (int x = 2; x < 200; x += 5) {
      page.at<uchar>(y, x) = 0;
    }
  }
  return page;
}

bool identical(const cv::Mat &a, const cv::Mat &b) {
  if (a.size() != b.size() || a.type() != b.type()) {
    return false;
  }
  cv::Mat diff;
  cv::compare(a, b, diff, cv::CMP_NE);
  return cv::countNonZero(diff) == 0;
}

} // namespace

TEST(ImageSanitizerTest, CleanScanSkipsDenoise) {
  ImageSanitizer sanitizer;
  cv::Mat page = cleanDigitalScan();
  cv::Mat filtered = page.clone();

  double estimate = -1.0;
  EXPECT_FALSE(sanitizer.conditionalDenoise(filtered, &estimate));
  EXPECT_LE(estimate, sanitizer.getConfig().noiseThreshold);
  EXPECT_TRUE(identical(page, filtered));
}

TEST(ImageSanitizerTest, NoisyScanIsDenoised) {
  ImageSanitizer sanitizer;
  cv::Mat page = saltAndPepper();

  double estimate = 0.0;
  EXPECT_TRUE(sanitizer.conditionalDenoise(page, &estimate));
  EXPECT_GT(estimate, sanitizer.getConfig().noiseThreshold);

  cv::Mat dark = page < 150;
  EXPECT_EQ(cv::countNonZero(dark), 0);
}

TEST(ImageSanitizerTest, MostlyDarkImageHasNoEstimate) {
  ImageSanitizer sanitizer;
  cv::Mat page(100, 100, CV_8UC1, cv::Scalar(20));
  EXPECT_DOUBLE_EQ(sanitizer.estimateSaltPepperNoise(page), 0.0);
}

TEST(ImageSanitizerTest, DetectsDigitalAndPhotoScans) {
  ImageSanitizer sanitizer;
  EXPECT_EQ(sanitizer.detectMode(cleanDigitalScan()), SanitizerMode::DigitalScan);

  cv::Mat photo(100, 100, CV_8UC1, cv::Scalar(128));
  EXPECT_EQ(sanitizer.detectMode(photo), SanitizerMode::PhotoScan);
}

TEST(ImageSanitizerTest, SanitizeCleanScanKeepsPixels) {
  SanitizerConfig config;
  config.mode = SanitizerMode::DigitalScan;
  ImageSanitizer sanitizer(config);

  cv::Mat page = cleanDigitalScan();
  SanitizedImage result = sanitizer.sanitize(page);

  EXPECT_FALSE(result.degraded);
  EXPECT_FALSE(result.denoised);
  EXPECT_EQ(result.mode, SanitizerMode::DigitalScan);
  EXPECT_TRUE(identical(page, result.image));
}

TEST(ImageSanitizerTest, BackgroundSuppressionWhitensWatermark) {
  ImageSanitizer sanitizer;
  cv::Mat page = cleanDigitalScan();
  cv::rectangle(page, cv::Rect(0, 190, 200, 10), cv::Scalar(230), cv::FILLED);

  int changed = sanitizer.suppressBackground(page);
  EXPECT_EQ(changed, 2000);
  EXPECT_EQ(page.at<uchar>(195, 100), 255);
  EXPECT_EQ(page.at<uchar>(22, 50), 0);
}

TEST(ImageSanitizerTest, ColorStampsArePaintedWhite) {
  cv::Mat page(100, 100, CV_8UC3, cv::Scalar(255, 255, 255));
  cv::circle(page, cv::Point(50, 50), 20, cv::Scalar(200, 0, 0), cv::FILLED);

  cv::Mat cleaned = ImageSanitizer::removeColorStamps(page);
  cv::Vec3b center = cleaned.at<cv::Vec3b>(50, 50);
  EXPECT_TRUE(center == cv::Vec3b(255, 255, 255));
}

TEST(ImageSanitizerTest, EmptyRenderIsDegraded) {
  ImageSanitizer sanitizer;
  SanitizedImage result = sanitizer.sanitize(cv::Mat());
  EXPECT_TRUE(result.degraded);
  EXPECT_FALSE(result.errorMessage.empty());
}

TEST(ImageSanitizerTest, ImageFileNameIsZeroPadded) {
  ImageSanitizer sanitizer;
  EXPECT_EQ(sanitizer.imageFileName(7), "page_007.png");
}

TEST(ImageSanitizerTest, WhitePageKeepsLightMarks) {
  SanitizerConfig config;
  config.mode = SanitizerMode::DigitalScan;
  ImageSanitizer sanitizer(config);

  // A small light-gray stamp on an otherwise white page
  cv::Mat page = cleanDigitalScan();
  cv::rectangle(page, cv::Rect(0, 190, 200, 10), cv::Scalar(230), cv::FILLED);
  EXPECT_LT(ImageSanitizer::backgroundGrayShare(page),
            config.midToneDominance);

  SanitizedImage result = sanitizer.sanitize(page);
  EXPECT_TRUE(identical(page, result.image));
  EXPECT_EQ(result.image.at<uchar>(195, 100), 230);
  for (const auto &step : result.steps) {
    EXPECT_NE(step, "background");
  }
}

TEST(ImageSanitizerTest, GrayBackgroundIsWhitened) {
  SanitizerConfig config;
  config.mode = SanitizerMode::DigitalScan;
  ImageSanitizer sanitizer(config);

  cv::Mat page(200, 200, CV_8UC1, cv::Scalar(225));
  for (int row = 20; row < 180; row += 20) {
    cv::rectangle(page, cv::Rect(20, row, 150, 6), cv::Scalar(0), cv::FILLED);
  }
  EXPECT_DOUBLE_EQ(ImageSanitizer::backgroundGrayShare(page), 1.0);

  SanitizedImage result = sanitizer.sanitize(page);
  ASSERT_FALSE(result.steps.empty());
  EXPECT_NE(std::find(result.steps.begin(), result.steps.end(), "background"),
            result.steps.end());
  EXPECT_EQ(result.image.at<uchar>(5, 5), 255);
  EXPECT_EQ(result.image.at<uchar>(22, 50), 0);
}
