/**
 * @file test_layout.cpp
 * @brief Unit tests for lateral band detection and page layout building
 */

#include <gtest/gtest.h>
#include <lext/LayoutAnalyzer.hpp>

#include <string>
#include <vector>

using namespace lext;

namespace {

constexpr double kWidth = 600.0;
constexpr double kHeight = 800.0;

TextBox word(double x, double y, double width, int chars) {
  TextBox box;
  box.text = std::string(static_cast<size_t>(chars), 'a');
  box.box = PageRect{x, y, width, 12.0};
  box.charCount = chars;
  return box;
}

// Body text in four columns of words plus a narrow signature strip in the
// right 15% of the page
std::vector<TextBox> bandedPage() {
  std::vector<TextBox> boxes;
  for (int row = 0; row < 10; ++row) {
    double y = 60.0 + row * 20.0;
    for (double x : {50.0, 150.0, 250.0, 350.0}) {
      boxes.push_back(word(x, y, 80.0, 10));
    }
    boxes.push_back(word(520.0, y, 60.0, 10));
  }
  return boxes;
}

std::vector<TextBox> plainPage() {
  std::vector<TextBox> boxes;
  for (int row = 0; row < 10; ++row) {
    double y = 60.0 + row * 20.0;
    for (double x : {50.0, 150.0, 250.0, 350.0}) {
      boxes.push_back(word(x, y, 80.0, 10));
    }
  }
  return boxes;
}

} // namespace

TEST(LayoutAnalyzerTest, RightBandExcludedFromTrustworthyRegion) {
  LayoutAnalyzer analyzer;
  auto boxes = bandedPage();

  BandDetection band = analyzer.detectLateralBand(boxes, {}, kWidth, kHeight);
  ASSERT_TRUE(band.detected);
  EXPECT_EQ(band.side, BandSide::Right);
  EXPECT_DOUBLE_EQ(band.cutCoordinate, 520.0);

  PageLayout layout =
      analyzer.buildPageLayout(1, boxes, {}, kWidth, kHeight, band);
  EXPECT_TRUE(layout.hasLateralBand);
  EXPECT_EQ(layout.bandSide, BandSide::Right);
  EXPECT_LE(layout.trustworthyRegion.right(), kWidth * 0.85 + 1e-9);
  EXPECT_TRUE(layout.pageBounds().contains(layout.trustworthyRegion));
  EXPECT_EQ(layout.classification, PageClassification::Native);
  EXPECT_EQ(layout.nativeCharCount, 400);
  EXPECT_EQ(layout.complexity, ComplexityTag::NativeWithArtifacts);
  EXPECT_TRUE(layout.needsCleaning);
}

TEST(LayoutAnalyzerTest, NoBandKeepsFullPage) {
  LayoutAnalyzer analyzer;
  auto boxes = plainPage();

  BandDetection band = analyzer.detectLateralBand(boxes, {}, kWidth, kHeight);
  EXPECT_FALSE(band.detected);

  PageLayout layout =
      analyzer.buildPageLayout(1, boxes, {}, kWidth, kHeight, band);
  EXPECT_FALSE(layout.hasLateralBand);
  EXPECT_EQ(layout.trustworthyRegion, layout.pageBounds());
  EXPECT_FALSE(layout.bandCutCoordinate.has_value());
  EXPECT_EQ(layout.recommendedEngine, EngineType::Native);
}

TEST(LayoutAnalyzerTest, EmptyPageNeedsRaster) {
  LayoutAnalyzer analyzer;
  PageLayout layout =
      analyzer.buildPageLayout(2, {}, {}, kWidth, kHeight, BandDetection());
  EXPECT_EQ(layout.classification, PageClassification::RasterNeeded);
  EXPECT_EQ(layout.nativeCharCount, 0);
  EXPECT_NE(layout.recommendedEngine, EngineType::Native);
}

TEST(LayoutAnalyzerTest, ImageStripCountsAsBand) {
  LayoutAnalyzer analyzer;
  std::vector<PageRect> images = {PageRect{560.0, 0.0, 30.0, 700.0}};

  BandDetection band =
      analyzer.detectLateralBand(plainPage(), images, kWidth, kHeight);
  ASSERT_TRUE(band.detected);
  EXPECT_TRUE(band.fromImage);
  EXPECT_EQ(band.side, BandSide::Right);
  EXPECT_DOUBLE_EQ(band.cutCoordinate, 560.0);
}

TEST(LayoutAnalyzerTest, RegionAlwaysInsidePage) {
  LayoutAnalyzer analyzer;

  BandDetection farRight;
  farRight.detected = true;
  farRight.side = BandSide::Right;
  farRight.cutCoordinate = 5000.0;

  BandDetection farLeft;
  farLeft.detected = true;
  farLeft.side = BandSide::Left;
  farLeft.cutCoordinate = -40.0;

  BandDetection beyondLeft;
  beyondLeft.detected = true;
  beyondLeft.side = BandSide::Left;
  beyondLeft.cutCoordinate = 900.0;

  PageRect page{0.0, 0.0, kWidth, kHeight};
  for (const auto &band : {farRight, farLeft, beyondLeft}) {
    PageRect region = analyzer.trustworthyRegion(band, kWidth, kHeight);
    EXPECT_TRUE(page.contains(region));
    EXPECT_FALSE(region.empty());
  }
}

TEST(LayoutAnalyzerTest, BandNeedsMajorityOfPages) {
  LayoutAnalyzer analyzer;

  BandDetection right;
  right.detected = true;
  right.side = BandSide::Right;
  right.cutCoordinate = 520.0;

  BandDetection none;

  BandDetection majority = analyzer.reconcileBands({right, right, none}, 3);
  EXPECT_TRUE(majority.detected);
  EXPECT_EQ(majority.side, BandSide::Right);
  EXPECT_DOUBLE_EQ(majority.cutCoordinate, 520.0);

  BandDetection minority = analyzer.reconcileBands({right, none, none}, 3);
  EXPECT_FALSE(minority.detected);
}

TEST(LayoutAnalyzerTest, DegradedPageHasZeroConfidence) {
  PageLayout layout = LayoutAnalyzer::degradedPage(4, kWidth, kHeight);
  EXPECT_EQ(layout.pageNumber, 4);
  EXPECT_DOUBLE_EQ(layout.confidence, 0.0);
  EXPECT_EQ(layout.classification, PageClassification::RasterNeeded);
  EXPECT_EQ(layout.trustworthyRegion, layout.pageBounds());
}

TEST(LayoutAnalyzerTest, JsonCarriesPageFields) {
  LayoutAnalyzer analyzer;
  auto boxes = bandedPage();
  BandDetection band = analyzer.detectLateralBand(boxes, {}, kWidth, kHeight);

  LayoutReport report;
  report.docId = "sample";
  report.pages.push_back(
      analyzer.buildPageLayout(1, boxes, {}, kWidth, kHeight, band));

  nlohmann::json j = LayoutAnalyzer::toJson(report);
  EXPECT_EQ(j["doc_id"].get<std::string>(), "sample");
  ASSERT_EQ(j["pages"].size(), 1u);
  EXPECT_TRUE(j["pages"][0]["has_lateral_band"].get<bool>());
  EXPECT_EQ(j["pages"][0]["classification"].get<std::string>(),
            toString(PageClassification::Native));
}
