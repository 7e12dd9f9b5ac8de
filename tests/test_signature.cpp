/**
 * @file test_signature.cpp
 * @brief Unit tests for page signatures and similarity
 */

#include <gtest/gtest.h>
#include <lext/Signature.hpp>

#include <vector>

using namespace lext;

namespace {

PageLayout rasterLayout() {
  PageLayout layout;
  layout.pageNumber = 1;
  layout.pageWidth = 595.0;
  layout.pageHeight = 842.0;
  layout.trustworthyRegion = layout.pageBounds();
  return layout;
}

} // namespace

TEST(SignatureTest, FeaturesAreNormalized) {
  PageSignature signature = computeSignature(rasterLayout());
  ASSERT_EQ(signature.features.size(), kSignatureLength);
  for (double feature : signature.features) {
    EXPECT_GE(feature, 0.0);
    EXPECT_LE(feature, 1.0);
  }
  EXPECT_EQ(signature.bucket, "7,20,0,0,0,15,10,0,20,0");
}

TEST(SignatureTest, BandShowsInSignature) {
  PageLayout layout = rasterLayout();
  layout.pageWidth = 600.0;
  layout.pageHeight = 800.0;
  layout.hasLateralBand = true;
  layout.bandSide = BandSide::Right;
  layout.bandCutCoordinate = 520.0;
  layout.trustworthyRegion = PageRect{0.0, 0.0, 510.0, 800.0};

  PageSignature signature = computeSignature(layout);
  EXPECT_DOUBLE_EQ(signature.features[3], 1.0);
  EXPECT_NEAR(signature.features[4], 520.0 / 600.0, 1e-9);
  EXPECT_NEAR(signature.features[1], 510.0 / 600.0, 1e-9);
}

TEST(SignatureTest, CosineSimilarity) {
  std::vector<double> a = {1.0, 0.0, 1.0};
  EXPECT_NEAR(cosineSimilarity(a, a), 1.0, 1e-12);
  EXPECT_NEAR(cosineSimilarity(a, {0.0, 1.0, 0.0}), 0.0, 1e-12);
  EXPECT_DOUBLE_EQ(cosineSimilarity(a, {1.0, 0.0}), 0.0);
  EXPECT_DOUBLE_EQ(cosineSimilarity(a, {0.0, 0.0, 0.0}), 0.0);
  EXPECT_DOUBLE_EQ(cosineSimilarity({}, {}), 0.0);
}

TEST(SignatureTest, BucketQuantizes) {
  EXPECT_EQ(signatureBucket({0.5, 0.1, 0.0}, 0.05), "10,2,0");
  EXPECT_EQ(signatureBucket({0.5, 0.1}, 0.1), "5,1");
  // A non-positive step falls back to the default
  EXPECT_EQ(signatureBucket({0.5}, 0.0), "10");
}

TEST(SignatureTest, PatternKindFromLayout) {
  PageLayout layout = rasterLayout();
  layout.nativeCharCount = 10;
  EXPECT_EQ(inferPatternKind(layout), PatternKind::Image);

  layout.nativeCharCount = 400;
  EXPECT_EQ(inferPatternKind(layout), PatternKind::TextBlock);

  layout.hasLateralBand = true;
  EXPECT_EQ(inferPatternKind(layout), PatternKind::Header);
}
