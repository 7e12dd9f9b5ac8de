#include "lext/Signature.hpp"

#include <algorithm>
#include <cmath>

namespace lext {

namespace {

double complexityScore(ComplexityTag tag) {
  switch (tag) {
  case ComplexityTag::NativeClean:
    return 0.0;
  case ComplexityTag::NativeWithArtifacts:
    return 0.25;
  case ComplexityTag::RasterClean:
    return 0.5;
  case ComplexityTag::RasterDirty:
    return 0.75;
  case ComplexityTag::RasterDegraded:
    return 1.0;
  }
  return 0.5;
}

double engineScore(EngineType engine) {
  switch (engine) {
  case EngineType::Native:
    return 0.0;
  case EngineType::Ocr:
    return 0.5;
  case EngineType::MlLayout:
    return 1.0;
  }
  return 0.5;
}

} // anonymous namespace

PageSignature computeSignature(const PageLayout &layout, double bucketStep) {
  PageSignature signature;
  std::vector<double> &features = signature.features;
  features.reserve(kSignatureLength);

  // 1. Aspect ratio, wide pages saturate at 2:1
  double dimRatio = 0.5;
  if (layout.pageHeight > 0.0) {
    dimRatio = std::min(layout.pageWidth / layout.pageHeight, 2.0) / 2.0;
  }
  features.push_back(dimRatio);

  // 2. Trustworthy region area over page area
  double pageArea = layout.pageWidth * layout.pageHeight;
  double regionArea = layout.trustworthyRegion.area();
  features.push_back(pageArea > 0.0 ? std::min(regionArea / pageArea, 1.0)
                                    : 1.0);

  // 3. Characters per square point, scaled up and capped
  double density = 0.0;
  if (regionArea > 0.0) {
    density = std::min(layout.nativeCharCount / regionArea * 10.0, 1.0);
  }
  features.push_back(density);

  // 4-5. Lateral band
  features.push_back(layout.hasLateralBand ? 1.0 : 0.0);
  double cutRatio = 0.0;
  if (layout.bandCutCoordinate && layout.pageWidth > 0.0) {
    cutRatio = std::clamp(*layout.bandCutCoordinate / layout.pageWidth, 0.0, 1.0);
  } else if (layout.hasLateralBand) {
    cutRatio = 0.85;
  }
  features.push_back(cutRatio);

  // 6-7. Complexity and recommended engine
  features.push_back(complexityScore(layout.complexity));
  features.push_back(engineScore(layout.recommendedEngine));

  // 8-10. Cleaning flag, page type, cleaning reasons (max 5)
  features.push_back(layout.needsCleaning ? 1.0 : 0.0);
  features.push_back(layout.classification == PageClassification::Native ? 0.0
                                                                         : 1.0);
  features.push_back(
      std::min(static_cast<double>(layout.cleaningReasons.size()) / 5.0, 1.0));

  signature.bucket = signatureBucket(features, bucketStep);
  return signature;
}

std::string signatureBucket(const std::vector<double> &features,
                            double bucketStep) {
  double step = bucketStep > 0.0 ? bucketStep : 0.05;
  std::string bucket;
  for (size_t i = 0; i < features.size(); ++i) {
    if (i > 0) {
      bucket += ",";
    }
    bucket += std::to_string(std::lround(features[i] / step));
  }
  return bucket;
}

double cosineSimilarity(const std::vector<double> &a,
                        const std::vector<double> &b) {
  if (a.size() != b.size() || a.empty()) {
    return 0.0;
  }

  double dot = 0.0;
  double normA = 0.0;
  double normB = 0.0;
  for (size_t i = 0; i < a.size(); ++i) {
    dot += a[i] * b[i];
    normA += a[i] * a[i];
    normB += b[i] * b[i];
  }

  if (normA == 0.0 || normB == 0.0) {
    return 0.0;
  }
  return std::clamp(dot / (std::sqrt(normA) * std::sqrt(normB)), 0.0, 1.0);
}

PatternKind inferPatternKind(const PageLayout &layout) {
  if (layout.nativeCharCount < 50) {
    return PatternKind::Image;
  }
  if (layout.hasLateralBand) {
    return PatternKind::Header;
  }
  return PatternKind::TextBlock;
}

} // namespace lext
