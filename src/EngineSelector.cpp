#include "lext/EngineSelector.hpp"

#include <array>

namespace lext {

namespace {

// Tiers that can read a rendered page, highest quality first
constexpr std::array<EngineType, 2> kRecognitionTiers = {EngineType::MlLayout,
                                                         EngineType::Ocr};

} // anonymous namespace

bool EngineBudget::allows(EngineType engine) const {
  switch (engine) {
  case EngineType::Native:
    return native;
  case EngineType::Ocr:
    return ocr;
  case EngineType::MlLayout:
    return mlLayout;
  }
  return false;
}

EngineSelector::EngineSelector(double hintMinSimilarity,
                               double hintMinConfidence)
    : m_hintMinSimilarity(hintMinSimilarity),
      m_hintMinConfidence(hintMinConfidence) {}

EngineChoice EngineSelector::select(const PageLayout &layout,
                                    const std::optional<PatternHint> &hint,
                                    const EngineBudget &budget) const {
  EngineChoice choice;

  if (layout.classification == PageClassification::Native) {
    choice.engine = EngineType::Native;
    return choice;
  }

  if (hint && hint->shouldUse(m_hintMinSimilarity, m_hintMinConfidence) &&
      hint->suggestedEngine != EngineType::Native) {
    if (budget.allows(hint->suggestedEngine)) {
      choice.engine = hint->suggestedEngine;
      choice.fromHint = true;
      choice.region = hint->suggestedRegion;
      return choice;
    }
    choice.warnings.push_back(makeWarning(
        WarningKind::EngineUnavailable, layout.pageNumber,
        "hinted engine " + toString(hint->suggestedEngine) + " unavailable"));
  }

  for (EngineType engine : kRecognitionTiers) {
    if (budget.allows(engine)) {
      choice.engine = engine;
      return choice;
    }
  }

  // No recognition engine at all, read whatever text layer exists
  choice.engine = EngineType::Native;
  choice.warnings.push_back(makeWarning(WarningKind::EngineUnavailable,
                                        layout.pageNumber,
                                        "no recognition engine available"));
  return choice;
}

std::optional<EngineType>
EngineSelector::nextTier(EngineType current, const EngineBudget &budget) const {
  std::optional<EngineType> next;
  for (EngineType engine : kRecognitionTiers) {
    if (engineQuality(engine) > engineQuality(current) && budget.allows(engine)) {
      next = engine; // keep the cheapest tier above current
    }
  }
  return next;
}

std::optional<EngineType>
EngineSelector::lowerTier(EngineType current, const EngineBudget &budget) const {
  for (EngineType engine : kRecognitionTiers) {
    if (engineQuality(engine) < engineQuality(current) && budget.allows(engine)) {
      return engine;
    }
  }
  // The text layer is the last resort below every recognition tier
  if (current != EngineType::Native && budget.allows(EngineType::Native)) {
    return EngineType::Native;
  }
  return std::nullopt;
}

} // namespace lext
