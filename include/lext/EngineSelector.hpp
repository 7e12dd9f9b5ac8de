#ifndef LEXT_ENGINE_SELECTOR_HPP
#define LEXT_ENGINE_SELECTOR_HPP

#include "lext/ContextStore.hpp"
#include "lext/Errors.hpp"
#include "lext/Types.hpp"

#include <optional>

namespace lext {

/**
 * @brief Engines that can be afforded for the current document
 */
struct EngineBudget {
  bool native = true;
  bool ocr = true;
  bool mlLayout = false;

  bool allows(EngineType engine) const;
};

/**
 * @brief Engine picked for a page and why
 */
struct EngineChoice {
  EngineType engine = EngineType::Native;
  bool fromHint = false;            ///< The Context Store hint decided
  std::optional<PageRect> region;   ///< Region suggested by the hint
  Warnings warnings;
};

/**
 * @brief Pure engine selection and escalation logic
 *
 * Native pages always use the text-layer parser. Raster pages follow a
 * usable Context Store hint and otherwise get the highest tier the budget
 * allows. Escalation only ever moves to a tier of higher quality.
 */
class EngineSelector {
public:
  EngineSelector(double hintMinSimilarity = 0.85,
                 double hintMinConfidence = 0.7);

  EngineChoice select(const PageLayout &layout,
                      const std::optional<PatternHint> &hint,
                      const EngineBudget &budget) const;

  /**
   * @brief Cheapest affordable recognition tier above @p current
   */
  std::optional<EngineType> nextTier(EngineType current,
                                     const EngineBudget &budget) const;

  /**
   * @brief Tier to fall back to when @p current fails or is unavailable
   *
   * Prefers the best recognition tier below @p current; the native text
   * layer comes last.
   */
  std::optional<EngineType> lowerTier(EngineType current,
                                      const EngineBudget &budget) const;

private:
  double m_hintMinSimilarity;
  double m_hintMinConfidence;
};

} // namespace lext

#endif // LEXT_ENGINE_SELECTOR_HPP
