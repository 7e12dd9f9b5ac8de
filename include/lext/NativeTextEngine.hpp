#ifndef LEXT_NATIVE_TEXT_ENGINE_HPP
#define LEXT_NATIVE_TEXT_ENGINE_HPP

#include "lext/ExtractionEngine.hpp"

#include <vector>

namespace lext {

/**
 * @brief Reads the PDF text layer through Poppler
 *
 * Only words that lie entirely inside the trustworthy region are kept, so
 * text printed in a lateral band never leaks into the page text.
 */
class NativeTextEngine : public ExtractionEngine {
public:
  /**
   * @param minTextChars Character count that earns full raw confidence
   */
  explicit NativeTextEngine(int minTextChars = 50);

  EngineType type() const override { return EngineType::Native; }
  bool isAvailable() override { return true; }
  EngineOutput extract(const PageInput &input) override;

  /**
   * @brief Confidence of a text-layer read
   *
   * Scales the native quality ceiling by how many characters were found and
   * by the share of undecodable glyphs.
   */
  double scoreText(const std::string &text) const;

private:
  int m_minTextChars;
};

/**
 * @brief Keep the words lying fully inside @p region
 */
std::vector<TextBox> filterToRegion(const std::vector<TextBox> &boxes,
                                    const PageRect &region);

/**
 * @brief Group words into lines and join them in reading order
 *
 * Words whose vertical centres differ by at most half the word height are
 * placed on the same line; lines are ordered top to bottom and words left
 * to right.
 */
std::string assembleLines(const std::vector<TextBox> &boxes);

} // namespace lext

#endif // LEXT_NATIVE_TEXT_ENGINE_HPP
