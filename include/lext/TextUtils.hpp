#ifndef LEXT_TEXT_UTILS_HPP
#define LEXT_TEXT_UTILS_HPP

#include <string>
#include <vector>

namespace lext {
namespace text {

/**
 * @brief Fold Latin-1 accented UTF-8 letters to ASCII
 *
 * Combining diacritical marks (decomposed input) are dropped so that
 * precomposed and decomposed spellings fold to the same bytes. The no-break
 * space becomes a plain space.
 */
std::string foldAccents(const std::string &input);

std::string toUpperAscii(const std::string &input);
std::string toLowerAscii(const std::string &input);

/**
 * @brief Replace runs of whitespace with one space and trim both ends
 */
std::string collapseWhitespace(const std::string &input);

std::string trim(const std::string &input);

/**
 * @brief Split on '\n', dropping a trailing '\r' from each line
 */
std::vector<std::string> splitLines(const std::string &input);

/**
 * @brief Accent-folded, lowercase, whitespace-collapsed form of a text
 */
std::string comparisonForm(const std::string &input);

/**
 * @brief Case-insensitive, whitespace-collapsed equality
 * @return true when both texts have the same comparisonForm()
 */
bool semanticEqual(const std::string &a, const std::string &b);

/**
 * @brief Number of UTF-8 code points in @p input
 */
size_t utf8Length(const std::string &input);

/**
 * @brief Escape regex metacharacters so the word matches literally
 */
std::string escapeRegex(const std::string &input);

} // namespace text
} // namespace lext

#endif // LEXT_TEXT_UTILS_HPP
