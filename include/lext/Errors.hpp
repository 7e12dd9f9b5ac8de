#ifndef LEXT_ERRORS_HPP
#define LEXT_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <vector>

namespace lext {

/**
 * @brief Unreadable or corrupt input document, fatal for that document
 */
class DocumentError : public std::runtime_error {
public:
  explicit DocumentError(const std::string &message)
      : std::runtime_error(message) {}
};

/**
 * @brief Failure of the embedded Context Store database
 */
class ContextStoreError : public std::runtime_error {
public:
  explicit ContextStoreError(const std::string &message)
      : std::runtime_error(message) {}
};

/**
 * @brief Non-fatal conditions reported alongside a result
 */
enum class WarningKind {
  PageDegraded,           ///< Page failed, recorded with zero confidence
  EngineUnavailable,      ///< Engine missing, fell back to another tier
  ClassificationAmbiguous ///< No taxonomy match, previous section inherited
};

/**
 * @brief A warning attached to a stage result
 */
struct Warning {
  WarningKind kind = WarningKind::PageDegraded;
  int page = 0; ///< 1-indexed page number, 0 for document level
  std::string message;
};

using Warnings = std::vector<Warning>;

std::string toString(WarningKind kind);

/**
 * @brief Build a warning and log it at WARN level
 */
Warning makeWarning(WarningKind kind, int page, const std::string &message);

} // namespace lext

#endif // LEXT_ERRORS_HPP
