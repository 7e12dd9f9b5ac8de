#ifndef LEXT_SYSTEM_DETECTOR_HPP
#define LEXT_SYSTEM_DETECTOR_HPP

#include "lext/Types.hpp"

#include <regex>
#include <string>
#include <vector>

namespace lext {

/**
 * @brief Fingerprints of one document-issuing system
 */
struct SystemProfile {
  std::string code;
  std::string name;
  int tier = 3; ///< 1 = most specific fingerprints
  std::vector<std::regex> fingerprints;
};

/**
 * @brief Identifies the electronic court system that produced a document
 *
 * Fingerprints are matched against accent-folded, lowercase text. Every
 * system with at least one match is a candidate; candidates are ranked by
 * tier, then by match count. Without candidates the detector falls back to
 * GENERIC_JUDICIAL when ICP-Brasil signature marks are present, else
 * UNKNOWN.
 */
class SystemDetector {
public:
  SystemDetector();

  /**
   * @brief Detect the issuing system of a document
   * @param documentText Concatenated page text
   * @return Identification with confidence 0-100
   */
  SystemIdentification detect(const std::string &documentText) const;

  /**
   * @brief Identification for a caller-supplied system code
   */
  SystemIdentification fromOverride(const std::string &systemCode) const;

  const std::vector<SystemProfile> &profiles() const { return m_profiles; }

  static constexpr size_t kMinTextLength = 100;
  static constexpr size_t kMaxScanLength = 256 * 1024; ///< Bytes scanned

private:
  static int countMatches(const std::string &text,
                          const std::vector<std::regex> &patterns);

  std::vector<SystemProfile> m_profiles;
  std::vector<std::regex> m_icpBrasil;
};

} // namespace lext

#endif // LEXT_SYSTEM_DETECTOR_HPP
