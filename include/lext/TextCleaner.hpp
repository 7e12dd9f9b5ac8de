#ifndef LEXT_TEXT_CLEANER_HPP
#define LEXT_TEXT_CLEANER_HPP

#include "lext/Config.hpp"

#include <map>
#include <regex>
#include <string>
#include <vector>

namespace lext {

/**
 * @brief What a cleaning pass removed
 */
struct CleaningStats {
  std::string systemCode;
  size_t originalLength = 0;
  size_t finalLength = 0;
  double reductionPercent = 0.0;
  std::vector<std::string> patternsRemoved; ///< Descriptions of rules that hit
};

struct CleaningResult {
  std::string text;
  CleaningStats stats;
};

/**
 * @brief Removes issuing-system artifacts from extracted page text
 *
 * Steps, in order:
 * 1. rules of the issuing system (signature stamps, verification codes);
 * 2. universal rules (page counters, folio numbers, jus.br URLs,
 *    certification text, isolated date/time/hex lines of the lateral band);
 * 3. the caller's exclusion words, matched literally and case-insensitively;
 * 4. normalization (control characters, typographic quotes and dashes,
 *    hyphenation across line breaks, runs of blanks and blank lines);
 * 5. optional masking of CPF, CNPJ, e-mail and phone numbers.
 */
class TextCleaner {
public:
  TextCleaner();

  /**
   * @brief Clean one page of text
   * @param text Extracted text
   * @param options System code, exclusion words and PII masking
   */
  CleaningResult clean(const std::string &text,
                       const CleaningOptions &options) const;

  /**
   * @brief Typography and whitespace normalization only
   */
  static std::string normalize(const std::string &text);

  /**
   * @brief Replace personal identifiers with [CPF], [CNPJ], [EMAIL], [TELEFONE]
   */
  static std::string maskPii(const std::string &text);

  /**
   * @brief System codes that carry dedicated rules
   */
  std::vector<std::string> supportedSystems() const;

private:
  struct Rule {
    std::string description;
    std::regex regex;
  };

  static Rule rule(const std::string &description, const std::string &pattern);

  bool applyRules(std::string &text, const std::vector<Rule> &rules,
                  std::vector<std::string> &removed) const;
  bool applyLineRules(std::string &text, const std::vector<Rule> &rules,
                      std::vector<std::string> &removed) const;

  std::map<std::string, std::vector<Rule>> m_systemRules;
  std::map<std::string, std::vector<Rule>> m_systemLineRules;
  std::vector<Rule> m_universalRules;
  std::vector<Rule> m_universalLineRules; ///< Matched against whole lines
};

} // namespace lext

#endif // LEXT_TEXT_CLEANER_HPP
