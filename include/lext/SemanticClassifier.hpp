#ifndef LEXT_SEMANTIC_CLASSIFIER_HPP
#define LEXT_SEMANTIC_CLASSIFIER_HPP

#include "lext/Config.hpp"
#include "lext/Errors.hpp"
#include "lext/Types.hpp"

#include <nlohmann/json.hpp>

#include <regex>
#include <string>
#include <vector>

namespace lext {

/**
 * @brief One page of a tagged document
 */
struct TaggedPage {
  int page = 0;
  std::string extractionType; ///< TYPE value of the marker (NATIVE, OCR, ...)
  std::string content;        ///< Text between this marker and the next
};

/**
 * @brief Page types and sections of a document
 */
struct ClassificationResult {
  std::string docId;
  std::vector<PageClassificationRecord> pages;
  std::vector<Section> sections;
  Warnings warnings;
  std::string classifierName;
  double processingTimeMs = 0;
};

/**
 * @brief Assigns taxonomy categories to the pages of a tagged document
 *
 * PatternClassifier is the default implementation. Another classifier
 * (for instance one backed by a remote model) can be plugged into the
 * pipeline in its place.
 */
class DocumentClassifier {
public:
  virtual ~DocumentClassifier() = default;

  /**
   * @brief Classify a merged document with "## [[PAGE_NNN]]" markers
   * @param taggedDocument Text Extractor output
   * @param docId Document id copied into the result
   */
  virtual ClassificationResult classify(const std::string &taggedDocument,
                                        const std::string &docId) const = 0;

  virtual std::string name() const = 0;
};

/**
 * @brief Score of one taxonomy category against a header window
 */
struct CategoryScore {
  TaxonomyCategory category = TaxonomyCategory::Indeterminado;
  double score = 0.0;
  double confidence = 0.0;
  int headerMatches = 0;
  bool openingHeader = false; ///< At least one matched header opens a section
  int synonymMatches = 0;
  std::vector<std::string> matchedPatterns;
};

/**
 * @brief Rule-based classifier over a fixed legal taxonomy
 *
 * Page text is accent-folded, uppercased and whitespace-collapsed line by
 * line. The first lines of each page form the header window; it starts at
 * initialWindowLines and grows by windowStepLines up to maxWindowLines
 * until a category with an opening header reaches earlyStopScore.
 *
 * Category score:
 * - header patterns (anchored at the start of a line): 0.5 for the first
 *   matching line, 0.2 for each further one. Weak headers such as the
 *   court address add only 0.1 each when no opening header matched;
 * - body synonyms: 0.3 each, at most 0.6;
 * - priority * 0.015.
 *
 * Categories with a header match and a score of at least minConfidence
 * qualify. A category with an opening header beats one with weak headers
 * only, then the highest score wins, ties going to taxonomy order. The
 * winner opens a section on that page. Pages without a match continue the
 * current section.
 *
 * Example:
 * @code
 *   lext::PatternClassifier classifier;
 *   auto result = classifier.classify(report.taggedDocument, "doc");
 *   for (const auto &section : result.sections) {
 *     std::cout << lext::toString(section.type) << " " << section.startPage
 *               << "-" << section.endPage << std::endl;
 *   }
 * @endcode
 */
class PatternClassifier : public DocumentClassifier {
public:
  PatternClassifier();
  explicit PatternClassifier(const ClassifierConfig &config);

  ClassificationResult classify(const std::string &taggedDocument,
                                const std::string &docId) const override;

  std::string name() const override { return "pattern"; }

  /**
   * @brief Classify a single page
   * @return Record with matched=false when no category qualifies
   */
  PageClassificationRecord classifyPage(const TaggedPage &page) const;

  /**
   * @brief Score every category against a header window
   * @param lines Normalized lines of the window
   * @return Scores in taxonomy order (INDETERMINADO excluded)
   */
  std::vector<CategoryScore> scoreWindow(
      const std::vector<std::string> &lines) const;

  /**
   * @brief Split a tagged document on its page markers
   */
  static std::vector<TaggedPage> parsePages(const std::string &taggedDocument);

  /**
   * @brief Non-empty lines, accent-folded, uppercase, whitespace-collapsed
   */
  static std::vector<std::string> normalizeLines(const std::string &text);

  /**
   * @brief Turn page records into sections
   *
   * Unmatched pages take the type of the section they continue; an
   * unmatched first page opens an INDETERMINADO section.
   */
  static std::vector<Section> buildSections(
      std::vector<PageClassificationRecord> &pages, Warnings &warnings);

  const ClassifierConfig &getConfig() const { return m_config; }

  static constexpr const char *kTaxonomyVersion = "1.0";

private:
  struct HeaderPattern {
    std::string id;
    std::regex regex;
    double baseConfidence;
    bool opening; ///< false for cues shared by every pleading
  };

  struct Synonym {
    std::string term;
    std::regex regex;
  };

  struct CategoryRules {
    TaxonomyCategory category;
    int priority; ///< 0-10
    std::vector<HeaderPattern> headers;
    std::vector<Synonym> synonyms;
  };

  void buildTaxonomy();

  ClassifierConfig m_config;
  std::vector<CategoryRules> m_taxonomy;
};

/**
 * @brief semantic_structure.json content
 */
nlohmann::json toJson(const ClassificationResult &result);

/**
 * @brief Write semantic_structure.json
 * @return true on success
 */
bool saveJson(const ClassificationResult &result, const std::string &path);

/**
 * @brief Add semantic tags to the page markers of a tagged document
 *
 * "## [[PAGE_001]] [TYPE: NATIVE] ..." gains "[SEMANTIC: X] [CONF: c]";
 * section starts are preceded by a "### INICIO DE SECAO: X" heading.
 */
std::string tagDocument(const std::string &taggedDocument,
                        const ClassificationResult &result);

} // namespace lext

#endif // LEXT_SEMANTIC_CLASSIFIER_HPP
