#ifndef LEXT_TEXT_EXTRACTOR_HPP
#define LEXT_TEXT_EXTRACTOR_HPP

#include "lext/Config.hpp"
#include "lext/ContextStore.hpp"
#include "lext/EngineSelector.hpp"
#include "lext/Errors.hpp"
#include "lext/ExtractionEngine.hpp"
#include "lext/TextCleaner.hpp"
#include "lext/Types.hpp"

#include <opencv2/core.hpp>

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace lext {

/**
 * @brief Per-document inputs of the extraction stage
 */
struct ExtractionContext {
  std::optional<long long> caseId; ///< Context Store case, none = no learning
  CleaningOptions cleaning;        ///< System code, exclusions, PII masking
  double imageDpi = 300.0;         ///< Resolution of the sanitized images
};

/**
 * @brief Result of extracting every page of a document
 */
struct ExtractionReport {
  std::vector<ExtractionResult> pages; ///< One per layout, in page order
  std::string taggedDocument;          ///< Merged text with page markers
  Warnings warnings;
  bool timedOut = false;
  double processingTimeMs = 0;
};

/**
 * @brief Per-page engine selection, escalation and merging
 *
 * Native pages are read from the text layer inside the trustworthy region.
 * Raster pages go to the engine suggested by a usable Context Store hint or
 * to the best affordable recognition tier. A result below the confidence
 * threshold is re-run one tier higher and the result with the higher
 * similarityScore() is kept, ties going to the higher tier. A page is never
 * dropped: if every engine fails it is kept with empty text and zero
 * confidence.
 *
 * Example:
 * @code
 *   lext::TextExtractor extractor(config.extractor);
 *   extractor.setEngine(std::make_shared<lext::NativeTextEngine>());
 *   extractor.setEngine(std::make_shared<lext::TesseractEngine>(config.extractor));
 *   auto report = extractor.extract(&document, layout.pages, images, context);
 *   std::cout << report.taggedDocument;
 * @endcode
 */
class TextExtractor {
public:
  explicit TextExtractor(const ExtractorConfig &config);

  /**
   * @brief Register the engine of its tier, replacing any previous one
   */
  void setEngine(std::shared_ptr<ExtractionEngine> engine);

  /**
   * @brief Use a Context Store for hints and learning (may be null)
   */
  void setPatternAdvisor(PatternAdvisor *advisor,
                         const ContextStoreConfig &storeConfig);

  /**
   * @brief Extract every page
   * @param document Source PDF (may be null when every engine works from
   *        images)
   * @param layouts Page layouts from the Layout Analyzer
   * @param images Sanitized images of raster pages, keyed by page number
   * @param context Case and cleaning options
   */
  ExtractionReport extract(const PdfDocument *document,
                           const std::vector<PageLayout> &layouts,
                           const std::map<int, cv::Mat> &images,
                           const ExtractionContext &context);

  /**
   * @brief Extract one page with selection, fallback and escalation
   * @param input Page input carrying the layout's trustworthy region
   * @param layout Layout of the page
   * @param hint Context Store suggestion, if any
   * @param budget Engines usable for this document
   * @param warnings Receives fallback and degradation warnings
   */
  ExtractionResult extractPage(const PageInput &input, const PageLayout &layout,
                               const std::optional<PatternHint> &hint,
                               const EngineBudget &budget, Warnings &warnings);

  /**
   * @brief Engines that are registered and report themselves available
   */
  EngineBudget probeEngines(Warnings &warnings);

  /**
   * @brief Reference-signal quality of a text
   *
   * Dense tokens (two or more characters, at least 60% letters or digits)
   * times one minus the share of stray symbol characters.
   */
  static double similarityScore(const std::string &text);

  /**
   * @brief Merge page results into one document with a marker per page
   *
   * Each page opens with "## [[PAGE_NNN]] [TYPE: NATIVE|OCR|ML|NONE]
   * [CONF: x.xx]"; empty pages read "(página vazia)".
   */
  static std::string buildTaggedDocument(
      const std::vector<ExtractionResult> &pages);

  /**
   * @brief Marker line of one page
   */
  static std::string pageMarker(const ExtractionResult &page);

  const ExtractorConfig &getConfig() const { return m_config; }

private:
  struct Attempt {
    EngineType engine;
    EngineOutput output;
  };

  ExtractionEngine *engineFor(EngineType type) const;
  std::optional<Attempt> runEngine(EngineType type, const PageInput &input,
                                   ExtractionResult &result);

  ExtractorConfig m_config;
  EngineSelector m_selector;
  TextCleaner m_cleaner;
  std::map<EngineType, std::shared_ptr<ExtractionEngine>> m_engines;
  PatternAdvisor *m_advisor = nullptr;
  ContextStoreConfig m_storeConfig;
};

} // namespace lext

#endif // LEXT_TEXT_EXTRACTOR_HPP
