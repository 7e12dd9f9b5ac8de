#ifndef LEXT_PIPELINE_HPP
#define LEXT_PIPELINE_HPP

#include "lext/Config.hpp"
#include "lext/ContextStore.hpp"
#include "lext/Errors.hpp"
#include "lext/ImageSanitizer.hpp"
#include "lext/LayoutAnalyzer.hpp"
#include "lext/SemanticClassifier.hpp"
#include "lext/TextExtractor.hpp"

#include <memory>
#include <string>
#include <vector>

namespace lext {

/**
 * @brief Per-document options of a pipeline run
 */
struct RunOptions {
  std::string caseId;                      ///< Context Store case (empty = none)
  std::string systemOverride;              ///< Skip system detection
  std::vector<std::string> exclusionWords; ///< Removed from the page text
  bool maskPii = false;
};

/**
 * @brief Everything produced for one document
 */
struct PipelineResult {
  bool success = false;
  std::string errorMessage;
  std::string docId;
  std::string outputDirectory; ///< <output>/<docId>
  SystemIdentification system;
  std::vector<PageLayout> layouts;
  std::vector<ExtractionResult> pages;
  std::vector<Section> sections;
  Warnings warnings;           ///< Warnings of every stage, in stage order
  std::vector<std::string> artifacts; ///< Files written
  double processingTimeMs = 0;
};

/**
 * @brief Runs the five stages on one PDF and writes its artifacts
 *
 * Stages: layout analysis, image sanitizing of raster pages, text
 * extraction, semantic classification. The Context Store, when enabled,
 * supplies hints to and learns from the extraction stage.
 *
 * Artifacts under <output>/<docId>/: layout.json, images/page_NNN.png,
 * final.md, semantic_structure.json and semantic.md.
 *
 * Example:
 * @code
 *   lext::PipelineConfig config;
 *   lext::applyEnvironment(config);
 *   lext::Pipeline pipeline(config);
 *   auto result = pipeline.run("process.pdf", {"0001234-56.2024.8.26.0100"});
 *   if (!result.success) {
 *     std::cerr << result.errorMessage << std::endl;
 *   }
 * @endcode
 */
class Pipeline {
public:
  explicit Pipeline(const PipelineConfig &config);
  ~Pipeline();

  Pipeline(const Pipeline &) = delete;
  Pipeline &operator=(const Pipeline &) = delete;

  /**
   * @brief Process one PDF
   * @return success=false with errorMessage when the document is unreadable
   */
  PipelineResult run(const std::string &pdfPath,
                     const RunOptions &options = RunOptions());

  /**
   * @brief Replace the classifier (default: PatternClassifier)
   */
  void setClassifier(std::unique_ptr<DocumentClassifier> classifier);

  /**
   * @brief Replace an extraction engine of the same tier
   */
  void setEngine(std::shared_ptr<ExtractionEngine> engine);

  /**
   * @brief Context Store in use, null when disabled or unavailable
   */
  ContextStore *contextStore() const { return m_store.get(); }

  const PipelineConfig &getConfig() const { return m_config; }

private:
  void openContextStore();
  void writeText(const std::string &path, const std::string &content,
                 PipelineResult &result) const;

  PipelineConfig m_config;
  LayoutAnalyzer m_layout;
  ImageSanitizer m_sanitizer;
  TextExtractor m_extractor;
  std::unique_ptr<DocumentClassifier> m_classifier;
  std::unique_ptr<ContextStore> m_store;
};

} // namespace lext

#endif // LEXT_PIPELINE_HPP
