#ifndef LEXT_EXTRACTION_ENGINE_HPP
#define LEXT_EXTRACTION_ENGINE_HPP

#include "lext/PdfDocument.hpp"
#include "lext/Types.hpp"

#include <opencv2/core.hpp>

#include <string>

namespace lext {

/**
 * @brief Everything an engine may need to read one page
 */
struct PageInput {
  int pageNumber = 0;                   ///< 1-indexed page number
  const PdfDocument *document = nullptr; ///< Source PDF (may be null)
  PageRect region;                      ///< Trustworthy region in points
  cv::Mat image;                        ///< Sanitized render of the region
  double imageDpi = 300.0;              ///< Resolution of @ref image
};

/**
 * @brief Raw result of one engine run
 */
struct EngineOutput {
  bool success = false;     ///< Whether the engine produced a result
  std::string text;         ///< Recognized text
  double confidence = 0.0;  ///< Quality ceiling times raw confidence
  std::string errorMessage; ///< Error message if failed
  double processingTimeMs = 0;
};

/**
 * @brief A text extraction capability
 *
 * Implementations are interchangeable behind the Text Extractor: the native
 * text-layer parser, the OCR engine and the layout-aware high-fidelity
 * recognizer. Confidence is reported already scaled by engineQuality() of
 * the engine's tier.
 */
class ExtractionEngine {
public:
  virtual ~ExtractionEngine() = default;

  /**
   * @brief Tier implemented by this engine
   */
  virtual EngineType type() const = 0;

  /**
   * @brief Whether the engine's dependencies and resources are present
   */
  virtual bool isAvailable() = 0;

  /**
   * @brief Extract the text of one page
   * @param input Page to read
   * @return Engine output, success=false on failure
   */
  virtual EngineOutput extract(const PageInput &input) = 0;
};

} // namespace lext

#endif // LEXT_EXTRACTION_ENGINE_HPP
