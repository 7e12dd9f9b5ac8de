#ifndef LEXT_LAYOUT_ANALYZER_HPP
#define LEXT_LAYOUT_ANALYZER_HPP

#include "lext/Config.hpp"
#include "lext/Errors.hpp"
#include "lext/PdfDocument.hpp"
#include "lext/SystemDetector.hpp"
#include "lext/Types.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace lext {

/**
 * @brief Lateral band found on a single page
 */
struct BandDetection {
  bool detected = false;
  BandSide side = BandSide::None;
  double cutCoordinate = 0.0; ///< X boundary between body and band
  double charShare = 0.0;     ///< Share of characters inside the edge zone
  bool fromImage = false;     ///< Band is an embedded image strip
};

/**
 * @brief Result of surveying every page of a document
 */
struct LayoutReport {
  std::string docId;
  std::vector<PageLayout> pages;
  std::vector<std::string> pageTexts; ///< Native text of each page
  SystemIdentification system;
  BandDetection documentBand; ///< Band accepted for the whole document
  Warnings warnings;
  double processingTimeMs = 0;
};

/**
 * @brief Per-page structural survey of a PDF
 *
 * For each page the analyzer reads the native text layer, looks for a
 * lateral signature/certification band, derives the trustworthy region and
 * decides between native extraction and rasterization. A band is accepted
 * only when the same side is flagged on a majority of the pages that carry
 * text.
 *
 * Example usage:
 * @code
 * lext::LayoutAnalyzer analyzer;
 * lext::PdfDocument pdf("process.pdf");
 * auto report = analyzer.analyze(pdf);
 * for (const auto &page : report.pages) {
 *     std::cout << page.pageNumber << " " << lext::toString(page.classification);
 * }
 * @endcode
 */
class LayoutAnalyzer {
public:
  LayoutAnalyzer();
  explicit LayoutAnalyzer(const LayoutConfig &config);

  /**
   * @brief Survey all pages of an open document
   * @param document PDF to analyze
   * @param systemOverride System code to use instead of detection (optional)
   * @return Layout of each page plus system identification
   * @throws DocumentError if no page of the document can be read
   */
  LayoutReport analyze(const PdfDocument &document,
                       const std::string &systemOverride = "") const;

  /**
   * @brief Open and survey a PDF file
   * @throws DocumentError for unreadable, locked or empty PDFs
   */
  LayoutReport analyzeFile(const std::string &pdfPath,
                           const std::string &systemOverride = "") const;

  const LayoutConfig &getConfig() const { return m_config; }

  /**
   * @brief Look for a lateral band on one page
   * @param boxes Words of the page, top-left origin
   * @param images Embedded image placements, top-left origin
   * @param pageWidth Page width in points
   * @param pageHeight Page height in points
   */
  BandDetection detectLateralBand(const std::vector<TextBox> &boxes,
                                  const std::vector<PageRect> &images,
                                  double pageWidth, double pageHeight) const;

  /**
   * @brief Region of the page that excludes @p band plus the safety margin
   *
   * The result is clamped to the page and never empty; without a band it
   * is the full page.
   */
  PageRect trustworthyRegion(const BandDetection &band, double pageWidth,
                             double pageHeight) const;

  /**
   * @brief Build the layout of one page from its raw survey data
   * @param pageNumber 1-indexed page number
   * @param boxes Words of the page
   * @param images Embedded image placements
   * @param pageWidth Page width in points
   * @param pageHeight Page height in points
   * @param band Band to exclude (already reconciled with the document)
   */
  PageLayout buildPageLayout(int pageNumber, const std::vector<TextBox> &boxes,
                             const std::vector<PageRect> &images,
                             double pageWidth, double pageHeight,
                             const BandDetection &band) const;

  /**
   * @brief Accept a band side only if most text pages agree on it
   * @param pageBands Per-page detections
   * @param textPages Number of pages with any native text or images
   * @return The document band, with the median cut of agreeing pages
   */
  BandDetection reconcileBands(const std::vector<BandDetection> &pageBands,
                               int textPages) const;

  /**
   * @brief Layout recorded for a page that could not be read
   */
  static PageLayout degradedPage(int pageNumber, double pageWidth,
                                 double pageHeight);

  /**
   * @brief Engine recommended for a complexity tag
   */
  static EngineType engineFor(ComplexityTag tag);

  /**
   * @brief Serialize a report as the layout.json artifact
   */
  static nlohmann::json toJson(const LayoutReport &report);

  /**
   * @brief Write layout.json
   * @return true on success
   */
  static bool saveJson(const LayoutReport &report, const std::string &path);

private:
  BandDetection detectTextBand(const std::vector<TextBox> &boxes,
                               double pageWidth, BandSide side) const;

  LayoutConfig m_config;
  SystemDetector m_detector;
};

nlohmann::json toJson(const PageLayout &layout);
nlohmann::json toJson(const PageRect &rect);

} // namespace lext

#endif // LEXT_LAYOUT_ANALYZER_HPP
