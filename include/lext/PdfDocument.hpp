#ifndef LEXT_PDF_DOCUMENT_HPP
#define LEXT_PDF_DOCUMENT_HPP

#include "lext/Types.hpp"

#include <opencv2/core.hpp>

#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace poppler {
class document;
}

class PDFDoc;
class GlobalParamsIniter;

namespace lext {

/**
 * @brief A word of the native text layer
 */
struct TextBox {
  std::string text; ///< UTF-8 text of the word
  PageRect box;     ///< Bounding box, top-left origin, in points
  int charCount = 0; ///< Number of code points in text
  bool spaceAfter = true; ///< Poppler reports a space after this word
};

/**
 * @brief Read-only access to a PDF through Poppler
 *
 * Wraps a poppler::document for text-layer reads and page rendering, and
 * opens the low-level PDFDoc once for embedded image placement. Access to
 * both is serialized, so one instance can be used by several page
 * workers. Page coordinates are relative to the crop box.
 *
 * Example usage:
 * @code
 * lext::PdfDocument pdf("process.pdf");
 * for (int page = 1; page <= pdf.pageCount(); ++page) {
 *     auto words = pdf.textBoxes(page);
 * }
 * @endcode
 */
class PdfDocument {
public:
  /**
   * @brief Load a PDF from disk
   * @param pdfPath Path to the PDF file
   * @throws DocumentError if the file cannot be parsed, is locked or has no
   * pages
   */
  explicit PdfDocument(const std::string &pdfPath);

  ~PdfDocument();

  PdfDocument(const PdfDocument &) = delete;
  PdfDocument &operator=(const PdfDocument &) = delete;

  /**
   * @brief Number of pages in the document
   */
  int pageCount() const;

  /**
   * @brief Path the document was loaded from
   */
  const std::string &path() const { return m_path; }

  /**
   * @brief Stable document id derived from the file name
   */
  std::string documentId() const;

  /**
   * @brief Page bounds in points
   * @param pageNumber 1-indexed page number
   * @throws std::runtime_error if the page cannot be created
   */
  PageRect pageBounds(int pageNumber) const;

  /**
   * @brief Words of the native text layer
   *
   * Coordinates are converted from PDF space (origin bottom-left) to
   * top-left origin.
   *
   * @param pageNumber 1-indexed page number
   * @return Words on the page (empty for image-only pages)
   * @throws std::runtime_error if the page cannot be created
   */
  std::vector<TextBox> textBoxes(int pageNumber) const;

  /**
   * @brief Placement of embedded raster images on a page
   *
   * Uses Poppler's OutputDev callbacks, no pixel data is decoded.
   *
   * @param pageNumber 1-indexed page number
   * @return Image rectangles in points, top-left origin
   */
  std::vector<PageRect> imagePlacements(int pageNumber) const;

  /**
   * @brief Render a page as a BGR image
   * @param pageNumber 1-indexed page number
   * @param dpi Rendering resolution
   * @return Rendered page, empty on failure
   */
  cv::Mat renderPage(int pageNumber, double dpi) const;

  /**
   * @brief Render a page and crop it to a region given in points
   * @param pageNumber 1-indexed page number
   * @param region Region in points, top-left origin
   * @param dpi Rendering resolution
   * @return Cropped render, empty on failure
   */
  cv::Mat renderRegion(int pageNumber, const PageRect &region,
                       double dpi) const;

private:
  std::unique_ptr<poppler::document> m_document;
  mutable std::unique_ptr<GlobalParamsIniter> m_globalParams;
  mutable std::unique_ptr<PDFDoc> m_pdfDoc; ///< Opened by imagePlacements
  std::string m_path;
  mutable std::mutex m_mutex;
};

/**
 * @brief Convert a rectangle in points to a pixel rectangle at @p dpi
 *
 * The result is clamped to an image of @p imageSize.
 */
cv::Rect pointsToPixels(const PageRect &region, double dpi,
                        const cv::Size &imageSize);

} // namespace lext

#endif // LEXT_PDF_DOCUMENT_HPP
