#include "lext/PdfDocument.hpp"
#include "lext/Errors.hpp"
#include "lext/Log.hpp"
#include "lext/TextUtils.hpp"

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>
#include <filesystem>

// Poppler C++ wrapper
#include <poppler-document.h>
#include <poppler-page-renderer.h>
#include <poppler-page.h>

// Poppler low-level API for embedded image placement
#include <GfxState.h>
#include <GlobalParams.h>
#include <OutputDev.h>
#include <PDFDoc.h>
#include <goo/GooString.h>

namespace lext {

namespace {

// Records where raster images are painted without decoding them
class ImagePlacementOutputDev : public OutputDev {
public:
  const std::vector<PageRect> &placements() const { return m_placements; }

  // Required OutputDev overrides
  bool upsideDown() override { return false; }
  bool useDrawChar() override { return false; }
  bool interpretType3Chars() override { return false; }
  bool needNonText() override { return true; }

  void drawImage(GfxState *state, Object *ref, Stream *str, int width,
                 int height, GfxImageColorMap *colorMap, bool interpolate,
                 const int *maskColors, bool inlineImg) override {
    if (width > 0 && height > 0) {
      // CTM maps the unit square onto the image, take the axis-aligned box
      const auto &ctm = state->getCTM();
      double x0 = ctm[4];
      double y0 = ctm[5];
      double x1 = ctm[4] + ctm[0];
      double y1 = ctm[5] + ctm[1];
      double x2 = ctm[4] + ctm[2];
      double y2 = ctm[5] + ctm[3];
      double x3 = ctm[4] + ctm[0] + ctm[2];
      double y3 = ctm[5] + ctm[1] + ctm[3];

      PageRect rect;
      rect.x = std::min({x0, x1, x2, x3});
      rect.y = std::min({y0, y1, y2, y3});
      rect.width = std::max({x0, x1, x2, x3}) - rect.x;
      rect.height = std::max({y0, y1, y2, y3}) - rect.y;
      m_placements.push_back(rect);
    }

    // Base implementation skips inline image data in the content stream
    OutputDev::drawImage(state, ref, str, width, height, colorMap, interpolate,
                         maskColors, inlineImg);
  }

private:
  std::vector<PageRect> m_placements; ///< Bottom-left origin
};

cv::Mat toMat(const poppler::image &popplerImage) {
  int width = popplerImage.width();
  int height = popplerImage.height();
  cv::Mat mat;

  switch (popplerImage.format()) {
  case poppler::image::format_argb32: {
    // ARGB32 is stored as BGRA in memory on little-endian hosts
    mat = cv::Mat(height, width, CV_8UC4,
                  const_cast<char *>(popplerImage.const_data()),
                  popplerImage.bytes_per_row())
              .clone();
    cv::cvtColor(mat, mat, cv::COLOR_BGRA2BGR);
    break;
  }
  case poppler::image::format_rgb24: {
    mat = cv::Mat(height, width, CV_8UC3,
                  const_cast<char *>(popplerImage.const_data()),
                  popplerImage.bytes_per_row())
              .clone();
    cv::cvtColor(mat, mat, cv::COLOR_RGB2BGR);
    break;
  }
  case poppler::image::format_bgr24: {
    mat = cv::Mat(height, width, CV_8UC3,
                  const_cast<char *>(popplerImage.const_data()),
                  popplerImage.bytes_per_row())
              .clone();
    break;
  }
  case poppler::image::format_gray8: {
    mat = cv::Mat(height, width, CV_8UC1,
                  const_cast<char *>(popplerImage.const_data()),
                  popplerImage.bytes_per_row())
              .clone();
    cv::cvtColor(mat, mat, cv::COLOR_GRAY2BGR);
    break;
  }
  default:
    log::warn("Unsupported Poppler image format");
    break;
  }

  return mat;
}

} // anonymous namespace

PdfDocument::PdfDocument(const std::string &pdfPath) : m_path(pdfPath) {
  m_document.reset(poppler::document::load_from_file(pdfPath));

  if (!m_document) {
    throw DocumentError("Failed to load PDF file: " + pdfPath);
  }

  if (m_document->is_locked()) {
    throw DocumentError("PDF file is password protected: " + pdfPath);
  }

  if (m_document->pages() < 1) {
    throw DocumentError("PDF has no pages: " + pdfPath);
  }

  log::debug("Loaded ", pdfPath, " with ", m_document->pages(), " pages");
}

PdfDocument::~PdfDocument() = default;

int PdfDocument::pageCount() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_document->pages();
}

std::string PdfDocument::documentId() const {
  return std::filesystem::path(m_path).stem().string();
}

PageRect PdfDocument::pageBounds(int pageNumber) const {
  std::lock_guard<std::mutex> lock(m_mutex);
  std::unique_ptr<poppler::page> page(m_document->create_page(pageNumber - 1));
  if (!page) {
    throw std::runtime_error("Failed to create page " +
                             std::to_string(pageNumber));
  }
  poppler::rectf pageRect = page->page_rect();
  return PageRect{0.0, 0.0, pageRect.width(), pageRect.height()};
}

std::vector<TextBox> PdfDocument::textBoxes(int pageNumber) const {
  std::lock_guard<std::mutex> lock(m_mutex);
  std::unique_ptr<poppler::page> page(m_document->create_page(pageNumber - 1));
  if (!page) {
    throw std::runtime_error("Failed to create page " +
                             std::to_string(pageNumber));
  }

  poppler::rectf pageRect = page->page_rect();
  std::vector<poppler::text_box> popplerBoxes = page->text_list();

  std::vector<TextBox> boxes;
  boxes.reserve(popplerBoxes.size());

  for (auto &textBox : popplerBoxes) {
    poppler::byte_array textBytes = textBox.text().to_utf8();
    std::string word(textBytes.begin(), textBytes.end());
    if (word.empty()) {
      continue;
    }

    // PDF y increases upward, page coordinates here increase downward
    poppler::rectf bbox = textBox.bbox();
    TextBox box;
    box.text = word;
    box.box.x = bbox.x();
    box.box.y = pageRect.height() - bbox.y() - bbox.height();
    box.box.width = bbox.width();
    box.box.height = bbox.height();
    box.charCount = static_cast<int>(text::utf8Length(word));
    box.spaceAfter = textBox.has_space_after();
    boxes.push_back(box);
  }

  return boxes;
}

std::vector<PageRect> PdfDocument::imagePlacements(int pageNumber) const {
  std::lock_guard<std::mutex> lock(m_mutex);
  std::vector<PageRect> placements;

  // Opened once, on first use, and kept for the life of the document
  if (!m_pdfDoc) {
    if (!m_globalParams) {
      m_globalParams = std::make_unique<GlobalParamsIniter>(nullptr);
    }
    m_pdfDoc = std::make_unique<PDFDoc>(std::make_unique<GooString>(m_path));
  }
  if (!m_pdfDoc->isOk() || pageNumber < 1 ||
      pageNumber > m_pdfDoc->getNumPages()) {
    return placements;
  }

  // Same box as poppler::page::page_rect() and the text layer
  double pageHeight = m_pdfDoc->getPageCropHeight(pageNumber);

  ImagePlacementOutputDev outputDev;
  m_pdfDoc->displayPage(&outputDev, pageNumber, 72.0, 72.0, // DPI
                        0,                                  // rotation
                        false,                              // useMediaBox
                        true,                               // crop
                        false);                             // printing

  for (const PageRect &rect : outputDev.placements()) {
    PageRect converted = rect;
    converted.y = pageHeight - rect.y - rect.height;
    placements.push_back(converted);
  }

  return placements;
}

cv::Mat PdfDocument::renderPage(int pageNumber, double dpi) const {
  std::lock_guard<std::mutex> lock(m_mutex);
  std::unique_ptr<poppler::page> page(m_document->create_page(pageNumber - 1));
  if (!page) {
    log::warn("Failed to create page ", pageNumber, " for rendering");
    return cv::Mat();
  }

  poppler::page_renderer renderer;
  renderer.set_render_hint(poppler::page_renderer::antialiasing, true);
  renderer.set_render_hint(poppler::page_renderer::text_antialiasing, true);
  renderer.set_image_format(poppler::image::format_argb32);

  poppler::image popplerImage = renderer.render_page(page.get(), dpi, dpi);
  if (!popplerImage.is_valid()) {
    log::warn("Failed to render page ", pageNumber);
    return cv::Mat();
  }

  return toMat(popplerImage);
}

cv::Mat PdfDocument::renderRegion(int pageNumber, const PageRect &region,
                                  double dpi) const {
  cv::Mat rendered = renderPage(pageNumber, dpi);
  if (rendered.empty()) {
    return rendered;
  }

  cv::Rect roi = pointsToPixels(region, dpi, rendered.size());
  if (roi.empty()) {
    return rendered;
  }
  return rendered(roi).clone();
}

cv::Rect pointsToPixels(const PageRect &region, double dpi,
                        const cv::Size &imageSize) {
  double scale = dpi / 72.0;
  int x = static_cast<int>(std::floor(region.x * scale));
  int y = static_cast<int>(std::floor(region.y * scale));
  int right = static_cast<int>(std::ceil(region.right() * scale));
  int bottom = static_cast<int>(std::ceil(region.bottom() * scale));

  cv::Rect roi(x, y, right - x, bottom - y);
  return roi & cv::Rect(0, 0, imageSize.width, imageSize.height);
}

} // namespace lext
