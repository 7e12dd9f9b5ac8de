#include "lext/LayoutAnalyzer.hpp"
#include "lext/Log.hpp"
#include "lext/NativeTextEngine.hpp"
#include "lext/WorkerPool.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <fstream>
#include <limits>

namespace lext {

namespace {

// A4 in points, used when a page size cannot be read at all
constexpr double kDefaultPageWidth = 595.276;
constexpr double kDefaultPageHeight = 841.89;

// Tolerance for words touching the region border
constexpr double kContainmentEpsilon = 0.5;

struct PageSurvey {
  bool readable = false;
  double width = 0.0;
  double height = 0.0;
  std::vector<TextBox> boxes;
  std::vector<PageRect> images;
  BandDetection band;
  std::string text;
  std::string error;
};

bool insideRegion(const PageRect &box, const PageRect &region) {
  return box.x >= region.x - kContainmentEpsilon &&
         box.y >= region.y - kContainmentEpsilon &&
         box.right() <= region.right() + kContainmentEpsilon &&
         box.bottom() <= region.bottom() + kContainmentEpsilon;
}

double clippedArea(const PageRect &rect, double width, double height) {
  double left = std::max(0.0, rect.x);
  double top = std::max(0.0, rect.y);
  double right = std::min(width, rect.right());
  double bottom = std::min(height, rect.bottom());
  if (right <= left || bottom <= top) {
    return 0.0;
  }
  return (right - left) * (bottom - top);
}

} // anonymous namespace

LayoutAnalyzer::LayoutAnalyzer() : m_config() {}

LayoutAnalyzer::LayoutAnalyzer(const LayoutConfig &config) : m_config(config) {}

BandDetection LayoutAnalyzer::detectTextBand(const std::vector<TextBox> &boxes,
                                             double pageWidth,
                                             BandSide side) const {
  BandDetection band;
  if (boxes.empty() || pageWidth <= 0.0) {
    return band;
  }

  int bins = std::max(1, m_config.histogramBins);
  std::vector<double> histogram(bins, 0.0);
  double totalChars = 0.0;

  for (const auto &box : boxes) {
    double center = box.box.x + box.box.width / 2.0;
    int bin = static_cast<int>(center / pageWidth * bins);
    bin = std::clamp(bin, 0, bins - 1);
    histogram[bin] += box.charCount;
    totalChars += box.charCount;
  }

  if (totalChars <= 0.0) {
    return band;
  }

  int zoneBins = std::max(
      1, static_cast<int>(std::lround(bins * m_config.bandZonePercent)));
  int zoneBegin = side == BandSide::Right ? bins - zoneBins : 0;
  int zoneEnd = side == BandSide::Right ? bins : zoneBins;

  double zoneChars = 0.0;
  double bodyChars = 0.0;
  int zoneFilled = 0;
  int bodyFilled = 0;
  for (int bin = 0; bin < bins; ++bin) {
    bool inZone = bin >= zoneBegin && bin < zoneEnd;
    if (inZone) {
      zoneChars += histogram[bin];
      zoneFilled += histogram[bin] > 0.0 ? 1 : 0;
    } else {
      bodyChars += histogram[bin];
      bodyFilled += histogram[bin] > 0.0 ? 1 : 0;
    }
  }

  band.charShare = zoneChars / totalChars;
  if (band.charShare < m_config.bandCharRatio || bodyChars <= 0.0) {
    return band;
  }

  // Adaptive cut: first wide empty column between the body and the band
  std::vector<TextBox> sorted = boxes;
  if (side == BandSide::Right) {
    std::sort(sorted.begin(), sorted.end(),
              [](const TextBox &a, const TextBox &b) { return a.box.x < b.box.x; });
    double limit = pageWidth * (1.0 - m_config.bandMaxPercent);
    double reach = -std::numeric_limits<double>::infinity();
    for (const auto &box : sorted) {
      if (std::isfinite(reach) && box.box.x - reach >= m_config.minCutGap &&
          box.box.x >= limit) {
        band.detected = true;
        band.cutCoordinate = box.box.x;
        break;
      }
      reach = std::max(reach, box.box.right());
    }
  } else {
    std::sort(sorted.begin(), sorted.end(), [](const TextBox &a, const TextBox &b) {
      return a.box.right() > b.box.right();
    });
    double limit = pageWidth * m_config.bandMaxPercent;
    double reach = std::numeric_limits<double>::infinity();
    for (const auto &box : sorted) {
      if (std::isfinite(reach) && reach - box.box.right() >= m_config.minCutGap &&
          box.box.right() <= limit) {
        band.detected = true;
        band.cutCoordinate = box.box.right();
        break;
      }
      reach = std::min(reach, box.box.x);
    }
  }

  if (!band.detected && zoneFilled > 0 && bodyFilled > 0) {
    // No clean gap: fall back to a marked density contrast
    double zoneDensity = zoneChars / zoneFilled;
    double bodyDensity = bodyChars / bodyFilled;
    if (zoneDensity >= 2.0 * bodyDensity || zoneDensity <= 0.5 * bodyDensity) {
      band.detected = true;
      double zoneWidth = pageWidth * zoneBins / bins;
      band.cutCoordinate =
          side == BandSide::Right ? pageWidth - zoneWidth : zoneWidth;
    }
  }

  if (band.detected) {
    band.side = side;
  }
  return band;
}

BandDetection
LayoutAnalyzer::detectLateralBand(const std::vector<TextBox> &boxes,
                                  const std::vector<PageRect> &images,
                                  double pageWidth, double pageHeight) const {
  BandDetection right = detectTextBand(boxes, pageWidth, BandSide::Right);
  BandDetection left = detectTextBand(boxes, pageWidth, BandSide::Left);

  if (right.detected && (!left.detected || right.charShare >= left.charShare)) {
    return right;
  }
  if (left.detected) {
    return left;
  }

  // Narrow full-height image strips along an edge (seals, QR columns)
  for (const auto &image : images) {
    if (image.height < pageHeight * 0.5 ||
        image.width > pageWidth * m_config.bandMaxPercent) {
      continue;
    }
    BandDetection band;
    if (image.x >= pageWidth * (1.0 - m_config.bandMaxPercent)) {
      band.detected = true;
      band.side = BandSide::Right;
      band.cutCoordinate = image.x;
    } else if (image.right() <= pageWidth * m_config.bandMaxPercent) {
      band.detected = true;
      band.side = BandSide::Left;
      band.cutCoordinate = image.right();
    }
    if (band.detected) {
      band.fromImage = true;
      return band;
    }
  }

  return BandDetection();
}

PageRect LayoutAnalyzer::trustworthyRegion(const BandDetection &band,
                                           double pageWidth,
                                           double pageHeight) const {
  PageRect region{0.0, 0.0, pageWidth, pageHeight};
  if (!band.detected || pageWidth <= 1.0) {
    return region;
  }

  if (band.side == BandSide::Right) {
    double right = std::clamp(band.cutCoordinate - m_config.safeMargin, 1.0,
                              pageWidth);
    region.width = right;
  } else if (band.side == BandSide::Left) {
    double left = std::clamp(band.cutCoordinate + m_config.safeMargin, 0.0,
                             pageWidth - 1.0);
    region.x = left;
    region.width = pageWidth - left;
  }
  return region;
}

EngineType LayoutAnalyzer::engineFor(ComplexityTag tag) {
  switch (tag) {
  case ComplexityTag::NativeClean:
  case ComplexityTag::NativeWithArtifacts:
    return EngineType::Native;
  case ComplexityTag::RasterClean:
    return EngineType::Ocr;
  case ComplexityTag::RasterDirty:
  case ComplexityTag::RasterDegraded:
    return EngineType::MlLayout;
  }
  return EngineType::Ocr;
}

PageLayout LayoutAnalyzer::buildPageLayout(int pageNumber,
                                           const std::vector<TextBox> &boxes,
                                           const std::vector<PageRect> &images,
                                           double pageWidth, double pageHeight,
                                           const BandDetection &band) const {
  PageLayout layout;
  layout.pageNumber = pageNumber;
  layout.pageWidth = pageWidth;
  layout.pageHeight = pageHeight;
  layout.trustworthyRegion = trustworthyRegion(band, pageWidth, pageHeight);
  layout.hasLateralBand = band.detected;
  layout.bandSide = band.detected ? band.side : BandSide::None;
  if (band.detected) {
    layout.bandCutCoordinate = band.cutCoordinate;
  }

  for (const auto &box : boxes) {
    if (insideRegion(box.box, layout.trustworthyRegion)) {
      layout.nativeCharCount += box.charCount;
    }
  }

  double pageArea = pageWidth * pageHeight;
  if (pageArea > 0.0) {
    double covered = 0.0;
    for (const auto &image : images) {
      covered += clippedArea(image, pageWidth, pageHeight);
    }
    layout.imageCoverage = std::min(1.0, covered / pageArea);
  }

  layout.classification = layout.nativeCharCount >= m_config.minTextChars
                              ? PageClassification::Native
                              : PageClassification::RasterNeeded;

  // Quality estimate from what the text layer and image placement reveal
  double regionArea = layout.trustworthyRegion.area();
  double charDensity =
      regionArea > 0.0 ? layout.nativeCharCount / regionArea : 0.0;
  bool scanned = layout.imageCoverage >= m_config.imageCoverageRaster;
  double contrast = (scanned || charDensity >= 0.0001) ? 0.85 : 0.3;
  double noise = contrast < 0.4 ? 0.7 : 0.3;

  if (layout.hasLateralBand) {
    layout.cleaningReasons.push_back("lateral_stripe_detected");
  }
  if (layout.classification == PageClassification::RasterNeeded) {
    if (contrast < 0.4) {
      layout.cleaningReasons.push_back("low_contrast");
    }
    if (noise > 0.6) {
      layout.cleaningReasons.push_back("high_noise");
    }
  }
  layout.needsCleaning = !layout.cleaningReasons.empty();

  if (layout.classification == PageClassification::Native) {
    layout.complexity = layout.hasLateralBand
                            ? ComplexityTag::NativeWithArtifacts
                            : ComplexityTag::NativeClean;
  } else if (contrast > 0.8 && !layout.hasLateralBand) {
    layout.complexity = ComplexityTag::RasterClean;
  } else if (contrast < 0.4 || noise > 0.6) {
    layout.complexity = ComplexityTag::RasterDegraded;
  } else {
    layout.complexity = ComplexityTag::RasterDirty;
  }
  layout.recommendedEngine = engineFor(layout.complexity);

  return layout;
}

BandDetection
LayoutAnalyzer::reconcileBands(const std::vector<BandDetection> &pageBands,
                               int textPages) const {
  std::vector<double> rightCuts;
  std::vector<double> leftCuts;
  for (const auto &band : pageBands) {
    if (!band.detected) {
      continue;
    }
    if (band.side == BandSide::Right) {
      rightCuts.push_back(band.cutCoordinate);
    } else if (band.side == BandSide::Left) {
      leftCuts.push_back(band.cutCoordinate);
    }
  }

  BandDetection documentBand;
  std::vector<double> &cuts =
      rightCuts.size() >= leftCuts.size() ? rightCuts : leftCuts;
  if (cuts.empty() ||
      static_cast<double>(cuts.size()) <= textPages * m_config.bandPageMajority) {
    return documentBand;
  }

  std::sort(cuts.begin(), cuts.end());
  documentBand.detected = true;
  documentBand.side =
      rightCuts.size() >= leftCuts.size() ? BandSide::Right : BandSide::Left;
  documentBand.cutCoordinate = cuts[cuts.size() / 2];
  documentBand.charShare =
      static_cast<double>(cuts.size()) / std::max(1, textPages);
  return documentBand;
}

PageLayout LayoutAnalyzer::degradedPage(int pageNumber, double pageWidth,
                                        double pageHeight) {
  PageLayout layout;
  layout.pageNumber = pageNumber;
  layout.pageWidth = pageWidth;
  layout.pageHeight = pageHeight;
  layout.trustworthyRegion = PageRect{0.0, 0.0, pageWidth, pageHeight};
  layout.classification = PageClassification::RasterNeeded;
  layout.complexity = ComplexityTag::RasterDegraded;
  layout.recommendedEngine = engineFor(layout.complexity);
  layout.confidence = 0.0;
  return layout;
}

LayoutReport LayoutAnalyzer::analyze(const PdfDocument &document,
                                     const std::string &systemOverride) const {
  auto startTime = std::chrono::high_resolution_clock::now();

  LayoutReport report;
  report.docId = document.documentId();
  int pageCount = document.pageCount();

  std::vector<PageSurvey> surveys(pageCount);

  parallelFor(static_cast<size_t>(pageCount), m_config.workers, [&](size_t i) {
    int pageNumber = static_cast<int>(i) + 1;
    PageSurvey &survey = surveys[i];
    try {
      PageRect bounds = document.pageBounds(pageNumber);
      survey.width = bounds.width;
      survey.height = bounds.height;
      survey.boxes = document.textBoxes(pageNumber);
      survey.images = document.imagePlacements(pageNumber);
      survey.band = detectLateralBand(survey.boxes, survey.images,
                                      survey.width, survey.height);
      survey.text = assembleLines(survey.boxes);
      survey.readable = survey.width > 0.0 && survey.height > 0.0;
      if (!survey.readable) {
        survey.error = "page has no usable size";
      }
    } catch (const std::exception &e) {
      survey.readable = false;
      survey.error = e.what();
    }
  });

  int readablePages = 0;
  int textPages = 0;
  double fallbackWidth = kDefaultPageWidth;
  double fallbackHeight = kDefaultPageHeight;
  std::vector<BandDetection> pageBands;
  pageBands.reserve(surveys.size());

  for (const auto &survey : surveys) {
    pageBands.push_back(survey.band);
    if (!survey.readable) {
      continue;
    }
    if (readablePages == 0) {
      fallbackWidth = survey.width;
      fallbackHeight = survey.height;
    }
    ++readablePages;
    if (!survey.boxes.empty() || !survey.images.empty()) {
      ++textPages;
    }
  }

  if (readablePages == 0) {
    throw DocumentError("No readable page in " + document.path());
  }

  report.documentBand = reconcileBands(pageBands, textPages);
  if (report.documentBand.detected) {
    log::info("Lateral band on the ", toString(report.documentBand.side),
              " side, cut at x=", report.documentBand.cutCoordinate);
  }

  report.pages.reserve(surveys.size());
  report.pageTexts.reserve(surveys.size());
  std::string documentText;

  for (size_t i = 0; i < surveys.size(); ++i) {
    int pageNumber = static_cast<int>(i) + 1;
    const PageSurvey &survey = surveys[i];

    if (!survey.readable) {
      double width = survey.width > 0.0 ? survey.width : fallbackWidth;
      double height = survey.height > 0.0 ? survey.height : fallbackHeight;
      report.pages.push_back(degradedPage(pageNumber, width, height));
      report.pageTexts.emplace_back();
      report.warnings.push_back(
          makeWarning(WarningKind::PageDegraded, pageNumber,
                      "layout read failed: " + survey.error));
      continue;
    }

    BandDetection band;
    if (report.documentBand.detected) {
      band = report.documentBand;
      if (survey.band.detected && survey.band.side == band.side) {
        band.cutCoordinate = survey.band.cutCoordinate;
      }
    }

    report.pages.push_back(buildPageLayout(pageNumber, survey.boxes,
                                           survey.images, survey.width,
                                           survey.height, band));
    report.pageTexts.push_back(survey.text);
    documentText += survey.text;
    documentText += "\n";

    const PageLayout &layout = report.pages.back();
    log::debug("Page ", pageNumber, ": ", toString(layout.classification),
               " chars=", layout.nativeCharCount, " complexity=",
               toString(layout.complexity),
               " engine=", toString(layout.recommendedEngine));
  }

  report.system = systemOverride.empty()
                      ? m_detector.detect(documentText)
                      : m_detector.fromOverride(systemOverride);
  log::info("Document ", report.docId, ": ", pageCount,
            " pages, system=", report.system.code, " (",
            report.system.confidence, "%)");

  auto endTime = std::chrono::high_resolution_clock::now();
  report.processingTimeMs =
      std::chrono::duration<double, std::milli>(endTime - startTime).count();

  return report;
}

LayoutReport LayoutAnalyzer::analyzeFile(const std::string &pdfPath,
                                         const std::string &systemOverride) const {
  PdfDocument document(pdfPath);
  return analyze(document, systemOverride);
}

nlohmann::json toJson(const PageRect &rect) {
  return nlohmann::json{{"x", rect.x},
                        {"y", rect.y},
                        {"width", rect.width},
                        {"height", rect.height}};
}

nlohmann::json toJson(const PageLayout &layout) {
  nlohmann::json j;
  j["page_number"] = layout.pageNumber;
  j["classification"] = toString(layout.classification);
  j["complexity_tag"] = toString(layout.complexity);
  j["recommended_engine"] = toString(layout.recommendedEngine);
  j["trustworthy_region"] = toJson(layout.trustworthyRegion);
  j["has_lateral_band"] = layout.hasLateralBand;
  j["band_side"] = toString(layout.bandSide);
  if (layout.bandCutCoordinate) {
    j["band_cut_coordinate"] = *layout.bandCutCoordinate;
  } else {
    j["band_cut_coordinate"] = nullptr;
  }
  j["native_char_count"] = layout.nativeCharCount;
  j["page_width"] = layout.pageWidth;
  j["page_height"] = layout.pageHeight;
  j["image_coverage"] = layout.imageCoverage;
  j["needs_cleaning"] = layout.needsCleaning;
  j["cleaning_reasons"] = layout.cleaningReasons;
  j["confidence"] = layout.confidence;
  return j;
}

nlohmann::json LayoutAnalyzer::toJson(const LayoutReport &report) {
  nlohmann::json j;
  j["doc_id"] = report.docId;
  j["total_pages"] = report.pages.size();
  j["system"] = {{"code", report.system.code},
                 {"name", report.system.name},
                 {"confidence", report.system.confidence},
                 {"matches", report.system.matches},
                 {"overridden", report.system.overridden}};
  j["document_band"] = {{"detected", report.documentBand.detected},
                        {"side", toString(report.documentBand.side)},
                        {"cut", report.documentBand.cutCoordinate}};

  nlohmann::json pages = nlohmann::json::array();
  for (const auto &page : report.pages) {
    pages.push_back(lext::toJson(page));
  }
  j["pages"] = pages;

  nlohmann::json warnings = nlohmann::json::array();
  for (const auto &warning : report.warnings) {
    warnings.push_back({{"kind", toString(warning.kind)},
                        {"page", warning.page},
                        {"message", warning.message}});
  }
  j["warnings"] = warnings;
  return j;
}

bool LayoutAnalyzer::saveJson(const LayoutReport &report,
                              const std::string &path) {
  std::ofstream out(path);
  if (!out) {
    log::error("Cannot write ", path);
    return false;
  }
  out << toJson(report).dump(2) << "\n";
  return out.good();
}

} // namespace lext
