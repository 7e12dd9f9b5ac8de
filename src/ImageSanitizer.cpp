#include "lext/ImageSanitizer.hpp"
#include "lext/Log.hpp"
#include "lext/WorkerPool.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <mutex>

namespace lext {

namespace {

constexpr int kDarkLimit = 50;
constexpr int kLightLimit = 200;
constexpr int kPepperLimit = 150;

} // anonymous namespace

std::string toString(SanitizerMode mode) {
  switch (mode) {
  case SanitizerMode::Auto:
    return "auto";
  case SanitizerMode::DigitalScan:
    return "digital-scan";
  case SanitizerMode::PhotoScan:
    return "photo-scan";
  }
  return "auto";
}

ImageSanitizer::ImageSanitizer() : m_config() {}

ImageSanitizer::ImageSanitizer(const SanitizerConfig &config)
    : m_config(config) {}

ToneShares ImageSanitizer::toneShares(const cv::Mat &gray) {
  ToneShares shares;
  if (gray.empty()) {
    return shares;
  }

  int histSize = 256;
  int channels[] = {0};
  float range[] = {0, 256};
  const float *histRange = {range};
  cv::Mat hist;
  cv::calcHist(&gray, 1, channels, cv::Mat(), hist, 1, &histSize, &histRange);

  double total = static_cast<double>(gray.total());
  double dark = 0.0;
  double mid = 0.0;
  double light = 0.0;
  for (int value = 0; value < histSize; ++value) {
    double count = hist.at<float>(value);
    if (value < kDarkLimit) {
      dark += count;
    } else if (value < kLightLimit) {
      mid += count;
    } else {
      light += count;
    }
  }

  shares.dark = dark / total;
  shares.mid = mid / total;
  shares.light = light / total;
  return shares;
}

SanitizerMode ImageSanitizer::detectMode(const cv::Mat &gray) const {
  ToneShares shares = toneShares(gray);
  double extremes = shares.dark + shares.light;

  log::debug("Tone shares dark=", shares.dark, " mid=", shares.mid,
             " light=", shares.light);

  if (extremes > 1.0 - m_config.midToneDominance &&
      shares.mid < m_config.midToneDominance) {
    return SanitizerMode::DigitalScan;
  }
  return SanitizerMode::PhotoScan;
}

double ImageSanitizer::backgroundGrayShare(const cv::Mat &gray) {
  if (gray.empty()) {
    return 0.0;
  }
  cv::Mat backgroundMask = gray >= kDarkLimit;
  int background = cv::countNonZero(backgroundMask);
  if (background == 0) {
    return 0.0;
  }
  cv::Mat grayMask = backgroundMask & (gray < 255);
  int grayTones = cv::countNonZero(grayMask);
  return static_cast<double>(grayTones) / static_cast<double>(background);
}

cv::Mat ImageSanitizer::toGrayscale(const cv::Mat &image) {
  cv::Mat gray;

  if (image.channels() == 3) {
    cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);
  } else if (image.channels() == 4) {
    cv::cvtColor(image, gray, cv::COLOR_BGRA2GRAY);
  } else {
    gray = image.clone();
  }

  if (gray.depth() != CV_8U) {
    gray.convertTo(gray, CV_8U);
  }
  return gray;
}

int ImageSanitizer::suppressBackground(cv::Mat &gray) const {
  cv::Mat lightGray = (gray > m_config.backgroundThreshold) & (gray < 255);
  int changed = cv::countNonZero(lightGray);
  if (changed > 0) {
    gray.setTo(255, lightGray);
  }
  return changed;
}

cv::Mat ImageSanitizer::removeColorStamps(const cv::Mat &bgr) {
  if (bgr.channels() < 3) {
    return bgr.clone();
  }

  cv::Mat color;
  if (bgr.channels() == 4) {
    cv::cvtColor(bgr, color, cv::COLOR_BGRA2BGR);
  } else {
    color = bgr.clone();
  }

  cv::Mat hsv;
  cv::cvtColor(color, hsv, cv::COLOR_BGR2HSV);

  cv::Mat blue, redLow, redHigh, green;
  cv::inRange(hsv, cv::Scalar(100, 50, 50), cv::Scalar(130, 255, 255), blue);
  cv::inRange(hsv, cv::Scalar(0, 50, 50), cv::Scalar(10, 255, 255), redLow);
  cv::inRange(hsv, cv::Scalar(170, 50, 50), cv::Scalar(180, 255, 255), redHigh);
  cv::inRange(hsv, cv::Scalar(35, 50, 50), cv::Scalar(85, 255, 255), green);

  cv::Mat mask = blue | redLow | redHigh | green;
  if (cv::countNonZero(mask) == 0) {
    return color;
  }

  cv::Mat kernel = cv::getStructuringElement(cv::MORPH_RECT, cv::Size(5, 5));
  cv::dilate(mask, mask, kernel, cv::Point(-1, -1), 2);
  color.setTo(cv::Scalar(255, 255, 255), mask);
  return color;
}

cv::Mat ImageSanitizer::adaptiveThreshold(const cv::Mat &gray) const {
  int blockSize = std::max(3, m_config.adaptiveBlockSize);
  if (blockSize % 2 == 0) {
    ++blockSize;
  }

  cv::Mat binary;
  cv::adaptiveThreshold(gray, binary, 255, cv::ADAPTIVE_THRESH_GAUSSIAN_C,
                        cv::THRESH_BINARY, blockSize, m_config.adaptiveC);
  return binary;
}

double ImageSanitizer::estimateSaltPepperNoise(const cv::Mat &gray) const {
  if (gray.empty()) {
    return 0.0;
  }

  cv::Mat light = gray > kLightLimit;
  int lightCount = cv::countNonZero(light);
  if (lightCount < m_config.minLightShare * static_cast<double>(gray.total())) {
    return 0.0;
  }

  // Dark pixels with no dark 8-neighbour are specks, glyph strokes are not
  cv::Mat dark;
  cv::threshold(gray, dark, kPepperLimit - 1, 1, cv::THRESH_BINARY_INV);
  cv::Mat kernel = cv::Mat::ones(3, 3, CV_32F);
  kernel.at<float>(1, 1) = 0.0f;
  cv::Mat darkNeighbours;
  cv::filter2D(dark, darkNeighbours, CV_32F, kernel, cv::Point(-1, -1), 0,
               cv::BORDER_CONSTANT);

  cv::Mat isolated = (dark > 0) & (darkNeighbours < 0.5f);
  int specks = cv::countNonZero(isolated);

  return static_cast<double>(specks) / static_cast<double>(lightCount);
}

bool ImageSanitizer::conditionalDenoise(cv::Mat &gray,
                                        double *noiseEstimate) const {
  double estimate = estimateSaltPepperNoise(gray);
  if (noiseEstimate != nullptr) {
    *noiseEstimate = estimate;
  }

  if (estimate <= m_config.noiseThreshold) {
    log::debug("Denoise skipped, noise estimate ", estimate);
    return false;
  }

  int kernel = std::max(3, m_config.despeckleKernel);
  if (kernel % 2 == 0) {
    ++kernel;
  }
  cv::medianBlur(gray, gray, kernel);
  log::debug("Denoise applied, noise estimate ", estimate);
  return true;
}

SanitizedImage ImageSanitizer::sanitize(const cv::Mat &render) const {
  SanitizedImage result;
  if (render.empty()) {
    result.degraded = true;
    result.errorMessage = "Input image is empty";
    return result;
  }

  try {
    cv::Mat gray = toGrayscale(render);

    result.mode = m_config.mode == SanitizerMode::Auto ? detectMode(gray)
                                                       : m_config.mode;

    if (result.mode == SanitizerMode::PhotoScan && m_config.removeColorStamps &&
        render.channels() >= 3) {
      cv::Mat withoutStamps = removeColorStamps(render);
      gray = toGrayscale(withoutStamps);
      result.steps.push_back("color_stamps");
    }
    result.steps.push_back("grayscale");

    double grayShare = backgroundGrayShare(gray);
    if (grayShare >= m_config.midToneDominance) {
      if (suppressBackground(gray) > 0) {
        result.steps.push_back("background");
      }
    } else {
      log::debug("Background kept, gray share ", grayShare);
    }

    if (result.mode == SanitizerMode::PhotoScan) {
      gray = adaptiveThreshold(gray);
      result.steps.push_back("adaptive_threshold");
    }

    result.denoised = conditionalDenoise(gray, &result.noiseEstimate);
    if (result.denoised) {
      result.steps.push_back("denoise");
    }

    result.image = gray;
  } catch (const cv::Exception &e) {
    log::warn("Sanitization failed, keeping raw render: ", e.what());
    result.image = render.clone();
    result.steps.clear();
    result.degraded = true;
    result.errorMessage = e.what();
  }

  return result;
}

std::string ImageSanitizer::imageFileName(int pageNumber) const {
  char name[32];
  std::snprintf(name, sizeof(name), "page_%03d", pageNumber);
  return std::string(name) + m_config.imageExtension;
}

void ImageSanitizer::processPage(const PdfDocument &document,
                                 const PageLayout &layout,
                                 const std::string &imageDirectory,
                                 std::mutex &reportMutex,
                                 SanitizerReport &report) const {
  cv::Mat render = document.renderRegion(
      layout.pageNumber, layout.trustworthyRegion, m_config.renderDpi);

  if (render.empty()) {
    std::lock_guard<std::mutex> lock(reportMutex);
    report.warnings.push_back(makeWarning(WarningKind::PageDegraded,
                                          layout.pageNumber,
                                          "page could not be rendered"));
    return;
  }

  SanitizedImage sanitized = sanitize(render);

  std::string path;
  if (!imageDirectory.empty()) {
    path = (std::filesystem::path(imageDirectory) /
            imageFileName(layout.pageNumber))
               .string();
    bool written = false;
    try {
      written = cv::imwrite(path, sanitized.image);
    } catch (const cv::Exception &e) {
      log::warn("Failed to write ", path, ": ", e.what());
    }
    if (!written) {
      path.clear();
    }
  }

  log::debug("Page ", layout.pageNumber, " sanitized (",
             toString(sanitized.mode), ", noise ", sanitized.noiseEstimate,
             ")");

  std::lock_guard<std::mutex> lock(reportMutex);
  report.images[layout.pageNumber] = sanitized.image;
  if (!path.empty()) {
    report.imagePaths[layout.pageNumber] = path;
  }
  report.details[layout.pageNumber] = std::move(sanitized);
}

SanitizerReport ImageSanitizer::process(const PdfDocument &document,
                                        const std::vector<PageLayout> &layouts,
                                        const std::string &imageDirectory,
                                        int workers) const {
  auto startTime = std::chrono::high_resolution_clock::now();
  SanitizerReport report;

  std::vector<const PageLayout *> rasterPages;
  for (const auto &layout : layouts) {
    if (layout.classification == PageClassification::RasterNeeded) {
      rasterPages.push_back(&layout);
    }
  }

  if (!imageDirectory.empty() && !rasterPages.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(imageDirectory, ec);
    if (ec) {
      log::warn("Cannot create ", imageDirectory, ": ", ec.message());
    }
  }

  std::mutex reportMutex;

  parallelFor(rasterPages.size(), workers, [&](size_t i) {
    const PageLayout &layout = *rasterPages[i];
    try {
      processPage(document, layout, imageDirectory, reportMutex, report);
    } catch (const std::exception &e) {
      // Only this page is lost, the extractor falls back to its own render
      log::error("Page ", layout.pageNumber, " sanitization failed: ",
                 e.what());
      std::lock_guard<std::mutex> lock(reportMutex);
      report.warnings.push_back(makeWarning(
          WarningKind::PageDegraded, layout.pageNumber,
          std::string("sanitization failed: ") + e.what()));
    }
  });

  auto endTime = std::chrono::high_resolution_clock::now();
  report.processingTimeMs =
      std::chrono::duration<double, std::milli>(endTime - startTime).count();

  log::info("Sanitized ", report.images.size(), " of ", rasterPages.size(),
            " raster pages");
  return report;
}

} // namespace lext
