#include "lext/OcrEngine.hpp"
#include "lext/Log.hpp"
#include "lext/TextUtils.hpp"

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <stdexcept>

namespace lext {

TesseractPool::Lease::Lease(TesseractPool &pool,
                            std::unique_ptr<tesseract::TessBaseAPI> api)
    : m_pool(&pool), m_api(std::move(api)) {}

TesseractPool::Lease::Lease(Lease &&other) noexcept
    : m_pool(other.m_pool), m_api(std::move(other.m_api)) {
  other.m_pool = nullptr;
}

TesseractPool::Lease::~Lease() {
  if (m_pool != nullptr && m_api) {
    m_api->Clear();
    m_pool->giveBack(std::move(m_api));
  }
}

TesseractPool::TesseractPool(const TesseractSettings &settings)
    : m_settings(settings) {
  m_settings.maxInstances = std::max(1, m_settings.maxInstances);
}

TesseractPool::~TesseractPool() {
  for (auto &api : m_idle) {
    api->End();
  }
}

std::unique_ptr<tesseract::TessBaseAPI> TesseractPool::createHandle() {
  const char *tessDataPath = nullptr;

  // Priority 1: Use config path if provided
  if (!m_settings.tessDataPath.empty()) {
    tessDataPath = m_settings.tessDataPath.c_str();
  }
  // Priority 2: Check TESSDATA_PREFIX environment variable
  else {
    const char *envPath = std::getenv("TESSDATA_PREFIX");
    if (envPath != nullptr) {
      tessDataPath = envPath;
    } else {
      // Priority 3: Let Tesseract use its compiled-in location
      log::debug("TESSDATA_PREFIX not set, using compiled-in tessdata");
    }
  }

  auto api = std::make_unique<tesseract::TessBaseAPI>();
  int result = api->Init(tessDataPath, m_settings.language.c_str(),
                         m_settings.engineMode);
  if (result != 0) {
    throw std::runtime_error("Failed to initialize Tesseract with language: " +
                             m_settings.language);
  }

  api->SetPageSegMode(m_settings.pageSegMode);
  return api;
}

bool TesseractPool::initialize() {
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_usable.has_value()) {
      return *m_usable;
    }
  }

  bool usable = true;
  try {
    Lease lease = acquire();
  } catch (const std::runtime_error &e) {
    log::warn(e.what());
    usable = false;
  }

  std::lock_guard<std::mutex> lock(m_mutex);
  m_usable = usable;
  return usable;
}

TesseractPool::Lease TesseractPool::acquire() {
  std::unique_lock<std::mutex> lock(m_mutex);
  m_returned.wait(lock, [this] {
    return !m_idle.empty() || m_created < m_settings.maxInstances;
  });

  if (!m_idle.empty()) {
    std::unique_ptr<tesseract::TessBaseAPI> api = std::move(m_idle.back());
    m_idle.pop_back();
    return Lease(*this, std::move(api));
  }

  ++m_created;
  lock.unlock();

  try {
    return Lease(*this, createHandle());
  } catch (const std::runtime_error &) {
    lock.lock();
    --m_created;
    lock.unlock();
    m_returned.notify_one();
    throw;
  }
}

void TesseractPool::giveBack(std::unique_ptr<tesseract::TessBaseAPI> api) {
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_idle.push_back(std::move(api));
  }
  m_returned.notify_one();
}

std::string TesseractPool::version() {
  return tesseract::TessBaseAPI::Version();
}

std::vector<std::string> TesseractPool::availableLanguages() {
  std::vector<std::string> languages;
  if (!initialize()) {
    return languages;
  }

  Lease lease = acquire();
  lease->GetAvailableLanguagesAsVector(&languages);
  return languages;
}

void setTesseractImage(tesseract::TessBaseAPI &api, const cv::Mat &image) {
  cv::Mat rgbImage;

  // Convert to RGB if necessary (Tesseract expects RGB)
  if (image.channels() == 1) {
    cv::cvtColor(image, rgbImage, cv::COLOR_GRAY2RGB);
  } else if (image.channels() == 4) {
    cv::cvtColor(image, rgbImage, cv::COLOR_BGRA2RGB);
  } else {
    cv::cvtColor(image, rgbImage, cv::COLOR_BGR2RGB);
  }

  // SetImage copies the pixels, rgbImage may go out of scope afterwards
  api.SetImage(rgbImage.data, rgbImage.cols, rgbImage.rows, 3,
               static_cast<int>(rgbImage.step));
}

bool recognizeText(tesseract::TessBaseAPI &api, std::string &text) {
  if (api.Recognize(nullptr) != 0) {
    return false;
  }

  char *outText = api.GetUTF8Text();
  if (outText) {
    text = outText;
    delete[] outText;
  }
  return true;
}

TesseractEngine::TesseractEngine(const ExtractorConfig &config)
    : m_pool([&config] {
        TesseractSettings settings;
        settings.tessDataPath = config.tessDataPath;
        settings.language = config.language;
        settings.pageSegMode = config.pageSegMode;
        settings.maxInstances = config.ocrInstances;
        return settings;
      }()) {}

bool TesseractEngine::isAvailable() { return m_pool.initialize(); }

EngineOutput TesseractEngine::extract(const PageInput &input) {
  EngineOutput output;
  auto startTime = std::chrono::high_resolution_clock::now();

  try {
    cv::Mat image = input.image;
    double dpi = input.imageDpi;
    if (image.empty() && input.document != nullptr) {
      dpi = 300.0;
      image = input.document->renderRegion(input.pageNumber, input.region, dpi);
    }

    if (image.empty()) {
      output.errorMessage = "No image available for page " +
                            std::to_string(input.pageNumber);
    } else {
      TesseractPool::Lease api = m_pool.acquire();
      setTesseractImage(*api, image);
      api->SetSourceResolution(static_cast<int>(dpi));

      std::string text;
      if (!recognizeText(*api, text)) {
        output.errorMessage = "Tesseract recognition failed";
      } else {
        int meanConf = api->MeanTextConf();
        double raw = std::clamp(meanConf / 100.0, 0.0, 1.0);
        output.text = text::trim(text);
        output.confidence = engineQuality(EngineType::Ocr) * raw;
        output.success = true;
        log::debug("Page ", input.pageNumber, " OCR mean confidence ",
                   meanConf);
      }
    }
  } catch (const std::exception &e) {
    output.errorMessage = std::string("OCR analysis failed: ") + e.what();
  }

  auto endTime = std::chrono::high_resolution_clock::now();
  output.processingTimeMs =
      std::chrono::duration<double, std::milli>(endTime - startTime).count();
  return output;
}

} // namespace lext
