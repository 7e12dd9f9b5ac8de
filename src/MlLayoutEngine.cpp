#include "lext/MlLayoutEngine.hpp"
#include "lext/ImageSanitizer.hpp"
#include "lext/Log.hpp"
#include "lext/TextUtils.hpp"

#include <tesseract/resultiterator.h>

#include <algorithm>
#include <chrono>
#include <map>
#include <mutex>

#ifdef __unix__
#include <unistd.h>
#endif

namespace lext {

namespace {

TesseractSettings mlSettings(const ExtractorConfig &config) {
  TesseractSettings settings;
  settings.tessDataPath = config.mlModelPath;
  settings.language = config.language;
  settings.engineMode = tesseract::OEM_LSTM_ONLY;
  settings.pageSegMode = tesseract::PSM_AUTO;
  settings.maxInstances = std::max(1, config.mlWorkers);
  return settings;
}

} // anonymous namespace

MlLayoutEngine::MlLayoutEngine(const ExtractorConfig &config)
    : m_config(config), m_pool(mlSettings(config)), m_gate(config.mlWorkers) {}

std::shared_ptr<MlLayoutEngine>
MlLayoutEngine::shared(const ExtractorConfig &config) {
  static std::mutex cacheMutex;
  static std::map<std::string, std::weak_ptr<MlLayoutEngine>> cache;

  std::string key = config.mlModelPath + "|" + config.language;
  std::lock_guard<std::mutex> lock(cacheMutex);

  std::shared_ptr<MlLayoutEngine> engine = cache[key].lock();
  if (!engine) {
    log::debug("Loading ML layout engine for ", key);
    engine = std::make_shared<MlLayoutEngine>(config);
    cache[key] = engine;
  }
  return engine;
}

long MlLayoutEngine::availableMemoryMb() {
#if defined(__unix__) && defined(_SC_AVPHYS_PAGES)
  long pages = sysconf(_SC_AVPHYS_PAGES);
  long pageSize = sysconf(_SC_PAGESIZE);
  if (pages > 0 && pageSize > 0) {
    return static_cast<long>(static_cast<double>(pages) *
                             static_cast<double>(pageSize) / (1024.0 * 1024.0));
  }
#endif
  return -1;
}

bool MlLayoutEngine::isAvailable() {
  if (m_config.mlModelPath.empty()) {
    log::debug("ML layout engine disabled, no model path configured");
    return false;
  }

  long freeMb = availableMemoryMb();
  if (freeMb >= 0 && freeMb < m_config.mlMinMemoryMb) {
    log::debug("ML layout engine skipped, ", freeMb, " MB free, ",
               m_config.mlMinMemoryMb, " MB required");
    return false;
  }

  return m_pool.initialize();
}

std::string MlLayoutEngine::paragraphText(tesseract::TessBaseAPI &api) const {
  std::string text;
  tesseract::ResultIterator *ri = api.GetIterator();
  if (ri == nullptr) {
    return text;
  }

  tesseract::PageIteratorLevel level = tesseract::RIL_PARA;
  do {
    if (ri->Empty(level)) {
      continue;
    }
    char *para = ri->GetUTF8Text(level);
    if (para != nullptr) {
      std::string paragraph = text::trim(para);
      delete[] para;
      if (!paragraph.empty()) {
        if (!text.empty()) {
          text += "\n\n";
        }
        text += paragraph;
      }
    }
  } while (ri->Next(level));
  delete ri;

  return text;
}

EngineOutput MlLayoutEngine::extract(const PageInput &input) {
  EngineOutput output;
  auto startTime = std::chrono::high_resolution_clock::now();

  ConcurrencyGate::Slot slot(m_gate);

  try {
    cv::Mat image;
    double dpi = m_config.mlRenderDpi;
    if (input.document != nullptr) {
      image = input.document->renderRegion(input.pageNumber, input.region, dpi);
    }
    if (image.empty()) {
      image = input.image;
      dpi = input.imageDpi;
    }

    if (image.empty()) {
      output.errorMessage = "No image available for page " +
                            std::to_string(input.pageNumber);
    } else {
      cv::Mat gray = ImageSanitizer::toGrayscale(image);

      TesseractPool::Lease api = m_pool.acquire();
      setTesseractImage(*api, gray);
      api->SetSourceResolution(static_cast<int>(dpi));

      // Must call Recognize before GetIterator
      if (api->Recognize(nullptr) != 0) {
        output.errorMessage = "LSTM recognition failed";
      } else {
        int meanConf = api->MeanTextConf();
        output.text = paragraphText(*api);
        output.confidence = engineQuality(EngineType::MlLayout) *
                            std::clamp(meanConf / 100.0, 0.0, 1.0);
        output.success = true;
        log::debug("Page ", input.pageNumber, " ML layout mean confidence ",
                   meanConf);
      }
    }
  } catch (const std::exception &e) {
    output.errorMessage = std::string("ML layout extraction failed: ") + e.what();
  }

  auto endTime = std::chrono::high_resolution_clock::now();
  output.processingTimeMs =
      std::chrono::duration<double, std::milli>(endTime - startTime).count();
  return output;
}

} // namespace lext
