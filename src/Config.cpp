#include "lext/Config.hpp"
#include "lext/Log.hpp"

#include <cstdlib>
#include <exception>

namespace lext {

SanitizerConfig SanitizerConfig::digitalAggressive() {
  SanitizerConfig config;
  config.mode = SanitizerMode::DigitalScan;
  config.backgroundThreshold = 180;
  return config;
}

SanitizerConfig SanitizerConfig::scannedConservative() {
  SanitizerConfig config;
  config.mode = SanitizerMode::PhotoScan;
  config.backgroundThreshold = 210;
  config.adaptiveC = 10;
  return config;
}

SanitizerConfig SanitizerConfig::ocrOptimized() {
  SanitizerConfig config;
  config.mode = SanitizerMode::Auto;
  config.adaptiveBlockSize = 21;
  config.adaptiveC = 12;
  return config;
}

void applyEnvironment(PipelineConfig &config) {
  if (config.extractor.tessDataPath.empty()) {
    const char *envPath = std::getenv("TESSDATA_PREFIX");
    if (envPath != nullptr) {
      config.extractor.tessDataPath = envPath;
    }
  }

  if (config.extractor.mlModelPath.empty()) {
    const char *modelPath = std::getenv("LEXT_ML_MODEL_PATH");
    if (modelPath != nullptr) {
      config.extractor.mlModelPath = modelPath;
    }
  }

  const char *workers = std::getenv("LEXT_WORKERS");
  if (workers != nullptr) {
    try {
      int value = std::stoi(workers);
      if (value > 0) {
        config.layout.workers = value;
        config.extractor.workers = value;
      }
    } catch (const std::exception &e) {
      log::warn("Ignoring LEXT_WORKERS=", workers, ": ", e.what());
    }
  }

  const char *database = std::getenv("LEXT_CONTEXT_DB");
  if (database != nullptr) {
    config.contextStore.databasePath = database;
  }

  const char *logLevel = std::getenv("LEXT_LOG_LEVEL");
  if (logLevel != nullptr) {
    log::setLevel(log::parseLevel(logLevel));
  }
}

} // namespace lext
