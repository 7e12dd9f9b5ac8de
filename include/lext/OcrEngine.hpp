#ifndef LEXT_OCR_ENGINE_HPP
#define LEXT_OCR_ENGINE_HPP

#include "lext/Config.hpp"
#include "lext/ExtractionEngine.hpp"

#include <opencv2/core.hpp>
#include <tesseract/baseapi.h>

#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace lext {

/**
 * @brief How a pool of Tesseract handles is initialized
 */
struct TesseractSettings {
  std::string tessDataPath; ///< Empty = TESSDATA_PREFIX or compiled default
  std::string language = "por";
  tesseract::OcrEngineMode engineMode = tesseract::OEM_DEFAULT;
  tesseract::PageSegMode pageSegMode = tesseract::PSM_AUTO;
  int maxInstances = 2; ///< Upper bound of live handles
};

/**
 * @brief Thread-safe pool of initialized TessBaseAPI handles
 *
 * A TessBaseAPI instance is not reentrant, so each worker leases its own
 * handle. Handles are created lazily up to maxInstances; further callers
 * block until a lease is returned.
 */
class TesseractPool {
public:
  explicit TesseractPool(const TesseractSettings &settings);
  ~TesseractPool();

  TesseractPool(const TesseractPool &) = delete;
  TesseractPool &operator=(const TesseractPool &) = delete;

  /**
   * @brief Exclusive use of one handle, returned to the pool on destruction
   */
  class Lease {
  public:
    Lease(TesseractPool &pool, std::unique_ptr<tesseract::TessBaseAPI> api);
    ~Lease();
    Lease(Lease &&other) noexcept;
    Lease(const Lease &) = delete;
    Lease &operator=(const Lease &) = delete;
    Lease &operator=(Lease &&) = delete;

    tesseract::TessBaseAPI *operator->() const { return m_api.get(); }
    tesseract::TessBaseAPI &operator*() const { return *m_api; }

  private:
    TesseractPool *m_pool;
    std::unique_ptr<tesseract::TessBaseAPI> m_api;
  };

  /**
   * @brief Create the first handle to verify tessdata and language
   * @return true if a handle could be initialized; the answer is cached
   */
  bool initialize();

  /**
   * @brief Take a handle, blocking while all handles are leased
   * @throws std::runtime_error if a new handle fails to initialize
   */
  Lease acquire();

  const TesseractSettings &getSettings() const { return m_settings; }

  /**
   * @brief Get the Tesseract library version string
   */
  static std::string version();

  /**
   * @brief Languages found in the resolved tessdata directory
   */
  std::vector<std::string> availableLanguages();

private:
  std::unique_ptr<tesseract::TessBaseAPI> createHandle();
  void giveBack(std::unique_ptr<tesseract::TessBaseAPI> api);

  TesseractSettings m_settings;
  std::mutex m_mutex;
  std::condition_variable m_returned;
  std::vector<std::unique_ptr<tesseract::TessBaseAPI>> m_idle;
  int m_created = 0;
  std::optional<bool> m_usable;
};

/**
 * @brief Hand an OpenCV image to Tesseract as packed RGB
 */
void setTesseractImage(tesseract::TessBaseAPI &api, const cv::Mat &image);

/**
 * @brief Run recognition on the current image and collect the UTF-8 text
 * @return false if Recognize() failed
 */
bool recognizeText(tesseract::TessBaseAPI &api, std::string &text);

/**
 * @brief Optical character recognition tier backed by Tesseract
 *
 * Reads the sanitized page image when one is supplied and otherwise renders
 * the trustworthy region itself. Confidence is the OCR quality ceiling times
 * Tesseract's mean word confidence.
 */
class TesseractEngine : public ExtractionEngine {
public:
  explicit TesseractEngine(const ExtractorConfig &config);

  EngineType type() const override { return EngineType::Ocr; }
  bool isAvailable() override;
  EngineOutput extract(const PageInput &input) override;

private:
  TesseractPool m_pool;
};

} // namespace lext

#endif // LEXT_OCR_ENGINE_HPP
