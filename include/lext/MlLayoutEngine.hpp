#ifndef LEXT_ML_LAYOUT_ENGINE_HPP
#define LEXT_ML_LAYOUT_ENGINE_HPP

#include "lext/Config.hpp"
#include "lext/ExtractionEngine.hpp"
#include "lext/OcrEngine.hpp"
#include "lext/WorkerPool.hpp"

#include <memory>
#include <string>

namespace lext {

/**
 * @brief High-fidelity tier: LSTM recognizer with layout reconstruction
 *
 * Uses the LSTM-only engine with the high-accuracy models found under
 * ExtractorConfig::mlModelPath, renders the region at mlRenderDpi and
 * rebuilds the text paragraph by paragraph from Tesseract's layout
 * analysis. The models are large, so instances are shared per process
 * through shared() and concurrent extractions are limited to mlWorkers.
 */
class MlLayoutEngine : public ExtractionEngine {
public:
  explicit MlLayoutEngine(const ExtractorConfig &config);

  /**
   * @brief Process-wide instance for a model directory and language
   *
   * Returns the live instance if one exists, otherwise creates it. The
   * instance is released when the last holder drops it.
   */
  static std::shared_ptr<MlLayoutEngine> shared(const ExtractorConfig &config);

  EngineType type() const override { return EngineType::MlLayout; }

  /**
   * @brief Model directory set, enough free memory and models loadable
   */
  bool isAvailable() override;

  EngineOutput extract(const PageInput &input) override;

  /**
   * @brief Currently available physical memory in MB, -1 if unknown
   */
  static long availableMemoryMb();

private:
  std::string paragraphText(tesseract::TessBaseAPI &api) const;

  ExtractorConfig m_config;
  TesseractPool m_pool;
  ConcurrencyGate m_gate;
};

} // namespace lext

#endif // LEXT_ML_LAYOUT_ENGINE_HPP
