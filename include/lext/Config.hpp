#ifndef LEXT_CONFIG_HPP
#define LEXT_CONFIG_HPP

#include <tesseract/publictypes.h>

#include <string>
#include <vector>

namespace lext {

/**
 * @brief Layout Analyzer thresholds
 */
struct LayoutConfig {
  int minTextChars = 50;          ///< Below this a page needs rasterization
  int histogramBins = 100;        ///< Bins of the character X histogram
  double bandZonePercent = 0.20;  ///< Width share of the outer edge strips
  double bandCharRatio = 0.15;    ///< Share of characters that flags a band
  double bandMaxPercent = 0.30;   ///< Furthest a cut may reach into the page
  double minCutGap = 30.0;        ///< Gap in points marking the band edge
  double safeMargin = 10.0;       ///< Extra points removed past the cut
  double bandPageMajority = 0.5;  ///< Share of text pages that must agree
  double imageCoverageRaster = 0.5; ///< Image coverage marking a scan
  int workers = 4;                ///< Parallel page workers
};

/**
 * @brief Image Sanitizer processing modes
 */
enum class SanitizerMode {
  Auto,        ///< Pick from background uniformity
  DigitalScan, ///< Clean digital render, background only
  PhotoScan    ///< Photographed or scanned paper
};

/**
 * @brief Image Sanitizer filter parameters
 */
struct SanitizerConfig {
  SanitizerMode mode = SanitizerMode::Auto;
  double renderDpi = 300.0;
  int backgroundThreshold = 200; ///< Pixels above become white
  int adaptiveBlockSize = 31;    ///< Odd block size of the threshold
  int adaptiveC = 15;            ///< Constant subtracted from the mean
  int despeckleKernel = 3;       ///< Median kernel size
  double noiseThreshold = 0.02;  ///< Salt-and-pepper estimator cutoff
  double minLightShare = 0.30;   ///< Below this no noise estimate is made
  double midToneDominance = 0.20; ///< Mid-gray share that triggers suppression
  bool removeColorStamps = true; ///< Drop blue/red/green stamps in photo mode
  std::string imageExtension = ".png";

  /// Strong watermark suppression for digital renders
  static SanitizerConfig digitalAggressive();
  /// Gentle thresholding for fragile scans
  static SanitizerConfig scannedConservative();
  /// Smaller threshold block tuned for recognition
  static SanitizerConfig ocrOptimized();
};

/**
 * @brief Text Extractor engine and escalation settings
 */
struct ExtractorConfig {
  std::string language = "por";   ///< Tesseract language code
  tesseract::PageSegMode pageSegMode = tesseract::PSM_AUTO;
  std::string tessDataPath;       ///< Empty = TESSDATA_PREFIX or default
  std::string mlModelPath;        ///< tessdata directory of the best models
  double mlRenderDpi = 400.0;     ///< Render resolution for the ML tier
  long mlMinMemoryMb = 2048;      ///< Available memory needed for ML tier
  double confidenceThreshold = 0.85; ///< Below this the extractor escalates
  double reviewThreshold = 0.60;  ///< Below this a page is flagged for review
  int workers = 4;                ///< Parallel page workers
  int mlWorkers = 1;              ///< Concurrent ML-tier extractions
  int ocrInstances = 2;           ///< Pooled Tesseract handles
  double timeoutSeconds = 0.0;    ///< Document deadline, 0 disables
  bool applyCleaning = true;      ///< Run the TextCleaner on each page
};

/**
 * @brief Semantic Classifier thresholds
 */
struct ClassifierConfig {
  double minConfidence = 0.3;     ///< Score needed to start a section
  double earlyStopScore = 0.4;    ///< Header window stops growing here
  int initialWindowLines = 15;
  int windowStepLines = 10;
  int maxWindowLines = 50;
};

/**
 * @brief Context Store location and learning thresholds
 */
struct ContextStoreConfig {
  std::string databasePath = "lext_context.db";
  double similarityThreshold = 0.85;
  int deprecationThreshold = 3;
  double hintMinConfidence = 0.7;
  double bucketStep = 0.05; ///< Quantization step of signature buckets
};

/**
 * @brief Options for the text cleanup pass
 */
struct CleaningOptions {
  std::string systemCode;                 ///< Empty = use detected system
  std::vector<std::string> exclusionWords; ///< Literal, case-insensitive
  bool maskPii = false;                   ///< Replace CPF/CNPJ/e-mail/phone
};

/**
 * @brief Complete pipeline configuration
 */
struct PipelineConfig {
  LayoutConfig layout;
  SanitizerConfig sanitizer;
  ExtractorConfig extractor;
  ClassifierConfig classifier;
  ContextStoreConfig contextStore;
  bool useContextStore = true;
  std::string outputDirectory = "output";
};

/**
 * @brief Apply LEXT_* and TESSDATA_PREFIX environment overrides
 *
 * Explicit config values win over TESSDATA_PREFIX.
 */
void applyEnvironment(PipelineConfig &config);

} // namespace lext

#endif // LEXT_CONFIG_HPP
