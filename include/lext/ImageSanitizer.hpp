#ifndef LEXT_IMAGE_SANITIZER_HPP
#define LEXT_IMAGE_SANITIZER_HPP

#include "lext/Config.hpp"
#include "lext/Errors.hpp"
#include "lext/PdfDocument.hpp"
#include "lext/Types.hpp"

#include <opencv2/core.hpp>

#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace lext {

/**
 * @brief Share of dark, mid-gray and light pixels in a grayscale image
 */
struct ToneShares {
  double dark = 0.0;  ///< Pixels below 50
  double mid = 0.0;   ///< Pixels in [50, 200)
  double light = 0.0; ///< Pixels at 200 or above
};

/**
 * @brief A cleaned page image and the filters that produced it
 */
struct SanitizedImage {
  cv::Mat image;                   ///< Cleaned image (grayscale)
  SanitizerMode mode = SanitizerMode::DigitalScan; ///< Resolved mode
  std::vector<std::string> steps;  ///< Filters that changed the image
  double noiseEstimate = 0.0;      ///< Salt-and-pepper estimate
  bool denoised = false;           ///< Median filter was applied
  bool degraded = false;           ///< A filter failed, image is the raw render
  std::string errorMessage;        ///< Failure of the filter chain
};

/**
 * @brief Result of sanitizing the raster pages of a document
 */
struct SanitizerReport {
  std::map<int, cv::Mat> images;          ///< Cleaned image per page number
  std::map<int, std::string> imagePaths;  ///< Written artifact per page
  std::map<int, SanitizedImage> details;  ///< Filter trace per page
  Warnings warnings;
  double processingTimeMs = 0;
};

/**
 * @brief Renders raster pages and cleans them for recognition
 *
 * Filters run in a fixed order: color stamp removal (photo mode),
 * grayscale, background normalization (only when gray tones make up at
 * least midToneDominance of the background), adaptive threshold (photo
 * mode) and conditional denoising. The median filter only runs when the
 * salt-and-pepper estimate exceeds the configured threshold, so clean
 * renders keep their thin strokes intact.
 */
class ImageSanitizer {
public:
  ImageSanitizer();
  explicit ImageSanitizer(const SanitizerConfig &config);

  /**
   * @brief Clean one rendered page
   * @param render BGR, BGRA or grayscale render
   * @return Cleaned image; on filter failure the unfiltered render
   */
  SanitizedImage sanitize(const cv::Mat &render) const;

  /**
   * @brief Render, clean and write every RASTER_NEEDED page
   * @param document Source PDF
   * @param layouts Layout of every page
   * @param imageDirectory Directory for page_NNN images (empty = no files)
   * @param workers Parallel page workers
   */
  SanitizerReport process(const PdfDocument &document,
                          const std::vector<PageLayout> &layouts,
                          const std::string &imageDirectory,
                          int workers = 1) const;

  const SanitizerConfig &getConfig() const { return m_config; }
  void setConfig(const SanitizerConfig &config) { m_config = config; }

  /**
   * @brief Tone distribution of a grayscale image
   */
  static ToneShares toneShares(const cv::Mat &gray);

  /**
   * @brief Choose digital-scan or photo-scan from background uniformity
   */
  SanitizerMode detectMode(const cv::Mat &gray) const;

  /**
   * @brief Convert to single-channel 8-bit
   */
  static cv::Mat toGrayscale(const cv::Mat &image);

  /**
   * @brief Whiten light-gray background tones (watermarks)
   * @return Number of pixels changed
   */
  int suppressBackground(cv::Mat &gray) const;

  /**
   * @brief Paint blue, red and green ink white
   * @param bgr Color image
   * @return Copy without colored stamps
   */
  static cv::Mat removeColorStamps(const cv::Mat &bgr);

  /**
   * @brief Adaptive Gaussian threshold for uneven scans
   */
  cv::Mat adaptiveThreshold(const cv::Mat &gray) const;

  /**
   * @brief Share of isolated dark pixels within the light background
   * @return 0 when the light background is too small to judge
   */
  double estimateSaltPepperNoise(const cv::Mat &gray) const;

  /**
   * @brief Median filter, only when the noise estimate is above threshold
   * @param gray Image filtered in place
   * @param noiseEstimate Receives the estimate (optional)
   * @return true if the filter ran
   */
  bool conditionalDenoise(cv::Mat &gray, double *noiseEstimate = nullptr) const;

  /**
   * @brief Artifact file name of a page, e.g. page_007.png
   */
  std::string imageFileName(int pageNumber) const;

  /**
   * @brief Gray share of the non-text pixels
   *
   * Pixels darker than 50 are text mass; the rest are background. The
   * share is the part of the background that is neither text nor pure
   * white.
   */
  static double backgroundGrayShare(const cv::Mat &gray);

private:
  // Render, clean and record one page; throws on render or filter failure
  void processPage(const PdfDocument &document, const PageLayout &layout,
                   const std::string &imageDirectory, std::mutex &reportMutex,
                   SanitizerReport &report) const;

  SanitizerConfig m_config;
};

std::string toString(SanitizerMode mode);

} // namespace lext

#endif // LEXT_IMAGE_SANITIZER_HPP
