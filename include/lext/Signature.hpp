#ifndef LEXT_SIGNATURE_HPP
#define LEXT_SIGNATURE_HPP

#include "lext/Types.hpp"

#include <string>
#include <vector>

namespace lext {

/**
 * @brief Visual fingerprint of a page used for pattern matching
 *
 * Ten features normalized to [0,1], in this order: aspect ratio, region
 * area ratio, character density, band flag, band cut ratio, complexity
 * score, engine score, needs-cleaning flag, page type and cleaning-reason
 * ratio.
 */
struct PageSignature {
  std::vector<double> features;
  std::string bucket; ///< Features quantized to the bucket step
};

constexpr size_t kSignatureLength = 10;

/**
 * @brief Compute the signature of a surveyed page
 * @param layout Page layout from the Layout Analyzer
 * @param bucketStep Quantization step of the bucket key
 */
PageSignature computeSignature(const PageLayout &layout,
                               double bucketStep = 0.05);

/**
 * @brief Quantize features into a stable key, e.g. "10,18,4,0,..."
 */
std::string signatureBucket(const std::vector<double> &features,
                            double bucketStep);

/**
 * @brief Cosine similarity in [0,1]; 0 for length mismatch or zero vectors
 */
double cosineSimilarity(const std::vector<double> &a,
                        const std::vector<double> &b);

/**
 * @brief Guess the pattern kind of a page
 *
 * Fewer than 50 characters is an image, a lateral band marks a header
 * pattern and anything else is a text block.
 */
PatternKind inferPatternKind(const PageLayout &layout);

} // namespace lext

#endif // LEXT_SIGNATURE_HPP
