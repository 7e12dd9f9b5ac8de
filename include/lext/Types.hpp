#ifndef LEXT_TYPES_HPP
#define LEXT_TYPES_HPP

#include <optional>
#include <string>
#include <vector>

namespace lext {

/**
 * @brief Rectangle in PDF points with origin at the top-left of the page
 */
struct PageRect {
  double x = 0.0;      ///< Left edge in points
  double y = 0.0;      ///< Top edge in points
  double width = 0.0;  ///< Width in points
  double height = 0.0; ///< Height in points

  double right() const { return x + width; }
  double bottom() const { return y + height; }
  double area() const { return width * height; }
  bool empty() const { return width <= 0.0 || height <= 0.0; }

  /**
   * @brief Check whether @p other lies fully inside this rectangle
   */
  bool contains(const PageRect &other) const {
    return other.x >= x && other.y >= y && other.right() <= right() &&
           other.bottom() <= bottom();
  }

  bool operator==(const PageRect &other) const {
    return x == other.x && y == other.y && width == other.width &&
           height == other.height;
  }
  bool operator!=(const PageRect &other) const { return !(*this == other); }
};

/**
 * @brief Whether a page carries a usable text layer
 */
enum class PageClassification {
  Native,      ///< Text layer is present and dense enough
  RasterNeeded ///< Page must be rendered and recognized
};

/**
 * @brief Visual complexity of a page, drives the recommended engine
 */
enum class ComplexityTag {
  NativeClean,
  NativeWithArtifacts,
  RasterClean,
  RasterDirty,
  RasterDegraded
};

/**
 * @brief Extraction engine tiers
 *
 * Quality ranking (highest first): MlLayout, Native, Ocr.
 */
enum class EngineType {
  Native,  ///< PDF text-layer parser
  Ocr,     ///< Optical character recognition
  MlLayout ///< High-fidelity layout-aware recognizer
};

/**
 * @brief Side of the page where a lateral band was found
 */
enum class BandSide { None, Left, Right };

/**
 * @brief Coarse visual role of a page pattern in the Context Store
 */
enum class PatternKind {
  Header,
  Footer,
  Table,
  TextBlock,
  Image,
  Signature,
  Stamp,
  Unknown
};

/**
 * @brief Legal document section taxonomy
 *
 * Declaration order is the matching order used by the classifier.
 */
enum class TaxonomyCategory {
  PeticaoInicial, ///< Initial petition
  Contestacao,    ///< Defense / response
  Replica,        ///< Rebuttal
  Sentenca,       ///< Judicial decision (sentence, judgment, decision)
  Despacho,       ///< Procedural order
  Recurso,        ///< Appeal
  ParecerMp,      ///< Prosecutorial opinion
  AtaAudiencia,   ///< Hearing record
  Certidao,       ///< Certificate / notice
  Anexos,         ///< Supporting attachments
  CapaDados,      ///< Case cover sheet
  Indeterminado   ///< Fallback
};

/**
 * @brief Issuing system identified for a document
 */
struct SystemIdentification {
  std::string code = "UNKNOWN"; ///< System code (PJE, ESAJ, ...)
  std::string name;             ///< Human readable name
  int confidence = 0;           ///< Confidence 0-100
  int matches = 0;              ///< Number of fingerprints matched
  int tier = 0;                 ///< Priority tier (1 = most specific)
  bool overridden = false;      ///< Set by caller instead of detected
};

/**
 * @brief Per-page structural survey
 */
struct PageLayout {
  int pageNumber = 0; ///< 1-indexed page number
  PageClassification classification = PageClassification::RasterNeeded;
  ComplexityTag complexity = ComplexityTag::RasterDirty;
  EngineType recommendedEngine = EngineType::Ocr;
  PageRect trustworthyRegion; ///< Always inside the page bounds
  bool hasLateralBand = false;
  BandSide bandSide = BandSide::None;
  std::optional<double> bandCutCoordinate; ///< X boundary body/band
  int nativeCharCount = 0; ///< Characters inside trustworthyRegion

  double pageWidth = 0.0;     ///< Page width in points
  double pageHeight = 0.0;    ///< Page height in points
  double imageCoverage = 0.0; ///< Share of page area covered by images
  bool needsCleaning = false;
  std::vector<std::string> cleaningReasons;
  double confidence = 1.0; ///< 0 when the page could not be read

  PageRect pageBounds() const { return PageRect{0.0, 0.0, pageWidth, pageHeight}; }
};

/**
 * @brief Outcome of extracting one page
 */
struct ExtractionResult {
  int pageNumber = 0;
  EngineType engineUsed = EngineType::Native;
  std::string text;
  double confidence = 0.0;                ///< In [0,1]
  std::vector<EngineType> fallbackChain;  ///< Engines attempted, in order
  double similarityScore = 0.0;           ///< Reference-signal score of text
  bool escalated = false;                 ///< A higher tier was tried
  bool needsReview = false;               ///< Confidence below review floor
  bool hintUsed = false;                  ///< Context Store hint drove choice
  bool failed = false;                    ///< No engine produced text
  double processingTimeMs = 0.0;
};

/**
 * @brief Contiguous run of pages of a single taxonomy category
 */
struct Section {
  int sectionId = 0;
  TaxonomyCategory type = TaxonomyCategory::Indeterminado;
  int startPage = 0;
  int endPage = 0;
  double confidence = 0.0;

  int pageCount() const { return endPage - startPage + 1; }
};

/**
 * @brief Per-page classification used to locate section boundaries
 */
struct PageClassificationRecord {
  int page = 0;
  TaxonomyCategory type = TaxonomyCategory::Indeterminado;
  double confidence = 0.0;
  bool isSectionStart = false;
  bool matched = false;         ///< A header pattern matched on this page
  std::string extractionType;   ///< Marker TYPE value of the page
  std::vector<std::string> matchedPatterns;
};

// String conversions used in artifacts, markers and the Context Store
std::string toString(PageClassification value);
std::string toString(ComplexityTag value);
std::string toString(EngineType value);
std::string toString(BandSide value);
std::string toString(PatternKind value);
std::string toString(TaxonomyCategory value);

/**
 * @brief Short marker label of an engine (NATIVE, OCR, ML)
 */
std::string markerLabel(EngineType value);

std::optional<EngineType> engineFromString(const std::string &value);
std::optional<PatternKind> patternKindFromString(const std::string &value);
std::optional<TaxonomyCategory> taxonomyFromString(const std::string &value);

/**
 * @brief Quality ceiling of an engine tier (ml 1.0, native 0.9, ocr 0.7)
 */
double engineQuality(EngineType engine);

} // namespace lext

#endif // LEXT_TYPES_HPP
