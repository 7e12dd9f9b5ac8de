#ifndef LEXT_CONTEXT_STORE_HPP
#define LEXT_CONTEXT_STORE_HPP

#include "lext/Config.hpp"
#include "lext/Signature.hpp"
#include "lext/Types.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace lext {

/**
 * @brief A legal case, the scope patterns are learned in
 */
struct CaseRecord {
  long long id = 0;
  std::string caseIdentifier; ///< Case number or caller-chosen key
  std::string system;         ///< Issuing system code
  std::string createdAt;
  std::string updatedAt;
};

/**
 * @brief Suggestion derived from a previously observed similar page
 */
struct PatternHint {
  long long patternId = 0;
  double similarity = 0.0;         ///< Cosine similarity to the query vector
  PatternKind kind = PatternKind::Unknown;
  EngineType suggestedEngine = EngineType::Ocr;
  std::optional<PageRect> suggestedRegion;
  double confidence = 0.0;         ///< Running average confidence
  int occurrenceCount = 0;

  /**
   * @brief Whether the hint is strong enough to drive engine selection
   */
  bool shouldUse(double minSimilarity = 0.85,
                 double minConfidence = 0.7) const {
    return similarity >= minSimilarity && confidence >= minConfidence;
  }
};

/**
 * @brief What actually happened when a page was extracted
 */
struct PageObservation {
  int pageNumber = 0;
  PatternKind kind = PatternKind::TextBlock;
  EngineType engineUsed = EngineType::Ocr;
  double confidence = 0.0;
  PageRect region; ///< Region the engine read
};

/**
 * @brief Per-engine aggregate over all stored patterns
 */
struct EngineStat {
  EngineType engine = EngineType::Ocr;
  int totalPatterns = 0;
  double avgConfidence = 0.0;
  int totalOccurrences = 0;
  int deprecatedCount = 0;
  double reliability = 0.0; ///< avg * 0.7 + (1 - deprecation rate) * 0.3
};

/**
 * @brief Lookup and learning interface used by the Text Extractor
 */
class PatternAdvisor {
public:
  virtual ~PatternAdvisor() = default;

  /**
   * @brief Best non-deprecated pattern of the case with cosine >= threshold
   * @param kind Restrict to one pattern kind (optional)
   */
  virtual std::optional<PatternHint>
  findSimilarPattern(long long caseId, const std::vector<double> &vector,
                     std::optional<PatternKind> kind = std::nullopt) = 0;

  /**
   * @brief Record the outcome of a page and check the hint that drove it
   * @return Id of the created or updated pattern
   */
  virtual long long learnFromPage(long long caseId,
                                  const PageSignature &signature,
                                  const PageObservation &observation,
                                  const std::optional<PatternHint> &hint) = 0;
};

/**
 * @brief Persistent per-case pattern store on SQLite
 *
 * Every operation opens its own connection, so concurrent readers never
 * share a handle; the database runs in WAL mode. Writes of one case are
 * serialized by a per-case mutex and each write is a single transaction.
 *
 * Update rules:
 * - the stored engine and region are only replaced by an engine of equal
 *   or higher quality tier;
 * - when a hint was used and the engine or region actually used differs
 *   from it, the hinted pattern's divergence count grows and a
 *   divergence_log row is written; at deprecationThreshold the pattern is
 *   deprecated and never hinted again. Patterns are never deleted.
 *
 * All failures throw ContextStoreError.
 */
class ContextStore : public PatternAdvisor {
public:
  /**
   * @brief Open or create the database and its schema
   * @throws ContextStoreError if the database cannot be opened
   */
  explicit ContextStore(const ContextStoreConfig &config);
  ~ContextStore() override;

  ContextStore(const ContextStore &) = delete;
  ContextStore &operator=(const ContextStore &) = delete;

  /**
   * @brief Find a case by identifier, creating it on first use
   */
  CaseRecord getOrCreateCase(const std::string &caseIdentifier,
                             const std::string &system);

  std::optional<PatternHint>
  findSimilarPattern(long long caseId, const std::vector<double> &vector,
                     std::optional<PatternKind> kind = std::nullopt) override;

  long long learnFromPage(long long caseId, const PageSignature &signature,
                          const PageObservation &observation,
                          const std::optional<PatternHint> &hint) override;

  /**
   * @brief Rows of the engine_stats view
   */
  std::vector<EngineStat> engineStats();

  /**
   * @brief Number of active or deprecated patterns of a case
   */
  int patternCount(long long caseId, bool deprecated = false);

  /**
   * @brief Divergence count of a pattern, nullopt if it does not exist
   */
  std::optional<int> divergenceCount(long long patternId);

  /**
   * @brief Stored engine of a pattern, nullopt if it does not exist
   */
  std::optional<EngineType> storedEngine(long long patternId);

  const std::string &databasePath() const { return m_config.databasePath; }

private:
  std::mutex &caseMutex(long long caseId);

  ContextStoreConfig m_config;
  std::mutex m_locksMutex;
  std::map<long long, std::unique_ptr<std::mutex>> m_caseLocks;
};

} // namespace lext

#endif // LEXT_CONTEXT_STORE_HPP
