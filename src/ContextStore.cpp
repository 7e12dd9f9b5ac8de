#include "lext/ContextStore.hpp"
#include "lext/Errors.hpp"
#include "lext/Log.hpp"

#include <nlohmann/json.hpp>
#include <sqlite3.h>

#include <cmath>
#include <filesystem>

namespace lext {

namespace {

const char *kSchema = R"SQL(
CREATE TABLE IF NOT EXISTS cases (
  id INTEGER PRIMARY KEY AUTOINCREMENT,
  case_identifier TEXT NOT NULL UNIQUE,
  system TEXT NOT NULL DEFAULT '',
  created_at TEXT NOT NULL DEFAULT CURRENT_TIMESTAMP,
  updated_at TEXT NOT NULL DEFAULT CURRENT_TIMESTAMP
);

CREATE TABLE IF NOT EXISTS observed_patterns (
  id INTEGER PRIMARY KEY AUTOINCREMENT,
  case_id INTEGER NOT NULL REFERENCES cases(id),
  pattern_kind TEXT NOT NULL,
  signature_bucket TEXT NOT NULL,
  signature_vector TEXT NOT NULL,
  first_seen_page INTEGER NOT NULL,
  last_seen_page INTEGER NOT NULL,
  engine_used TEXT NOT NULL,
  engine_quality REAL NOT NULL,
  occurrence_count INTEGER NOT NULL DEFAULT 1,
  avg_confidence REAL NOT NULL DEFAULT 0,
  divergence_count INTEGER NOT NULL DEFAULT 0,
  deprecated INTEGER NOT NULL DEFAULT 0,
  suggested_region TEXT,
  created_at TEXT NOT NULL DEFAULT CURRENT_TIMESTAMP,
  updated_at TEXT NOT NULL DEFAULT CURRENT_TIMESTAMP,
  UNIQUE(case_id, signature_bucket, pattern_kind)
);

CREATE INDEX IF NOT EXISTS idx_patterns_case
  ON observed_patterns(case_id, deprecated);

CREATE TABLE IF NOT EXISTS divergence_log (
  id INTEGER PRIMARY KEY AUTOINCREMENT,
  pattern_id INTEGER NOT NULL REFERENCES observed_patterns(id),
  page_number INTEGER NOT NULL,
  expected_engine TEXT NOT NULL,
  actual_engine TEXT NOT NULL,
  expected_confidence REAL,
  actual_confidence REAL,
  created_at TEXT NOT NULL DEFAULT CURRENT_TIMESTAMP
);

CREATE VIEW IF NOT EXISTS engine_stats AS
SELECT
  engine_used,
  COUNT(*) AS total_patterns,
  AVG(avg_confidence) AS avg_confidence,
  SUM(occurrence_count) AS total_occurrences,
  SUM(deprecated) AS deprecated_count,
  AVG(avg_confidence) * 0.7 +
    (1.0 - CAST(SUM(deprecated) AS REAL) / COUNT(*)) * 0.3 AS reliability
FROM observed_patterns
GROUP BY engine_used;
)SQL";

const char *kUpsertPattern = R"SQL(
INSERT INTO observed_patterns (
  case_id, pattern_kind, signature_bucket, signature_vector,
  first_seen_page, last_seen_page, engine_used, engine_quality,
  avg_confidence, suggested_region
) VALUES (?1, ?2, ?3, ?4, ?5, ?5, ?6, ?7, ?8, ?9)
ON CONFLICT(case_id, signature_bucket, pattern_kind) DO UPDATE SET
  last_seen_page = excluded.last_seen_page,
  occurrence_count = occurrence_count + 1,
  avg_confidence = CASE WHEN excluded.engine_quality >= engine_quality
    THEN (avg_confidence * occurrence_count + excluded.avg_confidence) /
         (occurrence_count + 1)
    ELSE avg_confidence END,
  signature_vector = CASE WHEN excluded.engine_quality >= engine_quality
    THEN excluded.signature_vector ELSE signature_vector END,
  engine_used = CASE WHEN excluded.engine_quality >= engine_quality
    THEN excluded.engine_used ELSE engine_used END,
  suggested_region = CASE WHEN excluded.engine_quality >= engine_quality
    THEN excluded.suggested_region ELSE suggested_region END,
  engine_quality = MAX(engine_quality, excluded.engine_quality),
  updated_at = CURRENT_TIMESTAMP
)SQL";

// Edges may move this much before a region counts as different
constexpr double kRegionTolerance = 2.0;

/// Owns one sqlite3 connection
class Connection {
public:
  explicit Connection(const std::string &path) {
    int rc = sqlite3_open_v2(path.c_str(), &m_db,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE |
                                 SQLITE_OPEN_NOMUTEX,
                             nullptr);
    if (rc != SQLITE_OK) {
      std::string message = m_db ? sqlite3_errmsg(m_db) : sqlite3_errstr(rc);
      sqlite3_close(m_db);
      m_db = nullptr;
      throw ContextStoreError("Cannot open context database " + path + ": " +
                              message);
    }
    sqlite3_busy_timeout(m_db, 5000);
  }

  ~Connection() { sqlite3_close(m_db); }

  Connection(const Connection &) = delete;
  Connection &operator=(const Connection &) = delete;

  sqlite3 *get() const { return m_db; }

  void exec(const char *sql) {
    char *error = nullptr;
    if (sqlite3_exec(m_db, sql, nullptr, nullptr, &error) != SQLITE_OK) {
      std::string message = error ? error : sqlite3_errmsg(m_db);
      sqlite3_free(error);
      throw ContextStoreError("SQL failed: " + message);
    }
  }

private:
  sqlite3 *m_db = nullptr;
};

/// Owns one prepared statement
class Statement {
public:
  Statement(Connection &connection, const char *sql) : m_db(connection.get()) {
    if (sqlite3_prepare_v2(m_db, sql, -1, &m_stmt, nullptr) != SQLITE_OK) {
      throw ContextStoreError(std::string("Prepare failed: ") +
                              sqlite3_errmsg(m_db));
    }
  }

  ~Statement() { sqlite3_finalize(m_stmt); }

  Statement(const Statement &) = delete;
  Statement &operator=(const Statement &) = delete;

  void bind(int index, long long value) {
    check(sqlite3_bind_int64(m_stmt, index, value));
  }
  void bind(int index, int value) { check(sqlite3_bind_int(m_stmt, index, value)); }
  void bind(int index, double value) {
    check(sqlite3_bind_double(m_stmt, index, value));
  }
  void bind(int index, const std::string &value) {
    check(sqlite3_bind_text(m_stmt, index, value.c_str(),
                            static_cast<int>(value.size()), SQLITE_TRANSIENT));
  }
  void bindNull(int index) { check(sqlite3_bind_null(m_stmt, index)); }

  /**
   * @return true while a row is available
   */
  bool step() {
    int rc = sqlite3_step(m_stmt);
    if (rc == SQLITE_ROW) {
      return true;
    }
    if (rc != SQLITE_DONE) {
      throw ContextStoreError(std::string("Step failed: ") +
                              sqlite3_errmsg(m_db));
    }
    return false;
  }

  long long int64(int column) const {
    return sqlite3_column_int64(m_stmt, column);
  }
  int integer(int column) const { return sqlite3_column_int(m_stmt, column); }
  double real(int column) const { return sqlite3_column_double(m_stmt, column); }
  bool isNull(int column) const {
    return sqlite3_column_type(m_stmt, column) == SQLITE_NULL;
  }
  std::string text(int column) const {
    const unsigned char *value = sqlite3_column_text(m_stmt, column);
    return value ? reinterpret_cast<const char *>(value) : std::string();
  }

private:
  void check(int rc) {
    if (rc != SQLITE_OK) {
      throw ContextStoreError(std::string("Bind failed: ") +
                              sqlite3_errmsg(m_db));
    }
  }

  sqlite3 *m_db;
  sqlite3_stmt *m_stmt = nullptr;
};

/// Rolls back unless committed
class Transaction {
public:
  explicit Transaction(Connection &connection) : m_connection(connection) {
    m_connection.exec("BEGIN IMMEDIATE");
  }

  ~Transaction() {
    if (!m_committed &&
        sqlite3_exec(m_connection.get(), "ROLLBACK", nullptr, nullptr,
                     nullptr) != SQLITE_OK) {
      log::error("Rollback failed: ", sqlite3_errmsg(m_connection.get()));
    }
  }

  void commit() {
    m_connection.exec("COMMIT");
    m_committed = true;
  }

private:
  Connection &m_connection;
  bool m_committed = false;
};

std::string regionToJson(const PageRect &region) {
  nlohmann::json j = {{"x", region.x},
                      {"y", region.y},
                      {"width", region.width},
                      {"height", region.height}};
  return j.dump();
}

std::optional<PageRect> regionFromJson(const std::string &text) {
  if (text.empty()) {
    return std::nullopt;
  }
  nlohmann::json j = nlohmann::json::parse(text, nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    return std::nullopt;
  }
  PageRect region;
  region.x = j.value("x", 0.0);
  region.y = j.value("y", 0.0);
  region.width = j.value("width", 0.0);
  region.height = j.value("height", 0.0);
  return region;
}

std::vector<double> vectorFromJson(const std::string &text) {
  nlohmann::json j = nlohmann::json::parse(text, nullptr, false);
  if (j.is_discarded() || !j.is_array()) {
    return {};
  }
  std::vector<double> vector;
  for (const auto &value : j) {
    if (value.is_number()) {
      vector.push_back(value.get<double>());
    }
  }
  return vector;
}

bool sameRegion(const PageRect &a, const PageRect &b) {
  return std::abs(a.x - b.x) <= kRegionTolerance &&
         std::abs(a.y - b.y) <= kRegionTolerance &&
         std::abs(a.right() - b.right()) <= kRegionTolerance &&
         std::abs(a.bottom() - b.bottom()) <= kRegionTolerance;
}

} // anonymous namespace

ContextStore::ContextStore(const ContextStoreConfig &config) : m_config(config) {
  std::filesystem::path dbPath(m_config.databasePath);
  if (dbPath.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(dbPath.parent_path(), ec);
    if (ec) {
      throw ContextStoreError("Cannot create directory for " +
                              m_config.databasePath + ": " + ec.message());
    }
  }

  Connection connection(m_config.databasePath);
  connection.exec("PRAGMA journal_mode=WAL");
  connection.exec(kSchema);
  log::info("Context store ready at ", m_config.databasePath);
}

ContextStore::~ContextStore() = default;

std::mutex &ContextStore::caseMutex(long long caseId) {
  std::lock_guard<std::mutex> lock(m_locksMutex);
  auto &slot = m_caseLocks[caseId];
  if (!slot) {
    slot = std::make_unique<std::mutex>();
  }
  return *slot;
}

CaseRecord ContextStore::getOrCreateCase(const std::string &caseIdentifier,
                                         const std::string &system) {
  Connection connection(m_config.databasePath);

  {
    Statement insert(connection,
                     "INSERT INTO cases (case_identifier, system) VALUES (?1, ?2) "
                     "ON CONFLICT(case_identifier) DO NOTHING");
    insert.bind(1, caseIdentifier);
    insert.bind(2, system);
    insert.step();
    if (sqlite3_changes(connection.get()) > 0) {
      log::info("Created new case: ", caseIdentifier);
    }
  }

  Statement select(connection,
                   "SELECT id, case_identifier, system, created_at, updated_at "
                   "FROM cases WHERE case_identifier = ?1");
  select.bind(1, caseIdentifier);
  if (!select.step()) {
    throw ContextStoreError("Case vanished after insert: " + caseIdentifier);
  }

  CaseRecord record;
  record.id = select.int64(0);
  record.caseIdentifier = select.text(1);
  record.system = select.text(2);
  record.createdAt = select.text(3);
  record.updatedAt = select.text(4);
  return record;
}

std::optional<PatternHint>
ContextStore::findSimilarPattern(long long caseId,
                                 const std::vector<double> &vector,
                                 std::optional<PatternKind> kind) {
  Connection connection(m_config.databasePath);

  std::string sql =
      "SELECT id, pattern_kind, signature_vector, suggested_region, "
      "engine_used, avg_confidence, occurrence_count FROM observed_patterns "
      "WHERE case_id = ?1 AND deprecated = 0";
  if (kind) {
    sql += " AND pattern_kind = ?2";
  }

  Statement select(connection, sql.c_str());
  select.bind(1, caseId);
  if (kind) {
    select.bind(2, toString(*kind));
  }

  std::optional<PatternHint> best;
  double bestSimilarity = 0.0;
  while (select.step()) {
    double similarity = cosineSimilarity(vector, vectorFromJson(select.text(2)));
    if (similarity < m_config.similarityThreshold ||
        similarity <= bestSimilarity) {
      continue;
    }

    std::optional<EngineType> engine = engineFromString(select.text(4));
    if (!engine) {
      log::warn("Pattern ", select.int64(0), " has unknown engine ",
                select.text(4));
      continue;
    }

    PatternHint hint;
    hint.patternId = select.int64(0);
    hint.similarity = similarity;
    hint.kind = patternKindFromString(select.text(1)).value_or(PatternKind::Unknown);
    hint.suggestedEngine = *engine;
    if (!select.isNull(3)) {
      hint.suggestedRegion = regionFromJson(select.text(3));
    }
    hint.confidence = select.real(5);
    hint.occurrenceCount = select.integer(6);

    best = hint;
    bestSimilarity = similarity;
  }

  if (best) {
    log::debug("Found similar pattern ", best->patternId, " (similarity ",
               best->similarity, ", engine ", toString(best->suggestedEngine),
               ")");
  }
  return best;
}

long long ContextStore::learnFromPage(long long caseId,
                                      const PageSignature &signature,
                                      const PageObservation &observation,
                                      const std::optional<PatternHint> &hint) {
  std::lock_guard<std::mutex> caseLock(caseMutex(caseId));

  Connection connection(m_config.databasePath);
  Transaction transaction(connection);

  if (hint) {
    bool engineDiffers = hint->suggestedEngine != observation.engineUsed;
    bool regionDiffers = hint->suggestedRegion &&
                         !sameRegion(*hint->suggestedRegion, observation.region);

    if (engineDiffers || regionDiffers) {
      Statement diverge(connection,
                        "UPDATE observed_patterns SET "
                        "divergence_count = divergence_count + 1, "
                        "deprecated = CASE WHEN divergence_count + 1 >= ?1 "
                        "THEN 1 ELSE deprecated END, "
                        "updated_at = CURRENT_TIMESTAMP WHERE id = ?2");
      diverge.bind(1, m_config.deprecationThreshold);
      diverge.bind(2, hint->patternId);
      diverge.step();

      Statement record(connection,
                       "INSERT INTO divergence_log (pattern_id, page_number, "
                       "expected_engine, actual_engine, expected_confidence, "
                       "actual_confidence) VALUES (?1, ?2, ?3, ?4, ?5, ?6)");
      record.bind(1, hint->patternId);
      record.bind(2, observation.pageNumber);
      record.bind(3, toString(hint->suggestedEngine));
      record.bind(4, toString(observation.engineUsed));
      record.bind(5, hint->confidence);
      record.bind(6, observation.confidence);
      record.step();

      log::warn("Divergence on pattern ", hint->patternId, " page ",
                observation.pageNumber, ": expected ",
                toString(hint->suggestedEngine), ", used ",
                toString(observation.engineUsed));
    }
  }

  nlohmann::json features = signature.features;
  std::string kindName = toString(observation.kind);

  {
    Statement upsert(connection, kUpsertPattern);
    upsert.bind(1, caseId);
    upsert.bind(2, kindName);
    upsert.bind(3, signature.bucket);
    upsert.bind(4, features.dump());
    upsert.bind(5, observation.pageNumber);
    upsert.bind(6, toString(observation.engineUsed));
    upsert.bind(7, engineQuality(observation.engineUsed));
    upsert.bind(8, observation.confidence);
    upsert.bind(9, regionToJson(observation.region));
    upsert.step();
  }

  long long patternId = 0;
  {
    Statement select(connection,
                     "SELECT id FROM observed_patterns WHERE case_id = ?1 AND "
                     "signature_bucket = ?2 AND pattern_kind = ?3");
    select.bind(1, caseId);
    select.bind(2, signature.bucket);
    select.bind(3, kindName);
    if (!select.step()) {
      throw ContextStoreError("Pattern missing after upsert");
    }
    patternId = select.int64(0);
  }

  transaction.commit();
  log::debug("Learned pattern ", patternId, " from page ",
             observation.pageNumber, " (", toString(observation.engineUsed),
             ")");
  return patternId;
}

std::vector<EngineStat> ContextStore::engineStats() {
  Connection connection(m_config.databasePath);
  Statement select(connection,
                   "SELECT engine_used, total_patterns, avg_confidence, "
                   "total_occurrences, deprecated_count, reliability "
                   "FROM engine_stats");

  std::vector<EngineStat> stats;
  while (select.step()) {
    std::optional<EngineType> engine = engineFromString(select.text(0));
    if (!engine) {
      continue;
    }
    EngineStat stat;
    stat.engine = *engine;
    stat.totalPatterns = select.integer(1);
    stat.avgConfidence = select.real(2);
    stat.totalOccurrences = select.integer(3);
    stat.deprecatedCount = select.integer(4);
    stat.reliability = select.real(5);
    stats.push_back(stat);
  }
  return stats;
}

int ContextStore::patternCount(long long caseId, bool deprecated) {
  Connection connection(m_config.databasePath);
  Statement select(connection,
                   "SELECT COUNT(*) FROM observed_patterns "
                   "WHERE case_id = ?1 AND deprecated = ?2");
  select.bind(1, caseId);
  select.bind(2, deprecated ? 1 : 0);
  return select.step() ? select.integer(0) : 0;
}

std::optional<int> ContextStore::divergenceCount(long long patternId) {
  Connection connection(m_config.databasePath);
  Statement select(connection,
                   "SELECT divergence_count FROM observed_patterns WHERE id = ?1");
  select.bind(1, patternId);
  if (!select.step()) {
    return std::nullopt;
  }
  return select.integer(0);
}

std::optional<EngineType> ContextStore::storedEngine(long long patternId) {
  Connection connection(m_config.databasePath);
  Statement select(connection,
                   "SELECT engine_used FROM observed_patterns WHERE id = ?1");
  select.bind(1, patternId);
  if (!select.step()) {
    return std::nullopt;
  }
  return engineFromString(select.text(0));
}

} // namespace lext
