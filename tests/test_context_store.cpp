/**
 * @file test_context_store.cpp
 * @brief Unit tests for the SQLite pattern store
 */

#include <gtest/gtest.h>
#include <lext/ContextStore.hpp>
#include <lext/Errors.hpp>

#include <filesystem>
#include <string>
#include <thread>
#include <vector>

using namespace lext;

namespace {

class ContextStoreTest : public ::testing::Test {
protected:
  void SetUp() override {
    const auto *info = ::testing::UnitTest::GetInstance()->current_test_info();
    m_path = (std::filesystem::temp_directory_path() /
              (std::string("lext_store_") + info->name() + ".db"))
                 .string();
    removeFiles();
    m_config.databasePath = m_path;
  }

  void TearDown() override { removeFiles(); }

  void removeFiles() {
    std::error_code ec;
    for (const char *suffix : {"", "-wal", "-shm"}) {
      std::filesystem::remove(m_path + suffix, ec);
    }
  }

  static PageSignature signature() {
    PageSignature sig;
    sig.features = {0.35, 1.0, 0.2, 0.0, 0.0, 0.75, 0.5, 0.0, 1.0, 0.0};
    sig.bucket = signatureBucket(sig.features, 0.05);
    return sig;
  }

  static PageObservation observation(EngineType engine, double confidence) {
    PageObservation obs;
    obs.pageNumber = 3;
    obs.kind = PatternKind::TextBlock;
    obs.engineUsed = engine;
    obs.confidence = confidence;
    obs.region = PageRect{0.0, 0.0, 500.0, 842.0};
    return obs;
  }

  std::string m_path;
  ContextStoreConfig m_config;
};

} // namespace

TEST_F(ContextStoreTest, CaseIsCreatedOnce) {
  ContextStore store(m_config);
  CaseRecord first = store.getOrCreateCase("0001234-56.2024.8.26.0100", "ESAJ");
  CaseRecord second = store.getOrCreateCase("0001234-56.2024.8.26.0100", "ESAJ");

  EXPECT_GT(first.id, 0);
  EXPECT_EQ(first.id, second.id);
  EXPECT_EQ(second.system, "ESAJ");
  EXPECT_NE(store.getOrCreateCase("other", "PJE").id, first.id);
}

TEST_F(ContextStoreTest, LearnedPatternIsFound) {
  ContextStore store(m_config);
  long long caseId = store.getOrCreateCase("case-a", "PJE").id;
  long long otherCase = store.getOrCreateCase("case-b", "PJE").id;

  long long patternId = store.learnFromPage(
      caseId, signature(), observation(EngineType::Ocr, 0.9), std::nullopt);
  EXPECT_GT(patternId, 0);

  auto hint = store.findSimilarPattern(caseId, signature().features);
  ASSERT_TRUE(hint.has_value());
  EXPECT_EQ(hint->patternId, patternId);
  EXPECT_NEAR(hint->similarity, 1.0, 1e-9);
  EXPECT_EQ(hint->suggestedEngine, EngineType::Ocr);
  EXPECT_NEAR(hint->confidence, 0.9, 1e-9);
  EXPECT_EQ(hint->kind, PatternKind::TextBlock);
  ASSERT_TRUE(hint->suggestedRegion.has_value());
  EXPECT_DOUBLE_EQ(hint->suggestedRegion->width, 500.0);

  // Scoped by case and by kind
  EXPECT_FALSE(store.findSimilarPattern(otherCase, signature().features));
  EXPECT_FALSE(
      store.findSimilarPattern(caseId, signature().features, PatternKind::Image));
}

TEST_F(ContextStoreTest, DissimilarVectorHasNoHint) {
  ContextStore store(m_config);
  long long caseId = store.getOrCreateCase("case-a", "PJE").id;
  store.learnFromPage(caseId, signature(), observation(EngineType::Ocr, 0.9),
                      std::nullopt);

  std::vector<double> other = {0.0, 0.0, 0.0, 1.0, 0.0,
                               0.0, 0.0, 1.0, 0.0, 1.0};
  EXPECT_FALSE(store.findSimilarPattern(caseId, other));
}

TEST_F(ContextStoreTest, LowerTierDoesNotReplaceStoredEngine) {
  ContextStore store(m_config);
  long long caseId = store.getOrCreateCase("case-a", "PJE").id;

  long long id = store.learnFromPage(
      caseId, signature(), observation(EngineType::MlLayout, 0.9), std::nullopt);
  long long again = store.learnFromPage(
      caseId, signature(), observation(EngineType::Ocr, 0.5), std::nullopt);
  EXPECT_EQ(id, again);

  ASSERT_TRUE(store.storedEngine(id).has_value());
  EXPECT_EQ(*store.storedEngine(id), EngineType::MlLayout);
  auto hint = store.findSimilarPattern(caseId, signature().features);
  ASSERT_TRUE(hint.has_value());
  EXPECT_NEAR(hint->confidence, 0.9, 1e-9);
  EXPECT_EQ(hint->occurrenceCount, 2);
}

TEST_F(ContextStoreTest, RepeatedDivergenceDeprecates) {
  ContextStore store(m_config);
  long long caseId = store.getOrCreateCase("case-a", "PJE").id;
  long long id = store.learnFromPage(
      caseId, signature(), observation(EngineType::Ocr, 0.9), std::nullopt);

  auto hint = store.findSimilarPattern(caseId, signature().features);
  ASSERT_TRUE(hint.has_value());

  for (int i = 0; i < 3; ++i) {
    store.learnFromPage(caseId, signature(),
                        observation(EngineType::MlLayout, 0.95), hint);
  }

  EXPECT_EQ(store.divergenceCount(id).value_or(-1), 3);
  EXPECT_FALSE(store.findSimilarPattern(caseId, signature().features));
  EXPECT_EQ(store.patternCount(caseId, true), 1);
  EXPECT_EQ(store.patternCount(caseId, false), 0);
}

TEST_F(ContextStoreTest, SmallRegionShiftIsNotDivergence) {
  ContextStore store(m_config);
  long long caseId = store.getOrCreateCase("case-a", "PJE").id;
  long long id = store.learnFromPage(
      caseId, signature(), observation(EngineType::Ocr, 0.9), std::nullopt);
  auto hint = store.findSimilarPattern(caseId, signature().features);
  ASSERT_TRUE(hint.has_value());

  PageObservation shifted = observation(EngineType::Ocr, 0.9);
  shifted.region = PageRect{1.0, 1.0, 500.0, 842.0};
  store.learnFromPage(caseId, signature(), shifted, hint);
  EXPECT_EQ(store.divergenceCount(id).value_or(-1), 0);

  PageObservation moved = observation(EngineType::Ocr, 0.9);
  moved.region = PageRect{0.0, 0.0, 450.0, 842.0};
  store.learnFromPage(caseId, signature(), moved, hint);
  EXPECT_EQ(store.divergenceCount(id).value_or(-1), 1);
}

TEST_F(ContextStoreTest, ConcurrentLearningOnOneCase) {
  ContextStore store(m_config);
  long long caseId = store.getOrCreateCase("case-a", "PJE").id;

  constexpr int kThreads = 4;
  constexpr int kPagesPerThread = 5;
  std::vector<std::thread> threads;
  std::vector<int> failures(kThreads, 0);
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&, t]() {
      for (int i = 0; i < kPagesPerThread; ++i) {
        try {
          store.learnFromPage(caseId, signature(),
                              observation(EngineType::Ocr, 0.8), std::nullopt);
        } catch (const ContextStoreError &) {
          ++failures[t];
        }
      }
    });
  }
  for (auto &thread : threads) {
    thread.join();
  }

  for (int failed : failures) {
    EXPECT_EQ(failed, 0);
  }
  EXPECT_EQ(store.patternCount(caseId), 1);
  auto hint = store.findSimilarPattern(caseId, signature().features);
  ASSERT_TRUE(hint.has_value());
  EXPECT_EQ(hint->occurrenceCount, kThreads * kPagesPerThread);
  EXPECT_NEAR(hint->confidence, 0.8, 1e-9);
}

TEST_F(ContextStoreTest, EngineStatsAggregatePatterns) {
  ContextStore store(m_config);
  long long caseId = store.getOrCreateCase("case-a", "PJE").id;
  store.learnFromPage(caseId, signature(), observation(EngineType::Ocr, 0.8),
                      std::nullopt);

  auto stats = store.engineStats();
  ASSERT_EQ(stats.size(), 1u);
  EXPECT_EQ(stats[0].engine, EngineType::Ocr);
  EXPECT_EQ(stats[0].totalPatterns, 1);
  EXPECT_NEAR(stats[0].reliability, 0.8 * 0.7 + 0.3, 1e-9);
}

TEST_F(ContextStoreTest, MissingPatternQueries) {
  ContextStore store(m_config);
  EXPECT_FALSE(store.divergenceCount(42).has_value());
  EXPECT_FALSE(store.storedEngine(42).has_value());
}

TEST(ContextStoreOpenTest, UnwritableLocationThrows) {
  ContextStoreConfig config;
  config.databasePath = "/proc/lext-missing/context.db";
  EXPECT_THROW(ContextStore store(config), ContextStoreError);
}
