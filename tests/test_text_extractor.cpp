/**
 * @file test_text_extractor.cpp
 * @brief Unit tests for per-page extraction, fallback, escalation and merging
 */

#include <gtest/gtest.h>
#include <lext/ContextStore.hpp>
#include <lext/TextExtractor.hpp>

#include <atomic>
#include <filesystem>
#include <map>
#include <memory>
#include <regex>
#include <stdexcept>
#include <string>
#include <vector>

using namespace lext;

namespace {

/// Engine returning canned output, counting its calls
class FakeEngine : public ExtractionEngine {
public:
  FakeEngine(EngineType type, std::string text, double confidence,
             bool available = true, bool succeeds = true, bool throws = false)
      : m_type(type), m_text(std::move(text)), m_confidence(confidence),
        m_available(available), m_succeeds(succeeds), m_throws(throws) {}

  EngineType type() const override { return m_type; }
  bool isAvailable() override { return m_available; }

  EngineOutput extract(const PageInput &input) override {
    ++calls;
    if (m_throws) {
      throw std::runtime_error("fake crash on page " +
                               std::to_string(input.pageNumber));
    }
    EngineOutput output;
    if (!m_succeeds) {
      output.errorMessage = "fake failure on page " +
                            std::to_string(input.pageNumber);
      return output;
    }
    output.success = true;
    output.text = m_text;
    output.confidence = m_confidence;
    return output;
  }

  std::atomic<int> calls{0};

private:
  EngineType m_type;
  std::string m_text;
  double m_confidence;
  bool m_available;
  bool m_succeeds;
  bool m_throws;
};

ExtractorConfig singleWorker() {
  ExtractorConfig config;
  config.workers = 1;
  return config;
}

PageLayout layoutFor(int page, PageClassification classification) {
  PageLayout layout;
  layout.pageNumber = page;
  layout.classification = classification;
  layout.pageWidth = 595.0;
  layout.pageHeight = 842.0;
  layout.trustworthyRegion = layout.pageBounds();
  return layout;
}

PageInput inputFor(const PageLayout &layout) {
  PageInput input;
  input.pageNumber = layout.pageNumber;
  input.region = layout.trustworthyRegion;
  return input;
}

const char *kGoodText =
    "Vistos e examinados os autos da presente demanda judicial.";

} // namespace

TEST(TextExtractorTest, LowConfidenceEscalatesToHigherTier) {
  TextExtractor extractor(singleWorker());
  auto ocr = std::make_shared<FakeEngine>(EngineType::Ocr, "Vistos e ex@m#nados",
                                          0.5);
  auto ml = std::make_shared<FakeEngine>(EngineType::MlLayout, kGoodText, 0.95);
  extractor.setEngine(ocr);
  extractor.setEngine(ml);

  PageLayout layout = layoutFor(1, PageClassification::RasterNeeded);
  Warnings warnings;
  EngineBudget budget{true, true, false};

  // Budget without the ML tier: stays on OCR
  ExtractionResult ocrOnly =
      extractor.extractPage(inputFor(layout), layout, std::nullopt, budget,
                            warnings);
  EXPECT_EQ(ocrOnly.engineUsed, EngineType::Ocr);
  EXPECT_FALSE(ocrOnly.escalated);
  EXPECT_TRUE(ocrOnly.needsReview);

  // Hint pins OCR, low confidence escalates to ML which reads better
  PatternHint hint;
  hint.suggestedEngine = EngineType::Ocr;
  hint.similarity = 0.95;
  hint.confidence = 0.9;
  budget.mlLayout = true;
  ExtractionResult escalated = extractor.extractPage(
      inputFor(layout), layout, hint, budget, warnings);
  EXPECT_TRUE(escalated.hintUsed);
  EXPECT_TRUE(escalated.escalated);
  EXPECT_EQ(escalated.engineUsed, EngineType::MlLayout);
  EXPECT_EQ(escalated.text, kGoodText);
  EXPECT_GE(engineQuality(escalated.engineUsed), engineQuality(EngineType::Ocr));
}

TEST(TextExtractorTest, EscalationKeepsBetterLowerTierText) {
  TextExtractor extractor(singleWorker());
  extractor.setEngine(
      std::make_shared<FakeEngine>(EngineType::Ocr, kGoodText, 0.6));
  extractor.setEngine(
      std::make_shared<FakeEngine>(EngineType::MlLayout, "## @@ ~~ ^^", 0.9));

  PageLayout layout = layoutFor(1, PageClassification::RasterNeeded);
  PatternHint hint;
  hint.suggestedEngine = EngineType::Ocr;
  hint.similarity = 0.95;
  hint.confidence = 0.9;

  Warnings warnings;
  ExtractionResult result = extractor.extractPage(
      inputFor(layout), layout, hint, EngineBudget{true, true, true}, warnings);
  EXPECT_TRUE(result.escalated);
  EXPECT_EQ(result.engineUsed, EngineType::Ocr);
  EXPECT_EQ(result.text, kGoodText);
  ASSERT_EQ(result.fallbackChain.size(), 2u);
  EXPECT_EQ(result.fallbackChain[1], EngineType::MlLayout);
}

TEST(TextExtractorTest, FailingEngineFallsBack) {
  TextExtractor extractor(singleWorker());
  auto ml = std::make_shared<FakeEngine>(EngineType::MlLayout, "", 0.0, true,
                                         false);
  auto ocr = std::make_shared<FakeEngine>(EngineType::Ocr, kGoodText, 0.9);
  extractor.setEngine(ml);
  extractor.setEngine(ocr);

  PageLayout layout = layoutFor(3, PageClassification::RasterNeeded);
  Warnings warnings;
  ExtractionResult result = extractor.extractPage(
      inputFor(layout), layout, std::nullopt, EngineBudget{true, true, true},
      warnings);

  EXPECT_FALSE(result.failed);
  EXPECT_EQ(result.engineUsed, EngineType::Ocr);
  EXPECT_EQ(ml->calls.load(), 1);
  bool fellBack = false;
  for (const auto &warning : warnings) {
    fellBack |= warning.kind == WarningKind::EngineUnavailable;
  }
  EXPECT_TRUE(fellBack);
}

TEST(TextExtractorTest, PageIsKeptWhenEveryEngineFails) {
  TextExtractor extractor(singleWorker());
  extractor.setEngine(
      std::make_shared<FakeEngine>(EngineType::Ocr, "", 0.0, true, false));
  extractor.setEngine(
      std::make_shared<FakeEngine>(EngineType::Native, "", 0.0, true, false));

  PageLayout layout = layoutFor(2, PageClassification::RasterNeeded);
  Warnings warnings;
  ExtractionResult result = extractor.extractPage(
      inputFor(layout), layout, std::nullopt, EngineBudget{true, true, false},
      warnings);

  EXPECT_TRUE(result.failed);
  EXPECT_TRUE(result.text.empty());
  EXPECT_DOUBLE_EQ(result.confidence, 0.0);
  ASSERT_FALSE(warnings.empty());
  EXPECT_EQ(warnings.back().kind, WarningKind::PageDegraded);
  EXPECT_EQ(warnings.back().page, 2);
}

TEST(TextExtractorTest, UnavailableEnginesAreReported) {
  TextExtractor extractor(singleWorker());
  extractor.setEngine(std::make_shared<FakeEngine>(EngineType::Native,
                                                   kGoodText, 0.9));
  extractor.setEngine(
      std::make_shared<FakeEngine>(EngineType::Ocr, "", 0.0, false));

  Warnings warnings;
  EngineBudget budget = extractor.probeEngines(warnings);
  EXPECT_TRUE(budget.native);
  EXPECT_FALSE(budget.ocr);
  EXPECT_FALSE(budget.mlLayout);
  ASSERT_EQ(warnings.size(), 1u);
  EXPECT_EQ(warnings[0].kind, WarningKind::EngineUnavailable);
}

TEST(TextExtractorTest, OneMarkerPerPage) {
  TextExtractor extractor(singleWorker());
  extractor.setEngine(std::make_shared<FakeEngine>(EngineType::Native,
                                                   kGoodText, 0.9));
  extractor.setEngine(std::make_shared<FakeEngine>(EngineType::Ocr, "", 0.0,
                                                   true, false));

  std::vector<PageLayout> layouts = {
      layoutFor(1, PageClassification::Native),
      layoutFor(2, PageClassification::RasterNeeded),
      layoutFor(3, PageClassification::Native)};

  ExtractionReport report =
      extractor.extract(nullptr, layouts, {}, ExtractionContext());
  ASSERT_EQ(report.pages.size(), 3u);

  std::regex marker(R"(## \[\[PAGE_(\d{3})\]\] \[TYPE: (NATIVE|OCR|ML|NONE)\])");
  auto begin = std::sregex_iterator(report.taggedDocument.begin(),
                                    report.taggedDocument.end(), marker);
  std::vector<std::string> pages;
  for (auto it = begin; it != std::sregex_iterator(); ++it) {
    pages.push_back((*it)[1].str());
  }
  EXPECT_EQ(pages, (std::vector<std::string>{"001", "002", "003"}));
  EXPECT_NE(report.taggedDocument.find("## [[PAGE_002]] [TYPE: NATIVE]"),
            std::string::npos);
}

TEST(TextExtractorTest, FailedPageIsMarkedNone) {
  ExtractionResult failed;
  failed.pageNumber = 4;
  failed.failed = true;

  ExtractionResult read;
  read.pageNumber = 5;
  read.engineUsed = EngineType::Ocr;
  read.confidence = 0.734;
  read.text = "  texto  ";

  std::string document = TextExtractor::buildTaggedDocument({failed, read});
  EXPECT_EQ(document,
            "## [[PAGE_004]] [TYPE: NONE] [CONF: 0.00]\n(página vazia)\n\n"
            "## [[PAGE_005]] [TYPE: OCR] [CONF: 0.73]\ntexto\n");
}

TEST(TextExtractorTest, TimeoutKeepsEveryPage) {
  ExtractorConfig config = singleWorker();
  config.timeoutSeconds = 1e-9;
  TextExtractor extractor(config);
  extractor.setEngine(std::make_shared<FakeEngine>(EngineType::Native,
                                                   kGoodText, 0.9));
  extractor.setEngine(
      std::make_shared<FakeEngine>(EngineType::Ocr, kGoodText, 0.9));

  std::vector<PageLayout> layouts = {
      layoutFor(1, PageClassification::Native),
      layoutFor(2, PageClassification::Native)};

  ExtractionReport report =
      extractor.extract(nullptr, layouts, {}, ExtractionContext());
  EXPECT_TRUE(report.timedOut);
  ASSERT_EQ(report.pages.size(), 2u);
  for (const auto &page : report.pages) {
    EXPECT_TRUE(page.failed);
  }
  EXPECT_NE(report.taggedDocument.find("[[PAGE_001]]"), std::string::npos);
  EXPECT_NE(report.taggedDocument.find("[[PAGE_002]]"), std::string::npos);
}

TEST(TextExtractorTest, SimilarityScorePrefersCleanText) {
  double clean = TextExtractor::similarityScore(kGoodText);
  double garbled = TextExtractor::similarityScore("V#s ~~ ^^ @@ e|x");
  EXPECT_GT(clean, garbled);
  EXPECT_DOUBLE_EQ(TextExtractor::similarityScore(""), 0.0);
}

TEST(TextExtractorTest, FailedEscalationIsNotReported) {
  TextExtractor extractor(singleWorker());
  extractor.setEngine(
      std::make_shared<FakeEngine>(EngineType::Ocr, kGoodText, 0.5));
  auto ml = std::make_shared<FakeEngine>(EngineType::MlLayout, "", 0.0, true,
                                         false);
  extractor.setEngine(ml);

  PageLayout layout = layoutFor(1, PageClassification::RasterNeeded);
  PatternHint hint;
  hint.suggestedEngine = EngineType::Ocr;
  hint.similarity = 0.95;
  hint.confidence = 0.9;

  Warnings warnings;
  ExtractionResult result = extractor.extractPage(
      inputFor(layout), layout, hint, EngineBudget{true, true, true}, warnings);
  EXPECT_EQ(ml->calls.load(), 1);
  EXPECT_FALSE(result.escalated);
  EXPECT_EQ(result.engineUsed, EngineType::Ocr);
  EXPECT_EQ(result.text, kGoodText);
}

TEST(TextExtractorTest, ThrowingEngineFallsBack) {
  TextExtractor extractor(singleWorker());
  extractor.setEngine(std::make_shared<FakeEngine>(
      EngineType::MlLayout, "", 0.0, true, true, true));
  extractor.setEngine(
      std::make_shared<FakeEngine>(EngineType::Ocr, kGoodText, 0.9));

  PageLayout layout = layoutFor(1, PageClassification::RasterNeeded);
  Warnings warnings;
  ExtractionResult result = extractor.extractPage(
      inputFor(layout), layout, std::nullopt, EngineBudget{true, true, true},
      warnings);
  EXPECT_FALSE(result.failed);
  EXPECT_EQ(result.engineUsed, EngineType::Ocr);
}

TEST(TextExtractorTest, ThrowingEngineDegradesOnlyItsPages) {
  TextExtractor extractor(singleWorker());
  extractor.setEngine(std::make_shared<FakeEngine>(EngineType::Native,
                                                   kGoodText, 0.9));
  extractor.setEngine(std::make_shared<FakeEngine>(EngineType::Ocr, "", 0.0,
                                                   true, true, true));

  std::vector<PageLayout> layouts = {
      layoutFor(1, PageClassification::Native),
      layoutFor(2, PageClassification::RasterNeeded),
      layoutFor(3, PageClassification::Native)};

  ExtractionReport report =
      extractor.extract(nullptr, layouts, {}, ExtractionContext());
  ASSERT_EQ(report.pages.size(), 3u);
  EXPECT_FALSE(report.pages[0].failed);
  EXPECT_FALSE(report.pages[2].failed);
  EXPECT_EQ(report.pages[0].text, kGoodText);

  // OCR throws, the text layer fallback still reads the page
  EXPECT_EQ(report.pages[1].engineUsed, EngineType::Native);
  EXPECT_NE(report.taggedDocument.find("[[PAGE_003]]"), std::string::npos);
}

TEST(TextExtractorTest, EveryEngineThrowingFailsThePage) {
  TextExtractor extractor(singleWorker());
  extractor.setEngine(std::make_shared<FakeEngine>(EngineType::Native, "", 0.0,
                                                   true, true, true));
  extractor.setEngine(std::make_shared<FakeEngine>(EngineType::Ocr, "", 0.0,
                                                   true, true, true));

  std::vector<PageLayout> layouts = {
      layoutFor(1, PageClassification::RasterNeeded),
      layoutFor(2, PageClassification::RasterNeeded)};

  ExtractionReport report =
      extractor.extract(nullptr, layouts, {}, ExtractionContext());
  ASSERT_EQ(report.pages.size(), 2u);
  int degraded = 0;
  for (const auto &warning : report.warnings) {
    degraded += warning.kind == WarningKind::PageDegraded ? 1 : 0;
  }
  EXPECT_EQ(degraded, 2);
  for (const auto &page : report.pages) {
    EXPECT_TRUE(page.failed);
  }
  EXPECT_NE(report.taggedDocument.find("## [[PAGE_002]] [TYPE: NONE]"),
            std::string::npos);
}

TEST(TextExtractorTest, ContextStoreHintsAndLearns) {
  std::string path =
      (std::filesystem::temp_directory_path() / "lext_extractor_store.db")
          .string();
  auto removeFiles = [&path]() {
    std::error_code ec;
    for (const char *suffix : {"", "-wal", "-shm"}) {
      std::filesystem::remove(path + suffix, ec);
    }
  };
  removeFiles();

  ContextStoreConfig storeConfig;
  storeConfig.databasePath = path;
  {
    ContextStore store(storeConfig);
    ExtractionContext context;
    context.caseId = store.getOrCreateCase("0001234-56.2024.8.26.0100", "ESAJ").id;

    TextExtractor extractor(singleWorker());
    extractor.setPatternAdvisor(&store, storeConfig);
    extractor.setEngine(std::make_shared<FakeEngine>(EngineType::Native,
                                                     kGoodText, 0.9));
    extractor.setEngine(
        std::make_shared<FakeEngine>(EngineType::Ocr, kGoodText, 0.9));

    std::vector<PageLayout> layouts = {
        layoutFor(1, PageClassification::RasterNeeded)};
    PageSignature signature =
        computeSignature(layouts[0], storeConfig.bucketStep);
    PatternKind kind = inferPatternKind(layouts[0]);

    // First sighting: OCR reads the page and the store learns it
    ExtractionReport first = extractor.extract(nullptr, layouts, {}, context);
    EXPECT_FALSE(first.pages[0].hintUsed);
    auto learned = store.findSimilarPattern(*context.caseId,
                                            signature.features, kind);
    ASSERT_TRUE(learned.has_value());
    EXPECT_EQ(learned->suggestedEngine, EngineType::Ocr);
    EXPECT_EQ(learned->occurrenceCount, 1);

    // The hint pins OCR although the ML tier is now affordable
    auto ml = std::make_shared<FakeEngine>(EngineType::MlLayout, kGoodText, 0.95);
    extractor.setEngine(ml);
    ExtractionReport second = extractor.extract(nullptr, layouts, {}, context);
    EXPECT_TRUE(second.pages[0].hintUsed);
    EXPECT_EQ(second.pages[0].engineUsed, EngineType::Ocr);
    EXPECT_EQ(ml->calls.load(), 0);
    EXPECT_EQ(store.findSimilarPattern(*context.caseId, signature.features, kind)
                  ->occurrenceCount,
              2);
    EXPECT_EQ(store.divergenceCount(learned->patternId).value_or(-1), 0);

    // OCR degrades, escalation to ML wins and contradicts the hint
    extractor.setEngine(std::make_shared<FakeEngine>(
        EngineType::Ocr, "V#s ~~ ^^ @@ e|x", 0.5));
    ExtractionReport third = extractor.extract(nullptr, layouts, {}, context);
    EXPECT_TRUE(third.pages[0].hintUsed);
    EXPECT_TRUE(third.pages[0].escalated);
    EXPECT_EQ(third.pages[0].engineUsed, EngineType::MlLayout);
    EXPECT_EQ(store.divergenceCount(learned->patternId).value_or(-1), 1);
    EXPECT_EQ(store.storedEngine(learned->patternId).value_or(EngineType::Native),
              EngineType::MlLayout);
    EXPECT_EQ(store.patternCount(*context.caseId), 1);
  }
  removeFiles();
}
