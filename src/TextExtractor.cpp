#include "lext/TextExtractor.hpp"
#include "lext/Log.hpp"
#include "lext/Signature.hpp"
#include "lext/TextUtils.hpp"
#include "lext/WorkerPool.hpp"

#include <algorithm>
#include <chrono>
#include <cctype>
#include <cstdio>
#include <cstring>
#include <exception>
#include <mutex>
#include <set>

namespace lext {

namespace {

constexpr double kDenseShare = 0.6;
constexpr const char *kEmptyPage = "(página vazia)";
constexpr const char *kPunctuation = ".,;:!?()[]\"'-/%$&@#*+=<>_";

PageRect intersect(const PageRect &a, const PageRect &b) {
  double left = std::max(a.x, b.x);
  double top = std::max(a.y, b.y);
  double right = std::min(a.right(), b.right());
  double bottom = std::min(a.bottom(), b.bottom());
  if (right <= left || bottom <= top) {
    return PageRect{};
  }
  return PageRect{left, top, right - left, bottom - top};
}

// Code point classes for scoring; any non-ASCII code point counts as a letter
struct CodePointCounts {
  size_t total = 0;
  size_t alnum = 0;
  size_t artifacts = 0;
};

CodePointCounts countCodePoints(const std::string &token) {
  CodePointCounts counts;
  for (char ch : token) {
    unsigned char c = static_cast<unsigned char>(ch);
    if ((c & 0xC0) == 0x80) {
      continue; // continuation byte
    }
    ++counts.total;
    if (std::isalnum(c) || c >= 0xC0) {
      ++counts.alnum;
    } else if (std::strchr(kPunctuation, c) == nullptr) {
      ++counts.artifacts;
    }
  }
  return counts;
}

} // anonymous namespace

TextExtractor::TextExtractor(const ExtractorConfig &config)
    : m_config(config), m_selector(), m_cleaner() {}

void TextExtractor::setEngine(std::shared_ptr<ExtractionEngine> engine) {
  if (engine) {
    EngineType type = engine->type();
    m_engines[type] = std::move(engine);
  }
}

void TextExtractor::setPatternAdvisor(PatternAdvisor *advisor,
                                      const ContextStoreConfig &storeConfig) {
  m_advisor = advisor;
  m_storeConfig = storeConfig;
  m_selector = EngineSelector(storeConfig.similarityThreshold,
                              storeConfig.hintMinConfidence);
}

ExtractionEngine *TextExtractor::engineFor(EngineType type) const {
  auto it = m_engines.find(type);
  return it == m_engines.end() ? nullptr : it->second.get();
}

EngineBudget TextExtractor::probeEngines(Warnings &warnings) {
  EngineBudget budget;

  auto probe = [&](EngineType type, bool required) {
    ExtractionEngine *engine = engineFor(type);
    bool available = engine != nullptr && engine->isAvailable();
    if (!available && required) {
      warnings.push_back(makeWarning(WarningKind::EngineUnavailable, 0,
                                     toString(type) + " engine unavailable"));
    } else if (!available) {
      log::info(toString(type), " engine not available for this run");
    }
    return available;
  };

  budget.native = probe(EngineType::Native, true);
  budget.ocr = probe(EngineType::Ocr, true);
  budget.mlLayout = probe(EngineType::MlLayout, !m_config.mlModelPath.empty());
  return budget;
}

std::optional<TextExtractor::Attempt>
TextExtractor::runEngine(EngineType type, const PageInput &input,
                         ExtractionResult &result) {
  ExtractionEngine *engine = engineFor(type);
  if (engine == nullptr) {
    return std::nullopt;
  }

  result.fallbackChain.push_back(type);
  EngineOutput output;
  try {
    output = engine->extract(input);
  } catch (const std::exception &e) {
    output.success = false;
    output.errorMessage = e.what();
  }
  if (!output.success) {
    log::warn("Page ", input.pageNumber, ": ", toString(type),
              " engine failed: ", output.errorMessage);
    return std::nullopt;
  }

  output.confidence = std::clamp(output.confidence, 0.0, 1.0);
  log::debug("Page ", input.pageNumber, ": ", toString(type), " confidence ",
             output.confidence, " in ", output.processingTimeMs, " ms");
  return Attempt{type, std::move(output)};
}

ExtractionResult TextExtractor::extractPage(const PageInput &input,
                                            const PageLayout &layout,
                                            const std::optional<PatternHint> &hint,
                                            const EngineBudget &budget,
                                            Warnings &warnings) {
  auto startTime = std::chrono::high_resolution_clock::now();

  ExtractionResult result;
  result.pageNumber = layout.pageNumber;

  EngineChoice choice = m_selector.select(layout, hint, budget);
  warnings.insert(warnings.end(), choice.warnings.begin(), choice.warnings.end());
  result.engineUsed = choice.engine;

  PageInput pageInput = input;
  if (choice.fromHint) {
    result.hintUsed = true;
    if (choice.region) {
      PageRect region = intersect(*choice.region, layout.trustworthyRegion);
      if (!region.empty() && region != pageInput.region) {
        pageInput.region = region;
        pageInput.image = cv::Mat(); // the sanitized image covers another region
      }
    }
  }

  // First successful engine, falling back one tier at a time
  std::set<EngineType> tried;
  std::optional<Attempt> best;
  std::optional<EngineType> current = choice.engine;
  while (current && !tried.count(*current)) {
    tried.insert(*current);
    if (budget.allows(*current)) {
      best = runEngine(*current, pageInput, result);
      if (best) {
        break;
      }
    }
    std::optional<EngineType> lower = m_selector.lowerTier(*current, budget);
    if (lower && !tried.count(*lower)) {
      warnings.push_back(makeWarning(WarningKind::EngineUnavailable,
                                     layout.pageNumber,
                                     toString(*current) + " failed, falling back to " +
                                         toString(*lower)));
    }
    current = lower;
  }

  if (!best) {
    result.failed = true;
    result.text.clear();
    result.confidence = 0.0;
    result.needsReview = true;
    warnings.push_back(makeWarning(WarningKind::PageDegraded, layout.pageNumber,
                                   "no engine produced text"));
  } else {
    double bestScore = similarityScore(best->output.text);

    if (best->output.confidence < m_config.confidenceThreshold) {
      std::optional<EngineType> next = m_selector.nextTier(best->engine, budget);
      if (next && !tried.count(*next)) {
        tried.insert(*next);
        log::debug("Page ", layout.pageNumber, ": escalating ",
                   toString(best->engine), " -> ", toString(*next));

        std::optional<Attempt> higher = runEngine(*next, pageInput, result);
        if (higher) {
          result.escalated = true;
          double higherScore = similarityScore(higher->output.text);
          // Ties go to the higher tier
          if (higherScore >= bestScore) {
            best = std::move(higher);
            bestScore = higherScore;
          }
        }
      }
    }

    result.engineUsed = best->engine;
    result.text = best->output.text;
    result.confidence = best->output.confidence;
    result.similarityScore = bestScore;
    result.needsReview = result.confidence < m_config.reviewThreshold;
  }

  auto endTime = std::chrono::high_resolution_clock::now();
  result.processingTimeMs =
      std::chrono::duration<double, std::milli>(endTime - startTime).count();
  return result;
}

ExtractionReport TextExtractor::extract(const PdfDocument *document,
                                        const std::vector<PageLayout> &layouts,
                                        const std::map<int, cv::Mat> &images,
                                        const ExtractionContext &context) {
  auto startTime = std::chrono::high_resolution_clock::now();
  ExtractionReport report;
  report.pages.resize(layouts.size());

  EngineBudget budget = probeEngines(report.warnings);

  bool hasDeadline = m_config.timeoutSeconds > 0.0;
  auto deadline =
      startTime + std::chrono::duration_cast<std::chrono::high_resolution_clock::duration>(
                      std::chrono::duration<double>(m_config.timeoutSeconds));

  PatternAdvisor *advisor = context.caseId ? m_advisor : nullptr;
  std::mutex reportMutex;
  bool timedOut = false;

  parallelFor(layouts.size(), m_config.workers, [&](size_t i) {
    const PageLayout &layout = layouts[i];
    Warnings pageWarnings;
    ExtractionResult result;

    if (hasDeadline && std::chrono::high_resolution_clock::now() > deadline) {
      result.pageNumber = layout.pageNumber;
      result.failed = true;
      result.needsReview = true;
      pageWarnings.push_back(makeWarning(WarningKind::PageDegraded,
                                         layout.pageNumber,
                                         "document timeout reached"));
      std::lock_guard<std::mutex> lock(reportMutex);
      timedOut = true;
      report.pages[i] = result;
      report.warnings.insert(report.warnings.end(), pageWarnings.begin(),
                             pageWarnings.end());
      return;
    }

    PageInput input;
    input.pageNumber = layout.pageNumber;
    input.document = document;
    input.region = layout.trustworthyRegion;
    input.imageDpi = context.imageDpi;
    auto image = images.find(layout.pageNumber);
    if (image != images.end()) {
      input.image = image->second;
    }

    bool learns = advisor != nullptr &&
                  layout.classification == PageClassification::RasterNeeded;
    PageSignature signature;
    PatternKind kind = PatternKind::Unknown;
    std::optional<PatternHint> hint;

    if (learns) {
      signature = computeSignature(layout, m_storeConfig.bucketStep);
      kind = inferPatternKind(layout);
      try {
        hint = advisor->findSimilarPattern(*context.caseId, signature.features,
                                           kind);
      } catch (const ContextStoreError &e) {
        log::warn("Page ", layout.pageNumber, ": hint lookup failed: ", e.what());
      }
    }

    try {
      result = extractPage(input, layout, hint, budget, pageWarnings);
    } catch (const std::exception &e) {
      log::error("Page ", layout.pageNumber, " extraction failed: ", e.what());
      result = ExtractionResult();
      result.pageNumber = layout.pageNumber;
      result.failed = true;
      result.needsReview = true;
      pageWarnings.push_back(makeWarning(
          WarningKind::PageDegraded, layout.pageNumber,
          std::string("extraction failed: ") + e.what()));
    }

    if (learns && !result.failed) {
      PageObservation observation;
      observation.pageNumber = layout.pageNumber;
      observation.kind = kind;
      observation.engineUsed = result.engineUsed;
      observation.confidence = result.confidence;
      observation.region = layout.trustworthyRegion;
      if (result.hintUsed && hint && hint->suggestedRegion) {
        PageRect hinted = intersect(*hint->suggestedRegion, layout.trustworthyRegion);
        if (!hinted.empty()) {
          observation.region = hinted;
        }
      }
      try {
        advisor->learnFromPage(*context.caseId, signature, observation,
                               result.hintUsed ? hint : std::nullopt);
      } catch (const ContextStoreError &e) {
        log::warn("Page ", layout.pageNumber, ": learning skipped: ", e.what());
      }
    }

    if (m_config.applyCleaning && !result.text.empty()) {
      try {
        result.text = m_cleaner.clean(result.text, context.cleaning).text;
      } catch (const std::exception &e) {
        log::warn("Page ", layout.pageNumber, ": cleaning skipped: ", e.what());
      }
    }

    std::lock_guard<std::mutex> lock(reportMutex);
    report.pages[i] = std::move(result);
    report.warnings.insert(report.warnings.end(), pageWarnings.begin(),
                           pageWarnings.end());
  });

  report.timedOut = timedOut;
  report.taggedDocument = buildTaggedDocument(report.pages);

  auto endTime = std::chrono::high_resolution_clock::now();
  report.processingTimeMs =
      std::chrono::duration<double, std::milli>(endTime - startTime).count();

  log::info("Extracted ", report.pages.size(), " pages in ",
            report.processingTimeMs, " ms");
  return report;
}

double TextExtractor::similarityScore(const std::string &text) {
  size_t dense = 0;
  size_t symbols = 0;
  size_t characters = 0;

  std::string token;
  auto flush = [&]() {
    if (token.empty()) {
      return;
    }
    CodePointCounts counts = countCodePoints(token);
    characters += counts.total;
    symbols += counts.artifacts;
    if (counts.total >= 2 &&
        static_cast<double>(counts.alnum) >= kDenseShare * counts.total) {
      ++dense;
    }
    token.clear();
  };

  for (char c : text) {
    if (std::isspace(static_cast<unsigned char>(c))) {
      flush();
    } else {
      token += c;
    }
  }
  flush();

  if (characters == 0) {
    return 0.0;
  }
  double artifactRatio =
      static_cast<double>(symbols) / static_cast<double>(characters);
  return static_cast<double>(dense) * (1.0 - artifactRatio);
}

std::string TextExtractor::pageMarker(const ExtractionResult &page) {
  char marker[96];
  std::snprintf(marker, sizeof(marker), "## [[PAGE_%03d]] [TYPE: %s] [CONF: %.2f]",
                page.pageNumber,
                page.failed ? "NONE" : markerLabel(page.engineUsed).c_str(),
                page.confidence);
  return marker;
}

std::string TextExtractor::buildTaggedDocument(
    const std::vector<ExtractionResult> &pages) {
  std::string document;
  for (size_t i = 0; i < pages.size(); ++i) {
    if (i > 0) {
      document += "\n\n";
    }
    document += pageMarker(pages[i]);
    document += "\n";
    std::string body = text::trim(pages[i].text);
    document += body.empty() ? kEmptyPage : body;
  }
  document += "\n";
  return document;
}

} // namespace lext
