#include "lext/Pipeline.hpp"
#include "lext/Log.hpp"
#include "lext/MlLayoutEngine.hpp"
#include "lext/NativeTextEngine.hpp"
#include "lext/OcrEngine.hpp"
#include "lext/PdfDocument.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>

namespace lext {

namespace fs = std::filesystem;

Pipeline::Pipeline(const PipelineConfig &config)
    : m_config(config), m_layout(config.layout),
      m_sanitizer(config.sanitizer), m_extractor(config.extractor),
      m_classifier(std::make_unique<PatternClassifier>(config.classifier)) {
  m_extractor.setEngine(
      std::make_shared<NativeTextEngine>(config.layout.minTextChars));
  m_extractor.setEngine(std::make_shared<TesseractEngine>(config.extractor));
  m_extractor.setEngine(MlLayoutEngine::shared(config.extractor));

  if (m_config.useContextStore) {
    openContextStore();
  }
}

Pipeline::~Pipeline() = default;

void Pipeline::openContextStore() {
  try {
    m_store = std::make_unique<ContextStore>(m_config.contextStore);
    m_extractor.setPatternAdvisor(m_store.get(), m_config.contextStore);
  } catch (const ContextStoreError &e) {
    log::error("Context Store disabled: ", e.what());
    m_store.reset();
    m_extractor.setPatternAdvisor(nullptr, m_config.contextStore);
  }
}

void Pipeline::setClassifier(std::unique_ptr<DocumentClassifier> classifier) {
  if (classifier) {
    m_classifier = std::move(classifier);
  }
}

void Pipeline::setEngine(std::shared_ptr<ExtractionEngine> engine) {
  m_extractor.setEngine(std::move(engine));
}

void Pipeline::writeText(const std::string &path, const std::string &content,
                         PipelineResult &result) const {
  std::ofstream out(path);
  if (!out) {
    log::error("Cannot write ", path);
    return;
  }
  out << content;
  if (!out.good()) {
    log::error("Write failed: ", path);
    return;
  }
  result.artifacts.push_back(path);
}

PipelineResult Pipeline::run(const std::string &pdfPath,
                             const RunOptions &options) {
  auto startTime = std::chrono::high_resolution_clock::now();
  PipelineResult result;

  auto finish = [&]() {
    auto endTime = std::chrono::high_resolution_clock::now();
    result.processingTimeMs =
        std::chrono::duration<double, std::milli>(endTime - startTime).count();
  };

  try {
    PdfDocument document(pdfPath);

    // Stage 1: layout
    LayoutReport layout = m_layout.analyze(document, options.systemOverride);
    result.docId = layout.docId;
    result.system = layout.system;
    result.layouts = layout.pages;
    result.warnings.insert(result.warnings.end(), layout.warnings.begin(),
                           layout.warnings.end());

    fs::path outDir = fs::path(m_config.outputDirectory) / result.docId;
    std::error_code ec;
    fs::create_directories(outDir, ec);
    if (ec) {
      result.errorMessage =
          "Cannot create output directory " + outDir.string() + ": " +
          ec.message();
      finish();
      return result;
    }
    result.outputDirectory = outDir.string();

    std::string layoutPath = (outDir / "layout.json").string();
    if (LayoutAnalyzer::saveJson(layout, layoutPath)) {
      result.artifacts.push_back(layoutPath);
    }

    // Stage 2: sanitize raster pages
    SanitizerReport images =
        m_sanitizer.process(document, layout.pages,
                            (outDir / "images").string(),
                            m_config.layout.workers);
    result.warnings.insert(result.warnings.end(), images.warnings.begin(),
                           images.warnings.end());
    for (const auto &entry : images.imagePaths) {
      result.artifacts.push_back(entry.second);
    }

    // Stage 3: extraction
    ExtractionContext context;
    context.imageDpi = m_sanitizer.getConfig().renderDpi;
    context.cleaning.systemCode = layout.system.code;
    context.cleaning.exclusionWords = options.exclusionWords;
    context.cleaning.maskPii = options.maskPii;

    if (m_store && !options.caseId.empty()) {
      try {
        CaseRecord record =
            m_store->getOrCreateCase(options.caseId, layout.system.code);
        context.caseId = record.id;
      } catch (const ContextStoreError &e) {
        log::error("Context Store unavailable for case ", options.caseId,
                   ": ", e.what());
      }
    }

    ExtractionReport extraction =
        m_extractor.extract(&document, layout.pages, images.images, context);
    result.pages = extraction.pages;
    result.warnings.insert(result.warnings.end(), extraction.warnings.begin(),
                           extraction.warnings.end());
    writeText((outDir / "final.md").string(), extraction.taggedDocument, result);

    // Stage 4: classification
    ClassificationResult classification =
        m_classifier->classify(extraction.taggedDocument, result.docId);
    result.sections = classification.sections;
    result.warnings.insert(result.warnings.end(),
                           classification.warnings.begin(),
                           classification.warnings.end());

    std::string structurePath = (outDir / "semantic_structure.json").string();
    if (saveJson(classification, structurePath)) {
      result.artifacts.push_back(structurePath);
    }
    writeText((outDir / "semantic.md").string(),
              tagDocument(extraction.taggedDocument, classification), result);

    result.success = true;
  } catch (const DocumentError &e) {
    result.errorMessage = e.what();
    log::error("Document failed: ", pdfPath, ": ", e.what());
  }

  finish();
  log::info("Pipeline ", result.success ? "finished" : "failed", " for ",
            pdfPath, " in ", result.processingTimeMs, " ms (",
            result.warnings.size(), " warnings)");
  return result;
}

} // namespace lext
