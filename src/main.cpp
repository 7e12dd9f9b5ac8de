#include "lext/Config.hpp"
#include "lext/Log.hpp"
#include "lext/OcrEngine.hpp"
#include "lext/Pipeline.hpp"

#include <opencv2/core/version.hpp>

#include <exception>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

void printUsage(const char *programName) {
  std::cout
      << "Usage: " << programName << " <pdf_path> [options]\n"
      << "\nOptions:\n"
      << "  -o, --output <dir>      Output directory (default: output)\n"
      << "  --case <id>             Case id for the Context Store\n"
      << "  --system <code>         Issuing system (PJE, ESAJ, EPROC, ...)\n"
      << "  --exclude <w1,w2,...>   Words removed from the extracted text\n"
      << "  --mask-pii              Mask CPF, CNPJ, e-mail and phone numbers\n"
      << "  -l, --lang <lang>       OCR language (default: por)\n"
      << "  --workers <n>           Parallel page workers (default: 4)\n"
      << "  --ml-model <dir>        tessdata directory of the ML tier\n"
      << "  --db <path>             Context Store database\n"
      << "  --no-context            Do not use the Context Store\n"
      << "  --timeout <seconds>     Extraction deadline per document\n"
      << "  --mode <auto|digital|photo|ocr>  Image sanitizer preset\n"
      << "  -v, --verbose           Debug logging\n"
      << "  -h, --help              Show this help message\n"
      << "\nExamples:\n"
      << "  " << programName << " processo.pdf\n"
      << "  " << programName
      << " processo.pdf --case 0001234-56.2024.8.26.0100 --system ESAJ\n"
      << "  " << programName << " scan.pdf --mode photo --exclude Fulano,Beltrano\n";
}

std::vector<std::string> splitList(const std::string &value) {
  std::vector<std::string> items;
  std::stringstream stream(value);
  std::string item;
  while (std::getline(stream, item, ',')) {
    if (!item.empty()) {
      items.push_back(item);
    }
  }
  return items;
}

} // namespace

int main(int argc, char *argv[]) {
  if (argc < 2) {
    printUsage(argv[0]);
    return 1;
  }

  lext::PipelineConfig config;
  lext::applyEnvironment(config);
  lext::RunOptions options;
  std::string pdfPath;

  // Parse command line arguments
  try {
    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      auto value = [&](const char *name) -> std::string {
        if (i + 1 >= argc) {
          throw std::invalid_argument(std::string(name) +
                                      " requires an argument");
        }
        return argv[++i];
      };

      if (arg == "-h" || arg == "--help") {
        printUsage(argv[0]);
        return 0;
      } else if (arg == "-o" || arg == "--output") {
        config.outputDirectory = value("--output");
      } else if (arg == "--case") {
        options.caseId = value("--case");
      } else if (arg == "--system") {
        options.systemOverride = value("--system");
      } else if (arg == "--exclude") {
        options.exclusionWords = splitList(value("--exclude"));
      } else if (arg == "--mask-pii") {
        options.maskPii = true;
      } else if (arg == "-l" || arg == "--lang") {
        config.extractor.language = value("--lang");
      } else if (arg == "--workers") {
        int workers = std::stoi(value("--workers"));
        if (workers < 1) {
          throw std::invalid_argument("--workers must be at least 1");
        }
        config.layout.workers = workers;
        config.extractor.workers = workers;
      } else if (arg == "--ml-model") {
        config.extractor.mlModelPath = value("--ml-model");
      } else if (arg == "--db") {
        config.contextStore.databasePath = value("--db");
      } else if (arg == "--no-context") {
        config.useContextStore = false;
      } else if (arg == "--timeout") {
        config.extractor.timeoutSeconds = std::stod(value("--timeout"));
      } else if (arg == "--mode") {
        std::string mode = value("--mode");
        if (mode == "auto") {
          config.sanitizer.mode = lext::SanitizerMode::Auto;
        } else if (mode == "digital") {
          config.sanitizer = lext::SanitizerConfig::digitalAggressive();
        } else if (mode == "photo") {
          config.sanitizer = lext::SanitizerConfig::scannedConservative();
        } else if (mode == "ocr") {
          config.sanitizer = lext::SanitizerConfig::ocrOptimized();
        } else {
          throw std::invalid_argument("unknown mode: " + mode);
        }
      } else if (arg == "-v" || arg == "--verbose") {
        lext::log::setLevel(lext::log::Level::Debug);
      } else if (arg[0] != '-') {
        pdfPath = arg;
      } else {
        std::cerr << "Unknown option: " << arg << "\n";
        printUsage(argv[0]);
        return 1;
      }
    }
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }

  if (pdfPath.empty()) {
    std::cerr << "Error: No PDF path provided\n";
    printUsage(argv[0]);
    return 1;
  }

  std::cout << "=== Legal Text Extraction ===\n"
            << "Tesseract version: " << lext::TesseractPool::version() << "\n"
            << "OpenCV version: " << CV_VERSION << "\n"
            << "Language: " << config.extractor.language << "\n"
            << "=============================\n\n";

  lext::Pipeline pipeline(config);
  auto result = pipeline.run(pdfPath, options);

  if (!result.success) {
    std::cerr << "Extraction failed: " << result.errorMessage << "\n";
    return 1;
  }

  std::cout << "Document: " << result.docId << "\n"
            << "System: " << result.system.code << " ("
            << result.system.confidence << "%)\n"
            << "Pages: " << result.pages.size() << "\n\n";

  std::cout << "[Pages]\n";
  std::cout << std::setw(6) << "Page" << std::setw(10) << "Engine"
            << std::setw(8) << "Conf" << "  Flags\n";
  std::cout << std::string(50, '-') << "\n";
  for (const auto &page : result.pages) {
    std::cout << std::setw(6) << page.pageNumber << std::setw(10)
              << (page.failed ? "NONE" : lext::markerLabel(page.engineUsed))
              << std::setw(8) << std::fixed << std::setprecision(2)
              << page.confidence << "  " << (page.escalated ? "escalated " : "")
              << (page.hintUsed ? "hint " : "")
              << (page.needsReview ? "review" : "") << "\n";
  }

  std::cout << "\n[Sections]\n";
  for (const auto &section : result.sections) {
    std::cout << std::setw(3) << section.sectionId << "  " << std::left
              << std::setw(18) << lext::toString(section.type) << std::right
              << " pages " << section.startPage << "-" << section.endPage
              << "  conf " << std::setprecision(2) << section.confidence
              << "\n";
  }

  std::cout << "\nArtifacts: " << result.outputDirectory << "\n";
  std::cout << "Warnings: " << result.warnings.size() << "\n";
  std::cout << "Processing time: " << std::fixed << std::setprecision(2)
            << result.processingTimeMs << " ms\n";

  return 0;
}
