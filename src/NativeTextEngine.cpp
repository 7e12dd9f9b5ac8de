#include "lext/NativeTextEngine.hpp"
#include "lext/Log.hpp"
#include "lext/TextUtils.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>

namespace lext {

namespace {

struct TextLine {
  double yCenter = 0.0;
  double height = 0.0;
  std::vector<TextBox> words;
};

double centerY(const TextBox &box) { return box.box.y + box.box.height / 2.0; }

} // anonymous namespace

std::vector<TextBox> filterToRegion(const std::vector<TextBox> &boxes,
                                    const PageRect &region) {
  std::vector<TextBox> kept;
  kept.reserve(boxes.size());
  for (const auto &box : boxes) {
    if (region.contains(box.box)) {
      kept.push_back(box);
    }
  }
  return kept;
}

std::string assembleLines(const std::vector<TextBox> &boxes) {
  std::vector<TextBox> sorted = boxes;
  std::stable_sort(sorted.begin(), sorted.end(),
                   [](const TextBox &a, const TextBox &b) {
                     return centerY(a) < centerY(b);
                   });

  std::vector<TextLine> lines;
  for (const auto &box : sorted) {
    if (!lines.empty()) {
      TextLine &line = lines.back();
      // Use half the smaller height as tolerance
      double tolerance =
          std::max(2.0, std::min(line.height, box.box.height) / 2.0);
      if (std::abs(centerY(box) - line.yCenter) <= tolerance) {
        line.words.push_back(box);
        line.height = std::max(line.height, box.box.height);
        continue;
      }
    }
    TextLine line;
    line.yCenter = centerY(box);
    line.height = box.box.height;
    line.words.push_back(box);
    lines.push_back(line);
  }

  std::string text;
  for (size_t i = 0; i < lines.size(); ++i) {
    auto &words = lines[i].words;
    std::sort(words.begin(), words.end(),
              [](const TextBox &a, const TextBox &b) { return a.box.x < b.box.x; });

    std::string lineText;
    for (size_t w = 0; w < words.size(); ++w) {
      lineText += words[w].text;
      if (w + 1 < words.size()) {
        double gap = words[w + 1].box.x - words[w].box.right();
        if (words[w].spaceAfter || gap > 1.0) {
          lineText += " ";
        }
      }
    }

    text += text::trim(lineText);
    if (i + 1 < lines.size()) {
      text += "\n";
    }
  }

  return text;
}

NativeTextEngine::NativeTextEngine(int minTextChars)
    : m_minTextChars(std::max(1, minTextChars)) {}

double NativeTextEngine::scoreText(const std::string &text) const {
  size_t chars = text::utf8Length(text);
  if (chars == 0) {
    return 0.0;
  }

  // U+FFFD and stray control bytes mark glyphs Poppler could not map
  size_t garbled = 0;
  for (size_t i = 0; i < text.size(); ++i) {
    unsigned char c = static_cast<unsigned char>(text[i]);
    if (c < 0x20 && c != '\n' && c != '\t') {
      ++garbled;
    } else if (c == 0xEF && i + 2 < text.size() &&
               static_cast<unsigned char>(text[i + 1]) == 0xBF &&
               static_cast<unsigned char>(text[i + 2]) == 0xBD) {
      ++garbled;
      i += 2;
    }
  }

  double coverage = std::min(1.0, static_cast<double>(chars) / m_minTextChars);
  double clean = 1.0 - static_cast<double>(garbled) / static_cast<double>(chars);
  return engineQuality(EngineType::Native) * coverage * clean;
}

EngineOutput NativeTextEngine::extract(const PageInput &input) {
  EngineOutput output;
  auto startTime = std::chrono::high_resolution_clock::now();

  if (input.document == nullptr) {
    output.errorMessage = "Native extraction needs the PDF document";
    return output;
  }

  try {
    std::vector<TextBox> boxes = input.document->textBoxes(input.pageNumber);
    std::vector<TextBox> inside = filterToRegion(boxes, input.region);
    log::debug("Page ", input.pageNumber, ": ", inside.size(), " of ",
               boxes.size(), " words inside the trustworthy region");

    output.text = assembleLines(inside);
    output.confidence = scoreText(output.text);
    output.success = true;
  } catch (const std::exception &e) {
    output.errorMessage = std::string("Native extraction failed: ") + e.what();
  }

  auto endTime = std::chrono::high_resolution_clock::now();
  output.processingTimeMs =
      std::chrono::duration<double, std::milli>(endTime - startTime).count();
  return output;
}

} // namespace lext
