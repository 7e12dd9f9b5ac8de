#include "lext/TextUtils.hpp"

#include <cctype>

namespace lext {
namespace text {

namespace {

// ASCII replacements for U+00C0..U+00FF
const char *const kLatin1Fold[64] = {
    "A", "A", "A", "A", "A", "A", "AE", "C", "E", "E", "E", "E", "I",
    "I", "I", "I", "D", "N", "O", "O", "O", "O", "O", "x", "O", "U",
    "U", "U", "U", "Y", "TH", "ss", "a", "a", "a", "a", "a", "a", "ae",
    "c", "e", "e", "e", "e", "i", "i", "i", "i", "d", "n", "o", "o",
    "o", "o", "o", "/", "o", "u", "u", "u", "u", "y", "th", "y"};

bool isSpaceByte(unsigned char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' ||
         c == '\v';
}

} // anonymous namespace

std::string foldAccents(const std::string &input) {
  std::string out;
  out.reserve(input.size());

  for (size_t i = 0; i < input.size(); ++i) {
    unsigned char c = static_cast<unsigned char>(input[i]);
    if (c < 0x80 || i + 1 >= input.size()) {
      out.push_back(static_cast<char>(c));
      continue;
    }

    unsigned char next = static_cast<unsigned char>(input[i + 1]);
    if (c == 0xC3 && next >= 0x80 && next <= 0xBF) {
      out += kLatin1Fold[next - 0x80];
      ++i;
    } else if (c == 0xC2 && next == 0xA0) {
      out.push_back(' ');
      ++i;
    } else if (c == 0xC2 && (next == 0xBA || next == 0xB0)) {
      out.push_back('o');
      ++i;
    } else if (c == 0xC2 && next == 0xAA) {
      out.push_back('a');
      ++i;
    } else if ((c == 0xCC && next >= 0x80) || (c == 0xCD && next <= 0xAF)) {
      // U+0300..U+036F combining marks
      ++i;
    } else {
      out.push_back(static_cast<char>(c));
    }
  }

  return out;
}

std::string toUpperAscii(const std::string &input) {
  std::string out = input;
  for (char &c : out) {
    unsigned char u = static_cast<unsigned char>(c);
    if (u < 0x80) {
      c = static_cast<char>(std::toupper(u));
    }
  }
  return out;
}

std::string toLowerAscii(const std::string &input) {
  std::string out = input;
  for (char &c : out) {
    unsigned char u = static_cast<unsigned char>(c);
    if (u < 0x80) {
      c = static_cast<char>(std::tolower(u));
    }
  }
  return out;
}

std::string collapseWhitespace(const std::string &input) {
  std::string out;
  out.reserve(input.size());
  bool pendingSpace = false;

  for (char c : input) {
    if (isSpaceByte(static_cast<unsigned char>(c))) {
      pendingSpace = !out.empty();
      continue;
    }
    if (pendingSpace) {
      out.push_back(' ');
      pendingSpace = false;
    }
    out.push_back(c);
  }

  return out;
}

std::string trim(const std::string &input) {
  size_t begin = 0;
  size_t end = input.size();
  while (begin < end && isSpaceByte(static_cast<unsigned char>(input[begin]))) {
    ++begin;
  }
  while (end > begin && isSpaceByte(static_cast<unsigned char>(input[end - 1]))) {
    --end;
  }
  return input.substr(begin, end - begin);
}

std::vector<std::string> splitLines(const std::string &input) {
  std::vector<std::string> lines;
  size_t start = 0;

  while (start <= input.size()) {
    size_t end = input.find('\n', start);
    if (end == std::string::npos) {
      end = input.size();
    }
    std::string line = input.substr(start, end - start);
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    lines.push_back(line);
    start = end + 1;
  }

  return lines;
}

std::string comparisonForm(const std::string &input) {
  return toLowerAscii(collapseWhitespace(foldAccents(input)));
}

bool semanticEqual(const std::string &a, const std::string &b) {
  return comparisonForm(a) == comparisonForm(b);
}

size_t utf8Length(const std::string &input) {
  size_t count = 0;
  for (char c : input) {
    if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) {
      ++count;
    }
  }
  return count;
}

std::string escapeRegex(const std::string &input) {
  static const std::string kSpecial = R"(\^$.|?*+()[]{})";
  std::string out;
  out.reserve(input.size() * 2);
  for (char c : input) {
    if (kSpecial.find(c) != std::string::npos) {
      out.push_back('\\');
    }
    out.push_back(c);
  }
  return out;
}

} // namespace text
} // namespace lext
