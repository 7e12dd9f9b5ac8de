#include "lext/TextCleaner.hpp"
#include "lext/Log.hpp"
#include "lext/TextUtils.hpp"

#include <cctype>

namespace lext {

namespace {

// Accented letters are matched as alternatives, not character classes,
// because std::regex works on bytes and these are two-byte sequences
const std::string kA = "(?:á|Á|ã|Ã|a)";
const std::string kC = "(?:ç|Ç|c)";
const std::string kE = "(?:ê|Ê|é|É|e)";
const std::string kI = "(?:í|Í|i)";
const std::string kO = "(?:ó|Ó|ô|Ô|o)";
const std::string kOrdinal = "(?:º|°)?";
// Bounded stand-in for a dot-all lazy gap
const std::string kGap = "[\\s\\S]{0,400}?";

void replaceAll(std::string &text, const std::string &from,
                const std::string &to) {
  size_t pos = 0;
  while ((pos = text.find(from, pos)) != std::string::npos) {
    text.replace(pos, from.size(), to);
    pos += to.size();
  }
}

bool isLetterByte(unsigned char c) { return std::isalpha(c) || c >= 0x80; }

bool continuesWord(unsigned char c) { return std::islower(c) || c >= 0x80; }

} // anonymous namespace

TextCleaner::Rule TextCleaner::rule(const std::string &description,
                                    const std::string &pattern) {
  return Rule{description,
              std::regex(pattern, std::regex::ECMAScript | std::regex::icase)};
}

TextCleaner::TextCleaner() {
  m_systemRules["PJE"] = {
      rule("PJE verification code",
           "c" + kO + "digo\\s+de\\s+verifica" + kC + kA +
               "o:\\s*[A-Z0-9]{4}\\.[0-9]{4}\\.[0-9A-Z]{4}\\.[A-Z0-9]{4}"),
      rule("PJE generated-by footer",
           "este\\s+documento\\s+foi\\s+gerado\\s+pelo\\s+usu" + kA + "rio" +
               kGap + "\\d{2}:\\d{2}:\\d{2}"),
      rule("PJE signature stamp",
           "documento\\s+assinado\\s+por\\s+[^\\n]{5,100}\\s+e\\s+certificado"
           "\\s+digitalmente"),
  };
  m_systemLineRules["PJE"] = {
      rule("PJE banner line", "[_\\-=]+\\s*processo\\s+judicial\\s+eletr" + kO +
                                  "nico\\s*[_\\-=]+"),
  };

  m_systemRules["ESAJ"] = {
      rule("ESAJ document code",
           "c" + kO + "digo\\s+do\\s+documento:\\s*[A-Z0-9]{8,20}"),
      rule("ESAJ digital conference notice",
           "confer" + kE + "ncia\\s+de\\s+documento\\s+digital" + kGap +
               "portal\\s+e-saj"),
      rule("ESAJ signature stamp",
           "assinado\\s+digitalmente\\s+por:\\s*[^\\n]{5,80}\\s+data:\\s*"
           "\\d{2}/\\d{2}/\\d{4}"),
      rule("ESAJ resolution reference",
           "resolu" + kC + kA + "o\\s+n?" + kOrdinal + "\\s*552/11"),
  };

  m_systemRules["EPROC"] = {
      rule("EPROC signature link",
           "assinatura\\s+digital\\s+dispon" + kI + "vel\\s+em:\\s*[^\\n]*\\.p7s"),
      rule("EPROC conformity checker",
           "verificador\\s+de\\s+conformidade\\s+(?:iti|icp-brasil)"),
      rule("EPROC electronic signature",
           "assinado\\s+eletronicamente\\s+por" + kGap +
               "certificado\\s+digital\\s+icp-brasil"),
      rule("EPROC byte range", "byterange\\s*\\[\\s*\\d+\\s+\\d+\\s+\\d+\\s+\\d+"
                               "\\s*\\]"),
  };

  m_systemRules["PROJUDI"] = {
      rule("PROJUDI signature stamp",
           "digitalmente\\s+assinado\\s+por" + kGap + "data:\\s*\\d{2}/\\d{2}/\\d{4}"),
      rule("PROJUDI version banner",
           "projudi\\s+-\\s+vers" + kA + "o\\s+\\d+\\.\\d+"),
      rule("PROJUDI signer", "assinador\\s+livre\\s+(?:tjrj|tribunal)"),
  };

  m_systemRules["STF"] = {
      rule("STF consultant CPF",
           "cpf\\s+do\\s+consulente:\\s*\\d{3}\\.\\d{3}\\.\\d{3}-\\d{2}"),
      rule("STF Victor notice",
           "documento\\s+processado\\s+pelo\\s+projeto\\s+victor"),
      rule("STF resolution reference",
           "resolu" + kC + kA + "o\\s+stf\\s+n?" + kOrdinal + "\\s*693/2020"),
  };

  m_systemRules["STJ"] = {
      rule("STJ document code", "c" + kO + "digo:\\s*[A-Z0-9]{16,32}"),
      rule("STJ authentication link",
           "autentique\\s+em:\\s*https?://(?:www\\.)?stj\\.jus\\.br"),
      rule("STJ signer",
           "assinado\\s+por:\\s*[^\\n]{5,80}\\s+-\\s+cpf:\\s*"
           "\\d{3}\\.\\d{3}\\.\\d{3}-\\d{2}"),
      rule("STJ QR code notice", "valide\\s+este\\s+documento\\s+via\\s+qr\\s+code"),
  };

  m_universalRules = {
      rule("page counter", "p" + kA + "gina\\s+\\d+\\s+de\\s+\\d+"),
      rule("folio number", "fls?\\.\\s*\\d+"),
      rule("MP 2.200-2 certification",
           "documento\\s+assinado\\s+digitalmente\\s+conforme\\s+mp\\s+n?" +
               kOrdinal + "\\s*2\\.?200-2/2001"),
      rule("ICP-Brasil mark", "icp-?brasil"),
      rule("jus.br URL", "https?://[^\\s]+\\.jus\\.br[^\\s]*"),
      rule("jus.br host", "[a-z]+\\.[a-z]+\\.jus\\.br\\S*"),
      rule("validation prompt", "validar\\s+documento"),
      rule("verification code",
           "c" + kO + "digo\\s+de\\s+verifica" + kC + kA + "o[:\\s]+[A-Z0-9\\.\\-]+"),
      rule("validate-at prompt", "valide?\\s+em[:\\s]+"),
      rule("signature block", "assinado\\s+por[:\\s]+[^\\n]{5,80}"),
      rule("certificate id", "certificado[:\\s]+[A-Z0-9\\-]+"),
      rule("hash digest", "hash\\s+(?:sha-?256|md5)[:\\s]+[a-f0-9]+"),
      rule("timestamp",
           "data/hora[:\\s]+\\d{2}/\\d{2}/\\d{4}\\s+\\d{2}:\\d{2}(?::\\d{2})?"),
  };

  m_universalLineRules = {
      rule("isolated /validar line", "/validar\\s*"),
      rule("isolated CPF line", "CPF:\\s*\\d{3}\\.\\d{3}\\.\\d{3}-\\d{2}\\s*"),
      rule("corrupted Data/Hora line", "Da\\s*t[aL]/H[oO]r[aA][:\\s,]*"),
      rule("isolated date line", "\\d{2}/\\d{2}/\\d{4}\\s*"),
      rule("isolated time line", "\\d{2}:\\d{2}(?::\\d{2})?\\s*"),
      rule("isolated hex line", "[0-9a-f]{12,32}\\s*"),
  };
}

std::vector<std::string> TextCleaner::supportedSystems() const {
  std::vector<std::string> systems;
  for (const auto &entry : m_systemRules) {
    systems.push_back(entry.first);
  }
  return systems;
}

bool TextCleaner::applyRules(std::string &text, const std::vector<Rule> &rules,
                             std::vector<std::string> &removed) const {
  bool changed = false;
  for (const auto &r : rules) {
    try {
      std::string replaced = std::regex_replace(text, r.regex, "");
      if (replaced != text) {
        text = std::move(replaced);
        removed.push_back(r.description);
        changed = true;
      }
    } catch (const std::regex_error &e) {
      log::warn("Cleaning rule '", r.description, "' skipped: ", e.what());
    }
  }
  return changed;
}

bool TextCleaner::applyLineRules(std::string &text,
                                 const std::vector<Rule> &rules,
                                 std::vector<std::string> &removed) const {
  if (rules.empty()) {
    return false;
  }

  std::vector<std::string> lines = text::splitLines(text);
  bool changed = false;
  for (auto &line : lines) {
    if (line.empty()) {
      continue;
    }
    for (const auto &r : rules) {
      if (std::regex_match(line, r.regex)) {
        removed.push_back(r.description);
        line.clear();
        changed = true;
        break;
      }
    }
  }

  if (changed) {
    std::string joined;
    for (size_t i = 0; i < lines.size(); ++i) {
      if (i > 0) {
        joined += "\n";
      }
      joined += lines[i];
    }
    text = std::move(joined);
  }
  return changed;
}

CleaningResult TextCleaner::clean(const std::string &text,
                                  const CleaningOptions &options) const {
  CleaningResult result;
  result.stats.systemCode =
      options.systemCode.empty() ? "UNKNOWN" : options.systemCode;
  result.stats.originalLength = text::utf8Length(text);

  std::string cleaned = text;
  std::vector<std::string> &removed = result.stats.patternsRemoved;

  // 1. Issuing system
  std::string system = text::toUpperAscii(options.systemCode);
  auto systemRules = m_systemRules.find(system);
  if (systemRules != m_systemRules.end()) {
    applyRules(cleaned, systemRules->second, removed);
  }
  auto lineRules = m_systemLineRules.find(system);
  if (lineRules != m_systemLineRules.end()) {
    applyLineRules(cleaned, lineRules->second, removed);
  }

  // 2. Universal
  applyLineRules(cleaned, m_universalLineRules, removed);
  applyRules(cleaned, m_universalRules, removed);

  // 3. Exclusion words
  for (const auto &word : options.exclusionWords) {
    if (text::trim(word).empty()) {
      continue;
    }
    try {
      std::regex literal(text::escapeRegex(word),
                         std::regex::ECMAScript | std::regex::icase);
      std::string replaced = std::regex_replace(cleaned, literal, "");
      if (replaced != cleaned) {
        cleaned = std::move(replaced);
        removed.push_back("Exclusion: \"" + word + "\"");
      }
    } catch (const std::regex_error &e) {
      log::warn("Exclusion word '", word, "' skipped: ", e.what());
    }
  }

  // 4. Normalization
  cleaned = normalize(cleaned);

  // 5. Personal data
  if (options.maskPii) {
    cleaned = maskPii(cleaned);
  }

  result.text = std::move(cleaned);
  result.stats.finalLength = text::utf8Length(result.text);
  if (result.stats.originalLength > 0) {
    result.stats.reductionPercent =
        100.0 *
        (static_cast<double>(result.stats.originalLength) -
         static_cast<double>(result.stats.finalLength)) /
        static_cast<double>(result.stats.originalLength);
  }
  return result;
}

std::string TextCleaner::normalize(const std::string &text) {
  std::string out;
  out.reserve(text.size());

  // Control characters
  for (char ch : text) {
    unsigned char c = static_cast<unsigned char>(ch);
    if ((c < 0x20 && c != '\n' && c != '\t') || c == 0x7F) {
      continue;
    }
    out += ch;
  }

  // Typographic quotes and dashes
  replaceAll(out, "\xE2\x80\x9C", "\"");
  replaceAll(out, "\xE2\x80\x9D", "\"");
  replaceAll(out, "\xE2\x80\x9E", "\"");
  replaceAll(out, "\xE2\x80\x98", "'");
  replaceAll(out, "\xE2\x80\x99", "'");
  replaceAll(out, "\xE2\x80\x93", "-");
  replaceAll(out, "\xE2\x80\x94", "-");
  replaceAll(out, "\xC2\xA0", " ");

  // Words hyphenated across a line break
  std::string joined;
  joined.reserve(out.size());
  for (size_t i = 0; i < out.size(); ++i) {
    if (out[i] == '-' && i + 1 < out.size() && out[i + 1] == '\n' && i > 0 &&
        i + 2 < out.size() &&
        isLetterByte(static_cast<unsigned char>(out[i - 1])) &&
        continuesWord(static_cast<unsigned char>(out[i + 2]))) {
      ++i; // drop "-\n"
      continue;
    }
    joined += out[i];
  }

  // Blanks: runs of spaces/tabs, trailing blanks, 3+ newlines
  std::string compact;
  compact.reserve(joined.size());
  size_t newlines = 0;
  for (size_t i = 0; i < joined.size(); ++i) {
    char c = joined[i];
    if (c == ' ' || c == '\t') {
      size_t j = i;
      while (j < joined.size() && (joined[j] == ' ' || joined[j] == '\t')) {
        ++j;
      }
      bool atLineEnd = j == joined.size() || joined[j] == '\n';
      bool atLineStart = compact.empty() || compact.back() == '\n';
      if (!atLineEnd && !atLineStart) {
        compact += ' ';
      }
      i = j - 1;
      continue;
    }
    if (c == '\n') {
      if (++newlines > 2) {
        continue;
      }
    } else {
      newlines = 0;
    }
    compact += c;
  }

  return text::trim(compact);
}

std::string TextCleaner::maskPii(const std::string &text) {
  static const std::regex cnpj("\\d{2}\\.\\d{3}\\.\\d{3}/\\d{4}-\\d{2}");
  static const std::regex cpf("\\d{3}\\.\\d{3}\\.\\d{3}-\\d{2}");
  static const std::regex email("[A-Za-z0-9._%+-]+@[A-Za-z0-9.-]+\\.[A-Za-z]{2,}");
  static const std::regex phone("\\(?\\d{2}\\)?\\s?9?\\d{4}-\\d{4}");

  std::string masked = std::regex_replace(text, cnpj, "[CNPJ]");
  masked = std::regex_replace(masked, cpf, "[CPF]");
  masked = std::regex_replace(masked, email, "[EMAIL]");
  masked = std::regex_replace(masked, phone, "[TELEFONE]");
  return masked;
}

} // namespace lext
