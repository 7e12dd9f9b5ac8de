#include "lext/SemanticClassifier.hpp"
#include "lext/Log.hpp"
#include "lext/TextUtils.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <map>
#include <optional>
#include <sstream>

namespace lext {

namespace {

constexpr double kFirstHeaderWeight = 0.5;
constexpr double kExtraHeaderWeight = 0.2;
constexpr double kWeakHeaderWeight = 0.1;
constexpr double kSynonymWeight = 0.3;
constexpr double kSynonymCap = 0.6;
constexpr double kPriorityWeight = 0.015;

constexpr const char *kSectionHeading = "### INICIO DE SECAO:";
constexpr const char *kResultVersion = "1.0.0";

const std::regex &markerRegex() {
  static const std::regex marker(
      R"(^##\s*\[\[PAGE_(\d+)\]\]\s*\[TYPE:\s*(\w+)\])");
  return marker;
}

std::regex compile(const std::string &pattern) {
  return std::regex(pattern, std::regex::ECMAScript | std::regex::optimize);
}

double round3(double value) { return std::round(value * 1000.0) / 1000.0; }

std::string isoTimestamp() {
  std::time_t now = std::time(nullptr);
  std::tm local{};
  localtime_r(&now, &local);
  std::ostringstream out;
  out << std::put_time(&local, "%Y-%m-%dT%H:%M:%S");
  return out.str();
}

bool outranks(const CategoryScore &candidate, const CategoryScore &current) {
  if (candidate.openingHeader != current.openingHeader) {
    return candidate.openingHeader;
  }
  return candidate.score > current.score;
}

bool isSectionHeadingLine(const std::string &line) {
  std::string trimmed = text::trim(line);
  return trimmed == "---" || trimmed.rfind(kSectionHeading, 0) == 0;
}

} // namespace

PatternClassifier::PatternClassifier() : PatternClassifier(ClassifierConfig{}) {}

PatternClassifier::PatternClassifier(const ClassifierConfig &config)
    : m_config(config) {
  buildTaxonomy();
}

void PatternClassifier::buildTaxonomy() {
  // Lines are matched after accent folding and uppercasing, so every
  // pattern is plain uppercase ASCII.
  auto header = [](const std::string &id, const std::string &pattern,
                   double base, bool opening = true) {
    return HeaderPattern{id, compile("^" + pattern), base, opening};
  };
  auto synonyms = [](std::initializer_list<const char *> terms) {
    std::vector<Synonym> list;
    for (const char *term : terms) {
      list.push_back(Synonym{term, compile(std::string("\\b") +
                                           text::escapeRegex(term) + "\\b")});
    }
    return list;
  };

  m_taxonomy.clear();

  m_taxonomy.push_back(
      {TaxonomyCategory::PeticaoInicial,
       8,
       // Every pleading opens with the court address, so it only counts
       // when nothing else on the page names the filing
       {header("enderecamento", R"(EXCELENTISSIM[OA]\s+(SENHOR|SR\.?)\b)",
               0.70, false),
        header("peticao_inicial", R"(PETICAO\s+INICIAL\b)", 0.92),
        header("reclamacao_trabalhista", R"(RECLAMACAO\s+TRABALHISTA\b)",
               0.85)},
       synonyms({"VEM, RESPEITOSAMENTE", "VEM RESPEITOSAMENTE",
                 "PROPOR A PRESENTE", "AJUIZAR A PRESENTE", "DOS FATOS",
                 "DOS PEDIDOS", "DA CAUSA DE PEDIR", "PETICAO INICIAL"})});

  m_taxonomy.push_back(
      {TaxonomyCategory::Contestacao,
       7,
       {header("contestacao", R"(CONTESTACAO\b)", 0.92),
        header("defesa", R"(DEFESA\b)", 0.80)},
       synonyms({"APRESENTAR CONTESTACAO", "PRELIMINARMENTE",
                 "EM PRELIMINAR", "NO MERITO", "IMPROCEDENCIA DOS PEDIDOS",
                 "IMPUGNA"})});

  m_taxonomy.push_back(
      {TaxonomyCategory::Replica,
       7,
       {header("replica", R"(REPLICA\b)", 0.90),
        header("impugnacao_contestacao",
               R"(IMPUGNACAO\s+(A\s+)?CONTESTACAO\b)", 0.90),
        header("treplica", R"(TREPLICA\b)", 0.85)},
       synonyms({"EM REPLICA", "APRESENTAR REPLICA",
                 "MANIFESTAR-SE SOBRE A CONTESTACAO",
                 "MANIFESTACAO SOBRE DOCUMENTOS"})});

  m_taxonomy.push_back(
      {TaxonomyCategory::Sentenca,
       9,
       {header("sentenca", R"(SENTENCA\b)", 0.95),
        header("acordao", R"(ACORDAO\b)", 0.95),
        header("decisao", R"(DECISAO(\s+INTERLOCUTORIA)?\b)", 0.88),
        header("vistos", R"(VISTOS(\s+E\s+EXAMINADOS)?[.,])", 0.82)},
       synonyms({"JULGO PROCEDENTE", "JULGO IMPROCEDENTE",
                 "JULGO PARCIALMENTE PROCEDENTE", "ACORDAM OS DESEMBARGADORES",
                 "ANTE O EXPOSTO", "DISPOSITIVO", "FUNDAMENTACAO",
                 "RELATORIO"})});

  m_taxonomy.push_back({TaxonomyCategory::Despacho,
                        6,
                        {header("despacho", R"(DESPACHO\b)", 0.90)},
                        synonyms({"CITE-SE", "INTIME-SE", "INTIMEM-SE",
                                  "JUNTE-SE", "AGUARDE-SE", "CUMPRA-SE",
                                  "DIGAM AS PARTES", "CONCLUSOS"})});

  m_taxonomy.push_back(
      {TaxonomyCategory::Recurso,
       8,
       {header("recurso",
               R"((APELACAO|AGRAVO|EMBARGOS|RECURSO|RAZOES|CONTRARRAZOES)\b)",
               0.88)},
       synonyms({"RECURSO ORDINARIO", "RECURSO DE REVISTA",
                 "RECURSO ESPECIAL", "EMBARGOS DE DECLARACAO",
                 "REFORMA DA DECISAO", "REFORMA DA SENTENCA",
                 "EGREGIO TRIBUNAL", "COLENDA TURMA"})});

  m_taxonomy.push_back(
      {TaxonomyCategory::ParecerMp,
       7,
       {header("parecer", R"(PARECER\b)", 0.90),
        header("promocao_mp",
               R"((PROMOCAO|MANIFESTACAO)\s+(DO\s+)?MINISTERIO\s+PUBLICO\b)",
               0.88),
        header("ministerio_publico", R"(MINISTERIO\s+PUBLICO\b)", 0.85)},
       synonyms({"PROMOTOR DE JUSTICA", "PROMOTORA DE JUSTICA",
                 "PROCURADOR DE JUSTICA", "PROCURADORA DE JUSTICA",
                 "CUSTOS LEGIS", "O MINISTERIO PUBLICO OPINA"})});

  m_taxonomy.push_back(
      {TaxonomyCategory::AtaAudiencia,
       7,
       {header("ata_audiencia", R"((ATA|TERMO)\s+DE\s+AUDIENCIA\b)", 0.92),
        header("termo_depoimento",
               R"(TERMO\s+DE\s+(DEPOIMENTO|CONCILIACAO)\b)", 0.85)},
       synonyms({"AUDIENCIA REALIZADA", "ABERTA A AUDIENCIA",
                 "PRESENTES AS PARTES", "TESTEMUNHA", "PROPOSTA DE ACORDO",
                 "CONCILIACAO REJEITADA"})});

  m_taxonomy.push_back(
      {TaxonomyCategory::Certidao,
       5,
       {header("certidao", R"(CERTIDAO\b)", 0.90),
        header("certifico", R"(CERTIFICO\b)", 0.88)},
       synonyms({"CERTIFICO", "DOU FE", "TRANSITOU EM JULGADO",
                 "TRANSITO EM JULGADO", "DECORREU O PRAZO"})});

  m_taxonomy.push_back(
      {TaxonomyCategory::Anexos,
       3,
       {header("procuracao",
               R"((PROCURACAO|INSTRUMENTO\s+(PARTICULAR\s+)?DE\s+MANDATO)\b)",
               0.90),
        header("substabelecimento", R"(SUBSTABELECIMENTO\b)", 0.88),
        header("contrato", R"(CONTRATO\b)", 0.85),
        header("anexo", R"((ANEXO|DOC\.?)\s*[.:IVX\d]+)", 0.85),
        header("nota_fiscal", R"((NOTA\s+FISCAL|DANFE)\b)", 0.85),
        header("comprovante", R"(COMPROVANTE\b)", 0.82),
        header("laudo", R"(LAUDO\s+(PERICIAL|TECNICO)\b)", 0.80)},
       synonyms({"OUTORGANTE", "OUTORGADO", "PODERES DA CLAUSULA",
                 "AD JUDICIA", "EXTRATO", "RECIBO"})});

  m_taxonomy.push_back(
      {TaxonomyCategory::CapaDados,
       4,
       {header("classe", R"(CLASSE\s*:)", 0.85),
        header("assunto", R"(ASSUNTO\s*:)", 0.80),
        header("distribuicao", R"(DISTRIBUID[OA]\s+EM\b)", 0.85),
        header("autuacao", R"(AUTUACAO\b)", 0.85)},
       synonyms({"POLO ATIVO", "POLO PASSIVO", "VALOR DA CAUSA",
                 "SEGREDO DE JUSTICA", "JUSTICA GRATUITA",
                 "ORGAO JULGADOR"})});
}

std::vector<TaggedPage> PatternClassifier::parsePages(
    const std::string &taggedDocument) {
  std::vector<TaggedPage> pages;
  std::ostringstream body;
  bool open = false;

  auto flush = [&]() {
    if (open) {
      pages.back().content = body.str();
    }
    body.str("");
    body.clear();
  };

  for (const auto &line : text::splitLines(taggedDocument)) {
    std::smatch match;
    if (std::regex_search(line, match, markerRegex())) {
      flush();
      TaggedPage page;
      page.page = std::stoi(match[1].str());
      page.extractionType = match[2].str();
      pages.push_back(page);
      open = true;
      continue;
    }
    if (!open || isSectionHeadingLine(line)) {
      continue;
    }
    body << line << "\n";
  }
  flush();

  // Untagged text is treated as a single page
  if (pages.empty() && !text::trim(taggedDocument).empty()) {
    TaggedPage page;
    page.page = 1;
    page.extractionType = "UNKNOWN";
    page.content = taggedDocument;
    pages.push_back(page);
  }
  return pages;
}

std::vector<std::string> PatternClassifier::normalizeLines(
    const std::string &input) {
  std::vector<std::string> lines;
  for (const auto &line : text::splitLines(input)) {
    std::string normalized =
        text::collapseWhitespace(text::toUpperAscii(text::foldAccents(line)));
    if (!normalized.empty()) {
      lines.push_back(normalized);
    }
  }
  return lines;
}

std::vector<CategoryScore> PatternClassifier::scoreWindow(
    const std::vector<std::string> &lines) const {
  std::string joined;
  for (const auto &line : lines) {
    joined += line;
    joined += '\n';
  }

  std::vector<CategoryScore> scores;
  scores.reserve(m_taxonomy.size());

  for (const auto &rules : m_taxonomy) {
    CategoryScore result;
    result.category = rules.category;
    double bestBase = 0.0;

    for (const auto &line : lines) {
      for (const auto &pattern : rules.headers) {
        if (std::regex_search(line, pattern.regex)) {
          ++result.headerMatches;
          if (pattern.opening) {
            result.openingHeader = true;
          }
          bestBase = std::max(bestBase, pattern.baseConfidence);
          result.matchedPatterns.push_back("header:" + pattern.id);
          break;
        }
      }
    }

    for (const auto &synonym : rules.synonyms) {
      auto begin =
          std::sregex_iterator(joined.begin(), joined.end(), synonym.regex);
      int hits = static_cast<int>(std::distance(begin, std::sregex_iterator()));
      if (hits > 0) {
        result.synonymMatches += hits;
        result.matchedPatterns.push_back("synonym:" + synonym.term);
      }
    }

    if (result.headerMatches == 0 && result.synonymMatches == 0) {
      scores.push_back(result);
      continue;
    }

    double score = 0.0;
    score += std::min(kSynonymWeight * result.synonymMatches, kSynonymCap);
    if (result.openingHeader) {
      score += kFirstHeaderWeight +
               kExtraHeaderWeight * (result.headerMatches - 1);
    } else {
      score += kWeakHeaderWeight * result.headerMatches;
    }
    score += rules.priority * kPriorityWeight;

    result.score = std::min(1.0, score);
    result.confidence = std::min(1.0, std::max(bestBase, score));
    scores.push_back(result);
  }

  return scores;
}

PageClassificationRecord PatternClassifier::classifyPage(
    const TaggedPage &page) const {
  PageClassificationRecord record;
  record.page = page.page;
  record.extractionType = page.extractionType;

  std::vector<std::string> lines = normalizeLines(page.content);
  if (lines.empty()) {
    return record;
  }

  size_t window = static_cast<size_t>(std::max(1, m_config.initialWindowLines));
  size_t step = static_cast<size_t>(std::max(1, m_config.windowStepLines));
  size_t maxWindow = static_cast<size_t>(
      std::max(m_config.maxWindowLines, m_config.initialWindowLines));

  std::optional<CategoryScore> chosen;
  while (true) {
    size_t take = std::min(window, lines.size());
    std::vector<std::string> head(lines.begin(), lines.begin() + take);

    chosen.reset();
    for (auto &score : scoreWindow(head)) {
      if (score.headerMatches == 0 || score.score < m_config.minConfidence) {
        continue;
      }
      if (!chosen || outranks(score, *chosen)) {
        chosen = std::move(score);
      }
    }

    // A weak header alone keeps the window growing
    if (chosen && chosen->openingHeader &&
        chosen->score >= m_config.earlyStopScore) {
      break;
    }
    if (take >= lines.size() || window >= maxWindow) {
      break;
    }
    window = std::min(window + step, maxWindow);
  }

  if (chosen) {
    record.type = chosen->category;
    record.confidence = chosen->confidence;
    record.matched = true;
    record.matchedPatterns = chosen->matchedPatterns;
    log::debug("Page ", page.page, ": ", toString(record.type), " (",
               record.confidence, ")");
  }
  return record;
}

std::vector<Section> PatternClassifier::buildSections(
    std::vector<PageClassificationRecord> &pages, Warnings &warnings) {
  std::vector<Section> sections;

  for (auto &page : pages) {
    if (page.matched) {
      page.isSectionStart = true;
      Section section;
      section.sectionId = static_cast<int>(sections.size()) + 1;
      section.type = page.type;
      section.startPage = page.page;
      section.endPage = page.page;
      section.confidence = page.confidence;
      sections.push_back(section);
      continue;
    }

    page.confidence = 0.0;
    if (sections.empty()) {
      page.type = TaxonomyCategory::Indeterminado;
      page.isSectionStart = true;
      Section section;
      section.sectionId = 1;
      section.type = TaxonomyCategory::Indeterminado;
      section.startPage = page.page;
      section.endPage = page.page;
      sections.push_back(section);
      warnings.push_back(makeWarning(WarningKind::ClassificationAmbiguous,
                                     page.page,
                                     "no taxonomy match on first page"));
      continue;
    }

    Section &current = sections.back();
    page.type = current.type;
    page.isSectionStart = false;
    current.endPage = page.page;
    warnings.push_back(makeWarning(
        WarningKind::ClassificationAmbiguous, page.page,
        "no taxonomy match, continuing " + toString(current.type)));
  }

  return sections;
}

ClassificationResult PatternClassifier::classify(
    const std::string &taggedDocument, const std::string &docId) const {
  auto startTime = std::chrono::high_resolution_clock::now();

  ClassificationResult result;
  result.docId = docId;
  result.classifierName = name();

  for (const auto &page : parsePages(taggedDocument)) {
    result.pages.push_back(classifyPage(page));
  }
  result.sections = buildSections(result.pages, result.warnings);

  auto endTime = std::chrono::high_resolution_clock::now();
  result.processingTimeMs =
      std::chrono::duration<double, std::milli>(endTime - startTime).count();

  log::info("Classified ", result.pages.size(), " pages into ",
            result.sections.size(), " sections");
  return result;
}

nlohmann::json toJson(const ClassificationResult &result) {
  nlohmann::json j;
  j["doc_id"] = result.docId;
  j["processed_at"] = isoTimestamp();
  j["version"] = kResultVersion;
  j["classifier"] = result.classifierName;
  j["total_pages"] = result.pages.size();
  j["total_sections"] = result.sections.size();

  nlohmann::json pages = nlohmann::json::array();
  for (const auto &page : result.pages) {
    pages.push_back({{"page", page.page},
                     {"type", toString(page.type)},
                     {"confidence", round3(page.confidence)},
                     {"is_section_start", page.isSectionStart},
                     {"extraction_type", page.extractionType},
                     {"matched_patterns", page.matchedPatterns}});
  }
  j["pages"] = pages;

  nlohmann::json sections = nlohmann::json::array();
  for (const auto &section : result.sections) {
    sections.push_back({{"section_id", section.sectionId},
                        {"type", toString(section.type)},
                        {"start_page", section.startPage},
                        {"end_page", section.endPage},
                        {"confidence", round3(section.confidence)},
                        {"page_count", section.pageCount()}});
  }
  j["sections"] = sections;
  j["taxonomy_version"] = PatternClassifier::kTaxonomyVersion;
  return j;
}

bool saveJson(const ClassificationResult &result, const std::string &path) {
  std::ofstream out(path);
  if (!out) {
    log::error("Cannot write ", path);
    return false;
  }
  out << toJson(result).dump(2) << "\n";
  return out.good();
}

std::string tagDocument(const std::string &taggedDocument,
                        const ClassificationResult &result) {
  std::map<int, const PageClassificationRecord *> byPage;
  for (const auto &page : result.pages) {
    byPage[page.page] = &page;
  }

  std::string out;
  out.reserve(taggedDocument.size() + result.pages.size() * 64);

  for (const auto &line : text::splitLines(taggedDocument)) {
    std::smatch match;
    if (std::regex_search(line, match, markerRegex())) {
      auto it = byPage.find(std::stoi(match[1].str()));
      if (it != byPage.end()) {
        const PageClassificationRecord &page = *it->second;
        std::string type = toString(page.type);
        if (page.isSectionStart) {
          out += "\n---\n";
          out += kSectionHeading;
          out += " " + type + "\n";
        }
        char tag[96];
        std::snprintf(tag, sizeof(tag), " [SEMANTIC: %s] [CONF: %.2f]",
                      type.c_str(), page.confidence);
        out += line + tag + "\n";
        continue;
      }
    }
    out += line + "\n";
  }

  // splitLines keeps the empty piece after a trailing newline
  if (!taggedDocument.empty() && taggedDocument.back() == '\n' &&
      out.size() >= 2 && out.compare(out.size() - 2, 2, "\n\n") == 0) {
    out.pop_back();
  }
  return out;
}

} // namespace lext
