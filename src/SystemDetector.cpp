#include "lext/SystemDetector.hpp"
#include "lext/Log.hpp"
#include "lext/TextUtils.hpp"

#include <algorithm>
#include <cmath>

namespace lext {

namespace {

std::vector<std::regex> compile(const std::vector<const char *> &sources) {
  std::vector<std::regex> patterns;
  patterns.reserve(sources.size());
  for (const char *source : sources) {
    patterns.emplace_back(source, std::regex::ECMAScript | std::regex::icase |
                                      std::regex::optimize);
  }
  return patterns;
}

SystemProfile makeProfile(const std::string &code, const std::string &name,
                          int tier, const std::vector<const char *> &sources) {
  SystemProfile profile;
  profile.code = code;
  profile.name = name;
  profile.tier = tier;
  profile.fingerprints = compile(sources);
  return profile;
}

} // anonymous namespace

SystemDetector::SystemDetector() {
  // Patterns run on accent-folded text, so "eletronico" covers "eletrônico".
  // Gaps stay on one line and are bounded: std::regex recurses per
  // character consumed.
  m_profiles.push_back(makeProfile(
      "STF", "STF (Supremo Tribunal Federal)", 1,
      {R"(supremo\s+tribunal\s+federal)", R"(e-stf)",
       R"(portal\.stf\.jus\.br)", R"(peticionamento\s+eletronico\s+stf)",
       R"(resolucao\s+stf\s+693)", R"(pkcs\s*#?\s*7)", R"(projeto\s+victor)"}));

  m_profiles.push_back(makeProfile(
      "STJ", "STJ (Superior Tribunal de Justica)", 1,
      {R"(superior\s+tribunal\s+de\s+justica)", R"(e-stj)",
       R"(www\.stj\.jus\.br)", R"(central\s+do\s+processo\s+eletronico)",
       R"(resolucao\s+stj/gp\s+10)",
       R"(autentique\s+em:\s*https?://www\.stj\.jus\.br/validar)"}));

  m_profiles.push_back(makeProfile(
      "PJE", "PJE (Processo Judicial Eletronico)", 2,
      {R"(processo\s+judicial\s+eletronico)", R"(\bpje\b)",
       R"(resolucao\s+cnj\s+281)",
       R"(documento\s+assinado\s+por[^\n]{0,200}e\s+certificado\s+digitalmente\s+por)",
       R"(codigo\s+de\s+verificacao:\s*[a-z0-9]{4}\.[0-9]{4}\.[0-9]x{2}[0-9]\.[x0-9]{4})",
       R"(este\s+documento\s+foi\s+gerado\s+pelo\s+usuario\s+\d{3}\.\d{3}\.\d{3}-\d{2})",
       R"(trt\d+\.jus\.br/pje)", R"(trf\d+\.jus\.br/pje)"}));

  m_profiles.push_back(makeProfile(
      "ESAJ", "ESAJ (Sistema de Automacao da Justica)", 2,
      {R"(e-saj)", R"(\besaj\b)", R"(softplan)", R"(portal\s+e-saj)",
       R"(conferencia\s+de\s+documento\s+digital)", R"(tjsp\.jus\.br[^\n]{0,200}esaj)",
       R"(tjce\.jus\.br[^\n]{0,200}esaj)", R"(tjam\.jus\.br[^\n]{0,200}esaj)",
       R"(tjms\.jus\.br[^\n]{0,200}esaj)", R"(resolucao\s+[^\n]{0,200}552/11)"}));

  m_profiles.push_back(makeProfile(
      "EPROC", "EPROC (Sistema de Processo Eletronico)", 2,
      {R"(\beproc\b)", R"(sistema\s+de\s+processo\s+eletronico)",
       R"(trf4\.jus\.br[^\n]{0,200}eproc)", R"(trf2\.jus\.br[^\n]{0,200}eproc)",
       R"(trf6\.jus\.br[^\n]{0,200}eproc)", R"(tjrs\.jus\.br[^\n]{0,200}eproc)",
       R"(tjsc\.jus\.br[^\n]{0,200}eproc)", R"(\.p7s)", R"(cades)",
       R"(assinatura\s+destacada)"}));

  m_profiles.push_back(makeProfile(
      "PROJUDI", "PROJUDI (Processo Judicial Digital)", 3,
      {R"(projudi)", R"(processo\s+judicial\s+digital)",
       R"(tjba\.jus\.br[^\n]{0,200}projudi)", R"(tjce\.jus\.br[^\n]{0,200}projudi)",
       R"(tjpr\.jus\.br[^\n]{0,200}projudi)", R"(tjmg\.jus\.br[^\n]{0,200}projudi)",
       R"(versao\s+1\.\d+)", R"(assinador\s+livre)",
       R"(universidade\s+federal\s+de\s+campina\s+grande)"}));

  m_icpBrasil = compile(
      {R"(icp-brasil)", R"(certificado\s+digital)",
       R"(assinado\s+digitalmente)", R"(pades|cades|xades)",
       R"(\bac\s+[a-z]+)",
       R"(iti\s+-\s+instituto\s+nacional\s+de\s+tecnologia\s+da\s+informacao)"});
}

int SystemDetector::countMatches(const std::string &text,
                                 const std::vector<std::regex> &patterns) {
  int matches = 0;
  for (const auto &pattern : patterns) {
    if (std::regex_search(text, pattern)) {
      ++matches;
    }
  }
  return matches;
}

SystemIdentification
SystemDetector::detect(const std::string &documentText) const {
  SystemIdentification result;
  result.name = "Unknown system";

  if (documentText.size() < kMinTextLength) {
    log::debug("System detection skipped, text has ", documentText.size(),
               " bytes");
    return result;
  }

  std::string folded = text::toLowerAscii(
      text::foldAccents(documentText.substr(0, kMaxScanLength)));

  const SystemProfile *best = nullptr;
  int bestMatches = 0;

  for (const auto &profile : m_profiles) {
    int matches = countMatches(folded, profile.fingerprints);
    log::debug("System ", profile.code, ": ", matches, "/",
               profile.fingerprints.size(), " fingerprints");
    if (matches == 0) {
      continue;
    }
    if (best == nullptr || profile.tier < best->tier ||
        (profile.tier == best->tier && matches > bestMatches)) {
      best = &profile;
      bestMatches = matches;
    }
  }

  if (best == nullptr) {
    int icpMatches = countMatches(folded, m_icpBrasil);
    if (icpMatches >= 2) {
      result.code = "GENERIC_JUDICIAL";
      result.name = "Generic judicial system (ICP-Brasil)";
      result.confidence = 50;
      result.matches = icpMatches;
    }
    return result;
  }

  double ratio = static_cast<double>(bestMatches) /
                 static_cast<double>(best->fingerprints.size());
  double confidence = 40.0 + ratio * 60.0;
  if (best->tier == 1) {
    confidence += 10.0;
  }
  confidence += (bestMatches - 1) * 5.0;

  result.code = best->code;
  result.name = best->name;
  result.confidence =
      static_cast<int>(std::lround(std::min(100.0, confidence)));
  result.matches = bestMatches;
  result.tier = best->tier;
  return result;
}

SystemIdentification
SystemDetector::fromOverride(const std::string &systemCode) const {
  SystemIdentification result;
  result.code = text::toUpperAscii(systemCode);
  result.name = result.code;
  result.confidence = 100;
  result.overridden = true;

  for (const auto &profile : m_profiles) {
    if (profile.code == result.code) {
      result.name = profile.name;
      result.tier = profile.tier;
    }
  }
  return result;
}

} // namespace lext
