/**
 * @file test_cleaner.cpp
 * @brief Unit tests for artifact removal and text normalization
 */

#include <gtest/gtest.h>
#include <lext/TextCleaner.hpp>

#include <algorithm>
#include <string>
#include <vector>

using namespace lext;

namespace {

bool removed(const CleaningResult &result, const std::string &description) {
  const auto &patterns = result.stats.patternsRemoved;
  return std::find(patterns.begin(), patterns.end(), description) !=
         patterns.end();
}

} // namespace

TEST(TextCleanerTest, RemovesPageCounter) {
  TextCleaner cleaner;
  CleaningResult result =
      cleaner.clean("Texto da decisão.\nPágina 3 de 10\n", CleaningOptions());

  EXPECT_EQ(result.text, "Texto da decisão.");
  EXPECT_TRUE(removed(result, "page counter"));
  EXPECT_EQ(result.stats.systemCode, "UNKNOWN");
  EXPECT_GT(result.stats.reductionPercent, 0.0);
}

TEST(TextCleanerTest, ExclusionWordsAreLiteralAndCaseInsensitive) {
  TextCleaner cleaner;
  CleaningOptions options;
  options.exclusionWords = {"r$ 1.000,00", "  "};

  CleaningResult result = cleaner.clean(
      "Valor da causa: R$ 1.000,00 conforme inicial.", options);
  EXPECT_EQ(result.text, "Valor da causa: conforme inicial.");
  EXPECT_TRUE(removed(result, "Exclusion: \"r$ 1.000,00\""));
}

TEST(TextCleanerTest, SystemRulesApplyToDetectedSystem) {
  TextCleaner cleaner;
  CleaningOptions options;
  options.systemCode = "PJE";

  CleaningResult result = cleaner.clean(
      "Decisão proferida.\nCódigo de verificação: AB12.3456.CD78.EF90\n",
      options);
  EXPECT_EQ(result.text, "Decisão proferida.");
  EXPECT_TRUE(removed(result, "PJE verification code"));
  EXPECT_EQ(result.stats.systemCode, "PJE");
}

TEST(TextCleanerTest, IsolatedBandLinesAreDropped) {
  TextCleaner cleaner;
  CleaningResult result = cleaner.clean(
      "Conclusão\n12/03/2024\n14:22\nTexto final", CleaningOptions());

  EXPECT_EQ(result.text, "Conclusão\n\nTexto final");
  EXPECT_TRUE(removed(result, "isolated date line"));
  EXPECT_TRUE(removed(result, "isolated time line"));
}

TEST(TextCleanerTest, NormalizeJoinsHyphenationAndQuotes) {
  EXPECT_EQ(TextCleaner::normalize("o advo-\ngado da parte"),
            "o advogado da parte");
  EXPECT_EQ(TextCleaner::normalize("\xE2\x80\x9C"
                                   "cita\xC3\xA7\xC3\xA3o"
                                   "\xE2\x80\x9D"),
            "\"citação\"");
  EXPECT_EQ(TextCleaner::normalize("a\n\n\n\nb"), "a\n\nb");
  EXPECT_EQ(TextCleaner::normalize("  x   y  \n"), "x y");
}

TEST(TextCleanerTest, MaskPii) {
  EXPECT_EQ(TextCleaner::maskPii("CPF 123.456.789-09, CNPJ 12.345.678/0001-90, "
                                 "email joao.silva@example.com, "
                                 "tel (11) 98765-4321"),
            "CPF [CPF], CNPJ [CNPJ], email [EMAIL], tel [TELEFONE]");

  TextCleaner cleaner;
  CleaningOptions options;
  options.maskPii = true;
  EXPECT_EQ(cleaner.clean("Contato: joao@example.com", options).text,
            "Contato: [EMAIL]");
}

TEST(TextCleanerTest, SupportsEverySystemProfile) {
  TextCleaner cleaner;
  std::vector<std::string> systems = cleaner.supportedSystems();
  for (const char *code : {"PJE", "ESAJ", "EPROC", "PROJUDI", "STF", "STJ"}) {
    EXPECT_NE(std::find(systems.begin(), systems.end(), code), systems.end())
        << code;
  }
}
