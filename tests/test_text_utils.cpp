/**
 * @file test_text_utils.cpp
 * @brief Unit tests for UTF-8 text helpers
 */

#include <gtest/gtest.h>
#include <lext/TextUtils.hpp>

#include <regex>
#include <string>
#include <vector>

using namespace lext;

TEST(TextUtilsTest, FoldAccents) {
  EXPECT_EQ(text::foldAccents("Sentença de ação é válida"),
            "Sentenca de acao e valida");
  // Decomposed "é" folds the same way as the precomposed one
  EXPECT_EQ(text::foldAccents("e\xCC\x81"), text::foldAccents("\xC3\xA9"));
  EXPECT_EQ(text::foldAccents("1ª vara, nº 5"), "1a vara, no 5");
  EXPECT_EQ(text::foldAccents("a\xC2\xA0" "b"), "a b");
}

TEST(TextUtilsTest, CaseAndWhitespace) {
  EXPECT_EQ(text::toUpperAscii("ação"), "AçãO");
  EXPECT_EQ(text::collapseWhitespace("  a \t\n b  "), "a b");
  EXPECT_EQ(text::trim("\r\n x y \t"), "x y");
}

TEST(TextUtilsTest, SplitLinesDropsCarriageReturns) {
  std::vector<std::string> lines = text::splitLines("a\r\nb\n\nc");
  EXPECT_EQ(lines, (std::vector<std::string>{"a", "b", "", "c"}));
  EXPECT_EQ(text::splitLines("x\n").size(), 2u);
}

TEST(TextUtilsTest, SemanticEquality) {
  EXPECT_TRUE(text::semanticEqual("EXCELENTÍSSIMO  Senhor",
                                  "excelenti\xCC\x81ssimo senhor"));
  EXPECT_FALSE(text::semanticEqual("senhor", "senhora"));
}

TEST(TextUtilsTest, Utf8Length) {
  EXPECT_EQ(text::utf8Length("ação"), 4u);
  EXPECT_EQ(text::utf8Length(""), 0u);
}

TEST(TextUtilsTest, EscapedWordMatchesLiterally) {
  std::regex literal(text::escapeRegex("R$ 1.000,00 (total)"));
  EXPECT_TRUE(std::regex_search("valor R$ 1.000,00 (total) devido", literal));
  EXPECT_FALSE(std::regex_search("valor R$ 1a000,00 (total)", literal));
}
