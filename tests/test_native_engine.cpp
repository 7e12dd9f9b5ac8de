/**
 * @file test_native_engine.cpp
 * @brief Unit tests for text-layer reading order and region filtering
 */

#include <gtest/gtest.h>
#include <lext/NativeTextEngine.hpp>

#include <string>
#include <vector>

using namespace lext;

namespace {

TextBox word(const std::string &text, double x, double y, double width,
             bool spaceAfter = true) {
  TextBox box;
  box.text = text;
  box.box = PageRect{x, y, width, 12.0};
  box.charCount = static_cast<int>(text.size());
  box.spaceAfter = spaceAfter;
  return box;
}

} // namespace

TEST(NativeTextEngineTest, AssemblesLinesInReadingOrder) {
  std::vector<TextBox> boxes = {word("Linha", 10.0, 130.0, 40.0),
                                word("mundo", 60.0, 100.0, 40.0),
                                word("Olá", 10.0, 101.0, 40.0)};
  EXPECT_EQ(assembleLines(boxes), "Olá mundo\nLinha");
}

TEST(NativeTextEngineTest, TouchingWordsWithoutSpaceAreJoined) {
  std::vector<TextBox> boxes = {word("advo", 10.0, 100.0, 20.0, false),
                                word("gado", 30.0, 100.0, 20.0)};
  EXPECT_EQ(assembleLines(boxes), "advogado");
}

TEST(NativeTextEngineTest, WordsOutsideRegionAreDropped) {
  PageRect region{0.0, 0.0, 500.0, 842.0};
  std::vector<TextBox> boxes = {word("corpo", 50.0, 100.0, 60.0),
                                word("faixa", 520.0, 100.0, 40.0),
                                word("borda", 490.0, 100.0, 20.0)};

  std::vector<TextBox> kept = filterToRegion(boxes, region);
  ASSERT_EQ(kept.size(), 1u);
  EXPECT_EQ(kept[0].text, "corpo");
}

TEST(NativeTextEngineTest, ScoreReflectsCoverageAndGarbling) {
  NativeTextEngine engine(50);
  EXPECT_DOUBLE_EQ(engine.scoreText(""), 0.0);
  EXPECT_NEAR(engine.scoreText(std::string(100, 'a')), 0.9, 1e-9);
  EXPECT_NEAR(engine.scoreText(std::string(25, 'a')), 0.45, 1e-9);

  std::string garbled(45, 'a');
  for (int i = 0; i < 5; ++i) {
    garbled += "\xEF\xBF\xBD";
  }
  EXPECT_NEAR(engine.scoreText(garbled), 0.9 * 0.9, 1e-9);
}

TEST(NativeTextEngineTest, NeedsDocument) {
  NativeTextEngine engine;
  PageInput input;
  input.pageNumber = 1;
  EngineOutput output = engine.extract(input);
  EXPECT_FALSE(output.success);
  EXPECT_FALSE(output.errorMessage.empty());
}
