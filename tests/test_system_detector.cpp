/**
 * @file test_system_detector.cpp
 * @brief Unit tests for issuing-system identification
 */

#include <gtest/gtest.h>
#include <lext/SystemDetector.hpp>

#include <string>

using namespace lext;

TEST(SystemDetectorTest, DetectsPje) {
  SystemDetector detector;
  std::string text =
      "PODER JUDICIÁRIO\nProcesso Judicial Eletrônico - PJe\n"
      "Tribunal Regional do Trabalho da 2ª Região\n"
      "Documento assinado por MARIA DA SILVA e certificado digitalmente por "
      "AC SERASA\n";

  SystemIdentification id = detector.detect(text);
  EXPECT_EQ(id.code, "PJE");
  EXPECT_GE(id.matches, 2);
  EXPECT_GT(id.confidence, 40);
  EXPECT_FALSE(id.overridden);
}

TEST(SystemDetectorTest, MoreSpecificTierWins) {
  SystemDetector detector;
  // Mentions PJe but is issued by the STJ
  std::string text =
      "SUPERIOR TRIBUNAL DE JUSTIÇA\nDocumento eletrônico e-STJ\n"
      "Consulta ao andamento também disponível no PJe para fins de "
      "acompanhamento processual do recurso especial.\n";

  EXPECT_EQ(detector.detect(text).code, "STJ");
}

TEST(SystemDetectorTest, IcpBrasilMarksFallBackToGeneric) {
  SystemDetector detector;
  std::string text =
      "Documento assinado digitalmente com certificado digital padrão "
      "ICP-Brasil, conforme a legislação vigente sobre documentos "
      "eletrônicos no âmbito do Poder Judiciário.\n";

  SystemIdentification id = detector.detect(text);
  EXPECT_EQ(id.code, "GENERIC_JUDICIAL");
  EXPECT_EQ(id.confidence, 50);
}

TEST(SystemDetectorTest, ShortTextIsUnknown) {
  SystemDetector detector;
  EXPECT_EQ(detector.detect("PJe").code, "UNKNOWN");
}

TEST(SystemDetectorTest, OverrideUsesProfileName) {
  SystemDetector detector;
  SystemIdentification id = detector.fromOverride("esaj");
  EXPECT_EQ(id.code, "ESAJ");
  EXPECT_TRUE(id.overridden);
  EXPECT_EQ(id.confidence, 100);
  EXPECT_NE(id.name.find("Automacao"), std::string::npos);
}

TEST(SystemDetectorTest, LongSingleLineIsScanned) {
  SystemDetector detector;
  std::string line = "Documento assinado por MARIA DA SILVA";
  while (line.size() < 60000) {
    line += " palavra";
  }
  line += " e certificado digitalmente por AC SERASA\n";

  // The signature phrase is too far from its certificate to match, but
  // the PJe name still does
  SystemIdentification id = detector.detect("Processo Judicial Eletrônico\n" +
                                            line);
  EXPECT_EQ(id.code, "PJE");
  EXPECT_EQ(id.matches, 1);
}
