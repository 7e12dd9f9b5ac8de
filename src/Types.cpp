#include "lext/Types.hpp"

namespace lext {

std::string toString(PageClassification value) {
  return value == PageClassification::Native ? "NATIVE" : "RASTER_NEEDED";
}

std::string toString(ComplexityTag value) {
  switch (value) {
  case ComplexityTag::NativeClean:
    return "native_clean";
  case ComplexityTag::NativeWithArtifacts:
    return "native_with_artifacts";
  case ComplexityTag::RasterClean:
    return "raster_clean";
  case ComplexityTag::RasterDirty:
    return "raster_dirty";
  case ComplexityTag::RasterDegraded:
    return "raster_degraded";
  }
  return "raster_dirty";
}

std::string toString(EngineType value) {
  switch (value) {
  case EngineType::Native:
    return "native";
  case EngineType::Ocr:
    return "ocr";
  case EngineType::MlLayout:
    return "ml-layout";
  }
  return "native";
}

std::string toString(BandSide value) {
  switch (value) {
  case BandSide::Left:
    return "left";
  case BandSide::Right:
    return "right";
  case BandSide::None:
    break;
  }
  return "none";
}

std::string toString(PatternKind value) {
  switch (value) {
  case PatternKind::Header:
    return "header";
  case PatternKind::Footer:
    return "footer";
  case PatternKind::Table:
    return "table";
  case PatternKind::TextBlock:
    return "text_block";
  case PatternKind::Image:
    return "image";
  case PatternKind::Signature:
    return "signature";
  case PatternKind::Stamp:
    return "stamp";
  case PatternKind::Unknown:
    break;
  }
  return "unknown";
}

std::string toString(TaxonomyCategory value) {
  switch (value) {
  case TaxonomyCategory::PeticaoInicial:
    return "PETICAO_INICIAL";
  case TaxonomyCategory::Contestacao:
    return "CONTESTACAO";
  case TaxonomyCategory::Replica:
    return "REPLICA";
  case TaxonomyCategory::Sentenca:
    return "SENTENCA";
  case TaxonomyCategory::Despacho:
    return "DESPACHO";
  case TaxonomyCategory::Recurso:
    return "RECURSO";
  case TaxonomyCategory::ParecerMp:
    return "PARECER_MP";
  case TaxonomyCategory::AtaAudiencia:
    return "ATA_AUDIENCIA";
  case TaxonomyCategory::Certidao:
    return "CERTIDAO";
  case TaxonomyCategory::Anexos:
    return "ANEXOS";
  case TaxonomyCategory::CapaDados:
    return "CAPA_DADOS";
  case TaxonomyCategory::Indeterminado:
    break;
  }
  return "INDETERMINADO";
}

std::string markerLabel(EngineType value) {
  switch (value) {
  case EngineType::Native:
    return "NATIVE";
  case EngineType::Ocr:
    return "OCR";
  case EngineType::MlLayout:
    return "ML";
  }
  return "NATIVE";
}

std::optional<EngineType> engineFromString(const std::string &value) {
  for (EngineType engine :
       {EngineType::Native, EngineType::Ocr, EngineType::MlLayout}) {
    if (toString(engine) == value) {
      return engine;
    }
  }
  return std::nullopt;
}

std::optional<PatternKind> patternKindFromString(const std::string &value) {
  for (PatternKind kind :
       {PatternKind::Header, PatternKind::Footer, PatternKind::Table,
        PatternKind::TextBlock, PatternKind::Image, PatternKind::Signature,
        PatternKind::Stamp, PatternKind::Unknown}) {
    if (toString(kind) == value) {
      return kind;
    }
  }
  return std::nullopt;
}

std::optional<TaxonomyCategory> taxonomyFromString(const std::string &value) {
  for (int i = 0; i <= static_cast<int>(TaxonomyCategory::Indeterminado); ++i) {
    auto category = static_cast<TaxonomyCategory>(i);
    if (toString(category) == value) {
      return category;
    }
  }
  return std::nullopt;
}

double engineQuality(EngineType engine) {
  switch (engine) {
  case EngineType::MlLayout:
    return 1.0;
  case EngineType::Native:
    return 0.9;
  case EngineType::Ocr:
    return 0.7;
  }
  return 0.0;
}

} // namespace lext
