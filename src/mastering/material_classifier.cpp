#include "mastering/material_classifier.h"

namespace masterprint {

const char* material_class_name(MaterialClass material) {
  switch (material) {
    case MaterialClass::CompressedLoud:
      return "compressed_loud";
    case MaterialClass::DynamicLoud:
      return "dynamic_loud";
    case MaterialClass::Quiet:
      return "quiet";
  }
  return "unknown";
}

MaterialClass classify_material(float lufs, float crest_db, const ClassifierConfig& config) {
  if (lufs > config.loud_threshold_lufs) {
    return crest_db < config.dynamic_min_crest_db ? MaterialClass::CompressedLoud
                                                  : MaterialClass::DynamicLoud;
  }
  return MaterialClass::Quiet;
}

}  // namespace masterprint
