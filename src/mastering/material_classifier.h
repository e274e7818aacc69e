#pragma once

/// @file material_classifier.h
/// @brief Loudness/crest classification that selects the processing branch.

namespace masterprint {

/// @brief Material class. Derived on every run, never stored.
enum class MaterialClass {
  CompressedLoud,  ///< Loud with a low crest factor
  DynamicLoud,     ///< Loud with healthy dynamics
  Quiet,           ///< At or below the loudness threshold
};

/// @brief Classification thresholds.
struct ClassifierConfig {
  float loud_threshold_lufs = -12.0f;   ///< Strictly above is loud
  float dynamic_min_crest_db = 13.0f;   ///< Loud material below this crest is compressed
};

/// @brief Returns "compressed_loud", "dynamic_loud" or "quiet".
const char* material_class_name(MaterialClass material);

/// @brief Classifies material from integrated loudness and crest factor.
/// @details Only a strict `>` counts as loud, so lufs == threshold is Quiet.
MaterialClass classify_material(float lufs, float crest_db,
                                const ClassifierConfig& config = ClassifierConfig());

}  // namespace masterprint
