#pragma once

/// @file mastering_config.h
/// @brief Tuning constants shared by the processing branches.

#include "mastering/material_classifier.h"

namespace masterprint {

/// @brief Mastering configuration.
struct MasteringConfig {
  ClassifierConfig classifier;

  // Compressed loud branch
  float hyper_compressed_crest_db = 8.0f;     ///< Below this crest, expansion is skipped
  float max_crest_increase_db = 2.0f;         ///< Upper bound on the expansion target
  float rms_expansion_amount = 0.5f;          ///< Fraction of the target actually applied
  float compressed_loud_intensity = 0.7f;     ///< EQ intensity factor
  float dynamic_loud_intensity = 0.5f;        ///< EQ intensity factor

  // Shared stages
  float pre_eq_headroom_db = -1.0f;           ///< Cut before spectral boosts
  float safety_ceiling = 0.99f;               ///< Safety limiter ceiling (linear)
  float output_ceiling = 0.98f;               ///< Output normalization ceiling (linear)

  // Quiet branch
  float loudness_target_lufs = -11.0f;        ///< Reference for adaptive makeup gain
  float max_makeup_gain_db = 12.0f;           ///< Upper bound on makeup gain
  float makeup_safety_margin_db = 0.5f;       ///< Subtracted from the adaptive gain
  float harmonic_preservation_threshold = 0.6f;
  float variation_preservation_threshold = 0.5f;
  float flatness_preservation_threshold = 0.4f;
};

}  // namespace masterprint
