#pragma once

/// @file mastering_targets.h
/// @brief Mastering targets derived from a fingerprint.

#include <array>

#include "fingerprint/fingerprint.h"

namespace masterprint {

/// @brief Number of EQ bands in the targets (sub-bass .. air).
constexpr size_t kNumEqBands = 7;

/// @brief Loudness, crest, EQ and compression targets for one track.
struct MasteringTargets {
  float target_lufs = -14.0f;
  float target_crest_db = 12.75f;
  std::array<float, kNumEqBands> eq_adjustments_db{};  ///< Per band, in eq_band_names() order
  float compression_ratio = 2.5f;
  float compression_amount = 0.6f;
};

/// @brief Band keys used for EQ adjustments ("sub_bass", "bass", ..., "air").
const std::array<const char*, kNumEqBands>& eq_band_names();

/// @brief Derives targets from a fingerprint.
/// @details EQ moves 0.5 dB per percentage point of deviation from the reference balance
///          (5/15/18/22/20/13/7 %), clamped to +/-6 dB. Target crest is max(10, 0.85 * crest).
MasteringTargets derive_mastering_targets(const Fingerprint& fingerprint);

}  // namespace masterprint
