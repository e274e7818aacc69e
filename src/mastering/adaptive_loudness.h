#pragma once

/// @file adaptive_loudness.h
/// @brief Fingerprint-driven intensity, makeup gain and peak targets.

#include "mastering/mastering_config.h"

namespace masterprint {

/// @brief Scales the user intensity by a smooth 2D curve over crest and loudness.
/// @details crest_norm = clip((crest - 8) / 7), lufs_norm = clip((lufs + 13) / 2).
/// Compressed material (crest_norm < 0.3) gets 0.5 + 0.67 crest_norm; dynamic material gets
/// 0.7 + 0.5 (1 - crest_norm) + 0.5 (1 - lufs_norm) - 0.4 lufs_norm. The multiplier is
/// clamped to [0.5, 1.2].
float effective_intensity(float base_intensity, float lufs, float crest_db);

/// @brief Makeup gain in dB for quiet material, before the safety margin.
/// @details (target - lufs) * intensity, reduced for bass-heavy and transient-dense material
///          and capped so the peak lands at most 6 dB above full scale (the soft clipper
///          absorbs the rest).
float adaptive_makeup_gain(float lufs, float intensity, float bass_pct, float transient_density,
                           float peak_db, const MasteringConfig& config = MasteringConfig());

/// @brief Final peak target for quiet material, in [0.90, 0.95] (quieter sources go higher).
float adaptive_peak_target(float lufs);

}  // namespace masterprint
