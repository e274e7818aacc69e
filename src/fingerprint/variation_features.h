#pragma once

/// @file variation_features.h
/// @brief Frame-to-frame variation of crest factor, loudness and peaks.

#include "core/audio.h"
#include "fingerprint/fingerprint.h"
#include "fingerprint/frame_features.h"

namespace masterprint {

/// @brief Computes dynamic_range_variation, loudness_variation_std and peak_consistency.
/// @details dynamic_range_variation = std(frame crest dB) / 6 clipped to [0, 1];
///          loudness_variation_std = std(frame RMS dB) clipped to [0, 10];
///          peak_consistency = 1 / (1 + CV(frame peaks)).
FeatureMap extract_variation(const Audio& audio, const FrameConfig& frames = FrameConfig());

}  // namespace masterprint
