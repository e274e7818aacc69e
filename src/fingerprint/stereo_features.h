#pragma once

/// @file stereo_features.h
/// @brief Stereo width and inter-channel phase correlation.

#include "core/audio_buffer.h"
#include "fingerprint/fingerprint.h"

namespace masterprint {

/// @brief side energy / (mid + side energy); 0 for mono or silence.
float stereo_width_of(const AudioBuffer& buffer);

/// @brief Pearson correlation of left and right; 1.0 for mono or silence.
float phase_correlation_of(const AudioBuffer& buffer);

/// @brief Computes stereo_width and phase_correlation from the first two channels.
FeatureMap extract_stereo(const AudioBuffer& buffer);

}  // namespace masterprint
