#pragma once

/// @file resample.h
/// @brief Sample rate conversion using r8brain.

#include <vector>

#include "core/audio.h"

namespace masterprint {

/// @brief Resamples mono audio to a target sample rate.
/// @param audio Input audio
/// @param target_sr Target sample rate in Hz
/// @return Resampled audio (shares the input when rates already match)
Audio resample(const Audio& audio, int target_sr);

/// @brief Resamples raw samples to a target sample rate.
/// @param samples Input samples
/// @param size Number of samples
/// @param src_sr Source sample rate in Hz
/// @param target_sr Target sample rate in Hz
/// @return round(size * target_sr / src_sr) samples
std::vector<float> resample(const float* samples, size_t size, int src_sr, int target_sr);

}  // namespace masterprint
