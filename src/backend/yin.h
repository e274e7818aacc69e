#pragma once

/// @file yin.h
/// @brief YIN fundamental frequency estimation.

#include <vector>

#include "core/audio.h"

namespace masterprint {

/// @brief YIN tracking configuration.
struct YinConfig {
  int frame_length = 2048;  ///< Frame length in samples
  int hop_length = 512;     ///< Hop length in samples
  float fmin = 65.41f;      ///< Minimum frequency in Hz (C2)
  float fmax = 2093.0f;     ///< Maximum frequency in Hz (C7)
  float threshold = 0.2f;   ///< CMNDF threshold for the first dip
};

/// @brief Computes the YIN difference function d(tau) for tau in [0, max_lag).
std::vector<float> yin_difference(const float* frame, int frame_length, int max_lag);

/// @brief Computes the cumulative mean normalized difference function.
std::vector<float> yin_cmndf(const std::vector<float>& diff);

/// @brief Finds the best period with parabolic interpolation.
/// @return Period in samples (fractional), or 0 if unvoiced
float yin_find_period(const std::vector<float>& cmndf, float threshold, int min_period,
                      int max_period);

/// @brief Estimates f0 for a single frame.
/// @return Frequency in Hz, 0 if unvoiced
float yin_frame(const float* frame, int frame_length, int sr, float fmin, float fmax,
                float threshold);

/// @brief Tracks f0 over a whole signal.
/// @return f0 per frame in Hz (0 = unvoiced); empty when audio is shorter than one frame
std::vector<float> yin_track(const Audio& audio, const YinConfig& config = YinConfig());

}  // namespace masterprint
