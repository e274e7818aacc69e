#pragma once

/// @file frame_features.h
/// @brief Frame-wise level statistics shared by the extractors.

#include <cstddef>
#include <vector>

namespace masterprint {

/// @brief Frame layout for level statistics.
struct FrameConfig {
  int frame_length = 2048;
  int hop_length = 512;
};

/// @brief Number of frames for a signal (at least one when size > 0).
size_t frame_count(size_t size, const FrameConfig& config);

/// @brief RMS of every frame. The last frame may be partial.
std::vector<float> frame_rms(const float* samples, size_t size,
                             const FrameConfig& config = FrameConfig());

/// @brief Absolute peak of every frame.
std::vector<float> frame_peaks(const float* samples, size_t size,
                               const FrameConfig& config = FrameConfig());

/// @brief Converts frame RMS values to dB relative to the loudest frame.
/// @details Values are floored at -80 dB. An all-silent input maps to all -80.
std::vector<float> rms_to_relative_db(const std::vector<float>& rms_values);

}  // namespace masterprint
