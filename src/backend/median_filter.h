#pragma once

/// @file median_filter.h
/// @brief Median filters along the time and frequency axes of a magnitude spectrogram.

#include <vector>

namespace masterprint {

/// @brief Median filter along time (per frequency bin).
/// @param magnitude Magnitude spectrogram [n_bins x n_frames]
/// @param n_bins Number of frequency bins
/// @param n_frames Number of time frames
/// @param kernel_size Filter kernel size (odd)
/// @return Filtered magnitude [n_bins x n_frames]
std::vector<float> median_filter_horizontal(const float* magnitude, int n_bins, int n_frames,
                                            int kernel_size);

/// @brief Median filter along frequency (per frame).
/// @param magnitude Magnitude spectrogram [n_bins x n_frames]
/// @param n_bins Number of frequency bins
/// @param n_frames Number of time frames
/// @param kernel_size Filter kernel size (odd)
/// @return Filtered magnitude [n_bins x n_frames]
std::vector<float> median_filter_vertical(const float* magnitude, int n_bins, int n_frames,
                                          int kernel_size);

}  // namespace masterprint
