#pragma once

/// @file chroma_filterbank.h
/// @brief Chroma filterbank mapping STFT bins onto 12 pitch classes.

#include <Eigen/Core>

namespace masterprint {

/// @brief Converts frequency to fractional pitch class in [0, 12), C = 0.
/// @return -1 for non-positive frequencies
float hz_to_chroma(float hz);

/// @brief Creates a chroma filterbank.
/// @details Each bin from C1 upward is split linearly between its two nearest pitch classes.
///          Rows are normalized to unit sum.
/// @param sr Sample rate in Hz
/// @param n_fft FFT size
/// @return Matrix [12 x (n_fft/2 + 1)]
Eigen::MatrixXf create_chroma_filterbank(int sr, int n_fft);

/// @brief Normalizes every column so its maximum is 1 (silent columns stay 0).
void normalize_chroma_columns(Eigen::MatrixXf& chroma);

}  // namespace masterprint
