#pragma once

/// @file spectral_features.h
/// @brief Spectral centroid, rolloff and flatness.

#include <vector>

#include "core/audio.h"
#include "core/spectrum.h"
#include "fingerprint/fingerprint.h"

namespace masterprint {

/// @brief Normalization constants for the spectral fields.
constexpr float kCentroidNormHz = 8000.0f;
constexpr float kRolloffNormHz = 10000.0f;
constexpr float kRolloffPercent = 0.85f;

/// @brief Per-frame centroid in Hz from a magnitude spectrogram.
std::vector<float> spectral_centroid(const Spectrogram& spec);

/// @brief Per-frame rolloff frequency in Hz (energy-based).
std::vector<float> spectral_rolloff(const Spectrogram& spec, float roll_percent = kRolloffPercent);

/// @brief Per-frame flatness (geometric / arithmetic mean of magnitude) in [0, 1].
std::vector<float> spectral_flatness(const Spectrogram& spec);

/// @brief Centroid, rolloff and flatness of a magnitude spectrum column.
/// @details Shared by the batch and streaming analyzers.
float column_centroid(const float* magnitude, int n_bins, float bin_hz);
float column_rolloff(const float* magnitude, int n_bins, float bin_hz,
                     float roll_percent = kRolloffPercent);
float column_flatness(const float* magnitude, int n_bins);

/// @brief Computes spectral_centroid, spectral_rolloff and spectral_flatness from one STFT.
FeatureMap extract_spectral(const Audio& audio);

}  // namespace masterprint
