#pragma once

/// @file dynamics_features.h
/// @brief Loudness, crest factor and seven-band energy distribution.

#include <array>

#include "core/audio.h"
#include "fingerprint/fingerprint.h"

namespace masterprint {

/// @brief Number of analysis bands (sub-bass .. air).
constexpr size_t kNumBands = 7;

/// @brief Band edges in Hz, [low, high).
struct BandEdges {
  float low_hz;
  float high_hz;
};

/// @brief Returns the seven band edges (20-60, 60-250, 250-500, 500-2k, 2k-4k, 4k-6k, 6k-20k).
const std::array<BandEdges, kNumBands>& band_edges();

/// @brief Sums spectral power inside each band.
/// @details Power is averaged over STFT frames so the spectrum resolution is independent of
///          signal length.
std::array<double, kNumBands> band_energies(const Audio& audio);

/// @brief Computes lufs, crest_db and bass_mid_ratio.
/// @details lufs = 20 log10(rms + 1e-10) + 0.691, crest_db = 20 log10(peak / rms),
///          bass_mid_ratio = 10 log10(bass / mid) (0 when mid has no energy).
FeatureMap extract_dynamics(const Audio& audio);

/// @brief Computes the seven band fractions (summing to 1, all 0 on silence).
FeatureMap extract_frequency_bands(const Audio& audio);

}  // namespace masterprint
