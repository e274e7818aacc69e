#pragma once

/// @file harmonic_features.h
/// @brief Harmonic ratio, pitch stability and chroma energy.

#include <vector>

#include <Eigen/Core>

#include "backend/dsp_backend.h"
#include "core/audio.h"
#include "fingerprint/fingerprint.h"

namespace masterprint {

/// @brief Chroma mean that maps to chroma_energy 1.0.
constexpr float kChromaFullScale = 0.4f;

/// @brief harmonic RMS / (harmonic RMS + percussive RMS).
float harmonic_ratio_from(const HarmonicPercussive& components);

/// @brief 1 / (1 + CV * 10) over voiced f0 values.
/// @return Field default when fewer than two frames are voiced
float pitch_stability_from(const std::vector<float>& f0);

/// @brief mean(chroma) / 0.4 clipped to [0, 1].
float chroma_energy_from(const Eigen::MatrixXf& chroma);

/// @brief Computes harmonic_ratio, pitch_stability and chroma_energy.
/// @details Each backend call is guarded on its own; a failure sets only that field to its
///          default.
FeatureMap extract_harmonic(const DspBackend& backend, const Audio& audio);

}  // namespace masterprint
