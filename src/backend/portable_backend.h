#pragma once

/// @file portable_backend.h
/// @brief Scalar fallback backend without vectorized kernels.

#include "backend/dsp_backend.h"

namespace masterprint {

/// @brief Plain-loop backend: short-kernel HPSS, autocorrelation f0, nearest-class chroma.
/// @details Bound when the native backend fails its startup probe or when forced by
///          configuration.
class PortableBackend : public DspBackend {
 public:
  std::string name() const override { return "portable"; }
  HarmonicPercussive separate_harmonic_percussive(const Audio& audio) const override;
  std::vector<float> track_pitch(const Audio& audio, float fmin, float fmax) const override;
  Eigen::MatrixXf chroma(const Audio& audio) const override;
};

}  // namespace masterprint
