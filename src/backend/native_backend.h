#pragma once

/// @file native_backend.h
/// @brief Vectorized backend built on Eigen and KissFFT.

#include "backend/dsp_backend.h"
#include "core/spectrum.h"

namespace masterprint {

/// @brief Median-filter HPSS configuration.
struct HpssConfig {
  int kernel_size_harmonic = 31;    ///< Time-axis median length (frames)
  int kernel_size_percussive = 31;  ///< Frequency-axis median length (bins)
  float power = 2.0f;               ///< Soft mask exponent
};

/// @brief Eigen/KissFFT backend: sliding-median HPSS, YIN f0, filterbank chroma.
class NativeBackend : public DspBackend {
 public:
  explicit NativeBackend(const HpssConfig& hpss = HpssConfig(),
                         const StftConfig& stft = StftConfig());

  std::string name() const override { return "native"; }
  HarmonicPercussive separate_harmonic_percussive(const Audio& audio) const override;
  std::vector<float> track_pitch(const Audio& audio, float fmin, float fmax) const override;
  Eigen::MatrixXf chroma(const Audio& audio) const override;

 private:
  HpssConfig hpss_;
  StftConfig stft_;
};

}  // namespace masterprint
