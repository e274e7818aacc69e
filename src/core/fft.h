#pragma once

/// @file fft.h
/// @brief Real FFT wrapper using KissFFT.

#include <complex>
#include <memory>
#include <vector>

namespace masterprint {

/// @brief Real-valued FFT processor using KissFFT.
/// @details One instance per thread; KissFFT state is modified during computation.
class FFT {
 public:
  /// @brief Constructs FFT processor.
  /// @param n_fft FFT size (even)
  /// @throws MasterprintException if allocation fails
  explicit FFT(int n_fft);
  ~FFT();

  FFT(const FFT&) = delete;
  FFT& operator=(const FFT&) = delete;
  FFT(FFT&&) noexcept;
  FFT& operator=(FFT&&) noexcept;

  /// @brief Forward real FFT.
  /// @param input Input signal [n_fft]
  /// @param output Complex spectrum [n_bins]
  void forward(const float* input, std::complex<float>* output);

  /// @brief Inverse real FFT, scaled by 1/n_fft.
  /// @param input Complex spectrum [n_bins]
  /// @param output Output signal [n_fft]
  void inverse(const std::complex<float>* input, float* output);

  int n_fft() const { return n_fft_; }
  int n_bins() const { return n_fft_ / 2 + 1; }

 private:
  int n_fft_;
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace masterprint
