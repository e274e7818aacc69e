#pragma once

/// @file spectrum.h
/// @brief STFT/iSTFT and Spectrogram class.

#include <complex>
#include <vector>

#include "core/audio.h"
#include "util/types.h"

namespace masterprint {

/// @brief Configuration for STFT computation.
struct StftConfig {
  int n_fft = 2048;                      ///< FFT size
  int hop_length = 512;                  ///< Hop length between frames
  int win_length = 0;                    ///< Window length (0 = n_fft)
  WindowType window = WindowType::Hann;  ///< Window function
  bool center = true;                    ///< Zero-pad signal by n_fft/2 on both sides

  /// @brief Returns actual window length (defaults to n_fft if 0).
  int actual_win_length() const { return win_length > 0 ? win_length : n_fft; }
};

/// @brief Spectrogram computed from audio via STFT.
/// @details Data is stored as [n_bins x n_frames] in row-major order:
///          data[bin * n_frames + frame].
/// @note magnitude() and power() cache lazily, so one instance must not be shared between
///       threads without synchronization.
class Spectrogram {
 public:
  Spectrogram();

  /// @brief Computes STFT of audio signal.
  /// @param audio Input audio
  /// @param config STFT configuration
  /// @return Spectrogram (empty for empty audio)
  static Spectrogram compute(const Audio& audio, const StftConfig& config = StftConfig());

  /// @brief Creates Spectrogram from existing complex spectrum data [n_bins x n_frames].
  static Spectrogram from_complex(const std::complex<float>* data, int n_bins, int n_frames,
                                  int n_fft, int hop_length, int sample_rate);

  int n_bins() const { return n_bins_; }
  int n_frames() const { return n_frames_; }
  int n_fft() const { return n_fft_; }
  int hop_length() const { return hop_length_; }
  int sample_rate() const { return sample_rate_; }
  bool empty() const { return n_frames_ == 0 || n_bins_ == 0; }

  /// @brief Returns view of complex spectrum [n_bins x n_frames].
  MatrixView<std::complex<float>> complex_view() const;

  const std::complex<float>* complex_data() const { return data_.data(); }

  /// @brief Returns magnitude spectrum [n_bins x n_frames] (cached).
  const std::vector<float>& magnitude() const;

  /// @brief Returns power spectrum [n_bins x n_frames] (cached).
  const std::vector<float>& power() const;

  /// @brief Center frequency of a bin in Hz.
  float bin_frequency(int bin) const;

  /// @brief Reconstructs audio via iSTFT (overlap-add, window-squared normalization).
  /// @param length Target length in samples (0 = full length minus center padding)
  /// @param window Synthesis window
  Audio to_audio(int length = 0, WindowType window = WindowType::Hann) const;

 private:
  Spectrogram(std::vector<std::complex<float>> data, int n_bins, int n_frames, int n_fft,
              int hop_length, int sample_rate);

  std::vector<std::complex<float>> data_;
  int n_bins_;
  int n_frames_;
  int n_fft_;
  int hop_length_;
  int sample_rate_;

  mutable std::vector<float> magnitude_cache_;
  mutable std::vector<float> power_cache_;
};

}  // namespace masterprint
