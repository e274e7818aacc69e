#include "core/spectrum.h"

#include <algorithm>
#include <cmath>

#include "core/fft.h"
#include "core/window.h"
#include "util/exception.h"

namespace masterprint {

Spectrogram::Spectrogram() : n_bins_(0), n_frames_(0), n_fft_(0), hop_length_(0), sample_rate_(0) {}

Spectrogram::Spectrogram(std::vector<std::complex<float>> data, int n_bins, int n_frames, int n_fft,
                         int hop_length, int sample_rate)
    : data_(std::move(data)),
      n_bins_(n_bins),
      n_frames_(n_frames),
      n_fft_(n_fft),
      hop_length_(hop_length),
      sample_rate_(sample_rate) {}

Spectrogram Spectrogram::compute(const Audio& audio, const StftConfig& config) {
  if (audio.empty()) {
    return Spectrogram();
  }

  MASTERPRINT_CHECK(config.n_fft > 0, ErrorCode::InvalidParameter);
  MASTERPRINT_CHECK(config.hop_length > 0, ErrorCode::InvalidParameter);

  int n_fft = config.n_fft;
  int hop_length = config.hop_length;
  int win_length = config.actual_win_length();

  MASTERPRINT_CHECK(win_length <= n_fft, ErrorCode::InvalidParameter);

  const std::vector<float>& window = get_window_cached(config.window, win_length);

  std::vector<float> padded_window(n_fft, 0.0f);
  int win_offset = (n_fft - win_length) / 2;
  std::copy(window.begin(), window.end(), padded_window.begin() + win_offset);

  const float* signal = audio.data();
  size_t signal_length = audio.size();

  std::vector<float> padded_signal;
  if (config.center) {
    size_t pad = static_cast<size_t>(n_fft / 2);
    padded_signal.assign(signal_length + 2 * pad, 0.0f);
    std::copy(signal, signal + signal_length, padded_signal.begin() + pad);
    signal = padded_signal.data();
    signal_length = padded_signal.size();
  }

  // Short signals still produce one zero-padded frame.
  int n_frames = 1;
  if (signal_length > static_cast<size_t>(n_fft)) {
    n_frames += static_cast<int>((signal_length - n_fft) / hop_length);
  }

  int n_bins = n_fft / 2 + 1;
  std::vector<std::complex<float>> spectrum(static_cast<size_t>(n_bins) * n_frames);

  FFT fft(n_fft);
  std::vector<float> frame(n_fft);
  std::vector<std::complex<float>> frame_spectrum(n_bins);

  for (int t = 0; t < n_frames; ++t) {
    size_t start = static_cast<size_t>(t) * hop_length;
    int valid = static_cast<int>(std::min<size_t>(n_fft, signal_length - start));

    for (int i = 0; i < valid; ++i) {
      frame[i] = signal[start + i] * padded_window[i];
    }
    std::fill(frame.begin() + valid, frame.end(), 0.0f);

    fft.forward(frame.data(), frame_spectrum.data());

    for (int f = 0; f < n_bins; ++f) {
      spectrum[static_cast<size_t>(f) * n_frames + t] = frame_spectrum[f];
    }
  }

  return Spectrogram(std::move(spectrum), n_bins, n_frames, n_fft, hop_length, audio.sample_rate());
}

Spectrogram Spectrogram::from_complex(const std::complex<float>* data, int n_bins, int n_frames,
                                      int n_fft, int hop_length, int sample_rate) {
  std::vector<std::complex<float>> spectrum(data, data + static_cast<size_t>(n_bins) * n_frames);
  return Spectrogram(std::move(spectrum), n_bins, n_frames, n_fft, hop_length, sample_rate);
}

MatrixView<std::complex<float>> Spectrogram::complex_view() const {
  return MatrixView<std::complex<float>>(data_.data(), n_bins_, n_frames_);
}

const std::vector<float>& Spectrogram::magnitude() const {
  if (magnitude_cache_.empty() && !data_.empty()) {
    magnitude_cache_.resize(data_.size());
    for (size_t i = 0; i < data_.size(); ++i) {
      magnitude_cache_[i] = std::abs(data_[i]);
    }
  }
  return magnitude_cache_;
}

const std::vector<float>& Spectrogram::power() const {
  if (power_cache_.empty() && !data_.empty()) {
    power_cache_.resize(data_.size());
    for (size_t i = 0; i < data_.size(); ++i) {
      power_cache_[i] = std::norm(data_[i]);
    }
  }
  return power_cache_;
}

float Spectrogram::bin_frequency(int bin) const {
  if (n_fft_ == 0) return 0.0f;
  return static_cast<float>(bin) * sample_rate_ / n_fft_;
}

Audio Spectrogram::to_audio(int length, WindowType window_type) const {
  if (empty()) {
    return Audio();
  }

  const std::vector<float>& window = get_window_cached(window_type, n_fft_);

  int full_length = (n_frames_ - 1) * hop_length_ + n_fft_;
  std::vector<float> output(full_length, 0.0f);
  std::vector<float> window_sum(full_length, 0.0f);

  FFT fft(n_fft_);
  std::vector<std::complex<float>> frame_spectrum(n_bins_);
  std::vector<float> frame(n_fft_);

  for (int t = 0; t < n_frames_; ++t) {
    for (int f = 0; f < n_bins_; ++f) {
      frame_spectrum[f] = data_[static_cast<size_t>(f) * n_frames_ + t];
    }
    fft.inverse(frame_spectrum.data(), frame.data());

    int start = t * hop_length_;
    for (int i = 0; i < n_fft_; ++i) {
      output[start + i] += frame[i] * window[i];
      window_sum[start + i] += window[i] * window[i];
    }
  }

  constexpr float kMinWindowSum = 1e-8f;
  for (int i = 0; i < full_length; ++i) {
    if (window_sum[i] > kMinWindowSum) {
      output[i] /= window_sum[i];
    }
  }

  // Remove the centering pad.
  int trim_start = n_fft_ / 2;
  int trim_end = full_length - n_fft_ / 2;
  if (length > 0) {
    trim_end = std::min(trim_start + length, full_length);
  }

  std::vector<float> trimmed(output.begin() + trim_start, output.begin() + trim_end);
  if (length > 0 && static_cast<int>(trimmed.size()) < length) {
    trimmed.resize(length, 0.0f);
  }
  return Audio::from_vector(std::move(trimmed), sample_rate_);
}

}  // namespace masterprint
