#pragma once

/// @file streaming_spectral.h
/// @brief Incremental spectral centroid, rolloff and flatness.

#include <complex>
#include <deque>
#include <vector>

#include "core/fft.h"
#include "streaming/streaming_config.h"

namespace masterprint {

/// @brief Current spectral estimate of a stream (normalized like the batch extractor).
struct SpectralEstimate {
  float spectral_centroid;
  float spectral_rolloff;
  float spectral_flatness;
  float confidence;
};

/// @brief Streaming spectral analyzer.
/// @details Centroid and flatness are running means updated in O(1) per frame. Rolloff is
/// recomputed from a bounded window of the most recent magnitude spectra.
/// Confidence is min(1, frames / full_confidence_frames).
class StreamingSpectralAnalyzer {
 public:
  /// @param sample_rate Stream sample rate in Hz
  /// @param config Frame and window settings
  explicit StreamingSpectralAnalyzer(int sample_rate,
                                     const StreamingSpectralConfig& config = StreamingSpectralConfig());

  // Non-copyable, movable
  StreamingSpectralAnalyzer(const StreamingSpectralAnalyzer&) = delete;
  StreamingSpectralAnalyzer& operator=(const StreamingSpectralAnalyzer&) = delete;
  StreamingSpectralAnalyzer(StreamingSpectralAnalyzer&&) = default;
  StreamingSpectralAnalyzer& operator=(StreamingSpectralAnalyzer&&) = default;

  /// @brief Appends samples and processes every complete frame.
  SpectralEstimate update(const float* samples, size_t n_samples);

  SpectralEstimate estimate() const;
  float confidence() const;
  void reset();

  /// @brief Number of frames processed so far.
  int frames() const { return state_.frames; }

 private:
  struct State {
    std::vector<float> pending;
    std::deque<std::vector<float>> recent;
    double centroid_sum = 0.0;
    double flatness_sum = 0.0;
    int frames = 0;
  };

  void process_frame(const float* frame);

  int sample_rate_;
  StreamingSpectralConfig config_;
  FFT fft_;
  std::vector<float> window_;
  std::vector<float> windowed_;
  std::vector<std::complex<float>> spectrum_;
  State state_;
};

}  // namespace masterprint
