#pragma once

/// @file streaming_config.h
/// @brief Configuration for the incremental fingerprint analyzers.

#include <cstddef>
#include <cstdint>

namespace masterprint {

/// @brief Configuration for StreamingHarmonicAnalyzer.
struct StreamingHarmonicConfig {
  float chunk_seconds = 0.5f;          ///< Audio accumulated before each batch analysis
  size_t reservoir_size = 1024;        ///< Voiced pitch values kept for pitch stability
  uint32_t seed = 0x5eed;              ///< Reservoir RNG seed
  int full_confidence_analyses = 5;    ///< Analyses needed for confidence 1.0
};

/// @brief Configuration for StreamingSpectralAnalyzer.
struct StreamingSpectralConfig {
  int n_fft = 2048;                    ///< FFT size
  int hop_length = 512;                ///< Hop length between frames
  size_t rolloff_window_frames = 43;   ///< Recent spectra kept for rolloff (about 1 s at 22050 Hz)
  int full_confidence_frames = 43;     ///< Frames needed for confidence 1.0

  /// @brief Returns number of frequency bins.
  int n_bins() const { return n_fft / 2 + 1; }
};

/// @brief Configuration for StreamingTemporalAnalyzer.
struct StreamingTemporalConfig {
  float window_seconds = 2.0f;         ///< Rolling audio buffer re-analyzed for rhythm
  float loudness_seconds = 10.0f;      ///< Rolling per-frame loudness history
  int loudness_frame = 512;            ///< Samples per loudness frame
  float silence_db = -40.0f;           ///< Silence threshold relative to the loudest frame
  int full_confidence_analyses = 5;    ///< Analyses needed for confidence 1.0
};

}  // namespace masterprint
