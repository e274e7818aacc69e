#pragma once

/// @file streaming_harmonic.h
/// @brief Incremental harmonic analysis over a live audio stream.

#include <random>
#include <vector>

#include "backend/dsp_backend.h"
#include "streaming/streaming_config.h"

namespace masterprint {

/// @brief Current harmonic estimate of a stream.
struct HarmonicEstimate {
  float harmonic_ratio;
  float pitch_stability;
  float chroma_energy;
  float confidence;  ///< 0.0 before the first analysis, 1.0 once enough chunks were seen
};

/// @brief Streaming harmonic analyzer.
/// @details Buffers audio into fixed-length chunks. Every completed chunk runs the batch
/// harmonic computation once and is folded into running means. Voiced pitch values are kept
/// in a bounded reservoir sampled uniformly over the whole stream, so pitch stability covers
/// the full history at constant memory.
///
/// One producer per instance; there is no internal locking.
///
/// @code
///   StreamingHarmonicAnalyzer analyzer(backend, 22050);
///   while (auto block = source.next()) {
///     HarmonicEstimate est = analyzer.update(block.data(), block.size());
///   }
/// @endcode
class StreamingHarmonicAnalyzer {
 public:
  /// @param backend DSP backend (must outlive the analyzer)
  /// @param sample_rate Stream sample rate in Hz
  /// @param config Chunking, reservoir and seed settings
  StreamingHarmonicAnalyzer(const DspBackend& backend, int sample_rate,
                            const StreamingHarmonicConfig& config = StreamingHarmonicConfig());

  // Non-copyable, movable
  StreamingHarmonicAnalyzer(const StreamingHarmonicAnalyzer&) = delete;
  StreamingHarmonicAnalyzer& operator=(const StreamingHarmonicAnalyzer&) = delete;
  StreamingHarmonicAnalyzer(StreamingHarmonicAnalyzer&&) = default;
  StreamingHarmonicAnalyzer& operator=(StreamingHarmonicAnalyzer&&) = default;

  /// @brief Appends samples and analyzes every chunk they complete.
  /// @return Estimate after the update
  HarmonicEstimate update(const float* samples, size_t n_samples);

  /// @brief Returns the current estimate without consuming audio.
  HarmonicEstimate estimate() const;

  /// @brief Returns min(1, analyses / full_confidence_analyses).
  float confidence() const;

  /// @brief Discards all state, including the reservoir RNG position.
  void reset();

  /// @brief Number of chunks analyzed so far.
  int analyses() const { return state_.analyses; }

  /// @brief Voiced pitch values currently held in the reservoir.
  const std::vector<float>& reservoir() const { return state_.reservoir; }

 private:
  struct State {
    explicit State(uint32_t seed) : rng(seed) {}

    std::vector<float> pending;
    std::vector<float> reservoir;
    size_t voiced_seen = 0;
    double ratio_sum = 0.0;
    int ratio_count = 0;
    double chroma_sum = 0.0;
    int chroma_count = 0;
    int analyses = 0;
    std::mt19937 rng;
  };

  void analyze_chunk(const std::vector<float>& chunk);
  void offer_pitch(float f0);

  const DspBackend* backend_;
  int sample_rate_;
  StreamingHarmonicConfig config_;
  size_t chunk_samples_;
  State state_;
};

}  // namespace masterprint
