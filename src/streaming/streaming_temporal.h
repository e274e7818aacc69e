#pragma once

/// @file streaming_temporal.h
/// @brief Incremental tempo, rhythm, transient and silence estimation.

#include <deque>
#include <vector>

#include "fingerprint/temporal_features.h"
#include "streaming/streaming_config.h"

namespace masterprint {

/// @brief Current temporal estimate of a stream.
struct TemporalEstimate {
  float tempo_bpm;
  float rhythm_stability;
  float transient_density;
  float silence_ratio;
  float confidence;
};

/// @brief Streaming temporal analyzer.
/// @details Keeps a rolling audio buffer that is re-analyzed for tempo, rhythm and
/// transients every time a full window of new audio has arrived, and a rolling per-frame
/// loudness history that is updated on every frame and yields the silence ratio. The
/// loudest frame is tracked with a monotonic deque and frame levels are counted in a
/// Fenwick tree over 0.25 dB bins, so neither update() nor estimate() scans the history.
class StreamingTemporalAnalyzer {
 public:
  explicit StreamingTemporalAnalyzer(int sample_rate,
                                     const StreamingTemporalConfig& config = StreamingTemporalConfig(),
                                     const TemporalConfig& analysis = TemporalConfig());

  // Non-copyable, movable
  StreamingTemporalAnalyzer(const StreamingTemporalAnalyzer&) = delete;
  StreamingTemporalAnalyzer& operator=(const StreamingTemporalAnalyzer&) = delete;
  StreamingTemporalAnalyzer(StreamingTemporalAnalyzer&&) = default;
  StreamingTemporalAnalyzer& operator=(StreamingTemporalAnalyzer&&) = default;

  TemporalEstimate update(const float* samples, size_t n_samples);
  TemporalEstimate estimate() const;

  /// @brief Returns min(1, window analyses / full_confidence_analyses).
  float confidence() const;
  void reset();

  /// @brief Number of rolling-window analyses run so far.
  int analyses() const { return state_.analyses; }

  /// @brief Number of loudness frames currently held.
  size_t loudness_frames() const { return state_.loudness_db.size(); }

 private:
  struct State {
    std::deque<float> window;
    size_t new_samples = 0;
    std::vector<float> frame;
    std::deque<float> loudness_db;
    std::deque<float> loudest_db;      ///< Non-increasing; front is the current maximum
    std::vector<int> level_counts;     ///< Fenwick tree of frames per loudness bin
    double tempo_sum = 0.0;
    int tempo_count = 0;
    double rhythm_sum = 0.0;
    int rhythm_count = 0;
    double transient_sum = 0.0;
    int transient_count = 0;
    int analyses = 0;
  };

  void push_loudness_frame();
  void count_level(float db, int delta);
  size_t frames_below(size_t bin) const;
  float silence_ratio() const;
  void analyze_window();

  int sample_rate_;
  StreamingTemporalConfig config_;
  TemporalConfig analysis_;
  size_t window_samples_;
  size_t loudness_capacity_;
  size_t loudness_bins_;
  State state_;
};

}  // namespace masterprint
