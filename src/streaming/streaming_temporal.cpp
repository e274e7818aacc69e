#include "streaming/streaming_temporal.h"

#include <algorithm>
#include <cmath>

#include "core/audio.h"
#include "fingerprint/fingerprint.h"
#include "util/exception.h"
#include "util/log.h"
#include "util/math_utils.h"

namespace masterprint {

namespace {

constexpr float kLevelBinDb = 0.25f;
constexpr float kLevelCeilingDb = 40.0f;

/// @brief Level at the epsilon floor, i.e. digital silence.
float floor_db() { return amplitude_to_db(0.0f); }

/// @brief Loudness bin of a level. Bin 0 holds digital silence.
size_t level_bin(float db, size_t n_bins) {
  if (db <= floor_db()) return 0;
  float position = std::floor((db - floor_db()) / kLevelBinDb);
  return std::min(n_bins - 1, 1 + static_cast<size_t>(std::max(0.0f, position)));
}

}  // namespace

StreamingTemporalAnalyzer::StreamingTemporalAnalyzer(int sample_rate,
                                                     const StreamingTemporalConfig& config,
                                                     const TemporalConfig& analysis)
    : sample_rate_(sample_rate), config_(config), analysis_(analysis) {
  MASTERPRINT_CHECK(sample_rate > 0, ErrorCode::InvalidParameter);
  MASTERPRINT_CHECK(config.window_seconds > 0.0f && config.loudness_seconds > 0.0f,
                    ErrorCode::InvalidParameter);
  MASTERPRINT_CHECK(config.loudness_frame > 0, ErrorCode::InvalidParameter);
  MASTERPRINT_CHECK(config.full_confidence_analyses > 0, ErrorCode::InvalidParameter);
  window_samples_ = static_cast<size_t>(std::round(config.window_seconds * sample_rate));
  loudness_capacity_ = std::max<size_t>(
      1, static_cast<size_t>(config.loudness_seconds * sample_rate / config.loudness_frame));
  loudness_bins_ =
      2 + static_cast<size_t>(std::ceil((kLevelCeilingDb - floor_db()) / kLevelBinDb));
  state_.level_counts.assign(loudness_bins_ + 1, 0);
}

TemporalEstimate StreamingTemporalAnalyzer::update(const float* samples, size_t n_samples) {
  size_t frame_len = static_cast<size_t>(config_.loudness_frame);
  for (size_t i = 0; i < n_samples; ++i) {
    float s = samples[i];

    state_.window.push_back(s);
    if (state_.window.size() > window_samples_) {
      state_.window.pop_front();
    }
    if (++state_.new_samples >= window_samples_) {
      analyze_window();
      state_.new_samples = 0;
    }

    state_.frame.push_back(s);
    if (state_.frame.size() == frame_len) {
      push_loudness_frame();
    }
  }
  return estimate();
}

void StreamingTemporalAnalyzer::push_loudness_frame() {
  float db = amplitude_to_db(rms(state_.frame.data(), state_.frame.size()));
  state_.frame.clear();

  state_.loudness_db.push_back(db);
  count_level(db, 1);
  while (!state_.loudest_db.empty() && state_.loudest_db.back() < db) {
    state_.loudest_db.pop_back();
  }
  state_.loudest_db.push_back(db);

  if (state_.loudness_db.size() > loudness_capacity_) {
    float expired = state_.loudness_db.front();
    state_.loudness_db.pop_front();
    count_level(expired, -1);
    if (state_.loudest_db.front() == expired) {
      state_.loudest_db.pop_front();
    }
  }
}

void StreamingTemporalAnalyzer::count_level(float db, int delta) {
  for (size_t i = level_bin(db, loudness_bins_) + 1; i <= loudness_bins_; i += i & (~i + 1)) {
    state_.level_counts[i] += delta;
  }
}

size_t StreamingTemporalAnalyzer::frames_below(size_t bin) const {
  int count = 0;
  for (size_t i = bin; i > 0; i -= i & (~i + 1)) {
    count += state_.level_counts[i];
  }
  return static_cast<size_t>(count);
}

float StreamingTemporalAnalyzer::silence_ratio() const {
  if (state_.loudness_db.empty()) {
    return field_spec(FingerprintField::SilenceRatio).default_value;
  }
  // Digital silence (bin 0) always counts as silent.
  size_t threshold = level_bin(state_.loudest_db.front() + config_.silence_db, loudness_bins_);
  size_t silent = frames_below(std::max<size_t>(threshold, 1));
  return static_cast<float>(silent) / state_.loudness_db.size();
}

void StreamingTemporalAnalyzer::analyze_window() {
  std::vector<float> samples(state_.window.begin(), state_.window.end());
  Audio audio = Audio::from_vector(std::move(samples), sample_rate_);
  ++state_.analyses;

  std::vector<float> envelope;
  try {
    envelope = onset_envelope(audio, analysis_);
  } catch (const std::exception& e) {
    logger()->warn("Streaming onset envelope failed: {}", e.what());
    return;
  }

  // A flat window (silence, drones) has no tempo; it simply does not contribute.
  try {
    float tempo = estimate_tempo(envelope, sample_rate_, analysis_);
    state_.tempo_sum += tempo;
    ++state_.tempo_count;
    state_.rhythm_sum +=
        rhythm_stability_from_beats(track_beats(envelope, tempo, sample_rate_, analysis_));
    ++state_.rhythm_count;
  } catch (const MasterprintException& e) {
    logger()->debug("Streaming tempo skipped: {}", e.what());
  }

  float per_second = pick_onsets(envelope, sample_rate_, analysis_).size() / audio.duration();
  state_.transient_sum += clamp(per_second / 10.0f, 0.0f, 1.0f);
  ++state_.transient_count;
}

TemporalEstimate StreamingTemporalAnalyzer::estimate() const {
  auto running = [](double sum, int count, FingerprintField field) {
    return count > 0 ? static_cast<float>(sum / count) : field_spec(field).default_value;
  };

  TemporalEstimate est;
  est.tempo_bpm = running(state_.tempo_sum, state_.tempo_count, FingerprintField::TempoBpm);
  est.rhythm_stability =
      running(state_.rhythm_sum, state_.rhythm_count, FingerprintField::RhythmStability);
  est.transient_density =
      running(state_.transient_sum, state_.transient_count, FingerprintField::TransientDensity);

  est.silence_ratio = silence_ratio();

  est.confidence = confidence();
  return est;
}

float StreamingTemporalAnalyzer::confidence() const {
  return std::min(1.0f, static_cast<float>(state_.analyses) / config_.full_confidence_analyses);
}

void StreamingTemporalAnalyzer::reset() {
  state_ = State();
  state_.level_counts.assign(loudness_bins_ + 1, 0);
}

}  // namespace masterprint
