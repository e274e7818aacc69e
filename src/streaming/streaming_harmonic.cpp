#include "streaming/streaming_harmonic.h"

#include <algorithm>
#include <cmath>

#include "core/audio.h"
#include "fingerprint/fingerprint.h"
#include "fingerprint/harmonic_features.h"
#include "util/exception.h"
#include "util/log.h"

namespace masterprint {

StreamingHarmonicAnalyzer::StreamingHarmonicAnalyzer(const DspBackend& backend, int sample_rate,
                                                     const StreamingHarmonicConfig& config)
    : backend_(&backend), sample_rate_(sample_rate), config_(config), state_(config.seed) {
  MASTERPRINT_CHECK(sample_rate > 0, ErrorCode::InvalidParameter);
  MASTERPRINT_CHECK(config.chunk_seconds > 0.0f, ErrorCode::InvalidParameter);
  MASTERPRINT_CHECK(config.reservoir_size > 0, ErrorCode::InvalidParameter);
  MASTERPRINT_CHECK(config.full_confidence_analyses > 0, ErrorCode::InvalidParameter);
  chunk_samples_ = static_cast<size_t>(std::round(config.chunk_seconds * sample_rate));
  state_.pending.reserve(chunk_samples_);
}

HarmonicEstimate StreamingHarmonicAnalyzer::update(const float* samples, size_t n_samples) {
  size_t pos = 0;
  while (pos < n_samples) {
    size_t take = std::min(chunk_samples_ - state_.pending.size(), n_samples - pos);
    state_.pending.insert(state_.pending.end(), samples + pos, samples + pos + take);
    pos += take;
    if (state_.pending.size() == chunk_samples_) {
      analyze_chunk(state_.pending);
      state_.pending.clear();
    }
  }
  return estimate();
}

void StreamingHarmonicAnalyzer::analyze_chunk(const std::vector<float>& chunk) {
  Audio audio = Audio::from_buffer(chunk.data(), chunk.size(), sample_rate_);

  HarmonicPercussive hp = safe_separate_harmonic_percussive(*backend_, audio);
  try {
    state_.ratio_sum += harmonic_ratio_from(hp);
    ++state_.ratio_count;
  } catch (const MasterprintException&) {
    // Silent chunk: no ratio to contribute.
  }

  for (float f0 : safe_track_pitch(*backend_, audio, kPitchFmin, kPitchFmax)) {
    if (f0 > 0.0f) offer_pitch(f0);
  }

  Eigen::MatrixXf chroma = safe_chroma(*backend_, audio);
  if (chroma.size() > 0) {
    state_.chroma_sum += chroma_energy_from(chroma);
    ++state_.chroma_count;
  }

  ++state_.analyses;
  logger()->debug("Streaming harmonic chunk {} analyzed ({} voiced values seen)",
                  state_.analyses, state_.voiced_seen);
}

void StreamingHarmonicAnalyzer::offer_pitch(float f0) {
  // Algorithm R: the n-th value replaces a random slot with probability k/n.
  ++state_.voiced_seen;
  if (state_.reservoir.size() < config_.reservoir_size) {
    state_.reservoir.push_back(f0);
    return;
  }
  std::uniform_int_distribution<size_t> pick(0, state_.voiced_seen - 1);
  size_t slot = pick(state_.rng);
  if (slot < config_.reservoir_size) {
    state_.reservoir[slot] = f0;
  }
}

HarmonicEstimate StreamingHarmonicAnalyzer::estimate() const {
  HarmonicEstimate est;
  est.harmonic_ratio = state_.ratio_count > 0
                           ? static_cast<float>(state_.ratio_sum / state_.ratio_count)
                           : field_spec(FingerprintField::HarmonicRatio).default_value;
  est.pitch_stability = pitch_stability_from(state_.reservoir);
  est.chroma_energy = state_.chroma_count > 0
                          ? static_cast<float>(state_.chroma_sum / state_.chroma_count)
                          : field_spec(FingerprintField::ChromaEnergy).default_value;
  est.confidence = confidence();
  return est;
}

float StreamingHarmonicAnalyzer::confidence() const {
  return std::min(1.0f, static_cast<float>(state_.analyses) / config_.full_confidence_analyses);
}

void StreamingHarmonicAnalyzer::reset() {
  state_ = State(config_.seed);
  state_.pending.reserve(chunk_samples_);
}

}  // namespace masterprint
