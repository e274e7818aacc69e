#include "streaming/streaming_spectral.h"

#include <algorithm>
#include <cmath>

#include "core/window.h"
#include "fingerprint/fingerprint.h"
#include "fingerprint/spectral_features.h"
#include "util/exception.h"
#include "util/math_utils.h"

namespace masterprint {

StreamingSpectralAnalyzer::StreamingSpectralAnalyzer(int sample_rate,
                                                     const StreamingSpectralConfig& config)
    : sample_rate_(sample_rate),
      config_(config),
      fft_(config.n_fft),
      window_(create_window(WindowType::Hann, config.n_fft)),
      windowed_(config.n_fft),
      spectrum_(config.n_bins()) {
  MASTERPRINT_CHECK(sample_rate > 0, ErrorCode::InvalidParameter);
  MASTERPRINT_CHECK(config.hop_length > 0 && config.hop_length <= config.n_fft,
                    ErrorCode::InvalidParameter);
  MASTERPRINT_CHECK(config.rolloff_window_frames > 0, ErrorCode::InvalidParameter);
  MASTERPRINT_CHECK(config.full_confidence_frames > 0, ErrorCode::InvalidParameter);
}

SpectralEstimate StreamingSpectralAnalyzer::update(const float* samples, size_t n_samples) {
  std::vector<float>& pending = state_.pending;
  pending.insert(pending.end(), samples, samples + n_samples);

  size_t n_fft = static_cast<size_t>(config_.n_fft);
  size_t hop = static_cast<size_t>(config_.hop_length);
  size_t offset = 0;
  while (pending.size() - offset >= n_fft) {
    process_frame(pending.data() + offset);
    offset += hop;
  }
  pending.erase(pending.begin(), pending.begin() + offset);
  return estimate();
}

void StreamingSpectralAnalyzer::process_frame(const float* frame) {
  for (int i = 0; i < config_.n_fft; ++i) {
    windowed_[i] = frame[i] * window_[i];
  }
  fft_.forward(windowed_.data(), spectrum_.data());

  int n_bins = config_.n_bins();
  std::vector<float> magnitude(n_bins);
  for (int k = 0; k < n_bins; ++k) {
    magnitude[k] = std::abs(spectrum_[k]);
  }

  float hz = static_cast<float>(sample_rate_) / config_.n_fft;
  state_.centroid_sum += column_centroid(magnitude.data(), n_bins, hz);
  state_.flatness_sum += column_flatness(magnitude.data(), n_bins);
  ++state_.frames;

  state_.recent.push_back(std::move(magnitude));
  if (state_.recent.size() > config_.rolloff_window_frames) {
    state_.recent.pop_front();
  }
}

SpectralEstimate StreamingSpectralAnalyzer::estimate() const {
  SpectralEstimate est;
  est.confidence = confidence();
  if (state_.frames == 0) {
    est.spectral_centroid = field_spec(FingerprintField::SpectralCentroid).default_value;
    est.spectral_rolloff = field_spec(FingerprintField::SpectralRolloff).default_value;
    est.spectral_flatness = field_spec(FingerprintField::SpectralFlatness).default_value;
    return est;
  }

  float hz = static_cast<float>(sample_rate_) / config_.n_fft;
  double rolloff_sum = 0.0;
  for (const auto& magnitude : state_.recent) {
    rolloff_sum += column_rolloff(magnitude.data(), config_.n_bins(), hz);
  }
  float rolloff_hz = static_cast<float>(rolloff_sum / state_.recent.size());

  est.spectral_centroid =
      clamp(static_cast<float>(state_.centroid_sum / state_.frames) / kCentroidNormHz, 0.0f, 1.0f);
  est.spectral_rolloff = clamp(rolloff_hz / kRolloffNormHz, 0.0f, 1.0f);
  est.spectral_flatness =
      clamp(static_cast<float>(state_.flatness_sum / state_.frames), 0.0f, 1.0f);
  return est;
}

float StreamingSpectralAnalyzer::confidence() const {
  return std::min(1.0f, static_cast<float>(state_.frames) / config_.full_confidence_frames);
}

void StreamingSpectralAnalyzer::reset() { state_ = State(); }

}  // namespace masterprint
