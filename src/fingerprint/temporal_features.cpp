#include "fingerprint/temporal_features.h"

#include <algorithm>
#include <cmath>
#include <limits>

#include "core/spectrum.h"
#include "fingerprint/feature_guard.h"
#include "fingerprint/frame_features.h"
#include "util/exception.h"
#include "util/math_utils.h"

namespace masterprint {

namespace {

constexpr float kTopDb = 80.0f;

float frames_per_second(int sr, int hop_length) {
  return static_cast<float>(sr) / static_cast<float>(hop_length);
}

float envelope_peak(const std::vector<float>& envelope) {
  return envelope.empty() ? 0.0f : *std::max_element(envelope.begin(), envelope.end());
}

}  // namespace

std::vector<float> onset_envelope(const Audio& audio, const TemporalConfig& config) {
  MASTERPRINT_CHECK(!audio.empty(), ErrorCode::InvalidParameter);

  StftConfig stft;
  stft.n_fft = config.n_fft;
  stft.hop_length = config.hop_length;
  Spectrogram spec = Spectrogram::compute(audio, stft);
  const std::vector<float>& power = spec.power();
  int n_bins = spec.n_bins();
  int n_frames = spec.n_frames();

  std::vector<float> db(power.size());
  float max_db = -std::numeric_limits<float>::infinity();
  for (size_t i = 0; i < power.size(); ++i) {
    db[i] = 10.0f * std::log10(std::max(power[i], 1e-10f));
    max_db = std::max(max_db, db[i]);
  }
  for (float& v : db) v = std::max(v, max_db - kTopDb);

  std::vector<float> envelope(n_frames, 0.0f);
  for (int t = 1; t < n_frames; ++t) {
    float flux = 0.0f;
    for (int k = 0; k < n_bins; ++k) {
      size_t row = static_cast<size_t>(k) * n_frames;
      flux += std::max(0.0f, db[row + t] - db[row + t - 1]);
    }
    envelope[t] = flux / n_bins;
  }
  return envelope;
}

float estimate_tempo(const std::vector<float>& envelope, int sr, const TemporalConfig& config) {
  MASTERPRINT_CHECK_MSG(envelope_peak(envelope) > kEpsilon, ErrorCode::InvalidParameter,
                        "onset envelope is flat");

  float fps = frames_per_second(sr, config.hop_length);
  int min_lag = std::max(1, static_cast<int>(std::floor(60.0f * fps / config.bpm_max)));
  int max_lag = static_cast<int>(std::ceil(60.0f * fps / config.bpm_min));
  int n = static_cast<int>(envelope.size());
  max_lag = std::min(max_lag, n - 1);
  MASTERPRINT_CHECK_MSG(max_lag > min_lag, ErrorCode::InvalidParameter,
                        "signal too short for tempo estimation");

  float env_mean = mean(envelope);
  std::vector<float> centered(envelope.size());
  for (size_t i = 0; i < envelope.size(); ++i) centered[i] = envelope[i] - env_mean;

  std::vector<float> score(max_lag + 2, 0.0f);
  for (int lag = min_lag; lag <= max_lag + 1 && lag < n; ++lag) {
    double ac = 0.0;
    for (int i = 0; i + lag < n; ++i) ac += centered[i] * centered[i + lag];
    ac /= (n - lag);
    float bpm = 60.0f * fps / lag;
    float octaves = std::log2(bpm / config.start_bpm);
    float prior = std::exp(-0.5f * octaves * octaves);
    score[lag] = static_cast<float>(ac) * prior;
  }

  int best_lag = min_lag;
  for (int lag = min_lag; lag <= max_lag; ++lag) {
    if (score[lag] > score[best_lag]) best_lag = lag;
  }
  MASTERPRINT_CHECK_MSG(score[best_lag] > 0.0f, ErrorCode::InvalidParameter,
                        "no periodicity in onset envelope");

  float lag = static_cast<float>(best_lag);
  if (best_lag > min_lag && best_lag < max_lag) {
    float ym1 = score[best_lag - 1];
    float y0 = score[best_lag];
    float yp1 = score[best_lag + 1];
    float denom = ym1 - 2.0f * y0 + yp1;
    if (std::abs(denom) > 1e-12f) {
      lag += clamp(0.5f * (ym1 - yp1) / denom, -0.5f, 0.5f);
    }
  }
  return clamp(60.0f * fps / lag, config.bpm_min, config.bpm_max);
}

std::vector<int> track_beats(const std::vector<float>& envelope, float bpm, int sr,
                             const TemporalConfig& config) {
  float peak = envelope_peak(envelope);
  if (peak <= kEpsilon || bpm <= 0.0f) {
    return {};
  }

  int n_frames = static_cast<int>(envelope.size());
  float period = 60.0f * frames_per_second(sr, config.hop_length) / bpm;
  if (period < 1.0f) {
    return {};
  }

  std::vector<float> local(envelope.size());
  for (size_t i = 0; i < envelope.size(); ++i) local[i] = envelope[i] / peak;

  const float neg_inf = -std::numeric_limits<float>::infinity();
  std::vector<float> cumulative(n_frames, neg_inf);
  std::vector<int> backpointer(n_frames, -1);

  int first_range = std::min(n_frames, static_cast<int>(period * 1.5f));
  for (int i = 0; i < first_range; ++i) {
    cumulative[i] = local[i];
  }

  int window_min = std::max(1, static_cast<int>(period * 0.5f));
  int window_max = static_cast<int>(period * 2.0f);

  for (int i = window_min; i < n_frames; ++i) {
    float best = cumulative[i];
    int best_prev = -1;
    for (int j = std::max(0, i - window_max); j <= i - window_min; ++j) {
      if (cumulative[j] == neg_inf) continue;
      float deviation = std::log(static_cast<float>(i - j) / period);
      float score = cumulative[j] + local[i] - config.tightness * deviation * deviation;
      if (score > best) {
        best = score;
        best_prev = j;
      }
    }
    if (best_prev >= 0) {
      cumulative[i] = best;
      backpointer[i] = best_prev;
    }
  }

  int end_start = std::max(0, n_frames - static_cast<int>(period * 2.0f));
  int best_end = -1;
  for (int i = end_start; i < n_frames; ++i) {
    if (cumulative[i] == neg_inf) continue;
    if (best_end < 0 || cumulative[i] > cumulative[best_end]) best_end = i;
  }

  std::vector<int> beats;
  for (int frame = best_end; frame >= 0; frame = backpointer[frame]) {
    beats.push_back(frame);
  }
  std::reverse(beats.begin(), beats.end());
  return beats;
}

std::vector<int> pick_onsets(const std::vector<float>& envelope, int sr,
                             const TemporalConfig& config) {
  float peak = envelope_peak(envelope);
  if (peak <= kEpsilon) {
    return {};
  }

  float fps = frames_per_second(sr, config.hop_length);
  int pre_max = std::max(1, static_cast<int>(0.03f * fps));
  int post_max = pre_max;
  int pre_avg = std::max(1, static_cast<int>(0.10f * fps));
  int post_avg = 1;
  int wait = pre_max;

  int n = static_cast<int>(envelope.size());
  std::vector<float> env(envelope.size());
  for (size_t i = 0; i < envelope.size(); ++i) env[i] = envelope[i] / peak;

  std::vector<int> onsets;
  int last = -wait - 1;
  for (int i = 0; i < n; ++i) {
    if (i - last <= wait) continue;

    bool is_max = true;
    for (int j = std::max(0, i - pre_max); j <= std::min(n - 1, i + post_max); ++j) {
      if (j != i && env[j] > env[i]) {
        is_max = false;
        break;
      }
    }
    if (!is_max) continue;

    float avg = 0.0f;
    int count = 0;
    for (int j = std::max(0, i - pre_avg); j <= std::min(n - 1, i + post_avg); ++j) {
      avg += env[j];
      ++count;
    }
    avg /= static_cast<float>(count);
    if (env[i] < avg + config.onset_delta) continue;

    onsets.push_back(i);
    last = i;
  }
  return onsets;
}

float rhythm_stability_from_beats(const std::vector<int>& beats) {
  if (beats.size() < 3) {
    return 0.0f;
  }
  std::vector<float> intervals;
  intervals.reserve(beats.size() - 1);
  for (size_t i = 1; i < beats.size(); ++i) {
    intervals.push_back(static_cast<float>(beats[i] - beats[i - 1]));
  }
  float cv = coefficient_of_variation(intervals.data(), intervals.size());
  return clamp(1.0f / (1.0f + cv), 0.0f, 1.0f);
}

float silence_ratio(const Audio& audio, const TemporalConfig& config) {
  MASTERPRINT_CHECK(!audio.empty(), ErrorCode::InvalidParameter);
  FrameConfig frames{config.n_fft, config.hop_length};
  std::vector<float> db = rms_to_relative_db(frame_rms(audio.data(), audio.size(), frames));
  size_t silent = std::count_if(db.begin(), db.end(),
                                [&](float v) { return v < config.silence_db; });
  return static_cast<float>(silent) / static_cast<float>(db.size());
}

FeatureMap extract_temporal(const Audio& audio, const TemporalConfig& config) {
  FeatureMap out;
  int sr = audio.sample_rate();

  std::vector<float> envelope;
  try {
    envelope = onset_envelope(audio, config);
  } catch (const std::exception& e) {
    logger()->warn("Onset envelope failed: {}", e.what());
  }

  float tempo = field_spec(FingerprintField::TempoBpm).default_value;
  guarded_feature(out, FingerprintField::TempoBpm, [&] {
    tempo = estimate_tempo(envelope, sr, config);
    return tempo;
  });

  guarded_feature(out, FingerprintField::RhythmStability, [&] {
    return rhythm_stability_from_beats(track_beats(envelope, tempo, sr, config));
  });

  guarded_feature(out, FingerprintField::TransientDensity, [&] {
    MASTERPRINT_CHECK(audio.duration() > 0.0f, ErrorCode::InvalidParameter);
    float per_second = pick_onsets(envelope, sr, config).size() / audio.duration();
    return clamp(per_second / 10.0f, 0.0f, 1.0f);
  });

  guarded_feature(out, FingerprintField::SilenceRatio, [&] { return silence_ratio(audio, config); });

  return out;
}

}  // namespace masterprint
