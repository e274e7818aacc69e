#include "backend/yin.h"

#include <algorithm>
#include <cmath>
#include <limits>

#include "util/exception.h"

namespace masterprint {

namespace {

float parabolic_offset(float ym1, float y0, float yp1) {
  float denom = ym1 - 2.0f * y0 + yp1;
  if (std::abs(denom) < 1e-10f) {
    return 0.0f;
  }
  return 0.5f * (ym1 - yp1) / denom;
}

}  // namespace

std::vector<float> yin_difference(const float* frame, int frame_length, int max_lag) {
  std::vector<float> diff(max_lag, 0.0f);
  int window = frame_length - max_lag;

  for (int tau = 1; tau < max_lag; ++tau) {
    float sum = 0.0f;
    for (int j = 0; j < window; ++j) {
      float delta = frame[j] - frame[j + tau];
      sum += delta * delta;
    }
    diff[tau] = sum;
  }
  return diff;
}

std::vector<float> yin_cmndf(const std::vector<float>& diff) {
  std::vector<float> cmndf(diff.size(), 1.0f);

  float running_sum = 0.0f;
  for (size_t tau = 1; tau < diff.size(); ++tau) {
    running_sum += diff[tau];
    if (running_sum > 1e-10f) {
      cmndf[tau] = diff[tau] * tau / running_sum;
    }
  }
  return cmndf;
}

float yin_find_period(const std::vector<float>& cmndf, float threshold, int min_period,
                      int max_period) {
  int n = static_cast<int>(cmndf.size());
  min_period = std::max(1, min_period);
  max_period = std::min(max_period, n - 1);

  int best_tau = -1;
  for (int tau = min_period; tau < max_period; ++tau) {
    if (cmndf[tau] < threshold) {
      while (tau + 1 < max_period && cmndf[tau + 1] < cmndf[tau]) {
        ++tau;
      }
      best_tau = tau;
      break;
    }
  }

  if (best_tau < 0) {
    // No dip under the threshold: accept the global minimum only if it is clearly periodic.
    float min_val = std::numeric_limits<float>::max();
    for (int tau = min_period; tau < max_period; ++tau) {
      if (cmndf[tau] < min_val) {
        min_val = cmndf[tau];
        best_tau = tau;
      }
    }
    if (best_tau < 0 || min_val > 0.5f) {
      return 0.0f;
    }
  }

  if (best_tau <= 0 || best_tau >= n - 1) {
    return static_cast<float>(std::max(best_tau, 0));
  }
  return best_tau + parabolic_offset(cmndf[best_tau - 1], cmndf[best_tau], cmndf[best_tau + 1]);
}

float yin_frame(const float* frame, int frame_length, int sr, float fmin, float fmax,
                float threshold) {
  int min_period = static_cast<int>(std::floor(static_cast<float>(sr) / fmax));
  int max_period = static_cast<int>(std::ceil(static_cast<float>(sr) / fmin));
  max_period = std::min(max_period, frame_length / 2);

  if (min_period >= max_period || max_period < 2) {
    return 0.0f;
  }

  // Silent frames have a flat CMNDF and would otherwise report a spurious period.
  float energy = 0.0f;
  for (int i = 0; i < frame_length; ++i) energy += frame[i] * frame[i];
  if (energy < 1e-8f) {
    return 0.0f;
  }

  std::vector<float> cmndf = yin_cmndf(yin_difference(frame, frame_length, max_period + 1));
  float period = yin_find_period(cmndf, threshold, min_period, max_period);
  if (period <= 0.0f) {
    return 0.0f;
  }

  float freq = static_cast<float>(sr) / period;
  if (freq < fmin || freq > fmax) {
    return 0.0f;
  }
  return freq;
}

std::vector<float> yin_track(const Audio& audio, const YinConfig& config) {
  MASTERPRINT_CHECK(config.frame_length > 0 && config.hop_length > 0,
                    ErrorCode::InvalidParameter);
  MASTERPRINT_CHECK(config.fmin > 0.0f && config.fmax > config.fmin, ErrorCode::InvalidParameter);

  if (audio.size() < static_cast<size_t>(config.frame_length)) {
    return {};
  }

  int n_frames =
      1 + static_cast<int>((audio.size() - config.frame_length) / config.hop_length);
  std::vector<float> f0(n_frames, 0.0f);

  for (int i = 0; i < n_frames; ++i) {
    const float* frame = audio.data() + static_cast<size_t>(i) * config.hop_length;
    f0[i] = yin_frame(frame, config.frame_length, audio.sample_rate(), config.fmin, config.fmax,
                      config.threshold);
  }
  return f0;
}

}  // namespace masterprint
