#include "mastering/enhancement.h"

#include <algorithm>
#include <array>
#include <cmath>
#include <vector>

#include "filters/iir.h"
#include "util/math_utils.h"

namespace masterprint {

namespace {

/// @brief Keeps filter frequencies valid at low sample rates.
float below_nyquist(float hz, int sr) { return std::min(hz, 0.45f * static_cast<float>(sr)); }

void filter_channels(AudioBuffer& audio, const BiquadCoeffs& coeffs) {
  for (int ch = 0; ch < audio.channels(); ++ch) {
    std::vector<float>& samples = audio.channel_vector(ch);
    samples = apply_biquad(samples, coeffs);
  }
}

}  // namespace

void apply_gain_db(AudioBuffer& audio, float gain_db) { audio.apply_gain(db_to_amplitude(gain_db)); }

void apply_peaking_band(AudioBuffer& audio, float center_hz, float gain_db, float q) {
  if (audio.empty() || gain_db == 0.0f) return;
  int sr = audio.sample_rate();
  filter_channels(audio, peaking_coeffs(below_nyquist(center_hz, sr), gain_db, q, sr));
}

void apply_low_shelf(AudioBuffer& audio, float corner_hz, float gain_db) {
  if (audio.empty() || gain_db == 0.0f) return;
  int sr = audio.sample_rate();
  filter_channels(audio, low_shelf_coeffs(below_nyquist(corner_hz, sr), gain_db, sr));
}

void apply_high_shelf(AudioBuffer& audio, float corner_hz, float gain_db) {
  if (audio.empty() || gain_db == 0.0f) return;
  int sr = audio.sample_rate();
  filter_channels(audio, high_shelf_coeffs(below_nyquist(corner_hz, sr), gain_db, sr));
}

void boost_low_band(AudioBuffer& audio, float cutoff_hz, float gain_db) {
  if (audio.empty()) return;
  int sr = audio.sample_rate();
  float gain = db_to_amplitude(gain_db);
  std::vector<float> low;
  std::vector<float> high;
  for (int ch = 0; ch < audio.channels(); ++ch) {
    split_bands(audio.channel(ch), audio.frames(), below_nyquist(cutoff_hz, sr), sr, low, high);
    float* out = audio.channel(ch);
    for (size_t i = 0; i < audio.frames(); ++i) {
      out[i] = low[i] * gain + high[i];
    }
  }
}

void soft_clip(AudioBuffer& audio, float threshold, float ceiling) {
  float knee = ceiling - threshold;
  for (int ch = 0; ch < audio.channels(); ++ch) {
    float* x = audio.channel(ch);
    for (size_t i = 0; i < audio.frames(); ++i) {
      float magnitude = std::abs(x[i]);
      if (knee <= 0.0f) {
        if (magnitude > ceiling) x[i] = std::copysign(ceiling, x[i]);
        continue;
      }
      if (magnitude > threshold) {
        float shaped = threshold + knee * std::tanh((magnitude - threshold) / knee);
        x[i] = std::copysign(shaped, x[i]);
      }
    }
  }
}

float safety_limit(AudioBuffer& audio, float ceiling) {
  float peak = audio.peak();
  if (peak <= ceiling) return 1.0f;
  float gain = ceiling / peak;
  audio.apply_gain(gain);
  return gain;
}

float normalize_peak(AudioBuffer& audio, float target_peak) {
  float peak = audio.peak();
  if (peak <= kEpsilon) return 1.0f;
  float gain = target_peak / peak;
  audio.apply_gain(gain);
  return gain;
}

void adjust_stereo_width_multiband(AudioBuffer& audio, float width_factor) {
  if (audio.channels() != 2 || audio.empty()) return;

  static const std::array<float, 3> kSplitsHz = {200.0f, 2000.0f, 8000.0f};
  static const std::array<float, 4> kBandWeights = {0.0f, 0.5f, 1.0f, 1.2f};

  int sr = audio.sample_rate();
  size_t n = audio.frames();
  float* left = audio.channel(0);
  float* right = audio.channel(1);

  std::vector<float> mid(n);
  std::vector<float> side(n);
  for (size_t i = 0; i < n; ++i) {
    mid[i] = 0.5f * (left[i] + right[i]);
    side[i] = 0.5f * (left[i] - right[i]);
  }

  // Peel bands off the side signal from the bottom up.
  float change = (width_factor - 0.5f) * 2.0f;
  std::vector<float> widened(n, 0.0f);
  std::vector<float> remainder = side;
  std::vector<float> low;
  std::vector<float> high;
  for (size_t band = 0; band < kBandWeights.size(); ++band) {
    float scale = 1.0f + change * kBandWeights[band];
    bool last = band == kSplitsHz.size() || kSplitsHz[band] >= 0.45f * sr;
    if (last) {
      for (size_t i = 0; i < n; ++i) widened[i] += remainder[i] * scale;
      break;
    }
    split_bands(remainder.data(), n, kSplitsHz[band], sr, low, high);
    for (size_t i = 0; i < n; ++i) widened[i] += low[i] * scale;
    remainder.swap(high);
  }

  for (size_t i = 0; i < n; ++i) {
    left[i] = mid[i] + widened[i];
    right[i] = mid[i] - widened[i];
  }
}

void rms_expansion(AudioBuffer& audio, float target_crest_increase_db, float amount,
                   float reference_peak) {
  float reduction_db = std::max(0.0f, target_crest_increase_db * amount);
  float peak = reference_peak > 0.0f ? reference_peak : audio.peak();
  if (reduction_db <= 0.0f || peak <= kEpsilon) return;

  float coeff = std::exp(-1.0f / (0.010f * audio.sample_rate()));
  for (int ch = 0; ch < audio.channels(); ++ch) {
    float* x = audio.channel(ch);
    float envelope = 0.0f;
    for (size_t i = 0; i < audio.frames(); ++i) {
      float magnitude = std::abs(x[i]);
      envelope = magnitude > envelope ? magnitude : coeff * envelope + (1.0f - coeff) * magnitude;
      float depth = 1.0f - clamp(envelope / peak, 0.0f, 1.0f);
      x[i] *= db_to_amplitude(-reduction_db * depth);
    }
  }
}

}  // namespace masterprint
