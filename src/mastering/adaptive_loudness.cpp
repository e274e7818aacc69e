#include "mastering/adaptive_loudness.h"

#include <algorithm>

#include "util/math_utils.h"

namespace masterprint {

namespace {
constexpr float kClipperAllowanceDb = 6.0f;
}

float effective_intensity(float base_intensity, float lufs, float crest_db) {
  float crest_norm = clamp((crest_db - 8.0f) / 7.0f, 0.0f, 1.0f);
  float lufs_norm = clamp((lufs + 13.0f) / 2.0f, 0.0f, 1.0f);

  float multiplier;
  if (crest_norm < 0.3f) {
    multiplier = 0.5f + crest_norm * 0.67f;
  } else {
    multiplier = 0.7f + (1.0f - crest_norm) * 0.5f + (1.0f - lufs_norm) * 0.5f - lufs_norm * 0.4f;
  }
  return base_intensity * clamp(multiplier, 0.5f, 1.2f);
}

float adaptive_makeup_gain(float lufs, float intensity, float bass_pct, float transient_density,
                           float peak_db, const MasteringConfig& config) {
  float gain = (config.loudness_target_lufs - lufs) * intensity;
  gain *= 1.0f - 0.3f * ramp_to_s_curve(bass_pct, 0.20f, 0.50f);
  gain *= 1.0f - 0.2f * clamp(transient_density, 0.0f, 1.0f);
  gain = std::min(gain, kClipperAllowanceDb - peak_db);
  return clamp(gain, 0.0f, config.max_makeup_gain_db);
}

float adaptive_peak_target(float lufs) {
  return 0.90f + 0.05f * clamp((-11.0f - lufs) / 9.0f, 0.0f, 1.0f);
}

}  // namespace masterprint
