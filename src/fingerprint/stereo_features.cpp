#include "fingerprint/stereo_features.h"

#include "fingerprint/feature_guard.h"
#include "util/math_utils.h"

namespace masterprint {

float stereo_width_of(const AudioBuffer& buffer) {
  if (buffer.channels() < 2 || buffer.empty()) {
    return 0.0f;
  }
  const float* left = buffer.channel(0);
  const float* right = buffer.channel(1);
  double mid_energy = 0.0;
  double side_energy = 0.0;
  for (size_t i = 0; i < buffer.frames(); ++i) {
    double mid = 0.5 * (left[i] + right[i]);
    double side = 0.5 * (left[i] - right[i]);
    mid_energy += mid * mid;
    side_energy += side * side;
  }
  double total = mid_energy + side_energy;
  if (total <= kEpsilon) {
    return 0.0f;
  }
  return clamp(static_cast<float>(side_energy / total), 0.0f, 1.0f);
}

float phase_correlation_of(const AudioBuffer& buffer) {
  if (buffer.channels() < 2 || buffer.empty()) {
    return 1.0f;
  }
  const float* left = buffer.channel(0);
  const float* right = buffer.channel(1);
  size_t n = buffer.frames();
  if (rms(left, n) <= kEpsilon && rms(right, n) <= kEpsilon) {
    return 1.0f;
  }
  return clamp(pearson_correlation(left, right, n), -1.0f, 1.0f);
}

FeatureMap extract_stereo(const AudioBuffer& buffer) {
  FeatureMap out;
  guarded_feature(out, FingerprintField::StereoWidth, [&] { return stereo_width_of(buffer); });
  guarded_feature(out, FingerprintField::PhaseCorrelation,
                  [&] { return phase_correlation_of(buffer); });
  return out;
}

}  // namespace masterprint
