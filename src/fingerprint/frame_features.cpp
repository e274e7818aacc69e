#include "fingerprint/frame_features.h"

#include <algorithm>
#include <cmath>

#include "util/exception.h"
#include "util/math_utils.h"

namespace masterprint {

namespace {
constexpr float kFloorDb = -80.0f;
}

size_t frame_count(size_t size, const FrameConfig& config) {
  MASTERPRINT_CHECK(config.frame_length > 0 && config.hop_length > 0,
                    ErrorCode::InvalidParameter);
  if (size == 0) return 0;
  if (size <= static_cast<size_t>(config.frame_length)) return 1;
  return 1 + (size - config.frame_length + config.hop_length - 1) / config.hop_length;
}

std::vector<float> frame_rms(const float* samples, size_t size, const FrameConfig& config) {
  size_t n_frames = frame_count(size, config);
  std::vector<float> result(n_frames);
  for (size_t t = 0; t < n_frames; ++t) {
    size_t start = t * config.hop_length;
    size_t len = std::min<size_t>(config.frame_length, size - start);
    result[t] = rms(samples + start, len);
  }
  return result;
}

std::vector<float> frame_peaks(const float* samples, size_t size, const FrameConfig& config) {
  size_t n_frames = frame_count(size, config);
  std::vector<float> result(n_frames);
  for (size_t t = 0; t < n_frames; ++t) {
    size_t start = t * config.hop_length;
    size_t len = std::min<size_t>(config.frame_length, size - start);
    result[t] = peak_abs(samples + start, len);
  }
  return result;
}

std::vector<float> rms_to_relative_db(const std::vector<float>& rms_values) {
  std::vector<float> db(rms_values.size(), kFloorDb);
  float ref = 0.0f;
  for (float v : rms_values) ref = std::max(ref, v);
  if (ref <= kEpsilon) {
    return db;
  }
  for (size_t i = 0; i < rms_values.size(); ++i) {
    db[i] = std::max(kFloorDb, 20.0f * std::log10(std::max(rms_values[i], kEpsilon) / ref));
  }
  return db;
}

}  // namespace masterprint
