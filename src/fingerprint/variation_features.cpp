#include "fingerprint/variation_features.h"

#include <cmath>

#include "fingerprint/feature_guard.h"
#include "util/exception.h"
#include "util/math_utils.h"

namespace masterprint {

namespace {
constexpr float kCrestStdFullScale = 6.0f;
constexpr float kMaxLoudnessStd = 10.0f;
}  // namespace

FeatureMap extract_variation(const Audio& audio, const FrameConfig& frames) {
  FeatureMap out;
  std::vector<float> rms_values = frame_rms(audio.data(), audio.size(), frames);
  std::vector<float> peaks = frame_peaks(audio.data(), audio.size(), frames);

  guarded_feature(out, FingerprintField::DynamicRangeVariation, [&] {
    std::vector<float> crest_db;
    for (size_t i = 0; i < rms_values.size(); ++i) {
      if (rms_values[i] > kEpsilon) {
        crest_db.push_back(20.0f * std::log10(peaks[i] / rms_values[i]));
      }
    }
    MASTERPRINT_CHECK_MSG(!crest_db.empty(), ErrorCode::InvalidParameter, "no audible frames");
    return clamp(stddev(crest_db) / kCrestStdFullScale, 0.0f, 1.0f);
  });

  guarded_feature(out, FingerprintField::LoudnessVariationStd, [&] {
    MASTERPRINT_CHECK(!rms_values.empty(), ErrorCode::InvalidParameter);
    return clamp(stddev(rms_to_relative_db(rms_values)), 0.0f, kMaxLoudnessStd);
  });

  guarded_feature(out, FingerprintField::PeakConsistency, [&] {
    MASTERPRINT_CHECK(!peaks.empty(), ErrorCode::InvalidParameter);
    return stability_from_cv(peaks);
  });

  return out;
}

}  // namespace masterprint
