#include "fingerprint/harmonic_features.h"

#include "fingerprint/feature_guard.h"
#include "util/exception.h"
#include "util/math_utils.h"

namespace masterprint {

namespace {
constexpr float kPitchCvScale = 10.0f;
}

float harmonic_ratio_from(const HarmonicPercussive& components) {
  float h = rms(components.harmonic.data(), components.harmonic.size());
  float p = rms(components.percussive.data(), components.percussive.size());
  MASTERPRINT_CHECK_MSG(h + p > kEpsilon, ErrorCode::InvalidParameter, "silent components");
  return clamp(h / (h + p), 0.0f, 1.0f);
}

float pitch_stability_from(const std::vector<float>& f0) {
  std::vector<float> voiced;
  for (float f : f0) {
    if (f > 0.0f) voiced.push_back(f);
  }
  if (voiced.size() < 2) {
    return field_spec(FingerprintField::PitchStability).default_value;
  }
  return stability_from_cv(voiced, kPitchCvScale);
}

float chroma_energy_from(const Eigen::MatrixXf& chroma) {
  MASTERPRINT_CHECK(chroma.size() > 0, ErrorCode::InvalidParameter);
  return clamp(chroma.mean() / kChromaFullScale, 0.0f, 1.0f);
}

FeatureMap extract_harmonic(const DspBackend& backend, const Audio& audio) {
  FeatureMap out;
  guarded_feature(out, FingerprintField::HarmonicRatio, [&] {
    return harmonic_ratio_from(backend.separate_harmonic_percussive(audio));
  });
  guarded_feature(out, FingerprintField::PitchStability, [&] {
    return pitch_stability_from(backend.track_pitch(audio, kPitchFmin, kPitchFmax));
  });
  guarded_feature(out, FingerprintField::ChromaEnergy,
                  [&] { return chroma_energy_from(backend.chroma(audio)); });
  return out;
}

}  // namespace masterprint
