#include "fingerprint/fingerprint.h"

#include <cmath>
#include <limits>

#include "util/log.h"
#include "util/math_utils.h"

namespace masterprint {

namespace {

constexpr float kInf = std::numeric_limits<float>::infinity();

using F = FingerprintField;

const std::array<FieldSpec, kFingerprintDims> kFields = {{
    {F::TempoBpm, "tempo_bpm", 120.0f, 40.0f, 200.0f},
    {F::Lufs, "lufs", -20.0f, -kInf, kInf},
    {F::CrestDb, "crest_db", 15.0f, -kInf, kInf},
    {F::BassPct, "bass_pct", 0.15f, 0.0f, 1.0f},
    {F::MidPct, "mid_pct", 0.30f, 0.0f, 1.0f},
    {F::HarmonicRatio, "harmonic_ratio", 0.5f, 0.0f, 1.0f},
    {F::TransientDensity, "transient_density", 0.5f, 0.0f, 1.0f},
    {F::SpectralCentroid, "spectral_centroid", 0.5f, 0.0f, 1.0f},
    {F::BassMidRatio, "bass_mid_ratio", 0.0f, -kInf, kInf},
    {F::RhythmStability, "rhythm_stability", 0.5f, 0.0f, 1.0f},
    {F::SilenceRatio, "silence_ratio", 0.1f, 0.0f, 1.0f},
    {F::SpectralRolloff, "spectral_rolloff", 0.5f, 0.0f, 1.0f},
    {F::SpectralFlatness, "spectral_flatness", 0.3f, 0.0f, 1.0f},
    {F::PitchStability, "pitch_stability", 0.7f, 0.0f, 1.0f},
    {F::ChromaEnergy, "chroma_energy", 0.5f, 0.0f, 1.0f},
    {F::DynamicRangeVariation, "dynamic_range_variation", 0.5f, 0.0f, 1.0f},
    {F::LoudnessVariationStd, "loudness_variation_std", 0.5f, 0.0f, 10.0f},
    {F::PeakConsistency, "peak_consistency", 0.5f, 0.0f, 1.0f},
    {F::StereoWidth, "stereo_width", 0.5f, 0.0f, 1.0f},
    {F::PhaseCorrelation, "phase_correlation", 1.0f, -1.0f, 1.0f},
    {F::SubBassPct, "sub_bass_pct", 0.05f, 0.0f, 1.0f},
    {F::LowMidPct, "low_mid_pct", 0.15f, 0.0f, 1.0f},
    {F::UpperMidPct, "upper_mid_pct", 0.20f, 0.0f, 1.0f},
    {F::PresencePct, "presence_pct", 0.10f, 0.0f, 1.0f},
    {F::AirPct, "air_pct", 0.05f, 0.0f, 1.0f},
}};

}  // namespace

const std::array<FieldSpec, kFingerprintDims>& fingerprint_fields() { return kFields; }

const FieldSpec& field_spec(FingerprintField field) {
  return kFields[static_cast<size_t>(field)];
}

Fingerprint::Fingerprint() {
  for (size_t i = 0; i < kFingerprintDims; ++i) {
    values_[i] = kFields[i].default_value;
  }
}

Fingerprint Fingerprint::from_map(const FeatureMap& values) {
  Fingerprint fp;
  for (size_t i = 0; i < kFingerprintDims; ++i) {
    const FieldSpec& spec = kFields[i];
    auto it = values.find(spec.name);
    if (it == values.end()) {
      continue;
    }
    if (!std::isfinite(it->second)) {
      logger()->warn("Fingerprint field '{}' is not finite, using default {}", spec.name,
                     spec.default_value);
      continue;
    }
    fp.values_[i] = clamp(it->second, spec.min_value, spec.max_value);
  }
  return fp;
}

FeatureMap Fingerprint::to_map() const {
  FeatureMap map;
  for (size_t i = 0; i < kFingerprintDims; ++i) {
    map[kFields[i].name] = values_[i];
  }
  return map;
}

bool approx_equal(const Fingerprint& a, const Fingerprint& b, float tolerance) {
  for (size_t i = 0; i < kFingerprintDims; ++i) {
    if (std::abs(a.values()[i] - b.values()[i]) > tolerance) {
      return false;
    }
  }
  return true;
}

}  // namespace masterprint
