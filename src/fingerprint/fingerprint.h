#pragma once

/// @file fingerprint.h
/// @brief 25-dimension perceptual fingerprint record with centralized defaults.

#include <array>
#include <cstddef>
#include <map>
#include <string>

namespace masterprint {

/// @brief Fingerprint dimensions, in persisted column order.
enum class FingerprintField : int {
  TempoBpm = 0,
  Lufs,
  CrestDb,
  BassPct,
  MidPct,
  HarmonicRatio,
  TransientDensity,
  SpectralCentroid,
  BassMidRatio,
  RhythmStability,
  SilenceRatio,
  SpectralRolloff,
  SpectralFlatness,
  PitchStability,
  ChromaEnergy,
  DynamicRangeVariation,
  LoudnessVariationStd,
  PeakConsistency,
  StereoWidth,
  PhaseCorrelation,
  SubBassPct,
  LowMidPct,
  UpperMidPct,
  PresencePct,
  AirPct,
};

/// @brief Number of fingerprint dimensions.
constexpr size_t kFingerprintDims = 25;

/// @brief Static description of one dimension.
struct FieldSpec {
  FingerprintField field;
  const char* name;    ///< Persisted key / column name
  float default_value;
  float min_value;     ///< Lower clamp (-inf when unbounded)
  float max_value;     ///< Upper clamp (+inf when unbounded)
};

/// @brief Returns the table of all 25 dimensions in persisted order.
const std::array<FieldSpec, kFingerprintDims>& fingerprint_fields();

/// @brief Returns the name, default and range of one dimension.
const FieldSpec& field_spec(FingerprintField field);

/// @brief Name-to-value map as produced by extractors.
using FeatureMap = std::map<std::string, float>;

/// @brief Immutable 25-scalar fingerprint.
/// @details Built once from a raw map; recomputation produces a new record.
class Fingerprint {
 public:
  /// @brief Creates a fingerprint holding every documented default.
  Fingerprint();

  /// @brief Builds a fingerprint from raw values.
  /// @details Missing keys take their default silently. Non-finite values take their default
  ///          with a logged warning. Bounded fields are clamped to their range. Unknown keys
  ///          are ignored.
  static Fingerprint from_map(const FeatureMap& values);

  /// @brief Returns every field keyed by its persisted name.
  FeatureMap to_map() const;

  float get(FingerprintField field) const { return values_[static_cast<size_t>(field)]; }
  float operator[](FingerprintField field) const { return get(field); }
  const std::array<float, kFingerprintDims>& values() const { return values_; }

  float lufs() const { return get(FingerprintField::Lufs); }
  float crest_db() const { return get(FingerprintField::CrestDb); }
  float bass_mid_ratio() const { return get(FingerprintField::BassMidRatio); }
  float sub_bass_pct() const { return get(FingerprintField::SubBassPct); }
  float bass_pct() const { return get(FingerprintField::BassPct); }
  float low_mid_pct() const { return get(FingerprintField::LowMidPct); }
  float mid_pct() const { return get(FingerprintField::MidPct); }
  float upper_mid_pct() const { return get(FingerprintField::UpperMidPct); }
  float presence_pct() const { return get(FingerprintField::PresencePct); }
  float air_pct() const { return get(FingerprintField::AirPct); }
  float tempo_bpm() const { return get(FingerprintField::TempoBpm); }
  float rhythm_stability() const { return get(FingerprintField::RhythmStability); }
  float transient_density() const { return get(FingerprintField::TransientDensity); }
  float silence_ratio() const { return get(FingerprintField::SilenceRatio); }
  float spectral_centroid() const { return get(FingerprintField::SpectralCentroid); }
  float spectral_rolloff() const { return get(FingerprintField::SpectralRolloff); }
  float spectral_flatness() const { return get(FingerprintField::SpectralFlatness); }
  float harmonic_ratio() const { return get(FingerprintField::HarmonicRatio); }
  float pitch_stability() const { return get(FingerprintField::PitchStability); }
  float chroma_energy() const { return get(FingerprintField::ChromaEnergy); }
  float dynamic_range_variation() const { return get(FingerprintField::DynamicRangeVariation); }
  float loudness_variation_std() const { return get(FingerprintField::LoudnessVariationStd); }
  float peak_consistency() const { return get(FingerprintField::PeakConsistency); }
  float stereo_width() const { return get(FingerprintField::StereoWidth); }
  float phase_correlation() const { return get(FingerprintField::PhaseCorrelation); }

  bool operator==(const Fingerprint& other) const { return values_ == other.values_; }
  bool operator!=(const Fingerprint& other) const { return !(*this == other); }

 private:
  std::array<float, kFingerprintDims> values_;
};

/// @brief Returns true if every field differs by at most @p tolerance.
bool approx_equal(const Fingerprint& a, const Fingerprint& b, float tolerance = 1e-5f);

}  // namespace masterprint
