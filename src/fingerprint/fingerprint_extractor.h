#pragma once

/// @file fingerprint_extractor.h
/// @brief Composes every feature extractor into a sanitized 25-dimension fingerprint.

#include <string>

#include "backend/dsp_backend.h"
#include "core/audio_buffer.h"
#include "fingerprint/fingerprint.h"
#include "fingerprint/sampled_analyzer.h"

namespace masterprint {

/// @brief How the harmonic family is analyzed.
enum class HarmonicStrategy {
  Sampling,   ///< Windowed analysis averaged over the track (default)
  FullTrack,  ///< One pass over the whole signal
};

/// @brief Extractor configuration.
struct ExtractorConfig {
  HarmonicStrategy strategy = HarmonicStrategy::Sampling;
  SampledAnalyzerConfig sampling;
  int analysis_sample_rate = 22050;   ///< Rate used by prepare_for_analysis
  float max_analysis_seconds = 90.0f; ///< Duration cap used by prepare_for_analysis
};

/// @brief Fingerprint plus internal-only extraction metadata.
/// @details harmonic_method is diagnostic and never persisted with the fingerprint.
struct ExtractionResult {
  Fingerprint fingerprint;
  std::string harmonic_method;  ///< "sampled" or "full-track"
};

/// @brief Returns the name recorded for a strategy.
const char* harmonic_method_name(HarmonicStrategy strategy);

/// @brief Caps duration and resamples every channel to the analysis rate.
/// @details Normalizing here keeps fingerprints comparable across load paths.
AudioBuffer prepare_for_analysis(const AudioBuffer& audio, int sample_rate, float max_seconds);

/// @brief Batch fingerprint extractor.
class FingerprintExtractor {
 public:
  /// @param backend DSP backend (must outlive the extractor)
  /// @param config Strategy and analysis-rate settings
  explicit FingerprintExtractor(const DspBackend& backend,
                                const ExtractorConfig& config = ExtractorConfig());

  /// @brief Extracts a fingerprint from already prepared audio.
  /// @details Every field is computed in isolation; failures fall back to field defaults.
  ExtractionResult extract(const AudioBuffer& audio) const;

  const ExtractorConfig& config() const { return config_; }

 private:
  const DspBackend& backend_;
  ExtractorConfig config_;
};

}  // namespace masterprint
