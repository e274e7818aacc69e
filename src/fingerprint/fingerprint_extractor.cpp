#include "fingerprint/fingerprint_extractor.h"

#include <algorithm>
#include <cmath>

#include "core/resample.h"
#include "fingerprint/dynamics_features.h"
#include "fingerprint/harmonic_features.h"
#include "fingerprint/spectral_features.h"
#include "fingerprint/stereo_features.h"
#include "fingerprint/temporal_features.h"
#include "fingerprint/variation_features.h"
#include "util/exception.h"
#include "util/log.h"

namespace masterprint {

namespace {

FeatureMap harmonic_defaults() {
  FeatureMap defaults;
  for (FingerprintField f : {FingerprintField::HarmonicRatio, FingerprintField::PitchStability,
                             FingerprintField::ChromaEnergy}) {
    defaults[field_spec(f).name] = field_spec(f).default_value;
  }
  return defaults;
}

void merge(FeatureMap& into, const FeatureMap& from) {
  for (const auto& entry : from) {
    into[entry.first] = entry.second;
  }
}

}  // namespace

const char* harmonic_method_name(HarmonicStrategy strategy) {
  return strategy == HarmonicStrategy::Sampling ? "sampled" : "full-track";
}

AudioBuffer prepare_for_analysis(const AudioBuffer& audio, int sample_rate, float max_seconds) {
  MASTERPRINT_CHECK(sample_rate > 0 && max_seconds > 0.0f, ErrorCode::InvalidParameter);
  if (audio.empty()) {
    return audio;
  }

  size_t cap = static_cast<size_t>(std::floor(max_seconds * audio.sample_rate()));
  AudioBuffer capped = audio.frames() > cap ? audio.slice(0, cap) : audio;
  if (capped.sample_rate() == sample_rate) {
    return capped;
  }

  std::vector<std::vector<float>> channels;
  channels.reserve(capped.channels());
  for (int ch = 0; ch < capped.channels(); ++ch) {
    channels.push_back(
        resample(capped.channel(ch), capped.frames(), capped.sample_rate(), sample_rate));
  }
  return AudioBuffer::from_channels(std::move(channels), sample_rate);
}

FingerprintExtractor::FingerprintExtractor(const DspBackend& backend, const ExtractorConfig& config)
    : backend_(backend), config_(config) {}

ExtractionResult FingerprintExtractor::extract(const AudioBuffer& audio) const {
  Audio mono = audio.to_mono();
  FeatureMap raw;

  merge(raw, extract_frequency_bands(mono));
  merge(raw, extract_dynamics(mono));
  merge(raw, extract_temporal(mono));
  merge(raw, extract_spectral(mono));
  merge(raw, extract_variation(mono));
  merge(raw, extract_stereo(audio));

  if (config_.strategy == HarmonicStrategy::Sampling) {
    const DspBackend& backend = backend_;
    SampledAnalyzer sampled([&backend](const Audio& window) { return extract_harmonic(backend, window); },
                            harmonic_defaults(), config_.sampling);
    merge(raw, sampled.analyze(mono));
  } else {
    merge(raw, extract_harmonic(backend_, mono));
  }

  ExtractionResult result;
  result.fingerprint = Fingerprint::from_map(raw);
  result.harmonic_method = harmonic_method_name(config_.strategy);
  logger()->debug("Extracted fingerprint ({} harmonic analysis, backend {})",
                  result.harmonic_method, backend_.name());
  return result;
}

}  // namespace masterprint
