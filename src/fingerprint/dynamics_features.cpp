#include "fingerprint/dynamics_features.h"

#include <cmath>

#include "core/spectrum.h"
#include "fingerprint/feature_guard.h"
#include "util/exception.h"
#include "util/math_utils.h"

namespace masterprint {

namespace {

constexpr float kLufsOffset = 0.691f;

const std::array<BandEdges, kNumBands> kBandEdges = {{
    {20.0f, 60.0f},
    {60.0f, 250.0f},
    {250.0f, 500.0f},
    {500.0f, 2000.0f},
    {2000.0f, 4000.0f},
    {4000.0f, 6000.0f},
    {6000.0f, 20000.0f},
}};

const std::array<FingerprintField, kNumBands> kBandFields = {
    FingerprintField::SubBassPct,  FingerprintField::BassPct,     FingerprintField::LowMidPct,
    FingerprintField::MidPct,      FingerprintField::UpperMidPct, FingerprintField::PresencePct,
    FingerprintField::AirPct,
};

}  // namespace

const std::array<BandEdges, kNumBands>& band_edges() { return kBandEdges; }

std::array<double, kNumBands> band_energies(const Audio& audio) {
  MASTERPRINT_CHECK(!audio.empty(), ErrorCode::InvalidParameter);

  StftConfig config;
  config.n_fft = 4096;
  config.hop_length = 2048;
  Spectrogram spec = Spectrogram::compute(audio, config);
  const std::vector<float>& power = spec.power();

  std::array<double, kNumBands> energies{};
  for (int k = 0; k < spec.n_bins(); ++k) {
    float freq = spec.bin_frequency(k);
    for (size_t b = 0; b < kNumBands; ++b) {
      if (freq < kBandEdges[b].low_hz || freq >= kBandEdges[b].high_hz) continue;
      const float* row = power.data() + static_cast<size_t>(k) * spec.n_frames();
      double sum = 0.0;
      for (int t = 0; t < spec.n_frames(); ++t) sum += row[t];
      energies[b] += sum / spec.n_frames();
      break;
    }
  }
  return energies;
}

FeatureMap extract_dynamics(const Audio& audio) {
  FeatureMap out;
  float level = rms(audio.data(), audio.size());

  guarded_feature(out, FingerprintField::Lufs, [&] {
    MASTERPRINT_CHECK(!audio.empty(), ErrorCode::InvalidParameter);
    return 20.0f * std::log10(level + kEpsilon) + kLufsOffset;
  });

  guarded_feature(out, FingerprintField::CrestDb, [&] {
    MASTERPRINT_CHECK(level > kEpsilon, ErrorCode::InvalidParameter);
    return 20.0f * std::log10(peak_abs(audio.data(), audio.size()) / level);
  });

  guarded_feature(out, FingerprintField::BassMidRatio, [&] {
    std::array<double, kNumBands> e = band_energies(audio);
    double bass = e[1];
    double mid = e[2] + e[3];  // 250-2000 Hz
    if (mid <= 0.0 || bass <= 0.0) return 0.0f;
    return static_cast<float>(10.0 * std::log10(bass / mid));
  });

  return out;
}

FeatureMap extract_frequency_bands(const Audio& audio) {
  FeatureMap out;
  std::array<double, kNumBands> energies{};
  bool ok = true;
  try {
    energies = band_energies(audio);
  } catch (const std::exception& e) {
    logger()->warn("Band analysis failed ({}), using default balance", e.what());
    ok = false;
  }

  double total = 0.0;
  for (double e : energies) total += e;

  for (size_t b = 0; b < kNumBands; ++b) {
    const FieldSpec& spec = field_spec(kBandFields[b]);
    if (!ok) {
      out[spec.name] = spec.default_value;
    } else {
      out[spec.name] = total > 0.0 ? static_cast<float>(energies[b] / total) : 0.0f;
    }
  }
  return out;
}

}  // namespace masterprint
