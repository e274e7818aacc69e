#include "fingerprint/mastering_targets.h"

#include <algorithm>

#include "util/math_utils.h"

namespace masterprint {

namespace {

constexpr float kStreamingLufs = -14.0f;
constexpr float kMinTargetCrest = 10.0f;
constexpr float kCrestRetention = 0.85f;
constexpr float kDbPerPercent = 0.5f;
constexpr float kMaxEqDb = 6.0f;

constexpr std::array<float, kNumEqBands> kReferenceBalancePct = {5.0f,  15.0f, 18.0f, 22.0f,
                                                                 20.0f, 13.0f, 7.0f};

const std::array<const char*, kNumEqBands> kBandNames = {
    "sub_bass", "bass", "low_mid", "mid", "upper_mid", "presence", "air"};

}  // namespace

const std::array<const char*, kNumEqBands>& eq_band_names() { return kBandNames; }

MasteringTargets derive_mastering_targets(const Fingerprint& fp) {
  const std::array<float, kNumEqBands> fractions = {
      fp.sub_bass_pct(),  fp.bass_pct(),     fp.low_mid_pct(), fp.mid_pct(),
      fp.upper_mid_pct(), fp.presence_pct(), fp.air_pct()};

  MasteringTargets targets;
  targets.target_lufs = kStreamingLufs;
  targets.target_crest_db = std::max(kMinTargetCrest, fp.crest_db() * kCrestRetention);
  for (size_t b = 0; b < kNumEqBands; ++b) {
    float deviation = kReferenceBalancePct[b] - fractions[b] * 100.0f;
    targets.eq_adjustments_db[b] = clamp(deviation * kDbPerPercent, -kMaxEqDb, kMaxEqDb);
  }
  return targets;
}

}  // namespace masterprint
