#include "mastering/processing_branches.h"

#include <algorithm>
#include <array>
#include <cmath>

#include "mastering/adaptive_loudness.h"
#include "mastering/enhancement.h"
#include "util/exception.h"
#include "util/log.h"
#include "util/math_utils.h"

namespace masterprint {

namespace {

constexpr float kPi = 3.14159265358979323846f;

/// @brief Smooth 1 -> 0 fade between lo and hi (1 below lo, 0 above hi).
float cosine_fade(float value, float lo, float hi) {
  if (value <= lo) return 1.0f;
  if (value >= hi) return 0.0f;
  float position = (value - lo) / (hi - lo);
  return 0.5f * (1.0f + std::cos(kPi * position));
}

/// @brief Gain taking a track that peaks at @p track_peak to @p target, or only down to it.
float track_gain(float track_peak, float target, bool raise) {
  if (track_peak <= kEpsilon) return 1.0f;
  float gain = target / track_peak;
  return raise ? gain : std::min(1.0f, gain);
}

/// @brief Pre-EQ headroom, presence and air, then the safety limiter.
void finish_loud_branch(AudioBuffer& audio, const BranchContext& ctx, float eq_factor,
                        StageTrace& trace) {
  const Fingerprint& fp = ctx.fingerprint;
  const MasteringConfig& config = ctx.config;

  apply_gain_db(audio, config.pre_eq_headroom_db);
  trace.add("pre_eq_headroom").with("gain_db", config.pre_eq_headroom_db);

  presence_stage(audio, fp.presence_pct(), fp.upper_mid_pct(), ctx.intensity * eq_factor, trace);
  air_stage(audio, fp.air_pct(), fp.spectral_rolloff(), ctx.intensity * eq_factor, trace);

  if (ctx.level_mode == LevelMode::Deferred) return;
  float gain = 1.0f;
  if (ctx.level_mode == LevelMode::Track) {
    gain = track_gain(ctx.track_peak, config.safety_ceiling, false);
    audio.apply_gain(gain);
  } else {
    gain = safety_limit(audio, config.safety_ceiling);
  }
  if (gain < 1.0f) {
    trace.add("safety_limit").with("gain_db", amplitude_to_db(gain));
  }
}

BranchResult compressed_loud_branch(const AudioBuffer& input, const BranchContext& ctx) {
  const Fingerprint& fp = ctx.fingerprint;
  const MasteringConfig& config = ctx.config;
  BranchResult result;
  result.audio = input;

  if (fp.crest_db() < config.hyper_compressed_crest_db) {
    result.trace.add("skip_expansion").because("hyper_compressed");
  } else {
    float target = std::min(config.max_crest_increase_db,
                            config.classifier.dynamic_min_crest_db - fp.crest_db());
    rms_expansion(result.audio, target, config.rms_expansion_amount,
                  db_to_amplitude(ctx.peak_db));
    result.trace.add("rms_expansion").with("target_crest", target);
  }

  stereo_expansion_stage(result.audio, fp.stereo_width(), ctx.intensity, result.trace);
  finish_loud_branch(result.audio, ctx, config.compressed_loud_intensity, result.trace);
  result.needs_output_normalize = true;
  return result;
}

BranchResult dynamic_loud_branch(const AudioBuffer& input, const BranchContext& ctx) {
  BranchResult result;
  result.audio = input;
  result.trace.add("passthrough");

  stereo_expansion_stage(result.audio, ctx.fingerprint.stereo_width(), ctx.intensity,
                         result.trace);
  finish_loud_branch(result.audio, ctx, ctx.config.dynamic_loud_intensity, result.trace);
  result.needs_output_normalize = true;
  return result;
}

BranchResult quiet_branch(const AudioBuffer& input, const BranchContext& ctx) {
  const Fingerprint& fp = ctx.fingerprint;
  const MasteringConfig& config = ctx.config;
  BranchResult result;
  result.audio = input;
  AudioBuffer& audio = result.audio;

  float makeup = adaptive_makeup_gain(fp.lufs(), ctx.intensity, fp.bass_pct(),
                                      fp.transient_density(), ctx.peak_db, config);
  makeup = std::max(0.0f, makeup - config.makeup_safety_margin_db);
  if (makeup > 0.0f) {
    apply_gain_db(audio, makeup);
    result.trace.add("makeup_gain").with("gain_db", makeup);
  }

  bass_enhancement_stage(audio, fp.bass_pct(), ctx.intensity, result.trace);
  sub_bass_control_stage(audio, fp.sub_bass_pct(), fp.bass_pct(), ctx.intensity, result.trace);
  mid_warmth_stage(audio, fp.low_mid_pct(), fp.mid_pct(), ctx.intensity, result.trace);
  presence_stage(audio, fp.presence_pct(), fp.upper_mid_pct(), ctx.intensity, result.trace);
  air_stage(audio, fp.air_pct(), fp.spectral_rolloff(), ctx.intensity, result.trace);

  SoftClipSettings clip = quiet_soft_clip_settings(fp, config);
  soft_clip(audio, db_to_amplitude(clip.threshold_db), clip.ceiling);
  result.trace.add("soft_clip").with("threshold_db", clip.threshold_db).with("ceiling", clip.ceiling);

  stereo_expansion_stage(audio, fp.stereo_width(), ctx.intensity, result.trace);

  if (ctx.level_mode != LevelMode::Deferred) {
    float target = quiet_peak_target(fp);
    float gain = 1.0f;
    if (ctx.level_mode == LevelMode::Track) {
      gain = track_gain(ctx.track_peak, target, true);
      audio.apply_gain(gain);
    } else {
      gain = normalize_peak(audio, target);
    }
    result.trace.add("normalize").with("target_peak", target).with("gain_db",
                                                                   amplitude_to_db(gain));
  }

  result.needs_output_normalize = false;
  return result;
}

// Indexed by MaterialClass.
const std::array<BranchFunction, 3> kBranches = {
    &compressed_loud_branch,
    &dynamic_loud_branch,
    &quiet_branch,
};

}  // namespace

BranchFunction branch_for(MaterialClass material) {
  return kBranches[static_cast<size_t>(material)];
}

BranchResult apply_branch(MaterialClass material, const AudioBuffer& audio,
                          const Fingerprint& fingerprint, float peak_db, float intensity,
                          int sample_rate, const MasteringConfig& config) {
  MASTERPRINT_CHECK_MSG(audio.empty() || audio.sample_rate() == sample_rate,
                        ErrorCode::InvalidParameter, "Branch sample rate mismatch");
  BranchContext context{fingerprint, peak_db, intensity, sample_rate, config};
  return branch_for(material)(audio, context);
}

BranchResult apply_branch(MaterialClass material, const AudioBuffer& audio,
                          const BranchContext& context) {
  MASTERPRINT_CHECK_MSG(audio.empty() || audio.sample_rate() == context.sample_rate,
                        ErrorCode::InvalidParameter, "Branch sample rate mismatch");
  return branch_for(material)(audio, context);
}

float peak_after_level_stage(MaterialClass material, const Fingerprint& fingerprint,
                             float track_peak, const MasteringConfig& config) {
  if (track_peak <= kEpsilon) return track_peak;
  if (material == MaterialClass::Quiet) return quiet_peak_target(fingerprint);
  return std::min(track_peak, config.safety_ceiling);
}

void stereo_expansion_stage(AudioBuffer& audio, float stereo_width, float intensity,
                            StageTrace& trace) {
  if (stereo_width >= 0.55f || audio.channels() != 2) return;

  float narrowness = cosine_fade(stereo_width, 0.25f, 0.55f);
  float expansion = 0.225f * intensity * narrowness;
  if (expansion < 0.02f) return;

  float width_factor = 0.5f + expansion;
  adjust_stereo_width_multiband(audio, width_factor);
  trace.add("stereo_expand").with("original_width", stereo_width).with("width_factor", width_factor);
}

void bass_enhancement_stage(AudioBuffer& audio, float bass_pct, float intensity,
                            StageTrace& trace) {
  if (bass_pct >= 0.5f) return;

  float fade = cosine_fade(bass_pct, 0.20f, 0.50f);
  float deficiency = std::max(0.0f, 0.30f - bass_pct) / 0.30f;
  float boost_db = 2.5f * intensity * fade * deficiency;
  if (boost_db < 0.5f) return;

  boost_low_band(audio, 100.0f, boost_db);
  trace.add("bass_enhance").with("boost_db", boost_db).with("bass_pct", bass_pct);
}

void sub_bass_control_stage(AudioBuffer& audio, float sub_bass_pct, float bass_pct,
                            float intensity, StageTrace& trace) {
  float excess = clamp((sub_bass_pct - 0.10f) / 0.10f, 0.0f, 1.0f);
  // Scaled by how close sub-bass energy comes to the bass band.
  float dominance = ramp_to_s_curve(sub_bass_pct / std::max(bass_pct, kEpsilon), 0.3f, 1.0f);
  float cut_db = -3.0f * intensity * excess * dominance;
  if (cut_db > -0.1f) return;

  apply_low_shelf(audio, 40.0f, cut_db);
  trace.add("sub_bass_control").with("cut_db", cut_db);
}

void mid_warmth_stage(AudioBuffer& audio, float low_mid_pct, float mid_pct, float intensity,
                      StageTrace& trace) {
  float deficit = clamp((0.15f - low_mid_pct) / 0.15f, 0.0f, 1.0f);
  float guard = 1.0f - ramp_to_s_curve(mid_pct, 0.30f, 0.45f);
  float boost_db = 2.0f * intensity * deficit * guard;
  if (boost_db < 0.1f) return;

  apply_peaking_band(audio, 300.0f, boost_db, 0.7f);
  trace.add("mid_warmth").with("boost_db", boost_db);
}

void presence_stage(AudioBuffer& audio, float presence_pct, float upper_mid_pct, float intensity,
                    StageTrace& trace) {
  float deficit = clamp((0.10f - presence_pct) / 0.10f, 0.0f, 1.0f);
  float guard = 1.0f - ramp_to_s_curve(upper_mid_pct, 0.20f, 0.35f);
  float boost_db = 3.0f * intensity * deficit * guard;
  if (boost_db < 0.1f) return;

  apply_peaking_band(audio, 4500.0f, boost_db, 0.8f);
  trace.add("presence_enhance").with("boost_db", boost_db);
}

void air_stage(AudioBuffer& audio, float air_pct, float spectral_rolloff, float intensity,
               StageTrace& trace) {
  float deficit = clamp((0.05f - air_pct) / 0.05f, 0.0f, 1.0f);
  float darkness = 0.5f + 0.5f * (1.0f - clamp(spectral_rolloff, 0.0f, 1.0f));
  float boost_db = 3.0f * intensity * deficit * darkness;
  if (boost_db < 0.1f) return;

  apply_high_shelf(audio, 10000.0f, boost_db);
  trace.add("air_enhance").with("boost_db", boost_db);
}

SoftClipSettings quiet_soft_clip_settings(const Fingerprint& fp, const MasteringConfig& config) {
  float loudness_factor = clamp((-11.0f - fp.lufs()) / 9.0f, 0.0f, 1.0f);
  SoftClipSettings settings;
  settings.threshold_db = -2.0f + 1.5f * (1.0f - loudness_factor);
  settings.ceiling = 0.92f + 0.07f * loudness_factor;

  float harmonic = fp.harmonic_ratio() * 0.7f + fp.pitch_stability() * 0.3f;
  float harmonic_factor = ramp_to_s_curve(harmonic, config.harmonic_preservation_threshold, 1.0f);
  settings.threshold_db += 0.5f * harmonic_factor;
  settings.ceiling += 0.03f * harmonic_factor;

  float variation = fp.dynamic_range_variation() * 0.6f + (1.0f - fp.peak_consistency()) * 0.4f;
  settings.threshold_db +=
      0.4f * ramp_to_s_curve(variation, config.variation_preservation_threshold, 1.0f);

  settings.threshold_db +=
      0.3f * ramp_to_s_curve(fp.spectral_flatness(), config.flatness_preservation_threshold, 1.0f);

  float bass = ramp_to_s_curve(fp.bass_pct(), 0.20f, 0.70f);
  settings.threshold_db -= 1.5f * bass;
  settings.ceiling -= 0.05f * bass;
  return settings;
}

float quiet_peak_target(const Fingerprint& fp) {
  float loudness_factor = clamp((-11.0f - fp.lufs()) / 9.0f, 0.0f, 1.0f);
  float target = clamp(adaptive_peak_target(fp.lufs()) - 0.05f * loudness_factor, 0.80f, 0.95f);
  return target - 0.025f * ramp_to_s_curve(fp.bass_pct(), 0.10f, 0.40f);
}

}  // namespace masterprint
