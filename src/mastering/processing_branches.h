#pragma once

/// @file processing_branches.h
/// @brief Per-material DSP chains dispatched through one table.

#include "core/audio_buffer.h"
#include "fingerprint/fingerprint.h"
#include "mastering/mastering_config.h"
#include "mastering/material_classifier.h"
#include "mastering/stage_trace.h"

namespace masterprint {

/// @brief Where the final level stage of a branch (limiter or peak normalize) takes its peak.
enum class LevelMode {
  Buffer,    ///< The buffer is the whole track: use its own peak
  Deferred,  ///< Skip the level stage; used to meter the processed track
  Track      ///< Use BranchContext::track_peak, shared by every chunk
};

/// @brief Shared inputs of every branch.
struct BranchContext {
  const Fingerprint& fingerprint;
  float peak_db;          ///< Peak level of the whole source in dBFS
  float intensity;        ///< Effective intensity (see effective_intensity())
  int sample_rate;
  const MasteringConfig& config;
  LevelMode level_mode = LevelMode::Buffer;
  float track_peak = 0.0f;  ///< Processed track peak ahead of the level stage (Track mode)
};

/// @brief Output of one branch run.
struct BranchResult {
  AudioBuffer audio;
  StageTrace trace;
  bool needs_output_normalize = false;  ///< Caller applies the output ceiling to the track
};

/// @brief Branch entry point.
using BranchFunction = BranchResult (*)(const AudioBuffer& audio, const BranchContext& context);

/// @brief Returns the branch registered for a material class.
BranchFunction branch_for(MaterialClass material);

/// @brief Runs the branch for @p material on @p audio, treating it as the whole track.
/// @throws MasterprintException with InvalidParameter if the buffer rate differs from
///         @p sample_rate
BranchResult apply_branch(MaterialClass material, const AudioBuffer& audio,
                          const Fingerprint& fingerprint, float peak_db, float intensity,
                          int sample_rate, const MasteringConfig& config = MasteringConfig());

/// @brief Runs the branch for @p material on one chunk of a track.
/// @details With LevelMode::Track every chunk receives the same limiter or normalize gain,
///          so level differences between chunks survive.
/// @throws MasterprintException with InvalidParameter if the buffer rate differs from
///         the context rate
BranchResult apply_branch(MaterialClass material, const AudioBuffer& audio,
                          const BranchContext& context);

/// @brief Peak of the processed track after the branch level stage, given its peak before it.
/// @details Used to place the output ceiling once for the whole track.
float peak_after_level_stage(MaterialClass material, const Fingerprint& fingerprint,
                             float track_peak, const MasteringConfig& config = MasteringConfig());

/// @name Shared stages
/// Each stage edits @p audio in place and appends a trace record only when it acts.
/// @{

/// @brief Multiband stereo expansion for narrow mixes.
/// @details No expansion at width >= 0.55; a cosine fade over 0.25-0.55 scales
///          0.225 * intensity; amounts below 0.02 are skipped. Traced as `stereo_expand`.
void stereo_expansion_stage(AudioBuffer& audio, float stereo_width, float intensity,
                            StageTrace& trace);

/// @brief Low-band boost below 100 Hz for bass-light mixes.
/// @details No boost at bass >= 0.5; a cosine fade over 0.2-0.5 and the deficit below 0.3
///          scale 2.5 dB * intensity; boosts below 0.5 dB are skipped. Traced as `bass_enhance`.
void bass_enhancement_stage(AudioBuffer& audio, float bass_pct, float intensity,
                            StageTrace& trace);

/// @brief Low-shelf cut at 40 Hz when sub-bass exceeds 10 %.
void sub_bass_control_stage(AudioBuffer& audio, float sub_bass_pct, float bass_pct,
                            float intensity, StageTrace& trace);

/// @brief Peaking boost at 300 Hz for thin mixes.
void mid_warmth_stage(AudioBuffer& audio, float low_mid_pct, float mid_pct, float intensity,
                      StageTrace& trace);

/// @brief Peaking boost at 4.5 kHz for dull mixes, backed off when upper mids are strong.
void presence_stage(AudioBuffer& audio, float presence_pct, float upper_mid_pct, float intensity,
                    StageTrace& trace);

/// @brief High-shelf boost at 10 kHz for dark mixes.
void air_stage(AudioBuffer& audio, float air_pct, float spectral_rolloff, float intensity,
               StageTrace& trace);

/// @}

/// @brief Soft-clip operating point of the quiet branch.
struct SoftClipSettings {
  float threshold_db;
  float ceiling;
};

/// @brief Computes the quiet-branch soft clip threshold and ceiling from the fingerprint.
SoftClipSettings quiet_soft_clip_settings(const Fingerprint& fingerprint,
                                          const MasteringConfig& config = MasteringConfig());

/// @brief Computes the quiet-branch final peak target.
float quiet_peak_target(const Fingerprint& fingerprint);

}  // namespace masterprint
