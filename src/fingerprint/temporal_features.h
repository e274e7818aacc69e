#pragma once

/// @file temporal_features.h
/// @brief Tempo, rhythm stability, transient density and silence ratio.

#include <vector>

#include "core/audio.h"
#include "fingerprint/fingerprint.h"

namespace masterprint {

/// @brief Onset and beat analysis parameters.
struct TemporalConfig {
  int n_fft = 2048;
  int hop_length = 512;
  float bpm_min = 40.0f;
  float bpm_max = 200.0f;
  float start_bpm = 120.0f;      ///< Center of the tempo prior
  float tightness = 100.0f;      ///< DP penalty on deviation from the beat period
  float silence_db = -40.0f;     ///< Frame silence threshold relative to the loudest frame
  float onset_delta = 0.07f;     ///< Peak-picking margin on the normalized envelope
};

/// @brief Onset strength envelope: half-wave rectified log-power spectral flux.
/// @return One value per STFT frame (first frame is 0)
std::vector<float> onset_envelope(const Audio& audio, const TemporalConfig& config = TemporalConfig());

/// @brief Estimates tempo from the envelope autocorrelation weighted by a log-normal prior.
/// @return Tempo in BPM, clipped to [bpm_min, bpm_max]
/// @throws MasterprintException if the envelope carries no energy
float estimate_tempo(const std::vector<float>& envelope, int sr,
                     const TemporalConfig& config = TemporalConfig());

/// @brief Dynamic-programming beat tracker.
/// @return Beat positions in frames, ascending (empty for a flat envelope)
std::vector<int> track_beats(const std::vector<float>& envelope, float bpm, int sr,
                             const TemporalConfig& config = TemporalConfig());

/// @brief Peak-picks onset frames from the envelope.
std::vector<int> pick_onsets(const std::vector<float>& envelope, int sr,
                             const TemporalConfig& config = TemporalConfig());

/// @brief Rhythm stability from beat frames: 1/(1+CV) of inter-beat intervals, 0 for < 3 beats.
float rhythm_stability_from_beats(const std::vector<int>& beats);

/// @brief Fraction of frames whose RMS is below the silence threshold.
float silence_ratio(const Audio& audio, const TemporalConfig& config = TemporalConfig());

/// @brief Computes tempo_bpm, rhythm_stability, transient_density and silence_ratio.
FeatureMap extract_temporal(const Audio& audio, const TemporalConfig& config = TemporalConfig());

}  // namespace masterprint
