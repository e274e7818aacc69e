#pragma once

/// @file enhancement.h
/// @brief Shared in-place DSP primitives used by the processing branches.

#include "core/audio_buffer.h"

namespace masterprint {

/// @brief Multiplies every channel by 10^(gain_db/20).
void apply_gain_db(AudioBuffer& audio, float gain_db);

/// @brief Peaking EQ band on every channel.
/// @details The center is clamped below Nyquist for low sample rates.
void apply_peaking_band(AudioBuffer& audio, float center_hz, float gain_db, float q);

/// @brief Low-shelf EQ on every channel.
void apply_low_shelf(AudioBuffer& audio, float corner_hz, float gain_db);

/// @brief High-shelf EQ on every channel.
void apply_high_shelf(AudioBuffer& audio, float corner_hz, float gain_db);

/// @brief Splits each channel at @p cutoff_hz and scales the low band by @p gain_db.
/// @details The split is zero-phase (low = filtfilt lowpass, high = input - low), so a
///          0 dB gain reconstructs the input exactly.
void boost_low_band(AudioBuffer& audio, float cutoff_hz, float gain_db);

/// @brief Soft clipper: samples above @p threshold approach @p ceiling along a tanh knee.
/// @details Samples at or below the threshold are untouched. A ceiling at or below the
///          threshold degrades to a hard clip at the ceiling.
void soft_clip(AudioBuffer& audio, float threshold, float ceiling);

/// @brief Scales the buffer down if its peak exceeds @p ceiling.
/// @return Gain applied (1.0 if untouched)
float safety_limit(AudioBuffer& audio, float ceiling);

/// @brief Scales the buffer so its peak equals @p target_peak (no-op on silence).
/// @return Gain applied
float normalize_peak(AudioBuffer& audio, float target_peak);

/// @brief Multiband mid/side width adjustment.
/// @details width_factor 0.5 is neutral. The side signal is split at 200 Hz, 2 kHz and 8 kHz;
///          the bands receive x0, x0.5, x1.0 and x1.2 of the width change. Mono is untouched.
void adjust_stereo_width_multiband(AudioBuffer& audio, float width_factor);

/// @brief Downward expansion of the signal body that leaves peaks in place.
/// @details Each sample is attenuated by reduction_db * (1 - envelope / peak), where the
///          envelope follows |x| with a 10 ms one-pole smoother. Raises the crest factor by
///          roughly @p target_crest_increase_db * @p amount.
/// @param reference_peak Peak the envelope is measured against; pass the whole-track peak
///        when @p audio is one chunk of it. 0 uses the buffer's own peak.
void rms_expansion(AudioBuffer& audio, float target_crest_increase_db, float amount,
                   float reference_peak = 0.0f);

}  // namespace masterprint
