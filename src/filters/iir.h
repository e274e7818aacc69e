#pragma once

/// @file iir.h
/// @brief Biquad filters for band splitting and equalization.

#include <cstddef>
#include <vector>

namespace masterprint {

/// @brief Biquad filter coefficients.
/// @details Transfer function: H(z) = (b0 + b1*z^-1 + b2*z^-2) / (1 + a1*z^-1 + a2*z^-2)
struct BiquadCoeffs {
  float b0 = 1.0f;
  float b1 = 0.0f;
  float b2 = 0.0f;
  float a1 = 0.0f;
  float a2 = 0.0f;
};

/// @brief Creates lowpass filter coefficients (Butterworth, 2nd order).
/// @param cutoff_hz Cutoff frequency in Hz
/// @param sr Sample rate in Hz
BiquadCoeffs lowpass_coeffs(float cutoff_hz, int sr);

/// @brief Creates peaking EQ coefficients.
/// @param center_hz Center frequency in Hz
/// @param gain_db Gain at the center frequency
/// @param q Quality factor
/// @param sr Sample rate in Hz
BiquadCoeffs peaking_coeffs(float center_hz, float gain_db, float q, int sr);

/// @brief Creates low-shelf coefficients (shelf slope 1).
BiquadCoeffs low_shelf_coeffs(float corner_hz, float gain_db, int sr);

/// @brief Creates high-shelf coefficients (shelf slope 1).
BiquadCoeffs high_shelf_coeffs(float corner_hz, float gain_db, int sr);

/// @brief Applies biquad filter to signal (Direct Form II Transposed).
/// @param input Input signal
/// @param size Signal length
/// @param coeffs Biquad coefficients
/// @return Filtered signal
std::vector<float> apply_biquad(const float* input, size_t size, const BiquadCoeffs& coeffs);

/// @brief Applies biquad filter to signal.
std::vector<float> apply_biquad(const std::vector<float>& input, const BiquadCoeffs& coeffs);

/// @brief Applies biquad filter forward and backward (zero-phase filtering).
/// @param input Input signal
/// @param size Signal length
/// @param coeffs Biquad coefficients
/// @return Filtered signal (no phase distortion)
std::vector<float> apply_biquad_filtfilt(const float* input, size_t size,
                                         const BiquadCoeffs& coeffs);

/// @brief Splits a signal into complementary low and high bands.
/// @details The low band is a zero-phase Butterworth lowpass. The high band is the residual,
///          so low + high reconstructs the input exactly.
/// @param input Input signal
/// @param size Signal length
/// @param cutoff_hz Crossover frequency in Hz
/// @param sr Sample rate in Hz
/// @param low Output low band
/// @param high Output high band
void split_bands(const float* input, size_t size, float cutoff_hz, int sr, std::vector<float>& low,
                 std::vector<float>& high);

}  // namespace masterprint
