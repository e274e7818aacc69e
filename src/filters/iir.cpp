#include "filters/iir.h"

#include <algorithm>
#include <cmath>

#include "util/exception.h"

namespace masterprint {

namespace {
constexpr float kPi = 3.14159265358979323846f;

void check_frequency(float hz, int sr) {
  MASTERPRINT_CHECK(hz > 0 && sr > 0, ErrorCode::InvalidParameter);
  MASTERPRINT_CHECK(hz < sr / 2.0f, ErrorCode::InvalidParameter);
}

BiquadCoeffs normalized(float b0, float b1, float b2, float a0, float a1, float a2) {
  BiquadCoeffs coeffs;
  coeffs.b0 = b0 / a0;
  coeffs.b1 = b1 / a0;
  coeffs.b2 = b2 / a0;
  coeffs.a1 = a1 / a0;
  coeffs.a2 = a2 / a0;
  return coeffs;
}
}  // namespace

BiquadCoeffs lowpass_coeffs(float cutoff_hz, int sr) {
  check_frequency(cutoff_hz, sr);

  float omega = 2.0f * kPi * cutoff_hz / sr;
  float cos_omega = std::cos(omega);
  float alpha = std::sin(omega) / std::sqrt(2.0f);

  return normalized((1.0f - cos_omega) / 2.0f, 1.0f - cos_omega, (1.0f - cos_omega) / 2.0f,
                    1.0f + alpha, -2.0f * cos_omega, 1.0f - alpha);
}

BiquadCoeffs peaking_coeffs(float center_hz, float gain_db, float q, int sr) {
  check_frequency(center_hz, sr);
  MASTERPRINT_CHECK(q > 0.0f, ErrorCode::InvalidParameter);

  float a = std::pow(10.0f, gain_db / 40.0f);
  float omega = 2.0f * kPi * center_hz / sr;
  float cos_omega = std::cos(omega);
  float alpha = std::sin(omega) / (2.0f * q);

  return normalized(1.0f + alpha * a, -2.0f * cos_omega, 1.0f - alpha * a, 1.0f + alpha / a,
                    -2.0f * cos_omega, 1.0f - alpha / a);
}

BiquadCoeffs low_shelf_coeffs(float corner_hz, float gain_db, int sr) {
  check_frequency(corner_hz, sr);

  float a = std::pow(10.0f, gain_db / 40.0f);
  float omega = 2.0f * kPi * corner_hz / sr;
  float cos_omega = std::cos(omega);
  float alpha = std::sin(omega) / std::sqrt(2.0f);
  float two_sqrt_a_alpha = 2.0f * std::sqrt(a) * alpha;

  return normalized(a * ((a + 1.0f) - (a - 1.0f) * cos_omega + two_sqrt_a_alpha),
                    2.0f * a * ((a - 1.0f) - (a + 1.0f) * cos_omega),
                    a * ((a + 1.0f) - (a - 1.0f) * cos_omega - two_sqrt_a_alpha),
                    (a + 1.0f) + (a - 1.0f) * cos_omega + two_sqrt_a_alpha,
                    -2.0f * ((a - 1.0f) + (a + 1.0f) * cos_omega),
                    (a + 1.0f) + (a - 1.0f) * cos_omega - two_sqrt_a_alpha);
}

BiquadCoeffs high_shelf_coeffs(float corner_hz, float gain_db, int sr) {
  check_frequency(corner_hz, sr);

  float a = std::pow(10.0f, gain_db / 40.0f);
  float omega = 2.0f * kPi * corner_hz / sr;
  float cos_omega = std::cos(omega);
  float alpha = std::sin(omega) / std::sqrt(2.0f);
  float two_sqrt_a_alpha = 2.0f * std::sqrt(a) * alpha;

  return normalized(a * ((a + 1.0f) + (a - 1.0f) * cos_omega + two_sqrt_a_alpha),
                    -2.0f * a * ((a - 1.0f) + (a + 1.0f) * cos_omega),
                    a * ((a + 1.0f) + (a - 1.0f) * cos_omega - two_sqrt_a_alpha),
                    (a + 1.0f) - (a - 1.0f) * cos_omega + two_sqrt_a_alpha,
                    2.0f * ((a - 1.0f) - (a + 1.0f) * cos_omega),
                    (a + 1.0f) - (a - 1.0f) * cos_omega - two_sqrt_a_alpha);
}

std::vector<float> apply_biquad(const float* input, size_t size, const BiquadCoeffs& coeffs) {
  if (size == 0) {
    return {};
  }
  MASTERPRINT_CHECK(input != nullptr, ErrorCode::InvalidParameter);

  std::vector<float> output(size);
  float z1 = 0.0f;
  float z2 = 0.0f;

  for (size_t i = 0; i < size; ++i) {
    float x = input[i];
    float y = coeffs.b0 * x + z1;
    z1 = coeffs.b1 * x - coeffs.a1 * y + z2;
    z2 = coeffs.b2 * x - coeffs.a2 * y;
    output[i] = y;
  }

  return output;
}

std::vector<float> apply_biquad(const std::vector<float>& input, const BiquadCoeffs& coeffs) {
  return apply_biquad(input.data(), input.size(), coeffs);
}

std::vector<float> apply_biquad_filtfilt(const float* input, size_t size,
                                         const BiquadCoeffs& coeffs) {
  if (size == 0) {
    return {};
  }
  std::vector<float> forward = apply_biquad(input, size, coeffs);
  std::reverse(forward.begin(), forward.end());
  std::vector<float> backward = apply_biquad(forward.data(), size, coeffs);
  std::reverse(backward.begin(), backward.end());
  return backward;
}

void split_bands(const float* input, size_t size, float cutoff_hz, int sr, std::vector<float>& low,
                 std::vector<float>& high) {
  low = apply_biquad_filtfilt(input, size, lowpass_coeffs(cutoff_hz, sr));
  high.resize(size);
  for (size_t i = 0; i < size; ++i) {
    high[i] = input[i] - low[i];
  }
}

}  // namespace masterprint
