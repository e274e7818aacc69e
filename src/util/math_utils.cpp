/// @file math_utils.cpp
/// @brief Implementation of math utility functions.

#include "util/math_utils.h"

#include <algorithm>
#include <cmath>
#include <vector>

namespace masterprint {

namespace {
constexpr float kPi = 3.14159265358979323846f;
}  // namespace

float pearson_correlation(const float* a, const float* b, size_t size) {
  if (size < 2) return 0.0f;

  double mean_a = 0.0;
  double mean_b = 0.0;
  for (size_t i = 0; i < size; ++i) {
    mean_a += a[i];
    mean_b += b[i];
  }
  mean_a /= static_cast<double>(size);
  mean_b /= static_cast<double>(size);

  double num = 0.0;
  double den_a = 0.0;
  double den_b = 0.0;

  for (size_t i = 0; i < size; ++i) {
    double da = a[i] - mean_a;
    double db = b[i] - mean_b;
    num += da * db;
    den_a += da * da;
    den_b += db * db;
  }

  double denom = std::sqrt(den_a * den_b);
  if (denom < 1e-12) return 0.0f;
  return static_cast<float>(clamp(num / denom, -1.0, 1.0));
}

float median(const float* data, size_t size) {
  if (size == 0) return 0.0f;

  std::vector<float> sorted(data, data + size);
  std::sort(sorted.begin(), sorted.end());

  if (size % 2 == 0) {
    return (sorted[size / 2 - 1] + sorted[size / 2]) / 2.0f;
  }
  return sorted[size / 2];
}

float percentile(const float* data, size_t size, float p) {
  if (size == 0) return 0.0f;

  std::vector<float> sorted(data, data + size);
  std::sort(sorted.begin(), sorted.end());

  float idx = (p / 100.0f) * (size - 1);
  size_t lo = static_cast<size_t>(idx);
  size_t hi = std::min(lo + 1, size - 1);
  float frac = idx - lo;

  return sorted[lo] * (1.0f - frac) + sorted[hi] * frac;
}

float coefficient_of_variation(const float* data, size_t size) {
  float m = mean(data, size);
  if (m <= kEpsilon) return 0.0f;
  return stddev(data, size) / m;
}

float stability_from_cv(const std::vector<float>& values, float scale) {
  if (values.empty() || mean(values) <= kEpsilon) return 0.5f;
  float cv = coefficient_of_variation(values.data(), values.size());
  return clamp(1.0f / (1.0f + cv * scale), 0.0f, 1.0f);
}

float normalize_to_range(float value, float lo, float hi) {
  if (hi <= lo) return 0.0f;
  return clamp((value - lo) / (hi - lo), 0.0f, 1.0f);
}

float ramp_to_s_curve(float value, float lo, float hi) {
  float x = normalize_to_range(value, lo, hi);
  return 0.5f * (1.0f - std::cos(kPi * x));
}

float rms(const float* data, size_t size) {
  if (size == 0) return 0.0f;
  double sum_sq = 0.0;
  for (size_t i = 0; i < size; ++i) {
    sum_sq += static_cast<double>(data[i]) * static_cast<double>(data[i]);
  }
  return static_cast<float>(std::sqrt(sum_sq / static_cast<double>(size)));
}

float peak_abs(const float* data, size_t size) {
  float peak = 0.0f;
  for (size_t i = 0; i < size; ++i) {
    peak = std::max(peak, std::abs(data[i]));
  }
  return peak;
}

}  // namespace masterprint
