#pragma once

/// @file math_utils.h
/// @brief Mathematical utility functions for feature extraction and mastering curves.

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <numeric>
#include <vector>

namespace masterprint {

/// @brief Small constant guarding divisions and logarithms.
constexpr float kEpsilon = 1e-10f;

/// @brief Clamps a value between min and max.
/// @tparam T Numeric type
/// @param value Value to clamp
/// @param min_val Minimum bound
/// @param max_val Maximum bound
/// @return Clamped value
template <typename T>
T clamp(T value, T min_val, T max_val) {
  return std::max(min_val, std::min(value, max_val));
}

/// @brief Computes the arithmetic mean.
/// @tparam T Numeric type
/// @param data Pointer to data array
/// @param size Number of elements
/// @return Mean value (0 if empty)
template <typename T>
T mean(const T* data, size_t size) {
  if (size == 0) return T{0};
  T sum = std::accumulate(data, data + size, T{0});
  return sum / static_cast<T>(size);
}

/// @brief Computes the population variance.
/// @tparam T Numeric type
/// @param data Pointer to data array
/// @param size Number of elements
/// @return Variance (0 if size < 2)
template <typename T>
T variance(const T* data, size_t size) {
  if (size < 2) return T{0};
  T m = mean(data, size);
  T sum_sq = T{0};
  for (size_t i = 0; i < size; ++i) {
    T diff = data[i] - m;
    sum_sq += diff * diff;
  }
  return sum_sq / static_cast<T>(size);
}

/// @brief Computes the standard deviation.
template <typename T>
T stddev(const T* data, size_t size) {
  return std::sqrt(variance(data, size));
}

/// @brief Vector overloads.
inline float mean(const std::vector<float>& v) { return mean(v.data(), v.size()); }
inline float stddev(const std::vector<float>& v) { return stddev(v.data(), v.size()); }

/// @brief Computes Pearson correlation coefficient.
/// @param a First vector
/// @param b Second vector
/// @param size Number of elements (must be same for both)
/// @return Correlation coefficient in [-1, 1] (0 if either input is constant)
float pearson_correlation(const float* a, const float* b, size_t size);

/// @brief Computes the median value.
/// @param data Pointer to data array
/// @param size Number of elements
/// @return Median value (0 if empty)
float median(const float* data, size_t size);

/// @brief Computes the p-th percentile.
/// @param data Pointer to data array
/// @param size Number of elements
/// @param p Percentile in [0, 100]
/// @return Percentile value (0 if empty)
float percentile(const float* data, size_t size, float p);

/// @brief Coefficient of variation (std / mean).
/// @return 0 when the mean is not positive
float coefficient_of_variation(const float* data, size_t size);

/// @brief Maps a coefficient of variation to a stability score.
/// @details Returns 1 / (1 + cv * scale) clipped to [0, 1]. Values with a non-positive mean
///          carry no information and map to 0.5.
/// @param values Observations
/// @param scale Sensitivity (1 for generic stability, 10 for pitch)
float stability_from_cv(const std::vector<float>& values, float scale = 1.0f);

/// @brief Linearly maps value from [lo, hi] to [0, 1] with clipping.
float normalize_to_range(float value, float lo, float hi);

/// @brief Smooth s-curve ramp between two breakpoints.
/// @details 0 below @p lo, 1 above @p hi, raised-cosine in between.
float ramp_to_s_curve(float value, float lo, float hi);

/// @brief Converts linear amplitude to decibels (floored at kEpsilon).
inline float amplitude_to_db(float amplitude) {
  return 20.0f * std::log10(std::max(amplitude, kEpsilon));
}

/// @brief Converts decibels to linear amplitude.
inline float db_to_amplitude(float db) { return std::pow(10.0f, db / 20.0f); }

/// @brief Returns the RMS of a sample range.
float rms(const float* data, size_t size);

/// @brief Returns the absolute peak of a sample range.
float peak_abs(const float* data, size_t size);

}  // namespace masterprint
