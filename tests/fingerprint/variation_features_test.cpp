/// @file variation_features_test.cpp
/// @brief Tests for dynamic range variation, loudness spread and peak consistency.

#include "fingerprint/variation_features.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <cmath>
#include <vector>

using namespace masterprint;
using Catch::Matchers::WithinAbs;

namespace {
constexpr float kPi = 3.14159265358979323846f;
constexpr int kSr = 22050;

std::vector<float> tone(float amplitude, size_t n) {
  std::vector<float> samples(n);
  for (size_t i = 0; i < n; ++i) {
    samples[i] = amplitude * std::sin(2.0f * kPi * 441.0f * i / kSr);
  }
  return samples;
}
}  // namespace

TEST_CASE("extract_variation on a steady tone", "[variation]") {
  FeatureMap out = extract_variation(Audio::from_vector(tone(0.5f, kSr * 2), kSr));
  REQUIRE(out.at("dynamic_range_variation") < 0.05f);
  REQUIRE(out.at("loudness_variation_std") < 0.5f);
  REQUIRE(out.at("peak_consistency") > 0.95f);
}

TEST_CASE("extract_variation on alternating levels", "[variation]") {
  std::vector<float> samples;
  for (int block = 0; block < 8; ++block) {
    std::vector<float> part = tone(block % 2 == 0 ? 0.8f : 0.05f, kSr / 4);
    samples.insert(samples.end(), part.begin(), part.end());
  }
  FeatureMap out = extract_variation(Audio::from_vector(std::move(samples), kSr));

  REQUIRE(out.at("loudness_variation_std") > 5.0f);
  REQUIRE(out.at("loudness_variation_std") <= 10.0f);
  REQUIRE(out.at("peak_consistency") < 0.7f);
}

TEST_CASE("extract_variation on silence", "[variation]") {
  FeatureMap out = extract_variation(Audio::from_vector(std::vector<float>(kSr, 0.0f), kSr));
  REQUIRE(out.at("dynamic_range_variation") == 0.5f);
  REQUIRE(out.at("loudness_variation_std") == 0.0f);
  REQUIRE(out.at("peak_consistency") == 0.5f);
}
