/// @file temporal_features_test.cpp
/// @brief Tests for tempo, rhythm, transients and silence.

#include "fingerprint/temporal_features.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <cmath>
#include <vector>

#include "util/exception.h"

using namespace masterprint;
using Catch::Matchers::WithinAbs;

namespace {
constexpr float kPi = 3.14159265358979323846f;
constexpr int kSr = 22050;

/// @brief Decaying 1 kHz clicks at @p bpm.
Audio click_track(float bpm, float seconds) {
  std::vector<float> samples(static_cast<size_t>(kSr * seconds), 0.0f);
  size_t period = static_cast<size_t>(kSr * 60.0f / bpm);
  for (size_t start = 0; start < samples.size(); start += period) {
    for (size_t i = 0; i < 1000 && start + i < samples.size(); ++i) {
      float decay = std::exp(-static_cast<float>(i) / 150.0f);
      samples[start + i] = 0.8f * decay * std::sin(2.0f * kPi * 1000.0f * i / kSr);
    }
  }
  return Audio::from_vector(std::move(samples), kSr);
}
}  // namespace

TEST_CASE("onset envelope responds to clicks", "[temporal]") {
  std::vector<float> env = onset_envelope(click_track(120.0f, 4.0f));
  REQUIRE_FALSE(env.empty());
  REQUIRE(env[0] == 0.0f);
  float peak = 0.0f;
  for (float v : env) peak = std::max(peak, v);
  REQUIRE(peak > 0.0f);
}

TEST_CASE("estimate_tempo on a click track", "[temporal]") {
  std::vector<float> env = onset_envelope(click_track(120.0f, 8.0f));
  REQUIRE_THAT(estimate_tempo(env, kSr), WithinAbs(120.0f, 4.0f));
}

TEST_CASE("estimate_tempo rejects a flat envelope", "[temporal]") {
  std::vector<float> flat(400, 0.0f);
  REQUIRE_THROWS_AS(estimate_tempo(flat, kSr), MasterprintException);
}

TEST_CASE("rhythm_stability_from_beats", "[temporal]") {
  REQUIRE(rhythm_stability_from_beats({0, 10}) == 0.0f);
  REQUIRE_THAT(rhythm_stability_from_beats({0, 10, 20, 30, 40}), WithinAbs(1.0f, 1e-6f));
  REQUIRE(rhythm_stability_from_beats({0, 3, 20, 22, 40}) < 0.8f);
}

TEST_CASE("silence_ratio", "[temporal]") {
  std::vector<float> samples(kSr * 2, 0.0f);
  for (size_t i = 0; i < samples.size() / 2; ++i) {
    samples[i] = 0.5f * std::sin(2.0f * kPi * 440.0f * i / kSr);
  }
  float ratio = silence_ratio(Audio::from_vector(samples, kSr));
  REQUIRE_THAT(ratio, WithinAbs(0.5f, 0.05f));
}

TEST_CASE("extract_temporal fields", "[temporal]") {
  FeatureMap out = extract_temporal(click_track(120.0f, 8.0f));
  REQUIRE_THAT(out.at("tempo_bpm"), WithinAbs(120.0f, 4.0f));
  REQUIRE(out.at("rhythm_stability") > 0.8f);
  REQUIRE(out.at("transient_density") > 0.0f);
  REQUIRE(out.at("transient_density") <= 1.0f);
}

TEST_CASE("extract_temporal on a steady tone falls back to the default tempo", "[temporal]") {
  std::vector<float> samples(kSr * 3);
  for (size_t i = 0; i < samples.size(); ++i) {
    samples[i] = 0.5f * std::sin(2.0f * kPi * 440.0f * i / kSr);
  }
  FeatureMap out = extract_temporal(Audio::from_vector(std::move(samples), kSr));
  REQUIRE(out.at("silence_ratio") == 0.0f);
  REQUIRE(out.count("tempo_bpm") == 1);
  REQUIRE(out.at("tempo_bpm") >= 40.0f);
  REQUIRE(out.at("tempo_bpm") <= 200.0f);
}
