/// @file audio_test.cpp
/// @brief Tests for the mono Audio view.

#include "core/audio.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <numeric>
#include <vector>

using namespace masterprint;
using Catch::Matchers::WithinAbs;

namespace {
std::vector<float> ramp(size_t n) {
  std::vector<float> v(n);
  std::iota(v.begin(), v.end(), 0.0f);
  return v;
}
}  // namespace

TEST_CASE("Audio from_buffer", "[audio]") {
  std::vector<float> samples = {0.1f, 0.2f, 0.3f};
  Audio audio = Audio::from_buffer(samples.data(), samples.size(), 22050);

  REQUIRE(audio.size() == 3);
  REQUIRE(audio.sample_rate() == 22050);
  REQUIRE(audio[1] == 0.2f);

  samples[1] = 9.0f;
  REQUIRE(audio[1] == 0.2f);
}

TEST_CASE("Audio from_vector", "[audio]") {
  Audio audio = Audio::from_vector(ramp(44100), 44100);
  REQUIRE(audio.size() == 44100);
  REQUIRE_THAT(audio.duration(), WithinAbs(1.0f, 1e-6f));
}

TEST_CASE("Audio slice by time", "[audio]") {
  Audio audio = Audio::from_vector(ramp(1000), 1000);

  Audio mid = audio.slice(0.25f, 0.5f);
  REQUIRE(mid.size() == 250);
  REQUIRE(mid[0] == 250.0f);

  Audio rest = audio.slice(0.9f);
  REQUIRE(rest.size() == 100);
}

TEST_CASE("Audio slice by samples", "[audio]") {
  Audio audio = Audio::from_vector(ramp(100), 100);

  SECTION("shares data with the parent") {
    Audio s = audio.slice_samples(10, 20);
    REQUIRE(s.size() == 10);
    REQUIRE(s[0] == 10.0f);
    REQUIRE(s.data() == audio.data() + 10);
  }

  SECTION("out of range clamps") {
    REQUIRE(audio.slice_samples(90, 1000).size() == 10);
    REQUIRE(audio.slice_samples(50, 40).empty());
  }

  SECTION("nested slices") {
    Audio s = audio.slice_samples(10, 60).slice_samples(5, 10);
    REQUIRE(s.size() == 5);
    REQUIRE(s[0] == 15.0f);
  }
}

TEST_CASE("Audio empty", "[audio]") {
  Audio audio;
  REQUIRE(audio.empty());
  REQUIRE(audio.size() == 0);
  REQUIRE(audio.slice(0.0f, 1.0f).empty());
}

TEST_CASE("Audio iterator", "[audio]") {
  Audio audio = Audio::from_vector(ramp(5), 5);
  float sum = std::accumulate(audio.begin(), audio.end(), 0.0f);
  REQUIRE_THAT(sum, WithinAbs(10.0f, 1e-6f));
}
