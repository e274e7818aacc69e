/// @file enhancement_test.cpp
/// @brief Tests for the shared in-place DSP primitives.

#include "mastering/enhancement.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <cmath>
#include <vector>

#include "util/math_utils.h"

using namespace masterprint;
using Catch::Matchers::WithinAbs;

namespace {

constexpr float kPi = 3.14159265358979323846f;
constexpr int kSr = 44100;

std::vector<float> sine(float freq, float amplitude, size_t n) {
  std::vector<float> out(n);
  for (size_t i = 0; i < n; ++i) {
    out[i] = amplitude * std::sin(2.0f * kPi * freq * static_cast<float>(i) / kSr);
  }
  return out;
}

float side_energy(const AudioBuffer& audio) {
  double sum = 0.0;
  for (size_t i = 0; i < audio.frames(); ++i) {
    float side = 0.5f * (audio.channel(0)[i] - audio.channel(1)[i]);
    sum += side * side;
  }
  return static_cast<float>(sum);
}

float crest_db(const AudioBuffer& audio) {
  return amplitude_to_db(audio.peak() / rms(audio.channel(0), audio.frames()));
}

}  // namespace

TEST_CASE("apply_gain_db", "[enhancement]") {
  AudioBuffer audio = AudioBuffer::from_channels({{0.25f, -0.5f}}, kSr);
  apply_gain_db(audio, 6.0f);
  REQUIRE_THAT(audio.channel(0)[0], WithinAbs(0.25f * 1.99526f, 1e-4f));
  REQUIRE_THAT(audio.channel(0)[1], WithinAbs(-0.5f * 1.99526f, 1e-4f));
}

TEST_CASE("safety_limit", "[enhancement]") {
  AudioBuffer loud = AudioBuffer::from_channels({{1.5f, -0.3f}, {0.2f, 0.1f}}, kSr);
  float gain = safety_limit(loud, 0.99f);
  REQUIRE_THAT(gain, WithinAbs(0.66f, 1e-5f));
  REQUIRE_THAT(loud.peak(), WithinAbs(0.99f, 1e-6f));

  AudioBuffer quiet = AudioBuffer::from_channels({{0.5f, -0.3f}}, kSr);
  REQUIRE(safety_limit(quiet, 0.99f) == 1.0f);
  REQUIRE(quiet.channel(0)[0] == 0.5f);
}

TEST_CASE("normalize_peak", "[enhancement]") {
  AudioBuffer audio = AudioBuffer::from_channels({{0.1f, -0.2f}}, kSr);
  normalize_peak(audio, 0.9f);
  REQUIRE_THAT(audio.peak(), WithinAbs(0.9f, 1e-6f));

  AudioBuffer silence(2, 100, kSr);
  REQUIRE(normalize_peak(silence, 0.9f) == 1.0f);
  REQUIRE(silence.peak() == 0.0f);
}

TEST_CASE("soft_clip", "[enhancement]") {
  AudioBuffer audio = AudioBuffer::from_channels({{0.5f, 0.85f, 1.2f, -3.0f}}, kSr);
  soft_clip(audio, 0.8f, 0.95f);
  const float* x = audio.channel(0);
  REQUIRE(x[0] == 0.5f);
  REQUIRE(x[1] > 0.8f);
  REQUIRE(x[1] < 0.85f);
  REQUIRE(x[2] > x[1]);
  REQUIRE(x[2] < 0.95f);
  REQUIRE(x[3] < 0.0f);
  REQUIRE(x[3] >= -0.95f - 1e-6f);

  SECTION("ceiling below threshold hard clips") {
    AudioBuffer hard = AudioBuffer::from_channels({{0.5f, -0.9f}}, kSr);
    soft_clip(hard, 0.9f, 0.6f);
    REQUIRE(hard.channel(0)[0] == 0.5f);
    REQUIRE(hard.channel(0)[1] == -0.6f);
  }
}

TEST_CASE("EQ helpers", "[enhancement]") {
  std::vector<float> tone = sine(4500.0f, 0.25f, kSr / 2);

  SECTION("zero gain is a no-op") {
    AudioBuffer audio = AudioBuffer::from_channels({tone}, kSr);
    apply_peaking_band(audio, 4500.0f, 0.0f, 0.8f);
    apply_high_shelf(audio, 10000.0f, 0.0f);
    apply_low_shelf(audio, 40.0f, 0.0f);
    REQUIRE(audio.channel_vector(0) == tone);
  }

  SECTION("peaking boost raises the band") {
    AudioBuffer audio = AudioBuffer::from_channels({tone}, kSr);
    float before = rms(audio.channel(0), audio.frames());
    apply_peaking_band(audio, 4500.0f, 3.0f, 0.8f);
    float after = rms(audio.channel(0) + 4410, audio.frames() - 4410);
    REQUIRE_THAT(amplitude_to_db(after / before), WithinAbs(3.0f, 0.3f));
  }

  SECTION("centers above Nyquist are tolerated") {
    AudioBuffer audio = AudioBuffer::from_channels({sine(1000.0f, 0.25f, 8000)}, 16000);
    apply_high_shelf(audio, 10000.0f, 2.0f);
    REQUIRE(std::isfinite(audio.peak()));
  }
}

TEST_CASE("boost_low_band", "[enhancement]") {
  std::vector<float> bass = sine(50.0f, 0.2f, kSr);
  std::vector<float> treble = sine(3000.0f, 0.2f, kSr);
  std::vector<float> mix(kSr);
  for (size_t i = 0; i < mix.size(); ++i) mix[i] = bass[i] + treble[i];

  SECTION("zero gain reconstructs") {
    AudioBuffer audio = AudioBuffer::from_channels({mix}, kSr);
    boost_low_band(audio, 100.0f, 0.0f);
    for (size_t i = 0; i < mix.size(); i += 97) {
      REQUIRE_THAT(audio.channel(0)[i], WithinAbs(mix[i], 1e-4f));
    }
  }

  SECTION("treble passes through a bass boost") {
    AudioBuffer audio = AudioBuffer::from_channels({treble}, kSr);
    boost_low_band(audio, 100.0f, 6.0f);
    float ratio = rms(audio.channel(0), audio.frames()) / rms(treble.data(), treble.size());
    REQUIRE_THAT(ratio, WithinAbs(1.0f, 0.02f));
  }

  SECTION("bass is raised") {
    AudioBuffer audio = AudioBuffer::from_channels({bass}, kSr);
    boost_low_band(audio, 100.0f, 6.0f);
    REQUIRE(rms(audio.channel(0), audio.frames()) > 1.5f * rms(bass.data(), bass.size()));
  }
}

TEST_CASE("adjust_stereo_width_multiband", "[enhancement]") {
  std::vector<float> left = sine(1000.0f, 0.4f, kSr / 2);
  std::vector<float> right = sine(1000.0f, 0.2f, kSr / 2);

  SECTION("neutral factor preserves the mix") {
    AudioBuffer audio = AudioBuffer::from_channels({left, right}, kSr);
    adjust_stereo_width_multiband(audio, 0.5f);
    for (size_t i = 0; i < left.size(); i += 101) {
      REQUIRE_THAT(audio.channel(0)[i], WithinAbs(left[i], 1e-4f));
      REQUIRE_THAT(audio.channel(1)[i], WithinAbs(right[i], 1e-4f));
    }
  }

  SECTION("wider factor raises side energy") {
    AudioBuffer audio = AudioBuffer::from_channels({left, right}, kSr);
    float before = side_energy(audio);
    adjust_stereo_width_multiband(audio, 0.7f);
    REQUIRE(side_energy(audio) > 1.2f * before);
  }

  SECTION("mono is untouched") {
    AudioBuffer mono = AudioBuffer::from_channels({left}, kSr);
    adjust_stereo_width_multiband(mono, 0.9f);
    REQUIRE(mono.channel_vector(0) == left);
  }
}

TEST_CASE("rms_expansion raises crest", "[enhancement]") {
  std::vector<float> body = sine(200.0f, 0.3f, kSr);
  body[kSr / 2] = 1.0f;
  AudioBuffer audio = AudioBuffer::from_channels({body}, kSr);
  float before = crest_db(audio);
  rms_expansion(audio, 2.0f, 0.5f);
  REQUIRE(audio.peak() == 1.0f);
  REQUIRE(crest_db(audio) > before + 0.3f);

  SECTION("zero amount is a no-op") {
    AudioBuffer copy = AudioBuffer::from_channels({body}, kSr);
    rms_expansion(copy, 2.0f, 0.0f);
    REQUIRE(copy.channel_vector(0) == body);
  }

  SECTION("a quiet chunk is expanded against the track peak") {
    AudioBuffer quiet = AudioBuffer::from_channels({sine(200.0f, 0.01f, kSr)}, kSr);
    AudioBuffer own = quiet;
    rms_expansion(own, 2.0f, 0.5f);
    rms_expansion(quiet, 2.0f, 0.5f, 1.0f);
    REQUIRE(quiet.peak() < own.peak());
    REQUIRE_THAT(amplitude_to_db(quiet.peak()), WithinAbs(amplitude_to_db(0.01f) - 1.0f, 0.1f));
  }
}
