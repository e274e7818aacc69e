/// @file audio_buffer_test.cpp
/// @brief Tests for the multichannel AudioBuffer.

#include "core/audio_buffer.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <vector>

#include "util/exception.h"

using namespace masterprint;
using Catch::Matchers::WithinAbs;

TEST_CASE("AudioBuffer construction", "[audio_buffer]") {
  AudioBuffer buffer(2, 100, 44100);
  REQUIRE(buffer.channels() == 2);
  REQUIRE(buffer.frames() == 100);
  REQUIRE(buffer.sample_rate() == 44100);
  REQUIRE(buffer.channel(1)[99] == 0.0f);

  AudioBuffer empty;
  REQUIRE(empty.empty());
}

TEST_CASE("AudioBuffer interleaved conversion", "[audio_buffer]") {
  std::vector<float> interleaved = {0.1f, -0.1f, 0.2f, -0.2f, 0.3f, -0.3f};
  AudioBuffer buffer = AudioBuffer::from_interleaved(interleaved.data(), interleaved.size(), 2,
                                                     48000);

  REQUIRE(buffer.frames() == 3);
  REQUIRE(buffer.channel(0)[2] == 0.3f);
  REQUIRE(buffer.channel(1)[0] == -0.1f);
  REQUIRE(buffer.interleaved() == interleaved);

  REQUIRE_THROWS_AS(AudioBuffer::from_interleaved(interleaved.data(), 5, 2, 48000),
                    MasterprintException);
}

TEST_CASE("AudioBuffer from_channels", "[audio_buffer]") {
  AudioBuffer buffer = AudioBuffer::from_channels({{1.0f, 2.0f}, {3.0f, 4.0f}}, 8000);
  REQUIRE(buffer.channels() == 2);
  REQUIRE(buffer.frames() == 2);

  REQUIRE_THROWS_AS(AudioBuffer::from_channels({{1.0f, 2.0f}, {3.0f}}, 8000),
                    MasterprintException);
}

TEST_CASE("AudioBuffer slice", "[audio_buffer]") {
  AudioBuffer buffer = AudioBuffer::from_channels({{0.f, 1.f, 2.f, 3.f}, {4.f, 5.f, 6.f, 7.f}}, 4);

  AudioBuffer mid = buffer.slice(1, 3);
  REQUIRE(mid.frames() == 2);
  REQUIRE(mid.channel(0)[0] == 1.0f);
  REQUIRE(mid.channel(1)[1] == 6.0f);
  REQUIRE(mid.sample_rate() == 4);

  REQUIRE(buffer.slice(3, 100).frames() == 1);
  REQUIRE(buffer.slice(3, 1).frames() == 0);
}

TEST_CASE("AudioBuffer mono and stereo views", "[audio_buffer]") {
  AudioBuffer stereo = AudioBuffer::from_channels({{1.0f, 0.0f}, {0.0f, 1.0f}}, 100);
  Audio mono = stereo.to_mono();
  REQUIRE(mono.size() == 2);
  REQUIRE_THAT(mono[0], WithinAbs(0.5f, 1e-6f));

  AudioBuffer from_mono = AudioBuffer::from_mono(Audio::from_vector({0.25f, 0.5f}, 100));
  REQUIRE(from_mono.channels() == 1);
  AudioBuffer upmixed = from_mono.to_stereo();
  REQUIRE(upmixed.channels() == 2);
  REQUIRE(upmixed.channel(1)[1] == 0.5f);

  AudioBuffer surround(3, 10, 100);
  REQUIRE_THROWS_AS(surround.to_stereo(), MasterprintException);
}

TEST_CASE("AudioBuffer gain and peak", "[audio_buffer]") {
  AudioBuffer buffer = AudioBuffer::from_channels({{0.5f, -0.25f}, {0.1f, 0.2f}}, 100);
  REQUIRE_THAT(buffer.peak(), WithinAbs(0.5f, 1e-6f));

  buffer.apply_gain(2.0f);
  REQUIRE_THAT(buffer.peak(), WithinAbs(1.0f, 1e-6f));
  REQUIRE_THAT(buffer.channel(1)[1], WithinAbs(0.4f, 1e-6f));
}
