/// @file spectrum_test.cpp
/// @brief Tests for the STFT spectrogram.

#include "core/spectrum.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <cmath>
#include <vector>

using namespace masterprint;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

namespace {
constexpr float kPi = 3.14159265358979323846f;
constexpr float kTwoPi = 2.0f * kPi;

Audio create_sine(float freq, int sr, float duration) {
  int n = static_cast<int>(sr * duration);
  std::vector<float> samples(n);
  for (int i = 0; i < n; ++i) {
    samples[i] = std::sin(kTwoPi * freq * i / sr);
  }
  return Audio::from_vector(std::move(samples), sr);
}
}  // namespace

TEST_CASE("Spectrogram compute basic", "[spectrum]") {
  Audio audio = create_sine(440.0f, 22050, 1.0f);
  StftConfig config;
  Spectrogram spec = Spectrogram::compute(audio, config);

  REQUIRE(spec.n_bins() == 1025);
  REQUIRE(spec.n_frames() == 1 + 22050 / 512);
  REQUIRE(spec.n_fft() == 2048);
  REQUIRE(spec.hop_length() == 512);
  REQUIRE(spec.sample_rate() == 22050);
  REQUIRE_FALSE(spec.empty());
}

TEST_CASE("Spectrogram magnitude and power", "[spectrum]") {
  Audio audio = create_sine(1000.0f, 22050, 0.5f);
  Spectrogram spec = Spectrogram::compute(audio);

  const std::vector<float>& mag = spec.magnitude();
  const std::vector<float>& pow = spec.power();
  REQUIRE(mag.size() == static_cast<size_t>(spec.n_bins() * spec.n_frames()));
  for (size_t i = 0; i < mag.size(); i += 37) {
    REQUIRE_THAT(pow[i], WithinAbs(mag[i] * mag[i], 1e-3f * (1.0f + pow[i])));
  }
}

TEST_CASE("Spectrogram sine wave frequency detection", "[spectrum]") {
  constexpr int sr = 22050;
  Audio audio = create_sine(1000.0f, sr, 1.0f);
  Spectrogram spec = Spectrogram::compute(audio);

  int mid = spec.n_frames() / 2;
  const std::vector<float>& mag = spec.magnitude();
  int best = 0;
  for (int k = 0; k < spec.n_bins(); ++k) {
    if (mag[k * spec.n_frames() + mid] > mag[best * spec.n_frames() + mid]) best = k;
  }
  REQUIRE_THAT(spec.bin_frequency(best), WithinAbs(1000.0f, sr / 2048.0f));
}

TEST_CASE("Spectrogram short signal yields one frame", "[spectrum]") {
  Audio audio = Audio::from_vector(std::vector<float>(100, 0.1f), 22050);
  StftConfig config;
  config.center = false;
  Spectrogram spec = Spectrogram::compute(audio, config);
  REQUIRE(spec.n_frames() == 1);
}

TEST_CASE("STFT/iSTFT roundtrip", "[spectrum]") {
  constexpr int sr = 22050;
  Audio audio = create_sine(440.0f, sr, 0.5f);
  Spectrogram spec = Spectrogram::compute(audio);
  Audio rebuilt = spec.to_audio(static_cast<int>(audio.size()));

  REQUIRE(rebuilt.size() == audio.size());
  for (size_t i = 2048; i < audio.size() - 2048; i += 131) {
    REQUIRE_THAT(rebuilt[i], WithinAbs(audio[i], 1e-3f));
  }
}

TEST_CASE("Spectrogram from_complex", "[spectrum]") {
  std::vector<std::complex<float>> data(5 * 3, {1.0f, 0.0f});
  Spectrogram spec = Spectrogram::from_complex(data.data(), 5, 3, 8, 2, 100);
  REQUIRE(spec.n_bins() == 5);
  REQUIRE(spec.n_frames() == 3);
  REQUIRE_THAT(spec.magnitude()[0], WithinRel(1.0f, 1e-6f));
}
