/// @file streaming_temporal_test.cpp
/// @brief Tests for the incremental temporal analyzer.

#include "streaming/streaming_temporal.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <cmath>
#include <vector>

#include "util/exception.h"

using namespace masterprint;
using Catch::Matchers::WithinAbs;

namespace {

constexpr int kSr = 22050;

/// @brief Decaying clicks at a fixed tempo.
std::vector<float> click_track(float bpm, float seconds) {
  std::vector<float> out(static_cast<size_t>(seconds * kSr), 0.0f);
  size_t period = static_cast<size_t>(60.0f / bpm * kSr);
  for (size_t start = 0; start < out.size(); start += period) {
    for (size_t i = 0; i < 256 && start + i < out.size(); ++i) {
      out[start + i] = 0.9f * std::exp(-static_cast<float>(i) / 40.0f) * ((i % 2) ? 1.0f : -1.0f);
    }
  }
  return out;
}

}  // namespace

TEST_CASE("StreamingTemporalAnalyzer defaults before analysis", "[streaming][temporal]") {
  StreamingTemporalAnalyzer analyzer(kSr);
  TemporalEstimate est = analyzer.estimate();
  REQUIRE(est.confidence == 0.0f);
  REQUIRE(est.tempo_bpm == 120.0f);
  REQUIRE(est.silence_ratio == 0.1f);
}

TEST_CASE("StreamingTemporalAnalyzer follows a click track", "[streaming][temporal]") {
  StreamingTemporalAnalyzer analyzer(kSr);
  std::vector<float> audio = click_track(120.0f, 10.0f);
  TemporalEstimate est;
  for (size_t pos = 0; pos < audio.size(); pos += 4096) {
    size_t n = std::min<size_t>(4096, audio.size() - pos);
    est = analyzer.update(audio.data() + pos, n);
  }

  REQUIRE(analyzer.analyses() == 5);
  REQUIRE(est.confidence == 1.0f);
  REQUIRE_THAT(est.tempo_bpm, WithinAbs(120.0f, 6.0f));
  REQUIRE(est.transient_density > 0.0f);
  REQUIRE(analyzer.loudness_frames() == audio.size() / 512);
}

TEST_CASE("StreamingTemporalAnalyzer silence ratio", "[streaming][temporal]") {
  StreamingTemporalAnalyzer analyzer(kSr);
  std::vector<float> loud(512 * 20, 0.5f);
  std::vector<float> quiet(512 * 20, 0.0f);
  analyzer.update(loud.data(), loud.size());
  TemporalEstimate est = analyzer.update(quiet.data(), quiet.size());
  REQUIRE_THAT(est.silence_ratio, WithinAbs(0.5f, 1e-6f));

  analyzer.reset();
  REQUIRE(analyzer.loudness_frames() == 0);
  REQUIRE(analyzer.analyses() == 0);
}

TEST_CASE("StreamingTemporalAnalyzer loudness history is bounded", "[streaming][temporal]") {
  StreamingTemporalConfig config;
  config.loudness_seconds = 1.0f;
  StreamingTemporalAnalyzer analyzer(kSr, config);
  std::vector<float> audio(kSr * 3, 0.25f);
  analyzer.update(audio.data(), audio.size());
  REQUIRE(analyzer.loudness_frames() == static_cast<size_t>(kSr / 512));
}

TEST_CASE("StreamingTemporalAnalyzer silence follows the loudest frame in the history",
          "[streaming][temporal]") {
  StreamingTemporalConfig config;
  config.loudness_seconds = 0.465f;  // 20 frames of 512 samples
  StreamingTemporalAnalyzer analyzer(kSr, config);

  std::vector<float> loud(512, 1.0f);
  std::vector<float> soft(512, 0.005f);  // -46 dB
  analyzer.update(loud.data(), loud.size());
  for (int i = 0; i < 19; ++i) analyzer.update(soft.data(), soft.size());
  REQUIRE(analyzer.loudness_frames() == 20);
  REQUIRE_THAT(analyzer.estimate().silence_ratio, WithinAbs(19.0f / 20.0f, 1e-6f));

  // The loud frame expires; the soft frames are now the loudest and none is silent.
  analyzer.update(soft.data(), soft.size());
  REQUIRE(analyzer.estimate().silence_ratio == 0.0f);

  std::vector<float> medium(512, 0.1f);  // -20 dB, 26 dB above the soft frames
  analyzer.update(medium.data(), medium.size());
  REQUIRE(analyzer.estimate().silence_ratio == 0.0f);

  analyzer.reset();
  analyzer.update(soft.data(), soft.size());
  REQUIRE(analyzer.estimate().silence_ratio == 0.0f);
}

TEST_CASE("StreamingTemporalAnalyzer validates configuration", "[streaming][temporal]") {
  StreamingTemporalConfig config;
  config.loudness_frame = 0;
  REQUIRE_THROWS_AS(StreamingTemporalAnalyzer(kSr, config), MasterprintException);
}
