/// @file mastering_engine_test.cpp
/// @brief Tests for fingerprint-driven mastering of buffers and files.

#include "mastering/mastering_engine.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <string>
#include <vector>

#include "core/audio_io.h"
#include "mastering/processing_branches.h"
#include "util/exception.h"
#include "util/math_utils.h"

using namespace masterprint;
using Catch::Matchers::WithinAbs;

namespace fs = std::filesystem;

namespace {

constexpr float kPi = 3.14159265358979323846f;
constexpr int kSr = 22050;

AudioBuffer stereo_tone(float amplitude, float seconds) {
  size_t n = static_cast<size_t>(seconds * kSr);
  std::vector<float> left(n);
  std::vector<float> right(n);
  for (size_t i = 0; i < n; ++i) {
    float t = static_cast<float>(i) / kSr;
    left[i] = amplitude * std::sin(2.0f * kPi * 220.0f * t);
    right[i] = amplitude * std::sin(2.0f * kPi * 330.0f * t);
  }
  return AudioBuffer::from_channels({left, right}, kSr);
}

/// @brief Two seconds at @p loud followed by two seconds at @p quiet.
AudioBuffer loud_then_quiet(float loud, float quiet) {
  AudioBuffer audio = stereo_tone(1.0f, 4.0f);
  for (int ch = 0; ch < 2; ++ch) {
    float* x = audio.channel(ch);
    for (size_t i = 0; i < audio.frames(); ++i) {
      x[i] *= i < 2 * static_cast<size_t>(kSr) ? loud : quiet;
    }
  }
  return audio;
}

/// @brief Peak of one second of output, skipping the 100 ms of filter ringing after a step.
float second_peak_db(const AudioBuffer& audio, size_t second) {
  size_t start = second * kSr + kSr / 10;
  return amplitude_to_db(audio.slice(start, std::min(start + kSr, audio.frames())).peak());
}

MasteringOptions short_chunks() {
  MasteringOptions options;
  options.pipeline.chunk_seconds = 1.0f;
  options.pipeline.crossfade_seconds = 0.1f;
  return options;
}

Fingerprint quiet_fingerprint() {
  FeatureMap values;
  values["lufs"] = -20.0f;
  values["crest_db"] = 16.0f;
  values["stereo_width"] = 0.8f;
  return Fingerprint::from_map(values);
}

}  // namespace

TEST_CASE("MasteringEngine quiet material", "[engine]") {
  MasteringEngine engine(short_chunks());
  AudioBuffer audio = stereo_tone(0.1f, 2.5f);
  MemoryChunkSink sink(2, kSr);

  MasteringResult result = engine.master_buffer(audio, quiet_fingerprint(), sink);
  REQUIRE(result.material == MaterialClass::Quiet);
  REQUIRE(result.frames == audio.frames());
  REQUIRE(sink.frames() == audio.frames());
  REQUIRE(result.channels == 2);
  REQUIRE(result.sample_rate == kSr);
  REQUIRE_THAT(result.peak_db, WithinAbs(-20.0f, 0.1f));
  REQUIRE_THAT(result.effective_intensity, WithinAbs(1.2f, 1e-5f));
  REQUIRE(result.trace.contains("makeup_gain"));
  REQUIRE(result.trace.stage_names().back() == "normalize");

  AudioBuffer output = sink.buffer();
  REQUIRE(output.peak() > audio.peak());
  REQUIRE(output.peak() <= 1.0f);
}

TEST_CASE("MasteringEngine loud material respects the output ceiling", "[engine]") {
  MasteringEngine engine(short_chunks());
  FeatureMap values;
  values["lufs"] = -8.0f;
  values["crest_db"] = 9.0f;
  values["presence_pct"] = 0.0f;
  values["air_pct"] = 0.0f;
  values["stereo_width"] = 0.8f;
  AudioBuffer audio = stereo_tone(1.0f, 2.5f);
  MemoryChunkSink sink(2, kSr);

  MasteringResult result = engine.master_buffer(audio, Fingerprint::from_map(values), sink);
  REQUIRE(result.material == MaterialClass::CompressedLoud);
  REQUIRE(result.trace.contains("rms_expansion"));
  REQUIRE(sink.buffer().peak() <= 0.98f + 1e-5f);
}

TEST_CASE("MasteringEngine keeps level differences between chunks", "[engine]") {
  MasteringOptions options;
  options.pipeline.chunk_seconds = 1.0f;
  options.pipeline.crossfade_seconds = 0.05f;
  MasteringEngine engine(options);
  AudioBuffer audio = loud_then_quiet(0.3f, 0.003f);

  SECTION("quiet material") {
    FeatureMap values;
    values["lufs"] = -20.0f;
    values["crest_db"] = 12.0f;
    values["stereo_width"] = 0.8f;
    Fingerprint fp = Fingerprint::from_map(values);
    MemoryChunkSink sink(2, kSr);
    MasteringResult result = engine.master_buffer(audio, fp, sink);
    REQUIRE(result.material == MaterialClass::Quiet);

    AudioBuffer output = sink.buffer();
    REQUIRE_THAT(output.peak(), WithinAbs(quiet_peak_target(fp), 1e-3f));
    REQUIRE(second_peak_db(output, 3) < second_peak_db(output, 0) - 30.0f);
    REQUIRE(second_peak_db(output, 2) < second_peak_db(output, 1) - 30.0f);
    REQUIRE_THAT(second_peak_db(output, 3), WithinAbs(second_peak_db(output, 2), 0.5f));
  }

  SECTION("compressed loud material") {
    FeatureMap values;
    values["lufs"] = -8.0f;
    values["crest_db"] = 9.0f;
    values["stereo_width"] = 0.8f;
    AudioBuffer hot = loud_then_quiet(1.0f, 0.01f);
    MemoryChunkSink sink(2, kSr);
    MasteringResult result = engine.master_buffer(hot, Fingerprint::from_map(values), sink);
    REQUIRE(result.material == MaterialClass::CompressedLoud);

    AudioBuffer output = sink.buffer();
    REQUIRE(output.peak() <= 0.98f + 1e-5f);
    REQUIRE(second_peak_db(output, 3) < second_peak_db(output, 0) - 30.0f);
  }
}

TEST_CASE("MasteringEngine validates intensity", "[engine]") {
  MasteringOptions options;
  options.intensity = 1.5f;
  REQUIRE_THROWS_AS(MasteringEngine(options), MasterprintException);
  options.intensity = -0.1f;
  REQUIRE_THROWS_AS(MasteringEngine(options), MasterprintException);
}

TEST_CASE("MasteringEngine masters a file", "[engine]") {
  fs::path dir = fs::temp_directory_path() / "masterprint_engine_test";
  fs::remove_all(dir);
  fs::create_directories(dir);
  std::string input = (dir / "mono.wav").string();
  std::string output = (dir / "mono_mastered.wav").string();

  AudioBuffer stereo = stereo_tone(0.1f, 2.0f);
  save_wav(input, AudioBuffer::from_mono(stereo.to_mono()), 16);

  FingerprintServiceConfig config;
  config.db_path = "";
  config.use_sidecar = false;
  int computes = 0;
  FingerprintService service(
      [&](const AudioBuffer&) {
        ++computes;
        return quiet_fingerprint();
      },
      config);

  MasteringEngine engine(short_chunks());
  std::vector<std::string> stages;
  MasteringResult result = engine.master_file(
      input, output, service, [&](float, const char* stage) { stages.emplace_back(stage); });

  REQUIRE(computes == 1);
  REQUIRE(result.channels == 2);
  REQUIRE(stages.front() == "fingerprint");
  REQUIRE(std::find(stages.begin(), stages.end(), "metering") != stages.end());
  REQUIRE(stages.back() == "mastering");
  REQUIRE_FALSE(fs::exists(output + ".partial"));

  AudioBuffer mastered = load_audio(output);
  REQUIRE(mastered.channels() == 2);
  REQUIRE(mastered.sample_rate() == kSr);
  REQUIRE(mastered.frames() == stereo.frames());

  SECTION("missing input fails before any work") {
    REQUIRE_THROWS_AS(
        engine.master_file((dir / "missing.wav").string(), output, service), MasterprintException);
    REQUIRE(computes == 1);
  }

  fs::remove_all(dir);
}

TEST_CASE("default_output_path", "[engine]") {
  REQUIRE(default_output_path("/music/song.flac") == "/music/song_mastered.wav");
  REQUIRE(default_output_path("/music.d/song") == "/music.d/song_mastered.wav");
  REQUIRE(default_output_path("track.mp3") == "track_mastered.wav");
}
