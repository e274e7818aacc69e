/// @file processing_branches_test.cpp
/// @brief Tests for the per-material processing chains.

#include "mastering/processing_branches.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <cmath>
#include <string>
#include <vector>

#include "util/exception.h"
#include "util/math_utils.h"

using namespace masterprint;
using Catch::Matchers::WithinAbs;

namespace {

constexpr float kPi = 3.14159265358979323846f;
constexpr int kSr = 44100;

AudioBuffer stereo_tone(float amplitude, float seconds = 0.5f) {
  size_t n = static_cast<size_t>(seconds * kSr);
  std::vector<float> left(n);
  std::vector<float> right(n);
  for (size_t i = 0; i < n; ++i) {
    float t = static_cast<float>(i) / kSr;
    left[i] = amplitude * std::sin(2.0f * kPi * 440.0f * t);
    right[i] = amplitude * std::sin(2.0f * kPi * 660.0f * t);
  }
  return AudioBuffer::from_channels({left, right}, kSr);
}

Fingerprint fingerprint_with(FeatureMap values) {
  if (!values.count("stereo_width")) values["stereo_width"] = 0.8f;
  return Fingerprint::from_map(values);
}

BranchResult run(MaterialClass material, const Fingerprint& fp, const AudioBuffer& audio,
                 float intensity = 1.0f) {
  return apply_branch(material, audio, fp, amplitude_to_db(audio.peak()), intensity, kSr);
}

}  // namespace

TEST_CASE("compressed loud branch", "[branches]") {
  AudioBuffer audio = stereo_tone(0.9f);

  SECTION("hyper-compressed material skips expansion") {
    Fingerprint fp = fingerprint_with({{"lufs", -8.0f}, {"crest_db", 7.0f}});
    BranchResult result = run(MaterialClass::CompressedLoud, fp, audio);
    REQUIRE(result.trace.stage_names().front() == "skip_expansion");
    REQUIRE(result.trace.find("skip_expansion")->reason == "hyper_compressed");
    REQUIRE_FALSE(result.trace.contains("rms_expansion"));
    REQUIRE(result.needs_output_normalize);
  }

  SECTION("expansion target is bounded") {
    Fingerprint fp = fingerprint_with({{"lufs", -8.0f}, {"crest_db", 9.0f}});
    BranchResult result = run(MaterialClass::CompressedLoud, fp, audio);
    REQUIRE(result.trace.find("rms_expansion")->param("target_crest") == 2.0f);

    Fingerprint near = fingerprint_with({{"lufs", -8.0f}, {"crest_db", 12.0f}});
    BranchResult near_result = run(MaterialClass::CompressedLoud, near, audio);
    REQUIRE_THAT(near_result.trace.find("rms_expansion")->param("target_crest"),
                 WithinAbs(1.0f, 1e-6f));
  }

  SECTION("headroom precedes the spectral stages") {
    Fingerprint fp = fingerprint_with(
        {{"lufs", -8.0f}, {"crest_db", 9.0f}, {"presence_pct", 0.02f}, {"air_pct", 0.01f}});
    BranchResult result = run(MaterialClass::CompressedLoud, fp, audio);
    std::vector<std::string> names = result.trace.stage_names();
    REQUIRE(names ==
            std::vector<std::string>{"rms_expansion", "pre_eq_headroom", "presence_enhance",
                                     "air_enhance"});
    REQUIRE(result.trace.find("pre_eq_headroom")->param("gain_db") == -1.0f);
    REQUIRE(result.audio.peak() <= 0.99f + 1e-6f);
  }
}

TEST_CASE("dynamic loud branch", "[branches]") {
  Fingerprint fp = fingerprint_with({{"lufs", -9.0f}, {"crest_db", 16.0f}});
  AudioBuffer audio = stereo_tone(0.5f);
  BranchResult result = run(MaterialClass::DynamicLoud, fp, audio);
  REQUIRE(result.trace.stage_names().front() == "passthrough");
  REQUIRE(result.trace.contains("pre_eq_headroom"));
  REQUIRE(result.needs_output_normalize);
  REQUIRE(result.audio.frames() == audio.frames());
  REQUIRE_THAT(result.audio.peak(), WithinAbs(0.5f * db_to_amplitude(-1.0f), 1e-3f));
}

TEST_CASE("quiet branch", "[branches]") {
  Fingerprint fp = fingerprint_with(
      {{"lufs", -20.0f}, {"crest_db", 16.0f}, {"bass_pct", 0.05f}, {"transient_density", 0.0f}});
  AudioBuffer audio = stereo_tone(0.1f);
  BranchResult result = run(MaterialClass::Quiet, fp, audio);

  REQUIRE_FALSE(result.needs_output_normalize);
  std::vector<std::string> names = result.trace.stage_names();
  REQUIRE(names.front() == "makeup_gain");
  REQUIRE(names.back() == "normalize");
  REQUIRE(result.trace.contains("bass_enhance"));
  REQUIRE(result.trace.contains("soft_clip"));

  // 9 dB of adaptive gain minus the safety margin.
  REQUIRE_THAT(result.trace.find("makeup_gain")->param("gain_db"), WithinAbs(8.5f, 1e-4f));
  float target = result.trace.find("normalize")->param("target_peak");
  REQUIRE_THAT(result.audio.peak(), WithinAbs(target, 1e-5f));
  REQUIRE(target == quiet_peak_target(fp));
}

TEST_CASE("quiet branch at zero intensity adds no gain", "[branches]") {
  Fingerprint fp = fingerprint_with({{"lufs", -20.0f}});
  BranchResult result = run(MaterialClass::Quiet, fp, stereo_tone(0.1f), 0.0f);
  REQUIRE_FALSE(result.trace.contains("makeup_gain"));
  REQUIRE_FALSE(result.trace.contains("bass_enhance"));
  REQUIRE(result.trace.contains("normalize"));
}

TEST_CASE("branch level stage follows the level mode", "[branches]") {
  Fingerprint fp = fingerprint_with({{"lufs", -20.0f}, {"crest_db", 16.0f}});
  MasteringConfig config;
  AudioBuffer audio = stereo_tone(0.1f);
  BranchContext context{fp, amplitude_to_db(audio.peak()), 1.0f, kSr, config};

  context.level_mode = LevelMode::Deferred;
  BranchResult deferred = apply_branch(MaterialClass::Quiet, audio, context);
  REQUIRE_FALSE(deferred.trace.contains("normalize"));

  SECTION("track mode scales by the track peak, not the chunk peak") {
    context.level_mode = LevelMode::Track;
    context.track_peak = 2.0f * deferred.audio.peak();
    BranchResult leveled = apply_branch(MaterialClass::Quiet, audio, context);
    REQUIRE(leveled.trace.stage_names().back() == "normalize");
    REQUIRE_THAT(leveled.audio.peak(), WithinAbs(0.5f * quiet_peak_target(fp), 1e-4f));
  }

  SECTION("track mode limits loud material from the track peak") {
    Fingerprint loud = fingerprint_with({{"lufs", -9.0f}, {"crest_db", 16.0f}});
    BranchContext loud_context{loud, 0.0f, 1.0f, kSr, config};
    loud_context.level_mode = LevelMode::Track;
    loud_context.track_peak = 1.98f;
    BranchResult limited = apply_branch(MaterialClass::DynamicLoud, stereo_tone(0.5f), loud_context);
    REQUIRE(limited.trace.contains("safety_limit"));
    REQUIRE_THAT(limited.audio.peak(), WithinAbs(0.5f * db_to_amplitude(-1.0f) * 0.5f, 1e-3f));
  }

  SECTION("leveled peak") {
    REQUIRE(peak_after_level_stage(MaterialClass::Quiet, fp, 0.3f) == quiet_peak_target(fp));
    REQUIRE(peak_after_level_stage(MaterialClass::DynamicLoud, fp, 1.5f) == config.safety_ceiling);
    REQUIRE(peak_after_level_stage(MaterialClass::CompressedLoud, fp, 0.5f) == 0.5f);
  }
}

TEST_CASE("apply_branch validates the sample rate", "[branches]") {
  Fingerprint fp;
  AudioBuffer audio = stereo_tone(0.1f);
  REQUIRE_THROWS_AS(apply_branch(MaterialClass::Quiet, audio, fp, -20.0f, 1.0f, 48000),
                    MasterprintException);
  MasteringConfig config;
  BranchContext context{fp, -20.0f, 1.0f, 48000, config};
  REQUIRE_THROWS_AS(apply_branch(MaterialClass::Quiet, audio, context), MasterprintException);
}

TEST_CASE("stereo_expansion_stage", "[branches]") {
  StageTrace trace;

  SECTION("narrow mixes are widened") {
    AudioBuffer audio = stereo_tone(0.3f);
    stereo_expansion_stage(audio, 0.3f, 1.0f, trace);
    const StageRecord* record = trace.find("stereo_expand");
    REQUIRE(record != nullptr);
    REQUIRE_THAT(record->param("width_factor"), WithinAbs(0.5f + 0.225f * 0.9330127f, 1e-4f));
  }

  SECTION("wide mixes are left alone") {
    AudioBuffer audio = stereo_tone(0.3f);
    stereo_expansion_stage(audio, 0.6f, 1.0f, trace);
    REQUIRE(trace.empty());
  }

  SECTION("tiny expansions are skipped") {
    AudioBuffer audio = stereo_tone(0.3f);
    stereo_expansion_stage(audio, 0.5f, 1.0f, trace);
    REQUIRE(trace.empty());
  }

  SECTION("mono is skipped") {
    AudioBuffer mono(1, 1000, kSr);
    stereo_expansion_stage(mono, 0.1f, 1.0f, trace);
    REQUIRE(trace.empty());
  }
}

TEST_CASE("bass_enhancement_stage", "[branches]") {
  StageTrace trace;
  AudioBuffer audio = stereo_tone(0.2f);

  SECTION("bass-light mix is boosted") {
    bass_enhancement_stage(audio, 0.05f, 1.0f, trace);
    REQUIRE_THAT(trace.find("bass_enhance")->param("boost_db"),
                 WithinAbs(2.5f * 0.25f / 0.30f, 1e-4f));
  }

  SECTION("small boosts are skipped") {
    bass_enhancement_stage(audio, 0.28f, 1.0f, trace);
    REQUIRE(trace.empty());
  }

  SECTION("bass-heavy mix is untouched") {
    bass_enhancement_stage(audio, 0.6f, 1.0f, trace);
    REQUIRE(trace.empty());
  }
}

TEST_CASE("spectral stages", "[branches]") {
  StageTrace trace;
  AudioBuffer audio = stereo_tone(0.2f);

  SECTION("sub-bass excess is cut") {
    sub_bass_control_stage(audio, 0.25f, 0.2f, 1.0f, trace);
    REQUIRE_THAT(trace.find("sub_bass_control")->param("cut_db"), WithinAbs(-3.0f, 1e-4f));
  }

  SECTION("normal sub-bass is untouched") {
    sub_bass_control_stage(audio, 0.05f, 0.2f, 1.0f, trace);
    REQUIRE(trace.empty());
  }

  SECTION("thin mixes get warmth") {
    mid_warmth_stage(audio, 0.0f, 0.2f, 1.0f, trace);
    REQUIRE_THAT(trace.find("mid_warmth")->param("boost_db"), WithinAbs(2.0f, 1e-4f));
  }

  SECTION("strong upper mids suppress presence") {
    presence_stage(audio, 0.0f, 0.4f, 1.0f, trace);
    REQUIRE(trace.empty());
    presence_stage(audio, 0.0f, 0.1f, 1.0f, trace);
    REQUIRE_THAT(trace.find("presence_enhance")->param("boost_db"), WithinAbs(3.0f, 1e-4f));
  }

  SECTION("dark mixes get air") {
    air_stage(audio, 0.0f, 0.0f, 1.0f, trace);
    REQUIRE_THAT(trace.find("air_enhance")->param("boost_db"), WithinAbs(3.0f, 1e-4f));
  }
}

TEST_CASE("quiet soft clip and peak targets", "[branches]") {
  Fingerprint plain = fingerprint_with({{"lufs", -20.0f}, {"harmonic_ratio", 0.0f},
                                        {"pitch_stability", 0.0f}, {"bass_pct", 0.0f},
                                        {"dynamic_range_variation", 0.0f},
                                        {"peak_consistency", 1.0f}, {"spectral_flatness", 0.0f}});
  SoftClipSettings clip = quiet_soft_clip_settings(plain);
  REQUIRE_THAT(clip.threshold_db, WithinAbs(-2.0f, 1e-5f));
  REQUIRE_THAT(clip.ceiling, WithinAbs(0.99f, 1e-5f));
  REQUIRE_THAT(quiet_peak_target(plain), WithinAbs(0.90f, 1e-5f));

  Fingerprint heavy = fingerprint_with({{"lufs", -20.0f}, {"harmonic_ratio", 0.0f},
                                        {"pitch_stability", 0.0f}, {"bass_pct", 0.8f},
                                        {"dynamic_range_variation", 0.0f},
                                        {"peak_consistency", 1.0f}, {"spectral_flatness", 0.0f}});
  SoftClipSettings heavy_clip = quiet_soft_clip_settings(heavy);
  REQUIRE(heavy_clip.threshold_db < clip.threshold_db);
  REQUIRE(heavy_clip.ceiling < clip.ceiling);
  REQUIRE(quiet_peak_target(heavy) < quiet_peak_target(plain));
}
