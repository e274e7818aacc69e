/// @file fingerprint_test.cpp
/// @brief Tests for the 25-dimension fingerprint record.

#include "fingerprint/fingerprint.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <cmath>
#include <limits>
#include <set>
#include <string>

using namespace masterprint;
using Catch::Matchers::WithinAbs;

TEST_CASE("fingerprint field table", "[fingerprint]") {
  const auto& fields = fingerprint_fields();
  REQUIRE(fields.size() == 25);

  std::set<std::string> names;
  for (size_t i = 0; i < fields.size(); ++i) {
    REQUIRE(static_cast<size_t>(fields[i].field) == i);
    names.insert(fields[i].name);
  }
  REQUIRE(names.size() == 25);
  REQUIRE(std::string(field_spec(FingerprintField::Lufs).name) == "lufs");
  REQUIRE(std::string(field_spec(FingerprintField::AirPct).name) == "air_pct");
}

TEST_CASE("default fingerprint", "[fingerprint]") {
  Fingerprint fp;
  REQUIRE(fp.tempo_bpm() == 120.0f);
  REQUIRE(fp.lufs() == -20.0f);
  REQUIRE(fp.crest_db() == 15.0f);
  REQUIRE(fp.pitch_stability() == 0.7f);
  REQUIRE(fp.phase_correlation() == 1.0f);
  REQUIRE(fp.stereo_width() == 0.5f);
}

TEST_CASE("from_map sanitizes values", "[fingerprint]") {
  FeatureMap raw;
  raw["tempo_bpm"] = 300.0f;
  raw["lufs"] = -9.5f;
  raw["bass_pct"] = -0.2f;
  raw["phase_correlation"] = -3.0f;
  raw["loudness_variation_std"] = 42.0f;
  raw["crest_db"] = std::numeric_limits<float>::quiet_NaN();
  raw["harmonic_ratio"] = std::numeric_limits<float>::infinity();
  raw["not_a_field"] = 1.0f;

  Fingerprint fp = Fingerprint::from_map(raw);

  SECTION("bounded fields are clamped") {
    REQUIRE(fp.tempo_bpm() == 200.0f);
    REQUIRE(fp.bass_pct() == 0.0f);
    REQUIRE(fp.phase_correlation() == -1.0f);
    REQUIRE(fp.loudness_variation_std() == 10.0f);
  }

  SECTION("unbounded fields pass through") {
    REQUIRE(fp.lufs() == -9.5f);
  }

  SECTION("non-finite values fall back to defaults") {
    REQUIRE(fp.crest_db() == 15.0f);
    REQUIRE(fp.harmonic_ratio() == 0.5f);
  }

  SECTION("missing fields keep defaults") {
    REQUIRE(fp.air_pct() == 0.05f);
  }

  for (float v : fp.values()) {
    REQUIRE(std::isfinite(v));
  }
}

TEST_CASE("to_map exposes every field", "[fingerprint]") {
  Fingerprint fp = Fingerprint::from_map({{"mid_pct", 0.42f}});
  FeatureMap map = fp.to_map();
  REQUIRE(map.size() == 25);
  REQUIRE_THAT(map.at("mid_pct"), WithinAbs(0.42f, 1e-7f));
  REQUIRE(Fingerprint::from_map(map) == fp);
}

TEST_CASE("approx_equal", "[fingerprint]") {
  Fingerprint a;
  Fingerprint b = Fingerprint::from_map({{"lufs", -20.000001f}});
  Fingerprint c = Fingerprint::from_map({{"lufs", -19.0f}});
  REQUIRE(approx_equal(a, b));
  REQUIRE_FALSE(approx_equal(a, c));
  REQUIRE(a != c);
}
