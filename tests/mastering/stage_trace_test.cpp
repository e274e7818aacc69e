/// @file stage_trace_test.cpp
/// @brief Tests for the stage trace.

#include "mastering/stage_trace.h"

#include <catch2/catch_test_macros.hpp>
#include <string>
#include <vector>

using namespace masterprint;

TEST_CASE("StageTrace records in order", "[trace]") {
  StageTrace trace;
  REQUIRE(trace.empty());

  trace.add("makeup_gain").with("gain_db", 4.5f);
  trace.add("skip_expansion").because("hyper_compressed");
  trace.add("soft_clip").with("threshold_db", -1.0f).with("ceiling", 0.95f);

  REQUIRE(trace.size() == 3);
  REQUIRE(trace.stage_names() ==
          std::vector<std::string>{"makeup_gain", "skip_expansion", "soft_clip"});

  const StageRecord* clip = trace.find("soft_clip");
  REQUIRE(clip != nullptr);
  REQUIRE(clip->has("ceiling"));
  REQUIRE(clip->param("ceiling") == 0.95f);
  REQUIRE(clip->param("missing", -3.0f) == -3.0f);

  REQUIRE(trace.find("skip_expansion")->reason == "hyper_compressed");
  REQUIRE_FALSE(trace.contains("normalize"));
}

TEST_CASE("StageTrace append", "[trace]") {
  StageTrace a;
  a.add("one");
  StageTrace b;
  b.add("two");
  b.add("three");
  a.append(b);
  REQUIRE(a.stage_names() == std::vector<std::string>{"one", "two", "three"});
}
