/// @file chroma_filterbank_test.cpp
/// @brief Tests for the STFT-to-chroma projection.

#include "backend/chroma_filterbank.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

using namespace masterprint;
using Catch::Matchers::WithinAbs;

TEST_CASE("hz_to_chroma", "[chroma]") {
  REQUIRE_THAT(hz_to_chroma(440.0f), WithinAbs(9.0f, 1e-3f));
  REQUIRE_THAT(hz_to_chroma(261.63f), WithinAbs(0.0f, 1e-2f));
  REQUIRE_THAT(hz_to_chroma(880.0f), WithinAbs(hz_to_chroma(220.0f), 1e-3f));
  REQUIRE(hz_to_chroma(0.0f) < 0.0f);
}

TEST_CASE("create_chroma_filterbank dimensions and normalization", "[chroma]") {
  Eigen::MatrixXf fb = create_chroma_filterbank(22050, 2048);
  REQUIRE(fb.rows() == 12);
  REQUIRE(fb.cols() == 1025);
  REQUIRE(fb.minCoeff() >= 0.0f);
  for (int c = 0; c < 12; ++c) {
    REQUIRE_THAT(fb.row(c).sum(), WithinAbs(1.0f, 1e-4f));
  }
  // DC never maps to a pitch class.
  REQUIRE(fb.col(0).sum() == 0.0f);
}

TEST_CASE("normalize_chroma_columns", "[chroma]") {
  Eigen::MatrixXf chroma = Eigen::MatrixXf::Zero(12, 2);
  chroma(3, 0) = 4.0f;
  chroma(5, 0) = 2.0f;

  normalize_chroma_columns(chroma);
  REQUIRE_THAT(chroma(3, 0), WithinAbs(1.0f, 1e-6f));
  REQUIRE_THAT(chroma(5, 0), WithinAbs(0.5f, 1e-6f));
  REQUIRE(chroma.col(1).sum() == 0.0f);
}
