#include "backend/chroma_filterbank.h"

#include <cmath>

#include "backend/dsp_backend.h"
#include "util/exception.h"

namespace masterprint {

namespace {
constexpr float kC1Hz = 32.70319566257483f;
}

float hz_to_chroma(float hz) {
  if (hz <= 0.0f) {
    return -1.0f;
  }
  float midi = 69.0f + 12.0f * std::log2(hz / 440.0f);
  float chroma = std::fmod(midi, 12.0f);
  if (chroma < 0.0f) {
    chroma += 12.0f;
  }
  return chroma;
}

Eigen::MatrixXf create_chroma_filterbank(int sr, int n_fft) {
  MASTERPRINT_CHECK(sr > 0 && n_fft > 0, ErrorCode::InvalidParameter);

  int n_bins = n_fft / 2 + 1;
  Eigen::MatrixXf filterbank = Eigen::MatrixXf::Zero(kNumChroma, n_bins);
  float bin_width = static_cast<float>(sr) / n_fft;

  for (int k = 1; k < n_bins; ++k) {
    float freq = k * bin_width;
    if (freq < kC1Hz) {
      continue;
    }
    float chroma = hz_to_chroma(freq);
    int low = static_cast<int>(std::floor(chroma)) % kNumChroma;
    int high = (low + 1) % kNumChroma;
    float frac = chroma - std::floor(chroma);
    filterbank(low, k) += 1.0f - frac;
    filterbank(high, k) += frac;
  }

  for (int c = 0; c < kNumChroma; ++c) {
    float sum = filterbank.row(c).sum();
    if (sum > 0.0f) {
      filterbank.row(c) /= sum;
    }
  }
  return filterbank;
}

void normalize_chroma_columns(Eigen::MatrixXf& chroma) {
  for (Eigen::Index t = 0; t < chroma.cols(); ++t) {
    float peak = chroma.col(t).maxCoeff();
    if (peak > 1e-10f) {
      chroma.col(t) /= peak;
    } else {
      chroma.col(t).setZero();
    }
  }
}

}  // namespace masterprint
