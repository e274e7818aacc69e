#include "fingerprint/spectral_features.h"

#include <Eigen/Core>
#include <algorithm>
#include <cmath>

#include "fingerprint/feature_guard.h"
#include "util/exception.h"
#include "util/math_utils.h"

namespace masterprint {

namespace {

using RowMajorMatrix = Eigen::Matrix<float, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

/// @brief Copies one frame out of the [n_bins x n_frames] layout.
std::vector<float> column(const Spectrogram& spec, int t) {
  const std::vector<float>& mag = spec.magnitude();
  std::vector<float> col(spec.n_bins());
  for (int k = 0; k < spec.n_bins(); ++k) {
    col[k] = mag[static_cast<size_t>(k) * spec.n_frames() + t];
  }
  return col;
}

float bin_hz(const Spectrogram& spec) {
  return static_cast<float>(spec.sample_rate()) / spec.n_fft();
}

}  // namespace

float column_centroid(const float* magnitude, int n_bins, float hz) {
  double weighted = 0.0;
  double total = 0.0;
  for (int k = 0; k < n_bins; ++k) {
    weighted += static_cast<double>(k) * hz * magnitude[k];
    total += magnitude[k];
  }
  return total > kEpsilon ? static_cast<float>(weighted / total) : 0.0f;
}

float column_rolloff(const float* magnitude, int n_bins, float hz, float roll_percent) {
  double total = 0.0;
  for (int k = 0; k < n_bins; ++k) total += magnitude[k] * magnitude[k];
  if (total <= kEpsilon) return 0.0f;

  double threshold = roll_percent * total;
  double cumulative = 0.0;
  for (int k = 0; k < n_bins; ++k) {
    cumulative += magnitude[k] * magnitude[k];
    if (cumulative >= threshold) {
      return k * hz;
    }
  }
  return (n_bins - 1) * hz;
}

float column_flatness(const float* magnitude, int n_bins) {
  if (n_bins == 0) return 0.0f;
  double log_sum = 0.0;
  double sum = 0.0;
  for (int k = 0; k < n_bins; ++k) {
    double m = std::max(static_cast<double>(magnitude[k]), 1e-10);
    log_sum += std::log(m);
    sum += m;
  }
  double geometric = std::exp(log_sum / n_bins);
  double arithmetic = sum / n_bins;
  return clamp(static_cast<float>(geometric / arithmetic), 0.0f, 1.0f);
}

std::vector<float> spectral_centroid(const Spectrogram& spec) {
  MASTERPRINT_CHECK(!spec.empty(), ErrorCode::InvalidParameter);

  Eigen::Map<const RowMajorMatrix> mag(spec.magnitude().data(), spec.n_bins(), spec.n_frames());
  Eigen::VectorXf freqs =
      Eigen::VectorXf::LinSpaced(spec.n_bins(), 0.0f, (spec.n_bins() - 1) * bin_hz(spec));

  Eigen::RowVectorXf weighted = freqs.transpose() * mag;
  Eigen::RowVectorXf total = mag.colwise().sum();

  std::vector<float> centroid(spec.n_frames());
  Eigen::Map<Eigen::RowVectorXf>(centroid.data(), spec.n_frames()) =
      weighted.array() / (total.array() + kEpsilon);
  return centroid;
}

std::vector<float> spectral_rolloff(const Spectrogram& spec, float roll_percent) {
  MASTERPRINT_CHECK(!spec.empty(), ErrorCode::InvalidParameter);
  MASTERPRINT_CHECK(roll_percent > 0.0f && roll_percent <= 1.0f, ErrorCode::InvalidParameter);

  std::vector<float> rolloff(spec.n_frames());
  for (int t = 0; t < spec.n_frames(); ++t) {
    std::vector<float> col = column(spec, t);
    rolloff[t] = column_rolloff(col.data(), spec.n_bins(), bin_hz(spec), roll_percent);
  }
  return rolloff;
}

std::vector<float> spectral_flatness(const Spectrogram& spec) {
  MASTERPRINT_CHECK(!spec.empty(), ErrorCode::InvalidParameter);

  std::vector<float> flatness(spec.n_frames());
  for (int t = 0; t < spec.n_frames(); ++t) {
    std::vector<float> col = column(spec, t);
    flatness[t] = column_flatness(col.data(), spec.n_bins());
  }
  return flatness;
}

FeatureMap extract_spectral(const Audio& audio) {
  FeatureMap out;

  // One STFT feeds all three features; a failure here only costs the fields that need it.
  Spectrogram spec;
  try {
    spec = Spectrogram::compute(audio);
  } catch (const std::exception& e) {
    logger()->warn("STFT for spectral features failed: {}", e.what());
  }

  guarded_feature(out, FingerprintField::SpectralCentroid, [&] {
    return clamp(mean(spectral_centroid(spec)) / kCentroidNormHz, 0.0f, 1.0f);
  });
  guarded_feature(out, FingerprintField::SpectralRolloff, [&] {
    return clamp(mean(spectral_rolloff(spec)) / kRolloffNormHz, 0.0f, 1.0f);
  });
  guarded_feature(out, FingerprintField::SpectralFlatness,
                  [&] { return clamp(mean(spectral_flatness(spec)), 0.0f, 1.0f); });

  return out;
}

}  // namespace masterprint
