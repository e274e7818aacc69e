#include "backend/portable_backend.h"

#include <algorithm>
#include <cmath>
#include <complex>
#include <vector>

#include "backend/chroma_filterbank.h"
#include "core/spectrum.h"
#include "util/exception.h"

namespace masterprint {

namespace {

constexpr int kKernel = 17;
constexpr int kFrameLength = 2048;
constexpr int kHopLength = 512;
constexpr float kVoicingThreshold = 0.5f;

float window_median(std::vector<float>& scratch) {
  size_t mid = scratch.size() / 2;
  std::nth_element(scratch.begin(), scratch.begin() + mid, scratch.end());
  return scratch[mid];
}

}  // namespace

HarmonicPercussive PortableBackend::separate_harmonic_percussive(const Audio& audio) const {
  MASTERPRINT_CHECK(!audio.empty(), ErrorCode::InvalidParameter);

  Spectrogram spec = Spectrogram::compute(audio);
  int n_bins = spec.n_bins();
  int n_frames = spec.n_frames();
  const std::vector<float>& mag = spec.magnitude();
  const std::complex<float>* data = spec.complex_data();
  int half = kKernel / 2;

  std::vector<std::complex<float>> harmonic(mag.size());
  std::vector<std::complex<float>> percussive(mag.size());
  std::vector<float> scratch;
  scratch.reserve(kKernel);

  for (int k = 0; k < n_bins; ++k) {
    for (int t = 0; t < n_frames; ++t) {
      scratch.clear();
      for (int j = std::max(0, t - half); j < std::min(n_frames, t + half + 1); ++j) {
        scratch.push_back(mag[static_cast<size_t>(k) * n_frames + j]);
      }
      float h = window_median(scratch);

      scratch.clear();
      for (int j = std::max(0, k - half); j < std::min(n_bins, k + half + 1); ++j) {
        scratch.push_back(mag[static_cast<size_t>(j) * n_frames + t]);
      }
      float p = window_median(scratch);

      float h2 = h * h;
      float p2 = p * p;
      float mask = h2 / (h2 + p2 + 1e-10f);
      size_t idx = static_cast<size_t>(k) * n_frames + t;
      harmonic[idx] = data[idx] * mask;
      percussive[idx] = data[idx] * (1.0f - mask);
    }
  }

  int length = static_cast<int>(audio.size());
  HarmonicPercussive result;
  result.harmonic = Spectrogram::from_complex(harmonic.data(), n_bins, n_frames, spec.n_fft(),
                                              spec.hop_length(), spec.sample_rate())
                        .to_audio(length);
  result.percussive = Spectrogram::from_complex(percussive.data(), n_bins, n_frames, spec.n_fft(),
                                                spec.hop_length(), spec.sample_rate())
                          .to_audio(length);
  return result;
}

std::vector<float> PortableBackend::track_pitch(const Audio& audio, float fmin, float fmax) const {
  MASTERPRINT_CHECK(fmin > 0.0f && fmax > fmin, ErrorCode::InvalidParameter);
  if (audio.size() < static_cast<size_t>(kFrameLength)) {
    return {};
  }

  int sr = audio.sample_rate();
  int min_lag = std::max(1, static_cast<int>(std::floor(sr / fmax)));
  int max_lag = std::min(kFrameLength / 2, static_cast<int>(std::ceil(sr / fmin)));
  int n_frames = 1 + static_cast<int>((audio.size() - kFrameLength) / kHopLength);
  std::vector<float> f0(n_frames, 0.0f);

  for (int i = 0; i < n_frames; ++i) {
    const float* frame = audio.data() + static_cast<size_t>(i) * kHopLength;
    int window = kFrameLength - max_lag;

    double energy = 0.0;
    for (int j = 0; j < window; ++j) energy += frame[j] * frame[j];
    if (energy < 1e-8) continue;

    int best_lag = 0;
    double best_corr = kVoicingThreshold;
    for (int lag = min_lag; lag <= max_lag; ++lag) {
      double cross = 0.0;
      double lagged = 0.0;
      for (int j = 0; j < window; ++j) {
        cross += frame[j] * frame[j + lag];
        lagged += frame[j + lag] * frame[j + lag];
      }
      double corr = cross / std::sqrt(energy * lagged + 1e-20);
      // Prefer the first strong peak to avoid octave errors.
      if (corr > best_corr) {
        best_corr = corr;
        best_lag = lag;
      } else if (best_lag > 0 && corr < best_corr - 0.1) {
        break;
      }
    }
    if (best_lag > 0) {
      f0[i] = static_cast<float>(sr) / best_lag;
    }
  }
  return f0;
}

Eigen::MatrixXf PortableBackend::chroma(const Audio& audio) const {
  MASTERPRINT_CHECK(!audio.empty(), ErrorCode::InvalidParameter);

  Spectrogram spec = Spectrogram::compute(audio);
  const std::vector<float>& power = spec.power();
  int n_frames = spec.n_frames();
  Eigen::MatrixXf result = Eigen::MatrixXf::Zero(kNumChroma, n_frames);

  for (int k = 1; k < spec.n_bins(); ++k) {
    float chroma = hz_to_chroma(spec.bin_frequency(k));
    if (spec.bin_frequency(k) < 32.7f || chroma < 0.0f) continue;
    int pc = static_cast<int>(std::lround(chroma)) % kNumChroma;
    for (int t = 0; t < n_frames; ++t) {
      result(pc, t) += power[static_cast<size_t>(k) * n_frames + t];
    }
  }

  normalize_chroma_columns(result);
  return result;
}

}  // namespace masterprint
