#include "backend/native_backend.h"

#include <complex>
#include <vector>

#include "backend/chroma_filterbank.h"
#include "backend/median_filter.h"
#include "backend/yin.h"
#include "util/exception.h"

namespace masterprint {

NativeBackend::NativeBackend(const HpssConfig& hpss, const StftConfig& stft)
    : hpss_(hpss), stft_(stft) {}

HarmonicPercussive NativeBackend::separate_harmonic_percussive(const Audio& audio) const {
  MASTERPRINT_CHECK(!audio.empty(), ErrorCode::InvalidParameter);

  Spectrogram spec = Spectrogram::compute(audio, stft_);
  int n_bins = spec.n_bins();
  int n_frames = spec.n_frames();
  const std::vector<float>& magnitude = spec.magnitude();

  std::vector<float> harmonic_enhanced =
      median_filter_horizontal(magnitude.data(), n_bins, n_frames, hpss_.kernel_size_harmonic);
  std::vector<float> percussive_enhanced =
      median_filter_vertical(magnitude.data(), n_bins, n_frames, hpss_.kernel_size_percussive);

  Eigen::Index total = static_cast<Eigen::Index>(magnitude.size());
  Eigen::Map<const Eigen::ArrayXf> h_enh(harmonic_enhanced.data(), total);
  Eigen::Map<const Eigen::ArrayXf> p_enh(percussive_enhanced.data(), total);

  Eigen::ArrayXf h_pow = h_enh.pow(hpss_.power);
  Eigen::ArrayXf p_pow = p_enh.pow(hpss_.power);
  Eigen::ArrayXf denom = h_pow + p_pow + 1e-10f;
  Eigen::ArrayXf h_mask = h_pow / denom;
  Eigen::ArrayXf p_mask = p_pow / denom;

  std::vector<std::complex<float>> harmonic_complex(magnitude.size());
  std::vector<std::complex<float>> percussive_complex(magnitude.size());
  Eigen::Map<const Eigen::ArrayXcf> complex_map(spec.complex_data(), total);
  Eigen::Map<Eigen::ArrayXcf>(harmonic_complex.data(), total) =
      complex_map * h_mask.cast<std::complex<float>>();
  Eigen::Map<Eigen::ArrayXcf>(percussive_complex.data(), total) =
      complex_map * p_mask.cast<std::complex<float>>();

  int length = static_cast<int>(audio.size());
  HarmonicPercussive result;
  result.harmonic = Spectrogram::from_complex(harmonic_complex.data(), n_bins, n_frames,
                                              spec.n_fft(), spec.hop_length(), spec.sample_rate())
                        .to_audio(length);
  result.percussive = Spectrogram::from_complex(percussive_complex.data(), n_bins, n_frames,
                                                spec.n_fft(), spec.hop_length(),
                                                spec.sample_rate())
                          .to_audio(length);
  return result;
}

std::vector<float> NativeBackend::track_pitch(const Audio& audio, float fmin, float fmax) const {
  YinConfig config;
  config.fmin = fmin;
  config.fmax = fmax;
  return yin_track(audio, config);
}

Eigen::MatrixXf NativeBackend::chroma(const Audio& audio) const {
  MASTERPRINT_CHECK(!audio.empty(), ErrorCode::InvalidParameter);

  Spectrogram spec = Spectrogram::compute(audio, stft_);
  using RowMajorMatrix = Eigen::Matrix<float, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
  Eigen::Map<const RowMajorMatrix> power(spec.power().data(), spec.n_bins(), spec.n_frames());

  Eigen::MatrixXf chroma = create_chroma_filterbank(audio.sample_rate(), spec.n_fft()) * power;
  normalize_chroma_columns(chroma);
  return chroma;
}

}  // namespace masterprint
