#include "core/fft.h"

#include "util/exception.h"

extern "C" {
#include "kiss_fft.h"
#include "kiss_fftr.h"
}

namespace masterprint {

struct FFT::Impl {
  kiss_fftr_cfg forward_cfg = nullptr;
  kiss_fftr_cfg inverse_cfg = nullptr;

  explicit Impl(int n_fft) {
    forward_cfg = kiss_fftr_alloc(n_fft, 0, nullptr, nullptr);
    inverse_cfg = kiss_fftr_alloc(n_fft, 1, nullptr, nullptr);
    if (!forward_cfg || !inverse_cfg) {
      release();
      throw MasterprintException(ErrorCode::OutOfMemory, "Failed to allocate KissFFT config");
    }
  }

  ~Impl() { release(); }

  void release() {
    if (forward_cfg) kiss_fft_free(forward_cfg);
    if (inverse_cfg) kiss_fft_free(inverse_cfg);
    forward_cfg = nullptr;
    inverse_cfg = nullptr;
  }
};

FFT::FFT(int n_fft) : n_fft_(n_fft) {
  MASTERPRINT_CHECK_MSG(n_fft >= 2 && n_fft % 2 == 0, ErrorCode::InvalidParameter,
                        "FFT size must be even and >= 2");
  impl_ = std::make_unique<Impl>(n_fft);
}

FFT::~FFT() = default;

FFT::FFT(FFT&&) noexcept = default;
FFT& FFT::operator=(FFT&&) noexcept = default;

void FFT::forward(const float* input, std::complex<float>* output) {
  kiss_fftr(impl_->forward_cfg, input, reinterpret_cast<kiss_fft_cpx*>(output));
}

void FFT::inverse(const std::complex<float>* input, float* output) {
  kiss_fftri(impl_->inverse_cfg, reinterpret_cast<const kiss_fft_cpx*>(input), output);

  float scale = 1.0f / static_cast<float>(n_fft_);
  for (int i = 0; i < n_fft_; ++i) {
    output[i] *= scale;
  }
}

}  // namespace masterprint
