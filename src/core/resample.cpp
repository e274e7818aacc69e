#include "core/resample.h"

#include <algorithm>
#include <cmath>

#include "CDSPResampler.h"
#include "util/exception.h"

namespace masterprint {

namespace {
constexpr int kBlockSize = 1024;
constexpr int kMaxFlushPasses = 16;
}  // namespace

std::vector<float> resample(const float* samples, size_t size, int src_sr, int target_sr) {
  MASTERPRINT_CHECK(src_sr > 0 && target_sr > 0, ErrorCode::InvalidParameter);

  if (size == 0) {
    return {};
  }
  if (src_sr == target_sr) {
    return std::vector<float>(samples, samples + size);
  }

  double ratio = static_cast<double>(target_sr) / static_cast<double>(src_sr);
  size_t expected_size = static_cast<size_t>(std::round(size * ratio));

  std::vector<double> input(samples, samples + size);
  std::vector<double> output;
  output.reserve(expected_size + kBlockSize);

  r8b::CDSPResampler24 resampler(static_cast<double>(src_sr), static_cast<double>(target_sr),
                                 kBlockSize);

  auto append = [&output](double* out_ptr, int out_len) {
    if (out_len > 0 && out_ptr != nullptr) {
      output.insert(output.end(), out_ptr, out_ptr + out_len);
    }
  };

  for (size_t pos = 0; pos < size; pos += kBlockSize) {
    int block_len = static_cast<int>(std::min<size_t>(kBlockSize, size - pos));
    double* out_ptr = nullptr;
    int out_len = resampler.process(input.data() + pos, block_len, out_ptr);
    append(out_ptr, out_len);
  }

  // Feed silence until the filter latency has been drained.
  std::vector<double> zeros(kBlockSize, 0.0);
  for (int pass = 0; pass < kMaxFlushPasses && output.size() < expected_size; ++pass) {
    double* out_ptr = nullptr;
    int out_len = resampler.process(zeros.data(), kBlockSize, out_ptr);
    append(out_ptr, out_len);
  }

  output.resize(expected_size, 0.0);

  std::vector<float> result(output.size());
  std::transform(output.begin(), output.end(), result.begin(),
                 [](double v) { return static_cast<float>(v); });
  return result;
}

Audio resample(const Audio& audio, int target_sr) {
  if (audio.empty() || audio.sample_rate() == target_sr) {
    return audio;
  }
  return Audio::from_vector(resample(audio.data(), audio.size(), audio.sample_rate(), target_sr),
                            target_sr);
}

}  // namespace masterprint
