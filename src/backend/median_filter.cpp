#include "backend/median_filter.h"

#include <algorithm>
#include <set>

#include "util/exception.h"

namespace masterprint {

namespace {

/// @brief Sliding window median over two balanced multisets, O(log k) per step.
class SlidingMedian {
 public:
  void insert(float val) {
    if (lo_.empty() || val <= *lo_.rbegin()) {
      lo_.insert(val);
    } else {
      hi_.insert(val);
    }
    rebalance();
  }

  void erase(float val) {
    auto it = lo_.find(val);
    if (it != lo_.end()) {
      lo_.erase(it);
    } else {
      it = hi_.find(val);
      if (it != hi_.end()) {
        hi_.erase(it);
      }
    }
    rebalance();
  }

  float median() const {
    if (lo_.empty()) return 0.0f;
    if (lo_.size() > hi_.size()) {
      return *lo_.rbegin();
    }
    return (*lo_.rbegin() + *hi_.begin()) / 2.0f;
  }

  void clear() {
    lo_.clear();
    hi_.clear();
  }

 private:
  // Keeps lo_.size() in {hi_.size(), hi_.size() + 1}.
  void rebalance() {
    while (lo_.size() > hi_.size() + 1) {
      auto it = std::prev(lo_.end());
      hi_.insert(*it);
      lo_.erase(it);
    }
    while (hi_.size() > lo_.size()) {
      auto it = hi_.begin();
      lo_.insert(*it);
      hi_.erase(it);
    }
  }

  std::multiset<float> lo_;
  std::multiset<float> hi_;
};

/// @brief Median of a scratch buffer (reordered in place).
float partial_median(float* values, size_t n) {
  if (n == 0) return 0.0f;
  size_t mid = n / 2;
  std::nth_element(values, values + mid, values + n);
  if (n % 2 == 0) {
    float high = values[mid];
    float low = *std::max_element(values, values + mid);
    return (low + high) / 2.0f;
  }
  return values[mid];
}

/// @brief Filters one strided line of @p n values.
/// @details Edges use truncated windows; the interior slides a SlidingMedian.
void filter_line(const float* in, float* out, int n, int stride, int kernel_size,
                 SlidingMedian& sm, std::vector<float>& scratch) {
  int half = kernel_size / 2;
  auto edge = [&](int i) {
    int start = std::max(0, i - half);
    int end = std::min(n, i + half + 1);
    int count = 0;
    for (int j = start; j < end; ++j) {
      scratch[count++] = in[j * stride];
    }
    out[i * stride] = partial_median(scratch.data(), count);
  };

  if (n <= 2 * half) {
    for (int i = 0; i < n; ++i) edge(i);
    return;
  }

  for (int i = 0; i < half; ++i) edge(i);

  sm.clear();
  for (int j = 0; j < kernel_size; ++j) {
    sm.insert(in[j * stride]);
  }
  out[half * stride] = sm.median();
  for (int i = half + 1; i < n - half; ++i) {
    sm.erase(in[(i - half - 1) * stride]);
    sm.insert(in[(i + half) * stride]);
    out[i * stride] = sm.median();
  }

  for (int i = n - half; i < n; ++i) edge(i);
}

}  // namespace

std::vector<float> median_filter_horizontal(const float* magnitude, int n_bins, int n_frames,
                                            int kernel_size) {
  MASTERPRINT_CHECK(magnitude != nullptr, ErrorCode::InvalidParameter);
  MASTERPRINT_CHECK(kernel_size > 0 && kernel_size % 2 == 1, ErrorCode::InvalidParameter);

  std::vector<float> result(static_cast<size_t>(n_bins) * n_frames);
  std::vector<float> scratch(kernel_size);
  SlidingMedian sm;

  for (int k = 0; k < n_bins; ++k) {
    size_t row = static_cast<size_t>(k) * n_frames;
    filter_line(magnitude + row, result.data() + row, n_frames, 1, kernel_size, sm, scratch);
  }
  return result;
}

std::vector<float> median_filter_vertical(const float* magnitude, int n_bins, int n_frames,
                                          int kernel_size) {
  MASTERPRINT_CHECK(magnitude != nullptr, ErrorCode::InvalidParameter);
  MASTERPRINT_CHECK(kernel_size > 0 && kernel_size % 2 == 1, ErrorCode::InvalidParameter);

  std::vector<float> result(static_cast<size_t>(n_bins) * n_frames);
  std::vector<float> scratch(kernel_size);
  SlidingMedian sm;

  for (int t = 0; t < n_frames; ++t) {
    filter_line(magnitude + t, result.data() + t, n_bins, n_frames, kernel_size, sm, scratch);
  }
  return result;
}

}  // namespace masterprint
