#include "core/window.h"

#include <cmath>
#include <map>
#include <utility>

namespace masterprint {

namespace {
constexpr float kTwoPi = 6.28318530717958647692f;

thread_local std::map<std::pair<WindowType, int>, std::vector<float>> g_window_cache;
}  // namespace

std::vector<float> create_window(WindowType type, int length) {
  switch (type) {
    case WindowType::Hann:
      return hann_window(length);
    case WindowType::Hamming:
      return hamming_window(length);
    case WindowType::Rectangular:
      return std::vector<float>(static_cast<size_t>(length), 1.0f);
  }
  return hann_window(length);
}

const std::vector<float>& get_window_cached(WindowType type, int length) {
  auto key = std::make_pair(type, length);
  auto it = g_window_cache.find(key);
  if (it != g_window_cache.end()) {
    return it->second;
  }
  return g_window_cache.emplace(key, create_window(type, length)).first->second;
}

std::vector<float> hann_window(int length) {
  std::vector<float> window(static_cast<size_t>(length), 1.0f);
  if (length < 2) return window;
  for (int i = 0; i < length; ++i) {
    window[i] = 0.5f * (1.0f - std::cos(kTwoPi * i / (length - 1)));
  }
  return window;
}

std::vector<float> hamming_window(int length) {
  std::vector<float> window(static_cast<size_t>(length), 1.0f);
  if (length < 2) return window;
  for (int i = 0; i < length; ++i) {
    window[i] = 0.54f - 0.46f * std::cos(kTwoPi * i / (length - 1));
  }
  return window;
}

}  // namespace masterprint
