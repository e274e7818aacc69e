#pragma once

/// @file window.h
/// @brief Window function generators.

#include <vector>

#include "util/types.h"

namespace masterprint {

/// @brief Creates a window of the specified type.
/// @param type Window type
/// @param length Window length in samples
std::vector<float> create_window(WindowType type, int length);

/// @brief Returns a cached window (thread-local cache).
const std::vector<float>& get_window_cached(WindowType type, int length);

/// @brief Creates a Hann (raised cosine) window.
std::vector<float> hann_window(int length);

/// @brief Creates a Hamming window.
std::vector<float> hamming_window(int length);

}  // namespace masterprint
