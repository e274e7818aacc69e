#pragma once

/// @file sampled_analyzer.h
/// @brief Runs a batch analyzer on short regularly spaced windows and averages the results.

#include <cstddef>
#include <functional>
#include <vector>

#include "core/audio.h"
#include "fingerprint/fingerprint.h"

namespace masterprint {

/// @brief Window layout and parallelism of the sampled analyzer.
struct SampledAnalyzerConfig {
  float window_seconds = 5.0f;   ///< Length of each analyzed window
  float stride_seconds = 10.0f;  ///< Distance between window starts
  size_t max_workers = 0;        ///< Worker bound (0 = hardware concurrency)
};

/// @brief Window-sampling wrapper around a batch analyzer.
/// @details Windows are analyzed on a bounded fork-join pool and reduced by per-key
///          arithmetic mean, so completion order does not affect the result.
class SampledAnalyzer {
 public:
  using Analyzer = std::function<FeatureMap(const Audio&)>;

  /// @param analyzer Batch analyzer applied to each window (must be thread-safe)
  /// @param defaults Result returned when no window succeeds
  /// @param config Window layout
  SampledAnalyzer(Analyzer analyzer, FeatureMap defaults,
                  const SampledAnalyzerConfig& config = SampledAnalyzerConfig());

  /// @brief Returns the start sample of every window for a signal.
  /// @details A signal shorter than one window yields a single window covering all of it.
  std::vector<size_t> window_starts(size_t n_samples, int sample_rate) const;

  /// @brief Analyzes all windows and averages every key.
  /// @details A window whose analyzer throws is skipped with a warning. Keys missing from a
  ///          window's result are averaged over the windows that produced them.
  FeatureMap analyze(const Audio& audio) const;

 private:
  Analyzer analyzer_;
  FeatureMap defaults_;
  SampledAnalyzerConfig config_;
};

}  // namespace masterprint
