#include "fingerprint/sampled_analyzer.h"

#include <algorithm>
#include <cmath>
#include <exception>
#include <map>
#include <string>

#include "util/exception.h"
#include "util/fork_join.h"
#include "util/log.h"

namespace masterprint {

SampledAnalyzer::SampledAnalyzer(Analyzer analyzer, FeatureMap defaults,
                                 const SampledAnalyzerConfig& config)
    : analyzer_(std::move(analyzer)), defaults_(std::move(defaults)), config_(config) {
  MASTERPRINT_CHECK(analyzer_ != nullptr, ErrorCode::InvalidParameter);
  MASTERPRINT_CHECK(config_.window_seconds > 0.0f && config_.stride_seconds > 0.0f,
                    ErrorCode::InvalidParameter);
}

std::vector<size_t> SampledAnalyzer::window_starts(size_t n_samples, int sample_rate) const {
  size_t window = static_cast<size_t>(std::round(config_.window_seconds * sample_rate));
  size_t stride = std::max<size_t>(1, static_cast<size_t>(
                                          std::round(config_.stride_seconds * sample_rate)));
  if (n_samples == 0) {
    return {};
  }
  if (n_samples <= window) {
    return {0};
  }
  std::vector<size_t> starts;
  for (size_t start = 0; start + window <= n_samples; start += stride) {
    starts.push_back(start);
  }
  return starts;
}

FeatureMap SampledAnalyzer::analyze(const Audio& audio) const {
  std::vector<size_t> starts = window_starts(audio.size(), audio.sample_rate());
  size_t window = static_cast<size_t>(std::round(config_.window_seconds * audio.sample_rate()));

  std::vector<FeatureMap> results(starts.size());
  std::vector<char> succeeded(starts.size(), 0);

  fork_join(starts.size(), config_.max_workers, [&](size_t i) {
    try {
      Audio slice = audio.slice_samples(starts[i], std::min(audio.size(), starts[i] + window));
      results[i] = analyzer_(slice);
      succeeded[i] = 1;
    } catch (const std::exception& e) {
      logger()->warn("Sampled window {} failed: {}", i, e.what());
    }
  });

  std::map<std::string, std::pair<double, size_t>> sums;
  for (size_t i = 0; i < results.size(); ++i) {
    if (!succeeded[i]) continue;
    for (const auto& entry : results[i]) {
      auto& acc = sums[entry.first];
      acc.first += entry.second;
      acc.second += 1;
    }
  }

  if (sums.empty()) {
    logger()->warn("No sampled window succeeded, using defaults");
    return defaults_;
  }

  FeatureMap averaged;
  for (const auto& entry : sums) {
    averaged[entry.first] = static_cast<float>(entry.second.first / entry.second.second);
  }
  return averaged;
}

}  // namespace masterprint
