#pragma once

/// @file fingerprint_service.h
/// @brief Three-tier fingerprint lookup: persistent store, sidecar, compute.

#include <functional>
#include <memory>
#include <string>

#include "backend/dsp_backend.h"
#include "cache/fingerprint_store.h"
#include "core/audio_buffer.h"
#include "fingerprint/fingerprint.h"
#include "fingerprint/fingerprint_extractor.h"

namespace masterprint {

/// @brief Computes a fingerprint from analysis-ready audio (22050 Hz, at most 90 s).
using FingerprintComputeFunction = std::function<Fingerprint(const AudioBuffer&)>;

/// @brief Returns a compute function backed by a FingerprintExtractor.
/// @param backend DSP backend (must outlive the returned function)
FingerprintComputeFunction extractor_compute(const DspBackend& backend,
                                             const ExtractorConfig& config = ExtractorConfig());

/// @brief Fingerprint service configuration.
struct FingerprintServiceConfig {
  std::string db_path = "masterprint.db";  ///< Store location; empty disables the store
  bool use_sidecar = true;                 ///< Read and write `.25d` sidecars
  int analysis_sample_rate = 22050;        ///< Rate the compute function receives
  float max_analysis_seconds = 90.0f;      ///< Duration cap before computing
};

/// @brief Where a fingerprint was found.
enum class CacheTier {
  Store,     ///< Persistent store hit
  Sidecar,   ///< Sidecar hit (store was backfilled)
  Computed,  ///< Extracted from audio
};

/// @brief Returns "store", "sidecar" or "computed".
const char* cache_tier_name(CacheTier tier);

/// @brief Result of a lookup.
struct CacheResult {
  Fingerprint fingerprint;
  CacheTier tier;
  std::string signature;  ///< Content signature the result is valid for
};

/// @brief Fingerprint cache service.
/// @details Misses and stale entries fall through to the next tier and are never errors.
/// Store failures are logged and never fail a lookup.
class FingerprintService {
 public:
  /// @param compute Extraction used on a full miss
  /// @param config Store path and analysis settings
  explicit FingerprintService(FingerprintComputeFunction compute,
                              const FingerprintServiceConfig& config = FingerprintServiceConfig());

  // Non-copyable
  FingerprintService(const FingerprintService&) = delete;
  FingerprintService& operator=(const FingerprintService&) = delete;

  /// @brief Returns the fingerprint of @p path, loading the file only on a full miss.
  /// @throws MasterprintException with FileNotFound if the file does not exist
  Fingerprint get_or_compute(const std::string& path);

  /// @brief Same as get_or_compute(path) but computes from already loaded audio.
  Fingerprint get_or_compute(const std::string& path, const AudioBuffer& audio);

  /// @brief Full lookup reporting the tier that answered.
  /// @param audio Decoded audio of @p path, or nullptr to load it on demand
  CacheResult lookup(const std::string& path, const AudioBuffer* audio = nullptr);

  /// @brief Purges every stored fingerprint and the sidecars of the stored paths.
  void clear_cache();

  /// @brief Purges the stored fingerprint and sidecar of one file.
  void clear_cache(const std::string& path);

  /// @brief Returns true if the persistent store is available.
  bool has_store() const { return store_ != nullptr; }

  const FingerprintServiceConfig& config() const { return config_; }

 private:
  void store_best_effort(const std::string& path, const std::string& signature,
                         const Fingerprint& fingerprint);

  FingerprintComputeFunction compute_;
  FingerprintServiceConfig config_;
  std::unique_ptr<FingerprintStore> store_;
};

}  // namespace masterprint
