#include "cache/fingerprint_service.h"

#include <sys/stat.h>

#include "cache/hashing.h"
#include "cache/sidecar.h"
#include "core/audio_io.h"
#include "fingerprint/mastering_targets.h"
#include "util/exception.h"
#include "util/log.h"
#include "util/version.h"

namespace masterprint {

FingerprintComputeFunction extractor_compute(const DspBackend& backend,
                                             const ExtractorConfig& config) {
  return [&backend, config](const AudioBuffer& audio) {
    FingerprintExtractor extractor(backend, config);
    return extractor.extract(audio).fingerprint;
  };
}

const char* cache_tier_name(CacheTier tier) {
  switch (tier) {
    case CacheTier::Store:
      return "store";
    case CacheTier::Sidecar:
      return "sidecar";
    case CacheTier::Computed:
      return "computed";
  }
  return "unknown";
}

FingerprintService::FingerprintService(FingerprintComputeFunction compute,
                                       const FingerprintServiceConfig& config)
    : compute_(std::move(compute)), config_(config) {
  MASTERPRINT_CHECK(compute_ != nullptr, ErrorCode::InvalidParameter);
  if (config_.db_path.empty()) {
    return;
  }
  try {
    store_.reset(new FingerprintStore(config_.db_path));
  } catch (const MasterprintException& e) {
    logger()->warn("Fingerprint store unavailable, continuing without it: {}", e.what());
  }
}

Fingerprint FingerprintService::get_or_compute(const std::string& path) {
  return lookup(path).fingerprint;
}

Fingerprint FingerprintService::get_or_compute(const std::string& path, const AudioBuffer& audio) {
  return lookup(path, &audio).fingerprint;
}

CacheResult FingerprintService::lookup(const std::string& path, const AudioBuffer* audio) {
  struct stat info;
  MASTERPRINT_CHECK_MSG(::stat(path.c_str(), &info) == 0, ErrorCode::FileNotFound,
                        "File not found: " + path);

  CacheResult result;
  result.signature = content_signature(path);

  if (store_) {
    try {
      if (store_->lookup(path, result.signature, result.fingerprint)) {
        logger()->debug("Fingerprint store hit for {}", path);
        result.tier = CacheTier::Store;
        return result;
      }
    } catch (const MasterprintException& e) {
      logger()->warn("Fingerprint store lookup failed for {}: {}", path, e.what());
    }
  }

  if (config_.use_sidecar) {
    SidecarRecord record;
    if (load_sidecar(path, result.signature, record)) {
      logger()->debug("Sidecar hit for {}", path);
      store_best_effort(path, result.signature, record.fingerprint);
      result.fingerprint = record.fingerprint;
      result.tier = CacheTier::Sidecar;
      return result;
    }
  }

  logger()->debug("Fingerprint cache miss for {}, extracting", path);
  AudioBuffer loaded;
  if (!audio) {
    loaded = load_audio(path);
    audio = &loaded;
  }
  AudioBuffer analysis =
      prepare_for_analysis(*audio, config_.analysis_sample_rate, config_.max_analysis_seconds);
  result.fingerprint = compute_(analysis);
  result.tier = CacheTier::Computed;

  store_best_effort(path, result.signature, result.fingerprint);

  if (config_.use_sidecar) {
    SidecarRecord record;
    record.signature = result.signature;
    record.generator_version = version();
    record.extracted_at = iso8601_utc_now();
    record.duration = audio->duration();
    record.sample_rate = audio->sample_rate();
    record.fingerprint = result.fingerprint;
    record.mastering_targets = derive_mastering_targets(result.fingerprint);
    try {
      save_sidecar(path, record);
    } catch (const MasterprintException& e) {
      logger()->warn("Could not write sidecar for {}: {}", path, e.what());
    }
  }
  return result;
}

void FingerprintService::store_best_effort(const std::string& path, const std::string& signature,
                                           const Fingerprint& fingerprint) {
  if (!store_) {
    return;
  }
  try {
    store_->upsert(path, signature, fingerprint);
  } catch (const MasterprintException& e) {
    logger()->warn("Fingerprint store write failed for {}: {}", path, e.what());
  }
}

void FingerprintService::clear_cache() {
  if (!store_) {
    return;
  }
  for (const std::string& path : store_->paths()) {
    remove_sidecar(path);
  }
  int removed = store_->clear();
  logger()->info("Cleared {} cached fingerprints", removed);
}

void FingerprintService::clear_cache(const std::string& path) {
  if (store_) {
    store_->clear(path);
  }
  remove_sidecar(path);
  logger()->debug("Cleared cached fingerprint for {}", path);
}

}  // namespace masterprint
