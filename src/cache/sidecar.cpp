#include "cache/sidecar.h"

#include <cstdio>
#include <ctime>
#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

#include "util/exception.h"
#include "util/log.h"

namespace masterprint {

using json = nlohmann::json;

namespace {

json targets_to_json(const MasteringTargets& targets) {
  json eq = json::object();
  const auto& names = eq_band_names();
  for (size_t i = 0; i < kNumEqBands; ++i) {
    eq[names[i]] = targets.eq_adjustments_db[i];
  }
  return json{{"target_lufs", targets.target_lufs},
              {"target_crest_db", targets.target_crest_db},
              {"eq_adjustments_db", eq},
              {"compression_ratio", targets.compression_ratio},
              {"compression_amount", targets.compression_amount}};
}

MasteringTargets targets_from_json(const json& j) {
  MasteringTargets targets;
  targets.target_lufs = j.value("target_lufs", targets.target_lufs);
  targets.target_crest_db = j.value("target_crest_db", targets.target_crest_db);
  targets.compression_ratio = j.value("compression_ratio", targets.compression_ratio);
  targets.compression_amount = j.value("compression_amount", targets.compression_amount);
  if (j.contains("eq_adjustments_db") && j["eq_adjustments_db"].is_object()) {
    const json& eq = j["eq_adjustments_db"];
    const auto& names = eq_band_names();
    for (size_t i = 0; i < kNumEqBands; ++i) {
      targets.eq_adjustments_db[i] = eq.value(names[i], 0.0f);
    }
  }
  return targets;
}

}  // namespace

std::string sidecar_path(const std::string& audio_path) { return audio_path + kSidecarExtension; }

std::string iso8601_utc_now() {
  std::time_t now = std::time(nullptr);
  std::tm utc;
  gmtime_r(&now, &utc);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &utc);
  return buf;
}

std::string sidecar_to_json(const SidecarRecord& record) {
  json fingerprint = json::object();
  for (const auto& entry : record.fingerprint.to_map()) {
    fingerprint[entry.first] = entry.second;
  }

  json j;
  j["format_version"] = kSidecarFormatVersion;
  j["generator_version"] = record.generator_version;
  j["signature"] = record.signature;
  j["extracted_at"] = record.extracted_at;
  j["duration"] = record.duration;
  j["sample_rate"] = record.sample_rate;
  j["fingerprint"] = fingerprint;
  j["mastering_targets"] = targets_to_json(record.mastering_targets);
  return j.dump(2);
}

bool sidecar_from_json(const std::string& text, SidecarRecord& out) {
  json j = json::parse(text, nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    return false;
  }

  try {
    if (j.value("format_version", std::string()) != kSidecarFormatVersion) {
      return false;
    }
    if (!j.contains("fingerprint") || !j["fingerprint"].is_object()) {
      return false;
    }

    FeatureMap values;
    for (const auto& item : j["fingerprint"].items()) {
      if (item.value().is_number()) {
        values[item.key()] = item.value().get<float>();
      }
    }

    SidecarRecord record;
    record.signature = j.value("signature", std::string());
    record.generator_version = j.value("generator_version", std::string());
    record.extracted_at = j.value("extracted_at", std::string());
    record.duration = j.value("duration", 0.0f);
    record.sample_rate = j.value("sample_rate", 0);
    record.fingerprint = Fingerprint::from_map(values);
    record.mastering_targets = j.contains("mastering_targets")
                                   ? targets_from_json(j["mastering_targets"])
                                   : derive_mastering_targets(record.fingerprint);
    out = record;
    return true;
  } catch (const json::exception& e) {
    logger()->debug("Malformed sidecar field: {}", e.what());
    return false;
  }
}

void save_sidecar(const std::string& audio_path, const SidecarRecord& record) {
  std::string path = sidecar_path(audio_path);
  std::ofstream file(path, std::ios::trunc);
  MASTERPRINT_CHECK_MSG(file.is_open(), ErrorCode::WriteFailed, "Cannot write sidecar: " + path);
  file << sidecar_to_json(record);
  file.flush();
  MASTERPRINT_CHECK_MSG(file.good(), ErrorCode::WriteFailed, "Cannot write sidecar: " + path);
}

bool load_sidecar(const std::string& audio_path, const std::string& expected_signature,
                  SidecarRecord& out) {
  std::string path = sidecar_path(audio_path);
  std::ifstream file(path);
  if (!file.is_open()) {
    return false;
  }
  std::stringstream text;
  text << file.rdbuf();

  SidecarRecord record;
  if (!sidecar_from_json(text.str(), record)) {
    logger()->debug("Sidecar {} unreadable or from another format version", path);
    return false;
  }
  if (record.signature != expected_signature) {
    logger()->debug("Sidecar {} is stale", path);
    return false;
  }
  out = record;
  return true;
}

bool remove_sidecar(const std::string& audio_path) {
  return std::remove(sidecar_path(audio_path).c_str()) == 0;
}

}  // namespace masterprint
