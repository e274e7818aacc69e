#pragma once

/// @file sidecar.h
/// @brief `.25d` sidecar files stored next to the audio they describe.

#include <string>

#include "fingerprint/fingerprint.h"
#include "fingerprint/mastering_targets.h"

namespace masterprint {

/// @brief Sidecar schema version. Any other version is treated as a miss.
constexpr const char* kSidecarFormatVersion = "1.0";

/// @brief Suffix appended to the audio file name.
constexpr const char* kSidecarExtension = ".25d";

/// @brief Contents of one sidecar file.
struct SidecarRecord {
  std::string signature;          ///< Content signature of the audio file
  std::string generator_version;  ///< Library version that wrote the record
  std::string extracted_at;       ///< ISO-8601 UTC timestamp
  float duration = 0.0f;          ///< Source duration in seconds
  int sample_rate = 0;            ///< Source sample rate in Hz
  Fingerprint fingerprint;
  MasteringTargets mastering_targets;
};

/// @brief Returns "<audio_path>.25d".
std::string sidecar_path(const std::string& audio_path);

/// @brief Returns the current UTC time as "YYYY-MM-DDTHH:MM:SSZ".
std::string iso8601_utc_now();

/// @brief Serializes a record to sidecar JSON text.
std::string sidecar_to_json(const SidecarRecord& record);

/// @brief Parses sidecar JSON text.
/// @return false if the text is unparsable or has another format version
bool sidecar_from_json(const std::string& text, SidecarRecord& out);

/// @brief Writes the sidecar for @p audio_path.
/// @throws MasterprintException with WriteFailed if the file cannot be written
void save_sidecar(const std::string& audio_path, const SidecarRecord& record);

/// @brief Loads and validates the sidecar for @p audio_path.
/// @param expected_signature Current content signature of the audio file
/// @param out Filled on a hit
/// @return true on a hit; a missing, stale, unparsable or foreign-version file is a miss
bool load_sidecar(const std::string& audio_path, const std::string& expected_signature,
                  SidecarRecord& out);

/// @brief Deletes the sidecar for @p audio_path if present.
/// @return true if a file was removed
bool remove_sidecar(const std::string& audio_path);

}  // namespace masterprint
