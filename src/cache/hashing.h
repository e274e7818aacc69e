#pragma once

/// @file hashing.h
/// @brief SHA-256 digests for content signatures and fingerprint integrity.

#include <cstddef>
#include <string>

#include "fingerprint/fingerprint.h"

namespace masterprint {

/// @brief Bytes of the file head included in a content signature.
constexpr size_t kSignatureHeadBytes = 1 << 20;

/// @brief Returns the lowercase hex SHA-256 of a byte range.
/// @throws MasterprintException if the digest cannot be computed
std::string sha256_hex(const void* data, size_t size);

/// @brief Computes the content signature of a file.
/// @details Digest over file size, modification time (nanoseconds) and the SHA-256 of the
///          first megabyte. Any change to one of them changes the signature.
/// @throws MasterprintException with FileNotFound if the file cannot be read
std::string content_signature(const std::string& path);

/// @brief Canonical text of a fingerprint: keys sorted, values printed with 6 decimals.
std::string canonical_fingerprint_text(const Fingerprint& fingerprint);

/// @brief SHA-256 over canonical_fingerprint_text().
std::string fingerprint_hash(const Fingerprint& fingerprint);

}  // namespace masterprint
