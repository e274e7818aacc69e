#include "cache/hashing.h"

#include <sys/stat.h>

#include <cstdio>
#include <fstream>
#include <memory>
#include <vector>

#include <openssl/evp.h>

#include "util/exception.h"

namespace masterprint {

namespace {

struct EvpContextDeleter {
  void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

using EvpContext = std::unique_ptr<EVP_MD_CTX, EvpContextDeleter>;

std::string to_hex(const unsigned char* bytes, unsigned int size) {
  static const char kDigits[] = "0123456789abcdef";
  std::string hex;
  hex.reserve(size * 2);
  for (unsigned int i = 0; i < size; ++i) {
    hex.push_back(kDigits[bytes[i] >> 4]);
    hex.push_back(kDigits[bytes[i] & 0x0F]);
  }
  return hex;
}

}  // namespace

std::string sha256_hex(const void* data, size_t size) {
  EvpContext ctx(EVP_MD_CTX_new());
  MASTERPRINT_CHECK_MSG(ctx != nullptr, ErrorCode::OutOfMemory, "EVP_MD_CTX_new failed");

  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digest_len = 0;
  bool ok = EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) == 1 &&
            EVP_DigestUpdate(ctx.get(), data, size) == 1 &&
            EVP_DigestFinal_ex(ctx.get(), digest, &digest_len) == 1;
  MASTERPRINT_CHECK_MSG(ok, ErrorCode::InvalidParameter, "SHA-256 digest failed");
  return to_hex(digest, digest_len);
}

std::string content_signature(const std::string& path) {
  struct stat info;
  MASTERPRINT_CHECK_MSG(::stat(path.c_str(), &info) == 0, ErrorCode::FileNotFound,
                        "Cannot stat file: " + path);

  std::ifstream file(path, std::ios::binary);
  MASTERPRINT_CHECK_MSG(file.is_open(), ErrorCode::FileNotFound, "Cannot open file: " + path);
  std::vector<char> head(kSignatureHeadBytes);
  file.read(head.data(), static_cast<std::streamsize>(head.size()));
  size_t head_size = static_cast<size_t>(file.gcount());

  long long mtime_ns = static_cast<long long>(info.st_mtim.tv_sec) * 1000000000LL +
                       static_cast<long long>(info.st_mtim.tv_nsec);
  std::string material = std::to_string(static_cast<long long>(info.st_size)) + ":" +
                         std::to_string(mtime_ns) + ":" + sha256_hex(head.data(), head_size);
  return sha256_hex(material.data(), material.size());
}

std::string canonical_fingerprint_text(const Fingerprint& fingerprint) {
  // FeatureMap is ordered by key, which gives the canonical key order.
  FeatureMap values = fingerprint.to_map();
  std::string text = "{";
  char number[64];
  bool first = true;
  for (const auto& entry : values) {
    std::snprintf(number, sizeof(number), "%.6f", static_cast<double>(entry.second));
    if (!first) text += ",";
    text += "\"" + entry.first + "\":" + number;
    first = false;
  }
  text += "}";
  return text;
}

std::string fingerprint_hash(const Fingerprint& fingerprint) {
  std::string text = canonical_fingerprint_text(fingerprint);
  return sha256_hex(text.data(), text.size());
}

}  // namespace masterprint
