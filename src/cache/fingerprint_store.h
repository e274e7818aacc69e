#pragma once

/// @file fingerprint_store.h
/// @brief SQLite-backed persistent fingerprint table.

#include <mutex>
#include <string>
#include <vector>

#include "fingerprint/fingerprint.h"

struct sqlite3;

namespace masterprint {

/// @brief Persistent fingerprint store.
/// @details One table `fingerprints` keyed by file path with one REAL column per fingerprint
/// field plus `signature`, `fingerprint_hash` and `updated_at`. The database runs in WAL mode
/// with a busy timeout so several processes can share it; writes are upserts and the last
/// writer wins. All calls on one store object are serialized by a mutex.
class FingerprintStore {
 public:
  /// @brief Busy timeout applied to the connection, in milliseconds.
  static constexpr int kBusyTimeoutMs = 60000;

  /// @brief Opens (creating if needed) the database at @p db_path.
  /// @throws MasterprintException with StoreFailed if the database cannot be opened
  explicit FingerprintStore(const std::string& db_path);

  ~FingerprintStore();

  // Non-copyable
  FingerprintStore(const FingerprintStore&) = delete;
  FingerprintStore& operator=(const FingerprintStore&) = delete;

  /// @brief Looks up the fingerprint stored for @p path.
  /// @details A row is a hit only when its signature equals @p signature and its stored
  ///          integrity hash matches the hash recomputed from the stored values.
  /// @return true on a hit (out is filled)
  /// @throws MasterprintException with StoreFailed on a database error
  bool lookup(const std::string& path, const std::string& signature, Fingerprint& out);

  /// @brief Inserts or replaces the row for @p path.
  /// @throws MasterprintException with StoreFailed on a database error
  void upsert(const std::string& path, const std::string& signature,
              const Fingerprint& fingerprint);

  /// @brief Deletes every row.
  /// @return Number of rows removed
  int clear();

  /// @brief Deletes the row for @p path.
  /// @return Number of rows removed (0 or 1)
  int clear(const std::string& path);

  /// @brief Returns the number of stored rows.
  int count();

  /// @brief Returns every stored file path.
  std::vector<std::string> paths();

  const std::string& db_path() const { return db_path_; }

 private:
  void exec(const std::string& sql);
  int execute_delete(const char* sql, const std::string* path);

  std::string db_path_;
  sqlite3* db_ = nullptr;
  std::mutex mutex_;
};

}  // namespace masterprint
