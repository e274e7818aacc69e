#include "cache/fingerprint_store.h"

#include <memory>

#include <sqlite3.h>

#include "cache/hashing.h"
#include "cache/sidecar.h"
#include "util/exception.h"
#include "util/log.h"

namespace masterprint {

namespace {

struct StatementDeleter {
  void operator()(sqlite3_stmt* stmt) const { sqlite3_finalize(stmt); }
};

using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

[[noreturn]] void fail(sqlite3* db, const std::string& what) {
  throw MasterprintException(ErrorCode::StoreFailed, what + ": " + sqlite3_errmsg(db));
}

Statement prepare(sqlite3* db, const std::string& sql) {
  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &raw, nullptr) != SQLITE_OK) {
    fail(db, "prepare failed");
  }
  return Statement(raw);
}

std::string column_list() {
  std::string columns;
  for (const FieldSpec& spec : fingerprint_fields()) {
    columns += ", ";
    columns += spec.name;
  }
  return columns;
}

std::string create_table_sql() {
  std::string sql = "CREATE TABLE IF NOT EXISTS fingerprints (filepath TEXT PRIMARY KEY";
  for (const FieldSpec& spec : fingerprint_fields()) {
    sql += ", ";
    sql += spec.name;
    sql += " REAL";
  }
  sql += ", signature TEXT NOT NULL, fingerprint_hash TEXT NOT NULL, updated_at TEXT NOT NULL)";
  return sql;
}

std::string upsert_sql() {
  std::string sql = "INSERT INTO fingerprints (filepath" + column_list() +
                    ", signature, fingerprint_hash, updated_at) VALUES (?";
  for (size_t i = 0; i < kFingerprintDims + 3; ++i) {
    sql += ", ?";
  }
  sql += ") ON CONFLICT(filepath) DO UPDATE SET ";
  for (const FieldSpec& spec : fingerprint_fields()) {
    sql += spec.name;
    sql += " = excluded.";
    sql += spec.name;
    sql += ", ";
  }
  sql += "signature = excluded.signature, fingerprint_hash = excluded.fingerprint_hash, "
         "updated_at = excluded.updated_at";
  return sql;
}

}  // namespace

FingerprintStore::FingerprintStore(const std::string& db_path) : db_path_(db_path) {
  if (sqlite3_open(db_path.c_str(), &db_) != SQLITE_OK) {
    std::string message = db_ ? sqlite3_errmsg(db_) : "out of memory";
    sqlite3_close(db_);
    db_ = nullptr;
    throw MasterprintException(ErrorCode::StoreFailed,
                               "Cannot open fingerprint store " + db_path + ": " + message);
  }
  try {
    sqlite3_busy_timeout(db_, kBusyTimeoutMs);
    exec("PRAGMA journal_mode=WAL");
    exec(create_table_sql());
  } catch (...) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
  logger()->debug("Opened fingerprint store {}", db_path);
}

FingerprintStore::~FingerprintStore() {
  if (db_) {
    sqlite3_close(db_);
  }
}

void FingerprintStore::exec(const std::string& sql) {
  char* error = nullptr;
  if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error) != SQLITE_OK) {
    std::string message = error ? error : "unknown error";
    sqlite3_free(error);
    throw MasterprintException(ErrorCode::StoreFailed, "SQL failed: " + message);
  }
}

bool FingerprintStore::lookup(const std::string& path, const std::string& signature,
                              Fingerprint& out) {
  std::lock_guard<std::mutex> lock(mutex_);
  Statement stmt = prepare(db_, "SELECT signature, fingerprint_hash" + column_list() +
                                     " FROM fingerprints WHERE filepath = ?");
  sqlite3_bind_text(stmt.get(), 1, path.c_str(), -1, SQLITE_TRANSIENT);

  int rc = sqlite3_step(stmt.get());
  if (rc == SQLITE_DONE) {
    return false;
  }
  if (rc != SQLITE_ROW) {
    fail(db_, "lookup failed");
  }

  auto text_column = [&stmt](int index) {
    const unsigned char* text = sqlite3_column_text(stmt.get(), index);
    return text ? std::string(reinterpret_cast<const char*>(text)) : std::string();
  };

  if (text_column(0) != signature) {
    logger()->debug("Stored fingerprint for {} is stale", path);
    return false;
  }

  FeatureMap values;
  int index = 2;
  for (const FieldSpec& spec : fingerprint_fields()) {
    if (sqlite3_column_type(stmt.get(), index) != SQLITE_NULL) {
      values[spec.name] = static_cast<float>(sqlite3_column_double(stmt.get(), index));
    }
    ++index;
  }
  Fingerprint fingerprint = Fingerprint::from_map(values);
  if (fingerprint_hash(fingerprint) != text_column(1)) {
    logger()->warn("Stored fingerprint for {} failed its integrity check", path);
    return false;
  }

  out = fingerprint;
  return true;
}

void FingerprintStore::upsert(const std::string& path, const std::string& signature,
                              const Fingerprint& fingerprint) {
  std::string hash = fingerprint_hash(fingerprint);
  std::string updated_at = iso8601_utc_now();

  std::lock_guard<std::mutex> lock(mutex_);
  Statement stmt = prepare(db_, upsert_sql());
  int index = 1;
  sqlite3_bind_text(stmt.get(), index++, path.c_str(), -1, SQLITE_TRANSIENT);
  for (float value : fingerprint.values()) {
    sqlite3_bind_double(stmt.get(), index++, static_cast<double>(value));
  }
  sqlite3_bind_text(stmt.get(), index++, signature.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt.get(), index++, hash.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt.get(), index++, updated_at.c_str(), -1, SQLITE_TRANSIENT);

  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    fail(db_, "upsert failed");
  }
}

int FingerprintStore::execute_delete(const char* sql, const std::string* path) {
  std::lock_guard<std::mutex> lock(mutex_);
  Statement stmt = prepare(db_, sql);
  if (path) {
    sqlite3_bind_text(stmt.get(), 1, path->c_str(), -1, SQLITE_TRANSIENT);
  }
  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    fail(db_, "delete failed");
  }
  return sqlite3_changes(db_);
}

int FingerprintStore::clear() { return execute_delete("DELETE FROM fingerprints", nullptr); }

int FingerprintStore::clear(const std::string& path) {
  return execute_delete("DELETE FROM fingerprints WHERE filepath = ?", &path);
}

int FingerprintStore::count() {
  std::lock_guard<std::mutex> lock(mutex_);
  Statement stmt = prepare(db_, "SELECT COUNT(*) FROM fingerprints");
  if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
    fail(db_, "count failed");
  }
  return sqlite3_column_int(stmt.get(), 0);
}

std::vector<std::string> FingerprintStore::paths() {
  std::lock_guard<std::mutex> lock(mutex_);
  Statement stmt = prepare(db_, "SELECT filepath FROM fingerprints");
  std::vector<std::string> result;
  int rc;
  while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
    result.emplace_back(reinterpret_cast<const char*>(sqlite3_column_text(stmt.get(), 0)));
  }
  if (rc != SQLITE_DONE) {
    fail(db_, "path listing failed");
  }
  return result;
}

}  // namespace masterprint
