#include "sqlite_db.hpp"

#include <sqlite3.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <cstring>

namespace isidorcpp::core {
namespace {

constexpr int kBusyTimeoutMs = 5000;

std::string ErrorText(sqlite3* db, const char* what) {
  return std::string("sqlite ") + what + " failed: " + (db != nullptr ? sqlite3_errmsg(db) : "no connection");
}

void AppendU32LE(std::string& out, std::uint32_t value) {
  for (std::size_t i = 0; i < sizeof(value); ++i) {
    out.push_back(static_cast<char>((value >> (8U * i)) & 0xFFU));
  }
}

std::uint32_t ReadU32LE(const std::string& bytes, std::size_t offset) {
  std::uint32_t out = 0;
  for (std::size_t i = 0; i < sizeof(out); ++i) {
    out |= static_cast<std::uint32_t>(static_cast<unsigned char>(bytes[offset + i])) << (8U * i);
  }
  return out;
}

}  // namespace

SqliteDatabase::SqliteDatabase(const std::string& path) : path_(path) {
  const int rc = sqlite3_open_v2(path_.c_str(),
                                 &db_,
                                 SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                                 nullptr);
  if (rc != SQLITE_OK) {
    const auto message = ErrorText(db_, "open");
    sqlite3_close(db_);
    db_ = nullptr;
    throw SqliteError(message + " (" + path_ + ")");
  }
  sqlite3_busy_timeout(db_, kBusyTimeoutMs);
  Exec("PRAGMA foreign_keys=ON;");
}

SqliteDatabase::~SqliteDatabase() {
  if (db_ != nullptr) {
    sqlite3_close(db_);
    db_ = nullptr;
  }
}

void SqliteDatabase::Exec(const char* sql) {
  char* err = nullptr;
  const int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err);
  if (rc == SQLITE_OK) {
    return;
  }
  std::string message = err != nullptr ? err : "sqlite exec failed";
  if (err != nullptr) {
    sqlite3_free(err);
  }
  throw SqliteError(message);
}

std::int64_t SqliteDatabase::changes() const {
  return static_cast<std::int64_t>(sqlite3_changes(db_));
}

Statement::Statement(const SqliteDatabase& db, std::string_view sql) : db_(db.handle()) {
  if (sqlite3_prepare_v2(db_, sql.data(), static_cast<int>(sql.size()), &stmt_, nullptr) != SQLITE_OK) {
    throw SqliteError(ErrorText(db_, "prepare"));
  }
}

Statement::~Statement() {
  if (stmt_ != nullptr) {
    sqlite3_finalize(stmt_);
  }
}

void Statement::Fail(const char* what) const {
  throw SqliteError(ErrorText(db_, what));
}

void Statement::BindText(int index, std::string_view value) {
  if (sqlite3_bind_text(stmt_, index, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT) != SQLITE_OK) {
    Fail("bind");
  }
}

void Statement::BindInt64(int index, std::int64_t value) {
  if (sqlite3_bind_int64(stmt_, index, static_cast<sqlite3_int64>(value)) != SQLITE_OK) {
    Fail("bind");
  }
}

void Statement::BindBlob(int index, const std::string& bytes) {
  if (sqlite3_bind_blob(stmt_, index, bytes.data(), static_cast<int>(bytes.size()), SQLITE_TRANSIENT) != SQLITE_OK) {
    Fail("bind");
  }
}

void Statement::BindNull(int index) {
  if (sqlite3_bind_null(stmt_, index) != SQLITE_OK) {
    Fail("bind");
  }
}

bool Statement::Step() {
  const int rc = sqlite3_step(stmt_);
  if (rc == SQLITE_ROW) {
    return true;
  }
  if (rc == SQLITE_DONE) {
    return false;
  }
  Fail("step");
}

void Statement::Reset() {
  sqlite3_reset(stmt_);
  sqlite3_clear_bindings(stmt_);
}

bool Statement::ColumnIsNull(int column) const {
  return sqlite3_column_type(stmt_, column) == SQLITE_NULL;
}

std::string Statement::ColumnText(int column) const {
  const auto* text = sqlite3_column_text(stmt_, column);
  const int bytes = sqlite3_column_bytes(stmt_, column);
  if (text == nullptr || bytes <= 0) {
    return {};
  }
  return std::string(reinterpret_cast<const char*>(text), static_cast<std::size_t>(bytes));
}

std::int64_t Statement::ColumnInt64(int column) const {
  return static_cast<std::int64_t>(sqlite3_column_int64(stmt_, column));
}

std::string Statement::ColumnBlob(int column) const {
  const void* blob = sqlite3_column_blob(stmt_, column);
  const int bytes = sqlite3_column_bytes(stmt_, column);
  if (blob == nullptr || bytes <= 0) {
    return {};
  }
  return std::string(static_cast<const char*>(blob), static_cast<std::size_t>(bytes));
}

Transaction::Transaction(SqliteDatabase& db) : db_(db) {
  db_.Exec("BEGIN IMMEDIATE TRANSACTION;");
}

Transaction::~Transaction() {
  if (done_) {
    return;
  }
  char* err = nullptr;
  if (sqlite3_exec(db_.handle(), "ROLLBACK;", nullptr, nullptr, &err) != SQLITE_OK) {
    spdlog::warn("sqlite rollback failed on {}: {}", db_.path(), err != nullptr ? err : "unknown error");
  }
  if (err != nullptr) {
    sqlite3_free(err);
  }
}

void Transaction::Commit() {
  db_.Exec("COMMIT;");
  done_ = true;
}

std::string EncodeEmbedding(const EmbeddingVector& embedding) {
  std::string out{};
  out.reserve(embedding.size() * sizeof(float));
  for (const float value : embedding) {
    std::uint32_t bits = 0;
    std::memcpy(&bits, &value, sizeof(bits));
    AppendU32LE(out, bits);
  }
  return out;
}

EmbeddingVector DecodeEmbedding(const std::string& bytes) {
  if (bytes.size() % sizeof(float) != 0) {
    throw SqliteError("embedding blob length is not a multiple of 4");
  }
  EmbeddingVector out(bytes.size() / sizeof(float), 0.0F);
  for (std::size_t i = 0; i < out.size(); ++i) {
    const std::uint32_t raw = ReadU32LE(bytes, i * sizeof(float));
    float value = 0.0F;
    std::memcpy(&value, &raw, sizeof(value));
    out[i] = value;
  }
  return out;
}

std::int64_t ToUnixMillis(Timestamp timestamp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(timestamp.time_since_epoch()).count();
}

Timestamp FromUnixMillis(std::int64_t millis) {
  return Timestamp(std::chrono::duration_cast<Timestamp::duration>(std::chrono::milliseconds(millis)));
}

}  // namespace isidorcpp::core
