#pragma once

#include "isidorcpp/types.hpp"

#include <cstdint>
#include <mutex>
#include <stdexcept>
#include <string>
#include <string_view>

struct sqlite3;
struct sqlite3_stmt;

namespace isidorcpp::core {

class SqliteError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// One connection. ":memory:" gives a private in-memory database. Callers hold mutex()
// across any multi-statement sequence.
class SqliteDatabase {
 public:
  explicit SqliteDatabase(const std::string& path);
  ~SqliteDatabase();
  SqliteDatabase(const SqliteDatabase&) = delete;
  SqliteDatabase& operator=(const SqliteDatabase&) = delete;

  [[nodiscard]] sqlite3* handle() const { return db_; }
  [[nodiscard]] std::mutex& mutex() { return mutex_; }
  [[nodiscard]] const std::string& path() const { return path_; }

  void Exec(const char* sql);
  [[nodiscard]] std::int64_t changes() const;

 private:
  std::string path_;
  sqlite3* db_ = nullptr;
  std::mutex mutex_;
};

class Statement final {
 public:
  Statement(const SqliteDatabase& db, std::string_view sql);
  ~Statement();
  Statement(const Statement&) = delete;
  Statement& operator=(const Statement&) = delete;

  // Parameter indexes are 1-based, columns 0-based.
  void BindText(int index, std::string_view value);
  void BindInt64(int index, std::int64_t value);
  void BindBlob(int index, const std::string& bytes);
  void BindNull(int index);

  // True while a row is available; false once the statement is done.
  bool Step();
  void Reset();

  [[nodiscard]] bool ColumnIsNull(int column) const;
  [[nodiscard]] std::string ColumnText(int column) const;
  [[nodiscard]] std::int64_t ColumnInt64(int column) const;
  [[nodiscard]] std::string ColumnBlob(int column) const;

 private:
  [[noreturn]] void Fail(const char* what) const;

  sqlite3* db_ = nullptr;
  sqlite3_stmt* stmt_ = nullptr;
};

// BEGIN IMMEDIATE on construction; rolls back on destruction unless committed.
class Transaction final {
 public:
  explicit Transaction(SqliteDatabase& db);
  ~Transaction();
  Transaction(const Transaction&) = delete;
  Transaction& operator=(const Transaction&) = delete;

  void Commit();

 private:
  SqliteDatabase& db_;
  bool done_ = false;
};

// Embeddings are stored as packed little-endian f32.
[[nodiscard]] std::string EncodeEmbedding(const EmbeddingVector& embedding);
[[nodiscard]] EmbeddingVector DecodeEmbedding(const std::string& bytes);

[[nodiscard]] std::int64_t ToUnixMillis(Timestamp timestamp);
[[nodiscard]] Timestamp FromUnixMillis(std::int64_t millis);

}  // namespace isidorcpp::core
