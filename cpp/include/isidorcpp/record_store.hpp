#pragma once

#include "isidorcpp/types.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace isidorcpp {

// Typed filter over the records table. Every value is bound as a statement parameter;
// only fixed column names ever reach the SQL text. All clauses are conjunctive.
class RecordQuery {
 public:
  using Binding = std::variant<std::string, std::int64_t>;
  struct Compiled {
    std::string sql;
    std::vector<Binding> bindings;
  };

  // Throws std::invalid_argument on an empty owner.
  static RecordQuery ForOwner(std::string owner_id);

  RecordQuery& Category(std::string category);
  RecordQuery& Since(Timestamp begin);
  RecordQuery& Until(Timestamp end);
  RecordQuery& Within(const DateRange& range);
  RecordQuery& MetadataEquals(std::string key, std::string value);
  RecordQuery& Limit(int limit);

  [[nodiscard]] const std::string& owner_id() const { return owner_id_; }
  [[nodiscard]] Compiled Compile() const;

 private:
  explicit RecordQuery(std::string owner_id);

  std::string owner_id_;
  std::optional<std::string> category_;
  std::optional<Timestamp> since_;
  std::optional<Timestamp> until_;
  std::vector<std::pair<std::string, std::string>> metadata_equals_;
  std::optional<int> limit_;
};

// Durable home of indexed records (id, owner, category, timestamp, metadata, embedding).
// Failures surface as StoreUnavailable. Safe to share between threads.
class SqliteRecordStore {
 public:
  // ":memory:" opens a private in-memory database.
  explicit SqliteRecordStore(const std::string& path);
  ~SqliteRecordStore();
  SqliteRecordStore(const SqliteRecordStore&) = delete;
  SqliteRecordStore& operator=(const SqliteRecordStore&) = delete;

  // Replaces any existing record with the same id, metadata included.
  void Upsert(const IndexedRecord& record);
  bool Remove(const std::string& id);

  // Newest first, ties by id.
  [[nodiscard]] std::vector<IndexedRecord> Query(const RecordQuery& query) const;
  [[nodiscard]] std::vector<IndexedRecord> LoadAll() const;
  [[nodiscard]] std::vector<std::string> DistinctCategories(const std::string& owner_id) const;
  [[nodiscard]] std::size_t Count() const;

 private:
  struct SQLiteState;

  std::unique_ptr<SQLiteState> sqlite_;
};

}  // namespace isidorcpp
