#include "isidorcpp/record_store.hpp"

#include "isidorcpp/errors.hpp"
#include "sqlite_db.hpp"

#include <spdlog/spdlog.h>

#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace isidorcpp {
namespace {

constexpr const char* kSelectColumns = "SELECT id, owner_id, category, ts_ms, embedding FROM records";

void CreateSchema(core::SqliteDatabase& db) {
  db.Exec(
      "CREATE TABLE IF NOT EXISTS records("
      "id TEXT PRIMARY KEY,"
      "owner_id TEXT NOT NULL,"
      "category TEXT NOT NULL,"
      "ts_ms INTEGER NOT NULL,"
      "embedding BLOB NOT NULL"
      ");");
  db.Exec("CREATE INDEX IF NOT EXISTS records_owner_category_ts ON records(owner_id, category, ts_ms);");
  db.Exec(
      "CREATE TABLE IF NOT EXISTS record_metadata("
      "record_id TEXT NOT NULL REFERENCES records(id) ON DELETE CASCADE,"
      "key TEXT NOT NULL,"
      "value TEXT NOT NULL,"
      "PRIMARY KEY(record_id, key)"
      ");");
}

void Bind(core::Statement& stmt, const std::vector<RecordQuery::Binding>& bindings) {
  for (std::size_t i = 0; i < bindings.size(); ++i) {
    const int index = static_cast<int>(i) + 1;
    if (const auto* text = std::get_if<std::string>(&bindings[i])) {
      stmt.BindText(index, *text);
    } else {
      stmt.BindInt64(index, std::get<std::int64_t>(bindings[i]));
    }
  }
}

std::vector<IndexedRecord> ReadRecords(const core::SqliteDatabase& db, core::Statement& select) {
  std::vector<IndexedRecord> records{};
  while (select.Step()) {
    IndexedRecord record{};
    record.id = select.ColumnText(0);
    record.owner_id = select.ColumnText(1);
    record.category = select.ColumnText(2);
    record.timestamp = core::FromUnixMillis(select.ColumnInt64(3));
    record.embedding = core::DecodeEmbedding(select.ColumnBlob(4));
    records.push_back(std::move(record));
  }

  core::Statement metadata(db, "SELECT key, value FROM record_metadata WHERE record_id = ?1;");
  for (auto& record : records) {
    metadata.Reset();
    metadata.BindText(1, record.id);
    while (metadata.Step()) {
      record.metadata.emplace(metadata.ColumnText(0), metadata.ColumnText(1));
    }
  }
  return records;
}

[[noreturn]] void RethrowAsStoreError(const char* operation, const std::exception& ex) {
  spdlog::error("record store {} failed: {}", operation, ex.what());
  throw StoreUnavailable(std::string("record store ") + operation + " failed: " + ex.what());
}

}  // namespace

RecordQuery::RecordQuery(std::string owner_id) : owner_id_(std::move(owner_id)) {}

RecordQuery RecordQuery::ForOwner(std::string owner_id) {
  if (owner_id.empty()) {
    throw std::invalid_argument("RecordQuery requires an owner_id");
  }
  return RecordQuery(std::move(owner_id));
}

RecordQuery& RecordQuery::Category(std::string category) {
  category_ = std::move(category);
  return *this;
}

RecordQuery& RecordQuery::Since(Timestamp begin) {
  since_ = begin;
  return *this;
}

RecordQuery& RecordQuery::Until(Timestamp end) {
  until_ = end;
  return *this;
}

RecordQuery& RecordQuery::Within(const DateRange& range) {
  if (range.begin.has_value()) {
    Since(*range.begin);
  }
  if (range.end.has_value()) {
    Until(*range.end);
  }
  return *this;
}

RecordQuery& RecordQuery::MetadataEquals(std::string key, std::string value) {
  metadata_equals_.emplace_back(std::move(key), std::move(value));
  return *this;
}

RecordQuery& RecordQuery::Limit(int limit) {
  if (limit < 0) {
    throw std::invalid_argument("RecordQuery limit must be non-negative");
  }
  limit_ = limit;
  return *this;
}

RecordQuery::Compiled RecordQuery::Compile() const {
  Compiled out{};
  out.sql = kSelectColumns;
  out.sql.append(" WHERE owner_id = ?");
  out.bindings.emplace_back(owner_id_);
  if (category_.has_value()) {
    out.sql.append(" AND category = ?");
    out.bindings.emplace_back(*category_);
  }
  if (since_.has_value()) {
    out.sql.append(" AND ts_ms >= ?");
    out.bindings.emplace_back(core::ToUnixMillis(*since_));
  }
  if (until_.has_value()) {
    out.sql.append(" AND ts_ms <= ?");
    out.bindings.emplace_back(core::ToUnixMillis(*until_));
  }
  for (const auto& [key, value] : metadata_equals_) {
    out.sql.append(
        " AND EXISTS (SELECT 1 FROM record_metadata m WHERE m.record_id = records.id AND m.key = ? AND m.value = ?)");
    out.bindings.emplace_back(key);
    out.bindings.emplace_back(value);
  }
  out.sql.append(" ORDER BY ts_ms DESC, id ASC");
  if (limit_.has_value()) {
    out.sql.append(" LIMIT ?");
    out.bindings.emplace_back(static_cast<std::int64_t>(*limit_));
  }
  out.sql.append(";");
  return out;
}

struct SqliteRecordStore::SQLiteState {
  explicit SQLiteState(const std::string& path) : db(path) {}

  core::SqliteDatabase db;
};

SqliteRecordStore::SqliteRecordStore(const std::string& path) {
  try {
    sqlite_ = std::make_unique<SQLiteState>(path);
    CreateSchema(sqlite_->db);
  } catch (const core::SqliteError& ex) {
    RethrowAsStoreError("open", ex);
  }
}

SqliteRecordStore::~SqliteRecordStore() = default;

void SqliteRecordStore::Upsert(const IndexedRecord& record) {
  if (record.id.empty() || record.owner_id.empty()) {
    throw std::invalid_argument("SqliteRecordStore::Upsert requires id and owner_id");
  }
  try {
    std::lock_guard<std::mutex> lock(sqlite_->db.mutex());
    core::Transaction tx(sqlite_->db);
    core::Statement upsert(sqlite_->db,
                           "INSERT INTO records(id, owner_id, category, ts_ms, embedding) VALUES(?1, ?2, ?3, ?4, ?5) "
                           "ON CONFLICT(id) DO UPDATE SET owner_id=excluded.owner_id, category=excluded.category, "
                           "ts_ms=excluded.ts_ms, embedding=excluded.embedding;");
    upsert.BindText(1, record.id);
    upsert.BindText(2, record.owner_id);
    upsert.BindText(3, record.category);
    upsert.BindInt64(4, core::ToUnixMillis(record.timestamp));
    upsert.BindBlob(5, core::EncodeEmbedding(record.embedding));
    (void)upsert.Step();

    core::Statement clear(sqlite_->db, "DELETE FROM record_metadata WHERE record_id = ?1;");
    clear.BindText(1, record.id);
    (void)clear.Step();

    core::Statement insert(sqlite_->db, "INSERT INTO record_metadata(record_id, key, value) VALUES(?1, ?2, ?3);");
    for (const auto& [key, value] : record.metadata) {
      insert.Reset();
      insert.BindText(1, record.id);
      insert.BindText(2, key);
      insert.BindText(3, value);
      (void)insert.Step();
    }
    tx.Commit();
  } catch (const core::SqliteError& ex) {
    RethrowAsStoreError("upsert", ex);
  }
}

bool SqliteRecordStore::Remove(const std::string& id) {
  try {
    std::lock_guard<std::mutex> lock(sqlite_->db.mutex());
    core::Statement remove(sqlite_->db, "DELETE FROM records WHERE id = ?1;");
    remove.BindText(1, id);
    (void)remove.Step();
    return sqlite_->db.changes() > 0;
  } catch (const core::SqliteError& ex) {
    RethrowAsStoreError("remove", ex);
  }
}

std::vector<IndexedRecord> SqliteRecordStore::Query(const RecordQuery& query) const {
  const auto compiled = query.Compile();
  try {
    std::lock_guard<std::mutex> lock(sqlite_->db.mutex());
    core::Statement select(sqlite_->db, compiled.sql);
    Bind(select, compiled.bindings);
    return ReadRecords(sqlite_->db, select);
  } catch (const core::SqliteError& ex) {
    RethrowAsStoreError("query", ex);
  }
}

std::vector<IndexedRecord> SqliteRecordStore::LoadAll() const {
  try {
    std::lock_guard<std::mutex> lock(sqlite_->db.mutex());
    core::Statement select(sqlite_->db, std::string(kSelectColumns) + " ORDER BY owner_id, category, id;");
    return ReadRecords(sqlite_->db, select);
  } catch (const core::SqliteError& ex) {
    RethrowAsStoreError("load", ex);
  }
}

std::vector<std::string> SqliteRecordStore::DistinctCategories(const std::string& owner_id) const {
  try {
    std::lock_guard<std::mutex> lock(sqlite_->db.mutex());
    core::Statement select(sqlite_->db,
                           "SELECT DISTINCT category FROM records WHERE owner_id = ?1 ORDER BY category;");
    select.BindText(1, owner_id);
    std::vector<std::string> categories{};
    while (select.Step()) {
      categories.push_back(select.ColumnText(0));
    }
    return categories;
  } catch (const core::SqliteError& ex) {
    RethrowAsStoreError("categories", ex);
  }
}

std::size_t SqliteRecordStore::Count() const {
  try {
    std::lock_guard<std::mutex> lock(sqlite_->db.mutex());
    core::Statement select(sqlite_->db, "SELECT COUNT(*) FROM records;");
    return select.Step() ? static_cast<std::size_t>(select.ColumnInt64(0)) : 0;
  } catch (const core::SqliteError& ex) {
    RethrowAsStoreError("count", ex);
  }
}

}  // namespace isidorcpp
