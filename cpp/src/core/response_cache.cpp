#include "isidorcpp/response_cache.hpp"

#include "isidorcpp/errors.hpp"
#include "sha256.hpp"
#include "sqlite_db.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <mutex>
#include <stdexcept>
#include <utility>
#include <vector>

namespace isidorcpp {
namespace {

void CreateSchema(core::SqliteDatabase& db) {
  db.Exec(
      "CREATE TABLE IF NOT EXISTS response_cache("
      "id INTEGER PRIMARY KEY AUTOINCREMENT,"
      "cache_key TEXT NOT NULL,"
      "owner_id TEXT NOT NULL,"
      "endpoint TEXT NOT NULL,"
      "time_frame TEXT NOT NULL,"
      "payload TEXT NOT NULL,"
      "created_ms INTEGER NOT NULL,"
      "expires_ms INTEGER NOT NULL"
      ");");
  db.Exec("CREATE INDEX IF NOT EXISTS response_cache_lookup ON response_cache(owner_id, cache_key, expires_ms);");
}

FieldValue CanonicalParam(const FieldValue& value) {
  const auto* list = std::get_if<FieldList>(&value.storage());
  if (list == nullptr) {
    return value;
  }
  std::vector<std::pair<std::string, const FieldValue*>> keyed{};
  keyed.reserve(list->size());
  for (const auto& element : *list) {
    keyed.emplace_back(EncodeFieldValue(element), &element);
  }
  std::stable_sort(keyed.begin(), keyed.end(), [](const auto& lhs, const auto& rhs) {
    return lhs.first < rhs.first;
  });
  FieldList sorted{};
  sorted.reserve(keyed.size());
  for (const auto& [encoded, element] : keyed) {
    sorted.push_back(*element);
  }
  return FieldValue(std::move(sorted));
}

[[noreturn]] void RethrowAsCacheError(const char* operation, const std::exception& ex) {
  spdlog::warn("response cache {} failed: {}", operation, ex.what());
  throw CacheUnavailable(std::string("response cache ") + operation + " failed: " + ex.what());
}

}  // namespace

struct ResponseCache::SQLiteState {
  explicit SQLiteState(const std::string& path) : db(path) {}

  core::SqliteDatabase db;
};

ResponseCache::ResponseCache(const std::string& path, std::shared_ptr<const Clock> clock)
    : clock_(std::move(clock)) {
  if (clock_ == nullptr) {
    throw std::invalid_argument("ResponseCache requires a clock");
  }
  try {
    sqlite_ = std::make_unique<SQLiteState>(path);
    CreateSchema(sqlite_->db);
  } catch (const core::SqliteError& ex) {
    RethrowAsCacheError("open", ex);
  }
}

ResponseCache::~ResponseCache() = default;

CacheKey ResponseCache::MakeKey(const std::string& endpoint,
                                const std::string& time_frame,
                                const std::string& query,
                                const FieldObject& extra_params) {
  FieldObject params{};
  params.reserve(extra_params.size());
  for (const auto& [name, value] : extra_params) {
    params.emplace_back(name, CanonicalParam(value));
  }
  const FieldObject canonical{
      {"endpoint", endpoint},
      {"params", std::move(params)},
      {"query", query},
      {"time_frame", time_frame},
  };
  CacheKey key{};
  key.endpoint = endpoint;
  key.time_frame = time_frame;
  key.digest = core::Sha256Hex(EncodeFieldValue(FieldValue(canonical)));
  return key;
}

std::optional<std::string> ResponseCache::Get(const std::string& owner_id, const CacheKey& key) const {
  const auto now_ms = core::ToUnixMillis(clock_->Now());
  try {
    std::lock_guard<std::mutex> lock(sqlite_->db.mutex());
    core::Statement select(sqlite_->db,
                           "SELECT payload FROM response_cache "
                           "WHERE owner_id = ?1 AND cache_key = ?2 AND expires_ms > ?3 "
                           "ORDER BY created_ms DESC, id DESC LIMIT 1;");
    select.BindText(1, owner_id);
    select.BindText(2, key.digest);
    select.BindInt64(3, now_ms);
    if (!select.Step()) {
      return std::nullopt;
    }
    return select.ColumnText(0);
  } catch (const core::SqliteError& ex) {
    RethrowAsCacheError("get", ex);
  }
}

CacheEntry ResponseCache::Put(const std::string& owner_id,
                              const CacheKey& key,
                              const std::string& payload,
                              std::chrono::seconds ttl) {
  if (ttl.count() <= 0) {
    throw std::invalid_argument("ResponseCache::Put ttl must be positive");
  }
  if (owner_id.empty() || key.digest.empty()) {
    throw std::invalid_argument("ResponseCache::Put requires owner_id and key");
  }
  CacheEntry entry{};
  entry.key = key.digest;
  entry.owner_id = owner_id;
  entry.endpoint = key.endpoint;
  entry.time_frame = key.time_frame;
  entry.payload = payload;
  entry.created_at = core::FromUnixMillis(core::ToUnixMillis(clock_->Now()));
  entry.expires_at = entry.created_at + ttl;

  try {
    std::lock_guard<std::mutex> lock(sqlite_->db.mutex());
    core::Statement insert(sqlite_->db,
                           "INSERT INTO response_cache(cache_key, owner_id, endpoint, time_frame, payload, "
                           "created_ms, expires_ms) VALUES(?1, ?2, ?3, ?4, ?5, ?6, ?7);");
    insert.BindText(1, entry.key);
    insert.BindText(2, entry.owner_id);
    insert.BindText(3, entry.endpoint);
    insert.BindText(4, entry.time_frame);
    insert.BindText(5, entry.payload);
    insert.BindInt64(6, core::ToUnixMillis(entry.created_at));
    insert.BindInt64(7, core::ToUnixMillis(entry.expires_at));
    (void)insert.Step();
  } catch (const core::SqliteError& ex) {
    RethrowAsCacheError("put", ex);
  }
  return entry;
}

std::size_t ResponseCache::Invalidate(const std::string& owner_id,
                                      const std::optional<std::string>& endpoint,
                                      const std::optional<std::string>& time_frame) {
  const auto now_ms = core::ToUnixMillis(clock_->Now());
  std::string sql = "UPDATE response_cache SET expires_ms = ?1 WHERE owner_id = ?2 AND expires_ms > ?1";
  int next = 3;
  int endpoint_index = 0;
  int time_frame_index = 0;
  if (endpoint.has_value()) {
    endpoint_index = next++;
    sql.append(" AND endpoint = ?" + std::to_string(endpoint_index));
  }
  if (time_frame.has_value()) {
    time_frame_index = next++;
    sql.append(" AND time_frame = ?" + std::to_string(time_frame_index));
  }
  sql.append(";");

  try {
    std::lock_guard<std::mutex> lock(sqlite_->db.mutex());
    core::Statement update(sqlite_->db, sql);
    update.BindInt64(1, now_ms);
    update.BindText(2, owner_id);
    if (endpoint.has_value()) {
      update.BindText(endpoint_index, *endpoint);
    }
    if (time_frame.has_value()) {
      update.BindText(time_frame_index, *time_frame);
    }
    (void)update.Step();
    const auto count = static_cast<std::size_t>(sqlite_->db.changes());
    spdlog::debug("invalidated {} cache rows for owner {}", count, owner_id);
    return count;
  } catch (const core::SqliteError& ex) {
    RethrowAsCacheError("invalidate", ex);
  }
}

std::size_t ResponseCache::PurgeExpired() {
  const auto now_ms = core::ToUnixMillis(clock_->Now());
  try {
    std::lock_guard<std::mutex> lock(sqlite_->db.mutex());
    core::Statement remove(sqlite_->db, "DELETE FROM response_cache WHERE expires_ms <= ?1;");
    remove.BindInt64(1, now_ms);
    (void)remove.Step();
    return static_cast<std::size_t>(sqlite_->db.changes());
  } catch (const core::SqliteError& ex) {
    RethrowAsCacheError("purge", ex);
  }
}

}  // namespace isidorcpp
