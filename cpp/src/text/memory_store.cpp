#include "isidorcpp/memory_store.hpp"

#include "../core/sqlite_db.hpp"
#include "isidorcpp/errors.hpp"
#include "isidorcpp/record_text.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdint>
#include <stdexcept>
#include <utility>

namespace isidorcpp {
namespace {

constexpr std::size_t kEntrySeparatorSize = 2;  // "\n\n"
constexpr std::size_t kRenderedPrefixSize = 22;  // "[YYYY-MM-DD HH:MM:SS] "
constexpr std::size_t kMinMaxChars = 64;

struct StoredEntry {
  std::int64_t seq = 0;
  Timestamp timestamp{};
  std::string content;
  std::size_t rendered_size = 0;
};

void CreateSchema(core::SqliteDatabase& db) {
  db.Exec(
      "CREATE TABLE IF NOT EXISTS memory_entries("
      "owner_id TEXT NOT NULL,"
      "seq INTEGER NOT NULL,"
      "created_ms INTEGER NOT NULL,"
      "content TEXT NOT NULL,"
      "PRIMARY KEY(owner_id, seq)"
      ");");
  db.Exec(
      "CREATE TABLE IF NOT EXISTS memory_documents("
      "owner_id TEXT PRIMARY KEY,"
      "text TEXT NOT NULL,"
      "embedding BLOB NOT NULL,"
      "updated_ms INTEGER NOT NULL"
      ");");
}

std::vector<StoredEntry> ReadEntries(const core::SqliteDatabase& db, const std::string& owner_id) {
  core::Statement select(db,
                         "SELECT seq, created_ms, content FROM memory_entries WHERE owner_id = ?1 ORDER BY seq;");
  select.BindText(1, owner_id);
  std::vector<StoredEntry> entries{};
  while (select.Step()) {
    StoredEntry entry{};
    entry.seq = select.ColumnInt64(0);
    entry.timestamp = core::FromUnixMillis(select.ColumnInt64(1));
    entry.content = select.ColumnText(2);
    entry.rendered_size = kRenderedPrefixSize + entry.content.size();
    entries.push_back(std::move(entry));
  }
  return entries;
}

std::optional<MemoryEntry> ReadDocument(const core::SqliteDatabase& db, const std::string& owner_id) {
  core::Statement select(db,
                         "SELECT text, embedding, updated_ms FROM memory_documents WHERE owner_id = ?1;");
  select.BindText(1, owner_id);
  if (!select.Step()) {
    return std::nullopt;
  }
  MemoryEntry entry{};
  entry.owner_id = owner_id;
  entry.text = select.ColumnText(0);
  entry.embedding = core::DecodeEmbedding(select.ColumnBlob(1));
  entry.timestamp = core::FromUnixMillis(select.ColumnInt64(2));
  return entry;
}

std::string WithContext(const std::string& text, const Metadata& context) {
  if (context.empty()) {
    return text;
  }
  std::vector<std::pair<std::string, std::string>> sorted(context.begin(), context.end());
  std::sort(sorted.begin(), sorted.end());
  std::string out = text;
  out.append("\nContext: ");
  for (std::size_t i = 0; i < sorted.size(); ++i) {
    if (i > 0) {
      out.append(", ");
    }
    out.append(sorted[i].first);
    out.append(": ");
    out.append(sorted[i].second);
  }
  return out;
}

std::size_t DocumentSize(const std::vector<StoredEntry>& entries, std::size_t first) {
  std::size_t total = 0;
  for (std::size_t i = first; i < entries.size(); ++i) {
    total += entries[i].rendered_size;
    if (i > first) {
      total += kEntrySeparatorSize;
    }
  }
  return total;
}

[[noreturn]] void RethrowAsStoreError(const char* operation, const std::exception& ex) {
  spdlog::error("memory store {} failed: {}", operation, ex.what());
  throw StoreUnavailable(std::string("memory store ") + operation + " failed: " + ex.what());
}

}  // namespace

struct MemoryStore::SQLiteState {
  explicit SQLiteState(const std::string& path) : db(path) {}

  core::SqliteDatabase db;
};

MemoryStore::MemoryStore(const std::string& path,
                         std::shared_ptr<const EmbeddingGenerator> generator,
                         std::size_t max_chars,
                         std::shared_ptr<const Clock> clock)
    : generator_(std::move(generator)), max_chars_(max_chars), clock_(std::move(clock)) {
  if (generator_ == nullptr) {
    throw std::invalid_argument("MemoryStore requires an embedding generator");
  }
  if (clock_ == nullptr) {
    throw std::invalid_argument("MemoryStore requires a clock");
  }
  if (max_chars_ < kMinMaxChars) {
    throw std::invalid_argument("MemoryStore max_chars must be at least " + std::to_string(kMinMaxChars));
  }
  try {
    sqlite_ = std::make_unique<SQLiteState>(path);
    CreateSchema(sqlite_->db);
  } catch (const core::SqliteError& ex) {
    RethrowAsStoreError("open", ex);
  }
}

MemoryStore::~MemoryStore() = default;

std::string MemoryStore::RenderEntry(Timestamp timestamp, const std::string& content) {
  return "[" + FormatUtcTimestamp(timestamp) + "] " + content;
}

MemoryStore::OwnerGuard::OwnerGuard(MemoryStore& store, const std::string& owner_id)
    : store_(store), owner_id_(owner_id) {
  {
    std::lock_guard<std::mutex> lock(store_.owner_locks_mutex_);
    auto& slot = store_.owner_locks_[owner_id_];
    if (slot == nullptr) {
      slot = std::make_shared<std::mutex>();
    }
    mutex_ = slot;
  }
  mutex_->lock();
}

MemoryStore::OwnerGuard::~OwnerGuard() {
  mutex_->unlock();
  std::lock_guard<std::mutex> lock(store_.owner_locks_mutex_);
  mutex_.reset();
  const auto it = store_.owner_locks_.find(owner_id_);
  if (it != store_.owner_locks_.end() && it->second.use_count() == 1) {
    store_.owner_locks_.erase(it);
  }
}

std::size_t MemoryStore::active_owner_locks() const {
  std::lock_guard<std::mutex> lock(owner_locks_mutex_);
  return owner_locks_.size();
}

std::optional<MemoryEntry> MemoryStore::Get(const std::string& owner_id) const {
  try {
    std::lock_guard<std::mutex> lock(sqlite_->db.mutex());
    return ReadDocument(sqlite_->db, owner_id);
  } catch (const core::SqliteError& ex) {
    RethrowAsStoreError("get", ex);
  }
}

MemoryEntry MemoryStore::Append(const std::string& owner_id, const std::string& text, const Metadata& context) {
  if (owner_id.empty()) {
    throw std::invalid_argument("MemoryStore::Append requires an owner_id");
  }
  const OwnerGuard serialize(*this, owner_id);

  const Timestamp now = core::FromUnixMillis(core::ToUnixMillis(clock_->Now()));
  std::string content = WithContext(text, context);
  if (kRenderedPrefixSize + content.size() > max_chars_) {
    spdlog::warn("memory entry for owner {} clipped from {} to {} bytes",
                 owner_id,
                 content.size(),
                 max_chars_ - kRenderedPrefixSize);
    content = ClipUtf8(content, max_chars_ - kRenderedPrefixSize);
  }

  std::vector<StoredEntry> entries{};
  try {
    std::lock_guard<std::mutex> lock(sqlite_->db.mutex());
    entries = ReadEntries(sqlite_->db, owner_id);
  } catch (const core::SqliteError& ex) {
    RethrowAsStoreError("append", ex);
  }

  StoredEntry fresh{};
  fresh.seq = entries.empty() ? 1 : entries.back().seq + 1;
  fresh.timestamp = now;
  fresh.content = content;
  fresh.rendered_size = kRenderedPrefixSize + content.size();
  entries.push_back(std::move(fresh));

  std::size_t first = 0;
  while (first + 1 < entries.size() && DocumentSize(entries, first) > max_chars_) {
    ++first;
  }
  if (first > 0) {
    spdlog::debug("memory for owner {} dropped {} oldest entries", owner_id, first);
  }

  std::string document{};
  document.reserve(DocumentSize(entries, first));
  for (std::size_t i = first; i < entries.size(); ++i) {
    if (i > first) {
      document.append("\n\n");
    }
    document.append(RenderEntry(entries[i].timestamp, entries[i].content));
  }

  auto embedding = generator_->Embed(document);

  try {
    std::lock_guard<std::mutex> lock(sqlite_->db.mutex());
    core::Transaction tx(sqlite_->db);

    core::Statement drop(sqlite_->db, "DELETE FROM memory_entries WHERE owner_id = ?1 AND seq < ?2;");
    drop.BindText(1, owner_id);
    drop.BindInt64(2, entries[first].seq);
    (void)drop.Step();

    const auto& added = entries.back();
    core::Statement insert(sqlite_->db,
                           "INSERT INTO memory_entries(owner_id, seq, created_ms, content) VALUES(?1, ?2, ?3, ?4);");
    insert.BindText(1, owner_id);
    insert.BindInt64(2, added.seq);
    insert.BindInt64(3, core::ToUnixMillis(added.timestamp));
    insert.BindText(4, added.content);
    (void)insert.Step();

    core::Statement upsert(sqlite_->db,
                           "INSERT INTO memory_documents(owner_id, text, embedding, updated_ms) VALUES(?1, ?2, ?3, ?4) "
                           "ON CONFLICT(owner_id) DO UPDATE SET text=excluded.text, embedding=excluded.embedding, "
                           "updated_ms=excluded.updated_ms;");
    upsert.BindText(1, owner_id);
    upsert.BindText(2, document);
    upsert.BindBlob(3, core::EncodeEmbedding(embedding));
    upsert.BindInt64(4, core::ToUnixMillis(now));
    (void)upsert.Step();

    tx.Commit();
  } catch (const core::SqliteError& ex) {
    RethrowAsStoreError("append", ex);
  }

  MemoryEntry out{};
  out.owner_id = owner_id;
  out.timestamp = now;
  out.text = std::move(document);
  out.embedding = std::move(embedding);
  return out;
}

std::vector<MemorySnippet> MemoryStore::Recall(const std::string& owner_id,
                                               const EmbeddingVector& query_vector,
                                               int limit,
                                               float min_similarity) const {
  if (limit <= 0) {
    return {};
  }
  const auto document = Get(owner_id);
  if (!document.has_value() || document->text.empty() || document->embedding.empty()) {
    return {};
  }
  const float similarity = DistanceToSimilarity(DistanceMetric::kCosine,
                                                CosineDistance(query_vector, document->embedding));
  if (similarity < min_similarity) {
    return {};
  }
  return {MemorySnippet{document->text, similarity, document->timestamp}};
}

std::vector<MemoryInsight> MemoryStore::ExtractEntries(const std::string& owner_id) const {
  std::vector<StoredEntry> entries{};
  try {
    std::lock_guard<std::mutex> lock(sqlite_->db.mutex());
    entries = ReadEntries(sqlite_->db, owner_id);
  } catch (const core::SqliteError& ex) {
    RethrowAsStoreError("extract", ex);
  }
  std::vector<MemoryInsight> out{};
  out.reserve(entries.size());
  for (auto& entry : entries) {
    out.push_back(MemoryInsight{entry.timestamp, std::move(entry.content)});
  }
  return out;
}

std::string MemoryStore::Summarize(const std::string& owner_id) const {
  const auto document = Get(owner_id);
  if (!document.has_value() || document->text.empty()) {
    return kNoMemoryHistory;
  }
  return document->text;
}

std::size_t MemoryStore::PruneOlderThan(Timestamp cutoff) {
  const auto cutoff_ms = core::ToUnixMillis(cutoff);
  try {
    std::lock_guard<std::mutex> lock(sqlite_->db.mutex());
    core::Transaction tx(sqlite_->db);
    core::Statement entries(sqlite_->db,
                            "DELETE FROM memory_entries WHERE owner_id IN "
                            "(SELECT owner_id FROM memory_documents WHERE updated_ms < ?1);");
    entries.BindInt64(1, cutoff_ms);
    (void)entries.Step();

    core::Statement documents(sqlite_->db, "DELETE FROM memory_documents WHERE updated_ms < ?1;");
    documents.BindInt64(1, cutoff_ms);
    (void)documents.Step();
    const auto removed = static_cast<std::size_t>(sqlite_->db.changes());
    tx.Commit();
    if (removed > 0) {
      spdlog::info("pruned memory for {} owners", removed);
    }
    return removed;
  } catch (const core::SqliteError& ex) {
    RethrowAsStoreError("prune", ex);
  }
}

}  // namespace isidorcpp
