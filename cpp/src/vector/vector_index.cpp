#include "isidorcpp/vector_index.hpp"

#include "isidorcpp/embeddings.hpp"
#include "isidorcpp/errors.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <mutex>
#include <stdexcept>
#include <utility>

namespace isidorcpp {
namespace {

void SortAndTrim(std::vector<ScoredRecord>& hits, std::size_t limit) {
  std::sort(hits.begin(), hits.end(), [](const ScoredRecord& lhs, const ScoredRecord& rhs) {
    if (lhs.distance != rhs.distance) {
      return lhs.distance < rhs.distance;
    }
    return lhs.record.id < rhs.record.id;
  });
  if (hits.size() > limit) {
    hits.resize(limit);
  }
}

bool WithinDistance(const SearchQuery& query, float distance) {
  return !query.max_distance.has_value() || distance <= *query.max_distance;
}

bool HasFilters(const SearchFilters& filters) {
  return filters.date_range.has_value() || !filters.metadata_equals.empty();
}

RecordQuery PartitionQuery(const SearchQuery& query, const std::string& category) {
  auto select = RecordQuery::ForOwner(query.owner_id).Category(category);
  if (query.filters.date_range.has_value()) {
    select.Within(*query.filters.date_range);
  }
  for (const auto& [key, value] : query.filters.metadata_equals) {
    select.MetadataEquals(key, value);
  }
  return select;
}

}  // namespace

bool MatchesFilters(const IndexedRecord& record, const SearchFilters& filters) {
  if (filters.date_range.has_value()) {
    const auto& range = *filters.date_range;
    if (range.begin.has_value() && record.timestamp < *range.begin) {
      return false;
    }
    if (range.end.has_value() && record.timestamp > *range.end) {
      return false;
    }
  }
  for (const auto& [key, expected] : filters.metadata_equals) {
    const auto it = record.metadata.find(key);
    if (it == record.metadata.end() || it->second != expected) {
      return false;
    }
  }
  return true;
}

VectorIndexConfig VectorIndexConfig::FromEngineConfig(const EngineConfig& config) {
  VectorIndexConfig out{};
  out.dimensions = config.embedding_dimensions;
  out.exact_scan_threshold = config.exact_scan_threshold;
  out.hnsw = config.hnsw;
  return out;
}

VectorIndex::VectorIndex(VectorIndexConfig config, std::shared_ptr<SqliteRecordStore> store)
    : config_(std::move(config)), store_(std::move(store)) {
  if (config_.dimensions <= 0) {
    throw std::invalid_argument("VectorIndex dimensions must be positive");
  }
}

VectorIndex::~VectorIndex() = default;

std::size_t VectorIndex::Reload() {
  if (store_ == nullptr) {
    throw std::logic_error("VectorIndex::Reload requires a backing store");
  }
  const auto records = store_->LoadAll();

  std::unique_lock<std::shared_mutex> lock(mutex_);
  partitions_.clear();
  locations_.clear();
  for (const auto& record : records) {
    if (record.embedding.size() != static_cast<std::size_t>(config_.dimensions)) {
      spdlog::warn("skipping record {}: embedding has {} dimensions, index expects {}",
                   record.id,
                   record.embedding.size(),
                   config_.dimensions);
      continue;
    }
    ApplyUpsert(record);
  }
  spdlog::info("vector index reloaded {} records across {} owners", locations_.size(), partitions_.size());
  return locations_.size();
}

void VectorIndex::Upsert(const IndexedRecord& record) {
  if (record.id.empty() || record.owner_id.empty() || record.category.empty()) {
    throw std::invalid_argument("VectorIndex::Upsert requires id, owner_id and category");
  }
  if (record.embedding.size() != static_cast<std::size_t>(config_.dimensions)) {
    throw DimensionMismatch("VectorIndex::Upsert", static_cast<std::size_t>(config_.dimensions), record.embedding.size());
  }
  if (store_ != nullptr) {
    store_->Upsert(record);
  }
  std::unique_lock<std::shared_mutex> lock(mutex_);
  ApplyUpsert(record);
}

bool VectorIndex::Remove(const std::string& id) {
  if (store_ != nullptr) {
    (void)store_->Remove(id);
  }
  std::unique_lock<std::shared_mutex> lock(mutex_);
  return ApplyRemove(id);
}

bool VectorIndex::Contains(const std::string& id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return locations_.find(id) != locations_.end();
}

std::size_t VectorIndex::size() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return locations_.size();
}

void VectorIndex::ApplyUpsert(const IndexedRecord& record) {
  const auto existing = locations_.find(record.id);
  if (existing != locations_.end() &&
      (existing->second.owner_id != record.owner_id || existing->second.category != record.category)) {
    (void)ApplyRemove(record.id);
  }

  auto& partition = partitions_[record.owner_id][record.category];
  std::uint64_t key = 0;
  const auto located = locations_.find(record.id);
  if (located != locations_.end()) {
    key = located->second.key;
  } else {
    key = next_key_++;
    locations_.emplace(record.id, Location{record.owner_id, record.category, key});
  }
  partition.records[key] = record;

  if (partition.graph != nullptr) {
    partition.graph->Add(key, record.embedding);
  } else if (partition.records.size() > config_.exact_scan_threshold) {
    BuildGraph(partition);
  }
}

bool VectorIndex::ApplyRemove(const std::string& id) {
  const auto located = locations_.find(id);
  if (located == locations_.end()) {
    return false;
  }
  const Location location = located->second;
  locations_.erase(located);

  auto owner = partitions_.find(location.owner_id);
  if (owner == partitions_.end()) {
    return true;
  }
  auto partition = owner->second.find(location.category);
  if (partition != owner->second.end()) {
    partition->second.records.erase(location.key);
    if (partition->second.graph != nullptr) {
      (void)partition->second.graph->Remove(location.key);
    }
    if (partition->second.records.empty()) {
      owner->second.erase(partition);
    } else if (partition->second.graph != nullptr &&
               partition->second.graph->tombstone_count() > partition->second.records.size()) {
      BuildGraph(partition->second);
    }
  }
  if (owner->second.empty()) {
    partitions_.erase(owner);
  }
  return true;
}

void VectorIndex::BuildGraph(Partition& partition) const {
  auto graph = std::make_unique<HnswVectorEngine>(config_.dimensions, config_.graph_metric, config_.hnsw);
  std::vector<std::uint64_t> keys{};
  keys.reserve(partition.records.size());
  for (const auto& [key, record] : partition.records) {
    keys.push_back(key);
  }
  // Insertion order shapes the graph; keep it reproducible.
  std::sort(keys.begin(), keys.end());
  for (const auto key : keys) {
    graph->Add(key, partition.records.at(key).embedding);
  }
  spdlog::debug("built hnsw graph over {} records", keys.size());
  partition.graph = std::move(graph);
}

std::vector<std::string> VectorIndex::Categories(const std::string& owner_id) const {
  if (store_ != nullptr) {
    return store_->DistinctCategories(owner_id);
  }
  std::shared_lock<std::shared_mutex> lock(mutex_);
  std::vector<std::string> categories{};
  const auto owner = partitions_.find(owner_id);
  if (owner == partitions_.end()) {
    return categories;
  }
  categories.reserve(owner->second.size());
  for (const auto& [category, partition] : owner->second) {
    categories.push_back(category);
  }
  return categories;
}

std::vector<ScoredRecord> VectorIndex::Search(const SearchQuery& query) const {
  if (query.owner_id.empty()) {
    throw std::invalid_argument("VectorIndex::Search requires an owner_id");
  }
  if (query.query_vector.size() != static_cast<std::size_t>(config_.dimensions)) {
    throw DimensionMismatch("VectorIndex::Search", static_cast<std::size_t>(config_.dimensions), query.query_vector.size());
  }
  if (query.limit <= 0) {
    return {};
  }

  std::shared_lock<std::shared_mutex> lock(mutex_);
  const auto owner = partitions_.find(query.owner_id);
  if (owner == partitions_.end()) {
    return {};
  }

  std::vector<std::pair<const std::string*, const Partition*>> targets{};
  if (query.category.has_value()) {
    const auto partition = owner->second.find(*query.category);
    if (partition == owner->second.end()) {
      return {};
    }
    targets.emplace_back(&partition->first, &partition->second);
  } else {
    for (const auto& [category, partition] : owner->second) {
      targets.emplace_back(&category, &partition);
    }
  }

  std::vector<ScoredRecord> hits{};
  for (const auto& [category, partition] : targets) {
    auto partial = UseGraph(*partition, query) ? SearchGraph(*category, *partition, query)
                                               : ScanExact(*category, *partition, query);
    hits.insert(hits.end(), std::make_move_iterator(partial.begin()), std::make_move_iterator(partial.end()));
  }
  SortAndTrim(hits, static_cast<std::size_t>(query.limit));
  return hits;
}

bool VectorIndex::UseGraph(const Partition& partition, const SearchQuery& query) const {
  return partition.graph != nullptr && query.metric == config_.graph_metric &&
         partition.records.size() > config_.exact_scan_threshold;
}

// With a backing store the filters run in SQLite and only surviving rows are scored.
std::vector<ScoredRecord> VectorIndex::ScanExact(const std::string& category,
                                                 const Partition& partition,
                                                 const SearchQuery& query) const {
  std::vector<ScoredRecord> hits{};
  const auto score = [&](const IndexedRecord& record) {
    if (record.embedding.size() != query.query_vector.size()) {
      return;
    }
    const float distance = Distance(query.metric, query.query_vector, record.embedding);
    if (WithinDistance(query, distance)) {
      hits.push_back(ScoredRecord{record, distance});
    }
  };

  if (store_ != nullptr) {
    for (const auto& record : store_->Query(PartitionQuery(query, category))) {
      score(record);
    }
  } else {
    for (const auto& [key, record] : partition.records) {
      if (MatchesFilters(record, query.filters)) {
        score(record);
      }
    }
  }
  SortAndTrim(hits, static_cast<std::size_t>(query.limit));
  return hits;
}

// Filters run inside the graph walk. Falls back to an exact scan when the graph still
// comes up short and the distance cutoff was not what ended the result.
std::vector<ScoredRecord> VectorIndex::SearchGraph(const std::string& category,
                                                   const Partition& partition,
                                                   const SearchQuery& query) const {
  const auto limit = static_cast<std::size_t>(query.limit);
  HnswVectorEngine::KeyFilter filter{};
  if (HasFilters(query.filters)) {
    filter = [&](std::uint64_t key) {
      const auto it = partition.records.find(key);
      return it != partition.records.end() && MatchesFilters(it->second, query.filters);
    };
  }

  const auto candidates = partition.graph->Search(query.query_vector, query.limit, filter);
  std::vector<ScoredRecord> hits{};
  bool cut_by_distance = false;
  for (const auto& [key, graph_distance] : candidates) {
    const auto& record = partition.records.at(key);
    const float distance = Distance(query.metric, query.query_vector, record.embedding);
    if (!WithinDistance(query, distance)) {
      cut_by_distance = true;
      continue;
    }
    hits.push_back(ScoredRecord{record, distance});
  }
  if (hits.size() >= limit || cut_by_distance) {
    SortAndTrim(hits, limit);
    return hits;
  }
  spdlog::debug("hnsw search for owner {} came up short after filtering; scanning {} records exactly",
                query.owner_id,
                partition.records.size());
  return ScanExact(category, partition, query);
}

}  // namespace isidorcpp
