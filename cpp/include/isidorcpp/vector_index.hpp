#pragma once

#include "isidorcpp/config.hpp"
#include "isidorcpp/record_store.hpp"
#include "isidorcpp/types.hpp"
#include "isidorcpp/vector_engine.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace isidorcpp {

// Read side the context assembler depends on.
class RecordSource {
 public:
  virtual ~RecordSource() = default;

  // Every category the owner has at least one record in, sorted.
  virtual std::vector<std::string> Categories(const std::string& owner_id) const = 0;
  virtual std::vector<ScoredRecord> Search(const SearchQuery& query) const = 0;
};

struct VectorIndexConfig {
  int dimensions = 384;
  // Metric the per-partition graphs are built for. Queries in any other metric scan exactly.
  DistanceMetric graph_metric = DistanceMetric::kCosine;
  // Partitions at or below this many records are always scanned exactly.
  std::size_t exact_scan_threshold = 256;
  HnswParams hnsw{};

  static VectorIndexConfig FromEngineConfig(const EngineConfig& config);
};

// Owner-scoped filtered similarity search over IndexedRecords. One partition per
// (owner, category); a partition grows an HNSW graph once it passes the exact-scan
// threshold. With a backing store every mutation is written through before it is applied
// in memory, and category listings and exact scans are answered by typed store queries.
// Readers share a lock; writers are exclusive.
class VectorIndex final : public RecordSource {
 public:
  explicit VectorIndex(VectorIndexConfig config, std::shared_ptr<SqliteRecordStore> store = nullptr);
  ~VectorIndex() override;
  VectorIndex(const VectorIndex&) = delete;
  VectorIndex& operator=(const VectorIndex&) = delete;

  // Replaces the in-memory state with the backing store's contents. Returns the record count.
  std::size_t Reload();

  // Idempotent on id; a record may move between owners or categories.
  void Upsert(const IndexedRecord& record);
  bool Remove(const std::string& id);

  [[nodiscard]] bool Contains(const std::string& id) const;
  [[nodiscard]] std::size_t size() const;
  [[nodiscard]] const VectorIndexConfig& config() const { return config_; }

  std::vector<std::string> Categories(const std::string& owner_id) const override;

  // Ascending by distance, ties by id. Throws std::invalid_argument on an empty owner and
  // DimensionMismatch on a query of the wrong length.
  std::vector<ScoredRecord> Search(const SearchQuery& query) const override;

 private:
  struct Partition {
    std::unordered_map<std::uint64_t, IndexedRecord> records;
    std::unique_ptr<HnswVectorEngine> graph;
  };
  struct Location {
    std::string owner_id;
    std::string category;
    std::uint64_t key = 0;
  };

  void ApplyUpsert(const IndexedRecord& record);
  bool ApplyRemove(const std::string& id);
  void BuildGraph(Partition& partition) const;
  bool UseGraph(const Partition& partition, const SearchQuery& query) const;
  std::vector<ScoredRecord> ScanExact(const std::string& category,
                                      const Partition& partition,
                                      const SearchQuery& query) const;
  std::vector<ScoredRecord> SearchGraph(const std::string& category,
                                        const Partition& partition,
                                        const SearchQuery& query) const;

  VectorIndexConfig config_;
  std::shared_ptr<SqliteRecordStore> store_;
  mutable std::shared_mutex mutex_;
  std::map<std::string, std::map<std::string, Partition>> partitions_;
  std::unordered_map<std::string, Location> locations_;
  std::uint64_t next_key_ = 1;
};

// True when the record passes the date-range and metadata clauses of `filters`.
[[nodiscard]] bool MatchesFilters(const IndexedRecord& record, const SearchFilters& filters);

}  // namespace isidorcpp
