#pragma once

#include "isidorcpp/config.hpp"
#include "isidorcpp/types.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <unordered_set>
#include <utility>
#include <vector>

namespace isidorcpp {

// Approximate top-k over keyed vectors, backed by an hnswlib graph. Results are
// (key, distance) ascending by distance, ties broken by lower key. Distances are in the
// engine's metric: cosine distance, Euclidean distance or negated inner product.
// Add is an upsert on key; Remove tombstones the key and a later Add revives it.
// Concurrent searches are safe; callers serialise writers against readers.
class HnswVectorEngine {
 public:
  // Returns true for keys a search may return.
  using KeyFilter = std::function<bool(std::uint64_t)>;

  HnswVectorEngine(int dimensions, DistanceMetric metric, const HnswParams& params = {});
  ~HnswVectorEngine();
  HnswVectorEngine(const HnswVectorEngine&) = delete;
  HnswVectorEngine& operator=(const HnswVectorEngine&) = delete;

  [[nodiscard]] int dimensions() const { return dimensions_; }
  [[nodiscard]] DistanceMetric metric() const { return metric_; }
  [[nodiscard]] std::size_t size() const { return live_.size(); }
  [[nodiscard]] std::size_t tombstone_count() const;

  // With a filter the graph walk skips rejected keys, so up to top_k accepted keys come back.
  std::vector<std::pair<std::uint64_t, float>> Search(const EmbeddingVector& vector,
                                                      int top_k,
                                                      const KeyFilter& filter = {}) const;
  void Add(std::uint64_t key, const EmbeddingVector& vector);
  bool Remove(std::uint64_t key);

 private:
  struct HnswState;

  EmbeddingVector Prepare(const EmbeddingVector& vector) const;
  float FromGraphDistance(float distance) const;

  int dimensions_;
  DistanceMetric metric_;
  HnswParams params_;
  std::unique_ptr<HnswState> hnsw_;
  std::unordered_set<std::uint64_t> live_;
};

}  // namespace isidorcpp
