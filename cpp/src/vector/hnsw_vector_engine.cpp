#include "isidorcpp/vector_engine.hpp"

#include "isidorcpp/embeddings.hpp"
#include "isidorcpp/errors.hpp"

#include <hnswlib/hnswlib.h>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <stdexcept>
#include <utility>
#include <vector>

namespace isidorcpp {
namespace {

constexpr std::size_t kInitialCapacity = 64;

class KeyFilterFunctor final : public hnswlib::BaseFilterFunctor {
 public:
  explicit KeyFilterFunctor(const HnswVectorEngine::KeyFilter& filter) : filter_(filter) {}

  bool operator()(hnswlib::labeltype label) override { return filter_(static_cast<std::uint64_t>(label)); }

 private:
  const HnswVectorEngine::KeyFilter& filter_;
};

}  // namespace

struct HnswVectorEngine::HnswState {
  std::unique_ptr<hnswlib::SpaceInterface<float>> space;
  std::unique_ptr<hnswlib::HierarchicalNSW<float>> graph;
};

HnswVectorEngine::HnswVectorEngine(int dimensions, DistanceMetric metric, const HnswParams& params)
    : dimensions_(dimensions), metric_(metric), params_(params), hnsw_(std::make_unique<HnswState>()) {
  if (dimensions_ <= 0) {
    throw std::invalid_argument("HnswVectorEngine dimensions must be positive");
  }
  if (params_.m < 2) {
    throw std::invalid_argument("HnswVectorEngine m must be at least 2");
  }
  if (params_.ef_construction <= 0 || params_.ef_search <= 0) {
    throw std::invalid_argument("HnswVectorEngine ef parameters must be positive");
  }

  const auto dims = static_cast<std::size_t>(dimensions_);
  if (metric_ == DistanceMetric::kL2) {
    hnsw_->space = std::make_unique<hnswlib::L2Space>(dims);
  } else {
    // Cosine runs as inner product over unit vectors.
    hnsw_->space = std::make_unique<hnswlib::InnerProductSpace>(dims);
  }
  hnsw_->graph = std::make_unique<hnswlib::HierarchicalNSW<float>>(hnsw_->space.get(),
                                                                   kInitialCapacity,
                                                                   static_cast<std::size_t>(params_.m),
                                                                   static_cast<std::size_t>(params_.ef_construction),
                                                                   static_cast<std::size_t>(params_.seed));
  hnsw_->graph->setEf(static_cast<std::size_t>(params_.ef_search));
}

HnswVectorEngine::~HnswVectorEngine() = default;

std::size_t HnswVectorEngine::tombstone_count() const {
  return hnsw_->graph->getDeletedCount();
}

EmbeddingVector HnswVectorEngine::Prepare(const EmbeddingVector& vector) const {
  if (metric_ == DistanceMetric::kCosine) {
    return Normalize(vector);
  }
  return vector;
}

// InnerProductSpace yields 1 - dot and L2Space yields the squared distance.
float HnswVectorEngine::FromGraphDistance(float distance) const {
  switch (metric_) {
    case DistanceMetric::kCosine:
      return distance;
    case DistanceMetric::kL2:
      return std::sqrt(std::max(distance, 0.0F));
    case DistanceMetric::kInnerProduct:
      return distance - 1.0F;
  }
  return distance;
}

std::vector<std::pair<std::uint64_t, float>> HnswVectorEngine::Search(const EmbeddingVector& vector,
                                                                      int top_k,
                                                                      const KeyFilter& filter) const {
  if (vector.size() != static_cast<std::size_t>(dimensions_)) {
    throw DimensionMismatch("HnswVectorEngine::Search", static_cast<std::size_t>(dimensions_), vector.size());
  }
  if (top_k <= 0 || live_.empty()) {
    return {};
  }

  const auto query = Prepare(vector);
  const auto k = std::min(static_cast<std::size_t>(top_k), live_.size());
  KeyFilterFunctor functor(filter);
  auto heap = hnsw_->graph->searchKnn(query.data(), k, filter ? &functor : nullptr);

  std::vector<std::pair<std::uint64_t, float>> results{};
  results.reserve(heap.size());
  while (!heap.empty()) {
    const auto& [distance, label] = heap.top();
    results.emplace_back(static_cast<std::uint64_t>(label), FromGraphDistance(distance));
    heap.pop();
  }
  std::sort(results.begin(), results.end(), [](const auto& lhs, const auto& rhs) {
    if (lhs.second != rhs.second) {
      return lhs.second < rhs.second;
    }
    return lhs.first < rhs.first;
  });
  return results;
}

void HnswVectorEngine::Add(std::uint64_t key, const EmbeddingVector& vector) {
  if (vector.size() != static_cast<std::size_t>(dimensions_)) {
    throw DimensionMismatch("HnswVectorEngine::Add", static_cast<std::size_t>(dimensions_), vector.size());
  }
  auto& graph = *hnsw_->graph;
  if (graph.getCurrentElementCount() >= graph.getMaxElements()) {
    graph.resizeIndex(graph.getMaxElements() * 2);
  }
  const auto prepared = Prepare(vector);
  // An existing label, tombstoned or not, is updated in place and made live again.
  graph.addPoint(prepared.data(), static_cast<hnswlib::labeltype>(key));
  live_.insert(key);
}

bool HnswVectorEngine::Remove(std::uint64_t key) {
  if (live_.erase(key) == 0) {
    return false;
  }
  hnsw_->graph->markDelete(static_cast<hnswlib::labeltype>(key));
  return true;
}

}  // namespace isidorcpp
