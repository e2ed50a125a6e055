#pragma once

#include "isidorcpp/record_text.hpp"
#include "isidorcpp/types.hpp"

#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace isidorcpp {

struct EmbeddingIdentity {
  std::optional<std::string> provider;
  std::optional<std::string> model;
  std::optional<int> dimensions;
  std::optional<bool> normalized;
};

// Model backend. Implementations throw EmbeddingUnavailable when the model cannot be used.
class EmbeddingProvider {
 public:
  virtual ~EmbeddingProvider() = default;

  virtual int dimensions() const = 0;
  virtual bool normalize() const = 0;
  virtual std::optional<EmbeddingIdentity> identity() const = 0;
  virtual EmbeddingVector Embed(const std::string& text) = 0;
};

// Deterministic feature-hashing embedder: lower-cased alphanumeric tokens are hashed
// (FNV-1a) into signed buckets. Construction is free; safe for concurrent Embed calls.
class HashingEmbedder final : public EmbeddingProvider {
 public:
  explicit HashingEmbedder(int dimensions = 384, std::size_t memoization_capacity = 4096);

  int dimensions() const override;
  bool normalize() const override;
  std::optional<EmbeddingIdentity> identity() const override;
  EmbeddingVector Embed(const std::string& text) override;
  [[nodiscard]] std::size_t cache_size() const;

 private:
  int dimensions_ = 384;
  std::size_t memoization_capacity_ = 0;
  std::unordered_map<std::string, EmbeddingVector> memoized_embeddings_{};
  std::deque<std::string> memoization_order_{};
  mutable std::mutex mutex_{};
};

// Front door for every embedding the engine produces. Constructed once per process and
// injected; the provider's model load cost is paid by whoever builds the provider.
class EmbeddingGenerator {
 public:
  explicit EmbeddingGenerator(std::shared_ptr<EmbeddingProvider> provider);

  [[nodiscard]] int dimensions() const;
  [[nodiscard]] EmbeddingVector Embed(const std::string& text) const;
  [[nodiscard]] EmbeddingVector EmbedStructuredRecord(std::string_view category,
                                                      const FieldObject& fields,
                                                      std::string_view source) const;
  [[nodiscard]] EmbeddingVector EmbedStructuredRecord(std::string_view category,
                                                      const MetricValue& value,
                                                      std::string_view source) const;

 private:
  std::shared_ptr<EmbeddingProvider> provider_;
  int dimensions_ = 0;
};

// Unit L2 norm; a zero vector is returned unchanged.
[[nodiscard]] EmbeddingVector Normalize(const EmbeddingVector& v);

// All distance helpers throw DimensionMismatch on unequal lengths.
[[nodiscard]] float DotProduct(const EmbeddingVector& lhs, const EmbeddingVector& rhs);
[[nodiscard]] float L2Distance(const EmbeddingVector& lhs, const EmbeddingVector& rhs);
// 1 - cosine similarity; a zero-norm operand is treated as orthogonal (distance 1).
[[nodiscard]] float CosineDistance(const EmbeddingVector& lhs, const EmbeddingVector& rhs);
// Lower is closer for every metric; inner product uses the negated dot product.
[[nodiscard]] float Distance(DistanceMetric metric, const EmbeddingVector& lhs, const EmbeddingVector& rhs);

// Converts a minimum similarity into the matching distance cutoff. The L2 form assumes unit vectors.
[[nodiscard]] float SimilarityToMaxDistance(DistanceMetric metric, float min_similarity);
[[nodiscard]] float DistanceToSimilarity(DistanceMetric metric, float distance);

[[nodiscard]] const char* DistanceMetricName(DistanceMetric metric);

}  // namespace isidorcpp
