#include "isidorcpp/embeddings.hpp"

#include "isidorcpp/errors.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <exception>
#include <mutex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace isidorcpp {
namespace {

constexpr std::uint64_t kFnvOffset = 1469598103934665603ULL;
constexpr std::uint64_t kFnvPrime = 1099511628211ULL;

std::vector<std::string> Tokenize(std::string_view text) {
  std::vector<std::string> tokens{};
  std::string current{};
  current.reserve(32);

  for (const unsigned char ch : text) {
    if (std::isalnum(ch) != 0) {
      current.push_back(static_cast<char>(std::tolower(ch)));
      continue;
    }
    if (!current.empty()) {
      tokens.push_back(current);
      current.clear();
    }
  }
  if (!current.empty()) {
    tokens.push_back(current);
  }
  return tokens;
}

std::uint64_t HashToken(std::string_view token) {
  std::uint64_t hash = kFnvOffset;
  for (const unsigned char ch : token) {
    hash ^= static_cast<std::uint64_t>(ch);
    hash *= kFnvPrime;
  }
  return hash;
}

void NormalizeL2(EmbeddingVector& v) {
  double sum_sq = 0.0;
  for (const auto x : v) {
    sum_sq += static_cast<double>(x) * static_cast<double>(x);
  }
  if (sum_sq <= 0.0) {
    return;
  }
  const auto inv_norm = 1.0 / std::sqrt(sum_sq);
  for (auto& x : v) {
    x = static_cast<float>(static_cast<double>(x) * inv_norm);
  }
}

void RequireSameLength(const char* where, const EmbeddingVector& lhs, const EmbeddingVector& rhs) {
  if (lhs.size() != rhs.size()) {
    throw DimensionMismatch(where, lhs.size(), rhs.size());
  }
}

double DotDouble(const EmbeddingVector& lhs, const EmbeddingVector& rhs) {
  double dot = 0.0;
  for (std::size_t i = 0; i < lhs.size(); ++i) {
    dot += static_cast<double>(lhs[i]) * static_cast<double>(rhs[i]);
  }
  return dot;
}

}  // namespace

HashingEmbedder::HashingEmbedder(int dimensions, std::size_t memoization_capacity)
    : dimensions_(dimensions), memoization_capacity_(memoization_capacity) {
  if (dimensions_ <= 0) {
    throw std::invalid_argument("HashingEmbedder dimensions must be positive");
  }
}

int HashingEmbedder::dimensions() const {
  return dimensions_;
}

bool HashingEmbedder::normalize() const {
  return true;
}

std::optional<EmbeddingIdentity> HashingEmbedder::identity() const {
  return EmbeddingIdentity{
      .provider = std::string("isidorcpp"),
      .model = std::string("feature-hash-fnv1a"),
      .dimensions = dimensions_,
      .normalized = true,
  };
}

EmbeddingVector HashingEmbedder::Embed(const std::string& text) {
  if (memoization_capacity_ > 0) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto cached = memoized_embeddings_.find(text);
    if (cached != memoized_embeddings_.end()) {
      return cached->second;
    }
  }

  EmbeddingVector embedding(static_cast<std::size_t>(dimensions_), 0.0F);
  for (const auto& token : Tokenize(text)) {
    const auto hash = HashToken(token);
    const auto index = static_cast<std::size_t>(hash % static_cast<std::uint64_t>(dimensions_));
    const float sign = ((hash >> 63U) != 0U) ? -1.0F : 1.0F;
    embedding[index] += sign;
  }

  if (normalize()) {
    NormalizeL2(embedding);
  }

  if (memoization_capacity_ > 0) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (memoized_embeddings_.find(text) == memoized_embeddings_.end()) {
      while (memoized_embeddings_.size() >= memoization_capacity_ && !memoization_order_.empty()) {
        memoized_embeddings_.erase(memoization_order_.front());
        memoization_order_.pop_front();
      }
      memoization_order_.push_back(text);
      memoized_embeddings_[text] = embedding;
    }
  }

  return embedding;
}

std::size_t HashingEmbedder::cache_size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return memoized_embeddings_.size();
}

EmbeddingGenerator::EmbeddingGenerator(std::shared_ptr<EmbeddingProvider> provider)
    : provider_(std::move(provider)) {
  if (provider_ == nullptr) {
    throw EmbeddingUnavailable("EmbeddingGenerator requires an embedding provider");
  }
  dimensions_ = provider_->dimensions();
  if (dimensions_ <= 0) {
    throw EmbeddingUnavailable("EmbeddingGenerator provider reports no dimensions");
  }
}

int EmbeddingGenerator::dimensions() const {
  return dimensions_;
}

EmbeddingVector EmbeddingGenerator::Embed(const std::string& text) const {
  EmbeddingVector embedding{};
  try {
    embedding = provider_->Embed(text);
  } catch (const EngineError&) {
    throw;
  } catch (const std::exception& ex) {
    spdlog::error("embedding provider failed: {}", ex.what());
    throw EmbeddingUnavailable(std::string("embedding provider failed: ") + ex.what());
  }
  if (embedding.size() != static_cast<std::size_t>(dimensions_)) {
    throw DimensionMismatch("EmbeddingGenerator::Embed", static_cast<std::size_t>(dimensions_), embedding.size());
  }
  return embedding;
}

EmbeddingVector EmbeddingGenerator::EmbedStructuredRecord(std::string_view category,
                                                          const FieldObject& fields,
                                                          std::string_view source) const {
  return Embed(CanonicalRecordText(category, fields, source));
}

EmbeddingVector EmbeddingGenerator::EmbedStructuredRecord(std::string_view category,
                                                          const MetricValue& value,
                                                          std::string_view source) const {
  return Embed(CanonicalRecordText(category, value, source));
}

EmbeddingVector Normalize(const EmbeddingVector& v) {
  EmbeddingVector out = v;
  NormalizeL2(out);
  return out;
}

float DotProduct(const EmbeddingVector& lhs, const EmbeddingVector& rhs) {
  RequireSameLength("DotProduct", lhs, rhs);
  return static_cast<float>(DotDouble(lhs, rhs));
}

float L2Distance(const EmbeddingVector& lhs, const EmbeddingVector& rhs) {
  RequireSameLength("L2Distance", lhs, rhs);
  double sum = 0.0;
  for (std::size_t i = 0; i < lhs.size(); ++i) {
    const double delta = static_cast<double>(lhs[i]) - static_cast<double>(rhs[i]);
    sum += delta * delta;
  }
  return static_cast<float>(std::sqrt(sum));
}

float CosineDistance(const EmbeddingVector& lhs, const EmbeddingVector& rhs) {
  RequireSameLength("CosineDistance", lhs, rhs);
  const double lhs_norm = std::sqrt(DotDouble(lhs, lhs));
  const double rhs_norm = std::sqrt(DotDouble(rhs, rhs));
  if (lhs_norm <= 0.0 || rhs_norm <= 0.0) {
    return 1.0F;
  }
  const double cosine = std::clamp(DotDouble(lhs, rhs) / (lhs_norm * rhs_norm), -1.0, 1.0);
  return static_cast<float>(1.0 - cosine);
}

float Distance(DistanceMetric metric, const EmbeddingVector& lhs, const EmbeddingVector& rhs) {
  switch (metric) {
    case DistanceMetric::kCosine:
      return CosineDistance(lhs, rhs);
    case DistanceMetric::kL2:
      return L2Distance(lhs, rhs);
    case DistanceMetric::kInnerProduct:
      return -DotProduct(lhs, rhs);
  }
  throw std::invalid_argument("Distance: unknown metric");
}

float SimilarityToMaxDistance(DistanceMetric metric, float min_similarity) {
  switch (metric) {
    case DistanceMetric::kCosine:
      return 1.0F - min_similarity;
    case DistanceMetric::kL2:
      return std::sqrt(std::max(0.0F, 2.0F - 2.0F * min_similarity));
    case DistanceMetric::kInnerProduct:
      return -min_similarity;
  }
  throw std::invalid_argument("SimilarityToMaxDistance: unknown metric");
}

float DistanceToSimilarity(DistanceMetric metric, float distance) {
  switch (metric) {
    case DistanceMetric::kCosine:
      return 1.0F - distance;
    case DistanceMetric::kL2:
      return 1.0F - (distance * distance) / 2.0F;
    case DistanceMetric::kInnerProduct:
      return -distance;
  }
  throw std::invalid_argument("DistanceToSimilarity: unknown metric");
}

const char* DistanceMetricName(DistanceMetric metric) {
  switch (metric) {
    case DistanceMetric::kCosine:
      return "cosine";
    case DistanceMetric::kL2:
      return "l2";
    case DistanceMetric::kInnerProduct:
      return "inner_product";
  }
  return "unknown";
}

}  // namespace isidorcpp
