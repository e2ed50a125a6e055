#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace isidorcpp {

using Metadata = std::unordered_map<std::string, std::string>;
using EmbeddingVector = std::vector<float>;
using Timestamp = std::chrono::system_clock::time_point;

enum class DistanceMetric {
  kCosine,
  kL2,
  kInnerProduct,
};

struct IndexedRecord {
  std::string id;
  std::string owner_id;
  std::string category;
  Timestamp timestamp{};
  Metadata metadata;
  EmbeddingVector embedding;
};

struct ScoredRecord {
  IndexedRecord record;
  float distance = 0.0F;
};

// Both bounds are inclusive; an absent bound is open.
struct DateRange {
  std::optional<Timestamp> begin;
  std::optional<Timestamp> end;
};

struct SearchFilters {
  std::optional<DateRange> date_range;
  Metadata metadata_equals;
};

struct SearchQuery {
  std::string owner_id;
  std::optional<std::string> category;
  EmbeddingVector query_vector;
  DistanceMetric metric = DistanceMetric::kCosine;
  std::optional<float> max_distance;
  int limit = 10;
  SearchFilters filters;
};

// Consolidated per-owner memory document.
struct MemoryEntry {
  std::string owner_id;
  Timestamp timestamp{};
  std::string text;
  EmbeddingVector embedding;
};

struct MemoryInsight {
  std::optional<Timestamp> timestamp;
  std::string content;
};

struct MemorySnippet {
  std::string text;
  float similarity = 0.0F;
  Timestamp last_updated{};
};

struct CacheKey {
  std::string endpoint;
  std::string time_frame;
  std::string digest;
};

struct CacheEntry {
  std::string key;
  std::string owner_id;
  std::string endpoint;
  std::string time_frame;
  std::string payload;
  Timestamp created_at{};
  Timestamp expires_at{};
};

struct ProtocolSnapshot {
  std::string id;
  std::string name;
  std::string description;
  std::vector<std::string> target_metrics;
  std::optional<std::string> start_date;
  std::string status;
  std::optional<std::string> duration_type;
  std::optional<int> duration_days;
};

struct CategoryHits {
  std::string category;
  std::vector<ScoredRecord> records;
};

struct RetrievalDebugInfo {
  std::string date_range;
  std::vector<std::string> searched_categories;
  std::map<std::string, std::size_t> found_per_category;
  std::map<std::string, std::string> category_errors;
  std::optional<std::string> memory_error;
  std::size_t protocol_count = 0;
};

struct RetrievalContext {
  std::string query;
  std::string time_frame;
  DistanceMetric metric = DistanceMetric::kCosine;
  std::vector<ProtocolSnapshot> protocols;
  std::optional<MemorySnippet> recent_memory;
  std::vector<MemorySnippet> similar_memories;
  std::vector<MemoryInsight> insights;
  std::vector<CategoryHits> categories;
  RetrievalDebugInfo debug;

  [[nodiscard]] bool has_records() const { return !categories.empty(); }
  [[nodiscard]] bool has_memory() const { return recent_memory.has_value() || !similar_memories.empty(); }
};

}  // namespace isidorcpp
