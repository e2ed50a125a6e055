#pragma once

#include <cstddef>

namespace isidorcpp {

struct HnswParams {
  int m = 16;
  int ef_construction = 64;
  int ef_search = 64;
  unsigned long long seed = 0x15D0'12CAULL;
};

struct EngineConfig {
  int embedding_dimensions = 384;
  float similarity_threshold = 0.7F;
  int max_metrics_per_type = 5;
  std::size_t max_memory_chars = 10000;
  int cache_ttl_hours = 24;
  int max_memory_insights = 10;
  int memory_recall_limit = 3;
  float memory_min_similarity = 0.6F;
  std::size_t exact_scan_threshold = 256;
  HnswParams hnsw{};
  int search_concurrency = 1;
};

// Throws std::invalid_argument describing the first offending field.
void ValidateEngineConfig(const EngineConfig& config);

// Overlays ISIDOR_* environment variables on top of `base` and validates the result.
EngineConfig LoadEngineConfigFromEnv(const EngineConfig& base = {});

}  // namespace isidorcpp
