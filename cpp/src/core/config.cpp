#include "isidorcpp/config.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstdlib>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>

namespace isidorcpp {
namespace {

std::optional<std::string> ReadEnv(const char* name) {
  const char* value = std::getenv(name);
  if (value == nullptr || *value == '\0') {
    return std::nullopt;
  }
  return std::string(value);
}

long long ParseInteger(const char* name, const std::string& text) {
  errno = 0;
  char* end = nullptr;
  const long long value = std::strtoll(text.c_str(), &end, 10);
  if (errno != 0 || end == text.c_str() || *end != '\0') {
    throw std::invalid_argument(std::string(name) + " is not an integer: " + text);
  }
  return value;
}

int ParseInt(const char* name, const std::string& text) {
  const long long value = ParseInteger(name, text);
  if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
    throw std::invalid_argument(std::string(name) + " is out of range: " + text);
  }
  return static_cast<int>(value);
}

float ParseReal(const char* name, const std::string& text) {
  errno = 0;
  char* end = nullptr;
  const float value = std::strtof(text.c_str(), &end);
  if (errno != 0 || end == text.c_str() || *end != '\0') {
    throw std::invalid_argument(std::string(name) + " is not a number: " + text);
  }
  return value;
}

void RequirePositive(const char* field, long long value) {
  if (value <= 0) {
    throw std::invalid_argument(std::string("EngineConfig.") + field + " must be positive");
  }
}

void RequireUnitInterval(const char* field, float value) {
  if (!(value >= 0.0F && value <= 1.0F)) {
    throw std::invalid_argument(std::string("EngineConfig.") + field + " must be within [0, 1]");
  }
}

}  // namespace

void ValidateEngineConfig(const EngineConfig& config) {
  RequirePositive("embedding_dimensions", config.embedding_dimensions);
  RequireUnitInterval("similarity_threshold", config.similarity_threshold);
  RequirePositive("max_metrics_per_type", config.max_metrics_per_type);
  RequirePositive("max_memory_chars", static_cast<long long>(config.max_memory_chars));
  RequirePositive("cache_ttl_hours", config.cache_ttl_hours);
  RequirePositive("max_memory_insights", config.max_memory_insights);
  RequirePositive("memory_recall_limit", config.memory_recall_limit);
  RequireUnitInterval("memory_min_similarity", config.memory_min_similarity);
  RequirePositive("search_concurrency", config.search_concurrency);
  if (config.hnsw.m < 2) {
    throw std::invalid_argument("EngineConfig.hnsw.m must be at least 2");
  }
  RequirePositive("hnsw.ef_construction", config.hnsw.ef_construction);
  RequirePositive("hnsw.ef_search", config.hnsw.ef_search);
}

EngineConfig LoadEngineConfigFromEnv(const EngineConfig& base) {
  EngineConfig config = base;
  if (const auto v = ReadEnv("ISIDOR_EMBEDDING_DIMENSION")) {
    config.embedding_dimensions = ParseInt("ISIDOR_EMBEDDING_DIMENSION", *v);
  }
  if (const auto v = ReadEnv("ISIDOR_SIMILARITY_THRESHOLD")) {
    config.similarity_threshold = ParseReal("ISIDOR_SIMILARITY_THRESHOLD", *v);
  }
  if (const auto v = ReadEnv("ISIDOR_MAX_METRICS_PER_TYPE")) {
    config.max_metrics_per_type = ParseInt("ISIDOR_MAX_METRICS_PER_TYPE", *v);
  }
  if (const auto v = ReadEnv("ISIDOR_MAX_MEMORY_CHARS")) {
    const auto chars = ParseInteger("ISIDOR_MAX_MEMORY_CHARS", *v);
    RequirePositive("max_memory_chars", chars);
    config.max_memory_chars = static_cast<std::size_t>(chars);
  }
  if (const auto v = ReadEnv("ISIDOR_CACHE_TTL_HOURS")) {
    config.cache_ttl_hours = ParseInt("ISIDOR_CACHE_TTL_HOURS", *v);
  }
  if (const auto v = ReadEnv("ISIDOR_SEARCH_CONCURRENCY")) {
    config.search_concurrency = ParseInt("ISIDOR_SEARCH_CONCURRENCY", *v);
  }
  ValidateEngineConfig(config);
  spdlog::debug("engine config: dimensions={} threshold={} per_type={} memory_chars={} ttl_hours={}",
                config.embedding_dimensions,
                config.similarity_threshold,
                config.max_metrics_per_type,
                config.max_memory_chars,
                config.cache_ttl_hours);
  return config;
}

}  // namespace isidorcpp
