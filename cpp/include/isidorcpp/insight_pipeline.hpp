#pragma once

#include "isidorcpp/config.hpp"
#include "isidorcpp/context_assembler.hpp"
#include "isidorcpp/memory_store.hpp"
#include "isidorcpp/record_text.hpp"
#include "isidorcpp/response_cache.hpp"
#include "isidorcpp/types.hpp"

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace isidorcpp {

struct GenerationParams {
  double temperature = 0.2;
  double top_p = 0.95;
  int top_k = 40;
  int max_output_tokens = 300;
};

// Opaque text-completion collaborator.
class TextGenerator {
 public:
  virtual ~TextGenerator() = default;
  virtual std::string Generate(const std::string& prompt, const GenerationParams& params) = 0;
};

// Protocol under review by the protocol endpoints.
struct ProtocolReview {
  ProtocolSnapshot protocol;
  // Measurements per target metric. An "overall" entry is rendered last.
  std::vector<std::pair<std::string, FieldObject>> effectiveness;
  // Current recommendations per metric; only the adjustments prompt shows them.
  std::vector<std::pair<std::string, std::vector<std::string>>> recommendations;
};

// Endpoints:
//   health_insight          any categories; the query is optional.
//   trend_analysis          exactly one category.
//   protocol_effectiveness  requires `review`; categories default to its target metrics.
//   protocol_adjustments    same as protocol_effectiveness.
// An empty query is replaced by an endpoint-specific retrieval query.
struct InsightRequest {
  ContextRequest context;
  std::string endpoint = kHealthInsightEndpoint;
  bool use_cache = true;
  bool update_memory = true;
  // Folded into the cache key next to every context input that shapes the prompt.
  FieldObject extra_params;
  // DefaultGenerationParams(endpoint) when absent.
  std::optional<GenerationParams> generation;
  std::optional<ProtocolReview> review;
};

[[nodiscard]] bool IsKnownEndpoint(const std::string& endpoint);
[[nodiscard]] GenerationParams DefaultGenerationParams(const std::string& endpoint);

struct InsightResult {
  std::string text;
  bool cached = false;
  std::string cache_key;
  // Absent on a cache hit.
  std::optional<RetrievalContext> context;
};

// cache lookup -> context build -> prompt -> generate -> memory append -> cache put.
// Cache and memory are optional; a cache outage behaves as a miss.
class InsightPipeline {
 public:
  InsightPipeline(std::shared_ptr<const ContextAssembler> assembler,
                  std::shared_ptr<TextGenerator> generator,
                  std::shared_ptr<MemoryStore> memory = nullptr,
                  std::shared_ptr<ResponseCache> cache = nullptr,
                  std::shared_ptr<const RecordBodyProvider> bodies = nullptr);

  // Throws std::invalid_argument on an unknown endpoint or a request the endpoint cannot serve.
  InsightResult Run(const InsightRequest& request);

  [[nodiscard]] std::string BuildPrompt(const RetrievalContext& context, const InsightRequest& request) const;

 private:
  std::optional<std::string> LookupCache(const std::string& owner_id, const CacheKey& key) const;
  void StoreCache(const std::string& owner_id, const CacheKey& key, const std::string& payload) const;
  void Remember(const InsightRequest& request, const RetrievalContext& context, const std::string& response) const;

  std::shared_ptr<const ContextAssembler> assembler_;
  std::shared_ptr<TextGenerator> generator_;
  std::shared_ptr<MemoryStore> memory_;
  std::shared_ptr<ResponseCache> cache_;
  std::shared_ptr<const RecordBodyProvider> bodies_;
};

}  // namespace isidorcpp
