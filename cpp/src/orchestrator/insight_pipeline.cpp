#include "isidorcpp/insight_pipeline.hpp"

#include "isidorcpp/embeddings.hpp"
#include "isidorcpp/errors.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <chrono>
#include <cstdio>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>

namespace isidorcpp {
namespace {

constexpr std::size_t kRememberedResponseChars = 200;

constexpr const char* kSystemPrompt =
    "You are a health insights assistant. Ground every statement in the user data provided below, "
    "avoid medical diagnoses, and keep the tone supportive and factual.";

std::string Spaced(std::string text) {
  std::replace(text.begin(), text.end(), '_', ' ');
  return text;
}

std::string Join(const std::vector<std::string>& items, const char* empty) {
  if (items.empty()) {
    return empty;
  }
  std::string out{};
  for (std::size_t i = 0; i < items.size(); ++i) {
    if (i > 0) {
      out.append(", ");
    }
    out.append(items[i]);
  }
  return out;
}

bool HasParam(const FieldObject& params, const std::string& name) {
  return std::any_of(params.begin(), params.end(), [&name](const auto& entry) { return entry.first == name; });
}

// Context inputs override caller extras of the same name.
void PutParam(FieldObject& params, const std::string& name, FieldValue value) {
  params.erase(std::remove_if(params.begin(), params.end(), [&name](const auto& entry) { return entry.first == name; }),
               params.end());
  params.emplace_back(name, std::move(value));
}

FieldList ToList(const std::vector<std::string>& items) {
  FieldList out{};
  out.reserve(items.size());
  for (const auto& item : items) {
    out.emplace_back(item);
  }
  return out;
}

FieldObject ProtocolFields(const ProtocolSnapshot& protocol) {
  FieldObject out{
      {"id", protocol.id},
      {"name", protocol.name},
      {"description", protocol.description},
      {"target_metrics", ToList(protocol.target_metrics)},
      {"status", protocol.status},
  };
  if (protocol.start_date.has_value()) {
    out.emplace_back("start_date", *protocol.start_date);
  }
  if (protocol.duration_type.has_value()) {
    out.emplace_back("duration_type", *protocol.duration_type);
  }
  if (protocol.duration_days.has_value()) {
    out.emplace_back("duration_days", *protocol.duration_days);
  }
  return out;
}

FieldObject ReviewFields(const ProtocolReview& review) {
  FieldObject effectiveness{};
  for (const auto& [metric, measurements] : review.effectiveness) {
    effectiveness.emplace_back(metric, measurements);
  }
  FieldObject recommendations{};
  for (const auto& [metric, items] : review.recommendations) {
    recommendations.emplace_back(metric, ToList(items));
  }
  return FieldObject{
      {"protocol", ProtocolFields(review.protocol)},
      {"effectiveness", std::move(effectiveness)},
      {"recommendations", std::move(recommendations)},
  };
}

FieldObject CacheParams(const InsightRequest& request, const ContextRequest& resolved) {
  FieldObject params = request.extra_params;
  if (!HasParam(params, "metric_types")) {
    params.emplace_back("metric_types", ToList(resolved.categories));
  }
  if (resolved.min_similarity.has_value()) {
    PutParam(params, "min_similarity", static_cast<double>(*resolved.min_similarity));
  }
  if (resolved.max_per_category.has_value()) {
    PutParam(params, "max_per_category", *resolved.max_per_category);
  }
  if (resolved.metric != DistanceMetric::kCosine) {
    PutParam(params, "metric", DistanceMetricName(resolved.metric));
  }
  if (!resolved.metadata_equals.empty()) {
    FieldObject metadata{};
    for (const auto& [key, value] : resolved.metadata_equals) {
      metadata.emplace_back(key, value);
    }
    PutParam(params, "metadata_equals", std::move(metadata));
  }
  if (!resolved.protocols.empty()) {
    FieldList protocols{};
    for (const auto& protocol : resolved.protocols) {
      protocols.emplace_back(ProtocolFields(protocol));
    }
    PutParam(params, "protocols", std::move(protocols));
  }
  if (request.review.has_value()) {
    PutParam(params, "review", ReviewFields(*request.review));
  }
  return params;
}

bool IsProtocolEndpoint(const std::string& endpoint) {
  return endpoint == kProtocolEffectivenessEndpoint || endpoint == kProtocolAdjustmentsEndpoint;
}

// Validates the request against its endpoint and fills in endpoint defaults.
ContextRequest Resolve(const InsightRequest& request) {
  if (!IsKnownEndpoint(request.endpoint)) {
    throw std::invalid_argument("InsightPipeline: unknown endpoint '" + request.endpoint + "'");
  }
  ContextRequest resolved = request.context;
  if (!IsKnownTimeFrame(resolved.time_frame)) {
    resolved.time_frame = kDefaultTimeFrame;
  }

  if (request.endpoint == kTrendAnalysisEndpoint) {
    if (resolved.categories.size() != 1) {
      throw std::invalid_argument("InsightPipeline: trend_analysis takes exactly one category");
    }
    if (resolved.query.empty()) {
      resolved.query = "Analyze my " + resolved.categories.front() + " trends for the " + resolved.time_frame;
    }
  } else if (IsProtocolEndpoint(request.endpoint)) {
    if (!request.review.has_value()) {
      throw std::invalid_argument("InsightPipeline: " + request.endpoint + " requires a protocol review");
    }
    const auto& protocol = request.review->protocol;
    if (resolved.categories.empty()) {
      resolved.categories = protocol.target_metrics;
    }
    if (resolved.query.empty()) {
      resolved.query = request.endpoint == kProtocolEffectivenessEndpoint
                           ? "Analyze the effectiveness of my " + protocol.name + " protocol"
                           : "Suggest adjustments for my " + protocol.name + " protocol";
    }
  }
  return resolved;
}

std::string FormatMeasurement(const FieldValue& value) {
  return std::visit(
      [&value](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::int64_t> || std::is_same_v<T, double>) {
          std::array<char, 64> buffer{};
          std::snprintf(buffer.data(), buffer.size(), "%.2f", static_cast<double>(v));
          return std::string(buffer.data());
        } else if constexpr (std::is_same_v<T, std::string>) {
          return v;
        } else {
          return EncodeFieldValue(value);
        }
      },
      value.storage());
}

void AppendMeasurements(std::string& out, const std::string& title, const FieldObject& measurements) {
  out.append("- " + title + ":\n");
  for (const auto& [key, value] : measurements) {
    out.append("  - " + key + ": " + FormatMeasurement(value) + "\n");
  }
}

std::string RenderReview(const ProtocolReview& review, bool with_recommendations) {
  const auto& protocol = review.protocol;
  std::string out{};
  out.append("Protocol: " + protocol.name + "\n");
  out.append("Description: " + protocol.description + "\n");
  out.append("Target Metrics: " + Join(protocol.target_metrics, "none") + "\n");
  out.append("Duration Type: " + protocol.duration_type.value_or("unspecified") + "\n");
  out.append("Duration Days: " +
             (protocol.duration_days.has_value() ? std::to_string(*protocol.duration_days) : std::string("Ongoing")) +
             "\n");
  out.append("Start Date: " + protocol.start_date.value_or("not started") + "\n");
  out.append("Status: " + protocol.status + "\n\n");

  out.append("Protocol Effectiveness Data:\n");
  const FieldObject* overall = nullptr;
  for (const auto& [metric, measurements] : review.effectiveness) {
    if (metric == "overall") {
      overall = &measurements;
      continue;
    }
    AppendMeasurements(out, CategoryTitle(metric), measurements);
  }
  if (overall != nullptr) {
    AppendMeasurements(out, "Overall", *overall);
  }

  if (with_recommendations) {
    out.append("\nCurrent Recommendations:\n");
    for (const auto& [metric, items] : review.recommendations) {
      out.append("- " + CategoryTitle(metric) + ":\n");
      for (const auto& item : items) {
        out.append("  - " + item + "\n");
      }
    }
  }
  out.append("\n");
  return out;
}

}  // namespace

bool IsKnownEndpoint(const std::string& endpoint) {
  return endpoint == kHealthInsightEndpoint || endpoint == kTrendAnalysisEndpoint || IsProtocolEndpoint(endpoint);
}

GenerationParams DefaultGenerationParams(const std::string& endpoint) {
  GenerationParams params{};
  if (endpoint == kTrendAnalysisEndpoint) {
    params.temperature = 0.1;
  } else if (endpoint == kProtocolAdjustmentsEndpoint) {
    params.temperature = 0.3;
  }
  return params;
}

InsightPipeline::InsightPipeline(std::shared_ptr<const ContextAssembler> assembler,
                                 std::shared_ptr<TextGenerator> generator,
                                 std::shared_ptr<MemoryStore> memory,
                                 std::shared_ptr<ResponseCache> cache,
                                 std::shared_ptr<const RecordBodyProvider> bodies)
    : assembler_(std::move(assembler)),
      generator_(std::move(generator)),
      memory_(std::move(memory)),
      cache_(std::move(cache)),
      bodies_(std::move(bodies)) {
  if (assembler_ == nullptr || generator_ == nullptr) {
    throw std::invalid_argument("InsightPipeline requires an assembler and a text generator");
  }
}

std::optional<std::string> InsightPipeline::LookupCache(const std::string& owner_id, const CacheKey& key) const {
  try {
    return cache_->Get(owner_id, key);
  } catch (const CacheUnavailable& ex) {
    spdlog::warn("cache lookup degraded to a miss: {}", ex.what());
    return std::nullopt;
  }
}

void InsightPipeline::StoreCache(const std::string& owner_id, const CacheKey& key, const std::string& payload) const {
  const auto ttl = std::chrono::hours(assembler_->config().cache_ttl_hours);
  try {
    (void)cache_->Put(owner_id, key, payload, ttl);
  } catch (const CacheUnavailable& ex) {
    spdlog::warn("response not cached: {}", ex.what());
  }
}

void InsightPipeline::Remember(const InsightRequest& request,
                               const RetrievalContext& context,
                               const std::string& response) const {
  const std::string clipped = ClipUtf8(response, kRememberedResponseChars);
  const std::string period = Spaced(context.time_frame);
  std::string summary{};
  if (request.endpoint == kTrendAnalysisEndpoint) {
    summary = "User requested: Analysis of " + request.context.categories.front() + " trends for " + period +
              "\nData available: " + (context.has_records() ? "Yes" : "No") + "\nKey analysis provided: " + clipped +
              "...";
  } else if (request.endpoint == kProtocolEffectivenessEndpoint) {
    summary = "User requested: Analysis of " + request.review->protocol.name +
              " protocol effectiveness\nProtocol status: " + request.review->protocol.status +
              "\nKey analysis provided: " + clipped + "...";
  } else if (request.endpoint == kProtocolAdjustmentsEndpoint) {
    summary = "User requested: Adjustments for " + request.review->protocol.name +
              " protocol\nProtocol status: " + request.review->protocol.status +
              "\nKey adjustments provided: " + clipped + "...";
  } else {
    summary = "User requested: " + Spaced(request.endpoint) + " for " + period + " for " +
              Join(request.context.categories, "all metrics") + "\nKey insight provided: " + clipped + "...";
  }
  try {
    (void)memory_->Append(request.context.owner_id, summary);
  } catch (const StoreUnavailable& ex) {
    spdlog::warn("interaction not remembered for owner {}: {}", request.context.owner_id, ex.what());
  } catch (const EmbeddingUnavailable& ex) {
    spdlog::warn("interaction not remembered for owner {}: {}", request.context.owner_id, ex.what());
  }
}

std::string InsightPipeline::BuildPrompt(const RetrievalContext& context, const InsightRequest& request) const {
  const std::string period = Spaced(context.time_frame);
  const std::string rendered = RenderContext(context, RenderOptions{bodies_.get(), false});
  std::string prompt = kSystemPrompt;
  prompt.append("\n\n");

  if (request.endpoint == kTrendAnalysisEndpoint) {
    const auto& metric = request.context.categories.front();
    prompt.append(rendered);
    if (context.has_records()) {
      prompt.append("Provide a brief analysis of the trends in the user's " + metric + " data over the " + period +
                    ". Limit your response to 3-5 sentences that highlight the most significant patterns or "
                    "changes. Focus only on what's directly observable in the data.\n");
    } else {
      prompt.append("The user doesn't have any " + metric + " data for the " + period +
                    ". In 1-2 sentences, acknowledge this and suggest what types of " + metric +
                    " data would be helpful to collect.\n");
    }
  } else if (request.endpoint == kProtocolEffectivenessEndpoint) {
    prompt.append(rendered);
    prompt.append(RenderReview(*request.review, false));
    prompt.append(
        "Provide a concise analysis of this protocol's effectiveness. Limit your response to 3-5 sentences that "
        "highlight the most significant results and areas for improvement. Focus only on what's directly "
        "observable in the data.\n");
  } else if (request.endpoint == kProtocolAdjustmentsEndpoint) {
    prompt.append(rendered);
    prompt.append(RenderReview(*request.review, true));
    prompt.append(
        "Provide 2-3 specific, actionable adjustments to improve this protocol based on the effectiveness data. "
        "Be direct and concise, focusing only on the most impactful changes. Each suggestion should be 1-2 "
        "sentences.\n");
  } else if (!context.has_records()) {
    prompt.append("The user has requested health insights for the " + period +
                  ", but there is no health data available.\n\n");
    prompt.append(rendered);
    prompt.append(
        "Provide a brief, 2-3 sentence response acknowledging the lack of data and suggesting what types of "
        "health data would be most valuable to track. Be direct and concise.\n");
  } else {
    prompt.append(rendered);
    if (!context.protocols.empty()) {
      prompt.append("Based on the health data from the " + period +
                    " and the active protocols above, generate a concise health insight in 3-5 sentences. "
                    "Relate the metrics to the protocol goals and name progress or setbacks in the target "
                    "metrics.\n");
    } else {
      prompt.append("Based on the health data from the " + period +
                    ", generate a concise health insight in 3-5 sentences that highlights the most significant "
                    "patterns. Stick to objective observations from the data.\n");
    }
  }

  // Only a caller's own question is quoted; endpoint retrieval queries are not.
  if (!request.context.query.empty()) {
    prompt.append("\nUser question: " + request.context.query + "\n");
  }
  return prompt;
}

InsightResult InsightPipeline::Run(const InsightRequest& request) {
  const auto resolved = Resolve(request);
  const auto& owner_id = resolved.owner_id;
  const auto key =
      ResponseCache::MakeKey(request.endpoint, resolved.time_frame, resolved.query, CacheParams(request, resolved));

  InsightResult result{};
  result.cache_key = key.digest;
  const bool caching = request.use_cache && cache_ != nullptr;
  if (caching) {
    if (auto hit = LookupCache(owner_id, key)) {
      spdlog::debug("cache hit for owner {} endpoint {}", owner_id, request.endpoint);
      result.text = std::move(*hit);
      result.cached = true;
      return result;
    }
  }

  auto context = assembler_->Build(resolved);
  const auto prompt = BuildPrompt(context, request);
  result.text = generator_->Generate(prompt, request.generation.value_or(DefaultGenerationParams(request.endpoint)));

  if (request.update_memory && memory_ != nullptr) {
    Remember(request, context, result.text);
  }
  if (caching) {
    StoreCache(owner_id, key, result.text);
  }
  result.context = std::move(context);
  return result;
}

}  // namespace isidorcpp
