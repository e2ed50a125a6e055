#include "isidorcpp/context_assembler.hpp"

#include "isidorcpp/errors.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <exception>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <unordered_set>
#include <utility>

namespace isidorcpp {
namespace {

struct NamedTimeFrame {
  std::string_view name;
  int days;
};

constexpr std::array<NamedTimeFrame, 6> kTimeFrames = {{
    {"last_day", 1},
    {"last_week", 7},
    {"last_month", 30},
    {"last_3_months", 90},
    {"last_6_months", 180},
    {"last_year", 365},
}};

struct CategoryOutcome {
  std::vector<ScoredRecord> records;
  std::optional<std::string> error;
};

std::string FormatRelevance(float similarity) {
  std::array<char, 32> buffer{};
  std::snprintf(buffer.data(), buffer.size(), "%.2f", static_cast<double>(similarity));
  return std::string(buffer.data());
}

std::string FieldText(const FieldValue& value) {
  if (const auto* text = std::get_if<std::string>(&value.storage())) {
    return *text;
  }
  return EncodeFieldValue(value);
}

FieldObject MetadataFields(const IndexedRecord& record) {
  std::vector<std::pair<std::string, std::string>> sorted{};
  for (const auto& [key, value] : record.metadata) {
    if (key != "source") {
      sorted.emplace_back(key, value);
    }
  }
  std::sort(sorted.begin(), sorted.end());
  FieldObject fields{};
  fields.reserve(sorted.size());
  for (auto& [key, value] : sorted) {
    fields.emplace_back(std::move(key), FieldValue(std::move(value)));
  }
  return fields;
}

void RenderProtocols(const std::vector<ProtocolSnapshot>& protocols, std::string& out) {
  out.append("## Active Protocols\n\n");
  for (const auto& protocol : protocols) {
    out.append("### ");
    out.append(protocol.name.empty() ? "Unnamed Protocol" : protocol.name);
    out.append("\n");
    if (!protocol.description.empty()) {
      out.append("Description: " + protocol.description + "\n");
    }
    if (!protocol.target_metrics.empty()) {
      out.append("Target Metrics: ");
      for (std::size_t i = 0; i < protocol.target_metrics.size(); ++i) {
        if (i > 0) {
          out.append(", ");
        }
        out.append(protocol.target_metrics[i]);
      }
      out.append("\n");
    }
    if (protocol.start_date.has_value()) {
      out.append("Started: " + *protocol.start_date + "\n");
    }
    if (!protocol.status.empty()) {
      out.append("Status: " + protocol.status + "\n");
    }
    if (protocol.duration_type.has_value() && protocol.duration_days.has_value()) {
      out.append("Duration: " + std::to_string(*protocol.duration_days) + " days (" + *protocol.duration_type + ")\n");
    }
    out.append("\n");
  }
}

void RenderMemory(const RetrievalContext& context, std::string& out) {
  out.append("## AI Memory\n\n");
  if (context.recent_memory.has_value()) {
    out.append("### Recent Memory\n");
    out.append(context.recent_memory->text);
    out.append("\n\n");
  }
  if (!context.similar_memories.empty()) {
    out.append("### Relevant Past Interactions\n");
    for (const auto& snippet : context.similar_memories) {
      out.append("- " + snippet.text + "\n");
    }
    out.append("\n");
  }
}

void RenderInsights(const std::vector<MemoryInsight>& insights, std::string& out) {
  out.append("## Key User Insights\n\n");
  for (const auto& insight : insights) {
    if (insight.content.empty()) {
      continue;
    }
    if (insight.timestamp.has_value()) {
      out.append("- [" + FormatUtcTimestamp(*insight.timestamp) + "] " + insight.content + "\n");
    } else {
      out.append("- " + insight.content + "\n");
    }
  }
  out.append("\n");
}

void RenderRecords(const RetrievalContext& context, const RecordBodyProvider* bodies, std::string& out) {
  out.append("## Relevant Health Data\n\n");
  for (const auto& hits : context.categories) {
    out.append("### " + CategoryTitle(hits.category) + " Data\n\n");
    for (const auto& scored : hits.records) {
      const auto& record = scored.record;
      const auto source = record.metadata.find("source");
      out.append("- Date: " + FormatUtcTimestamp(record.timestamp) + "\n");
      out.append("  Source: " + (source != record.metadata.end() ? source->second : std::string("unknown")) + "\n");
      out.append("  Relevance: " + FormatRelevance(DistanceToSimilarity(context.metric, scored.distance)) + "\n");

      std::optional<FieldObject> fields{};
      if (bodies != nullptr) {
        fields = bodies->Fields(record);
      }
      if (!fields.has_value()) {
        fields = MetadataFields(record);
      }
      for (const auto& [key, value] : *fields) {
        out.append("  " + key + ": " + FieldText(value) + "\n");
      }
    }
    out.append("\n");
  }
}

void RenderDiagnostics(const RetrievalDebugInfo& debug, std::string& out) {
  out.append("## Retrieval Diagnostics\n\n");
  out.append("- date_range: " + debug.date_range + "\n");
  for (const auto& category : debug.searched_categories) {
    const auto found = debug.found_per_category.find(category);
    out.append("- metrics_found_" + category + ": " +
               std::to_string(found != debug.found_per_category.end() ? found->second : 0) + "\n");
  }
  for (const auto& [category, error] : debug.category_errors) {
    out.append("- error_" + category + ": " + error + "\n");
  }
  if (debug.memory_error.has_value()) {
    out.append("- memory_error: " + *debug.memory_error + "\n");
  }
  out.append("- active_protocols_count: " + std::to_string(debug.protocol_count) + "\n\n");
}

}  // namespace

int TimeFrameDays(std::string_view time_frame) {
  for (const auto& frame : kTimeFrames) {
    if (frame.name == time_frame) {
      return frame.days;
    }
  }
  return kTimeFrames.front().days;
}

bool IsKnownTimeFrame(std::string_view time_frame) {
  return std::any_of(kTimeFrames.begin(), kTimeFrames.end(), [time_frame](const NamedTimeFrame& frame) {
    return frame.name == time_frame;
  });
}

DateRange TimeFrameRange(std::string_view time_frame, Timestamp now) {
  DateRange range{};
  range.begin = now - std::chrono::hours(24 * TimeFrameDays(time_frame));
  range.end = now;
  return range;
}

std::string CategoryTitle(std::string_view category) {
  std::string out{};
  out.reserve(category.size());
  bool word_start = true;
  for (const unsigned char ch : category) {
    if (ch == '_' || ch == ' ' || ch == '-') {
      out.push_back(' ');
      word_start = true;
      continue;
    }
    out.push_back(static_cast<char>(word_start ? std::toupper(ch) : std::tolower(ch)));
    word_start = false;
  }
  return out;
}

ContextAssembler::ContextAssembler(std::shared_ptr<const EmbeddingGenerator> generator,
                                   std::shared_ptr<const RecordSource> records,
                                   std::shared_ptr<const MemoryStore> memory,
                                   EngineConfig config,
                                   std::shared_ptr<const Clock> clock)
    : generator_(std::move(generator)),
      records_(std::move(records)),
      memory_(std::move(memory)),
      config_(std::move(config)),
      clock_(std::move(clock)) {
  if (generator_ == nullptr) {
    throw EmbeddingUnavailable("ContextAssembler requires an embedding generator");
  }
  if (records_ == nullptr) {
    throw std::invalid_argument("ContextAssembler requires a record source");
  }
  if (clock_ == nullptr) {
    throw std::invalid_argument("ContextAssembler requires a clock");
  }
  ValidateEngineConfig(config_);
}

std::vector<std::string> ContextAssembler::ResolveCategories(const ContextRequest& request,
                                                             RetrievalDebugInfo& debug) const {
  std::vector<std::string> requested = request.categories;
  if (requested.empty()) {
    try {
      requested = records_->Categories(request.owner_id);
    } catch (const StoreUnavailable& ex) {
      spdlog::warn("listing categories for owner {} failed: {}", request.owner_id, ex.what());
      debug.category_errors["*"] = ex.what();
      return {};
    }
  }
  std::vector<std::string> categories{};
  std::unordered_set<std::string> seen{};
  for (auto& category : requested) {
    if (!category.empty() && seen.insert(category).second) {
      categories.push_back(std::move(category));
    }
  }
  return categories;
}

void ContextAssembler::RecallMemory(const std::string& owner_id,
                                    const EmbeddingVector& query_vector,
                                    RetrievalContext& context) const {
  try {
    const auto document = memory_->Get(owner_id);
    if (document.has_value() && !document->text.empty()) {
      MemorySnippet recent{};
      recent.text = document->text;
      recent.last_updated = document->timestamp;
      if (!document->embedding.empty()) {
        recent.similarity = DistanceToSimilarity(DistanceMetric::kCosine,
                                                 CosineDistance(query_vector, document->embedding));
      }
      context.recent_memory = std::move(recent);
    }
    context.similar_memories =
        memory_->Recall(owner_id, query_vector, config_.memory_recall_limit, config_.memory_min_similarity);

    auto entries = memory_->ExtractEntries(owner_id);
    std::reverse(entries.begin(), entries.end());
    if (entries.size() > static_cast<std::size_t>(config_.max_memory_insights)) {
      entries.resize(static_cast<std::size_t>(config_.max_memory_insights));
    }
    context.insights = std::move(entries);
  } catch (const StoreUnavailable& ex) {
    spdlog::warn("memory recall for owner {} failed: {}", owner_id, ex.what());
    context.debug.memory_error = ex.what();
    context.recent_memory.reset();
    context.similar_memories.clear();
    context.insights.clear();
  }
}

RetrievalContext ContextAssembler::Build(const ContextRequest& request) const {
  if (request.owner_id.empty()) {
    throw std::invalid_argument("ContextAssembler::Build requires an owner_id");
  }

  RetrievalContext context{};
  context.query = request.query;
  context.time_frame = IsKnownTimeFrame(request.time_frame) ? request.time_frame : std::string(kDefaultTimeFrame);
  context.metric = request.metric;

  const auto range = TimeFrameRange(context.time_frame, clock_->Now());
  context.debug.date_range = FormatUtcTimestamp(*range.begin) + " to " + FormatUtcTimestamp(*range.end);

  const auto query_vector = generator_->Embed(request.query);
  const auto categories = ResolveCategories(request, context.debug);
  context.debug.searched_categories = categories;

  const float min_similarity = request.min_similarity.value_or(config_.similarity_threshold);
  const int per_category = request.max_per_category.value_or(config_.max_metrics_per_type);

  std::vector<CategoryOutcome> outcomes(categories.size());
  auto search_one = [&](std::size_t index) {
    SearchQuery query{};
    query.owner_id = request.owner_id;
    query.category = categories[index];
    query.query_vector = query_vector;
    query.metric = request.metric;
    query.max_distance = SimilarityToMaxDistance(request.metric, min_similarity);
    query.limit = per_category;
    query.filters.date_range = range;
    query.filters.metadata_equals = request.metadata_equals;
    try {
      outcomes[index].records = records_->Search(query);
    } catch (const DimensionMismatch&) {
      throw;
    } catch (const EmbeddingUnavailable&) {
      throw;
    } catch (const std::exception& ex) {
      spdlog::warn("search for owner {} category {} failed: {}", request.owner_id, categories[index], ex.what());
      outcomes[index].error = ex.what();
    }
  };

  const std::size_t worker_count =
      std::min(categories.size(), static_cast<std::size_t>(std::max(1, config_.search_concurrency)));
  if (worker_count <= 1) {
    for (std::size_t i = 0; i < categories.size(); ++i) {
      search_one(i);
    }
  } else {
    std::atomic<std::size_t> next_index{0};
    std::atomic<bool> stop_workers{false};
    std::exception_ptr first_error{};
    std::mutex error_mutex{};

    auto worker = [&]() {
      while (true) {
        if (stop_workers.load(std::memory_order_acquire)) {
          return;
        }
        const auto index = next_index.fetch_add(1);
        if (index >= categories.size()) {
          return;
        }
        try {
          search_one(index);
        } catch (...) {
          std::lock_guard<std::mutex> error_lock(error_mutex);
          if (first_error == nullptr) {
            first_error = std::current_exception();
          }
          stop_workers.store(true, std::memory_order_release);
          return;
        }
      }
    };

    std::vector<std::thread> workers{};
    workers.reserve(worker_count);
    for (std::size_t i = 0; i < worker_count; ++i) {
      workers.emplace_back(worker);
    }
    for (auto& thread : workers) {
      thread.join();
    }
    if (first_error != nullptr) {
      std::rethrow_exception(first_error);
    }
  }

  for (std::size_t i = 0; i < categories.size(); ++i) {
    auto& outcome = outcomes[i];
    context.debug.found_per_category[categories[i]] = outcome.records.size();
    if (outcome.error.has_value()) {
      context.debug.category_errors[categories[i]] = *outcome.error;
      continue;
    }
    if (!outcome.records.empty()) {
      context.categories.push_back(CategoryHits{categories[i], std::move(outcome.records)});
    }
  }

  if (memory_ != nullptr) {
    RecallMemory(request.owner_id, query_vector, context);
  }

  context.protocols = request.protocols;
  context.debug.protocol_count = context.protocols.size();
  return context;
}

std::string RenderContext(const RetrievalContext& context, const RenderOptions& options) {
  std::string out = "# User Context\n\n";
  if (!context.protocols.empty()) {
    RenderProtocols(context.protocols, out);
  }
  if (context.has_memory()) {
    RenderMemory(context, out);
  }
  if (!context.insights.empty()) {
    RenderInsights(context.insights, out);
  }
  if (context.has_records()) {
    RenderRecords(context, options.bodies, out);
  } else {
    out.append(kNoRelevantDataMarker);
    out.append("\n\n");
  }
  if (options.include_diagnostics) {
    RenderDiagnostics(context.debug, out);
  }
  return out;
}

}  // namespace isidorcpp
