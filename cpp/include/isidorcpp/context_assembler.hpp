#pragma once

#include "isidorcpp/clock.hpp"
#include "isidorcpp/config.hpp"
#include "isidorcpp/embeddings.hpp"
#include "isidorcpp/memory_store.hpp"
#include "isidorcpp/record_text.hpp"
#include "isidorcpp/types.hpp"
#include "isidorcpp/vector_index.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace isidorcpp {

inline constexpr const char* kNoRelevantDataMarker = "## Health Data\nNo relevant health data found for this query.";
inline constexpr const char* kDefaultTimeFrame = "last_day";

// Day span of a named time frame (last_day, last_week, last_month, last_3_months,
// last_6_months, last_year). Unknown names fall back to last_day.
[[nodiscard]] int TimeFrameDays(std::string_view time_frame);
[[nodiscard]] bool IsKnownTimeFrame(std::string_view time_frame);
// [now - days, now], both ends inclusive.
[[nodiscard]] DateRange TimeFrameRange(std::string_view time_frame, Timestamp now);

struct ContextRequest {
  std::string owner_id;
  std::string query;
  // Empty means every category the owner has records in.
  std::vector<std::string> categories;
  std::optional<int> max_per_category;
  std::optional<float> min_similarity;
  std::string time_frame = kDefaultTimeFrame;
  DistanceMetric metric = DistanceMetric::kCosine;
  Metadata metadata_equals;
  std::vector<ProtocolSnapshot> protocols;
};

// Decryption collaborator: plaintext fields of a record body. nullopt when unavailable.
class RecordBodyProvider {
 public:
  virtual ~RecordBodyProvider() = default;
  virtual std::optional<FieldObject> Fields(const IndexedRecord& record) const = 0;
};

// Builds one RetrievalContext per request from the record source, memory and the
// caller's protocol snapshots. Category searches may run on several threads; a failing
// category is recorded in debug info and skipped. EmbeddingUnavailable and
// DimensionMismatch propagate.
class ContextAssembler {
 public:
  ContextAssembler(std::shared_ptr<const EmbeddingGenerator> generator,
                   std::shared_ptr<const RecordSource> records,
                   std::shared_ptr<const MemoryStore> memory,
                   EngineConfig config = {},
                   std::shared_ptr<const Clock> clock = SystemClock::Shared());

  [[nodiscard]] RetrievalContext Build(const ContextRequest& request) const;
  [[nodiscard]] const EngineConfig& config() const { return config_; }

 private:
  std::vector<std::string> ResolveCategories(const ContextRequest& request, RetrievalDebugInfo& debug) const;
  void RecallMemory(const std::string& owner_id, const EmbeddingVector& query_vector, RetrievalContext& context) const;

  std::shared_ptr<const EmbeddingGenerator> generator_;
  std::shared_ptr<const RecordSource> records_;
  std::shared_ptr<const MemoryStore> memory_;
  EngineConfig config_;
  std::shared_ptr<const Clock> clock_;
};

struct RenderOptions {
  // Without a provider, record metadata (minus "source") stands in for the body.
  const RecordBodyProvider* bodies = nullptr;
  bool include_diagnostics = false;
};

// Deterministic prompt text. Sections: protocols, memory, insights, then per-category
// data; kNoRelevantDataMarker replaces the data section when nothing was found.
[[nodiscard]] std::string RenderContext(const RetrievalContext& context, const RenderOptions& options = {});

// "heart_rate" -> "Heart Rate".
[[nodiscard]] std::string CategoryTitle(std::string_view category);

}  // namespace isidorcpp
