#pragma once

#include "isidorcpp/clock.hpp"
#include "isidorcpp/record_text.hpp"
#include "isidorcpp/types.hpp"

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>

namespace isidorcpp {

inline constexpr const char* kHealthInsightEndpoint = "health_insight";
inline constexpr const char* kTrendAnalysisEndpoint = "trend_analysis";
inline constexpr const char* kProtocolEffectivenessEndpoint = "protocol_effectiveness";
inline constexpr const char* kProtocolAdjustmentsEndpoint = "protocol_adjustments";

// TTL-bound store of generated responses. Rows are only ever inserted, then force-expired
// or purged; a payload is returned exactly as it was put. Failures surface as
// CacheUnavailable.
class ResponseCache {
 public:
  explicit ResponseCache(const std::string& path, std::shared_ptr<const Clock> clock = SystemClock::Shared());
  ~ResponseCache();
  ResponseCache(const ResponseCache&) = delete;
  ResponseCache& operator=(const ResponseCache&) = delete;

  // Deterministic key. List-valued top-level params are sorted by their encoding and object
  // keys are sorted, so client-side ordering never changes the digest.
  static CacheKey MakeKey(const std::string& endpoint,
                          const std::string& time_frame,
                          const std::string& query,
                          const FieldObject& extra_params = {});

  // Newest fresh payload; nullopt when never cached or expired.
  [[nodiscard]] std::optional<std::string> Get(const std::string& owner_id, const CacheKey& key) const;
  CacheEntry Put(const std::string& owner_id, const CacheKey& key, const std::string& payload, std::chrono::seconds ttl);

  // Force-expires the owner's fresh rows in one statement. Returns how many.
  std::size_t Invalidate(const std::string& owner_id,
                         const std::optional<std::string>& endpoint = std::nullopt,
                         const std::optional<std::string>& time_frame = std::nullopt);

  // Deletes rows that are no longer fresh. Returns how many.
  std::size_t PurgeExpired();

 private:
  struct SQLiteState;

  std::unique_ptr<SQLiteState> sqlite_;
  std::shared_ptr<const Clock> clock_;
};

}  // namespace isidorcpp
