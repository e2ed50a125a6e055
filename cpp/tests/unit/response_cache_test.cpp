#include "isidorcpp/errors.hpp"
#include "isidorcpp/response_cache.hpp"

#include "../test_logger.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>

namespace {

void Require(bool condition, const std::string& message) {
  if (!condition) {
    throw std::runtime_error(message);
  }
}

class ManualClock final : public isidorcpp::Clock {
 public:
  isidorcpp::Timestamp Now() const override { return now_; }
  void Advance(std::chrono::seconds delta) { now_ += delta; }

 private:
  isidorcpp::Timestamp now_{std::chrono::seconds(1700000000)};
};

isidorcpp::FieldObject MetricTypes(isidorcpp::FieldList types) {
  return isidorcpp::FieldObject{{"metric_types", isidorcpp::FieldValue(std::move(types))}};
}

void ScenarioKeyCanonicalization() {
  isidorcpp::tests::Log("scenario: key canonicalization");
  using isidorcpp::ResponseCache;
  const auto ab = ResponseCache::MakeKey(isidorcpp::kHealthInsightEndpoint, "last_week", "how did I sleep",
                                         MetricTypes({"a", "b"}));
  const auto ba = ResponseCache::MakeKey(isidorcpp::kHealthInsightEndpoint, "last_week", "how did I sleep",
                                         MetricTypes({"b", "a"}));
  isidorcpp::tests::LogKV("digest", ab.digest);
  Require(ab.digest == ba.digest, "list order must not change the key");
  Require(ab.digest.size() == 64, "digest should be hex sha256");
  Require(ab.endpoint == isidorcpp::kHealthInsightEndpoint && ab.time_frame == "last_week", "key echo mismatch");

  const isidorcpp::FieldObject forward = {{"x", 1}, {"y", "two"}};
  const isidorcpp::FieldObject backward = {{"y", "two"}, {"x", 1}};
  Require(ResponseCache::MakeKey("trend_analysis", "last_day", "", forward).digest ==
              ResponseCache::MakeKey("trend_analysis", "last_day", "", backward).digest,
          "param key order must not change the key");

  const auto other_frame = ResponseCache::MakeKey(isidorcpp::kHealthInsightEndpoint, "last_month", "how did I sleep",
                                                  MetricTypes({"a", "b"}));
  const auto other_query = ResponseCache::MakeKey(isidorcpp::kHealthInsightEndpoint, "last_week", "how did I run",
                                                  MetricTypes({"a", "b"}));
  const auto other_types = ResponseCache::MakeKey(isidorcpp::kHealthInsightEndpoint, "last_week", "how did I sleep",
                                                  MetricTypes({"a"}));
  Require(ab.digest != other_frame.digest, "time frame must be part of the key");
  Require(ab.digest != other_query.digest, "query must be part of the key");
  Require(ab.digest != other_types.digest, "params must be part of the key");
}

void ScenarioTtl() {
  isidorcpp::tests::Log("scenario: ttl");
  auto clock = std::make_shared<ManualClock>();
  isidorcpp::ResponseCache cache(":memory:", clock);
  const auto key = isidorcpp::ResponseCache::MakeKey(isidorcpp::kHealthInsightEndpoint, "last_day", "q");

  Require(!cache.Get("u1", key).has_value(), "empty cache must miss");
  const auto entry = cache.Put("u1", key, "payload \xE2\x9C\x93 verbatim", std::chrono::hours(1));
  Require(entry.key == key.digest && entry.owner_id == "u1", "stored entry echo mismatch");
  Require(entry.expires_at - entry.created_at == std::chrono::hours(1), "expiry must be created_at + ttl");

  const auto hit = cache.Get("u1", key);
  Require(hit.has_value() && *hit == "payload \xE2\x9C\x93 verbatim", "payload must be returned verbatim");
  Require(!cache.Get("u2", key).has_value(), "another owner must not see the entry");

  clock->Advance(std::chrono::minutes(30));
  (void)cache.Put("u1", key, "newer", std::chrono::hours(1));
  Require(cache.Get("u1", key) == std::optional<std::string>("newer"), "newest fresh row must win");

  clock->Advance(std::chrono::hours(2));
  Require(!cache.Get("u1", key).has_value(), "expired entries must miss");

  bool threw = false;
  try {
    (void)cache.Put("u1", key, "x", std::chrono::seconds(0));
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  Require(threw, "a non-positive ttl must be rejected");
}

void ScenarioInvalidateAndPurge() {
  isidorcpp::tests::Log("scenario: invalidate and purge");
  auto clock = std::make_shared<ManualClock>();
  isidorcpp::ResponseCache cache(":memory:", clock);
  const auto insight_day = isidorcpp::ResponseCache::MakeKey(isidorcpp::kHealthInsightEndpoint, "last_day", "q");
  const auto insight_week = isidorcpp::ResponseCache::MakeKey(isidorcpp::kHealthInsightEndpoint, "last_week", "q");
  const auto trend_week = isidorcpp::ResponseCache::MakeKey(isidorcpp::kTrendAnalysisEndpoint, "last_week", "q");
  for (const auto* key : {&insight_day, &insight_week, &trend_week}) {
    (void)cache.Put("u1", *key, "body", std::chrono::hours(24));
  }
  (void)cache.Put("u2", insight_day, "body", std::chrono::hours(24));

  Require(cache.Invalidate("u1", std::string(isidorcpp::kHealthInsightEndpoint), std::string("last_week")) == 1,
          "endpoint and time frame filters should select one row");
  Require(!cache.Get("u1", insight_week).has_value(), "invalidated entry must miss");
  Require(cache.Get("u1", insight_day).has_value(), "unrelated entry must survive");

  Require(cache.Invalidate("u1", std::string(isidorcpp::kTrendAnalysisEndpoint)) == 1, "endpoint filter mismatch");
  Require(cache.Invalidate("u1") == 1, "owner-wide invalidate should hit the remaining fresh row");
  Require(cache.Invalidate("u1") == 0, "a second owner-wide invalidate has nothing left");
  Require(cache.Get("u2", insight_day).has_value(), "invalidate must not touch other owners");

  Require(cache.PurgeExpired() == 3, "purge should delete the three force-expired rows");
  clock->Advance(std::chrono::hours(25));
  Require(cache.PurgeExpired() == 1, "purge should delete the naturally expired row");
  Require(cache.PurgeExpired() == 0, "nothing left to purge");
}

void ScenarioUnavailableCache() {
  isidorcpp::tests::Log("scenario: unavailable cache");
  const auto missing = std::filesystem::temp_directory_path() / "isidorcpp_missing_dir" / "nested" / "cache.sqlite3";
  bool threw = false;
  try {
    isidorcpp::ResponseCache cache(missing.string());
  } catch (const isidorcpp::CacheUnavailable&) {
    threw = true;
  }
  Require(threw, "opening under a missing directory must throw CacheUnavailable");
}

}  // namespace

int main() {
  try {
    isidorcpp::tests::Log("response_cache_test: start");
    ScenarioKeyCanonicalization();
    ScenarioTtl();
    ScenarioInvalidateAndPurge();
    ScenarioUnavailableCache();
    isidorcpp::tests::Log("response_cache_test: finished");
    return EXIT_SUCCESS;
  } catch (const std::exception& ex) {
    isidorcpp::tests::LogError(ex.what());
    return EXIT_FAILURE;
  }
}
