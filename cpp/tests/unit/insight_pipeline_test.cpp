#include "isidorcpp/errors.hpp"
#include "isidorcpp/insight_pipeline.hpp"

#include "../test_logger.hpp"

#include <sqlite3.h>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace {

constexpr int kDims = 4;

void Require(bool condition, const std::string& message) {
  if (!condition) {
    throw std::runtime_error(message);
  }
}

// 2024-05-01 08:00:00 UTC.
const isidorcpp::Timestamp kNow{std::chrono::seconds(1714550400)};

class FixedClock final : public isidorcpp::Clock {
 public:
  isidorcpp::Timestamp Now() const override { return kNow; }
};

class TopicProvider final : public isidorcpp::EmbeddingProvider {
 public:
  int dimensions() const override { return kDims; }
  bool normalize() const override { return true; }
  std::optional<isidorcpp::EmbeddingIdentity> identity() const override { return std::nullopt; }
  isidorcpp::EmbeddingVector Embed(const std::string& text) override {
    if (text.find("sleep") != std::string::npos) {
      return {1.0F, 0.0F, 0.0F, 0.0F};
    }
    return {0.0F, 0.0F, 1.0F, 0.0F};
  }
};

class ScriptedGenerator final : public isidorcpp::TextGenerator {
 public:
  explicit ScriptedGenerator(std::string reply) : reply_(std::move(reply)) {}

  std::string Generate(const std::string& prompt, const isidorcpp::GenerationParams& params) override {
    if (fail_) {
      throw std::runtime_error("generator offline");
    }
    prompts.push_back(prompt);
    last_params = params;
    return reply_;
  }

  void set_fail(bool fail) { fail_ = fail; }

  std::vector<std::string> prompts;
  isidorcpp::GenerationParams last_params{};

 private:
  std::string reply_;
  bool fail_ = false;
};

std::filesystem::path UniquePath(const std::string& stem) {
  const auto now = std::chrono::high_resolution_clock::now().time_since_epoch().count();
  return std::filesystem::temp_directory_path() / (stem + "_" + std::to_string(now) + ".sqlite3");
}

struct Fixture {
  std::shared_ptr<const isidorcpp::EmbeddingGenerator> embeddings;
  std::shared_ptr<isidorcpp::VectorIndex> index;
  std::shared_ptr<isidorcpp::MemoryStore> memory;
  std::shared_ptr<const isidorcpp::ContextAssembler> assembler;
};

Fixture MakeFixture() {
  Fixture fixture{};
  const auto clock = std::make_shared<FixedClock>();
  fixture.embeddings = std::make_shared<isidorcpp::EmbeddingGenerator>(std::make_shared<TopicProvider>());

  isidorcpp::VectorIndexConfig index_config{};
  index_config.dimensions = kDims;
  fixture.index = std::make_shared<isidorcpp::VectorIndex>(index_config);
  for (int i = 0; i < 3; ++i) {
    isidorcpp::IndexedRecord record{};
    record.id = "sleep-" + std::to_string(i);
    record.owner_id = "u1";
    record.category = "sleep";
    record.timestamp = kNow - std::chrono::hours(12 + 24 * i);
    record.metadata = {{"source", "watch"}};
    record.embedding = {1.0F, 0.1F * static_cast<float>(i), 0.0F, 0.0F};
    fixture.index->Upsert(record);
  }

  fixture.memory = std::make_shared<isidorcpp::MemoryStore>(":memory:", fixture.embeddings, 10000, clock);
  isidorcpp::EngineConfig config{};
  config.embedding_dimensions = kDims;
  config.cache_ttl_hours = 6;
  fixture.assembler =
      std::make_shared<isidorcpp::ContextAssembler>(fixture.embeddings, fixture.index, fixture.memory, config, clock);
  return fixture;
}

isidorcpp::InsightRequest SleepInsight() {
  isidorcpp::InsightRequest request{};
  request.context.owner_id = "u1";
  request.context.query = "how did I sleep";
  request.context.time_frame = "last_week";
  request.context.categories = {"sleep"};
  return request;
}

void ScenarioGenerateThenCacheHit() {
  isidorcpp::tests::Log("scenario: generate then cache hit");
  auto fixture = MakeFixture();
  auto generator = std::make_shared<ScriptedGenerator>("You slept consistently around seven hours.");
  auto cache = std::make_shared<isidorcpp::ResponseCache>(":memory:", std::make_shared<FixedClock>());
  isidorcpp::InsightPipeline pipeline(fixture.assembler, generator, fixture.memory, cache);

  const auto first = pipeline.Run(SleepInsight());
  Require(!first.cached, "first run must generate");
  Require(first.text == "You slept consistently around seven hours.", "generated text mismatch");
  Require(first.context.has_value() && first.context->has_records(), "generated result must carry its context");
  Require(generator->prompts.size() == 1, "generator should be called once");
  Require(generator->last_params.max_output_tokens == 300 && generator->last_params.top_k == 40,
          "default generation parameters mismatch");

  const auto& prompt = generator->prompts.front();
  Require(prompt.find("### Sleep Data") != std::string::npos, "prompt must embed the rendered context");
  Require(prompt.find("health data from the last week") != std::string::npos, "prompt must name the period");
  Require(prompt.find("\nUser question: how did I sleep\n") != std::string::npos, "prompt must end with the question");

  const auto entries = fixture.memory->ExtractEntries("u1");
  Require(entries.size() == 1, "the interaction should be remembered");
  Require(entries[0].content ==
              "User requested: health insight for last week for sleep\n"
              "Key insight provided: You slept consistently around seven hours....",
          "remembered interaction mismatch");

  const auto second = pipeline.Run(SleepInsight());
  Require(second.cached, "second run must be served from the cache");
  Require(second.text == first.text, "cached text must be returned verbatim");
  Require(second.cache_key == first.cache_key, "cache key must be stable");
  Require(!second.context.has_value(), "cache hits carry no context");
  Require(generator->prompts.size() == 1, "cache hit must skip generation");
  Require(fixture.memory->ExtractEntries("u1").size() == 1, "cache hit must not touch memory");

  auto reordered = SleepInsight();
  reordered.context.categories = {"sleep", "activity"};
  auto swapped = SleepInsight();
  swapped.context.categories = {"activity", "sleep"};
  const auto a = pipeline.Run(reordered);
  const auto b = pipeline.Run(swapped);
  Require(!a.cached && b.cached, "category order must not defeat the cache");

  auto bypass = SleepInsight();
  bypass.use_cache = false;
  bypass.update_memory = false;
  Require(!pipeline.Run(bypass).cached, "use_cache=false must regenerate");
  Require(generator->prompts.size() == 3, "bypassed cache should call the generator again");
  Require(fixture.memory->ExtractEntries("u1").size() == 2, "update_memory=false must not append");

  Require(cache->Invalidate("u1", std::string(isidorcpp::kHealthInsightEndpoint)) == 2,
          "both cached insights should be invalidated");
  Require(!pipeline.Run(SleepInsight()).cached, "invalidated entries must regenerate");
}

void ScenarioPromptVariants() {
  isidorcpp::tests::Log("scenario: prompt variants");
  auto fixture = MakeFixture();
  auto generator = std::make_shared<ScriptedGenerator>("ok");
  isidorcpp::InsightPipeline pipeline(fixture.assembler, generator);

  auto empty = SleepInsight();
  empty.context.owner_id = "nobody";
  empty.context.query.clear();
  const auto no_data = pipeline.Run(empty);
  Require(!no_data.cached, "pipeline without a cache never reports hits");
  const auto& no_data_prompt = generator->prompts.back();
  Require(no_data_prompt.find("there is no health data available") != std::string::npos,
          "no-data prompt variant expected");
  Require(no_data_prompt.find(isidorcpp::kNoRelevantDataMarker) != std::string::npos,
          "no-data prompt must carry the marker");
  Require(no_data_prompt.find("User question:") == std::string::npos, "an empty query adds no question");

  auto with_protocol = SleepInsight();
  isidorcpp::ProtocolSnapshot protocol{};
  protocol.name = "Wind Down";
  protocol.status = "active";
  protocol.target_metrics = {"sleep"};
  with_protocol.context.protocols = {protocol};
  (void)pipeline.Run(with_protocol);
  const auto& protocol_prompt = generator->prompts.back();
  Require(protocol_prompt.find("### Wind Down") != std::string::npos, "protocol must be rendered");
  Require(protocol_prompt.find("active protocols above") != std::string::npos, "protocol prompt variant expected");
}

void ScenarioDegradedCollaborators() {
  isidorcpp::tests::Log("scenario: degraded collaborators");
  auto fixture = MakeFixture();
  auto generator = std::make_shared<ScriptedGenerator>("steady");
  const auto path = UniquePath("isidorcpp_pipeline_cache");
  {
    auto cache = std::make_shared<isidorcpp::ResponseCache>(path.string(), std::make_shared<FixedClock>());
    isidorcpp::InsightPipeline pipeline(fixture.assembler, generator, nullptr, cache);

    // Break the cache behind its back.
    sqlite3* db = nullptr;
    Require(sqlite3_open(path.string().c_str(), &db) == SQLITE_OK, "could not open cache file");
    const int rc = sqlite3_exec(db, "DROP TABLE response_cache;", nullptr, nullptr, nullptr);
    sqlite3_close(db);
    Require(rc == SQLITE_OK, "could not drop cache table");

    const auto result = pipeline.Run(SleepInsight());
    Require(!result.cached && result.text == "steady", "a broken cache must degrade to a miss");
    Require(generator->prompts.size() == 1, "generation must still happen");
  }
  std::error_code ec;
  std::filesystem::remove(path, ec);

  generator->set_fail(true);
  auto cache = std::make_shared<isidorcpp::ResponseCache>(":memory:", std::make_shared<FixedClock>());
  isidorcpp::InsightPipeline failing(fixture.assembler, generator, fixture.memory, cache);
  bool threw = false;
  try {
    (void)failing.Run(SleepInsight());
  } catch (const std::runtime_error&) {
    threw = true;
  }
  Require(threw, "generator failures must propagate");
  Require(fixture.memory->ExtractEntries("u1").empty(), "failed generation must not be remembered");
  const auto key = isidorcpp::ResponseCache::MakeKey(
      isidorcpp::kHealthInsightEndpoint, "last_week", "how did I sleep",
      isidorcpp::FieldObject{{"metric_types", isidorcpp::FieldList{"sleep"}}});
  Require(!cache->Get("u1", key).has_value(), "failed generation must not be cached");

  threw = false;
  try {
    isidorcpp::InsightPipeline missing(fixture.assembler, nullptr);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  Require(threw, "a pipeline without a generator must be rejected");
}

bool ThrowsInvalidArgument(isidorcpp::InsightPipeline& pipeline, const isidorcpp::InsightRequest& request) {
  try {
    (void)pipeline.Run(request);
  } catch (const std::invalid_argument&) {
    return true;
  }
  return false;
}

isidorcpp::ProtocolReview MagnesiumReview() {
  isidorcpp::ProtocolReview review{};
  review.protocol.id = "p-1";
  review.protocol.name = "Magnesium";
  review.protocol.description = "Magnesium glycinate before bed";
  review.protocol.target_metrics = {"sleep"};
  review.protocol.start_date = "2024-04-01";
  review.protocol.status = "active";
  review.protocol.duration_type = "fixed";
  review.effectiveness = {
      {"overall", isidorcpp::FieldObject{{"score", 0.8}}},
      {"sleep", isidorcpp::FieldObject{{"avg_hours", 7.25}, {"nights", 14}}},
  };
  review.recommendations = {{"sleep", {"Take it 30 minutes before lights out"}}};
  return review;
}

void ScenarioContextInputsSplitCacheKeys() {
  isidorcpp::tests::Log("scenario: context inputs split cache keys");
  auto fixture = MakeFixture();
  auto generator = std::make_shared<ScriptedGenerator>("fine");
  auto cache = std::make_shared<isidorcpp::ResponseCache>(":memory:", std::make_shared<FixedClock>());
  isidorcpp::InsightPipeline pipeline(fixture.assembler, generator, nullptr, cache);

  const auto baseline = pipeline.Run(SleepInsight());
  Require(!baseline.cached, "baseline must generate");

  auto strict = SleepInsight();
  strict.context.min_similarity = 0.9999F;
  strict.context.metric = isidorcpp::DistanceMetric::kL2;
  isidorcpp::ProtocolSnapshot magnesium{};
  magnesium.name = "Magnesium";
  magnesium.status = "active";
  magnesium.target_metrics = {"sleep"};
  strict.context.protocols = {magnesium};
  const auto strict_result = pipeline.Run(strict);
  Require(!strict_result.cached, "a stricter context must not reuse the baseline answer");
  Require(strict_result.cache_key != baseline.cache_key, "stricter context must change the cache key");
  Require(pipeline.Run(strict).cached, "the same strict request must hit its own entry");

  std::vector<isidorcpp::InsightRequest> variants{};
  auto similarity = SleepInsight();
  similarity.context.min_similarity = 0.5F;
  variants.push_back(similarity);
  auto per_category = SleepInsight();
  per_category.context.max_per_category = 1;
  variants.push_back(per_category);
  auto l2 = SleepInsight();
  l2.context.metric = isidorcpp::DistanceMetric::kL2;
  variants.push_back(l2);
  auto metadata = SleepInsight();
  metadata.context.metadata_equals = {{"source", "ring"}};
  variants.push_back(metadata);
  auto protocol = SleepInsight();
  protocol.context.protocols = {magnesium};
  variants.push_back(protocol);

  std::vector<std::string> keys{baseline.cache_key, strict_result.cache_key};
  for (const auto& variant : variants) {
    const auto result = pipeline.Run(variant);
    Require(!result.cached, "each context input must miss the baseline entry");
    for (const auto& seen : keys) {
      Require(result.cache_key != seen, "cache keys must differ per context input");
    }
    keys.push_back(result.cache_key);
  }

  auto renamed = protocol;
  renamed.context.protocols.front().status = "paused";
  Require(!pipeline.Run(renamed).cached, "protocol status must be part of the key");
  Require(pipeline.Run(SleepInsight()).cached, "the baseline entry must still be served");
}

void ScenarioTrendAnalysis() {
  isidorcpp::tests::Log("scenario: trend analysis");
  auto fixture = MakeFixture();
  auto generator = std::make_shared<ScriptedGenerator>("Sleep rose slightly.");
  isidorcpp::InsightPipeline pipeline(fixture.assembler, generator, fixture.memory);

  auto trend = SleepInsight();
  trend.endpoint = isidorcpp::kTrendAnalysisEndpoint;
  trend.context.query.clear();
  const auto result = pipeline.Run(trend);
  Require(result.context.has_value() && result.context->has_records(), "trend should retrieve sleep records");
  const auto& prompt = generator->prompts.back();
  Require(prompt.find("### Sleep Data") != std::string::npos, "trend prompt must embed the context");
  Require(prompt.find("trends in the user's sleep data over the last week") != std::string::npos,
          "trend prompt variant expected");
  Require(prompt.find("User question:") == std::string::npos, "the default trend query is not quoted");
  Require(generator->last_params.temperature == 0.1, "trend analysis runs at temperature 0.1");

  const auto entries = fixture.memory->ExtractEntries("u1");
  Require(!entries.empty() && entries.back().content ==
                                  "User requested: Analysis of sleep trends for last week\n"
                                  "Data available: Yes\n"
                                  "Key analysis provided: Sleep rose slightly....",
          "trend interaction summary mismatch");

  auto empty = trend;
  empty.context.owner_id = "nobody";
  (void)pipeline.Run(empty);
  Require(generator->prompts.back().find("doesn't have any sleep data for the last week") != std::string::npos,
          "no-data trend prompt expected");
  const auto none = fixture.memory->ExtractEntries("nobody");
  Require(none.size() == 1 && none[0].content.find("Data available: No\n") != std::string::npos,
          "no-data trend summary expected");

  auto overridden = trend;
  overridden.generation = isidorcpp::GenerationParams{0.7, 0.9, 20, 120};
  (void)pipeline.Run(overridden);
  Require(generator->last_params.temperature == 0.7 && generator->last_params.max_output_tokens == 120,
          "explicit generation parameters must win");

  auto two = trend;
  two.context.categories = {"sleep", "activity"};
  Require(ThrowsInvalidArgument(pipeline, two), "trend analysis over two categories must be rejected");
  auto unknown = SleepInsight();
  unknown.endpoint = "horoscope";
  Require(ThrowsInvalidArgument(pipeline, unknown), "unknown endpoint must be rejected");
  Require(!isidorcpp::IsKnownEndpoint("horoscope") && isidorcpp::IsKnownEndpoint("protocol_adjustments"),
          "endpoint registry mismatch");
}

void ScenarioProtocolEndpoints() {
  isidorcpp::tests::Log("scenario: protocol endpoints");
  auto fixture = MakeFixture();
  auto generator = std::make_shared<ScriptedGenerator>("Magnesium helped.");
  auto cache = std::make_shared<isidorcpp::ResponseCache>(":memory:", std::make_shared<FixedClock>());
  isidorcpp::InsightPipeline pipeline(fixture.assembler, generator, fixture.memory, cache);

  isidorcpp::InsightRequest effectiveness{};
  effectiveness.endpoint = isidorcpp::kProtocolEffectivenessEndpoint;
  effectiveness.context.owner_id = "u1";
  effectiveness.context.time_frame = "last_week";
  effectiveness.context.query = "did magnesium help my sleep";
  effectiveness.review = MagnesiumReview();
  const auto first = pipeline.Run(effectiveness);
  Require(first.context.has_value() && first.context->has_records(),
          "protocol categories should default to its target metrics");

  const auto& prompt = generator->prompts.back();
  Require(prompt.find("Protocol: Magnesium\nDescription: Magnesium glycinate before bed\n") != std::string::npos,
          "protocol header expected");
  Require(prompt.find("Duration Days: Ongoing\nStart Date: 2024-04-01\nStatus: active\n") != std::string::npos,
          "protocol schedule expected");
  const auto sleep_at = prompt.find("- Sleep:\n  - avg_hours: 7.25\n  - nights: 14.00\n");
  const auto overall_at = prompt.find("- Overall:\n  - score: 0.80\n");
  Require(sleep_at != std::string::npos && overall_at != std::string::npos && sleep_at < overall_at,
          "effectiveness data must list the overall entry last");
  Require(prompt.find("Current Recommendations:") == std::string::npos,
          "effectiveness prompt carries no recommendations");
  Require(prompt.find("protocol's effectiveness") != std::string::npos, "effectiveness instructions expected");
  Require(prompt.find("\nUser question: did magnesium help my sleep\n") != std::string::npos,
          "a caller question must be quoted");
  Require(generator->last_params.temperature == 0.2, "effectiveness runs at the default temperature");
  Require(fixture.memory->ExtractEntries("u1").back().content ==
              "User requested: Analysis of Magnesium protocol effectiveness\n"
              "Protocol status: active\n"
              "Key analysis provided: Magnesium helped....",
          "effectiveness summary mismatch");

  Require(pipeline.Run(effectiveness).cached, "identical review must hit the cache");
  auto changed = effectiveness;
  changed.review->effectiveness.back().second = isidorcpp::FieldObject{{"avg_hours", 6.5}};
  Require(!pipeline.Run(changed).cached, "different effectiveness data must miss the cache");

  auto adjustments = effectiveness;
  adjustments.endpoint = isidorcpp::kProtocolAdjustmentsEndpoint;
  (void)pipeline.Run(adjustments);
  const auto& adjust_prompt = generator->prompts.back();
  Require(adjust_prompt.find("Current Recommendations:\n- Sleep:\n  - Take it 30 minutes before lights out\n") !=
              std::string::npos,
          "adjustments prompt must list current recommendations");
  Require(adjust_prompt.find("actionable adjustments") != std::string::npos, "adjustments instructions expected");
  Require(generator->last_params.temperature == 0.3, "adjustments run at temperature 0.3");
  Require(fixture.memory->ExtractEntries("u1").back().content ==
              "User requested: Adjustments for Magnesium protocol\n"
              "Protocol status: active\n"
              "Key adjustments provided: Magnesium helped....",
          "adjustments summary mismatch");

  auto missing = adjustments;
  missing.review.reset();
  Require(ThrowsInvalidArgument(pipeline, missing), "protocol endpoints require a review");
}

void ScenarioRememberedSummaryKeepsUtf8() {
  isidorcpp::tests::Log("scenario: remembered summary keeps utf-8");
  auto fixture = MakeFixture();
  // The two-byte character straddles the clip boundary.
  auto generator = std::make_shared<ScriptedGenerator>(std::string(199, 'z') + "\xC3\xA9 tail");
  isidorcpp::InsightPipeline pipeline(fixture.assembler, generator, fixture.memory);

  (void)pipeline.Run(SleepInsight());
  const auto entries = fixture.memory->ExtractEntries("u1");
  Require(entries.size() == 1, "the interaction should be remembered");
  const std::string expected_tail = "Key insight provided: " + std::string(199, 'z') + "...";
  const auto& content = entries[0].content;
  Require(content.size() >= expected_tail.size() &&
              content.compare(content.size() - expected_tail.size(), expected_tail.size(), expected_tail) == 0,
          "clip must drop the split character instead of cutting it");
}

}  // namespace

int main() {
  try {
    isidorcpp::tests::Log("insight_pipeline_test: start");
    ScenarioGenerateThenCacheHit();
    ScenarioPromptVariants();
    ScenarioDegradedCollaborators();
    ScenarioContextInputsSplitCacheKeys();
    ScenarioTrendAnalysis();
    ScenarioProtocolEndpoints();
    ScenarioRememberedSummaryKeepsUtf8();
    isidorcpp::tests::Log("insight_pipeline_test: finished");
    return EXIT_SUCCESS;
  } catch (const std::exception& ex) {
    isidorcpp::tests::LogError(ex.what());
    return EXIT_FAILURE;
  }
}
