#include "isidorcpp/embeddings.hpp"
#include "isidorcpp/errors.hpp"
#include "isidorcpp/vector_engine.hpp"

#include "../test_logger.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <random>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

void Require(bool condition, const std::string& message) {
  if (!condition) {
    throw std::runtime_error(message);
  }
}

std::vector<isidorcpp::EmbeddingVector> RandomVectors(std::size_t count, int dims, std::uint32_t seed) {
  std::mt19937 rng(seed);
  std::normal_distribution<float> gaussian(0.0F, 1.0F);
  std::vector<isidorcpp::EmbeddingVector> out(count, isidorcpp::EmbeddingVector(static_cast<std::size_t>(dims)));
  for (auto& vector : out) {
    for (auto& value : vector) {
      value = gaussian(rng);
    }
  }
  return out;
}

// Brute-force reference ranking: (key, distance) ascending, ties by key.
std::vector<std::pair<std::uint64_t, float>> ExactTopK(const std::vector<isidorcpp::EmbeddingVector>& corpus,
                                                       const isidorcpp::EmbeddingVector& query,
                                                       isidorcpp::DistanceMetric metric,
                                                       std::size_t top_k) {
  std::vector<std::pair<std::uint64_t, float>> ranked{};
  for (std::size_t i = 0; i < corpus.size(); ++i) {
    ranked.emplace_back(i, isidorcpp::Distance(metric, query, corpus[i]));
  }
  std::sort(ranked.begin(), ranked.end(), [](const auto& lhs, const auto& rhs) {
    if (lhs.second != rhs.second) {
      return lhs.second < rhs.second;
    }
    return lhs.first < rhs.first;
  });
  ranked.resize(std::min(ranked.size(), top_k));
  return ranked;
}

void ScenarioCtorValidation() {
  isidorcpp::tests::Log("scenario: constructor validation");
  bool threw = false;
  try {
    isidorcpp::HnswVectorEngine invalid(0, isidorcpp::DistanceMetric::kCosine);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  Require(threw, "dimensions <= 0 must throw");

  threw = false;
  try {
    isidorcpp::HnswVectorEngine invalid(4, isidorcpp::DistanceMetric::kCosine, isidorcpp::HnswParams{.m = 1});
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  Require(threw, "m < 2 must throw");
}

void ScenarioAddSearchAndTieBreak() {
  isidorcpp::tests::Log("scenario: add/search/tie-break");
  isidorcpp::HnswVectorEngine engine(3, isidorcpp::DistanceMetric::kCosine);
  Require(engine.Search({1.0F, 0.0F, 0.0F}, 3).empty(), "empty engine must return no results");

  engine.Add(10, {1.0F, 0.0F, 0.0F});
  engine.Add(2, {2.0F, 0.0F, 0.0F});
  engine.Add(7, {0.0F, 1.0F, 0.0F});

  const auto results = engine.Search({1.0F, 0.0F, 0.0F}, 3);
  Require(results.size() == 3, "expected three vector results");
  Require(results[0].first == 2, "tie-break should prefer the lower key");
  Require(results[1].first == 10, "second tie entry should be the higher key");
  Require(results[2].first == 7, "orthogonal vector should rank last");

  bool threw = false;
  try {
    (void)engine.Search({1.0F, 0.0F}, 1);
  } catch (const isidorcpp::DimensionMismatch&) {
    threw = true;
  }
  Require(threw, "query of the wrong length must throw DimensionMismatch");
}

void ScenarioRecallAgainstExact() {
  isidorcpp::tests::Log("scenario: recall against exact scan");
  constexpr int kDims = 16;
  constexpr int kTopK = 10;
  const auto corpus = RandomVectors(600, kDims, 7);
  const auto queries = RandomVectors(40, kDims, 11);

  for (const auto metric : {isidorcpp::DistanceMetric::kCosine, isidorcpp::DistanceMetric::kL2}) {
    isidorcpp::HnswVectorEngine graph(kDims, metric);
    for (std::size_t i = 0; i < corpus.size(); ++i) {
      graph.Add(i, corpus[i]);
    }
    Require(graph.size() == corpus.size(), "graph size mismatch");

    std::size_t found = 0;
    for (const auto& query : queries) {
      const auto graph_hits = graph.Search(query, kTopK);
      const auto exact_hits = ExactTopK(corpus, query, metric, kTopK);
      Require(std::abs(graph_hits.front().second - isidorcpp::Distance(metric, query, corpus[graph_hits.front().first])) <
                  1e-4F,
              "graph distances must be reported in the engine metric");
      std::set<std::uint64_t> truth{};
      for (const auto& [key, distance] : exact_hits) {
        truth.insert(key);
      }
      for (const auto& [key, distance] : graph_hits) {
        found += truth.count(key);
      }
    }
    const double recall = static_cast<double>(found) / static_cast<double>(queries.size() * kTopK);
    isidorcpp::tests::LogKV("recall", std::to_string(recall));
    Require(recall >= 0.9, "hnsw recall@10 fell below 0.9");
  }
}

void ScenarioFilteredSearch() {
  isidorcpp::tests::Log("scenario: filtered search");
  constexpr int kDims = 8;
  const auto corpus = RandomVectors(200, kDims, 19);
  isidorcpp::HnswVectorEngine engine(kDims, isidorcpp::DistanceMetric::kCosine);
  for (std::size_t i = 0; i < corpus.size(); ++i) {
    engine.Add(i, corpus[i]);
  }
  const auto only_even = [](std::uint64_t key) { return key % 2 == 0; };
  const auto hits = engine.Search(corpus[3], 10, only_even);
  Require(hits.size() == 10, "filtered search should still fill top_k from accepted keys");
  for (const auto& [key, distance] : hits) {
    Require(key % 2 == 0, "filtered search returned a rejected key");
  }
  for (std::size_t i = 1; i < hits.size(); ++i) {
    Require(hits[i - 1].second <= hits[i].second, "filtered results must be ascending by distance");
  }
  Require(engine.Search(corpus[3], 5, [](std::uint64_t) { return false; }).empty(),
          "a filter rejecting every key yields nothing");
}

void ScenarioUpsertAndRemove() {
  isidorcpp::tests::Log("scenario: upsert and remove");
  constexpr int kDims = 8;
  const auto corpus = RandomVectors(64, kDims, 3);
  isidorcpp::HnswVectorEngine engine(kDims, isidorcpp::DistanceMetric::kL2, isidorcpp::HnswParams{.m = 4});
  for (std::size_t i = 0; i < corpus.size(); ++i) {
    engine.Add(i, corpus[i]);
  }

  engine.Add(5, corpus[5]);
  Require(engine.size() == corpus.size(), "re-adding an identical vector must be a no-op");
  Require(engine.tombstone_count() == 0, "identical upsert must not tombstone");
  Require(engine.Search(corpus[5], 1).front().first == 5, "re-added key must still be found");

  engine.Add(5, corpus[40]);
  Require(engine.size() == corpus.size(), "upsert must not grow the key set");
  const auto moved = engine.Search(corpus[40], 2);
  Require(moved.size() == 2, "expected two hits for the moved vector");
  Require(moved[0].second == 0.0F && moved[1].second == 0.0F, "both copies of the vector must be at distance 0");
  Require(moved[0].first == 5 && moved[1].first == 40, "moved key must be found at its new position");

  Require(engine.Remove(40), "removing a present key must succeed");
  Require(!engine.Remove(40), "removing an absent key must report false");
  Require(engine.tombstone_count() == 1, "remove must tombstone the key");
  for (const auto& [key, distance] : engine.Search(corpus[40], 10)) {
    Require(key != 40, "removed key must not be returned");
  }

  for (std::size_t i = 0; i < corpus.size(); ++i) {
    (void)engine.Remove(i);
  }
  Require(engine.size() == 0, "engine should be empty after removing every key");
  Require(engine.Search(corpus[0], 3).empty(), "emptied engine must return no results");
  engine.Add(99, corpus[0]);
  const auto revived = engine.Search(corpus[0], 1);
  Require(revived.size() == 1 && revived[0].first == 99, "engine must accept inserts past its initial capacity");

  engine.Add(7, corpus[7]);
  Require(engine.size() == 2, "a tombstoned key must come back live on re-add");
  const auto back = engine.Search(corpus[7], 1);
  Require(back.size() == 1 && back[0].first == 7, "revived key must be searchable");
}

}  // namespace

int main() {
  try {
    isidorcpp::tests::Log("hnsw_vector_engine_test: start");
    ScenarioCtorValidation();
    ScenarioAddSearchAndTieBreak();
    ScenarioRecallAgainstExact();
    ScenarioFilteredSearch();
    ScenarioUpsertAndRemove();
    isidorcpp::tests::Log("hnsw_vector_engine_test: finished");
    return EXIT_SUCCESS;
  } catch (const std::exception& ex) {
    isidorcpp::tests::LogError(ex.what());
    return EXIT_FAILURE;
  }
}
