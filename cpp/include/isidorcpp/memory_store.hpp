#pragma once

#include "isidorcpp/clock.hpp"
#include "isidorcpp/embeddings.hpp"
#include "isidorcpp/types.hpp"

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace isidorcpp {

inline constexpr const char* kNoMemoryHistory = "No interaction history available for this user.";

// Per-owner consolidated narrative memory. Entries are stored as structured
// (timestamp, content) rows; the rendered document "[YYYY-MM-DD HH:MM:SS] content" joined
// by blank lines is kept beside them with one embedding of the whole. The rendered document
// never exceeds max_chars: whole oldest entries are dropped first.
//
// Appends for one owner are serialized; different owners proceed in parallel.
class MemoryStore {
 public:
  MemoryStore(const std::string& path,
              std::shared_ptr<const EmbeddingGenerator> generator,
              std::size_t max_chars = 10000,
              std::shared_ptr<const Clock> clock = SystemClock::Shared());
  ~MemoryStore();
  MemoryStore(const MemoryStore&) = delete;
  MemoryStore& operator=(const MemoryStore&) = delete;

  [[nodiscard]] std::optional<MemoryEntry> Get(const std::string& owner_id) const;

  // `context` is rendered as "\nContext: k: v, ..." (keys sorted) after the text.
  // Throws EmbeddingUnavailable without persisting anything if the document cannot be embedded.
  MemoryEntry Append(const std::string& owner_id, const std::string& text, const Metadata& context = {});

  // At most one snippet: the owner's document, when it scores at least min_similarity.
  [[nodiscard]] std::vector<MemorySnippet> Recall(const std::string& owner_id,
                                                  const EmbeddingVector& query_vector,
                                                  int limit,
                                                  float min_similarity) const;

  // Chronological, oldest first.
  [[nodiscard]] std::vector<MemoryInsight> ExtractEntries(const std::string& owner_id) const;

  [[nodiscard]] std::string Summarize(const std::string& owner_id) const;

  // Deletes owners whose memory was last updated before `cutoff`. Returns how many.
  std::size_t PruneOlderThan(Timestamp cutoff);

  [[nodiscard]] std::size_t max_chars() const { return max_chars_; }
  // Owners with an append in flight.
  [[nodiscard]] std::size_t active_owner_locks() const;

  static std::string RenderEntry(Timestamp timestamp, const std::string& content);

 private:
  struct SQLiteState;

  // Holds one owner's append lock. The map entry goes away with the last holder.
  class OwnerGuard {
   public:
    OwnerGuard(MemoryStore& store, const std::string& owner_id);
    ~OwnerGuard();
    OwnerGuard(const OwnerGuard&) = delete;
    OwnerGuard& operator=(const OwnerGuard&) = delete;

   private:
    MemoryStore& store_;
    std::string owner_id_;
    std::shared_ptr<std::mutex> mutex_;
  };

  std::unique_ptr<SQLiteState> sqlite_;
  std::shared_ptr<const EmbeddingGenerator> generator_;
  std::size_t max_chars_;
  std::shared_ptr<const Clock> clock_;
  mutable std::mutex owner_locks_mutex_;
  std::unordered_map<std::string, std::shared_ptr<std::mutex>> owner_locks_;
};

}  // namespace isidorcpp
