#pragma once

#include <nostr/event.hpp>
#include <nostr/filter.hpp>

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <set>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace nostr_pool::store {

/**
 * @brief Thread-safe in-memory event store.
 *
 * Events are keyed by id; a second store() of the same id is a no-op.
 */
class memory_event_store
{
public:
  /// @return true if the event was not stored before
  auto store(const nostr::protocol::event_data &event) -> bool;

  /// Matching events, newest first, at most `limit` when the filter sets one
  [[nodiscard]] auto query(const nostr::filter &scope) const -> std::vector<nostr::protocol::event_data>;

  /// Union of query() over several filters, deduplicated by id
  [[nodiscard]] auto query(const nostr::filters &scopes) const -> std::vector<nostr::protocol::event_data>;

  [[nodiscard]] auto contains(const std::string &event_id) const -> bool;
  [[nodiscard]] auto size() const -> std::size_t;

private:
  /// (created_at, id); iterated in reverse for newest first
  using time_key = std::pair<std::uint64_t, std::string>;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, nostr::protocol::event_data> events_;
  std::set<time_key> by_time_;
};

}// namespace nostr_pool::store
