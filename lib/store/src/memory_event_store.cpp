#include <store/memory_event_store.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <tuple>
#include <unordered_set>

namespace nostr_pool::store {

auto memory_event_store::store(const nostr::protocol::event_data &event) -> bool
{
  const std::scoped_lock lock(mutex_);
  const auto [iter, inserted] = events_.emplace(event.id, event);
  if (inserted) {
    by_time_.emplace(event.created_at, event.id);
    spdlog::trace("[store] Stored event {} (kind {})", event.id, static_cast<std::uint16_t>(event.kind));
  }
  return inserted;
}

auto memory_event_store::query(const nostr::filter &scope) const -> std::vector<nostr::protocol::event_data>
{
  const std::scoped_lock lock(mutex_);
  std::vector<nostr::protocol::event_data> results;

  if (not scope.ids.empty()) {
    for (const auto &event_id : scope.ids) {
      auto iter = events_.find(event_id);
      if (iter != events_.end() and scope.matches(iter->second)) { results.push_back(iter->second); }
    }
    std::ranges::sort(results, [](const auto &lhs, const auto &rhs) {
      return std::tie(lhs.created_at, lhs.id) > std::tie(rhs.created_at, rhs.id);
    });
    if (scope.limit and results.size() > *scope.limit) { results.resize(*scope.limit); }
    return results;
  }

  for (auto iter = by_time_.rbegin(); iter != by_time_.rend(); ++iter) {
    if (scope.limit and results.size() >= *scope.limit) { break; }
    if (scope.until and iter->first > *scope.until) { continue; }
    if (scope.since and iter->first < *scope.since) { break; }
    const auto &event = events_.at(iter->second);
    if (scope.matches(event)) { results.push_back(event); }
  }
  return results;
}

auto memory_event_store::query(const nostr::filters &scopes) const -> std::vector<nostr::protocol::event_data>
{
  std::vector<nostr::protocol::event_data> results;
  std::unordered_set<std::string> seen;
  for (const auto &scope : scopes) {
    for (auto &event : query(scope)) {
      if (seen.insert(event.id).second) { results.push_back(std::move(event)); }
    }
  }
  return results;
}

auto memory_event_store::contains(const std::string &event_id) const -> bool
{
  const std::scoped_lock lock(mutex_);
  return events_.contains(event_id);
}

auto memory_event_store::size() const -> std::size_t
{
  const std::scoped_lock lock(mutex_);
  return events_.size();
}

}// namespace nostr_pool::store
