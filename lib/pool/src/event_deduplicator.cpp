#include <pool/event_deduplicator.hpp>

namespace nostr_pool::pool {

event_deduplicator::event_deduplicator(std::size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

auto event_deduplicator::observe(const std::string &event_id, const nostr::relay_url &relay) -> verdict
{
  const std::scoped_lock lock(mutex_);

  if (auto iter = seen_.find(event_id); iter != seen_.end()) {
    iter->second.insert(relay);
    return verdict::duplicate;
  }

  seen_.emplace(event_id, std::set<nostr::relay_url>{ relay });
  order_.push_back(event_id);
  while (order_.size() > capacity_) {
    seen_.erase(order_.front());
    order_.pop_front();
  }
  return verdict::delivered;
}

auto event_deduplicator::confirmations(const std::string &event_id) const
  -> std::optional<std::set<nostr::relay_url>>
{
  const std::scoped_lock lock(mutex_);
  auto iter = seen_.find(event_id);
  if (iter == seen_.end()) { return std::nullopt; }
  return iter->second;
}

auto event_deduplicator::contains(const std::string &event_id) const -> bool
{
  const std::scoped_lock lock(mutex_);
  return seen_.contains(event_id);
}

auto event_deduplicator::size() const -> std::size_t
{
  const std::scoped_lock lock(mutex_);
  return seen_.size();
}

auto event_deduplicator::clear() -> void
{
  const std::scoped_lock lock(mutex_);
  order_.clear();
  seen_.clear();
}

}// namespace nostr_pool::pool
