#include <pool/subscription_registry.hpp>

#include <core/id_generator.hpp>
#include <pool/errors.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <stdexcept>

namespace nostr_pool::pool {

auto subscription_registry::add(nostr::filters filters,
  std::set<nostr::relay_url> relays,
  std::optional<std::string> requested_id) -> std::string
{
  const std::scoped_lock lock(mutex_);

  std::string subscription_id;
  if (requested_id) {
    if (subscriptions_.contains(*requested_id)) {
      throw std::invalid_argument("Subscription id already registered: " + *requested_id);
    }
    subscription_id = std::move(*requested_id);
  } else {
    subscription_id = core::id_generator::subscription_id();
    while (subscriptions_.contains(subscription_id)) { subscription_id = core::id_generator::subscription_id(); }
  }

  subscriptions_.emplace(subscription_id,
    subscription{ .id = subscription_id,
      .filters = std::move(filters),
      .relays = std::move(relays),
      .closed = false,
      .eose = {},
      .pending_close = {} });
  spdlog::debug("[registry] Added subscription {}", subscription_id);
  return subscription_id;
}

auto subscription_registry::get(const std::string &subscription_id) const -> std::optional<subscription>
{
  const std::scoped_lock lock(mutex_);
  auto iter = subscriptions_.find(subscription_id);
  if (iter == subscriptions_.end()) { return std::nullopt; }
  return iter->second;
}

auto subscription_registry::is_active(const std::string &subscription_id) const -> bool
{
  const std::scoped_lock lock(mutex_);
  auto iter = subscriptions_.find(subscription_id);
  return iter != subscriptions_.end() and not iter->second.closed;
}

auto subscription_registry::is_active_on(const std::string &subscription_id, const nostr::relay_url &relay) const
  -> bool
{
  const std::scoped_lock lock(mutex_);
  auto iter = subscriptions_.find(subscription_id);
  return iter != subscriptions_.end() and not iter->second.closed and iter->second.relays.contains(relay);
}

auto subscription_registry::active_for(const nostr::relay_url &relay) const
  -> std::vector<std::pair<std::string, nostr::filters>>
{
  const std::scoped_lock lock(mutex_);
  std::vector<std::pair<std::string, nostr::filters>> active;
  for (const auto &[subscription_id, entry] : subscriptions_) {
    if (not entry.closed and entry.relays.contains(relay)) { active.emplace_back(subscription_id, entry.filters); }
  }
  return active;
}

auto subscription_registry::update_filters(const std::string &subscription_id, nostr::filters filters)
  -> std::set<nostr::relay_url>
{
  const std::scoped_lock lock(mutex_);
  auto iter = subscriptions_.find(subscription_id);
  if (iter == subscriptions_.end()) { throw subscription_not_found(subscription_id); }
  if (iter->second.closed) { throw subscription_closed(subscription_id); }

  iter->second.filters = std::move(filters);
  iter->second.eose.clear();
  return iter->second.relays;
}

auto subscription_registry::begin_close(const std::string &subscription_id) -> std::set<nostr::relay_url>
{
  const std::scoped_lock lock(mutex_);
  auto iter = subscriptions_.find(subscription_id);
  if (iter == subscriptions_.end()) { throw subscription_not_found(subscription_id); }
  if (iter->second.closed) { throw subscription_closed(subscription_id); }

  auto relays = iter->second.relays;
  if (relays.empty()) {
    subscriptions_.erase(iter);
    return relays;
  }
  iter->second.closed = true;
  iter->second.pending_close = relays;
  return relays;
}

auto subscription_registry::acknowledge_close(const std::string &subscription_id, const nostr::relay_url &relay)
  -> bool
{
  const std::scoped_lock lock(mutex_);
  auto iter = subscriptions_.find(subscription_id);
  if (iter == subscriptions_.end() or not iter->second.closed) { return false; }

  iter->second.pending_close.erase(relay);
  if (not iter->second.pending_close.empty()) { return false; }

  subscriptions_.erase(iter);
  spdlog::debug("[registry] Subscription {} closed on every relay", subscription_id);
  return true;
}

auto subscription_registry::force_erase(const std::string &subscription_id) -> bool
{
  const std::scoped_lock lock(mutex_);
  return subscriptions_.erase(subscription_id) > 0;
}

auto subscription_registry::drop_relay(const std::string &subscription_id, const nostr::relay_url &relay) -> void
{
  const std::scoped_lock lock(mutex_);
  auto iter = subscriptions_.find(subscription_id);
  if (iter == subscriptions_.end()) { return; }

  iter->second.relays.erase(relay);
  iter->second.eose.erase(relay);
  if (iter->second.closed) {
    iter->second.pending_close.erase(relay);
    if (iter->second.pending_close.empty()) { subscriptions_.erase(iter); }
  }
}

auto subscription_registry::remove_relay(const nostr::relay_url &relay) -> std::vector<std::string>
{
  const std::scoped_lock lock(mutex_);
  std::vector<std::string> affected;
  for (auto iter = subscriptions_.begin(); iter != subscriptions_.end();) {
    auto &entry = iter->second;
    if (not entry.relays.erase(relay)) {
      ++iter;
      continue;
    }
    affected.push_back(iter->first);
    entry.eose.erase(relay);
    entry.pending_close.erase(relay);
    if (entry.closed and entry.pending_close.empty()) {
      iter = subscriptions_.erase(iter);
    } else {
      ++iter;
    }
  }
  return affected;
}

auto subscription_registry::mark_eose(const std::string &subscription_id, const nostr::relay_url &relay) -> bool
{
  const std::scoped_lock lock(mutex_);
  auto iter = subscriptions_.find(subscription_id);
  if (iter == subscriptions_.end() or iter->second.closed or not iter->second.relays.contains(relay)) {
    return false;
  }
  iter->second.eose.insert(relay);
  return true;
}

auto subscription_registry::reset_eose(const std::string &subscription_id, const nostr::relay_url &relay) -> void
{
  const std::scoped_lock lock(mutex_);
  auto iter = subscriptions_.find(subscription_id);
  if (iter != subscriptions_.end()) { iter->second.eose.erase(relay); }
}

auto subscription_registry::eose_complete(const std::string &subscription_id) const -> bool
{
  const std::scoped_lock lock(mutex_);
  auto iter = subscriptions_.find(subscription_id);
  if (iter == subscriptions_.end()) { return false; }
  return std::ranges::all_of(
    iter->second.relays, [&entry = iter->second](const auto &relay) { return entry.eose.contains(relay); });
}

auto subscription_registry::ids() const -> std::vector<std::string>
{
  const std::scoped_lock lock(mutex_);
  std::vector<std::string> result;
  result.reserve(subscriptions_.size());
  for (const auto &[subscription_id, entry] : subscriptions_) { result.push_back(subscription_id); }
  return result;
}

auto subscription_registry::size() const -> std::size_t
{
  const std::scoped_lock lock(mutex_);
  return subscriptions_.size();
}

auto subscription_registry::clear() -> void
{
  const std::scoped_lock lock(mutex_);
  subscriptions_.clear();
}

}// namespace nostr_pool::pool
