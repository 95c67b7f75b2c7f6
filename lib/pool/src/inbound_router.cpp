#include <pool/inbound_router.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>
#include <variant>
#include <vector>

namespace nostr_pool::pool {

inbound_router::inbound_router(const std::shared_ptr<boost::asio::io_context> &io_context,
  std::shared_ptr<subscription_registry> registry,
  std::size_t seen_capacity,
  async::overflow_policy overflow,
  verify_fn verify,
  store_fn store)
  : registry_(std::move(registry)), deduplicator_(seen_capacity), overflow_(overflow), verify_(std::move(verify)),
    store_(std::move(store)), events_(io_context, overflow), notifications_(io_context, async::overflow_policy::drop_oldest)
{}

auto inbound_router::route(const nostr::relay_url &relay, const nostr::protocol::relay_message &message) -> void
{
  std::visit([&](const auto &msg) { handle(relay, msg); }, message);
}

auto inbound_router::on_malformed(const nostr::relay_url &relay, const std::string &frame) -> void
{
  static constexpr std::size_t excerpt_length = 120;
  spdlog::warn("[router] Malformed frame from {}: {}", relay.str(), frame.substr(0, excerpt_length));
  notify(notifications::protocol_error{ .relay = relay, .reason = "malformed frame" });
}

auto inbound_router::on_status(const nostr::relay_url &relay, connection_status from, connection_status to) -> void
{
  spdlog::debug("[router] {} {} -> {}", relay.str(), to_string(from), to_string(to));
  notify(notifications::status_changed{ .relay = relay, .from = from, .to = to });
}

auto inbound_router::on_transport_error(const nostr::relay_url &relay, const std::string &reason) -> void
{
  spdlog::warn("[router] Transport error on {}: {}", relay.str(), reason);
  notify(notifications::transport_error{ .relay = relay, .reason = reason });
}

auto inbound_router::on_relay_lost(const nostr::relay_url &relay, const std::string &reason) -> void
{
  std::vector<std::pair<std::string, std::shared_ptr<fetch_queue>>> fetches;
  std::vector<std::shared_ptr<session_queue>> sessions;
  {
    const std::scoped_lock lock(mutex_);
    for (const auto &[subscription_id, route] : fetches_) { fetches.emplace_back(subscription_id, route.queue); }
    for (const auto &[key, queue] : sessions_) {
      if (key.first == relay) { sessions.push_back(queue); }
    }
  }

  for (const auto &[subscription_id, queue] : fetches) {
    push_fetch_control(relay, subscription_id, *queue, events::fetch::relay_gone{ .relay = relay });
  }
  for (const auto &queue : sessions) { queue->push(events::reconciliation::aborted{ .reason = reason }); }
}

auto inbound_router::register_fetch(const std::string &subscription_id,
  std::shared_ptr<fetch_queue> queue,
  std::optional<std::size_t> event_limit) -> void
{
  const auto limit = std::min(event_limit.value_or(queue->capacity()), queue->capacity());
  const std::scoped_lock lock(mutex_);
  fetches_[subscription_id] = fetch_route{ .queue = std::move(queue), .event_limit = limit };
}

auto inbound_router::unregister_fetch(const std::string &subscription_id) -> void
{
  const std::scoped_lock lock(mutex_);
  fetches_.erase(subscription_id);
}

auto inbound_router::register_session(const nostr::relay_url &relay,
  const std::string &session_id,
  std::shared_ptr<session_queue> queue) -> void
{
  const std::scoped_lock lock(mutex_);
  sessions_[{ relay, session_id }] = std::move(queue);
}

auto inbound_router::unregister_session(const nostr::relay_url &relay, const std::string &session_id) -> void
{
  const std::scoped_lock lock(mutex_);
  sessions_.erase(std::make_pair(relay, session_id));
}

auto inbound_router::subscribe_events(std::size_t capacity) -> std::shared_ptr<async::consumer<stream_item>>
{
  return events_.subscribe(capacity);
}

auto inbound_router::subscribe_notifications(std::size_t capacity) -> std::shared_ptr<async::consumer<notification>>
{
  return notifications_.subscribe(capacity);
}

auto inbound_router::notify(notification note) -> void
{
  // Overflow of the notification stream itself can only be logged.
  for (const auto &report : notifications_.publish(note)) {
    spdlog::warn("[router] Notification consumer {} lagging, dropped {}", report.consumer_id, report.dropped);
  }
}

auto inbound_router::close() -> void
{
  std::map<std::string, fetch_route> fetches;
  std::map<std::pair<nostr::relay_url, std::string>, std::shared_ptr<session_queue>> sessions;
  {
    const std::scoped_lock lock(mutex_);
    fetches.swap(fetches_);
    sessions.swap(sessions_);
  }

  for (const auto &[subscription_id, route] : fetches) {
    static_cast<void>(route.queue->push_evicting(events::fetch::aborted{ .reason = "pool shut down" }));
  }
  for (const auto &[key, queue] : sessions) {
    queue->push(events::reconciliation::aborted{ .reason = "pool shut down" });
  }

  events_.close();
  notifications_.close();
}

auto inbound_router::handle(const nostr::relay_url &relay, const nostr::protocol::event &msg) -> void
{
  const auto &event = msg.data;

  if (verify_ and not verify_(event)) {
    spdlog::debug("[router] Dropping unverifiable event {} from {}", event.id, relay.str());
    notify(notifications::protocol_error{ .relay = relay, .reason = "event failed verification: " + event.id });
    return;
  }

  const auto entry = registry_->get(msg.subscription_id);
  if (not entry or entry->closed or not entry->relays.contains(relay)) {
    spdlog::trace("[router] Dropping event {} for inactive subscription {}", event.id, msg.subscription_id);
    return;
  }
  if (not nostr::admits_any(entry->filters, event)) {
    notify(notifications::protocol_error{
      .relay = relay, .reason = "event " + event.id + " does not match subscription " + msg.subscription_id });
    return;
  }

  if (auto fetch = find_fetch(msg.subscription_id)) {
    if (store_) { store_(event); }
    if (fetch->queue->size() >= fetch->event_limit
        or not fetch->queue->push(events::fetch::event_received{ .event = event, .relay = relay })) {
      spdlog::warn("[router] Fetch {} buffer full, dropped event {}", msg.subscription_id, event.id);
      notify(notifications::fetch_overflow{ .relay = relay, .subscription_id = msg.subscription_id, .dropped = 1 });
    }
    return;
  }

  if (deduplicator_.observe(event.id, relay) == event_deduplicator::verdict::duplicate) {
    spdlog::trace("[router] Duplicate {} confirmed by {}", event.id, relay.str());
    return;
  }

  if (store_) { store_(event); }

  const auto reports =
    events_.publish(stream_item{ .event = event, .relay = relay, .subscription_id = msg.subscription_id });
  for (const auto &report : reports) {
    spdlog::warn("[router] Event consumer {} overflowed ({} dropped{})",
      report.consumer_id,
      report.dropped,
      report.disconnected ? ", disconnected" : "");
    notify(
      notifications::consumer_overflow{ .consumer_id = report.consumer_id, .dropped = report.dropped, .policy = overflow_ });
  }
}

auto inbound_router::handle(const nostr::relay_url &relay, const nostr::protocol::ok &msg) -> void
{
  spdlog::debug("[router] Unmatched OK for {} from {}", msg.event_id, relay.str());
}

auto inbound_router::handle(const nostr::relay_url &relay, const nostr::protocol::eose &msg) -> void
{
  if (not registry_->mark_eose(msg.subscription_id, relay)) { return; }

  if (auto fetch = find_fetch(msg.subscription_id)) {
    push_fetch_control(relay, msg.subscription_id, *fetch->queue, events::fetch::eose_received{ .relay = relay });
    return;
  }
  notify(notifications::eose{ .relay = relay, .subscription_id = msg.subscription_id });
}

auto inbound_router::handle(const nostr::relay_url &relay, const nostr::protocol::closed &msg) -> void
{
  spdlog::info("[router] {} closed subscription {}: {}", relay.str(), msg.subscription_id, msg.message);
  registry_->drop_relay(msg.subscription_id, relay);

  if (auto fetch = find_fetch(msg.subscription_id)) {
    push_fetch_control(relay, msg.subscription_id, *fetch->queue, events::fetch::relay_gone{ .relay = relay });
  }
  notify(notifications::subscription_closed{
    .relay = relay, .subscription_id = msg.subscription_id, .message = msg.message });
}

auto inbound_router::handle(const nostr::relay_url &relay, const nostr::protocol::notice &msg) -> void
{
  spdlog::info("[router] NOTICE from {}: {}", relay.str(), msg.message);
  notify(notifications::notice{ .relay = relay, .message = msg.message });
}

auto inbound_router::handle(const nostr::relay_url &relay, const nostr::protocol::auth & /*msg*/) -> void
{
  spdlog::debug("[router] {} requested authentication, ignoring", relay.str());
}

auto inbound_router::handle(const nostr::relay_url &relay, const nostr::protocol::neg_msg &msg) -> void
{
  auto session = find_session(relay, msg.subscription_id);
  if (not session) {
    spdlog::debug("[router] NEG-MSG for unknown session {} from {}", msg.subscription_id, relay.str());
    return;
  }
  session->push(events::reconciliation::message_received{ .hex = msg.message });
}

auto inbound_router::handle(const nostr::relay_url &relay, const nostr::protocol::neg_err &msg) -> void
{
  auto session = find_session(relay, msg.subscription_id);
  if (not session) {
    spdlog::debug("[router] NEG-ERR for unknown session {} from {}", msg.subscription_id, relay.str());
    return;
  }
  session->push(events::reconciliation::error_received{ .reason = msg.reason });
}

auto inbound_router::find_fetch(const std::string &subscription_id) const -> std::optional<fetch_route>
{
  const std::scoped_lock lock(mutex_);
  auto iter = fetches_.find(subscription_id);
  if (iter == fetches_.end()) { return std::nullopt; }
  return iter->second;
}

auto inbound_router::push_fetch_control(const nostr::relay_url &relay,
  const std::string &subscription_id,
  fetch_queue &queue,
  events::fetch::in_t signal) -> void
{
  const auto evicted = queue.push_evicting(std::move(signal));
  if (evicted and *evicted > 0) {
    spdlog::warn("[router] Fetch {} evicted {} events for a control signal", subscription_id, *evicted);
    notify(notifications::fetch_overflow{ .relay = relay, .subscription_id = subscription_id, .dropped = *evicted });
  }
}

auto inbound_router::find_session(const nostr::relay_url &relay, const std::string &session_id) const
  -> std::shared_ptr<session_queue>
{
  const std::scoped_lock lock(mutex_);
  auto iter = sessions_.find(std::make_pair(relay, session_id));
  return iter == sessions_.end() ? nullptr : iter->second;
}

}// namespace nostr_pool::pool
