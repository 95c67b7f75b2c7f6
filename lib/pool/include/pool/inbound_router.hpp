#pragma once

#include <pool/connection_status.hpp>
#include <pool/event_deduplicator.hpp>
#include <pool/events.hpp>
#include <pool/notifications.hpp>
#include <pool/subscription_registry.hpp>

#include <async/async_queue.hpp>
#include <async/broadcast.hpp>
#include <nostr/protocol.hpp>
#include <nostr/relay_url.hpp>

#include <boost/asio/io_context.hpp>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

namespace nostr_pool::pool {

/**
 * @brief Receives every decoded inbound message from every connection and
 * routes it: subscription events through verification and deduplication to
 * the unified stream (or to a running fetch), EOSE and CLOSED to the
 * registry, NEG-* frames to reconciliation sessions, and everything else to
 * the notification stream.
 *
 * Called concurrently from all connection strands; holds its own lock only
 * around map lookups.
 */
class inbound_router
{
public:
  using verify_fn = std::function<bool(const nostr::protocol::event_data &)>;
  using store_fn = std::function<void(const nostr::protocol::event_data &)>;
  using fetch_queue = async::async_queue<events::fetch::in_t>;
  using session_queue = async::async_queue<events::reconciliation::in_t>;

  inbound_router(const std::shared_ptr<boost::asio::io_context> &io_context,
    std::shared_ptr<subscription_registry> registry,
    std::size_t seen_capacity,
    async::overflow_policy overflow,
    verify_fn verify,
    store_fn store);

  /// Routes one relay message received while Connected
  auto route(const nostr::relay_url &relay, const nostr::protocol::relay_message &message) -> void;

  /// A frame that failed to decode
  auto on_malformed(const nostr::relay_url &relay, const std::string &frame) -> void;

  auto on_status(const nostr::relay_url &relay, connection_status from, connection_status to) -> void;
  auto on_transport_error(const nostr::relay_url &relay, const std::string &reason) -> void;

  /**
   * @brief The relay stopped serving anything: aborts its reconciliation
   * sessions and releases fetches waiting on it.
   */
  auto on_relay_lost(const nostr::relay_url &relay, const std::string &reason) -> void;

  /**
   * @brief Routes a subscription's traffic to a running fetch.
   *
   * Events are queued only while fewer than @p event_limit items are buffered
   * (the queue's capacity when omitted); the rest of the queue is headroom
   * for EOSE and the other control signals, which are never refused.
   */
  auto register_fetch(const std::string &subscription_id,
    std::shared_ptr<fetch_queue> queue,
    std::optional<std::size_t> event_limit = std::nullopt) -> void;
  auto unregister_fetch(const std::string &subscription_id) -> void;

  auto register_session(const nostr::relay_url &relay,
    const std::string &session_id,
    std::shared_ptr<session_queue> queue) -> void;
  auto unregister_session(const nostr::relay_url &relay, const std::string &session_id) -> void;

  auto subscribe_events(std::size_t capacity) -> std::shared_ptr<async::consumer<stream_item>>;
  auto subscribe_notifications(std::size_t capacity) -> std::shared_ptr<async::consumer<notification>>;

  auto notify(notification note) -> void;

  [[nodiscard]] auto deduplicator() -> event_deduplicator & { return deduplicator_; }
  [[nodiscard]] auto deduplicator() const -> const event_deduplicator & { return deduplicator_; }

  /// Aborts every fetch and session and closes both streams; idempotent
  auto close() -> void;

private:
  auto handle(const nostr::relay_url &relay, const nostr::protocol::event &msg) -> void;
  auto handle(const nostr::relay_url &relay, const nostr::protocol::ok &msg) -> void;
  auto handle(const nostr::relay_url &relay, const nostr::protocol::eose &msg) -> void;
  auto handle(const nostr::relay_url &relay, const nostr::protocol::closed &msg) -> void;
  auto handle(const nostr::relay_url &relay, const nostr::protocol::notice &msg) -> void;
  auto handle(const nostr::relay_url &relay, const nostr::protocol::auth &msg) -> void;
  auto handle(const nostr::relay_url &relay, const nostr::protocol::neg_msg &msg) -> void;
  auto handle(const nostr::relay_url &relay, const nostr::protocol::neg_err &msg) -> void;

  struct fetch_route
  {
    std::shared_ptr<fetch_queue> queue;
    std::size_t event_limit{};
  };

  [[nodiscard]] auto find_fetch(const std::string &subscription_id) const -> std::optional<fetch_route>;

  /// Queues a control signal, evicting buffered events if it must
  auto push_fetch_control(const nostr::relay_url &relay,
    const std::string &subscription_id,
    fetch_queue &queue,
    events::fetch::in_t signal) -> void;
  [[nodiscard]] auto find_session(const nostr::relay_url &relay, const std::string &session_id) const
    -> std::shared_ptr<session_queue>;

  std::shared_ptr<subscription_registry> registry_;
  event_deduplicator deduplicator_;
  async::overflow_policy overflow_;
  verify_fn verify_;
  store_fn store_;
  async::broadcast<stream_item> events_;
  async::broadcast<notification> notifications_;

  mutable std::mutex mutex_;
  std::map<std::string, fetch_route> fetches_;
  std::map<std::pair<nostr::relay_url, std::string>, std::shared_ptr<session_queue>> sessions_;
};

}// namespace nostr_pool::pool
