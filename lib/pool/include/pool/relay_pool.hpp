#pragma once

#include <pool/connection_status.hpp>
#include <pool/errors.hpp>
#include <pool/events.hpp>
#include <pool/inbound_router.hpp>
#include <pool/notifications.hpp>
#include <pool/options.hpp>
#include <pool/reconciliation_session.hpp>
#include <pool/relay_connection.hpp>
#include <pool/results.hpp>
#include <pool/subscription_registry.hpp>

#include <async/async_queue.hpp>
#include <async/broadcast.hpp>
#include <concepts/event_store.hpp>
#include <concepts/event_verifier.hpp>
#include <concepts/transport_stream.hpp>
#include <core/id_generator.hpp>
#include <nostr/event.hpp>
#include <nostr/filter.hpp>
#include <nostr/id_verifier.hpp>
#include <nostr/relay_url.hpp>
#include <store/memory_event_store.hpp>

#include <algorithm>
#include <atomic>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_set>
#include <utility>
#include <variant>
#include <vector>

namespace nostr_pool::pool {

/// Relay selection: an explicit list of URLs, or std::nullopt for every added relay
using relay_targets = std::optional<std::vector<std::string>>;

/// Selects every relay currently added to the pool
inline constexpr std::nullopt_t all_relays = std::nullopt;

/**
 * @brief Multi-relay client: connection lifecycle, subscription multiplexing,
 * deduplicated event stream, publishing and negentropy reconciliation.
 *
 * Each relay is an independent relay_connection actor; the pool only posts
 * commands to them. Inbound traffic flows through one inbound_router into the
 * unified event stream and the notification stream.
 *
 * Caller misuse throws synchronously (see errors.hpp); per-relay failures are
 * reported in results and notifications and never fail a whole operation.
 *
 * @tparam Stream Transport satisfying concepts::transport_stream
 * @tparam Verifier Event authenticity check run before deduplication
 * @tparam Store Local event store used for persistence and reconciliation
 */
template<concepts::transport_stream Stream,
  concepts::event_verifier Verifier = nostr::id_verifier,
  concepts::event_store Store = store::memory_event_store>
class relay_pool
{
public:
  using connection_t = relay_connection<Stream>;
  using stream_factory = std::function<std::shared_ptr<Stream>(const nostr::relay_url &)>;

  relay_pool(const std::shared_ptr<boost::asio::io_context> &io_context,
    stream_factory factory,
    pool_options options = {},
    Verifier verifier = {},
    std::shared_ptr<Store> store = std::make_shared<Store>())
    : io_context_(io_context), factory_(std::move(factory)), options_(options), store_(std::move(store)),
      registry_(std::make_shared<subscription_registry>()),
      router_(std::make_shared<inbound_router>(
        io_context,
        registry_,
        options_.seen_capacity,
        options_.overflow,
        [verifier = std::move(verifier)](const nostr::protocol::event_data &event) {
          return static_cast<bool>(verifier.verify(event));
        },
        [store = store_](const nostr::protocol::event_data &event) {
          if (store) { static_cast<void>(store->store(event)); }
        }))
  {}

  relay_pool(const relay_pool &) = delete;
  auto operator=(const relay_pool &) -> relay_pool & = delete;
  relay_pool(relay_pool &&) = delete;
  auto operator=(relay_pool &&) -> relay_pool & = delete;
  ~relay_pool() = default;

  /**
   * @brief Adds a relay without connecting to it.
   *
   * Adding an already present relay returns its normalized url and keeps its
   * original options.
   *
   * @throws std::invalid_argument for an unusable url
   * @throws pool_shut_down
   */
  auto add_relay(std::string_view url, relay_options options = {}) -> nostr::relay_url
  {
    auto normalized = nostr::relay_url::parse(url);

    const std::scoped_lock lock(mutex_);
    ensure_running();
    if (connections_.contains(normalized)) { return normalized; }

    auto connection = std::make_shared<connection_t>(
      io_context_,
      normalized,
      options,
      [factory = factory_, normalized]() { return factory(normalized); },
      registry_,
      router_,
      options_.mailbox_capacity);
    connection->start();
    connections_.emplace(normalized, connection);
    spdlog::info("[pool] Added relay {}", normalized.str());
    return normalized;
  }

  /**
   * @brief Terminates a relay and removes it from every subscription.
   *
   * @throws relay_not_found
   */
  auto remove_relay(std::string_view url) -> void
  {
    const auto normalized = nostr::relay_url::parse(url);
    std::shared_ptr<connection_t> connection;
    {
      const std::scoped_lock lock(mutex_);
      ensure_running();
      auto iter = connections_.find(normalized);
      if (iter == connections_.end()) { throw relay_not_found(normalized.str()); }
      connection = iter->second;
      connections_.erase(iter);
      // The actor keeps itself alive until it exits; shutdown() only waits on those still running.
      std::erase_if(retired_, [](const auto &weak) { return weak.expired(); });
      retired_.push_back(connection);
    }

    connection->terminate();
    const auto affected = registry_->remove_relay(normalized);
    router_->on_relay_lost(normalized, "relay removed");
    spdlog::info("[pool] Removed relay {} ({} subscriptions affected)", normalized.str(), affected.size());
  }

  /// Starts every relay that is Initialized or Disconnected
  auto connect() -> void
  {
    for (const auto &connection : snapshot_connections()) { connection->connect(); }
  }

  /**
   * @throws relay_not_found
   */
  auto connect_relay(std::string_view url) -> void { find(url)->connect(); }

  /**
   * @brief Opens a subscription on the target relays.
   *
   * Connected targets receive the REQ right away; the others pick it up when
   * they next connect. Relays added later never receive it.
   *
   * @param targets Explicit relays, or all_relays for every relay with the read flag
   * @return The subscription id
   * @throws relay_not_found, std::invalid_argument for an empty filter list
   */
  auto subscribe(nostr::filters filters, const relay_targets &targets = all_relays) -> std::string
  {
    if (filters.empty()) { throw std::invalid_argument("Subscription needs at least one filter"); }
    const auto selected = select(targets, [](const relay_options &opts) { return opts.read; });

    std::set<nostr::relay_url> relays;
    for (const auto &connection : selected) { relays.insert(connection->url()); }

    auto subscription_id = registry_->add(filters, relays);
    for (const auto &connection : selected) {
      if (not connection->post(events::connection::subscribe{ .subscription_id = subscription_id, .filters = filters })) {
        spdlog::warn("[pool] {} refused subscription {}; it is served from the next connect", connection->url().str(), subscription_id);
      }
    }
    spdlog::debug("[pool] Subscription {} on {} relays", subscription_id, relays.size());
    return subscription_id;
  }

  /**
   * @brief Closes a subscription on every relay serving it.
   *
   * Bookkeeping is released once every relay acknowledged the CLOSE, or after
   * the close grace period.
   *
   * @throws subscription_not_found, subscription_closed
   */
  auto unsubscribe(const std::string &subscription_id) -> void
  {
    ensure_running_locked();
    close_subscription(subscription_id);
  }

  /**
   * @brief Replaces the filters of an open subscription on the wire.
   *
   * @throws subscription_not_found, subscription_closed, std::invalid_argument for an empty filter list
   */
  auto update_filters(const std::string &subscription_id, nostr::filters filters) -> void
  {
    ensure_running_locked();
    if (filters.empty()) { throw std::invalid_argument("Subscription needs at least one filter"); }

    const auto relays = registry_->update_filters(subscription_id, filters);
    for (const auto &relay : relays) {
      if (auto connection = lookup(relay)) {
        if (not connection->post(events::connection::resubscribe{ .subscription_id = subscription_id, .filters = filters })) {
          spdlog::warn("[pool] {} refused new filters for {}", relay.str(), subscription_id);
        }
      }
    }
  }

  /**
   * @brief Publishes an event to the target relays.
   *
   * Targets that are not Connected are reported as not attempted.
   *
   * @param targets Explicit relays, or all_relays for every relay with the write flag
   * @throws relay_not_found
   */
  auto publish(nostr::protocol::event_data event, relay_targets targets = all_relays)
    -> boost::asio::awaitable<publish_report>
  {
    const auto selected = select(targets, [](const relay_options &opts) { return opts.write; });

    publish_report report{ .event_id = event.id, .outcomes = {} };
    using result_t = std::pair<nostr::relay_url, publish_outcome>;
    auto results = std::make_shared<async::async_queue<result_t>>(io_context_, std::max<std::size_t>(1, selected.size()));

    std::size_t attempted = 0;
    for (const auto &connection : selected) {
      if (connection->status() != connection_status::connected) {
        report.outcomes.emplace(connection->url(),
          publish_outcome{ .result = publish_outcome::kind::not_attempted, .message = "not connected" });
        continue;
      }
      ++attempted;
      connection->publish(event,
        connection->options().publish_timeout,
        [results, url = connection->url()](publish_outcome outcome) { results->push({ url, std::move(outcome) }); });
    }

    for (std::size_t i = 0; i < attempted; ++i) {
      auto [url, outcome] = co_await results->pop();
      report.outcomes.insert_or_assign(std::move(url), std::move(outcome));
    }

    spdlog::debug("[pool] Published {}: {}/{} accepted", report.event_id, report.accepted_count(), selected.size());
    co_return report;
  }

  /**
   * @brief One-shot query: collects matching events from the Connected targets
   * until each is done or the timeout fires.
   *
   * A relay is done at its EOSE, or later as @p options.exit directs, or when
   * it stops serving the fetch. Results are deduplicated within this fetch,
   * stored, and not sent to the unified stream.
   *
   * @throws relay_not_found
   */
  auto fetch_events(nostr::filters filters, relay_targets targets = all_relays, fetch_options options = {})
    -> boost::asio::awaitable<std::vector<nostr::protocol::event_data>>
  {
    if (filters.empty()) { throw std::invalid_argument("Fetch needs at least one filter"); }

    auto selected = select(targets, [](const relay_options &opts) { return opts.read; });
    std::erase_if(selected, [](const auto &connection) { return connection->status() != connection_status::connected; });

    std::vector<nostr::protocol::event_data> collected;
    if (selected.empty()) { co_return collected; }

    std::set<nostr::relay_url> waiting;
    for (const auto &connection : selected) { waiting.insert(connection->url()); }

    // Per relay: EOSE, CLOSED or loss, and the end of its linger period; plus timeout and abort.
    const auto control_slots = 3 * waiting.size() + 2;
    auto queue = std::make_shared<inbound_router::fetch_queue>(io_context_, options_.stream_buffer + control_slots);
    auto subscription_id = core::id_generator::subscription_id();
    router_->register_fetch(subscription_id, queue, options_.stream_buffer);
    registry_->add(filters, waiting, subscription_id);
    for (const auto &connection : selected) {
      if (not connection->post(events::connection::subscribe{ .subscription_id = subscription_id, .filters = filters })) {
        waiting.erase(connection->url());
      }
    }

    const auto executor = co_await boost::asio::this_coro::executor;
    const auto deadline = std::chrono::steady_clock::now() + options.timeout;
    boost::asio::steady_timer timer(executor, options.timeout);
    timer.async_wait([queue](const boost::system::error_code &error) {
      if (not error) { static_cast<void>(queue->push_evicting(events::fetch::timed_out{})); }
    });

    std::map<nostr::relay_url, std::size_t> lingering;///< Events still awaited after EOSE
    std::vector<std::shared_ptr<boost::asio::steady_timer>> linger_timers;
    auto relay_done_at_eose = [&](const nostr::relay_url &relay) {
      return std::visit(
        [&](const auto &policy) {
          using policy_t = std::decay_t<decltype(policy)>;
          if constexpr (std::is_same_v<policy_t, fetch_exit::after_events>) {
            if (policy.count == 0) { return true; }
            lingering.insert_or_assign(relay, policy.count);
            return false;
          } else if constexpr (std::is_same_v<policy_t, fetch_exit::after_duration>) {
            auto linger = std::make_shared<boost::asio::steady_timer>(executor, policy.duration);
            linger->async_wait([queue, relay](const boost::system::error_code &error) {
              if (not error) { static_cast<void>(queue->push_evicting(events::fetch::linger_elapsed{ .relay = relay })); }
            });
            linger_timers.push_back(std::move(linger));
            return false;
          } else {
            return true;
          }
        },
        options.exit);
    };

    std::unordered_set<std::string> seen;
    std::set<nostr::relay_url> reached_eose;
    bool finished = false;
    while (not finished and not waiting.empty()) {
      auto signal = co_await queue->pop();
      std::visit(
        [&](auto &evt) {
          using signal_t = std::decay_t<decltype(evt)>;
          if constexpr (std::is_same_v<signal_t, events::fetch::event_received>) {
            if (seen.insert(evt.event.id).second) { collected.push_back(std::move(evt.event)); }
            auto pending = lingering.find(evt.relay);
            if (pending != lingering.end() and --pending->second == 0) {
              lingering.erase(pending);
              waiting.erase(evt.relay);
            }
          } else if constexpr (std::is_same_v<signal_t, events::fetch::eose_received>) {
            if (waiting.contains(evt.relay) and reached_eose.insert(evt.relay).second and relay_done_at_eose(evt.relay)) {
              waiting.erase(evt.relay);
            }
          } else if constexpr (std::is_same_v<signal_t, events::fetch::relay_gone>
                               or std::is_same_v<signal_t, events::fetch::linger_elapsed>) {
            lingering.erase(evt.relay);
            waiting.erase(evt.relay);
          } else if constexpr (std::is_same_v<signal_t, events::fetch::timed_out>) {
            spdlog::debug("[pool] Fetch {} timed out waiting on {} relays", subscription_id, waiting.size());
            finished = true;
          } else {
            finished = true;
          }
        },
        signal);
      if (std::chrono::steady_clock::now() >= deadline) { finished = true; }
    }

    timer.cancel();
    for (const auto &linger : linger_timers) { linger->cancel(); }
    router_->unregister_fetch(subscription_id);
    if (registry_->is_active(subscription_id)) { close_subscription(subscription_id); }

    spdlog::debug("[pool] Fetch {} collected {} events", subscription_id, collected.size());
    co_return collected;
  }

  /// fetch_events() that exits on EOSE and gives up after @p timeout
  auto fetch_events(nostr::filters filters, relay_targets targets, std::chrono::milliseconds timeout)
    -> boost::asio::awaitable<std::vector<nostr::protocol::event_data>>
  {
    return fetch_events(std::move(filters), std::move(targets), fetch_options{ .timeout = timeout, .exit = {} });
  }

  /**
   * @brief Runs a negentropy exchange against one relay over the locally
   * stored events matching @p scope.
   *
   * A relay that is not Connected yields an incomplete result.
   *
   * @throws relay_not_found
   */
  auto reconcile(std::string_view url, nostr::filter scope, reconciliation_options options = {})
    -> boost::asio::awaitable<reconciliation_result>
  {
    auto connection = find(url);
    if (connection->status() != connection_status::connected) {
      co_return reconciliation_result{ .relay = connection->url(),
        .need = {},
        .have = {},
        .complete = false,
        .error = "relay not connected",
        .rounds = 0 };
    }

    auto local_scope = scope;
    local_scope.limit.reset();
    const auto local = store_ ? store_->query(local_scope) : std::vector<nostr::protocol::event_data>{};

    reconciliation_session<connection_t> session(io_context_, connection, router_, std::move(scope), options);
    co_return co_await session.run(local);
  }

  /**
   * @brief Reconciles with one relay, then transfers the difference in the
   * requested direction: needed events are fetched by id in batches and
   * stored, had events are published to that relay.
   *
   * Acts on the partial difference when reconciliation is incomplete.
   *
   * @throws relay_not_found
   */
  auto sync(std::string_view url, nostr::filter scope, sync_options options = {})
    -> boost::asio::awaitable<sync_report>
  {
    const auto target = find(url)->url();
    sync_report report{ .reconciliation = co_await reconcile(url, std::move(scope), options.reconciliation),
      .received = 0,
      .sent = 0,
      .failed = {} };
    const auto &difference = report.reconciliation;

    const bool down = options.direction != sync_direction::up;
    const bool up = options.direction != sync_direction::down;
    const auto batch_size = std::max<std::size_t>(1, options.batch_size);

    if (down) {
      for (std::size_t offset = 0; offset < difference.need.size(); offset += batch_size) {
        const auto last = std::min(difference.need.size(), offset + batch_size);
        nostr::filter by_id;
        by_id.ids.insert(difference.need.begin() + static_cast<std::ptrdiff_t>(offset),
          difference.need.begin() + static_cast<std::ptrdiff_t>(last));

        const auto fetched = co_await fetch_events({ by_id }, std::vector{ target.str() }, options.fetch_timeout);
        std::unordered_set<std::string> received;
        for (const auto &event : fetched) { received.insert(event.id); }
        report.received += received.size();
        for (const auto &event_id : by_id.ids) {
          if (not received.contains(event_id)) { report.failed.push_back(event_id); }
        }
      }
    }

    if (up and store_ and not difference.have.empty()) {
      nostr::filter by_id;
      by_id.ids.insert(difference.have.begin(), difference.have.end());
      for (auto &event : store_->query(by_id)) {
        auto published = co_await publish(event, std::vector{ target.str() });
        const auto outcome = published.outcomes.find(target);
        if (outcome != published.outcomes.end() and outcome->second.is_accepted()) {
          ++report.sent;
        } else {
          report.failed.push_back(event.id);
        }
      }
    }

    spdlog::info("[pool] Sync with {}: received {}, sent {}, failed {}",
      target.str(),
      report.received,
      report.sent,
      report.failed.size());
    co_return report;
  }

  [[nodiscard]] auto relays() const -> std::vector<nostr::relay_url>
  {
    const std::scoped_lock lock(mutex_);
    std::vector<nostr::relay_url> urls;
    urls.reserve(connections_.size());
    for (const auto &[url, connection] : connections_) { urls.push_back(url); }
    return urls;
  }

  /**
   * @throws relay_not_found
   */
  [[nodiscard]] auto status(std::string_view url) const -> connection_status { return find(url)->status(); }

  [[nodiscard]] auto statuses() const -> std::map<nostr::relay_url, connection_status>
  {
    const std::scoped_lock lock(mutex_);
    std::map<nostr::relay_url, connection_status> snapshot;
    for (const auto &[url, connection] : connections_) { snapshot.emplace(url, connection->status()); }
    return snapshot;
  }

  /**
   * @brief Adds a consumer of the unified, deduplicated event stream.
   *
   * @param capacity Buffer size, or the pool's default when omitted
   */
  [[nodiscard]] auto events(std::optional<std::size_t> capacity = std::nullopt)
    -> std::shared_ptr<async::consumer<stream_item>>
  {
    return router_->subscribe_events(capacity.value_or(options_.stream_buffer));
  }

  [[nodiscard]] auto notifications() -> std::shared_ptr<async::consumer<notification>>
  {
    return router_->subscribe_notifications(options_.notification_buffer);
  }

  /// Relays that delivered @p event_id, while it is remembered
  [[nodiscard]] auto confirmations(const std::string &event_id) const -> std::optional<std::set<nostr::relay_url>>
  {
    return router_->deduplicator().confirmations(event_id);
  }

  [[nodiscard]] auto subscription(const std::string &subscription_id) const -> std::optional<pool::subscription>
  {
    return registry_->get(subscription_id);
  }

  [[nodiscard]] auto store() const -> const std::shared_ptr<Store> & { return store_; }

  [[nodiscard]] auto is_shut_down() const -> bool { return shut_down_.load(); }

  /**
   * @brief Terminates every connection, closes both streams and releases all
   * subscription state. Completes once every connection actor has exited.
   * Idempotent.
   */
  auto shutdown() -> boost::asio::awaitable<void>
  {
    std::vector<std::shared_ptr<connection_t>> stopping;
    {
      const std::scoped_lock lock(mutex_);
      if (not shut_down_.exchange(true)) { spdlog::info("[pool] Shutting down {} relays", connections_.size()); }
      for (auto &[url, connection] : connections_) { stopping.push_back(connection); }
      connections_.clear();
      for (const auto &weak : retired_) {
        if (auto connection = weak.lock()) { stopping.push_back(std::move(connection)); }
      }
      retired_.clear();
      for (const auto &weak : grace_timers_) {
        if (auto timer = weak.lock()) { timer->cancel(); }
      }
      grace_timers_.clear();
    }

    for (const auto &connection : stopping) { connection->terminate(); }
    router_->close();
    for (const auto &connection : stopping) { co_await connection->wait_stopped(); }
    registry_->clear();
    router_->deduplicator().clear();
    spdlog::debug("[pool] Shutdown complete");
  }

private:
  auto ensure_running() const -> void
  {
    if (shut_down_.load()) { throw pool_shut_down(); }
  }

  auto ensure_running_locked() const -> void
  {
    const std::scoped_lock lock(mutex_);
    ensure_running();
  }

  [[nodiscard]] auto find(std::string_view url) const -> std::shared_ptr<connection_t>
  {
    const auto normalized = nostr::relay_url::parse(url);
    const std::scoped_lock lock(mutex_);
    ensure_running();
    auto iter = connections_.find(normalized);
    if (iter == connections_.end()) { throw relay_not_found(normalized.str()); }
    return iter->second;
  }

  [[nodiscard]] auto lookup(const nostr::relay_url &url) const -> std::shared_ptr<connection_t>
  {
    const std::scoped_lock lock(mutex_);
    auto iter = connections_.find(url);
    return iter == connections_.end() ? nullptr : iter->second;
  }

  [[nodiscard]] auto snapshot_connections() const -> std::vector<std::shared_ptr<connection_t>>
  {
    const std::scoped_lock lock(mutex_);
    ensure_running();
    std::vector<std::shared_ptr<connection_t>> snapshot;
    snapshot.reserve(connections_.size());
    for (const auto &[url, connection] : connections_) { snapshot.push_back(connection); }
    return snapshot;
  }

  /**
   * @brief Resolves targets to connections.
   *
   * @param include Applied only when every relay is selected
   */
  template<typename Predicate>
  [[nodiscard]] auto select(const relay_targets &targets, Predicate include) const
    -> std::vector<std::shared_ptr<connection_t>>
  {
    if (not targets) {
      auto every = snapshot_connections();
      std::erase_if(every, [&include](const auto &connection) { return not include(connection->options()); });
      return every;
    }

    std::vector<std::shared_ptr<connection_t>> selected;
    std::set<nostr::relay_url> unique;
    for (const auto &url : *targets) {
      auto connection = find(url);
      if (unique.insert(connection->url()).second) { selected.push_back(std::move(connection)); }
    }
    return selected;
  }

  auto close_subscription(const std::string &subscription_id) -> void
  {
    const auto relays = registry_->begin_close(subscription_id);
    for (const auto &relay : relays) {
      auto connection = lookup(relay);
      if (not connection or not connection->post(events::connection::unsubscribe{ .subscription_id = subscription_id })) {
        registry_->acknowledge_close(subscription_id, relay);
      }
    }
    if (relays.empty() or not registry_->get(subscription_id)) { return; }

    auto timer = std::make_shared<boost::asio::steady_timer>(*io_context_, options_.close_grace);
    timer->async_wait([timer, registry = registry_, subscription_id](const boost::system::error_code &error) {
      if (error) { return; }
      if (registry->force_erase(subscription_id)) {
        spdlog::debug("[pool] Subscription {} released after close grace period", subscription_id);
      }
    });

    const std::scoped_lock lock(mutex_);
    std::erase_if(grace_timers_, [](const auto &weak) { return weak.expired(); });
    grace_timers_.push_back(timer);
  }

  std::shared_ptr<boost::asio::io_context> io_context_;
  stream_factory factory_;
  pool_options options_;
  std::shared_ptr<Store> store_;
  std::shared_ptr<subscription_registry> registry_;
  std::shared_ptr<inbound_router> router_;

  mutable std::mutex mutex_;
  std::map<nostr::relay_url, std::shared_ptr<connection_t>> connections_;
  std::vector<std::weak_ptr<connection_t>> retired_;
  std::vector<std::weak_ptr<boost::asio::steady_timer>> grace_timers_;
  std::atomic<bool> shut_down_{ false };
};

}// namespace nostr_pool::pool
