#pragma once

#include <pool/connection_status.hpp>
#include <pool/events.hpp>
#include <pool/inbound_router.hpp>
#include <pool/options.hpp>
#include <pool/results.hpp>
#include <pool/subscription_registry.hpp>

#include <async/async_queue.hpp>
#include <concepts/transport_stream.hpp>
#include <core/backoff.hpp>
#include <core/processor_runner.hpp>
#include <nostr/protocol.hpp>
#include <nostr/relay_url.hpp>
#include <nostr/request_tracker.hpp>

#include <atomic>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <span>
#include <spdlog/spdlog.h>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace nostr_pool::pool {

/**
 * @brief One relay's connection state machine.
 *
 * An actor: a single coroutine on its own strand drains the bounded mailbox
 * of commands from the pool. Completions from the transport and timers are
 * posted to the same strand instead, so a full mailbox can only refuse new
 * commands and never loses a completion. All state is touched on the strand;
 * the status is additionally mirrored into an atomic for snapshots.
 *
 * Initialized -> Connecting -> Connected -> Disconnected -> Connecting ... and
 * any state -> Terminated. A fresh transport is created for every attempt.
 *
 * @tparam Stream Transport satisfying concepts::transport_stream
 */
template<concepts::transport_stream Stream>
class relay_connection : public std::enable_shared_from_this<relay_connection<Stream>>
{
public:
  using stream_factory = std::function<std::shared_ptr<Stream>()>;
  using mailbox_t = async::async_queue<events::connection::in_t>;
  using strand_t = boost::asio::strand<boost::asio::io_context::executor_type>;

  relay_connection(const std::shared_ptr<boost::asio::io_context> &io_context,
    nostr::relay_url url,
    relay_options options,
    stream_factory factory,
    std::shared_ptr<subscription_registry> registry,
    std::shared_ptr<inbound_router> router,
    std::size_t mailbox_capacity = async::async_queue<events::connection::in_t>::default_capacity)
    : io_context_(io_context), strand_(boost::asio::make_strand(*io_context)), url_(std::move(url)),
      options_(std::move(options)), factory_(std::move(factory)), registry_(std::move(registry)),
      router_(std::move(router)), mailbox_(std::make_shared<mailbox_t>(io_context, mailbox_capacity)),
      stopped_(std::make_shared<async::async_queue<bool>>(io_context, 1)), backoff_(options_.backoff),
      reconnect_timer_(strand_), tracker_(strand_)
  {}

  relay_connection(const relay_connection &) = delete;
  auto operator=(const relay_connection &) -> relay_connection & = delete;
  relay_connection(relay_connection &&) = delete;
  auto operator=(relay_connection &&) -> relay_connection & = delete;
  ~relay_connection() = default;

  /**
   * @brief Spawns the actor on its strand.
   */
  auto start() -> std::shared_ptr<core::coroutine_state>
  {
    return core::spawn_processor(strand_, this->shared_from_this(), "relay " + url_.str());
  }

  [[nodiscard]] auto url() const -> const nostr::relay_url & { return url_; }
  [[nodiscard]] auto options() const -> const relay_options & { return options_; }
  [[nodiscard]] auto status() const -> connection_status { return status_.load(); }

  /**
   * @brief Enqueues a command.
   *
   * @return false once the connection is terminated or its mailbox is full
   */
  auto post(events::connection::in_t message) -> bool { return mailbox_->push(std::move(message)); }

  auto connect() -> bool { return post(events::connection::connect{}); }

  /**
   * @brief Terminates from any state. Runs on the strand ahead of queued
   * commands, so a full mailbox cannot hold it back.
   *
   * @return false if the connection was already terminated
   */
  auto terminate() -> bool
  {
    if (status() == connection_status::terminated) { return false; }
    boost::asio::post(strand_, [self = this->shared_from_this()]() { self->handle(events::connection::terminate{}); });
    return true;
  }

  /**
   * @brief Publishes an event; @p on_outcome is always called exactly once.
   */
  auto publish(nostr::protocol::event_data event,
    std::chrono::milliseconds timeout,
    std::function<void(publish_outcome)> on_outcome) -> void
  {
    auto callback = std::make_shared<std::function<void(publish_outcome)>>(std::move(on_outcome));
    if (not post(events::connection::publish{
          .event = std::move(event), .timeout = timeout, .on_outcome = [callback](publish_outcome outcome) {
            (*callback)(std::move(outcome));
          } })) {
      (*callback)(publish_outcome{ .result = publish_outcome::kind::not_attempted, .message = "relay unavailable" });
    }
  }

  /**
   * @brief Sends a pre-encoded frame; @p on_done receives false if it was never written.
   */
  auto send(std::string frame, events::connection::frame_kind kind, std::function<void(bool)> on_done) -> void
  {
    auto callback = std::make_shared<std::function<void(bool)>>(std::move(on_done));
    if (not post(events::connection::send{
          .frame = std::move(frame), .kind = kind, .on_done = [callback](bool written) { (*callback)(written); } })) {
      (*callback)(false);
    }
  }

  /**
   * @brief Completes once the actor has exited.
   */
  auto wait_stopped() -> boost::asio::awaitable<void>
  {
    try {
      static_cast<void>(co_await stopped_->pop());
    } catch (const boost::system::system_error &err) {
      if (not core::is_shutdown_error(err.code())) { throw; }
    }
  }

  // NOLINTNEXTLINE(performance-unnecessary-value-param)
  auto run_once(std::shared_ptr<boost::asio::cancellation_slot> cancel_slot = nullptr) -> boost::asio::awaitable<void>
  {
    auto evt = co_await mailbox_->pop(cancel_slot);
    std::visit([&](auto &&message) { handle(std::forward<decltype(message)>(message)); }, evt);
    co_return;
  }

  // NOLINTNEXTLINE(performance-unnecessary-value-param)
  auto run(std::shared_ptr<boost::asio::cancellation_slot> cancel_slot = nullptr) -> boost::asio::awaitable<void>
  {
    try {
      while (status() != connection_status::terminated) { co_await run_once(cancel_slot); }
    } catch (const boost::system::system_error &err) {
      if (not core::is_shutdown_error(err.code())) {
        spdlog::error("[{}] Unexpected error in run loop: {}", url_.str(), err.what());
      }
      if (status() != connection_status::terminated) { handle(events::connection::terminate{}); }
    }
    drain_mailbox();
    stopped_->close();
    spdlog::debug("[{}] Connection actor stopped", url_.str());
  }

private:
  struct frame
  {
    std::string text;
    events::connection::frame_kind kind{};
    std::function<void(bool)> on_done;
  };

  auto handle(const events::connection::connect & /*cmd*/) -> void
  {
    const auto current = status();
    if (current == connection_status::initialized or current == connection_status::disconnected) {
      start_connect();
    }
  }

  auto handle(events::connection::send &cmd) -> void
  {
    if (status() != connection_status::connected) {
      if (cmd.on_done) { cmd.on_done(false); }
      return;
    }
    enqueue(frame{ .text = std::move(cmd.frame), .kind = cmd.kind, .on_done = std::move(cmd.on_done) });
  }

  auto handle(events::connection::subscribe &cmd) -> void
  {
    if (status() != connection_status::connected or served_.contains(cmd.subscription_id)) { return; }
    if (not registry_->is_active_on(cmd.subscription_id, url_)) { return; }
    issue_req(cmd.subscription_id, cmd.filters);
  }

  auto handle(events::connection::resubscribe &cmd) -> void
  {
    if (status() != connection_status::connected) { return; }
    if (not registry_->is_active_on(cmd.subscription_id, url_)) { return; }
    issue_req(cmd.subscription_id, cmd.filters);
  }

  auto handle(const events::connection::unsubscribe &cmd) -> void
  {
    if (served_.erase(cmd.subscription_id) == 0 or status() != connection_status::connected) {
      registry_->acknowledge_close(cmd.subscription_id, url_);
      return;
    }

    enqueue(frame{ .text = nostr::protocol::close{ .subscription_id = cmd.subscription_id }.serialize(),
      .kind = events::connection::frame_kind::subscription,
      .on_done = [registry = registry_, subscription_id = cmd.subscription_id, url = url_](bool /*written*/) {
        registry->acknowledge_close(subscription_id, url);
      } });
  }

  auto handle(events::connection::publish &cmd) -> void
  {
    if (status() != connection_status::connected) {
      cmd.on_outcome(publish_outcome{ .result = publish_outcome::kind::not_attempted, .message = "not connected" });
      return;
    }

    tracker_.track(
      cmd.event.id,
      [on_outcome = std::move(cmd.on_outcome)](const nostr::protocol::ok &response) {
        on_outcome(publish_outcome{ .result = response.accepted ? publish_outcome::kind::accepted
                                                                : publish_outcome::kind::rejected,
          .message = response.message });
      },
      cmd.timeout);

    enqueue(frame{ .text = nostr::protocol::event::from_event_data(cmd.event).serialize(),
      .kind = events::connection::frame_kind::publish,
      .on_done = nullptr });
  }

  auto handle(const events::connection::terminate & /*cmd*/) -> void
  {
    if (status() == connection_status::terminated) { return; }

    reconnect_timer_.cancel();
    tear_down("connection terminated");
    close_stream();
    set_status(connection_status::terminated);
    mailbox_->close();
  }

  auto handle(const events::connection::connected &evt) -> void
  {
    if (evt.generation != generation_ or status() != connection_status::connecting) { return; }

    spdlog::info("[{}] Connected", url_.str());
    backoff_.reset();
    set_status(connection_status::connected);
    start_read();

    for (const auto &[subscription_id, filters] : registry_->active_for(url_)) {
      if (not served_.contains(subscription_id)) { issue_req(subscription_id, filters); }
    }
    write_next();
  }

  auto handle(const events::connection::connect_failed &evt) -> void
  {
    if (evt.generation != generation_ or status() != connection_status::connecting) { return; }

    spdlog::warn("[{}] Connect failed: {}", url_.str(), evt.reason);
    stream_.reset();
    set_status(connection_status::disconnected);
    router_->on_transport_error(url_, evt.reason);
    schedule_reconnect();
  }

  auto handle(events::connection::message_received &evt) -> void
  {
    if (evt.generation != generation_ or status() != connection_status::connected) { return; }

    dispatch(evt.text);
    // dispatch() never leaves the Connected state, so keep reading.
    start_read();
  }

  auto handle(const events::connection::write_completed &evt) -> void
  {
    if (evt.generation != generation_ or not in_flight_) { return; }

    if (evt.error) {
      lose_transport(evt.error.message());
      return;
    }

    auto written = std::move(*in_flight_);
    in_flight_.reset();
    if (written.on_done) { written.on_done(true); }
    write_next();
  }

  auto handle(const events::connection::transport_lost &evt) -> void
  {
    if (evt.generation != generation_) { return; }
    if (status() != connection_status::connected and status() != connection_status::connecting) { return; }
    lose_transport(evt.reason);
  }

  auto handle(const events::connection::reconnect_due &evt) -> void
  {
    if (evt.token != reconnect_token_ or status() != connection_status::disconnected) { return; }
    spdlog::debug("[{}] Reconnecting (attempt {})", url_.str(), backoff_.attempts());
    start_connect();
  }

  auto start_connect() -> void
  {
    set_status(connection_status::connecting);
    ++generation_;
    stream_ = factory_();

    const auto generation = generation_;
    stream_->async_connect(
      typename Stream::connection_params_t{ .host = url_.host(), .port = url_.port(), .path = target_ },
      [self = this->weak_from_this(), strand = strand_, stream = stream_, generation](
        const boost::system::error_code &error, std::size_t /*bytes*/) {
        if (error) {
          complete(self, strand, events::connection::connect_failed{ .generation = generation, .reason = error.message() });
        } else {
          complete(self, strand, events::connection::connected{ .generation = generation });
        }
      });
  }

  auto start_read() -> void
  {
    if (not stream_) { return; }
    const auto generation = generation_;
    stream_->async_read([self = this->weak_from_this(), strand = strand_, stream = stream_, generation](
                          const boost::system::error_code &error, std::string text) {
      if (error) {
        complete(self, strand, events::connection::transport_lost{ .generation = generation, .reason = error.message() });
      } else {
        complete(self, strand, events::connection::message_received{ .generation = generation, .text = std::move(text) });
      }
    });
  }

  auto dispatch(const std::string &text) -> void
  {
    auto message = nostr::protocol::decode_relay_message(text);
    if (not message) {
      router_->on_malformed(url_, text);
      return;
    }

    if (const auto *response = std::get_if<nostr::protocol::ok>(&*message)) {
      if (tracker_.resolve(*response)) { return; }
    } else if (const auto *closed = std::get_if<nostr::protocol::closed>(&*message)) {
      served_.erase(closed->subscription_id);
    }
    router_->route(url_, *message);
  }

  auto issue_req(const std::string &subscription_id, const nostr::filters &filters) -> void
  {
    served_.insert(subscription_id);
    registry_->reset_eose(subscription_id, url_);
    enqueue(frame{ .text = nostr::protocol::req{ .subscription_id = subscription_id, .filter_list = filters }.serialize(),
      .kind = events::connection::frame_kind::subscription,
      .on_done = nullptr });
  }

  auto enqueue(frame outbound) -> void
  {
    outbound_.push_back(std::move(outbound));
    write_next();
  }

  auto write_next() -> void
  {
    if (in_flight_ or outbound_.empty() or status() != connection_status::connected or not stream_) { return; }

    in_flight_ = std::move(outbound_.front());
    outbound_.pop_front();

    const auto generation = generation_;
    const std::span<const std::byte> bytes = std::as_bytes(std::span(in_flight_->text));
    stream_->async_write(bytes,
      [self = this->weak_from_this(), strand = strand_, stream = stream_, generation](
        const boost::system::error_code &error, std::size_t /*bytes*/) {
        complete(self, strand, events::connection::write_completed{ .generation = generation, .error = error });
      });
  }

  auto lose_transport(const std::string &reason) -> void
  {
    spdlog::warn("[{}] Transport lost: {}", url_.str(), reason);
    tear_down("connection lost");
    close_stream();
    set_status(connection_status::disconnected);
    router_->on_transport_error(url_, reason);
    schedule_reconnect();
  }

  /**
   * @brief Drops every queued frame and fails everything tied to the transport.
   */
  auto tear_down(const std::string &reason) -> void
  {
    served_.clear();

    auto dropped = std::move(outbound_);
    outbound_.clear();
    if (in_flight_) {
      dropped.push_front(std::move(*in_flight_));
      in_flight_.reset();
    }
    for (auto &outbound : dropped) {
      if (outbound.on_done) { outbound.on_done(false); }
    }

    tracker_.fail_all(reason);
    router_->on_relay_lost(url_, reason);
  }

  auto close_stream() -> void
  {
    if (not stream_) { return; }
    ++generation_;
    auto stream = std::move(stream_);
    stream_.reset();
    stream->async_close([stream](const boost::system::error_code &error, std::size_t /*bytes*/) {
      if (error) { spdlog::trace("Transport close reported: {}", error.message()); }
    });
  }

  auto schedule_reconnect() -> void
  {
    if (not options_.reconnect or status() == connection_status::terminated) { return; }

    const auto delay = backoff_.next_delay();
    const auto token = ++reconnect_token_;
    spdlog::debug("[{}] Reconnecting in {} ms", url_.str(), delay.count());

    reconnect_timer_.expires_after(delay);
    reconnect_timer_.async_wait([self = this->weak_from_this(), strand = strand_, token](const boost::system::error_code &error) {
      if (not error) { complete(self, strand, events::connection::reconnect_due{ .token = token }); }
    });
  }

  /**
   * @brief Runs a completion on the strand, between two mailbox commands.
   *
   * Completions of a connection that no longer exists are discarded; stale
   * ones of a live connection are filtered by their generation or token.
   */
  static auto complete(const std::weak_ptr<relay_connection> &self,
    const strand_t &strand,
    events::connection::completion_t completion) -> void
  {
    boost::asio::post(strand, [self, completion = std::move(completion)]() mutable {
      if (auto connection = self.lock()) {
        std::visit([&connection](auto &evt) { connection->handle(evt); }, completion);
      }
    });
  }

  auto set_status(connection_status next) -> void
  {
    const auto previous = status_.exchange(next);
    if (previous != next) { router_->on_status(url_, previous, next); }
  }

  /**
   * @brief Completes commands left behind after termination.
   */
  auto drain_mailbox() -> void
  {
    while (auto leftover = mailbox_->try_pop()) {
      std::visit(
        [this](auto &message) {
          using message_t = std::decay_t<decltype(message)>;
          if constexpr (std::is_same_v<message_t, events::connection::publish>) {
            message.on_outcome(
              publish_outcome{ .result = publish_outcome::kind::not_attempted, .message = "connection terminated" });
          } else if constexpr (std::is_same_v<message_t, events::connection::send>) {
            if (message.on_done) { message.on_done(false); }
          } else if constexpr (std::is_same_v<message_t, events::connection::unsubscribe>) {
            registry_->acknowledge_close(message.subscription_id, url_);
          }
        },
        *leftover);
    }
  }

  std::shared_ptr<boost::asio::io_context> io_context_;
  strand_t strand_;
  nostr::relay_url url_;
  std::string target_{ url_.target() };
  relay_options options_;
  stream_factory factory_;
  std::shared_ptr<subscription_registry> registry_;
  std::shared_ptr<inbound_router> router_;
  std::shared_ptr<mailbox_t> mailbox_;
  std::shared_ptr<async::async_queue<bool>> stopped_;

  std::atomic<connection_status> status_{ connection_status::initialized };
  core::backoff backoff_;
  boost::asio::steady_timer reconnect_timer_;
  nostr::request_tracker tracker_;

  std::shared_ptr<Stream> stream_;
  std::uint64_t generation_{ 0 };
  std::uint64_t reconnect_token_{ 0 };
  std::set<std::string> served_;
  std::deque<frame> outbound_;
  std::optional<frame> in_flight_;
};

}// namespace nostr_pool::pool
