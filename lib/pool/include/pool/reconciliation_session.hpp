#pragma once

#include <pool/events.hpp>
#include <pool/inbound_router.hpp>
#include <pool/options.hpp>
#include <pool/results.hpp>

#include <async/async_queue.hpp>
#include <core/id_generator.hpp>
#include <core/sha256.hpp>
#include <negentropy/reconciler.hpp>
#include <negentropy/storage.hpp>
#include <nostr/event.hpp>
#include <nostr/filter.hpp>
#include <nostr/protocol.hpp>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <spdlog/spdlog.h>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace nostr_pool::pool {

/**
 * @brief Runs one negentropy exchange with one relay as the initiator.
 *
 * Local items come from the caller; the relay's replies arrive through the
 * inbound router, keyed by this session's id. The session ends when the
 * reconciler has nothing left to ask, when the relay answers NEG-ERR, when a
 * reply does not arrive in time, or when the relay goes away; in every case
 * the difference found so far is returned.
 *
 * @tparam Connection relay_connection<Stream>
 */
template<typename Connection> class reconciliation_session
{
public:
  reconciliation_session(const std::shared_ptr<boost::asio::io_context> &io_context,
    std::shared_ptr<Connection> connection,
    std::shared_ptr<inbound_router> router,
    nostr::filter scope,
    reconciliation_options options)
    : io_context_(io_context), connection_(std::move(connection)), router_(std::move(router)),
      scope_(std::move(scope)), options_(options), session_id_(core::id_generator::prefixed_id("neg-")),
      queue_(std::make_shared<inbound_router::session_queue>(io_context, signal_capacity)),
      result_{ .relay = connection_->url(), .need = {}, .have = {}, .complete = false, .error = {}, .rounds = 0 }
  {}

  [[nodiscard]] auto session_id() const -> const std::string & { return session_id_; }

  /**
   * @brief Performs the exchange.
   *
   * @param local Locally stored events within the scope
   */
  auto run(const std::vector<nostr::protocol::event_data> &local) -> boost::asio::awaitable<reconciliation_result>
  {
    negentropy::vector_storage storage;
    std::string raw_id;
    for (const auto &event : local) {
      if (not nostr::protocol::is_hex32(event.id) or not core::from_hex(event.id, raw_id)) { continue; }
      storage.insert(event.created_at, raw_id);
    }
    storage.seal();

    negentropy::reconciler reconciler(storage, options_.frame_size_limit);
    router_->register_session(connection_->url(), session_id_, queue_);

    const auto executor = co_await boost::asio::this_coro::executor;
    boost::asio::steady_timer timer(executor);

    spdlog::debug("[negentropy] {} opening {} with {} local items", connection_->url().str(), session_id_, storage.size());
    send(nostr::protocol::neg_open{
      .subscription_id = session_id_, .scope = scope_, .message = to_hex(reconciler.initiate()) }
           .serialize());
    arm(timer, options_.initial_timeout);

    bool relay_closed_session = false;
    while (true) {
      const auto signal = co_await queue_->pop();
      const bool finished = std::visit(
        [&](const auto &evt) -> bool {
          using signal_t = std::decay_t<decltype(evt)>;
          if constexpr (std::is_same_v<signal_t, events::reconciliation::message_received>) {
            return on_message(reconciler, timer, evt.hex);
          } else if constexpr (std::is_same_v<signal_t, events::reconciliation::error_received>) {
            relay_closed_session = true;
            result_.error = "relay error: " + evt.reason;
            return true;
          } else if constexpr (std::is_same_v<signal_t, events::reconciliation::timed_out>) {
            if (evt.round != round_) { return false; }
            result_.error = result_.rounds == 0 ? "no reply from relay (negentropy unsupported?)" : "timeout";
            return true;
          } else {
            relay_closed_session = true;
            result_.error = evt.reason;
            return true;
          }
        },
        signal);
      if (finished) { break; }
    }

    timer.cancel();
    router_->unregister_session(connection_->url(), session_id_);
    if (not relay_closed_session) { send(nostr::protocol::neg_close{ .subscription_id = session_id_ }.serialize()); }

    if (result_.complete) {
      spdlog::info("[negentropy] {} reconciled in {} rounds: need {}, have {}",
        connection_->url().str(),
        result_.rounds,
        result_.need.size(),
        result_.have.size());
    } else {
      spdlog::warn("[negentropy] {} incomplete after {} rounds: {}", connection_->url().str(), result_.rounds, result_.error);
    }
    co_return result_;
  }

private:
  static constexpr std::size_t signal_capacity = 64;

  static auto to_hex(const std::string &bytes) -> std::string
  {
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    return core::to_hex(std::span(reinterpret_cast<const std::uint8_t *>(bytes.data()), bytes.size()));
  }

  auto on_message(negentropy::reconciler &reconciler, boost::asio::steady_timer &timer, const std::string &hex)
    -> bool
  {
    ++result_.rounds;

    std::string message;
    if (not core::from_hex(hex, message)) {
      result_.error = "malformed NEG-MSG payload";
      return true;
    }

    std::vector<std::string> have;
    std::vector<std::string> need;
    std::optional<std::string> next;
    try {
      next = reconciler.reconcile(message, have, need);
    } catch (const negentropy::protocol_error &err) {
      result_.error = err.what();
      return true;
    }

    for (const auto &raw : have) { result_.have.push_back(to_hex(raw)); }
    for (const auto &raw : need) { result_.need.push_back(to_hex(raw)); }

    if (not next) {
      result_.complete = true;
      return true;
    }

    send(nostr::protocol::neg_msg{ .subscription_id = session_id_, .message = to_hex(*next) }.serialize());
    arm(timer, options_.round_timeout);
    return false;
  }

  auto send(std::string frame) -> void
  {
    connection_->send(std::move(frame),
      events::connection::frame_kind::reconciliation,
      [queue = queue_](bool written) {
        if (not written) { queue->push(events::reconciliation::aborted{ .reason = "relay not connected" }); }
      });
  }

  auto arm(boost::asio::steady_timer &timer, std::chrono::milliseconds timeout) -> void
  {
    const auto round = ++round_;
    timer.expires_after(timeout);
    timer.async_wait([queue = queue_, round](const boost::system::error_code &error) {
      if (not error) { queue->push(events::reconciliation::timed_out{ .round = round }); }
    });
  }

  std::shared_ptr<boost::asio::io_context> io_context_;
  std::shared_ptr<Connection> connection_;
  std::shared_ptr<inbound_router> router_;
  nostr::filter scope_;
  reconciliation_options options_;
  std::string session_id_;
  std::shared_ptr<inbound_router::session_queue> queue_;
  reconciliation_result result_;
  std::uint64_t round_{ 0 };
};

}// namespace nostr_pool::pool
