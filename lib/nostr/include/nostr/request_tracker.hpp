#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <cstdint>
#include <algorithm>
#include <functional>
#include <memory>
#include <nostr/protocol.hpp>
#include <string>
#include <unordered_map>
#include <vector>

namespace nostr_pool::nostr {

/**
 * @brief Tracks pending publishes and matches them with OK responses.
 *
 * Associates event IDs with callbacks and fires each callback exactly once:
 * with the relay's OK, with a synthetic rejection on timeout, or with a
 * synthetic rejection from fail_all(). Several publishes of the same id may be
 * pending at once; one OK resolves all of them.
 *
 * Not thread-safe: use it from the executor it was constructed with.
 */
class request_tracker
{
public:
  using callback_type = std::function<void(const protocol::ok &)>;

  /// Reason reported when no OK arrives in time
  static constexpr auto timeout_reason = "timeout";

  /**
   * @brief Constructs a request tracker.
   *
   * @param executor Executor (normally the owning connection's strand) for timers
   */
  explicit request_tracker(boost::asio::any_io_executor executor)
    : executor_(std::move(executor)), pending_(std::make_shared<pending_map>())
  {}

  request_tracker(const request_tracker &) = delete;
  auto operator=(const request_tracker &) -> request_tracker & = delete;
  request_tracker(request_tracker &&) = delete;
  auto operator=(request_tracker &&) -> request_tracker & = delete;
  ~request_tracker() { cancel_timers(); }

  /**
   * @brief Tracks a request with callback-based completion.
   *
   * @param event_id Event ID to track
   * @param callback Function to call when OK response received
   * @param timeout Maximum time to wait for response
   */
  auto track(const std::string &event_id, callback_type callback, std::chrono::milliseconds timeout) -> void
  {
    const auto ticket = next_ticket_++;
    auto timer = std::make_shared<boost::asio::steady_timer>(executor_, timeout);

    timer->async_wait([weak = std::weak_ptr<pending_map>(pending_), event_id, ticket](
                        const boost::system::error_code &error) {
      if (error) { return; }
      if (auto pending = weak.lock()) { handle_timeout(*pending, event_id, ticket); }
    });

    (*pending_)[event_id].push_back(
      pending_request{ .ticket = ticket, .callback = std::move(callback), .timer = std::move(timer) });
  }

  /**
   * @brief Checks if an event ID has a pending request.
   */
  [[nodiscard]] auto has_pending(const std::string &event_id) const -> bool { return pending_->contains(event_id); }

  [[nodiscard]] auto pending_count() const -> std::size_t
  {
    std::size_t count = 0;
    for (const auto &[event_id, requests] : *pending_) { count += requests.size(); }
    return count;
  }

  /**
   * @brief Resolves every pending request for the response's event id.
   *
   * @return false if nothing was pending for that id
   */
  auto resolve(const protocol::ok &response) -> bool
  {
    auto iter = pending_->find(response.event_id);
    if (iter == pending_->end()) { return false; }

    auto requests = std::move(iter->second);
    pending_->erase(iter);
    for (auto &request : requests) {
      request.timer->cancel();
      request.callback(response);
    }
    return true;
  }

  /**
   * @brief Rejects every pending request with the given reason.
   */
  auto fail_all(const std::string &reason) -> void
  {
    auto pending = std::move(*pending_);
    pending_->clear();
    for (auto &[event_id, requests] : pending) {
      for (auto &request : requests) {
        request.timer->cancel();
        request.callback(protocol::ok{ .event_id = event_id, .accepted = false, .message = reason });
      }
    }
  }

private:
  /// Internal structure for pending request state
  struct pending_request
  {
    std::uint64_t ticket{};///< Distinguishes repeated publishes of one id
    callback_type callback;///< Response callback
    std::shared_ptr<boost::asio::steady_timer> timer;///< Timeout timer
  };

  using pending_map = std::unordered_map<std::string, std::vector<pending_request>>;

  static auto handle_timeout(pending_map &pending, const std::string &event_id, std::uint64_t ticket) -> void
  {
    auto iter = pending.find(event_id);
    if (iter == pending.end()) { return; }

    auto &requests = iter->second;
    auto request_iter = std::ranges::find_if(
      requests, [ticket](const pending_request &request) { return request.ticket == ticket; });
    if (request_iter == requests.end()) { return; }

    auto callback = std::move(request_iter->callback);
    requests.erase(request_iter);
    if (requests.empty()) { pending.erase(iter); }

    callback(protocol::ok{ .event_id = event_id, .accepted = false, .message = timeout_reason });
  }

  auto cancel_timers() -> void
  {
    for (auto &[event_id, requests] : *pending_) {
      for (auto &request : requests) { request.timer->cancel(); }
    }
  }

  boost::asio::any_io_executor executor_;
  std::shared_ptr<pending_map> pending_;
  std::uint64_t next_ticket_{ 1 };
};

}// namespace nostr_pool::nostr
