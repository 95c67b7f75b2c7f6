#pragma once

#include <atomic>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/bind_cancellation_slot.hpp>
#include <boost/asio/cancellation_signal.hpp>
#include <boost/asio/experimental/concurrent_channel.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <cstddef>
#include <memory>
#include <optional>

namespace nostr_pool::async {

/**
 * @brief Bounded, thread-safe asynchronous queue for message passing between coroutines.
 *
 * @tparam T The type of elements stored in the queue
 *
 * Every actor in the pool owns one of these as its mailbox. Producers never
 * suspend: a push into a full or closed queue fails and reports it, leaving the
 * overflow decision to the caller.
 */
template<typename T> class async_queue
{
public:
  /// Capacity used when none is given
  static constexpr std::size_t default_capacity{ 1024 };

  /**
   * @brief Constructs a new async queue.
   *
   * @param io_context Shared pointer to the Boost.Asio io_context for async operations
   * @param capacity Maximum number of buffered elements (must be non-zero)
   */
  explicit async_queue(const std::shared_ptr<boost::asio::io_context> &io_context,
    std::size_t capacity = default_capacity)
    : io_context_(io_context), channel_(*io_context_, capacity == 0 ? 1 : capacity),
      capacity_(capacity == 0 ? 1 : capacity), size_(0)
  {}

  async_queue(const async_queue &) = delete;
  auto operator=(const async_queue &) -> async_queue & = delete;
  async_queue(async_queue &&) = delete;
  auto operator=(async_queue &&) -> async_queue & = delete;
  ~async_queue() = default;

  /**
   * @brief Pushes a value onto the queue without blocking.
   *
   * @param value The value to push (moved into the queue only on success)
   * @return false if the queue is full or closed
   */
  auto push(T value) -> bool
  {
    if (not channel_.try_send(boost::system::error_code{}, std::move(value))) { return false; }
    ++size_;
    return true;
  }

  /**
   * @brief Pushes a value, evicting the oldest buffered element while full.
   *
   * @param value The value to push
   * @return Number of elements evicted to make room, or std::nullopt if the queue is closed
   */
  auto push_evicting(T value) -> std::optional<std::size_t>
  {
    std::size_t evicted = 0;
    while (not channel_.try_send(boost::system::error_code{}, std::move(value))) {
      if (not channel_.is_open()) { return std::nullopt; }
      if (try_pop()) { ++evicted; }
    }
    ++size_;
    return evicted;
  }

  /**
   * @brief Asynchronously pops a value from the queue (coroutine).
   *
   * @param cancel_slot Optional cancellation slot for operation cancellation
   * @return Awaitable that yields the next value from the queue
   * @throws boost::system::system_error on cancellation or channel errors
   */
  auto pop(std::shared_ptr<boost::asio::cancellation_slot> cancel_slot = nullptr) -> boost::asio::awaitable<T>
  {
    boost::system::error_code err;

    if (cancel_slot) {
      auto val = co_await channel_.async_receive(boost::asio::bind_cancellation_slot(
        *cancel_slot, boost::asio::redirect_error(boost::asio::use_awaitable, err)));
      if (err) { throw boost::system::system_error(err); }
      --size_;
      co_return val;
    } else {
      auto val = co_await channel_.async_receive(boost::asio::redirect_error(boost::asio::use_awaitable, err));
      if (err) { throw boost::system::system_error(err); }
      --size_;
      co_return val;
    }
  }

  /**
   * @brief Attempts to pop a value without blocking.
   *
   * @return Optional containing the value if available, std::nullopt if queue is empty
   */
  auto try_pop() -> std::optional<T>
  {
    std::optional<T> value;
    // A closed channel completes try_receive with channel_closed and a default value.
    const bool received = channel_.try_receive([&value](boost::system::error_code error, T rx_value) {
      if (not error) { value.emplace(std::move(rx_value)); }
    });

    if (received and value) {
      --size_;
      return value;
    }
    return std::nullopt;
  }

  [[nodiscard]] auto empty() const -> bool { return size_.load() == 0; }

  [[nodiscard]] auto size() const -> std::size_t { return size_.load(); }

  [[nodiscard]] auto capacity() const -> std::size_t { return capacity_; }

  [[nodiscard]] auto is_open() const -> bool { return channel_.is_open(); }

  /**
   * @brief Closes the queue. Pending and future pops fail with channel_closed
   * once the buffer is drained; pushes fail immediately.
   */
  auto close() -> void { channel_.close(); }

private:
  std::shared_ptr<boost::asio::io_context> io_context_;
  boost::asio::experimental::concurrent_channel<void(boost::system::error_code, T)> channel_;
  std::size_t capacity_;
  std::atomic<std::size_t> size_;
};

}// namespace nostr_pool::async
