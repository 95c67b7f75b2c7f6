#pragma once

#include <async/async_queue.hpp>

#include <algorithm>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace nostr_pool::async {

/// What a broadcast does with a consumer whose buffer is full.
enum class overflow_policy : std::uint8_t {
  drop_oldest,///< Evict the consumer's oldest buffered item
  disconnect,///< Close the consumer's queue; it receives nothing further
};

/// Outcome of delivering one item to one lagging consumer
struct overflow_report
{
  std::uint64_t consumer_id{};///< Consumer that overflowed
  std::size_t dropped{};///< Items evicted (drop_oldest) or 0 when disconnected
  bool disconnected{};///< True when the consumer was cut off
};

/**
 * @brief One reader's view of a broadcast.
 *
 * Holds a private bounded queue. Dropping the last reference unregisters the
 * consumer on the next publish.
 */
template<typename T> class consumer
{
public:
  consumer(const std::shared_ptr<boost::asio::io_context> &io_context, std::uint64_t id, std::size_t capacity)
    : id_(id), queue_(io_context, capacity)
  {}

  /**
   * @brief Waits for the next item.
   *
   * @throws boost::system::system_error with channel_closed once the broadcast
   *         is closed (or this consumer was disconnected) and the buffer is drained
   */
  auto next(std::shared_ptr<boost::asio::cancellation_slot> cancel_slot = nullptr) -> boost::asio::awaitable<T>
  {
    co_return co_await queue_.pop(std::move(cancel_slot));
  }

  auto try_next() -> std::optional<T> { return queue_.try_pop(); }

  [[nodiscard]] auto id() const -> std::uint64_t { return id_; }
  [[nodiscard]] auto pending() const -> std::size_t { return queue_.size(); }
  [[nodiscard]] auto is_open() const -> bool { return queue_.is_open(); }

  auto close() -> void { queue_.close(); }

private:
  template<typename> friend class broadcast;

  std::uint64_t id_;
  async_queue<T> queue_;
};

/**
 * @brief Bounded fan-out from one producer side to many consumers.
 *
 * Publishing never suspends and never blocks on a slow consumer: each consumer
 * has its own buffer, and a full buffer is resolved by the configured policy.
 * Overflow is returned to the caller so it can be surfaced, never silently lost.
 */
template<typename T> class broadcast
{
public:
  broadcast(const std::shared_ptr<boost::asio::io_context> &io_context, overflow_policy policy)
    : io_context_(io_context), policy_(policy)
  {}

  broadcast(const broadcast &) = delete;
  auto operator=(const broadcast &) -> broadcast & = delete;
  broadcast(broadcast &&) = delete;
  auto operator=(broadcast &&) -> broadcast & = delete;
  ~broadcast() = default;

  /**
   * @brief Registers a new consumer.
   *
   * @param capacity Buffer size for this consumer
   * @return The consumer; a closed consumer if the broadcast is already closed
   */
  auto subscribe(std::size_t capacity) -> std::shared_ptr<consumer<T>>
  {
    const std::scoped_lock lock(mutex_);
    auto reader = std::make_shared<consumer<T>>(io_context_, next_consumer_id_++, capacity);
    if (closed_) {
      reader->close();
    } else {
      consumers_.push_back(reader);
    }
    return reader;
  }

  /**
   * @brief Delivers an item to every live consumer.
   *
   * @return Reports for each consumer that overflowed during this delivery
   */
  auto publish(const T &value) -> std::vector<overflow_report>
  {
    std::vector<overflow_report> reports;
    const std::scoped_lock lock(mutex_);
    if (closed_) { return reports; }

    std::erase_if(consumers_, [](const std::weak_ptr<consumer<T>> &weak) { return weak.expired(); });

    for (auto &weak : consumers_) {
      auto reader = weak.lock();
      if (not reader or not reader->queue_.is_open()) { continue; }

      if (reader->queue_.push(value)) { continue; }

      if (policy_ == overflow_policy::drop_oldest) {
        auto evicted = reader->queue_.push_evicting(value);
        if (evicted) { reports.push_back({ .consumer_id = reader->id_, .dropped = *evicted, .disconnected = false }); }
      } else {
        reader->queue_.close();
        reports.push_back({ .consumer_id = reader->id_, .dropped = 0, .disconnected = true });
      }
    }
    return reports;
  }

  /// Closes every consumer; idempotent.
  auto close() -> void
  {
    const std::scoped_lock lock(mutex_);
    if (closed_) { return; }
    closed_ = true;
    for (auto &weak : consumers_) {
      if (auto reader = weak.lock()) { reader->close(); }
    }
    consumers_.clear();
  }

  [[nodiscard]] auto consumer_count() const -> std::size_t
  {
    const std::scoped_lock lock(mutex_);
    return static_cast<std::size_t>(std::ranges::count_if(
      consumers_, [](const auto &weak) {
        auto reader = weak.lock();
        return reader and reader->is_open();
      }));
  }

private:
  std::shared_ptr<boost::asio::io_context> io_context_;
  overflow_policy policy_;
  mutable std::mutex mutex_;
  std::vector<std::weak_ptr<consumer<T>>> consumers_;
  std::uint64_t next_consumer_id_{ 1 };
  bool closed_{ false };
};

}// namespace nostr_pool::async
