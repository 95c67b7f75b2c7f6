#pragma once

#include <async/broadcast.hpp>
#include <core/backoff.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <variant>

namespace nostr_pool::pool {

/**
 * @brief Per-relay settings given to add_relay().
 */
struct relay_options
{
  bool reconnect{ true };///< Schedule a reconnect after every transport loss
  bool read{ true };///< Included in subscriptions that target "all relays"
  bool write{ true };///< Included in publishes that target "all relays"
  core::backoff_policy backoff{};///< Reconnect delay curve
  std::chrono::milliseconds publish_timeout{ std::chrono::seconds(10) };///< Wait for OK before rejecting
};

/**
 * @brief Pool-wide settings.
 */
struct pool_options
{
  std::size_t seen_capacity{ 100'000 };///< Ids remembered by the deduplicator
  std::size_t stream_buffer{ 4096 };///< Default per-consumer buffer of the unified stream
  async::overflow_policy overflow{ async::overflow_policy::drop_oldest };///< Slow-consumer handling
  std::size_t notification_buffer{ 4096 };///< Per-consumer buffer of the notification stream
  std::chrono::milliseconds close_grace{ std::chrono::seconds(5) };///< Force-forget unacknowledged CLOSEs
  std::size_t mailbox_capacity{ 1024 };///< Commands buffered per connection; further commands are refused
};

/// Which half of a reconciliation result sync() acts on
enum class sync_direction : std::uint8_t {
  down,///< Fetch events the relay has and we lack
  up,///< Publish events we have and the relay lacks
  both,
};

/**
 * @brief Settings for one negentropy exchange.
 */
struct reconciliation_options
{
  std::chrono::milliseconds initial_timeout{ std::chrono::seconds(10) };///< Wait for the first reply
  std::chrono::milliseconds round_timeout{ std::chrono::seconds(10) };///< Wait for each later reply
  std::size_t frame_size_limit{ 0 };///< Outgoing message cap in bytes, 0 for none
};

namespace fetch_exit {

  /// Stop listening to a relay at its EOSE
  struct on_eose
  {
  };

  /// After a relay's EOSE, stop once it sent this many more matching events
  struct after_events
  {
    std::size_t count{};
  };

  /// After a relay's EOSE, keep listening to it for this long
  struct after_duration
  {
    std::chrono::milliseconds duration{};
  };

}// namespace fetch_exit

using fetch_exit_policy = std::variant<fetch_exit::on_eose, fetch_exit::after_events, fetch_exit::after_duration>;

/**
 * @brief Settings for one fetch_events() call.
 */
struct fetch_options
{
  std::chrono::milliseconds timeout{ std::chrono::seconds(10) };///< Bound on the whole fetch
  fetch_exit_policy exit{};///< When each relay is considered done
};

struct sync_options
{
  sync_direction direction{ sync_direction::down };
  reconciliation_options reconciliation{};
  std::size_t batch_size{ 50 };///< Ids per fetch subscription
  std::chrono::milliseconds fetch_timeout{ std::chrono::seconds(10) };///< Per batch
};

}// namespace nostr_pool::pool
