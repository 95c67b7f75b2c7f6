#pragma once

#include <pool/connection_status.hpp>

#include <nostr/event.hpp>
#include <nostr/relay_url.hpp>

#include <async/broadcast.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>

namespace nostr_pool::pool {

/// One entry of the unified event stream
struct stream_item
{
  nostr::protocol::event_data event;
  nostr::relay_url relay;///< Relay that delivered it first
  std::string subscription_id;
};

namespace notifications {

  struct status_changed
  {
    nostr::relay_url relay;
    connection_status from;
    connection_status to;
  };

  /// NOTICE frame from a relay
  struct notice
  {
    nostr::relay_url relay;
    std::string message;
  };

  /// Relay-initiated CLOSED for one of our subscriptions
  struct subscription_closed
  {
    nostr::relay_url relay;
    std::string subscription_id;
    std::string message;
  };

  /// Malformed frame or unverifiable event; the connection stays up
  struct protocol_error
  {
    nostr::relay_url relay;
    std::string reason;
  };

  /// Connect failure or loss of an established transport
  struct transport_error
  {
    nostr::relay_url relay;
    std::string reason;
  };

  /// A relay finished sending stored events for a subscription
  struct eose
  {
    nostr::relay_url relay;
    std::string subscription_id;
  };

  /// A unified-stream consumer could not keep up
  struct consumer_overflow
  {
    std::uint64_t consumer_id{};
    std::size_t dropped{};
    async::overflow_policy policy{};
  };

  /// A fetch's buffer was full; events were left out of its result
  struct fetch_overflow
  {
    nostr::relay_url relay;
    std::string subscription_id;
    std::size_t dropped{};
  };

}// namespace notifications

using notification = std::variant<notifications::status_changed,
  notifications::notice,
  notifications::subscription_closed,
  notifications::protocol_error,
  notifications::transport_error,
  notifications::eose,
  notifications::consumer_overflow,
  notifications::fetch_overflow>;

}// namespace nostr_pool::pool
