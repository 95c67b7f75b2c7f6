#pragma once

#include <pool/results.hpp>

#include <nostr/event.hpp>
#include <nostr/filter.hpp>
#include <nostr/relay_url.hpp>

#include <boost/system/error_code.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <variant>

namespace nostr_pool::pool::events {

namespace connection {

  /// Open the transport if Initialized or Disconnected
  struct connect
  {
  };

  /// What a queued frame belongs to; decides its fate on disconnect
  enum class frame_kind : std::uint8_t {
    subscription,///< REQ / CLOSE, regenerated by resubscription
    publish,///< EVENT, failed through the request tracker
    reconciliation,///< NEG-*, its session is aborted
  };

  /// Write a pre-encoded frame while Connected
  struct send
  {
    std::string frame;
    frame_kind kind{ frame_kind::reconciliation };
    std::function<void(bool)> on_done;///< true once written, false if dropped
  };

  /// Serve a subscription from the registry if not served yet
  struct subscribe
  {
    std::string subscription_id;
    nostr::filters filters;
  };

  /// Re-issue REQ with replaced filters
  struct resubscribe
  {
    std::string subscription_id;
    nostr::filters filters;
  };

  /// Stop serving a subscription and acknowledge the close in the registry
  struct unsubscribe
  {
    std::string subscription_id;
  };

  struct publish
  {
    nostr::protocol::event_data event;
    std::chrono::milliseconds timeout{};
    std::function<void(publish_outcome)> on_outcome;///< Called exactly once
  };

  /// Close for good; the actor exits afterwards
  struct terminate
  {
  };

  // Completions from the transport and timers. Generation tags ignore
  // completions of a transport that has since been replaced.

  struct connected
  {
    std::uint64_t generation{};
  };

  struct connect_failed
  {
    std::uint64_t generation{};
    std::string reason;
  };

  struct message_received
  {
    std::uint64_t generation{};
    std::string text;
  };

  struct write_completed
  {
    std::uint64_t generation{};
    boost::system::error_code error;
  };

  struct transport_lost
  {
    std::uint64_t generation{};
    std::string reason;
  };

  struct reconnect_due
  {
    std::uint64_t token{};
  };

  /// Commands, queued in the bounded mailbox
  using in_t = std::variant<connect, send, subscribe, resubscribe, unsubscribe, publish, terminate>;

  /// Completions, posted straight to the connection's strand
  using completion_t =
    std::variant<connected, connect_failed, message_received, write_completed, transport_lost, reconnect_due>;

}// namespace connection

namespace fetch {

  struct event_received
  {
    nostr::protocol::event_data event;
    nostr::relay_url relay;
  };

  struct eose_received
  {
    nostr::relay_url relay;
  };

  /// Relay stopped serving the fetch (CLOSED, disconnect or removal)
  struct relay_gone
  {
    nostr::relay_url relay;
  };

  /// The post-EOSE listening period of a relay ended
  struct linger_elapsed
  {
    nostr::relay_url relay;
  };

  struct timed_out
  {
  };

  struct aborted
  {
    std::string reason;
  };

  using in_t = std::variant<event_received, eose_received, relay_gone, linger_elapsed, timed_out, aborted>;

}// namespace fetch

namespace reconciliation {

  struct message_received
  {
    std::string hex;
  };

  struct error_received
  {
    std::string reason;
  };

  struct timed_out
  {
    std::uint64_t round{};
  };

  struct aborted
  {
    std::string reason;
  };

  using in_t = std::variant<message_received, error_received, timed_out, aborted>;

}// namespace reconciliation

}// namespace nostr_pool::pool::events
