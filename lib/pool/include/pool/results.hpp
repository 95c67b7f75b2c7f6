#pragma once

#include <nostr/relay_url.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace nostr_pool::pool {

/// What happened to one publish on one relay
struct publish_outcome
{
  enum class kind : std::uint8_t {
    accepted,
    rejected,
    not_attempted,
  };

  kind result{ kind::not_attempted };
  std::string message;///< Relay message, or the local reason ("timeout", "connection lost", ...)

  [[nodiscard]] auto is_accepted() const -> bool { return result == kind::accepted; }
};

[[nodiscard]] constexpr auto to_string(publish_outcome::kind result) -> std::string_view
{
  switch (result) {
  case publish_outcome::kind::accepted:
    return "accepted";
  case publish_outcome::kind::rejected:
    return "rejected";
  case publish_outcome::kind::not_attempted:
    return "not attempted";
  }
  return "unknown";
}

/// Per-relay publish outcomes keyed by relay
struct publish_report
{
  std::string event_id;
  std::map<nostr::relay_url, publish_outcome> outcomes;

  [[nodiscard]] auto accepted_count() const -> std::size_t;
  [[nodiscard]] auto any_accepted() const -> bool { return accepted_count() > 0; }
};

/**
 * @brief Outcome of one negentropy exchange. Ids are lowercase hex.
 *
 * An incomplete result still carries whatever difference was found before
 * the exchange stopped.
 */
struct reconciliation_result
{
  nostr::relay_url relay;
  std::vector<std::string> need;///< Relay has, we lack
  std::vector<std::string> have;///< We have, relay lacks
  bool complete{ false };
  std::string error;///< Why the exchange stopped early
  std::size_t rounds{ 0 };///< Messages received from the relay
};

/// Outcome of sync(): reconciliation plus the follow-up transfers
struct sync_report
{
  reconciliation_result reconciliation;
  std::size_t received{ 0 };///< Needed events fetched and stored
  std::size_t sent{ 0 };///< Had events accepted by the relay
  std::vector<std::string> failed;///< Ids that could not be transferred
};

}// namespace nostr_pool::pool
