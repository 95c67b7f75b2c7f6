#pragma once

#include <nostr/filter.hpp>
#include <nostr/relay_url.hpp>

#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace nostr_pool::pool {

/**
 * @brief Bookkeeping for one subscription.
 */
struct subscription
{
  std::string id;
  nostr::filters filters;
  std::set<nostr::relay_url> relays;///< Relays the subscription targets
  bool closed{ false };///< unsubscribe() was called; waiting for acknowledgements
  std::set<nostr::relay_url> eose;///< Relays that sent EOSE since the last REQ
  std::set<nostr::relay_url> pending_close;///< Relays whose CLOSE is not yet acknowledged
};

/**
 * @brief Thread-safe registry of the pool's subscriptions.
 *
 * Holds what should be active, not what is on the wire: each connection
 * tracks what it currently serves and reconciles against this registry when it
 * (re)connects. Ids are generated here and never reused.
 */
class subscription_registry
{
public:
  /**
   * @brief Records a new subscription.
   *
   * @param subscription_id Id reserved by the caller, or std::nullopt to allocate one
   * @return The subscription id
   * @throws std::invalid_argument if a caller-chosen id is already registered
   */
  auto add(nostr::filters filters,
    std::set<nostr::relay_url> relays,
    std::optional<std::string> subscription_id = std::nullopt) -> std::string;

  [[nodiscard]] auto get(const std::string &subscription_id) const -> std::optional<subscription>;

  /// True while the subscription exists and is not closing
  [[nodiscard]] auto is_active(const std::string &subscription_id) const -> bool;

  /// True when the subscription is active and targets @p relay
  [[nodiscard]] auto is_active_on(const std::string &subscription_id, const nostr::relay_url &relay) const -> bool;

  /// Active subscriptions targeting @p relay, as (id, filters)
  [[nodiscard]] auto active_for(const nostr::relay_url &relay) const
    -> std::vector<std::pair<std::string, nostr::filters>>;

  /**
   * @brief Replaces the filters of an active subscription and clears its EOSE state.
   *
   * @return The relays the subscription targets
   * @throws subscription_not_found, subscription_closed
   */
  auto update_filters(const std::string &subscription_id, nostr::filters filters) -> std::set<nostr::relay_url>;

  /**
   * @brief Marks a subscription closed and starts waiting for acknowledgements.
   *
   * A subscription without target relays is erased immediately.
   *
   * @return The relays that must acknowledge the close
   * @throws subscription_not_found, subscription_closed
   */
  auto begin_close(const std::string &subscription_id) -> std::set<nostr::relay_url>;

  /**
   * @brief Acknowledges the close on one relay.
   *
   * @return true if this was the last pending acknowledgement and the subscription is gone
   */
  auto acknowledge_close(const std::string &subscription_id, const nostr::relay_url &relay) -> bool;

  /// Erases a subscription regardless of pending acknowledgements
  auto force_erase(const std::string &subscription_id) -> bool;

  /**
   * @brief Removes a relay from one subscription (relay-initiated CLOSED).
   */
  auto drop_relay(const std::string &subscription_id, const nostr::relay_url &relay) -> void;

  /**
   * @brief Removes a relay from every subscription.
   *
   * Pending closes on that relay count as acknowledged.
   *
   * @return Ids of subscriptions that lost the relay
   */
  auto remove_relay(const nostr::relay_url &relay) -> std::vector<std::string>;

  /**
   * @brief Records EOSE from a relay.
   *
   * @return false if the subscription is unknown, closed or does not target the relay
   */
  auto mark_eose(const std::string &subscription_id, const nostr::relay_url &relay) -> bool;

  /// Clears EOSE state for one relay, called whenever the REQ is re-issued
  auto reset_eose(const std::string &subscription_id, const nostr::relay_url &relay) -> void;

  /// True once every target relay has sent EOSE
  [[nodiscard]] auto eose_complete(const std::string &subscription_id) const -> bool;

  [[nodiscard]] auto ids() const -> std::vector<std::string>;
  [[nodiscard]] auto size() const -> std::size_t;
  auto clear() -> void;

private:
  mutable std::mutex mutex_;
  std::map<std::string, subscription> subscriptions_;
};

}// namespace nostr_pool::pool
