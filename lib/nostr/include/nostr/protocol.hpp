#pragma once

#include <nostr/event.hpp>
#include <nostr/filter.hpp>

#include <cstddef>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace nostr_pool::nostr::protocol {

/**
 * @brief Nostr EVENT message wrapper.
 *
 * Relay-to-client frames carry the subscription id; client-to-relay frames
 * (publish) leave it empty.
 */
struct event
{
  std::string subscription_id;///< Subscription this event matches (empty when publishing)
  event_data data;///< The event itself

  /**
   * @brief Creates a publish message from event_data.
   */
  static auto from_event_data(const event_data &evt) -> event;

  /**
   * @brief Serializes event to JSON string.
   *
   * @return `["EVENT", subscription_id, event]`, or `["EVENT", event]` without a subscription id
   */
  [[nodiscard]] auto serialize() const -> std::string;

  static auto from_json(const nlohmann::json &frame) -> std::optional<event>;
  static auto deserialize(const std::string &json) -> std::optional<event>;
};

/**
 * @brief Nostr OK response message.
 *
 * Sent by relays to indicate acceptance/rejection of a submitted event.
 */
struct ok
{
  std::string event_id;///< ID of the event this responds to
  bool accepted{};///< Whether the event was accepted
  std::string message;///< Human-readable status message

  [[nodiscard]] auto serialize() const -> std::string;
  static auto from_json(const nlohmann::json &frame) -> std::optional<ok>;
  static auto deserialize(const std::string &json) -> std::optional<ok>;
};

/**
 * @brief End of Stored Events marker.
 */
struct eose
{
  std::string subscription_id;///< Subscription this EOSE applies to

  [[nodiscard]] auto serialize() const -> std::string;
  static auto from_json(const nlohmann::json &frame) -> std::optional<eose>;
  static auto deserialize(const std::string &json) -> std::optional<eose>;
};

/// Relay-initiated end of a subscription
struct closed
{
  std::string subscription_id;
  std::string message;

  [[nodiscard]] auto serialize() const -> std::string;
  static auto from_json(const nlohmann::json &frame) -> std::optional<closed>;
};

/// Human-readable relay notice
struct notice
{
  std::string message;

  [[nodiscard]] auto serialize() const -> std::string;
  static auto from_json(const nlohmann::json &frame) -> std::optional<notice>;
};

/// NIP-42 authentication challenge
struct auth
{
  std::string challenge;

  static auto from_json(const nlohmann::json &frame) -> std::optional<auth>;
};

/**
 * @brief Nostr REQ subscription request.
 *
 * Sent to relays to subscribe to events matching any of the filters.
 */
struct req
{
  std::string subscription_id;///< Unique identifier for this subscription
  filters filter_list;///< Filter criteria (NIP-01 format), at least one

  /**
   * @brief Serializes REQ to JSON string.
   *
   * @return JSON string in format ["REQ", subscription_id, ...filters]
   */
  [[nodiscard]] auto serialize() const -> std::string;

  static auto from_json(const nlohmann::json &frame) -> std::optional<req>;
  static auto deserialize(const std::string &json) -> std::optional<req>;
};

/// Client request to end a subscription
struct close
{
  std::string subscription_id;

  [[nodiscard]] auto serialize() const -> std::string;
  static auto from_json(const nlohmann::json &frame) -> std::optional<close>;
};

/**
 * @brief NIP-77 reconciliation opening: `["NEG-OPEN", id, filter, hex_message]`.
 */
struct neg_open
{
  std::string subscription_id;
  nostr::filter scope;///< Filter delimiting the reconciled set
  std::string message;///< Hex-encoded negentropy message

  [[nodiscard]] auto serialize() const -> std::string;
  static auto from_json(const nlohmann::json &frame) -> std::optional<neg_open>;
};

/// NIP-77 reconciliation round, sent in both directions
struct neg_msg
{
  std::string subscription_id;
  std::string message;///< Hex-encoded negentropy message

  [[nodiscard]] auto serialize() const -> std::string;
  static auto from_json(const nlohmann::json &frame) -> std::optional<neg_msg>;
};

/// NIP-77 relay-side reconciliation failure
struct neg_err
{
  std::string subscription_id;
  std::string reason;

  [[nodiscard]] auto serialize() const -> std::string;
  static auto from_json(const nlohmann::json &frame) -> std::optional<neg_err>;
};

/// NIP-77 client-side end of a reconciliation
struct neg_close
{
  std::string subscription_id;

  [[nodiscard]] auto serialize() const -> std::string;
  static auto from_json(const nlohmann::json &frame) -> std::optional<neg_close>;
};

/// Any frame a relay may send to a client
using relay_message = std::variant<event, ok, eose, closed, notice, auth, neg_msg, neg_err>;

/// Any frame a client may send to a relay
using client_message = std::variant<event, req, close, neg_open, neg_msg, neg_close>;

/**
 * @brief Decodes one relay-to-client frame.
 *
 * @return The message, or std::nullopt for malformed JSON, unknown labels or
 *         wrong field types
 */
[[nodiscard]] auto decode_relay_message(std::string_view frame) -> std::optional<relay_message>;

/**
 * @brief Decodes one client-to-relay frame.
 */
[[nodiscard]] auto decode_client_message(std::string_view frame) -> std::optional<client_message>;

/// Maximum allowed subscription ID length
constexpr std::size_t max_subscription_id_length = 64;

/**
 * @brief Validates a subscription ID.
 *
 * @param subscription_id ID to validate
 * @throws std::invalid_argument if ID is empty or exceeds maximum length
 */
inline auto validate_subscription_id(const std::string &subscription_id) -> void
{
  if (subscription_id.empty()) { throw std::invalid_argument("Subscription ID cannot be empty"); }
  if (subscription_id.length() > max_subscription_id_length) {
    throw std::invalid_argument("Subscription ID exceeds maximum length of 64 characters");
  }
}

}// namespace nostr_pool::nostr::protocol
