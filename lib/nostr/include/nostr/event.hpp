#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace nostr_pool::nostr::protocol {

/**
 * @brief Well-known Nostr event kinds.
 *
 * Any 16-bit value is a valid kind on the wire; the named values only cover
 * the kinds the pool and its CLI refer to.
 */
enum class kind : std::uint16_t {
  profile_metadata = 0,///< User profile metadata (NIP-01)
  text_note = 1,///< Text note/post (NIP-01)
  recommend_relay = 2,///< Relay recommendation (NIP-01)
  contact_list = 3,///< Contact list (NIP-02)
  encrypted_dm = 4,///< Encrypted direct message (NIP-04)
  deletion = 5,///< Event deletion request (NIP-09)
  repost = 6,///< Repost (NIP-18)
  reaction = 7,///< Reaction to an event (NIP-25)
  relay_list = 10002,///< Relay list metadata (NIP-65)

  replaceable_start = 10000,///< Start of replaceable range
  ephemeral_start = 20000,///< Start of ephemeral range
  parameterized_replaceable_start = 30000,///< Start of parameterized replaceable range
};

/**
 * @brief Nostr event data structure.
 *
 * Represents a complete Nostr event with all required fields per NIP-01.
 */
struct event_data
{
  std::string id;///< Event ID (32-byte hex hash)
  std::string pubkey;///< Public key of event creator (32-byte hex)
  std::uint64_t created_at{};///< Unix timestamp
  enum kind kind {};///< Event kind identifier
  std::vector<std::vector<std::string>> tags;///< Event tags (arbitrary string arrays)
  std::string content;///< Event content
  std::string sig;///< Schnorr signature (64-byte hex)

  /**
   * @brief Builds event data from a parsed JSON object.
   *
   * @return Parsed event_data or std::nullopt when a field is missing or mistyped
   */
  static auto from_json(const nlohmann::json &json_obj) -> std::optional<event_data>;

  /**
   * @brief Deserializes event data from JSON string.
   *
   * @param json JSON string
   * @return Parsed event_data or std::nullopt on failure
   */
  static auto deserialize(const std::string &json) -> std::optional<event_data>;

  [[nodiscard]] auto to_json() const -> nlohmann::json;

  /// Serializes the event object as compact JSON
  [[nodiscard]] auto serialize() const -> std::string;

  /**
   * @brief Returns the NIP-01 commitment `[0,pubkey,created_at,kind,tags,content]`.
   *
   * The event id is the SHA-256 of this string.
   */
  [[nodiscard]] auto commitment() const -> std::string;

  /// Lowercase hex SHA-256 of the commitment
  [[nodiscard]] auto compute_id() const -> std::string;

  /// First value of the first tag named @p name, if any
  [[nodiscard]] auto first_tag_value(const std::string &name) const -> std::optional<std::string>;

  auto operator==(const event_data &) const -> bool = default;
};

/// True for 64 lowercase-or-uppercase hex characters (ids and public keys)
[[nodiscard]] auto is_hex32(const std::string &value) -> bool;

}// namespace nostr_pool::nostr::protocol
