#pragma once

#include <string>

namespace nostr_pool::core {

/**
 * @brief Generates identifiers for subscriptions and reconciliation sessions.
 */
class id_generator
{
public:
  /**
   * @brief Generates a 32 character lowercase hex id from a random UUID.
   *
   * @return Id suitable as a NIP-01 subscription id (at most 64 characters)
   */
  [[nodiscard]] static auto subscription_id() -> std::string;

  /**
   * @brief Generates a hex id with a fixed prefix, e.g. "neg-…".
   *
   * @param prefix Text prepended to the random part
   */
  [[nodiscard]] static auto prefixed_id(const std::string &prefix) -> std::string;
};

}// namespace nostr_pool::core
