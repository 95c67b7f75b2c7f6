#pragma once

#include <nostr/event.hpp>

namespace nostr_pool::nostr {

/**
 * @brief Structural verifier: the event id must equal the SHA-256 of its
 * NIP-01 commitment and the public key must be 32 hex bytes.
 *
 * Signatures are not checked.
 */
struct id_verifier
{
  [[nodiscard]] auto verify(const protocol::event_data &event) const -> bool;
};

/// Accepts every event; for relays the caller already trusts.
struct accept_all_verifier
{
  [[nodiscard]] auto verify(const protocol::event_data & /*event*/) const -> bool { return true; }
};

}// namespace nostr_pool::nostr
