#pragma once

#include <concepts>
#include <nostr/event.hpp>

namespace nostr_pool::concepts {

/**
 * @brief Concept for event authenticity checks run before deduplication.
 *
 * Types satisfying this concept decide whether an inbound event may enter the
 * unified stream.
 */
template<typename T>
concept event_verifier = requires(const T verifier, const nostr::protocol::event_data &event) {
  { verifier.verify(event) } -> std::convertible_to<bool>;
};

}// namespace nostr_pool::concepts
