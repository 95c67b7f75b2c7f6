#pragma once

#include <concepts>
#include <nostr/event.hpp>
#include <nostr/filter.hpp>
#include <vector>

namespace nostr_pool::concepts {

/**
 * @brief Concept for the local event store the pool persists into and
 * reconciles against.
 *
 * store() reports whether the event was new; query() returns matching events
 * newest first, honouring the filter's limit. Implementations must be safe to
 * call from several connection strands at once.
 */
template<typename T>
concept event_store = requires(T store, const nostr::protocol::event_data &event, const nostr::filter &scope) {
  { store.store(event) } -> std::convertible_to<bool>;
  { store.query(scope) } -> std::same_as<std::vector<nostr::protocol::event_data>>;
};

}// namespace nostr_pool::concepts
