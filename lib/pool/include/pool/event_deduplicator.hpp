#pragma once

#include <nostr/relay_url.hpp>

#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>

namespace nostr_pool::pool {

/**
 * @brief Bounded index of delivered event ids and the relays that confirmed them.
 *
 * The first observation of an id is delivered; later ones only add a
 * confirming relay. Once more than @c capacity ids are indexed the oldest
 * insertion is forgotten; confirmations do not refresh an id.
 *
 * Thread-safe.
 */
class event_deduplicator
{
public:
  enum class verdict : std::uint8_t {
    delivered,
    duplicate,
  };

  explicit event_deduplicator(std::size_t capacity);

  auto observe(const std::string &event_id, const nostr::relay_url &relay) -> verdict;

  /// Relays that sent @p event_id, if it is still indexed
  [[nodiscard]] auto confirmations(const std::string &event_id) const -> std::optional<std::set<nostr::relay_url>>;

  [[nodiscard]] auto contains(const std::string &event_id) const -> bool;
  [[nodiscard]] auto size() const -> std::size_t;
  [[nodiscard]] auto capacity() const -> std::size_t { return capacity_; }

  auto clear() -> void;

private:
  std::size_t capacity_;
  mutable std::mutex mutex_;
  std::deque<std::string> order_;
  std::unordered_map<std::string, std::set<nostr::relay_url>> seen_;
};

}// namespace nostr_pool::pool
