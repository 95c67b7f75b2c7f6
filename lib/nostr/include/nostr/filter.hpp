#pragma once

#include <nostr/event.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace nostr_pool::nostr {

/**
 * @brief NIP-01 subscription filter.
 *
 * Every present constraint must hold for an event to match; an empty set or
 * an absent optional means "no constraint". Tag constraints are keyed by the
 * single-letter tag name and serialize as `#<letter>`.
 */
struct filter
{
  std::set<std::string> ids;///< Exact event ids
  std::set<std::string> authors;///< Exact author public keys
  std::set<std::uint16_t> kinds;///< Event kinds
  std::map<char, std::set<std::string>> tags;///< Single-letter tag values (`#e`, `#p`, ...)
  std::optional<std::uint64_t> since;///< Inclusive lower bound on created_at
  std::optional<std::uint64_t> until;///< Inclusive upper bound on created_at
  std::optional<std::size_t> limit;///< Maximum number of stored events requested
  std::optional<std::string> search;///< NIP-50 full-text query

  /**
   * @brief Evaluates the filter against an event locally.
   *
   * `limit` is ignored; `search` is a case-insensitive substring test on content.
   */
  [[nodiscard]] auto matches(const protocol::event_data &event) const -> bool;

  /**
   * @brief Checks only the exact constraints a relay must honor.
   *
   * `search` is skipped: a NIP-50 relay ranks by relevance, so its hits need
   * not contain the query verbatim.
   */
  [[nodiscard]] auto admits(const protocol::event_data &event) const -> bool;

  /// True when the filter carries no constraint at all
  [[nodiscard]] auto empty() const -> bool;

  [[nodiscard]] auto to_json() const -> nlohmann::json;

  /**
   * @brief Parses a filter object.
   *
   * Unknown keys are ignored. Multi-letter `#` keys are rejected.
   *
   * @return Parsed filter or std::nullopt on type mismatch
   */
  static auto from_json(const nlohmann::json &json_obj) -> std::optional<filter>;

  auto operator==(const filter &) const -> bool = default;
};

/// An ordered group of filters forming one subscription (OR semantics)
using filters = std::vector<filter>;

/// True if any filter in the group matches
[[nodiscard]] auto matches_any(const filters &group, const protocol::event_data &event) -> bool;

/// True if any filter in the group admits the event (search not rechecked)
[[nodiscard]] auto admits_any(const filters &group, const protocol::event_data &event) -> bool;

}// namespace nostr_pool::nostr
