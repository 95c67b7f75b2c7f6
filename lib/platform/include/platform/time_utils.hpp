#pragma once

#include <cstdint>
#include <string>

namespace nostr_pool::platform {

/**
 * @brief Current wall-clock time as unix seconds.
 */
[[nodiscard]] auto unix_now() -> std::uint64_t;

/**
 * @brief Formats a unix timestamp as "YYYY-MM-DD HH:MM:SS" in UTC.
 *
 * @param unix_seconds Seconds since the epoch, e.g. an event's created_at
 * @return Formatted time, or the raw number when it cannot be represented
 */
[[nodiscard]] auto format_utc(std::uint64_t unix_seconds) -> std::string;

}// namespace nostr_pool::platform
