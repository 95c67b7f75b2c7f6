#pragma once

#include <cstdint>
#include <string_view>

namespace nostr_pool::pool {

/// Lifecycle of one relay connection
enum class connection_status : std::uint8_t {
  initialized,
  connecting,
  connected,
  disconnected,
  terminated,
};

[[nodiscard]] constexpr auto to_string(connection_status status) -> std::string_view
{
  switch (status) {
  case connection_status::initialized:
    return "initialized";
  case connection_status::connecting:
    return "connecting";
  case connection_status::connected:
    return "connected";
  case connection_status::disconnected:
    return "disconnected";
  case connection_status::terminated:
    return "terminated";
  }
  return "unknown";
}

}// namespace nostr_pool::pool
