#pragma once

#include <compare>
#include <cstddef>
#include <functional>
#include <string>
#include <string_view>

namespace nostr_pool::nostr {

/**
 * @brief Normalized relay endpoint.
 *
 * Two spellings of the same endpoint compare equal: scheme and host are
 * lower-cased, the default port 443 is elided and trailing slashes are
 * removed from the path. Only secure websockets (`wss://`) are accepted.
 */
class relay_url
{
public:
  /**
   * @brief Parses and normalizes a relay address.
   *
   * A bare host (`relay.example.com`) is treated as `wss://relay.example.com`.
   *
   * @throws std::invalid_argument for `ws://`, other schemes, an empty host or a bad port
   */
  static auto parse(std::string_view address) -> relay_url;

  /// Canonical form, e.g. `wss://relay.example.com:8443/nostr`
  [[nodiscard]] auto str() const -> const std::string & { return canonical_; }
  [[nodiscard]] auto host() const -> const std::string & { return host_; }
  /// Port as a string, always present ("443" when elided in the canonical form)
  [[nodiscard]] auto port() const -> const std::string & { return port_; }
  /// Request target for the websocket handshake, "/" when empty
  [[nodiscard]] auto target() const -> std::string { return path_.empty() ? std::string{ "/" } : path_; }

  auto operator==(const relay_url &other) const -> bool { return canonical_ == other.canonical_; }
  auto operator<=>(const relay_url &other) const -> std::strong_ordering { return canonical_ <=> other.canonical_; }

private:
  relay_url(std::string host, std::string port, std::string path);

  std::string host_;
  std::string port_;
  std::string path_;
  std::string canonical_;
};

}// namespace nostr_pool::nostr

template<> struct std::hash<nostr_pool::nostr::relay_url>
{
  auto operator()(const nostr_pool::nostr::relay_url &url) const noexcept -> std::size_t
  {
    return std::hash<std::string>{}(url.str());
  }
};
