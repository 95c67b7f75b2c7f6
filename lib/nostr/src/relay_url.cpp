#include <nostr/relay_url.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <stdexcept>

namespace nostr_pool::nostr {

namespace {
  constexpr std::string_view secure_scheme = "wss://";
  constexpr std::string_view default_port = "443";

  auto lowercase(std::string_view text) -> std::string
  {
    std::string lowered(text);
    std::ranges::transform(
      lowered, lowered.begin(), [](unsigned char character) { return static_cast<char>(std::tolower(character)); });
    return lowered;
  }

  auto valid_port(std::string_view port) -> bool
  {
    static constexpr unsigned max_port = 65535;
    unsigned value = 0;
    const auto *const end = port.data() + port.size();// NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    const auto [ptr, error] = std::from_chars(port.data(), end, value);
    return error == std::errc{} and ptr == end and value > 0 and value <= max_port;
  }
}// namespace

relay_url::relay_url(std::string host, std::string port, std::string path)
  : host_(std::move(host)), port_(std::move(port)), path_(std::move(path))
{
  canonical_ = std::string{ secure_scheme } + host_;
  if (port_ != default_port) { canonical_ += ":" + port_; }
  canonical_ += path_;
}

auto relay_url::parse(std::string_view address) -> relay_url
{
  while (not address.empty() and std::isspace(static_cast<unsigned char>(address.front())) != 0) {
    address.remove_prefix(1);
  }
  while (not address.empty() and std::isspace(static_cast<unsigned char>(address.back())) != 0) {
    address.remove_suffix(1);
  }

  std::string_view rest = address;
  if (const auto scheme_end = address.find("://"); scheme_end != std::string_view::npos) {
    const auto scheme = lowercase(address.substr(0, scheme_end));
    if (scheme == "ws") {
      throw std::invalid_argument("Insecure WebSocket (ws://) not supported. Use wss:// for security.");
    }
    if (scheme != "wss") { throw std::invalid_argument("Unsupported relay URL scheme: " + scheme); }
    rest = address.substr(scheme_end + 3);
  }

  std::string_view authority = rest;
  std::string path;
  if (const auto slash = rest.find('/'); slash != std::string_view::npos) {
    authority = rest.substr(0, slash);
    path = std::string{ rest.substr(slash) };
  }
  while (not path.empty() and path.back() == '/') { path.pop_back(); }

  if (authority.find('@') != std::string_view::npos) {
    throw std::invalid_argument("Relay URL must not carry credentials");
  }

  std::string_view host = authority;
  std::string_view port = default_port;
  const auto colon = authority.rfind(':');
  const auto bracket = authority.rfind(']');
  if (colon != std::string_view::npos and (bracket == std::string_view::npos or colon > bracket)) {
    host = authority.substr(0, colon);
    port = authority.substr(colon + 1);
  }

  if (host.empty()) { throw std::invalid_argument("Relay URL has no host: " + std::string{ address }); }
  if (not valid_port(port)) { throw std::invalid_argument("Relay URL has an invalid port: " + std::string{ port }); }

  std::string port_text{ port };
  port_text.erase(0, std::min(port_text.find_first_not_of('0'), port_text.size() - 1));

  return relay_url{ lowercase(host), std::move(port_text), std::move(path) };
}

}// namespace nostr_pool::nostr
