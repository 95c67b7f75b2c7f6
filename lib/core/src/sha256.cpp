#include <core/sha256.hpp>

#include <openssl/evp.h>

#include <stdexcept>

namespace nostr_pool::core {

auto sha256(std::span<const std::uint8_t> data) -> sha256_digest
{
  sha256_digest digest{};
  unsigned int length = 0;
  if (EVP_Digest(data.data(), data.size(), digest.data(), &length, EVP_sha256(), nullptr) != 1
      or length != digest.size()) {
    throw std::runtime_error("SHA-256 digest failed");
  }
  return digest;
}

auto sha256(std::string_view text) -> sha256_digest
{
  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
  return sha256(std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t *>(text.data()), text.size()));
}

auto to_hex(std::span<const std::uint8_t> bytes) -> std::string
{
  static constexpr std::string_view digits = "0123456789abcdef";
  static constexpr unsigned nibble_bits = 4;
  static constexpr std::uint8_t nibble_mask = 0x0F;

  std::string hex;
  hex.reserve(bytes.size() * 2);
  for (const auto byte : bytes) {
    hex.push_back(digits[byte >> nibble_bits]);
    hex.push_back(digits[byte & nibble_mask]);
  }
  return hex;
}

namespace {
  auto hex_value(char character) -> int
  {
    static constexpr int decimal_offset = 10;
    if (character >= '0' and character <= '9') { return character - '0'; }
    if (character >= 'a' and character <= 'f') { return character - 'a' + decimal_offset; }
    if (character >= 'A' and character <= 'F') { return character - 'A' + decimal_offset; }
    return -1;
  }
}// namespace

auto from_hex(std::string_view hex, std::string &out) -> bool
{
  static constexpr int nibble_bits = 4;

  if (hex.size() % 2 != 0) { return false; }
  out.clear();
  out.reserve(hex.size() / 2);
  for (std::size_t i = 0; i < hex.size(); i += 2) {
    const int high = hex_value(hex[i]);
    const int low = hex_value(hex[i + 1]);
    if (high < 0 or low < 0) { return false; }
    out.push_back(static_cast<char>((high << nibble_bits) | low));
  }
  return true;
}

}// namespace nostr_pool::core
