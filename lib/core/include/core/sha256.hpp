#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace nostr_pool::core {

/// Raw SHA-256 digest
using sha256_digest = std::array<std::uint8_t, 32>;

/**
 * @brief Computes SHA-256 over a byte range (OpenSSL EVP).
 *
 * @throws std::runtime_error if the digest cannot be computed
 */
[[nodiscard]] auto sha256(std::span<const std::uint8_t> data) -> sha256_digest;

[[nodiscard]] auto sha256(std::string_view text) -> sha256_digest;

/// Lowercase hex encoding
[[nodiscard]] auto to_hex(std::span<const std::uint8_t> bytes) -> std::string;

/**
 * @brief Decodes lowercase or uppercase hex.
 *
 * @return false on odd length or a non-hex character; @p out is then unspecified
 */
[[nodiscard]] auto from_hex(std::string_view hex, std::string &out) -> bool;

}// namespace nostr_pool::core
