#pragma once

#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <string_view>

namespace nostr_pool::negentropy {

/// Negentropy protocol version 1
inline constexpr std::uint8_t protocol_version = 0x61;
inline constexpr std::size_t id_size = 32;
inline constexpr std::size_t fingerprint_size = 16;
/// Encodes as timestamp 0 on the wire ("infinity")
inline constexpr std::uint64_t max_timestamp = std::numeric_limits<std::uint64_t>::max();

/// Range modes carried in a message
enum class mode : std::uint64_t {
  skip = 0,
  fingerprint = 1,
  id_list = 2,
};

/// Malformed or unsupported negentropy message
class protocol_error : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
};

using id_bytes = std::array<std::uint8_t, id_size>;

/**
 * @brief One reconciled element, ordered by timestamp then id.
 */
struct item
{
  std::uint64_t timestamp{};
  id_bytes id{};

  /// Raw 32-byte id
  [[nodiscard]] auto id_string() const -> std::string { return { id.begin(), id.end() }; }

  auto operator<=>(const item &) const = default;
};

/**
 * @brief Range boundary: a timestamp plus the shortest id prefix that
 * separates two neighbouring items. Unused id bytes are zero.
 */
struct bound
{
  item value;
  std::size_t id_length{};
};

/// Bound covering everything
[[nodiscard]] inline auto infinity_bound() -> bound { return bound{ .value = { .timestamp = max_timestamp, .id = {} } }; }

/**
 * @brief Shortest bound that sorts after @p prev and at or before @p curr.
 */
[[nodiscard]] auto minimal_bound(const item &prev, const item &curr) -> bound;

/**
 * @brief Base-128 big-endian varint; every byte but the last has the high bit set.
 */
[[nodiscard]] auto encode_varint(std::uint64_t value) -> std::string;

/**
 * @brief Writes bounds with delta-encoded timestamps.
 *
 * Timestamps are relative to the previous one written; one encoder per message.
 */
class encoder
{
public:
  [[nodiscard]] auto timestamp(std::uint64_t value) -> std::string;
  [[nodiscard]] auto encode(const bound &value) -> std::string;

private:
  std::uint64_t last_timestamp_{ 0 };
};

/**
 * @brief Reads a message front to back.
 *
 * @throws protocol_error on truncated input or out-of-range fields
 */
class decoder
{
public:
  explicit decoder(std::string_view input) : input_(input) {}

  [[nodiscard]] auto empty() const -> bool { return input_.empty(); }

  auto byte() -> std::uint8_t;
  auto varint() -> std::uint64_t;
  auto bytes(std::size_t count) -> std::string_view;
  auto timestamp() -> std::uint64_t;
  auto decode_bound() -> bound;

private:
  std::string_view input_;
  std::uint64_t last_timestamp_{ 0 };
};

}// namespace nostr_pool::negentropy
