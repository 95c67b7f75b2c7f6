#pragma once

#include <negentropy/encoding.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace nostr_pool::negentropy {

/**
 * @brief Sums ids as 256-bit little-endian integers (mod 2^256).
 *
 * fingerprint(n) = first 16 bytes of SHA-256(sum || varint(n)).
 */
class fingerprint_accumulator
{
public:
  auto add(const id_bytes &id) -> void;
  [[nodiscard]] auto fingerprint(std::uint64_t count) const -> std::string;

private:
  id_bytes sum_{};
};

/**
 * @brief Sorted in-memory set of items.
 *
 * Fill with insert(), then seal() once before reconciling.
 */
class vector_storage
{
public:
  /**
   * @param timestamp Item timestamp (created_at)
   * @param id Raw 32-byte id
   * @throws std::invalid_argument if the id is not 32 bytes or the storage is sealed
   */
  auto insert(std::uint64_t timestamp, std::string_view id) -> void;

  /// Sorts and removes duplicates; idempotent
  auto seal() -> void;

  [[nodiscard]] auto size() const -> std::size_t { return items_.size(); }
  [[nodiscard]] auto at(std::size_t index) const -> const item & { return items_.at(index); }

  /**
   * @brief Index of the first item in [first, last) not less than @p value.
   */
  [[nodiscard]] auto find_lower_bound(std::size_t first, std::size_t last, const bound &value) const -> std::size_t;

  [[nodiscard]] auto fingerprint(std::size_t first, std::size_t last) const -> std::string;

  /**
   * @brief Visits items in [first, last) until the callback returns false.
   */
  auto iterate(std::size_t first, std::size_t last, const std::function<bool(const item &, std::size_t)> &callback) const
    -> void;

private:
  auto require_sealed() const -> void;

  std::vector<item> items_;
  bool sealed_{ false };
};

}// namespace nostr_pool::negentropy
