#include <negentropy/storage.hpp>

#include <core/sha256.hpp>

#include <algorithm>
#include <stdexcept>

namespace nostr_pool::negentropy {

auto fingerprint_accumulator::add(const id_bytes &id) -> void
{
  static constexpr unsigned byte_bits = 8;
  unsigned carry = 0;
  for (std::size_t i = 0; i < id_size; ++i) {
    const unsigned total = static_cast<unsigned>(sum_.at(i)) + id.at(i) + carry;
    sum_.at(i) = static_cast<std::uint8_t>(total);
    carry = total >> byte_bits;
  }
}

auto fingerprint_accumulator::fingerprint(std::uint64_t count) const -> std::string
{
  std::string input(sum_.begin(), sum_.end());
  input += encode_varint(count);
  const auto digest = core::sha256(input);
  return { digest.begin(), digest.begin() + fingerprint_size };
}

auto vector_storage::insert(std::uint64_t timestamp, std::string_view id) -> void
{
  if (sealed_) { throw std::invalid_argument("negentropy storage already sealed"); }
  if (id.size() != id_size) { throw std::invalid_argument("negentropy id must be 32 bytes"); }

  item entry{ .timestamp = timestamp, .id = {} };
  std::ranges::transform(id, entry.id.begin(), [](char byte) { return static_cast<std::uint8_t>(byte); });
  items_.push_back(entry);
}

auto vector_storage::seal() -> void
{
  if (sealed_) { return; }
  std::ranges::sort(items_);
  const auto duplicates = std::ranges::unique(items_);
  items_.erase(duplicates.begin(), duplicates.end());
  sealed_ = true;
}

auto vector_storage::find_lower_bound(std::size_t first, std::size_t last, const bound &value) const -> std::size_t
{
  require_sealed();
  last = std::min(last, items_.size());
  first = std::min(first, last);
  const auto begin = items_.begin() + static_cast<std::ptrdiff_t>(first);
  const auto end = items_.begin() + static_cast<std::ptrdiff_t>(last);
  return static_cast<std::size_t>(std::lower_bound(begin, end, value.value) - items_.begin());
}

auto vector_storage::fingerprint(std::size_t first, std::size_t last) const -> std::string
{
  require_sealed();
  fingerprint_accumulator accumulator;
  iterate(first, last, [&accumulator](const item &entry, std::size_t /*index*/) {
    accumulator.add(entry.id);
    return true;
  });
  return accumulator.fingerprint(last - first);
}

auto vector_storage::iterate(std::size_t first,
  std::size_t last,
  const std::function<bool(const item &, std::size_t)> &callback) const -> void
{
  require_sealed();
  if (first > last or last > items_.size()) { throw std::out_of_range("negentropy storage range out of bounds"); }
  for (auto index = first; index < last; ++index) {
    if (not callback(items_[index], index)) { break; }
  }
}

auto vector_storage::require_sealed() const -> void
{
  if (not sealed_) { throw std::logic_error("negentropy storage not sealed"); }
}

}// namespace nostr_pool::negentropy
