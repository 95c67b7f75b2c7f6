#include <negentropy/encoding.hpp>

#include <algorithm>
#include <iterator>

namespace nostr_pool::negentropy {

namespace {
  constexpr std::uint8_t continuation_bit = 0x80;
  constexpr std::uint8_t payload_mask = 0x7F;
  constexpr unsigned payload_bits = 7;
  constexpr std::size_t max_varint_length = 10;
}// namespace

auto minimal_bound(const item &prev, const item &curr) -> bound
{
  if (curr.timestamp != prev.timestamp) { return bound{ .value = { .timestamp = curr.timestamp, .id = {} } }; }

  const auto mismatch = std::ranges::mismatch(prev.id, curr.id);
  const auto shared_prefix = static_cast<std::size_t>(std::distance(curr.id.begin(), mismatch.in2));

  bound result{ .value = { .timestamp = curr.timestamp, .id = {} }, .id_length = std::min(shared_prefix + 1, id_size) };
  std::copy_n(curr.id.begin(), result.id_length, result.value.id.begin());
  return result;
}

auto encode_varint(std::uint64_t value) -> std::string
{
  if (value == 0) { return std::string(1, '\0'); }

  std::string output;
  while (value != 0) {
    output.push_back(static_cast<char>(value & payload_mask));
    value >>= payload_bits;
  }
  std::ranges::reverse(output);
  for (std::size_t i = 0; i + 1 < output.size(); ++i) {
    output[i] = static_cast<char>(static_cast<std::uint8_t>(output[i]) | continuation_bit);
  }
  return output;
}

auto encoder::timestamp(std::uint64_t value) -> std::string
{
  if (value == max_timestamp) {
    last_timestamp_ = max_timestamp;
    return encode_varint(0);
  }
  const auto delta = value - last_timestamp_;
  last_timestamp_ = value;
  return encode_varint(delta + 1);
}

auto encoder::encode(const bound &value) -> std::string
{
  auto output = timestamp(value.value.timestamp);
  output += encode_varint(value.id_length);
  output.append(value.value.id.begin(), value.value.id.begin() + static_cast<std::ptrdiff_t>(value.id_length));
  return output;
}

auto decoder::byte() -> std::uint8_t
{
  if (input_.empty()) { throw protocol_error("negentropy message truncated"); }
  const auto value = static_cast<std::uint8_t>(input_.front());
  input_.remove_prefix(1);
  return value;
}

auto decoder::varint() -> std::uint64_t
{
  std::uint64_t value = 0;
  for (std::size_t length = 1;; ++length) {
    if (length > max_varint_length) { throw protocol_error("negentropy varint too long"); }
    const auto next = byte();
    value = (value << payload_bits) | (next & payload_mask);
    if ((next & continuation_bit) == 0) { break; }
  }
  return value;
}

auto decoder::bytes(std::size_t count) -> std::string_view
{
  if (input_.size() < count) { throw protocol_error("negentropy message truncated"); }
  auto value = input_.substr(0, count);
  input_.remove_prefix(count);
  return value;
}

auto decoder::timestamp() -> std::uint64_t
{
  auto value = varint();
  value = value == 0 ? max_timestamp : value - 1;
  if (last_timestamp_ == max_timestamp or value == max_timestamp) {
    last_timestamp_ = max_timestamp;
    return max_timestamp;
  }
  value += last_timestamp_;
  last_timestamp_ = value;
  return value;
}

auto decoder::decode_bound() -> bound
{
  bound result;
  result.value.timestamp = timestamp();
  result.id_length = varint();
  if (result.id_length > id_size) { throw protocol_error("negentropy bound id too long"); }
  const auto prefix = bytes(result.id_length);
  std::ranges::transform(prefix, result.value.id.begin(), [](char byte) { return static_cast<std::uint8_t>(byte); });
  return result;
}

}// namespace nostr_pool::negentropy
