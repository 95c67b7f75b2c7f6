#include <negentropy/reconciler.hpp>

#include <set>
#include <stdexcept>

namespace nostr_pool::negentropy {

namespace {
  constexpr std::size_t buckets = 16;
  constexpr std::size_t frame_headroom = 200;
  constexpr std::uint8_t min_version = 0x60;
  constexpr std::uint8_t max_version = 0x6F;

  auto encode_mode(mode value) -> std::string { return encode_varint(static_cast<std::uint64_t>(value)); }
}// namespace

reconciler::reconciler(const vector_storage &storage, std::size_t frame_size_limit)
  : storage_(storage), frame_size_limit_(frame_size_limit)
{
  if (frame_size_limit_ != 0 and frame_size_limit_ < min_frame_size_limit) {
    throw std::invalid_argument("negentropy frame size limit too small");
  }
}

auto reconciler::initiate() -> std::string
{
  if (initiator_) { throw std::logic_error("negentropy reconciliation already initiated"); }
  initiator_ = true;

  encoder out;
  std::string output(1, static_cast<char>(protocol_version));
  output += split_range(out, 0, storage_.size(), infinity_bound());
  return output;
}

auto reconciler::reconcile(std::string_view query, std::vector<std::string> &have, std::vector<std::string> &need)
  -> std::optional<std::string>
{
  if (not initiator_) { throw std::logic_error("negentropy reconcile called before initiate"); }
  auto output = reconcile_ranges(query, have, need);
  if (output.size() == 1) { return std::nullopt; }
  return output;
}

auto reconciler::respond(std::string_view query) -> std::string
{
  if (initiator_) { throw std::logic_error("negentropy initiator cannot respond"); }
  std::vector<std::string> unused_have;
  std::vector<std::string> unused_need;
  return reconcile_ranges(query, unused_have, unused_need);
}

auto reconciler::reconcile_ranges(std::string_view query,
  std::vector<std::string> &have,
  std::vector<std::string> &need) -> std::string
{
  decoder in(query);
  encoder out;
  std::string full_output(1, static_cast<char>(protocol_version));

  const auto version = in.byte();
  if (version < min_version or version > max_version) {
    throw protocol_error("invalid negentropy protocol version byte");
  }
  if (version != protocol_version) {
    if (initiator_) { throw protocol_error("unsupported negentropy protocol version requested"); }
    // Tell the initiator which version we speak.
    return full_output;
  }

  const auto storage_size = storage_.size();
  bound prev_bound{};
  std::size_t prev_index = 0;
  bool skip = false;

  while (not in.empty()) {
    std::string output;
    auto flush_skip = [&] {
      if (not skip) { return; }
      skip = false;
      output += out.encode(prev_bound);
      output += encode_mode(mode::skip);
    };

    const auto current_bound = in.decode_bound();
    const auto current_mode = in.varint();
    const auto lower = prev_index;
    auto upper = storage_.find_lower_bound(prev_index, storage_size, current_bound);

    if (current_mode == static_cast<std::uint64_t>(mode::skip)) {
      skip = true;
    } else if (current_mode == static_cast<std::uint64_t>(mode::fingerprint)) {
      const auto theirs = in.bytes(fingerprint_size);
      if (theirs != storage_.fingerprint(lower, upper)) {
        flush_skip();
        output += split_range(out, lower, upper, current_bound);
      } else {
        skip = true;
      }
    } else if (current_mode == static_cast<std::uint64_t>(mode::id_list)) {
      const auto count = in.varint();
      std::set<std::string> their_ids;
      for (std::uint64_t i = 0; i < count; ++i) { their_ids.emplace(in.bytes(id_size)); }

      if (initiator_) {
        skip = true;
        storage_.iterate(lower, upper, [&](const item &entry, std::size_t /*index*/) {
          auto id = entry.id_string();
          if (not their_ids.erase(id)) { have.push_back(std::move(id)); }
          return true;
        });
        need.insert(need.end(), their_ids.begin(), their_ids.end());
      } else {
        flush_skip();

        std::string response_ids;
        std::uint64_t response_count = 0;
        auto end_bound = current_bound;
        storage_.iterate(lower, upper, [&](const item &entry, std::size_t index) {
          if (exceeds_frame_limit(full_output.size() + response_ids.size())) {
            end_bound = bound{ .value = entry, .id_length = id_size };
            upper = index;
            return false;
          }
          response_ids += entry.id_string();
          ++response_count;
          return true;
        });

        output += out.encode(end_bound);
        output += encode_mode(mode::id_list);
        output += encode_varint(response_count);
        output += response_ids;
        full_output += output;
        output.clear();
      }
    } else {
      throw protocol_error("unexpected negentropy mode");
    }

    if (exceeds_frame_limit(full_output.size() + output.size())) {
      // Summarize everything not yet covered and let the peer ask again.
      const auto remaining = storage_.fingerprint(upper, storage_size);
      full_output += out.encode(infinity_bound());
      full_output += encode_mode(mode::fingerprint);
      full_output += remaining;
      break;
    }

    full_output += output;
    prev_index = upper;
    prev_bound = current_bound;
  }

  return full_output;
}

auto reconciler::split_range(encoder &out, std::size_t lower, std::size_t upper, const bound &upper_bound)
  -> std::string
{
  std::string output;
  const auto count = upper - lower;

  if (count < buckets * 2) {
    output += out.encode(upper_bound);
    output += encode_mode(mode::id_list);
    output += encode_varint(count);
    storage_.iterate(lower, upper, [&output](const item &entry, std::size_t /*index*/) {
      output += entry.id_string();
      return true;
    });
    return output;
  }

  const auto per_bucket = count / buckets;
  const auto with_extra = count % buckets;
  auto current = lower;

  for (std::size_t i = 0; i < buckets; ++i) {
    const auto bucket_size = per_bucket + (i < with_extra ? 1 : 0);
    const auto fingerprint = storage_.fingerprint(current, current + bucket_size);
    current += bucket_size;

    const auto next_bound =
      current == upper ? upper_bound : minimal_bound(storage_.at(current - 1), storage_.at(current));

    output += out.encode(next_bound);
    output += encode_mode(mode::fingerprint);
    output += fingerprint;
  }
  return output;
}

auto reconciler::exceeds_frame_limit(std::size_t size) const -> bool
{
  return frame_size_limit_ != 0 and size > frame_size_limit_ - frame_headroom;
}

}// namespace nostr_pool::negentropy
