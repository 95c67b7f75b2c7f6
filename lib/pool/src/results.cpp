#include <pool/results.hpp>

#include <algorithm>

namespace nostr_pool::pool {

auto publish_report::accepted_count() const -> std::size_t
{
  return static_cast<std::size_t>(
    std::ranges::count_if(outcomes, [](const auto &entry) { return entry.second.is_accepted(); }));
}

}// namespace nostr_pool::pool
