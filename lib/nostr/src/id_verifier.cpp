#include <nostr/id_verifier.hpp>

#include <algorithm>
#include <cctype>

namespace nostr_pool::nostr {

auto id_verifier::verify(const protocol::event_data &event) const -> bool
{
  if (not protocol::is_hex32(event.id) or not protocol::is_hex32(event.pubkey)) { return false; }

  std::string lowered = event.id;
  std::ranges::transform(
    lowered, lowered.begin(), [](unsigned char character) { return static_cast<char>(std::tolower(character)); });
  return lowered == event.compute_id();
}

}// namespace nostr_pool::nostr
