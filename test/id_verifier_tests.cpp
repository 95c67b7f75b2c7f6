#include <catch2/catch_test_macros.hpp>
#include <concepts/event_verifier.hpp>
#include <nostr/id_verifier.hpp>

#include <algorithm>
#include <cctype>

#include "test_doubles/test_events.hpp"

static_assert(nostr_pool::concepts::event_verifier<nostr_pool::nostr::id_verifier>);
static_assert(nostr_pool::concepts::event_verifier<nostr_pool::nostr::accept_all_verifier>);

SCENARIO("id_verifier checks that an event's id commits to its contents", "[nostr][verifier]")
{
  const nostr_pool::nostr::id_verifier verifier;

  GIVEN("An event built with its computed id")
  {
    auto event = nostr_pool::test::make_event("authentic");

    THEN("it verifies") { REQUIRE(verifier.verify(event)); }

    WHEN("the id is written in upper case")
    {
      std::ranges::transform(
        event.id, event.id.begin(), [](unsigned char character) { return static_cast<char>(std::toupper(character)); });

      THEN("it still verifies") { REQUIRE(verifier.verify(event)); }
    }

    WHEN("the content is altered after the id was computed")
    {
      event.content = "forged";

      THEN("it fails") { REQUIRE_FALSE(verifier.verify(event)); }
    }

    WHEN("the pubkey is not 32 bytes of hex")
    {
      event.pubkey = "npub1notahexkey";
      event.id = event.compute_id();

      THEN("it fails") { REQUIRE_FALSE(verifier.verify(event)); }
    }
  }

  GIVEN("The accept-all verifier")
  {
    const nostr_pool::nostr::accept_all_verifier permissive;

    THEN("anything passes") { REQUIRE(permissive.verify(nostr_pool::nostr::protocol::event_data{})); }
  }
}
