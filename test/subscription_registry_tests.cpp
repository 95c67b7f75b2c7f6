#include <catch2/catch_test_macros.hpp>

#include <pool/errors.hpp>
#include <pool/subscription_registry.hpp>

#include <cstdint>
#include <set>
#include <stdexcept>
#include <string>

namespace {

const auto relay_a = nostr_pool::nostr::relay_url::parse("wss://relay-a.example.com");
const auto relay_b = nostr_pool::nostr::relay_url::parse("wss://relay-b.example.com");

auto kind_filter(std::uint16_t kind) -> nostr_pool::nostr::filters
{
  nostr_pool::nostr::filter scope;
  scope.kinds = { kind };
  return { scope };
}

}// namespace

SCENARIO("subscription_registry allocates and records subscriptions", "[registry]")
{
  GIVEN("an empty registry")
  {
    nostr_pool::pool::subscription_registry registry;

    WHEN("adding a subscription without an id")
    {
      const auto first = registry.add(kind_filter(1), { relay_a, relay_b });
      const auto second = registry.add(kind_filter(1), { relay_a });

      THEN("each gets a fresh valid id")
      {
        REQUIRE(first != second);
        REQUIRE(first.size() == 32);
        REQUIRE(registry.size() == 2);
        REQUIRE(registry.is_active(first));
      }

      THEN("each relay sees the subscriptions targeting it")
      {
        REQUIRE(registry.active_for(relay_a).size() == 2);
        REQUIRE(registry.active_for(relay_b).size() == 1);
        REQUIRE(registry.active_for(relay_b).front().first == first);
      }
    }

    WHEN("adding a caller-chosen id twice")
    {
      registry.add(kind_filter(1), { relay_a }, std::string{ "mine" });

      THEN("the second add throws")
      {
        REQUIRE_THROWS_AS(registry.add(kind_filter(1), { relay_a }, std::string{ "mine" }), std::invalid_argument);
      }
    }
  }
}

SCENARIO("subscription_registry tracks filter updates and EOSE", "[registry]")
{
  GIVEN("a subscription on two relays")
  {
    nostr_pool::pool::subscription_registry registry;
    const auto subscription_id = registry.add(kind_filter(1), { relay_a, relay_b });

    WHEN("both relays send EOSE")
    {
      REQUIRE(registry.mark_eose(subscription_id, relay_a));
      REQUIRE_FALSE(registry.eose_complete(subscription_id));
      REQUIRE(registry.mark_eose(subscription_id, relay_b));

      THEN("the subscription has caught up") { REQUIRE(registry.eose_complete(subscription_id)); }

      AND_WHEN("the filters are replaced")
      {
        const auto relays = registry.update_filters(subscription_id, kind_filter(7));

        THEN("the same relays are returned and EOSE starts over")
        {
          REQUIRE(relays == std::set{ relay_a, relay_b });
          REQUIRE_FALSE(registry.eose_complete(subscription_id));
          REQUIRE(registry.get(subscription_id)->filters.front().kinds == std::set<std::uint16_t>{ 7 });
        }
      }

      AND_WHEN("one relay re-issues the REQ")
      {
        registry.reset_eose(subscription_id, relay_b);

        THEN("EOSE is incomplete again") { REQUIRE_FALSE(registry.eose_complete(subscription_id)); }
      }
    }

    WHEN("an unknown relay sends EOSE")
    {
      const auto other = nostr_pool::nostr::relay_url::parse("wss://other.example.com");

      THEN("it is ignored") { REQUIRE_FALSE(registry.mark_eose(subscription_id, other)); }
    }

    WHEN("updating an unknown subscription")
    {
      THEN("subscription_not_found is thrown")
      {
        REQUIRE_THROWS_AS(
          registry.update_filters("missing", kind_filter(1)), nostr_pool::pool::subscription_not_found);
      }
    }
  }
}

SCENARIO("subscription_registry closes subscriptions once every relay acknowledges", "[registry]")
{
  GIVEN("a subscription on two relays")
  {
    nostr_pool::pool::subscription_registry registry;
    const auto subscription_id = registry.add(kind_filter(1), { relay_a, relay_b });

    WHEN("the close begins")
    {
      const auto pending = registry.begin_close(subscription_id);

      THEN("it is no longer active but still known")
      {
        REQUIRE(pending == std::set{ relay_a, relay_b });
        REQUIRE_FALSE(registry.is_active(subscription_id));
        REQUIRE(registry.active_for(relay_a).empty());
        REQUIRE(registry.get(subscription_id).has_value());
      }

      THEN("closing again or updating throws subscription_closed")
      {
        REQUIRE_THROWS_AS(registry.begin_close(subscription_id), nostr_pool::pool::subscription_closed);
        REQUIRE_THROWS_AS(
          registry.update_filters(subscription_id, kind_filter(2)), nostr_pool::pool::subscription_closed);
      }

      THEN("it disappears after the last acknowledgement")
      {
        REQUIRE_FALSE(registry.acknowledge_close(subscription_id, relay_a));
        REQUIRE(registry.acknowledge_close(subscription_id, relay_b));
        REQUIRE_FALSE(registry.get(subscription_id).has_value());
      }

      THEN("removing a relay counts as its acknowledgement")
      {
        REQUIRE(registry.acknowledge_close(subscription_id, relay_a) == false);
        const auto affected = registry.remove_relay(relay_b);
        REQUIRE(affected.size() == 1);
        REQUIRE(registry.size() == 0);
      }
    }

    WHEN("a relay closes the subscription on its side")
    {
      registry.drop_relay(subscription_id, relay_a);

      THEN("the subscription continues on the other relay")
      {
        REQUIRE(registry.is_active(subscription_id));
        REQUIRE_FALSE(registry.is_active_on(subscription_id, relay_a));
        REQUIRE(registry.is_active_on(subscription_id, relay_b));
      }
    }
  }

  GIVEN("a subscription with no relays")
  {
    nostr_pool::pool::subscription_registry registry;
    const auto subscription_id = registry.add(kind_filter(1), {});

    WHEN("it is closed")
    {
      const auto pending = registry.begin_close(subscription_id);

      THEN("it is erased immediately")
      {
        REQUIRE(pending.empty());
        REQUIRE(registry.size() == 0);
      }
    }
  }
}
