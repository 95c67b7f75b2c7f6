#include <catch2/catch_test_macros.hpp>

#include <store/memory_event_store.hpp>

#include "test_doubles/test_events.hpp"

#include <string>
#include <vector>

namespace {

auto contents_of(const std::vector<nostr_pool::nostr::protocol::event_data> &events) -> std::vector<std::string>
{
  std::vector<std::string> contents;
  contents.reserve(events.size());
  for (const auto &event : events) { contents.push_back(event.content); }
  return contents;
}

}// namespace

SCENARIO("memory_event_store keeps one copy per event id", "[store]")
{
  GIVEN("an empty store")
  {
    nostr_pool::store::memory_event_store store;
    const auto event = nostr_pool::test::make_event("hello");

    WHEN("the same event is stored twice")
    {
      const bool first = store.store(event);
      const bool second = store.store(event);

      THEN("only the first store inserts it")
      {
        REQUIRE(first);
        REQUIRE_FALSE(second);
        REQUIRE(store.size() == 1);
        REQUIRE(store.contains(event.id));
      }
    }
  }
}

SCENARIO("memory_event_store answers filter queries newest first", "[store]")
{
  GIVEN("events spread over time from two authors")
  {
    nostr_pool::store::memory_event_store store;
    store.store(nostr_pool::test::make_event("one", 100));
    store.store(nostr_pool::test::make_event("two", 200));
    store.store(nostr_pool::test::make_event("three", 300, nostr_pool::nostr::protocol::kind::text_note,
      nostr_pool::test::bob_pubkey));
    store.store(nostr_pool::test::make_event("four", 400));

    WHEN("querying with an empty filter")
    {
      const auto results = store.query(nostr_pool::nostr::filter{});

      THEN("everything comes back newest first")
      {
        REQUIRE(contents_of(results) == std::vector<std::string>{ "four", "three", "two", "one" });
      }
    }

    WHEN("querying with a limit")
    {
      nostr_pool::nostr::filter scope;
      scope.limit = 2;

      THEN("only the newest events are returned")
      {
        REQUIRE(contents_of(store.query(scope)) == std::vector<std::string>{ "four", "three" });
      }
    }

    WHEN("querying a time window")
    {
      nostr_pool::nostr::filter scope;
      scope.since = 200;
      scope.until = 300;

      THEN("both bounds are inclusive")
      {
        REQUIRE(contents_of(store.query(scope)) == std::vector<std::string>{ "three", "two" });
      }
    }

    WHEN("querying by author")
    {
      nostr_pool::nostr::filter scope;
      scope.authors = { nostr_pool::test::bob_pubkey };

      THEN("only that author's events match")
      {
        REQUIRE(contents_of(store.query(scope)) == std::vector<std::string>{ "three" });
      }
    }

    WHEN("querying by id")
    {
      nostr_pool::nostr::filter scope;
      scope.ids = { nostr_pool::test::make_event("one", 100).id, nostr_pool::test::make_event("two", 200).id };

      THEN("the listed events come back newest first")
      {
        REQUIRE(contents_of(store.query(scope)) == std::vector<std::string>{ "two", "one" });
      }
    }

    WHEN("querying several overlapping filters")
    {
      nostr_pool::nostr::filter recent;
      recent.since = 300;
      nostr_pool::nostr::filter by_bob;
      by_bob.authors = { nostr_pool::test::bob_pubkey };

      const auto results = store.query(nostr_pool::nostr::filters{ recent, by_bob });

      THEN("the union holds each event once")
      {
        REQUIRE(contents_of(results) == std::vector<std::string>{ "four", "three" });
      }
    }
  }
}
