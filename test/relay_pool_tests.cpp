#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_future.hpp>
#include <catch2/catch_test_macros.hpp>

#include <pool/relay_pool.hpp>

#include "test_doubles/io_helpers.hpp"
#include "test_doubles/test_double_relay.hpp"
#include "test_doubles/test_events.hpp"

#include <algorithm>
#include <chrono>
#include <future>
#include <map>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace {

using pool_t = nostr_pool::pool::relay_pool<nostr_pool::test::test_double_relay_stream>;
using nostr_pool::pool::connection_status;
using nostr_pool::pool::publish_outcome;
using nostr_pool::test::run_awaitable;
using nostr_pool::test::run_until;

constexpr auto relay_a_address = "wss://relay-a.example.com";
constexpr auto relay_b_address = "wss://relay-b.example.com";
constexpr auto relay_c_address = "wss://relay-c.example.com";
constexpr auto relay_d_address = "wss://relay-d.example.com";

auto fast_options() -> nostr_pool::pool::relay_options
{
  nostr_pool::pool::relay_options options;
  options.backoff = { .initial = std::chrono::milliseconds(10),
    .max = std::chrono::milliseconds(50),
    .multiplier = 2.0,
    .jitter = 0.0 };
  options.publish_timeout = std::chrono::milliseconds(500);
  return options;
}

auto text_notes() -> nostr_pool::nostr::filters
{
  nostr_pool::nostr::filter scope;
  scope.kinds = { 1 };
  return { scope };
}

auto url_of(const char *address) -> nostr_pool::nostr::relay_url { return nostr_pool::nostr::relay_url::parse(address); }

/// A pool whose relays are all scripted test doubles
struct pool_fixture
{
  using relay_map = std::map<std::string, std::shared_ptr<nostr_pool::test::test_double_relay>>;

  std::shared_ptr<boost::asio::io_context> io_context = std::make_shared<boost::asio::io_context>();
  std::shared_ptr<relay_map> relays = std::make_shared<relay_map>();
  /// Copied into every stream factory, so its use count tracks live connections
  std::shared_ptr<int> factory_token = std::make_shared<int>(0);
  std::shared_ptr<pool_t> pool;

  explicit pool_fixture(nostr_pool::pool::pool_options options = default_options())
  {
    pool = std::make_shared<pool_t>(
      io_context,
      [relays = relays, token = factory_token](const nostr_pool::nostr::relay_url &url) {
        return std::make_shared<nostr_pool::test::test_double_relay_stream>(relays->at(url.str()));
      },
      options);
  }

  static auto default_options() -> nostr_pool::pool::pool_options
  {
    nostr_pool::pool::pool_options options;
    options.close_grace = std::chrono::milliseconds(200);
    return options;
  }

  pool_fixture(const pool_fixture &) = delete;
  auto operator=(const pool_fixture &) -> pool_fixture & = delete;
  pool_fixture(pool_fixture &&) = delete;
  auto operator=(pool_fixture &&) -> pool_fixture & = delete;

  ~pool_fixture()
  {
    if (pool->is_shut_down()) { return; }
    boost::asio::co_spawn(*io_context, pool->shutdown(), boost::asio::detached);
    nostr_pool::test::run_for(*io_context, std::chrono::milliseconds(20));
  }

  auto add(const char *address, nostr_pool::pool::relay_options options = fast_options())
    -> std::shared_ptr<nostr_pool::test::test_double_relay>
  {
    auto relay = std::make_shared<nostr_pool::test::test_double_relay>(io_context);
    relays->insert_or_assign(url_of(address).str(), relay);
    pool->add_relay(address, options);
    return relay;
  }

  auto wait_connected(std::initializer_list<const char *> addresses) -> bool
  {
    return run_until(*io_context, [&]() {
      return std::ranges::all_of(
        addresses, [&](const char *address) { return pool->status(address) == connection_status::connected; });
    });
  }

  /// Starts a fetch and returns its future; drive it with run_until
  auto start_fetch(nostr_pool::pool::fetch_options options)
    -> std::future<std::vector<nostr_pool::nostr::protocol::event_data>>
  {
    return boost::asio::co_spawn(
      *io_context, pool->fetch_events(text_notes(), nostr_pool::pool::all_relays, options), boost::asio::use_future);
  }

  auto drain(nostr_pool::async::consumer<nostr_pool::pool::stream_item> &stream) -> std::vector<nostr_pool::pool::stream_item>
  {
    std::vector<nostr_pool::pool::stream_item> items;
    while (auto item = stream.try_next()) { items.push_back(std::move(*item)); }
    return items;
  }
};

}// namespace

SCENARIO("relay_pool merges one subscription across relays", "[pool][subscribe]")
{
  GIVEN("two connected relays and a stream consumer")
  {
    pool_fixture fixture;
    auto relay_a = fixture.add(relay_a_address);
    auto relay_b = fixture.add(relay_b_address);
    fixture.pool->connect();
    REQUIRE(fixture.wait_connected({ relay_a_address, relay_b_address }));
    auto stream = fixture.pool->events();

    const auto subscription_id = fixture.pool->subscribe(text_notes());
    REQUIRE(run_until(*fixture.io_context,
      [&]() { return relay_a->req_count(subscription_id) == 1 and relay_b->req_count(subscription_id) == 1; }));

    const auto first = nostr_pool::test::make_event("first");
    const auto second = nostr_pool::test::make_event("second");

    WHEN("relay A sends E1 and relay B sends E1 and E2")
    {
      relay_a->send_event(subscription_id, first);
      REQUIRE(run_until(*fixture.io_context, [&]() { return stream->pending() == 1; }));
      relay_b->send_event(subscription_id, first);
      relay_b->send_event(subscription_id, second);
      REQUIRE(run_until(*fixture.io_context, [&]() { return fixture.pool->confirmations(second.id).has_value(); }));

      THEN("the consumer receives exactly two events")
      {
        const auto items = fixture.drain(*stream);
        REQUIRE(items.size() == 2);
        REQUIRE(items[0].event.id == first.id);
        REQUIRE(items[0].relay == url_of(relay_a_address));
        REQUIRE(items[1].event.id == second.id);
        REQUIRE(items[1].relay == url_of(relay_b_address));
      }

      THEN("confirmations record every relay that sent each event")
      {
        REQUIRE(fixture.pool->confirmations(first.id) == std::set{ url_of(relay_a_address), url_of(relay_b_address) });
        REQUIRE(fixture.pool->confirmations(second.id) == std::set{ url_of(relay_b_address) });
      }

      THEN("delivered events are stored locally")
      {
        REQUIRE(fixture.pool->store()->contains(first.id));
        REQUIRE(fixture.pool->store()->contains(second.id));
      }
    }

    WHEN("both relays finish sending stored events")
    {
      REQUIRE(run_until(
        *fixture.io_context, [&]() { return fixture.pool->subscription(subscription_id)->eose.size() == 2; }));

      THEN("the subscription has caught up on every relay")
      {
        REQUIRE(fixture.pool->subscription(subscription_id)->relays.size() == 2);
      }
    }

    WHEN("the subscription is closed")
    {
      fixture.pool->unsubscribe(subscription_id);

      THEN("each relay receives CLOSE and the bookkeeping is released")
      {
        REQUIRE(run_until(*fixture.io_context, [&]() {
          return not relay_a->received<nostr_pool::nostr::protocol::close>().empty()
                 and not relay_b->received<nostr_pool::nostr::protocol::close>().empty();
        }));
        REQUIRE(run_until(
          *fixture.io_context, [&]() { return not fixture.pool->subscription(subscription_id).has_value(); }));
        REQUIRE(relay_a->received<nostr_pool::nostr::protocol::close>().front().subscription_id == subscription_id);
      }

      THEN("late events for it are not delivered")
      {
        relay_a->send_event(subscription_id, first);
        nostr_pool::test::run_for(*fixture.io_context, std::chrono::milliseconds(20));
        REQUIRE(fixture.drain(*stream).empty());
      }

      THEN("closing it again is an error")
      {
        REQUIRE_THROWS_AS(fixture.pool->unsubscribe(subscription_id), nostr_pool::pool::pool_error);
      }
    }

    WHEN("its filters are replaced")
    {
      nostr_pool::nostr::filter reactions;
      reactions.kinds = { 7 };
      fixture.pool->update_filters(subscription_id, { reactions });

      THEN("each relay receives a new REQ under the same id")
      {
        REQUIRE(run_until(*fixture.io_context,
          [&]() { return relay_a->req_count(subscription_id) == 2 and relay_b->req_count(subscription_id) == 2; }));
        const auto requests = relay_a->received<nostr_pool::nostr::protocol::req>();
        REQUIRE(requests.back().filter_list.front().kinds == std::set<std::uint16_t>{ 7 });
      }
    }
  }
}

SCENARIO("relay_pool releases a closing subscription after the grace period", "[pool][subscribe]")
{
  GIVEN("a subscription on a relay that stops completing writes")
  {
    pool_fixture fixture;
    auto relay_a = fixture.add(relay_a_address);
    fixture.pool->connect();
    REQUIRE(fixture.wait_connected({ relay_a_address }));
    const auto subscription_id = fixture.pool->subscribe(text_notes());
    REQUIRE(run_until(*fixture.io_context, [&]() { return relay_a->req_count(subscription_id) == 1; }));
    nostr_pool::test::run_for(*fixture.io_context, std::chrono::milliseconds(10));
    relay_a->set_stall_writes(true);

    WHEN("the subscription is closed and its CLOSE is never acknowledged")
    {
      fixture.pool->unsubscribe(subscription_id);
      REQUIRE(run_until(
        *fixture.io_context, [&]() { return not relay_a->received<nostr_pool::nostr::protocol::close>().empty(); }));
      nostr_pool::test::run_for(*fixture.io_context, std::chrono::milliseconds(50));

      THEN("it is held as closing, then forgotten once the grace period ends")
      {
        const auto closing = fixture.pool->subscription(subscription_id);
        REQUIRE(closing.has_value());
        REQUIRE(closing->closed);
        REQUIRE(closing->pending_close.contains(url_of(relay_a_address)));

        REQUIRE(run_until(
          *fixture.io_context, [&]() { return not fixture.pool->subscription(subscription_id).has_value(); }));
        REQUIRE(fixture.pool->status(relay_a_address) == connection_status::connected);
      }
    }
  }
}

SCENARIO("relay_pool fans a subscription out only to the relays present when it was made", "[pool][subscribe]")
{
  GIVEN("three connected relays, one of them write-only")
  {
    pool_fixture fixture;
    auto relay_a = fixture.add(relay_a_address);
    auto relay_b = fixture.add(relay_b_address);
    auto write_only = fast_options();
    write_only.read = false;
    auto relay_c = fixture.add(relay_c_address, write_only);
    fixture.pool->connect();
    REQUIRE(fixture.wait_connected({ relay_a_address, relay_b_address, relay_c_address }));

    WHEN("a subscription targets every relay and a fourth relay joins later")
    {
      const auto subscription_id = fixture.pool->subscribe(text_notes());
      auto relay_d = fixture.add(relay_d_address);
      fixture.pool->connect_relay(relay_d_address);
      REQUIRE(fixture.wait_connected({ relay_d_address }));
      REQUIRE(run_until(*fixture.io_context,
        [&]() { return relay_a->req_count(subscription_id) == 1 and relay_b->req_count(subscription_id) == 1; }));
      nostr_pool::test::run_for(*fixture.io_context, std::chrono::milliseconds(20));

      THEN("only the readable relays present at subscribe time serve it")
      {
        REQUIRE(relay_c->req_count(subscription_id) == 0);
        REQUIRE(relay_d->req_count(subscription_id) == 0);
        REQUIRE(fixture.pool->subscription(subscription_id)->relays
                == std::set{ url_of(relay_a_address), url_of(relay_b_address) });
      }
    }

    WHEN("a subscription names its relays explicitly")
    {
      const auto subscription_id =
        fixture.pool->subscribe(text_notes(), std::vector<std::string>{ relay_c_address });
      REQUIRE(run_until(*fixture.io_context, [&]() { return relay_c->req_count(subscription_id) == 1; }));

      THEN("the read flag does not apply")
      {
        REQUIRE(relay_a->req_count(subscription_id) == 0);
        REQUIRE(relay_b->req_count(subscription_id) == 0);
      }
    }
  }
}

SCENARIO("relay_pool resubscribes after a relay reconnects", "[pool][reconnect]")
{
  GIVEN("a subscription on a connected relay")
  {
    pool_fixture fixture;
    auto relay_a = fixture.add(relay_a_address);
    fixture.pool->connect();
    REQUIRE(fixture.wait_connected({ relay_a_address }));
    auto stream = fixture.pool->events();
    auto notes = fixture.pool->notifications();
    const auto subscription_id = fixture.pool->subscribe(text_notes());
    REQUIRE(run_until(*fixture.io_context, [&]() { return relay_a->req_count(subscription_id) == 1; }));

    WHEN("the connection drops and comes back")
    {
      relay_a->sever();
      REQUIRE(run_until(*fixture.io_context, [&]() { return relay_a->req_count(subscription_id) == 2; }));
      REQUIRE(fixture.wait_connected({ relay_a_address }));

      THEN("the same subscription keeps delivering events")
      {
        const auto event = nostr_pool::test::make_event("after reconnect");
        relay_a->send_event(subscription_id, event);
        REQUIRE(run_until(*fixture.io_context, [&]() { return stream->pending() == 1; }));
        REQUIRE(stream->try_next()->subscription_id == subscription_id);
      }

      THEN("the status changes were announced")
      {
        std::vector<connection_status> seen;
        while (auto note = notes->try_next()) {
          if (const auto *change = std::get_if<nostr_pool::pool::notifications::status_changed>(&*note)) {
            seen.push_back(change->to);
          }
        }
        REQUIRE(std::ranges::find(seen, connection_status::disconnected) != seen.end());
        REQUIRE(seen.back() == connection_status::connected);
      }
    }
  }
}

SCENARIO("relay_pool reports publish outcomes per relay", "[pool][publish]")
{
  GIVEN("one accepting relay, one rejecting relay and one unreachable relay")
  {
    pool_fixture fixture;
    auto relay_a = fixture.add(relay_a_address);
    auto relay_b = fixture.add(relay_b_address);
    auto relay_c = fixture.add(relay_c_address);
    relay_b->set_publish_reply(false, "blocked: not on whitelist");
    relay_c->set_refuse_connections(true);
    fixture.pool->connect();
    REQUIRE(fixture.wait_connected({ relay_a_address, relay_b_address }));

    WHEN("an event is published to every relay")
    {
      const auto event = nostr_pool::test::make_event("hello relays");
      const auto report = run_awaitable(*fixture.io_context, fixture.pool->publish(event));

      THEN("each relay has its own outcome")
      {
        REQUIRE(report.event_id == event.id);
        REQUIRE(report.outcomes.size() == 3);
        REQUIRE(report.outcomes.at(url_of(relay_a_address)).result == publish_outcome::kind::accepted);
        REQUIRE(report.outcomes.at(url_of(relay_b_address)).result == publish_outcome::kind::rejected);
        REQUIRE(report.outcomes.at(url_of(relay_b_address)).message == "blocked: not on whitelist");
        REQUIRE(report.outcomes.at(url_of(relay_c_address)).result == publish_outcome::kind::not_attempted);
        REQUIRE(report.accepted_count() == 1);
        REQUIRE(report.any_accepted());
      }

      THEN("the accepting relay stored the event")
      {
        REQUIRE(relay_a->stored().size() == 1);
        REQUIRE(relay_a->stored().front().id == event.id);
      }
    }

    WHEN("an event is published to a relay that is not in the pool")
    {
      THEN("relay_not_found is raised")
      {
        REQUIRE_THROWS_AS(run_awaitable(*fixture.io_context,
                            fixture.pool->publish(nostr_pool::test::make_event("lost"),
                              std::vector<std::string>{ "wss://unknown.example.com" })),
          nostr_pool::pool::relay_not_found);
      }
    }
  }
}

SCENARIO("relay_pool fetches stored events once", "[pool][fetch]")
{
  GIVEN("two relays with overlapping stored events")
  {
    pool_fixture fixture;
    auto relay_a = fixture.add(relay_a_address);
    auto relay_b = fixture.add(relay_b_address);
    const auto first = nostr_pool::test::make_event("one", 100);
    const auto shared = nostr_pool::test::make_event("two", 200);
    const auto third = nostr_pool::test::make_event("three", 300);
    relay_a->add_stored_event(first);
    relay_a->add_stored_event(shared);
    relay_b->add_stored_event(shared);
    relay_b->add_stored_event(third);
    fixture.pool->connect();
    REQUIRE(fixture.wait_connected({ relay_a_address, relay_b_address }));
    auto stream = fixture.pool->events();

    WHEN("fetching text notes")
    {
      const auto events = run_awaitable(*fixture.io_context, fixture.pool->fetch_events(text_notes()));

      THEN("every event is returned once and stored")
      {
        REQUIRE(events.size() == 3);
        std::set<std::string> ids;
        for (const auto &event : events) { ids.insert(event.id); }
        REQUIRE(ids == std::set{ first.id, shared.id, third.id });
        REQUIRE(fixture.pool->store()->size() == 3);
      }

      THEN("nothing reaches the unified stream")
      {
        nostr_pool::test::run_for(*fixture.io_context, std::chrono::milliseconds(10));
        REQUIRE(fixture.drain(*stream).empty());
      }

      THEN("the fetch subscription is closed on both relays")
      {
        REQUIRE(run_until(*fixture.io_context, [&]() {
          return relay_a->received<nostr_pool::nostr::protocol::close>().size() == 1
                 and relay_b->received<nostr_pool::nostr::protocol::close>().size() == 1;
        }));
      }
    }

    WHEN("one relay never sends EOSE")
    {
      relay_b->set_answer_requests(false);
      const auto events = run_awaitable(
        *fixture.io_context, fixture.pool->fetch_events(text_notes(), nostr_pool::pool::all_relays, std::chrono::milliseconds(50)));

      THEN("the timeout returns what arrived")
      {
        REQUIRE(events.size() == 2);
      }
    }
  }

  GIVEN("a pool without connected relays")
  {
    pool_fixture fixture;
    auto relay_a = fixture.add(relay_a_address);

    THEN("a fetch returns nothing right away")
    {
      REQUIRE(run_awaitable(*fixture.io_context, fixture.pool->fetch_events(text_notes())).empty());
      REQUIRE(relay_a->frames().empty());
    }
  }
}

SCENARIO("relay_pool fetches keep listening after EOSE when asked to", "[pool][fetch]")
{
  GIVEN("a relay with one stored event")
  {
    pool_fixture fixture;
    auto relay_a = fixture.add(relay_a_address);
    const auto stored = nostr_pool::test::make_event("stored", 100);
    const auto live_one = nostr_pool::test::make_event("live one", 200);
    const auto live_two = nostr_pool::test::make_event("live two", 300);
    relay_a->add_stored_event(stored);
    fixture.pool->connect();
    REQUIRE(fixture.wait_connected({ relay_a_address }));

    auto fetch_id = [&]() { return relay_a->received<nostr_pool::nostr::protocol::req>().back().subscription_id; };
    auto is_ready = [](auto &future) { return future.wait_for(std::chrono::seconds(0)) == std::future_status::ready; };

    WHEN("the fetch waits for two more events after EOSE")
    {
      auto future = fixture.start_fetch(
        { .timeout = std::chrono::seconds(2), .exit = nostr_pool::pool::fetch_exit::after_events{ .count = 2 } });
      REQUIRE(run_until(
        *fixture.io_context, [&]() { return not relay_a->received<nostr_pool::nostr::protocol::req>().empty(); }));
      nostr_pool::test::run_for(*fixture.io_context, std::chrono::milliseconds(20));

      THEN("it returns only after the second live event")
      {
        REQUIRE_FALSE(is_ready(future));
        relay_a->send_event(fetch_id(), live_one);
        nostr_pool::test::run_for(*fixture.io_context, std::chrono::milliseconds(20));
        REQUIRE_FALSE(is_ready(future));

        relay_a->send_event(fetch_id(), live_two);
        REQUIRE(run_until(*fixture.io_context, [&]() { return is_ready(future); }));
        const auto events = future.get();
        REQUIRE(events.size() == 3);
        REQUIRE(events.back().id == live_two.id);
      }
    }

    WHEN("the fetch lingers for a while after EOSE")
    {
      constexpr auto linger = std::chrono::milliseconds(100);
      const auto started = std::chrono::steady_clock::now();
      auto future =
        fixture.start_fetch({ .timeout = std::chrono::seconds(2), .exit = nostr_pool::pool::fetch_exit::after_duration{ .duration = linger } });
      REQUIRE(run_until(
        *fixture.io_context, [&]() { return not relay_a->received<nostr_pool::nostr::protocol::req>().empty(); }));
      relay_a->send_event(fetch_id(), live_one);

      THEN("events inside the window are kept and it returns once the window ends")
      {
        REQUIRE(run_until(*fixture.io_context, [&]() { return is_ready(future); }));
        REQUIRE(std::chrono::steady_clock::now() - started >= linger);
        const auto events = future.get();
        REQUIRE(events.size() == 2);
      }
    }

    WHEN("the fetch exits on EOSE")
    {
      auto future = fixture.start_fetch({ .timeout = std::chrono::seconds(2), .exit = nostr_pool::pool::fetch_exit::on_eose{} });

      THEN("it returns the stored events without waiting")
      {
        REQUIRE(run_until(*fixture.io_context, [&]() { return is_ready(future); }, std::chrono::milliseconds(500)));
        REQUIRE(future.get().size() == 1);
      }
    }
  }
}

SCENARIO("relay_pool reconciles and syncs with a relay", "[pool][negentropy]")
{
  GIVEN("a local store and a relay that share one event")
  {
    pool_fixture fixture;
    auto relay_a = fixture.add(relay_a_address);
    const auto shared = nostr_pool::test::make_event("shared", 100);
    const auto local_only = nostr_pool::test::make_event("local", 200);
    const auto remote_only = nostr_pool::test::make_event("remote", 300);
    const auto other_kind = nostr_pool::test::make_event("{}", 400, nostr_pool::nostr::protocol::kind::profile_metadata);

    fixture.pool->store()->store(shared);
    fixture.pool->store()->store(local_only);
    fixture.pool->store()->store(other_kind);
    relay_a->add_stored_event(shared);
    relay_a->add_stored_event(remote_only);
    fixture.pool->connect();
    REQUIRE(fixture.wait_connected({ relay_a_address }));

    WHEN("reconciling text notes")
    {
      const auto result =
        run_awaitable(*fixture.io_context, fixture.pool->reconcile(relay_a_address, text_notes().front()));

      THEN("the difference is exact")
      {
        REQUIRE(result.complete);
        REQUIRE(result.error.empty());
        REQUIRE(result.rounds >= 1);
        REQUIRE(result.need == std::vector<std::string>{ remote_only.id });
        REQUIRE(result.have == std::vector<std::string>{ local_only.id });
      }

      THEN("the session is closed on the relay")
      {
        REQUIRE(run_until(*fixture.io_context,
          [&]() { return relay_a->received<nostr_pool::nostr::protocol::neg_close>().size() == 1; }));
      }
    }

    WHEN("syncing in both directions")
    {
      nostr_pool::pool::sync_options options;
      options.direction = nostr_pool::pool::sync_direction::both;
      const auto report =
        run_awaitable(*fixture.io_context, fixture.pool->sync(relay_a_address, text_notes().front(), options));

      THEN("both sides end up with both events")
      {
        REQUIRE(report.reconciliation.complete);
        REQUIRE(report.received == 1);
        REQUIRE(report.sent == 1);
        REQUIRE(report.failed.empty());
        REQUIRE(fixture.pool->store()->contains(remote_only.id));
        REQUIRE(std::ranges::any_of(relay_a->stored(), [&](const auto &event) { return event.id == local_only.id; }));
      }
    }

    WHEN("syncing down only")
    {
      const auto report = run_awaitable(*fixture.io_context, fixture.pool->sync(relay_a_address, text_notes().front()));

      THEN("nothing is published")
      {
        REQUIRE(report.received == 1);
        REQUIRE(report.sent == 0);
        REQUIRE(relay_a->received<nostr_pool::nostr::protocol::event>().empty());
      }
    }

    WHEN("the relay does not support negentropy")
    {
      relay_a->set_negentropy_supported(false);
      nostr_pool::pool::reconciliation_options options;
      options.initial_timeout = std::chrono::milliseconds(50);
      const auto result =
        run_awaitable(*fixture.io_context, fixture.pool->reconcile(relay_a_address, text_notes().front(), options));

      THEN("the result is incomplete and explains why")
      {
        REQUIRE_FALSE(result.complete);
        REQUIRE(result.rounds == 0);
        REQUIRE(result.error.find("no reply") != std::string::npos);
      }
    }

    WHEN("the relay refuses the session")
    {
      relay_a->set_negentropy_error("blocked: negentropy disabled");
      const auto result =
        run_awaitable(*fixture.io_context, fixture.pool->reconcile(relay_a_address, text_notes().front()));

      THEN("the relay's reason is reported")
      {
        REQUIRE_FALSE(result.complete);
        REQUIRE(result.error == "relay error: blocked: negentropy disabled");
      }
    }
  }

  GIVEN("a relay that is not connected")
  {
    pool_fixture fixture;
    auto relay_a = fixture.add(relay_a_address);

    THEN("reconciliation is incomplete without contacting it")
    {
      const auto result =
        run_awaitable(*fixture.io_context, fixture.pool->reconcile(relay_a_address, text_notes().front()));
      REQUIRE_FALSE(result.complete);
      REQUIRE(result.error == "relay not connected");
      REQUIRE(relay_a->frames().empty());
    }
  }
}

SCENARIO("relay_pool rejects misuse", "[pool][errors]")
{
  GIVEN("a pool with one relay")
  {
    pool_fixture fixture;
    auto relay_a = fixture.add(relay_a_address);

    THEN("unknown relays and subscriptions are reported")
    {
      REQUIRE_THROWS_AS(fixture.pool->remove_relay("wss://unknown.example.com"), nostr_pool::pool::relay_not_found);
      REQUIRE_THROWS_AS(fixture.pool->status("wss://unknown.example.com"), nostr_pool::pool::relay_not_found);
      REQUIRE_THROWS_AS(fixture.pool->connect_relay("wss://unknown.example.com"), nostr_pool::pool::relay_not_found);
      REQUIRE_THROWS_AS(fixture.pool->unsubscribe("missing"), nostr_pool::pool::subscription_not_found);
      REQUIRE_THROWS_AS(fixture.pool->update_filters("missing", text_notes()), nostr_pool::pool::subscription_not_found);
    }

    THEN("bad arguments are rejected")
    {
      REQUIRE_THROWS_AS(fixture.pool->add_relay("ws://insecure.example.com"), std::invalid_argument);
      REQUIRE_THROWS_AS(fixture.pool->subscribe({}), std::invalid_argument);
    }

    THEN("adding the same relay twice keeps one connection")
    {
      const auto url = fixture.pool->add_relay(relay_a_address);
      REQUIRE(url == url_of(relay_a_address));
      REQUIRE(fixture.pool->relays().size() == 1);
    }

    WHEN("a relay is removed")
    {
      auto relay_b = fixture.add(relay_b_address);
      fixture.pool->connect();
      REQUIRE(fixture.wait_connected({ relay_a_address, relay_b_address }));
      const auto subscription_id = fixture.pool->subscribe(text_notes());
      fixture.pool->remove_relay(relay_b_address);
      REQUIRE(run_until(*fixture.io_context, [&]() { return not relay_b->is_connected(); }));

      THEN("it leaves the pool and every subscription")
      {
        REQUIRE(fixture.pool->relays() == std::vector{ url_of(relay_a_address) });
        REQUIRE(fixture.pool->subscription(subscription_id)->relays == std::set{ url_of(relay_a_address) });
        REQUIRE_THROWS_AS(fixture.pool->status(relay_b_address), nostr_pool::pool::relay_not_found);
      }
    }

    WHEN("the pool is shut down")
    {
      fixture.pool->connect();
      REQUIRE(fixture.wait_connected({ relay_a_address }));
      auto stream = fixture.pool->events();
      static_cast<void>(fixture.pool->subscribe(text_notes()));
      run_awaitable(*fixture.io_context, fixture.pool->shutdown());

      THEN("connections are closed and the stream ends")
      {
        REQUIRE(fixture.pool->is_shut_down());
        REQUIRE_FALSE(relay_a->is_connected());
        REQUIRE_FALSE(stream->is_open());
        REQUIRE(fixture.pool->relays().empty());
      }

      THEN("shutting down again is harmless")
      {
        run_awaitable(*fixture.io_context, fixture.pool->shutdown());
        REQUIRE(fixture.pool->is_shut_down());
      }

      THEN("further commands fail")
      {
        REQUIRE_THROWS_AS(fixture.pool->add_relay(relay_b_address), nostr_pool::pool::pool_shut_down);
        REQUIRE_THROWS_AS(fixture.pool->subscribe(text_notes()), nostr_pool::pool::pool_shut_down);
        REQUIRE_THROWS_AS(fixture.pool->connect(), nostr_pool::pool::pool_shut_down);
      }
    }
  }
}

SCENARIO("relay_pool lets go of removed relays", "[pool][lifecycle]")
{
  GIVEN("a pool that repeatedly adds and removes relays")
  {
    pool_fixture fixture;
    const auto baseline = fixture.factory_token.use_count();

    WHEN("each relay connects and is then removed")
    {
      for (int round = 0; round < 5; ++round) {
        fixture.add(relay_a_address);
        fixture.pool->connect();
        REQUIRE(fixture.wait_connected({ relay_a_address }));
        fixture.pool->remove_relay(relay_a_address);
      }

      THEN("no removed connection outlives its actor")
      {
        REQUIRE(run_until(*fixture.io_context, [&]() { return fixture.factory_token.use_count() == baseline; }));
        REQUIRE(fixture.pool->relays().empty());
      }
    }
  }
}
