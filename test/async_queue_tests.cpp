#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <catch2/catch_test_macros.hpp>
#include <memory>
#include <string>
#include <vector>

#include <async/async_queue.hpp>
#include <core/processor_runner.hpp>

SCENARIO("async_queue push respects its capacity", "[async_queue][push]")
{
  GIVEN("A queue with capacity 2")
  {
    auto io_context = std::make_shared<boost::asio::io_context>();
    nostr_pool::async::async_queue<int> queue(io_context, 2);

    WHEN("pushing three values")
    {
      const bool first = queue.push(1);
      const bool second = queue.push(2);
      const bool third = queue.push(3);

      THEN("the first two are accepted and the third is refused")
      {
        REQUIRE(first);
        REQUIRE(second);
        REQUIRE_FALSE(third);
        REQUIRE(queue.size() == 2);
      }
    }

    WHEN("pushing with eviction into a full queue")
    {
      queue.push(1);
      queue.push(2);
      const auto evicted = queue.push_evicting(3);

      THEN("the oldest value is evicted")
      {
        REQUIRE(evicted.has_value());
        REQUIRE(*evicted == 1);
        REQUIRE(queue.try_pop() == 2);
        REQUIRE(queue.try_pop() == 3);
        REQUIRE(queue.empty());
      }
    }
  }

  GIVEN("A closed queue")
  {
    auto io_context = std::make_shared<boost::asio::io_context>();
    nostr_pool::async::async_queue<int> queue(io_context);
    queue.close();

    WHEN("pushing a value")
    {
      THEN("the push fails")
      {
        REQUIRE_FALSE(queue.push(1));
        REQUIRE_FALSE(queue.push_evicting(1).has_value());
        REQUIRE_FALSE(queue.is_open());
      }
    }

    WHEN("trying to pop")
    {
      THEN("nothing is returned") { REQUIRE_FALSE(queue.try_pop().has_value()); }
    }
  }

  GIVEN("A queue constructed with capacity 0")
  {
    auto io_context = std::make_shared<boost::asio::io_context>();
    const nostr_pool::async::async_queue<int> queue(io_context, 0);

    THEN("it holds at least one element") { REQUIRE(queue.capacity() == 1); }
  }
}

SCENARIO("async_queue pop operation with coroutine", "[async_queue][pop]")
{
  GIVEN("A queue with values")
  {
    auto io_context = std::make_shared<boost::asio::io_context>();
    nostr_pool::async::async_queue<std::string> queue(io_context);
    queue.push("first");
    queue.push("second");

    WHEN("popping with co_await")
    {
      auto popped = std::make_shared<std::vector<std::string>>();

      boost::asio::co_spawn(
        *io_context,
        [](nostr_pool::async::async_queue<std::string> &source,
          std::shared_ptr<std::vector<std::string>> out) -> boost::asio::awaitable<void> {
          out->push_back(co_await source.pop());
          out->push_back(co_await source.pop());
        }(queue, popped),
        boost::asio::detached);

      io_context->run();

      THEN("values come out in FIFO order")
      {
        REQUIRE(*popped == std::vector<std::string>{ "first", "second" });
        REQUIRE(queue.empty());
      }
    }
  }

  GIVEN("A coroutine waiting on an empty queue")
  {
    auto io_context = std::make_shared<boost::asio::io_context>();
    nostr_pool::async::async_queue<int> queue(io_context);
    auto shutdown_seen = std::make_shared<bool>(false);

    boost::asio::co_spawn(
      *io_context,
      [](nostr_pool::async::async_queue<int> &source, std::shared_ptr<bool> seen) -> boost::asio::awaitable<void> {
        try {
          static_cast<void>(co_await source.pop());
        } catch (const boost::system::system_error &err) {
          *seen = nostr_pool::core::is_shutdown_error(err.code());
        }
      }(queue, shutdown_seen),
      boost::asio::detached);

    WHEN("the queue is closed")
    {
      io_context->poll();
      queue.close();
      io_context->run();

      THEN("the pop fails with a shutdown error") { REQUIRE(*shutdown_seen); }
    }
  }
}
