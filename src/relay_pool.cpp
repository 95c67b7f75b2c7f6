#include <algorithm>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/use_future.hpp>
#include <cli_utils/app_init.hpp>
#include <cli_utils/cli_parser.hpp>
#include <core/processor_runner.hpp>
#include <chrono>
#include <csignal>
#include <memory>
#include <nostr/id_verifier.hpp>
#include <pool/relay_pool.hpp>
#include <spdlog/spdlog.h>
#include <string>
#include <thread>
#include <transport/websocket_stream.hpp>
#include <vector>

namespace nostr_pool {

using pool_t = pool::relay_pool<transport::websocket_stream>;

namespace {

  /**
   * @brief Waits until no relay is still connecting, or the timeout passes.
   */
  auto settle(std::shared_ptr<pool_t> relay_pool, std::chrono::milliseconds timeout) -> boost::asio::awaitable<void>
  {
    constexpr auto poll_interval = std::chrono::milliseconds(100);
    boost::asio::steady_timer timer(co_await boost::asio::this_coro::executor);
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    while (std::chrono::steady_clock::now() < deadline) {
      const auto statuses = relay_pool->statuses();
      const bool pending = std::ranges::any_of(statuses, [](const auto &entry) {
        return entry.second == pool::connection_status::initialized
               or entry.second == pool::connection_status::connecting;
      });
      if (not pending) { co_return; }
      timer.expires_after(poll_interval);
      co_await timer.async_wait(boost::asio::use_awaitable);
    }
  }

  auto drain_notifications(std::shared_ptr<async::consumer<pool::notification>> notes) -> boost::asio::awaitable<void>
  {
    try {
      while (true) { cli_utils::print_notification(co_await notes->next()); }
    } catch (const boost::system::system_error &err) {
      if (not core::is_shutdown_error(err.code())) { spdlog::error("Notification stream failed: {}", err.what()); }
    }
  }

  auto run_stream(std::shared_ptr<pool_t> relay_pool, const cli_args &args) -> boost::asio::awaitable<int>
  {
    auto consumer = relay_pool->events();
    const auto subscription_id = relay_pool->subscribe({ cli_utils::build_filter(args) });
    spdlog::info("Streaming subscription {} (Ctrl-C to stop)", subscription_id);

    const auto executor = co_await boost::asio::this_coro::executor;
    boost::asio::signal_set signals(executor, SIGINT, SIGTERM);
    signals.async_wait([relay_pool, executor](const boost::system::error_code &error, int /*signal*/) {
      if (error) { return; }
      spdlog::info("Interrupted, shutting down");
      boost::asio::co_spawn(executor, relay_pool->shutdown(), boost::asio::detached);
    });

    try {
      while (true) { cli_utils::print_event(co_await consumer->next()); }
    } catch (const boost::system::system_error &err) {
      if (not core::is_shutdown_error(err.code())) { throw; }
    }
    signals.cancel();
    co_return 0;
  }

  auto run_fetch(std::shared_ptr<pool_t> relay_pool, const cli_args &args) -> boost::asio::awaitable<int>
  {
    co_await settle(relay_pool, timeout_of(args));
    const auto events = co_await relay_pool->fetch_events({ cli_utils::build_filter(args) }, pool::all_relays, timeout_of(args));
    for (const auto &event : events) { fmt::print("{}\n", event.serialize()); }
    spdlog::info("Fetched {} events", events.size());
    co_return 0;
  }

  auto run_publish(std::shared_ptr<pool_t> relay_pool, const cli_args &args) -> boost::asio::awaitable<int>
  {
    const auto loaded = cli_utils::load_events(args.event_path);
    if (not loaded or loaded->size() != 1) {
      spdlog::error("{} must hold exactly one event", args.event_path);
      co_return 1;
    }
    const auto &event = loaded->front();
    if (not nostr::id_verifier{}.verify(event)) {
      spdlog::error("Event id does not match its contents: {}", event.id);
      co_return 1;
    }

    co_await settle(relay_pool, timeout_of(args));
    const auto report = co_await relay_pool->publish(event);
    cli_utils::print_publish_report(report);
    co_return report.any_accepted() ? 0 : 1;
  }

  auto run_sync(std::shared_ptr<pool_t> relay_pool, const cli_args &args) -> boost::asio::awaitable<int>
  {
    const auto loaded = cli_utils::load_events(args.events_path);
    if (not loaded) { co_return 1; }
    std::size_t stored = 0;
    for (const auto &event : *loaded) {
      if (relay_pool->store()->store(event)) { ++stored; }
    }
    spdlog::info("Loaded {} local events", stored);

    pool::sync_options options;
    options.direction = args.direction == "up"     ? pool::sync_direction::up
                        : args.direction == "both" ? pool::sync_direction::both
                                                   : pool::sync_direction::down;
    options.reconciliation.initial_timeout = timeout_of(args);
    options.reconciliation.round_timeout = timeout_of(args);
    options.fetch_timeout = timeout_of(args);

    co_await settle(relay_pool, timeout_of(args));
    int exit_code = 0;
    for (const auto &url : relay_pool->relays()) {
      const auto report = co_await relay_pool->sync(url.str(), cli_utils::build_filter(args), options);
      cli_utils::print_sync_report(report);
      if (not report.reconciliation.complete or not report.failed.empty()) { exit_code = 1; }
    }
    co_return exit_code;
  }

  auto run_status(std::shared_ptr<pool_t> relay_pool, const cli_args &args) -> boost::asio::awaitable<int>
  {
    co_await settle(relay_pool, timeout_of(args));
    cli_utils::print_statuses(relay_pool->statuses());
    co_return 0;
  }

  auto run_command(std::shared_ptr<pool_t> relay_pool, cli_args args) -> boost::asio::awaitable<int>
  {
    int exit_code = 1;
    try {
      if (args.command == "stream") {
        exit_code = co_await run_stream(relay_pool, args);
      } else if (args.command == "fetch") {
        exit_code = co_await run_fetch(relay_pool, args);
      } else if (args.command == "publish") {
        exit_code = co_await run_publish(relay_pool, args);
      } else if (args.command == "sync") {
        exit_code = co_await run_sync(relay_pool, args);
      } else {
        exit_code = co_await run_status(relay_pool, args);
      }
    } catch (const std::exception &err) {
      spdlog::error("{} failed: {}", args.command, err.what());
      exit_code = 1;
    }
    co_await relay_pool->shutdown();
    co_return exit_code;
  }

}// namespace

// NOLINTNEXTLINE(bugprone-exception-escape)
auto main(int argc, char **argv) -> int
{
  auto args = parse_cli_args(argc, argv);

  if (args.show_version) {
    cli_utils::print_version();
    return 0;
  }

  cli_utils::configure_logging(args);
  if (not validate_cli_args(args)) { return 1; }

  auto io_context = std::make_shared<boost::asio::io_context>();

  auto relay_pool = std::make_shared<pool_t>(io_context,
    [io_context](const nostr::relay_url & /*url*/) { return std::make_shared<transport::websocket_stream>(io_context); });

  for (const auto &url : args.relays) {
    try {
      relay_pool->add_relay(url);
    } catch (const std::invalid_argument &err) {
      spdlog::error("Invalid relay {}: {}", url, err.what());
      return 1;
    }
  }

  auto notes_done = boost::asio::co_spawn(*io_context, drain_notifications(relay_pool->notifications()), boost::asio::use_future);
  relay_pool->connect();
  auto result = boost::asio::co_spawn(*io_context, run_command(relay_pool, args), boost::asio::use_future);

  auto work_guard = boost::asio::make_work_guard(*io_context);
  std::thread io_thread([&io_context]() {
    spdlog::debug("io_context thread started");
    io_context->run();
    spdlog::debug("io_context thread stopped");
  });

  int exit_code = 1;
  try {
    exit_code = result.get();
    notes_done.get();
  } catch (const std::exception &err) {
    spdlog::error("Unexpected error: {}", err.what());
  }

  spdlog::debug("Resetting work guard...");
  work_guard.reset();

  spdlog::debug("Stopping io_context...");
  io_context->stop();

  if (io_thread.joinable()) {
    io_thread.join();
    spdlog::debug("io_thread joined");
  }

  return exit_code;
}

}// namespace nostr_pool

// NOLINTNEXTLINE(bugprone-exception-escape)
auto main(int argc, char **argv) -> int { return nostr_pool::main(argc, argv); }
