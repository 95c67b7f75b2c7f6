#pragma once

#include <atomic>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/experimental/channel_error.hpp>
#include <concepts>
#include <memory>
#include <spdlog/spdlog.h>
#include <string>

namespace nostr_pool::core {

/**
 * @brief Concept for long-lived actors driven by a run() coroutine.
 */
template<typename T>
concept Processor = requires(T proc) {
  { proc.run() } -> std::same_as<boost::asio::awaitable<void>>;
};

/**
 * @brief True for the error codes an actor's mailbox raises on orderly shutdown.
 */
inline auto is_shutdown_error(const boost::system::error_code &code) -> bool
{
  return code == boost::asio::error::operation_aborted or code == boost::asio::experimental::error::channel_cancelled
         or code == boost::asio::experimental::error::channel_closed;
}

/**
 * @brief Runs a processor coroutine with error handling.
 *
 * @tparam P Processor type
 * @param proc The processor to run
 * @param processor_name Name for logging
 * @return Awaitable that completes when the processor exits
 */
template<Processor P>
auto run_processor(std::shared_ptr<P> proc, std::string processor_name) -> boost::asio::awaitable<void>
{
  spdlog::trace("[{}] Coroutine started", processor_name);
  try {
    co_await proc->run();
  } catch (const boost::system::system_error &err) {
    if (is_shutdown_error(err.code())) {
      spdlog::debug("[{}] Cancelled, exiting run loop", processor_name);
      co_return;
    }
    spdlog::error("[{}] Unexpected error in run loop: {}", processor_name, err.what());
  } catch (const std::exception &err) {
    spdlog::error("[{}] Unknown exception in run loop: {}", processor_name, err.what());
  }
  spdlog::trace("[{}] Coroutine exiting", processor_name);
}

/**
 * @brief Tracks the lifecycle state of a spawned coroutine.
 */
struct coroutine_state
{
  std::atomic<bool> started{ false };///< True when coroutine has started execution
  std::atomic<bool> done{ false };///< True when coroutine has completed
};

/**
 * @brief Spawns a processor as a detached coroutine on the given executor.
 *
 * Spawning on a strand gives the processor exclusive, serialized access to
 * its own state.
 *
 * @param executor Executor (io_context executor or strand) to run on
 * @param proc The processor to spawn
 * @param processor_name Name for logging
 * @return Shared pointer to coroutine state for tracking lifecycle
 */
template<typename Executor, Processor P>
auto spawn_processor(const Executor &executor, std::shared_ptr<P> proc, std::string processor_name)
  -> std::shared_ptr<coroutine_state>
{
  auto state = std::make_shared<coroutine_state>();
  boost::asio::co_spawn(
    executor,
    [](std::shared_ptr<P> processor,
      std::string name,
      std::shared_ptr<coroutine_state> coro_state) -> boost::asio::awaitable<void> {
      coro_state->started = true;
      co_await run_processor(processor, std::move(name));
      coro_state->done = true;
    }(std::move(proc), std::move(processor_name), state),
    boost::asio::detached);
  return state;
}

}// namespace nostr_pool::core
