#pragma once

#include <CLI/CLI.hpp>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <platform/env_utils.hpp>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace nostr_pool {

struct cli_args
{
  std::vector<std::string> relays;
  int verbosity = 0;
  bool show_version = false;

  std::string command;

  std::vector<std::uint16_t> kinds;
  std::vector<std::string> authors;
  std::optional<std::uint64_t> since;
  std::optional<std::size_t> limit;
  double timeout_seconds = 10.0;

  std::string event_path;
  std::string events_path;
  std::string direction = "down";
};

inline auto setup_cli_app(CLI::App &app, cli_args &args) -> void;

inline auto parse_cli_args(int argc, char **argv) -> cli_args
{
  cli_args args;
  CLI::App app{ "Relay Pool - multi-relay Nostr client", "relay-pool" };

  setup_cli_app(app, args);

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError &e) {
    app.exit(e);
    std::exit(e.get_exit_code());// NOLINT(concurrency-mt-unsafe)
  }

  args.event_path = platform::expand_tilde_path(args.event_path);
  args.events_path = platform::expand_tilde_path(args.events_path);

  return args;
}

namespace detail {

  inline auto add_filter_options(CLI::App &command, cli_args &args) -> void
  {
    command.add_option("-k,--kind", args.kinds, "Event kind to match (repeatable)");
    command.add_option("-a,--author", args.authors, "Author public key, 64 hex characters (repeatable)");
    command.add_option("--since", args.since, "Only events created at or after this unix timestamp");
  }

}// namespace detail

inline auto setup_cli_app(CLI::App &app, cli_args &args) -> void
{
  app.add_option("-r,--relay", args.relays, "Relay url, wss:// or bare host (repeatable)");
  app.add_flag("-v,--verbose", args.verbosity, "Verbose logging; repeat for trace output");
  app.add_flag("--version", args.show_version, "Show version information");
  app.require_subcommand(0, 1);

  auto *stream_cmd = app.add_subcommand("stream", "Print the deduplicated event stream until interrupted");
  detail::add_filter_options(*stream_cmd, args);
  stream_cmd->add_option("-l,--limit", args.limit, "Maximum stored events each relay sends first");
  stream_cmd->callback([&args]() { args.command = "stream"; });

  auto *fetch_cmd = app.add_subcommand("fetch", "Collect stored events from every relay and exit");
  detail::add_filter_options(*fetch_cmd, args);
  fetch_cmd->add_option("-l,--limit", args.limit, "Maximum events per relay");
  fetch_cmd->add_option("-t,--timeout", args.timeout_seconds, "Seconds to wait for all relays")
    ->check(CLI::PositiveNumber);
  fetch_cmd->callback([&args]() { args.command = "fetch"; });

  auto *publish_cmd = app.add_subcommand("publish", "Publish a signed event read from a JSON file");
  publish_cmd->add_option("event", args.event_path, "Path to the event JSON")->required()->check(CLI::ExistingFile);
  publish_cmd->callback([&args]() { args.command = "publish"; });

  auto *sync_cmd = app.add_subcommand("sync", "Reconcile a local event file with every relay");
  sync_cmd->add_option("-e,--events", args.events_path, "JSON array or JSON-lines file of local events")
    ->required()
    ->check(CLI::ExistingFile);
  sync_cmd->add_option("-d,--direction", args.direction, "Transfer direction: down, up, both")
    ->check(CLI::IsMember({ "down", "up", "both" }));
  detail::add_filter_options(*sync_cmd, args);
  sync_cmd->add_option("-t,--timeout", args.timeout_seconds, "Seconds to wait per reconciliation round")
    ->check(CLI::PositiveNumber);
  sync_cmd->callback([&args]() { args.command = "sync"; });

  auto *status_cmd = app.add_subcommand("status", "Connect to every relay and report its state");
  status_cmd->add_option("-t,--timeout", args.timeout_seconds, "Seconds to wait for connections")
    ->check(CLI::PositiveNumber);
  status_cmd->callback([&args]() { args.command = "status"; });
}

inline auto validate_cli_args(const cli_args &args) -> bool
{
  if (args.command.empty()) {
    spdlog::error("A command is required: stream, fetch, publish, sync or status");
    return false;
  }

  if (args.relays.empty()) {
    spdlog::error("At least one relay is required (-r URL)");
    return false;
  }

  if (args.direction != "down" and args.direction != "up" and args.direction != "both") {
    spdlog::error("Invalid direction: {}", args.direction);
    return false;
  }

  for (const auto &author : args.authors) {
    if (author.size() != 64) {
      spdlog::error("Author must be 64 hex characters: {}", author);
      return false;
    }
  }

  return true;
}

[[nodiscard]] inline auto timeout_of(const cli_args &args) -> std::chrono::milliseconds
{
  constexpr double millis_per_second = 1000.0;
  return std::chrono::milliseconds(static_cast<std::int64_t>(args.timeout_seconds * millis_per_second));
}

}// namespace nostr_pool
