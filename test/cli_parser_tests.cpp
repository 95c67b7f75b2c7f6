#include <catch2/catch_test_macros.hpp>
#include <cli_utils/app_init.hpp>
#include <cli_utils/cli_parser.hpp>

#include "test_doubles/test_events.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <set>
#include <string>
#include <vector>

namespace {

auto parse(std::vector<std::string> arguments) -> nostr_pool::cli_args
{
  nostr_pool::cli_args args;
  CLI::App app{ "test", "relay-pool" };
  nostr_pool::setup_cli_app(app, args);
  // CLI11 consumes the vector from the back.
  std::reverse(arguments.begin(), arguments.end());
  app.parse(arguments);
  return args;
}

/// Writes @p contents to a fresh file under the temp directory
auto write_temp_file(const std::string &name, const std::string &contents) -> std::string
{
  const auto path = std::filesystem::temp_directory_path() / name;
  std::ofstream file(path);
  file << contents;
  return path.string();
}

}// namespace

TEST_CASE("CLI parsing global options", "[cli_utils][cli_parser]")
{
  SECTION("version flag sets show_version")
  {
    const auto args = parse({ "--version" });
    REQUIRE(args.show_version);
    REQUIRE(args.command.empty());
  }

  SECTION("verbose flag counts repetitions")
  {
    REQUIRE(parse({ "-v", "status" }).verbosity == 1);
    REQUIRE(parse({ "-vv", "status" }).verbosity == 2);
  }

  SECTION("relays are repeatable")
  {
    const auto args = parse({ "-r", "wss://a.example.com", "--relay", "b.example.com", "status" });
    REQUIRE(args.relays == std::vector<std::string>{ "wss://a.example.com", "b.example.com" });
    REQUIRE(args.command == "status");
  }

  SECTION("only one command may be given")
  {
    REQUIRE_THROWS_AS(parse({ "status", "stream" }), CLI::ParseError);
  }
}

TEST_CASE("CLI parsing command options", "[cli_utils][cli_parser]")
{
  SECTION("stream takes filter options")
  {
    const auto args = parse({ "-r", "relay.example.com", "stream", "-k", "1", "-k", "7", "--since", "1700000000",
      "-l", "20" });
    REQUIRE(args.command == "stream");
    REQUIRE(args.kinds == std::vector<std::uint16_t>{ 1, 7 });
    REQUIRE(args.since == 1700000000);
    REQUIRE(args.limit == 20);
  }

  SECTION("fetch takes a timeout")
  {
    const auto args = parse({ "-r", "relay.example.com", "fetch", "-t", "2.5" });
    REQUIRE(args.command == "fetch");
    REQUIRE(nostr_pool::timeout_of(args) == std::chrono::milliseconds(2500));
  }

  SECTION("fetch rejects a non-positive timeout")
  {
    REQUIRE_THROWS_AS(parse({ "-r", "relay.example.com", "fetch", "-t", "0" }), CLI::ParseError);
  }

  SECTION("sync requires an events file and a known direction")
  {
    const auto path = write_temp_file("relay_pool_cli_sync.json", "[]");
    const auto args = parse({ "-r", "relay.example.com", "sync", "-e", path, "-d", "both" });
    REQUIRE(args.command == "sync");
    REQUIRE(args.events_path == path);
    REQUIRE(args.direction == "both");

    REQUIRE_THROWS_AS(parse({ "-r", "relay.example.com", "sync", "-e", path, "-d", "sideways" }), CLI::ParseError);
    REQUIRE_THROWS_AS(parse({ "-r", "relay.example.com", "sync" }), CLI::ParseError);
  }

  SECTION("publish requires an existing file")
  {
    REQUIRE_THROWS_AS(parse({ "-r", "relay.example.com", "publish", "/nonexistent/event.json" }), CLI::ParseError);
  }
}

TEST_CASE("CLI argument validation", "[cli_utils][cli_parser]")
{
  nostr_pool::cli_args args;
  args.command = "status";
  args.relays = { "relay.example.com" };

  SECTION("complete arguments are valid") { REQUIRE(nostr_pool::validate_cli_args(args)); }

  SECTION("a command is required")
  {
    args.command.clear();
    REQUIRE_FALSE(nostr_pool::validate_cli_args(args));
  }

  SECTION("a relay is required")
  {
    args.relays.clear();
    REQUIRE_FALSE(nostr_pool::validate_cli_args(args));
  }

  SECTION("authors must be full public keys")
  {
    args.authors = { "abc" };
    REQUIRE_FALSE(nostr_pool::validate_cli_args(args));
  }
}

TEST_CASE("build_filter maps options onto one filter", "[cli_utils][app_init]")
{
  nostr_pool::cli_args args;
  args.kinds = { 1, 1, 7 };
  args.authors = { nostr_pool::test::alice_pubkey };
  args.since = 100;
  args.limit = 5;

  const auto scope = nostr_pool::cli_utils::build_filter(args);

  REQUIRE(scope.kinds == std::set<std::uint16_t>{ 1, 7 });
  REQUIRE(scope.authors == std::set{ nostr_pool::test::alice_pubkey });
  REQUIRE(scope.since == 100);
  REQUIRE(scope.limit == 5);
  REQUIRE_FALSE(scope.until.has_value());
}

TEST_CASE("load_events accepts objects, arrays and JSON lines", "[cli_utils][app_init]")
{
  const auto first = nostr_pool::test::make_event("first");
  const auto second = nostr_pool::test::make_event("second");

  SECTION("a single object")
  {
    const auto path = write_temp_file("relay_pool_single.json", first.serialize());
    const auto loaded = nostr_pool::cli_utils::load_events(path);
    REQUIRE(loaded.has_value());
    REQUIRE(loaded->size() == 1);
    REQUIRE(loaded->front() == first);
  }

  SECTION("an array")
  {
    const auto path =
      write_temp_file("relay_pool_array.json", "[" + first.serialize() + "," + second.serialize() + "]");
    const auto loaded = nostr_pool::cli_utils::load_events(path);
    REQUIRE(loaded.has_value());
    REQUIRE(loaded->size() == 2);
  }

  SECTION("one event per line")
  {
    const auto path =
      write_temp_file("relay_pool_lines.jsonl", first.serialize() + "\n\n" + second.serialize() + "\n");
    const auto loaded = nostr_pool::cli_utils::load_events(path);
    REQUIRE(loaded.has_value());
    REQUIRE(loaded->size() == 2);
    REQUIRE(loaded->back() == second);
  }

  SECTION("something that is not an event")
  {
    const auto path = write_temp_file("relay_pool_bad.json", R"({"hello": "world"})");
    REQUIRE_FALSE(nostr_pool::cli_utils::load_events(path).has_value());
  }

  SECTION("a missing file")
  {
    REQUIRE_FALSE(nostr_pool::cli_utils::load_events("/nonexistent/events.json").has_value());
  }
}
