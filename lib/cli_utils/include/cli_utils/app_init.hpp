#pragma once

#include <cli_utils/cli_parser.hpp>
#include <nostr/event.hpp>
#include <nostr/filter.hpp>
#include <platform/time_utils.hpp>
#include <pool/connection_status.hpp>
#include <pool/notifications.hpp>
#include <pool/results.hpp>

#include "internal_use_only/config.hpp"

#include <fmt/core.h>
#include <fstream>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <spdlog/spdlog.h>
#include <sstream>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace nostr_pool::cli_utils {

inline auto configure_logging(const cli_args &args) -> void
{
  if (args.verbosity >= 2) {
    spdlog::set_level(spdlog::level::trace);
  } else if (args.verbosity == 1) {
    spdlog::set_level(spdlog::level::debug);
  } else {
    spdlog::set_level(spdlog::level::info);
  }
}

inline auto print_version() -> void
{
  fmt::print("{} v{}\n", nostr_pool::cmake::project_name, nostr_pool::cmake::project_version);
}

/**
 * @brief Builds the single filter described by the command-line options.
 */
[[nodiscard]] inline auto build_filter(const cli_args &args) -> nostr::filter
{
  nostr::filter scope;
  scope.kinds.insert(args.kinds.begin(), args.kinds.end());
  scope.authors.insert(args.authors.begin(), args.authors.end());
  scope.since = args.since;
  scope.limit = args.limit;
  return scope;
}

/**
 * @brief Reads events from a file holding one JSON event, a JSON array of
 * events, or one event per line.
 *
 * @return std::nullopt when the file cannot be read or an entry is not an event
 */
[[nodiscard]] inline auto load_events(const std::string &path)
  -> std::optional<std::vector<nostr::protocol::event_data>>
{
  std::ifstream file(path);
  if (not file) {
    spdlog::error("Cannot open {}", path);
    return std::nullopt;
  }
  std::stringstream contents;
  contents << file.rdbuf();
  const auto text = contents.str();

  std::vector<nostr::protocol::event_data> loaded;
  auto append = [&loaded, &path](const nlohmann::json &entry) -> bool {
    auto event = nostr::protocol::event_data::from_json(entry);
    if (not event) {
      spdlog::error("{}: not an event: {}", path, entry.dump());
      return false;
    }
    loaded.push_back(std::move(*event));
    return true;
  };

  auto document = nlohmann::json::parse(text, nullptr, false);
  if (not document.is_discarded()) {
    if (document.is_array()) {
      for (const auto &entry : document) {
        if (not append(entry)) { return std::nullopt; }
      }
    } else if (not append(document)) {
      return std::nullopt;
    }
    return loaded;
  }

  std::istringstream lines(text);
  std::string line;
  while (std::getline(lines, line)) {
    if (line.find_first_not_of(" \t\r") == std::string::npos) { continue; }
    auto entry = nlohmann::json::parse(line, nullptr, false);
    if (entry.is_discarded() or not append(entry)) {
      spdlog::error("{}: malformed line", path);
      return std::nullopt;
    }
  }
  return loaded;
}

inline auto print_event(const pool::stream_item &item) -> void
{
  fmt::print("{} {} kind={} via {}\n{}\n",
    platform::format_utc(item.event.created_at),
    item.event.id,
    static_cast<unsigned>(item.event.kind),
    item.relay.str(),
    item.event.content);
}

inline auto print_notification(const pool::notification &note) -> void
{
  std::visit(
    [](const auto &evt) {
      using note_t = std::decay_t<decltype(evt)>;
      if constexpr (std::is_same_v<note_t, pool::notifications::status_changed>) {
        spdlog::info("{}: {} -> {}", evt.relay.str(), pool::to_string(evt.from), pool::to_string(evt.to));
      } else if constexpr (std::is_same_v<note_t, pool::notifications::notice>) {
        spdlog::info("{} NOTICE: {}", evt.relay.str(), evt.message);
      } else if constexpr (std::is_same_v<note_t, pool::notifications::subscription_closed>) {
        spdlog::warn("{} closed {}: {}", evt.relay.str(), evt.subscription_id, evt.message);
      } else if constexpr (std::is_same_v<note_t, pool::notifications::protocol_error>) {
        spdlog::warn("{} protocol error: {}", evt.relay.str(), evt.reason);
      } else if constexpr (std::is_same_v<note_t, pool::notifications::transport_error>) {
        spdlog::warn("{} transport error: {}", evt.relay.str(), evt.reason);
      } else if constexpr (std::is_same_v<note_t, pool::notifications::eose>) {
        spdlog::debug("{} end of stored events for {}", evt.relay.str(), evt.subscription_id);
      } else if constexpr (std::is_same_v<note_t, pool::notifications::fetch_overflow>) {
        spdlog::warn("{} fetch {} buffer full, {} events left out", evt.relay.str(), evt.subscription_id, evt.dropped);
      } else {
        spdlog::warn("Consumer {} fell behind, {} events dropped", evt.consumer_id, evt.dropped);
      }
    },
    note);
}

inline auto print_statuses(const std::map<nostr::relay_url, pool::connection_status> &statuses) -> void
{
  for (const auto &[url, status] : statuses) { fmt::print("{:<48} {}\n", url.str(), pool::to_string(status)); }
}

inline auto print_publish_report(const pool::publish_report &report) -> void
{
  fmt::print("event {}: accepted by {}/{}\n", report.event_id, report.accepted_count(), report.outcomes.size());
  for (const auto &[url, outcome] : report.outcomes) {
    fmt::print("  {:<46} {} {}\n", url.str(), pool::to_string(outcome.result), outcome.message);
  }
}

inline auto print_sync_report(const pool::sync_report &report) -> void
{
  const auto &difference = report.reconciliation;
  fmt::print("{}: {} after {} rounds, need {}, have {}, received {}, sent {}, failed {}\n",
    difference.relay.str(),
    difference.complete ? "complete" : "incomplete (" + difference.error + ")",
    difference.rounds,
    difference.need.size(),
    difference.have.size(),
    report.received,
    report.sent,
    report.failed.size());
}

}// namespace nostr_pool::cli_utils
