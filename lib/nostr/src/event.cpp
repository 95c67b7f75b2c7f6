#include <nostr/event.hpp>

#include <core/sha256.hpp>

#include <algorithm>
#include <cctype>
#include <iterator>

namespace nostr_pool::nostr::protocol {

namespace {
  auto tags_to_json(const std::vector<std::vector<std::string>> &tags) -> nlohmann::json
  {
    auto tags_json = nlohmann::json::array();
    for (const auto &tag : tags) {
      nlohmann::json tag_json = nlohmann::json::array();
      std::ranges::copy(tag, std::back_inserter(tag_json));
      tags_json.push_back(tag_json);
    }
    return tags_json;
  }

  auto compact_dump(const nlohmann::json &json_obj) -> std::string
  {
    return json_obj.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  }
}// namespace

auto event_data::from_json(const nlohmann::json &json_obj) -> std::optional<event_data>
{
  if (not json_obj.is_object()) { return std::nullopt; }

  event_data event;

  if (not json_obj.contains("id") or not json_obj["id"].is_string()) { return std::nullopt; }
  event.id = json_obj["id"].get<std::string>();

  if (not json_obj.contains("pubkey") or not json_obj["pubkey"].is_string()) { return std::nullopt; }
  event.pubkey = json_obj["pubkey"].get<std::string>();

  if (not json_obj.contains("created_at") or not json_obj["created_at"].is_number_unsigned()) { return std::nullopt; }
  event.created_at = json_obj["created_at"].get<std::uint64_t>();

  if (not json_obj.contains("kind") or not json_obj["kind"].is_number_unsigned()) { return std::nullopt; }
  const auto raw_kind = json_obj["kind"].get<std::uint64_t>();
  if (raw_kind > UINT16_MAX) { return std::nullopt; }
  event.kind = static_cast<enum kind>(raw_kind);

  if (not json_obj.contains("content") or not json_obj["content"].is_string()) { return std::nullopt; }
  event.content = json_obj["content"].get<std::string>();

  if (not json_obj.contains("sig") or not json_obj["sig"].is_string()) { return std::nullopt; }
  event.sig = json_obj["sig"].get<std::string>();

  if (json_obj.contains("tags")) {
    if (not json_obj["tags"].is_array()) { return std::nullopt; }
    for (const auto &tag_json : json_obj["tags"]) {
      if (not tag_json.is_array()) { return std::nullopt; }
      std::vector<std::string> tag;
      for (const auto &element : tag_json) {
        if (not element.is_string()) { return std::nullopt; }
        tag.push_back(element.get<std::string>());
      }
      event.tags.push_back(std::move(tag));
    }
  }

  return event;
}

auto event_data::deserialize(const std::string &json) -> std::optional<event_data>
{
  try {
    return from_json(nlohmann::json::parse(json));
  } catch (const nlohmann::json::exception &) {
    return std::nullopt;
  }
}

auto event_data::to_json() const -> nlohmann::json
{
  nlohmann::json json_obj;
  json_obj["id"] = id;
  json_obj["pubkey"] = pubkey;
  json_obj["created_at"] = created_at;
  json_obj["kind"] = static_cast<std::uint16_t>(kind);
  json_obj["tags"] = tags_to_json(tags);
  json_obj["content"] = content;
  json_obj["sig"] = sig;
  return json_obj;
}

auto event_data::serialize() const -> std::string { return compact_dump(to_json()); }

auto event_data::commitment() const -> std::string
{
  nlohmann::json commitment = nlohmann::json::array();
  commitment.push_back(0);
  commitment.push_back(pubkey);
  commitment.push_back(created_at);
  commitment.push_back(static_cast<std::uint16_t>(kind));
  commitment.push_back(tags_to_json(tags));
  commitment.push_back(content);
  return compact_dump(commitment);
}

auto event_data::compute_id() const -> std::string { return core::to_hex(core::sha256(commitment())); }

auto event_data::first_tag_value(const std::string &name) const -> std::optional<std::string>
{
  const auto iter =
    std::ranges::find_if(tags, [&name](const auto &tag) { return tag.size() >= 2 and tag.front() == name; });
  if (iter == tags.end()) { return std::nullopt; }
  return (*iter)[1];
}

auto is_hex32(const std::string &value) -> bool
{
  static constexpr std::size_t hex32_length = 64;
  return value.size() == hex32_length
         and std::ranges::all_of(value, [](unsigned char character) { return std::isxdigit(character) != 0; });
}

}// namespace nostr_pool::nostr::protocol
