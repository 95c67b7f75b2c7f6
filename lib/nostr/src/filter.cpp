#include <nostr/filter.hpp>

#include <algorithm>
#include <cctype>
#include <type_traits>

namespace nostr_pool::nostr {

namespace {
  auto lowercase(std::string text) -> std::string
  {
    std::ranges::transform(
      text, text.begin(), [](unsigned char character) { return static_cast<char>(std::tolower(character)); });
    return text;
  }

  auto has_tag_value(const protocol::event_data &event, char name, const std::set<std::string> &values) -> bool
  {
    return std::ranges::any_of(event.tags, [name, &values](const std::vector<std::string> &tag) {
      return tag.size() >= 2 and tag[0].size() == 1 and tag[0][0] == name and values.contains(tag[1]);
    });
  }

  template<typename T> auto read_string_set(const nlohmann::json &value, std::set<T> &out) -> bool
  {
    if (not value.is_array()) { return false; }
    for (const auto &element : value) {
      if constexpr (std::is_same_v<T, std::string>) {
        if (not element.is_string()) { return false; }
        out.insert(element.get<std::string>());
      } else {
        if (not element.is_number_unsigned() or element.get<std::uint64_t>() > UINT16_MAX) { return false; }
        out.insert(static_cast<T>(element.get<std::uint64_t>()));
      }
    }
    return true;
  }
}// namespace

auto filter::admits(const protocol::event_data &event) const -> bool
{
  if (not ids.empty() and not ids.contains(event.id)) { return false; }
  if (not authors.empty() and not authors.contains(event.pubkey)) { return false; }
  if (not kinds.empty() and not kinds.contains(static_cast<std::uint16_t>(event.kind))) { return false; }
  if (since and event.created_at < *since) { return false; }
  if (until and event.created_at > *until) { return false; }

  for (const auto &[name, values] : tags) {
    if (not values.empty() and not has_tag_value(event, name, values)) { return false; }
  }
  return true;
}

auto filter::matches(const protocol::event_data &event) const -> bool
{
  if (not admits(event)) { return false; }
  if (search and not search->empty()) {
    if (lowercase(event.content).find(lowercase(*search)) == std::string::npos) { return false; }
  }
  return true;
}

auto filter::empty() const -> bool
{
  return ids.empty() and authors.empty() and kinds.empty() and tags.empty() and not since and not until and not limit
         and not search;
}

auto filter::to_json() const -> nlohmann::json
{
  auto json_obj = nlohmann::json::object();
  if (not ids.empty()) { json_obj["ids"] = ids; }
  if (not authors.empty()) { json_obj["authors"] = authors; }
  if (not kinds.empty()) { json_obj["kinds"] = kinds; }
  for (const auto &[name, values] : tags) { json_obj[std::string{ '#', name }] = values; }
  if (since) { json_obj["since"] = *since; }
  if (until) { json_obj["until"] = *until; }
  if (limit) { json_obj["limit"] = *limit; }
  if (search) { json_obj["search"] = *search; }
  return json_obj;
}

auto filter::from_json(const nlohmann::json &json_obj) -> std::optional<filter>
{
  if (not json_obj.is_object()) { return std::nullopt; }

  filter result;
  for (const auto &[key, value] : json_obj.items()) {
    if (key == "ids") {
      if (not read_string_set(value, result.ids)) { return std::nullopt; }
    } else if (key == "authors") {
      if (not read_string_set(value, result.authors)) { return std::nullopt; }
    } else if (key == "kinds") {
      if (not read_string_set(value, result.kinds)) { return std::nullopt; }
    } else if (key == "since" or key == "until" or key == "limit") {
      if (not value.is_number_unsigned()) { return std::nullopt; }
      const auto number = value.get<std::uint64_t>();
      if (key == "since") {
        result.since = number;
      } else if (key == "until") {
        result.until = number;
      } else {
        result.limit = static_cast<std::size_t>(number);
      }
    } else if (key == "search") {
      if (not value.is_string()) { return std::nullopt; }
      result.search = value.get<std::string>();
    } else if (key.size() == 2 and key[0] == '#' and std::isalpha(static_cast<unsigned char>(key[1])) != 0) {
      if (not read_string_set(value, result.tags[key[1]])) { return std::nullopt; }
    } else if (key.starts_with('#')) {
      return std::nullopt;
    }
  }
  return result;
}

auto matches_any(const filters &group, const protocol::event_data &event) -> bool
{
  return std::ranges::any_of(group, [&event](const filter &candidate) { return candidate.matches(event); });
}

auto admits_any(const filters &group, const protocol::event_data &event) -> bool
{
  return std::ranges::any_of(group, [&event](const filter &candidate) { return candidate.admits(event); });
}

}// namespace nostr_pool::nostr
