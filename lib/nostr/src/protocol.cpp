#include <nostr/protocol.hpp>

namespace nostr_pool::nostr::protocol {

namespace {
  auto is_frame(const nlohmann::json &frame, std::string_view label, std::size_t min_size) -> bool
  {
    return frame.is_array() and frame.size() >= min_size and frame[0].is_string()
           and frame[0].get_ref<const std::string &>() == label;
  }

  auto dump(const nlohmann::json &frame) -> std::string
  {
    return frame.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  }

  auto parse(std::string_view text) -> std::optional<nlohmann::json>
  {
    auto json_obj = nlohmann::json::parse(text, nullptr, false);
    if (json_obj.is_discarded()) { return std::nullopt; }
    return json_obj;
  }

  auto optional_string(const nlohmann::json &frame, std::size_t index) -> std::string
  {
    return (frame.size() > index and frame[index].is_string()) ? frame[index].get<std::string>() : "";
  }

  template<typename Message> auto deserialize_with(const std::string &json) -> std::optional<Message>
  {
    auto frame = parse(json);
    if (not frame) { return std::nullopt; }
    return Message::from_json(*frame);
  }

  template<typename Variant, typename Message> auto lift(std::optional<Message> message) -> std::optional<Variant>
  {
    if (not message) { return std::nullopt; }
    return Variant{ std::move(*message) };
  }
}// namespace

auto event::from_event_data(const event_data &evt) -> event { return event{ .subscription_id = "", .data = evt }; }

auto event::serialize() const -> std::string
{
  nlohmann::json message = nlohmann::json::array();
  message.push_back("EVENT");
  if (not subscription_id.empty()) { message.push_back(subscription_id); }
  message.push_back(data.to_json());
  return dump(message);
}

auto event::from_json(const nlohmann::json &frame) -> std::optional<event>
{
  if (not is_frame(frame, "EVENT", 2)) { return std::nullopt; }

  event result;
  if (frame.size() == 2) {
    auto event_opt = event_data::from_json(frame[1]);
    if (not event_opt) { return std::nullopt; }
    result.data = std::move(*event_opt);
    return result;
  }

  if (not frame[1].is_string()) { return std::nullopt; }
  auto event_opt = event_data::from_json(frame[2]);
  if (not event_opt) { return std::nullopt; }
  result.subscription_id = frame[1].get<std::string>();
  result.data = std::move(*event_opt);
  return result;
}

auto event::deserialize(const std::string &json) -> std::optional<event> { return deserialize_with<event>(json); }

auto ok::serialize() const -> std::string { return dump(nlohmann::json::array({ "OK", event_id, accepted, message })); }

auto ok::from_json(const nlohmann::json &frame) -> std::optional<ok>
{
  if (not is_frame(frame, "OK", 3)) { return std::nullopt; }
  if (not frame[1].is_string() or not frame[2].is_boolean()) { return std::nullopt; }

  return ok{ .event_id = frame[1].get<std::string>(),
    .accepted = frame[2].get<bool>(),
    .message = optional_string(frame, 3) };
}

auto ok::deserialize(const std::string &json) -> std::optional<ok> { return deserialize_with<ok>(json); }

auto eose::serialize() const -> std::string { return dump(nlohmann::json::array({ "EOSE", subscription_id })); }

auto eose::from_json(const nlohmann::json &frame) -> std::optional<eose>
{
  if (not is_frame(frame, "EOSE", 2) or not frame[1].is_string()) { return std::nullopt; }
  return eose{ .subscription_id = frame[1].get<std::string>() };
}

auto eose::deserialize(const std::string &json) -> std::optional<eose> { return deserialize_with<eose>(json); }

auto closed::serialize() const -> std::string
{
  return dump(nlohmann::json::array({ "CLOSED", subscription_id, message }));
}

auto closed::from_json(const nlohmann::json &frame) -> std::optional<closed>
{
  if (not is_frame(frame, "CLOSED", 2) or not frame[1].is_string()) { return std::nullopt; }
  return closed{ .subscription_id = frame[1].get<std::string>(), .message = optional_string(frame, 2) };
}

auto notice::serialize() const -> std::string { return dump(nlohmann::json::array({ "NOTICE", message })); }

auto notice::from_json(const nlohmann::json &frame) -> std::optional<notice>
{
  if (not is_frame(frame, "NOTICE", 2) or not frame[1].is_string()) { return std::nullopt; }
  return notice{ .message = frame[1].get<std::string>() };
}

auto auth::from_json(const nlohmann::json &frame) -> std::optional<auth>
{
  if (not is_frame(frame, "AUTH", 2) or not frame[1].is_string()) { return std::nullopt; }
  return auth{ .challenge = frame[1].get<std::string>() };
}

auto req::serialize() const -> std::string
{
  nlohmann::json json_array = nlohmann::json::array();
  json_array.push_back("REQ");
  json_array.push_back(subscription_id);
  for (const auto &item : filter_list) { json_array.push_back(item.to_json()); }
  return dump(json_array);
}

auto req::from_json(const nlohmann::json &frame) -> std::optional<req>
{
  if (not is_frame(frame, "REQ", 3) or not frame[1].is_string()) { return std::nullopt; }

  req result;
  result.subscription_id = frame[1].get<std::string>();
  for (std::size_t index = 2; index < frame.size(); ++index) {
    auto parsed = filter::from_json(frame[index]);
    if (not parsed) { return std::nullopt; }
    result.filter_list.push_back(std::move(*parsed));
  }
  return result;
}

auto req::deserialize(const std::string &json) -> std::optional<req> { return deserialize_with<req>(json); }

auto close::serialize() const -> std::string { return dump(nlohmann::json::array({ "CLOSE", subscription_id })); }

auto close::from_json(const nlohmann::json &frame) -> std::optional<close>
{
  if (not is_frame(frame, "CLOSE", 2) or not frame[1].is_string()) { return std::nullopt; }
  return close{ .subscription_id = frame[1].get<std::string>() };
}

auto neg_open::serialize() const -> std::string
{
  return dump(nlohmann::json::array({ "NEG-OPEN", subscription_id, scope.to_json(), message }));
}

auto neg_open::from_json(const nlohmann::json &frame) -> std::optional<neg_open>
{
  if (not is_frame(frame, "NEG-OPEN", 4) or not frame[1].is_string() or not frame[3].is_string()) {
    return std::nullopt;
  }
  auto parsed = filter::from_json(frame[2]);
  if (not parsed) { return std::nullopt; }
  return neg_open{ .subscription_id = frame[1].get<std::string>(),
    .scope = std::move(*parsed),
    .message = frame[3].get<std::string>() };
}

auto neg_msg::serialize() const -> std::string
{
  return dump(nlohmann::json::array({ "NEG-MSG", subscription_id, message }));
}

auto neg_msg::from_json(const nlohmann::json &frame) -> std::optional<neg_msg>
{
  if (not is_frame(frame, "NEG-MSG", 3) or not frame[1].is_string() or not frame[2].is_string()) {
    return std::nullopt;
  }
  return neg_msg{ .subscription_id = frame[1].get<std::string>(), .message = frame[2].get<std::string>() };
}

auto neg_err::serialize() const -> std::string
{
  return dump(nlohmann::json::array({ "NEG-ERR", subscription_id, reason }));
}

auto neg_err::from_json(const nlohmann::json &frame) -> std::optional<neg_err>
{
  if (not is_frame(frame, "NEG-ERR", 2) or not frame[1].is_string()) { return std::nullopt; }
  return neg_err{ .subscription_id = frame[1].get<std::string>(), .reason = optional_string(frame, 2) };
}

auto neg_close::serialize() const -> std::string { return dump(nlohmann::json::array({ "NEG-CLOSE", subscription_id })); }

auto neg_close::from_json(const nlohmann::json &frame) -> std::optional<neg_close>
{
  if (not is_frame(frame, "NEG-CLOSE", 2) or not frame[1].is_string()) { return std::nullopt; }
  return neg_close{ .subscription_id = frame[1].get<std::string>() };
}

auto decode_relay_message(std::string_view frame_text) -> std::optional<relay_message>
{
  auto frame = parse(frame_text);
  if (not frame or not frame->is_array() or frame->empty() or not (*frame)[0].is_string()) { return std::nullopt; }

  const auto &label = (*frame)[0].get_ref<const std::string &>();
  if (label == "EVENT") {
    auto message = event::from_json(*frame);
    // A relay must always name the subscription the event belongs to.
    if (message and message->subscription_id.empty()) { return std::nullopt; }
    return lift<relay_message>(std::move(message));
  }
  if (label == "OK") { return lift<relay_message>(ok::from_json(*frame)); }
  if (label == "EOSE") { return lift<relay_message>(eose::from_json(*frame)); }
  if (label == "CLOSED") { return lift<relay_message>(closed::from_json(*frame)); }
  if (label == "NOTICE") { return lift<relay_message>(notice::from_json(*frame)); }
  if (label == "AUTH") { return lift<relay_message>(auth::from_json(*frame)); }
  if (label == "NEG-MSG") { return lift<relay_message>(neg_msg::from_json(*frame)); }
  if (label == "NEG-ERR") { return lift<relay_message>(neg_err::from_json(*frame)); }
  return std::nullopt;
}

auto decode_client_message(std::string_view frame_text) -> std::optional<client_message>
{
  auto frame = parse(frame_text);
  if (not frame or not frame->is_array() or frame->empty() or not (*frame)[0].is_string()) { return std::nullopt; }

  const auto &label = (*frame)[0].get_ref<const std::string &>();
  if (label == "EVENT") {
    auto message = event::from_json(*frame);
    if (message and not message->subscription_id.empty()) { return std::nullopt; }
    return lift<client_message>(std::move(message));
  }
  if (label == "REQ") { return lift<client_message>(req::from_json(*frame)); }
  if (label == "CLOSE") { return lift<client_message>(close::from_json(*frame)); }
  if (label == "NEG-OPEN") { return lift<client_message>(neg_open::from_json(*frame)); }
  if (label == "NEG-MSG") { return lift<client_message>(neg_msg::from_json(*frame)); }
  if (label == "NEG-CLOSE") { return lift<client_message>(neg_close::from_json(*frame)); }
  return std::nullopt;
}

}// namespace nostr_pool::nostr::protocol
