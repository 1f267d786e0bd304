#include <nostr/protocol.hpp>

#include <algorithm>
#include <iterator>

namespace status_feed::nostr::protocol {

namespace {

  auto parse_message_array(const std::string &json, const std::string &type, std::size_t min_size)
    -> std::optional<nlohmann::json>
  {
    auto json_obj = nlohmann::json::parse(json);

    if (!json_obj.is_array() || json_obj.size() < min_size) { return std::nullopt; }
    if (!json_obj[0].is_string() || json_obj[0].get<std::string>() != type) { return std::nullopt; }

    return json_obj;
  }

}// namespace

auto event_data::from_json(const nlohmann::json &json_obj) -> std::optional<event_data>
{
  try {
    if (!json_obj.is_object()) { return std::nullopt; }

    event_data event;

    if (!json_obj.contains("id") || !json_obj["id"].is_string()) { return std::nullopt; }
    event.id = json_obj["id"].get<std::string>();

    if (!json_obj.contains("pubkey") || !json_obj["pubkey"].is_string()) { return std::nullopt; }
    event.pubkey = json_obj["pubkey"].get<std::string>();

    if (!json_obj.contains("created_at") || !json_obj["created_at"].is_number_unsigned()) { return std::nullopt; }
    event.created_at = json_obj["created_at"].get<std::uint64_t>();

    if (!json_obj.contains("kind") || !json_obj["kind"].is_number_unsigned()) { return std::nullopt; }
    event.kind = json_obj["kind"].get<enum kind>();

    if (!json_obj.contains("content") || !json_obj["content"].is_string()) { return std::nullopt; }
    event.content = json_obj["content"].get<std::string>();

    if (!json_obj.contains("sig") || !json_obj["sig"].is_string()) { return std::nullopt; }
    event.sig = json_obj["sig"].get<std::string>();

    if (json_obj.contains("tags")) {
      if (!json_obj["tags"].is_array()) { return std::nullopt; }
      for (const auto &tag_json : json_obj["tags"]) {
        if (!tag_json.is_array()) { return std::nullopt; }
        std::vector<std::string> tag;
        for (const auto &element : tag_json) {
          if (!element.is_string()) { return std::nullopt; }
          tag.push_back(element.get<std::string>());
        }
        event.tags.push_back(std::move(tag));
      }
    }

    return event;
  } catch (const std::exception &) {
    return std::nullopt;
  }
}

auto event_data::to_json() const -> nlohmann::json
{
  nlohmann::json json_obj;

  json_obj["id"] = id;
  json_obj["pubkey"] = pubkey;
  json_obj["created_at"] = created_at;
  json_obj["kind"] = kind;
  json_obj["content"] = content;
  json_obj["sig"] = sig;

  json_obj["tags"] = nlohmann::json::array();
  for (const auto &tag : tags) {
    nlohmann::json tag_json = nlohmann::json::array();
    std::ranges::copy(tag, std::back_inserter(tag_json));
    json_obj["tags"].push_back(tag_json);
  }

  return json_obj;
}

auto event_data::create_user_status(const std::string &sender_pubkey,
  std::uint64_t timestamp,
  const std::string &category,
  const std::string &content,
  const std::string &link_url,
  std::optional<std::uint64_t> expiration) -> event_data
{
  event_data event{ .id = "",
    .pubkey = sender_pubkey,
    .created_at = timestamp,
    .kind = kind::user_status,
    .tags = { { "d", category } },
    .content = content,
    .sig = "" };

  if (not link_url.empty()) { event.tags.push_back({ "r", link_url }); }
  if (expiration.has_value()) { event.tags.push_back({ "expiration", std::to_string(*expiration) }); }

  return event;
}

auto event_data::get_kind() const -> std::optional<enum kind>
{
  switch (kind) {
  case kind::profile_metadata:
  case kind::contact_list:
  case kind::relay_list:
  case kind::user_status:
    return kind;
  }
  return std::nullopt;
}

auto filter::to_json() const -> nlohmann::json
{
  nlohmann::json json_obj = nlohmann::json::object();

  if (not ids.empty()) { json_obj["ids"] = ids; }
  if (not authors.empty()) { json_obj["authors"] = authors; }
  if (not kinds.empty()) {
    json_obj["kinds"] = nlohmann::json::array();
    for (const auto event_kind : kinds) { json_obj["kinds"].push_back(static_cast<std::uint16_t>(event_kind)); }
  }
  for (const auto &[tag_name, values] : tags) { json_obj["#" + tag_name] = values; }
  if (since.has_value()) { json_obj["since"] = *since; }
  if (until.has_value()) { json_obj["until"] = *until; }
  if (limit.has_value()) { json_obj["limit"] = *limit; }

  return json_obj;
}

auto ok::deserialize(const std::string &json) -> std::optional<ok>
{
  try {
    auto json_obj = parse_message_array(json, "OK", 3);
    if (!json_obj) { return std::nullopt; }
    if (!(*json_obj)[1].is_string()) { return std::nullopt; }
    if (!(*json_obj)[2].is_boolean()) { return std::nullopt; }

    ok result;
    result.event_id = (*json_obj)[1].get<std::string>();
    result.accepted = (*json_obj)[2].get<bool>();
    result.message = (json_obj->size() > 3 && (*json_obj)[3].is_string()) ? (*json_obj)[3].get<std::string>() : "";

    return result;
  } catch (const std::exception &) {
    return std::nullopt;
  }
}

auto eose::deserialize(const std::string &json) -> std::optional<eose>
{
  try {
    auto json_obj = parse_message_array(json, "EOSE", 2);
    if (!json_obj) { return std::nullopt; }
    if (!(*json_obj)[1].is_string()) { return std::nullopt; }

    eose result;
    result.subscription_id = (*json_obj)[1].get<std::string>();

    return result;
  } catch (const std::exception &) {
    return std::nullopt;
  }
}

auto closed::deserialize(const std::string &json) -> std::optional<closed>
{
  try {
    auto json_obj = parse_message_array(json, "CLOSED", 2);
    if (!json_obj) { return std::nullopt; }
    if (!(*json_obj)[1].is_string()) { return std::nullopt; }

    closed result;
    result.subscription_id = (*json_obj)[1].get<std::string>();
    result.message = (json_obj->size() > 2 && (*json_obj)[2].is_string()) ? (*json_obj)[2].get<std::string>() : "";

    return result;
  } catch (const std::exception &) {
    return std::nullopt;
  }
}

auto notice::deserialize(const std::string &json) -> std::optional<notice>
{
  try {
    auto json_obj = parse_message_array(json, "NOTICE", 2);
    if (!json_obj) { return std::nullopt; }
    if (!(*json_obj)[1].is_string()) { return std::nullopt; }

    return notice{ .message = (*json_obj)[1].get<std::string>() };
  } catch (const std::exception &) {
    return std::nullopt;
  }
}

auto req::serialize() const -> std::string
{
  nlohmann::json json_array = nlohmann::json::array();
  json_array.push_back("REQ");
  json_array.push_back(subscription_id);
  json_array.push_back(filters);
  return json_array.dump();
}

auto req::deserialize(const std::string &json) -> std::optional<req>
{
  try {
    auto json_obj = parse_message_array(json, "REQ", 3);
    if (!json_obj) { return std::nullopt; }
    if (!(*json_obj)[1].is_string()) { return std::nullopt; }
    if (!(*json_obj)[2].is_object()) { return std::nullopt; }

    req result;
    result.subscription_id = (*json_obj)[1].get<std::string>();
    result.filters = (*json_obj)[2];

    return result;
  } catch (const std::exception &) {
    return std::nullopt;
  }
}

auto close::serialize() const -> std::string
{
  nlohmann::json json_array = nlohmann::json::array();
  json_array.push_back("CLOSE");
  json_array.push_back(subscription_id);
  return json_array.dump();
}

auto event::from_event_data(const event_data &evt) -> event { return event{ .subscription_id = "", .data = evt }; }

auto event::serialize() const -> std::string
{
  nlohmann::json message = nlohmann::json::array();
  message.push_back("EVENT");
  if (!subscription_id.empty()) { message.push_back(subscription_id); }
  message.push_back(data.to_json());

  return message.dump();
}

auto event::deserialize(const std::string &json) -> std::optional<event>
{
  try {
    auto json_obj = parse_message_array(json, "EVENT", 2);
    if (!json_obj) { return std::nullopt; }

    event result;

    if (json_obj->size() == 2) {
      auto event_opt = event_data::from_json((*json_obj)[1]);
      if (!event_opt) { return std::nullopt; }

      result.data = std::move(*event_opt);
      return result;
    }

    if (!(*json_obj)[1].is_string()) { return std::nullopt; }

    auto event_opt = event_data::from_json((*json_obj)[2]);
    if (!event_opt) { return std::nullopt; }

    result.subscription_id = (*json_obj)[1].get<std::string>();
    result.data = std::move(*event_opt);
    return result;
  } catch (const std::exception &) {
    return std::nullopt;
  }
}

}// namespace status_feed::nostr::protocol
