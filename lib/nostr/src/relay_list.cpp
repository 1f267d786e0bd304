#include <nostr/relay_list.hpp>

#include <algorithm>
#include <cctype>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace status_feed::nostr {

namespace {

  auto to_lower(std::string text) -> std::string
  {
    std::ranges::transform(
      text, text.begin(), [](unsigned char character) { return static_cast<char>(std::tolower(character)); });
    return text;
  }

  auto add_relay(relay_list &relays, const std::string &url, relay_usage flags) -> void
  {
    if (not flags.read and not flags.write) { return; }

    auto normalized = normalize_relay_url(url);
    if (not normalized) {
      spdlog::trace("[relay_list] Skipping invalid relay URL: {}", url);
      return;
    }

    auto &entry = relays[*normalized];
    entry.read = entry.read or flags.read;
    entry.write = entry.write or flags.write;
  }

  auto parse_contact_list_relays(const protocol::event_data &event) -> std::optional<relay_list>
  {
    if (event.content.empty()) { return std::nullopt; }

    nlohmann::json content;
    try {
      content = nlohmann::json::parse(event.content);
    } catch (const nlohmann::json::exception &e) {
      spdlog::debug("[relay_list] Contact list {} has malformed relay content: {}", event.id, e.what());
      return std::nullopt;
    }
    if (not content.is_object()) { return std::nullopt; }

    relay_list relays;
    for (const auto &[url, flags] : content.items()) {
      if (not flags.is_object()) { continue; }
      const auto read = flags.value("read", nlohmann::json{});
      const auto write = flags.value("write", nlohmann::json{});
      if (not read.is_boolean() or not write.is_boolean()) { continue; }
      add_relay(relays, url, relay_usage{ .read = read.get<bool>(), .write = write.get<bool>() });
    }

    if (relays.empty()) { return std::nullopt; }
    return relays;
  }

  auto parse_nip65_relays(const protocol::event_data &event) -> std::optional<relay_list>
  {
    relay_list relays;
    for (const auto &tag : event.tags) {
      if (tag.size() < 2 or tag[0] != "r") { continue; }

      if (tag.size() == 2 or tag[2].empty()) {
        add_relay(relays, tag[1], relay_usage{ .read = true, .write = true });
      } else if (tag[2] == "read") {
        add_relay(relays, tag[1], relay_usage{ .read = true, .write = false });
      } else if (tag[2] == "write") {
        add_relay(relays, tag[1], relay_usage{ .read = false, .write = true });
      }
    }

    if (relays.empty()) { return std::nullopt; }
    return relays;
  }

}// namespace

auto select_relays_by_usage(const relay_list &relays, usage wanted) -> std::vector<std::string>
{
  std::vector<std::string> selected;
  for (const auto &[url, flags] : relays) {
    switch (wanted) {
    case usage::read:
      if (flags.read) { selected.push_back(url); }
      break;
    case usage::write:
      if (flags.write) { selected.push_back(url); }
      break;
    case usage::read_and_write:
      if (flags.read and flags.write) { selected.push_back(url); }
      break;
    }
  }
  return selected;
}

auto normalize_relay_url(std::string_view url) -> std::optional<std::string>
{
  while (not url.empty() and std::isspace(static_cast<unsigned char>(url.front())) != 0) { url.remove_prefix(1); }
  while (not url.empty() and std::isspace(static_cast<unsigned char>(url.back())) != 0) { url.remove_suffix(1); }

  const auto scheme_end = url.find("://");
  if (scheme_end == std::string_view::npos) { return std::nullopt; }

  auto scheme = to_lower(std::string(url.substr(0, scheme_end)));
  if (scheme != "wss" and scheme != "ws") { return std::nullopt; }

  auto rest = url.substr(scheme_end + 3);
  const auto path_start = rest.find('/');
  auto host = to_lower(std::string(rest.substr(0, path_start)));
  if (host.empty()) { return std::nullopt; }

  std::string path;
  if (path_start != std::string_view::npos) { path = std::string(rest.substr(path_start)); }
  if (path == "/") { path.clear(); }

  return scheme + "://" + host + path;
}

auto parse_relay_list_in_event(const protocol::event_data &event) -> std::optional<relay_list>
{
  switch (event.kind) {
  case protocol::kind::contact_list:
    return parse_contact_list_relays(event);
  case protocol::kind::relay_list:
    return parse_nip65_relays(event);
  case protocol::kind::profile_metadata:
  case protocol::kind::user_status:
    return std::nullopt;
  }
  return std::nullopt;
}

}// namespace status_feed::nostr
