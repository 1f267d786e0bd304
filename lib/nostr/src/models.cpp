#include <nostr/models.hpp>
#include <nostr/tags.hpp>

#include <charconv>
#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace status_feed::nostr::models {

namespace {

  auto optional_string(const nlohmann::json &content, const char *key) -> std::optional<std::string>
  {
    if (not content.contains(key) or not content[key].is_string()) { return std::nullopt; }
    return content[key].get<std::string>();
  }

  auto parse_unix_time(const std::string &value) -> std::optional<std::uint64_t>
  {
    std::uint64_t parsed{};
    const auto *first = value.data();
    const auto *last = value.data() + value.size();// NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    auto [ptr, error_code] = std::from_chars(first, last, parsed);
    if (error_code != std::errc{} or ptr != last) { return std::nullopt; }
    return parsed;
  }

}// namespace

auto user_profile::from_event(const protocol::event_data &event) -> user_profile
{
  user_profile profile{ .source_event_id = event.id, .pubkey = event.pubkey };

  try {
    const auto content = nlohmann::json::parse(event.content);
    if (not content.is_object()) { return profile; }

    profile.name = optional_string(content, "name");
    profile.display_name = optional_string(content, "display_name");
    if (not profile.display_name) { profile.display_name = optional_string(content, "displayName"); }
    profile.about = optional_string(content, "about");
    profile.picture = optional_string(content, "picture");
    profile.banner = optional_string(content, "banner");
    profile.website = optional_string(content, "website");
    profile.nip05 = optional_string(content, "nip05");
    profile.lud16 = optional_string(content, "lud16");
  } catch (const nlohmann::json::exception &e) {
    spdlog::debug("[models] Malformed profile content in event {}: {}", event.id, e.what());
  }

  return profile;
}

auto user_profile::placeholder(const std::string &pubkey) -> user_profile
{
  return user_profile{ .source_event_id = std::string{ undefined_source_event_id }, .pubkey = pubkey };
}

auto user_profile::display_label() const -> std::string
{
  if (display_name and not display_name->empty()) { return *display_name; }
  if (name and not name->empty()) { return *name; }

  static constexpr std::size_t short_pubkey_length = 12;
  return pubkey.size() > short_pubkey_length ? pubkey.substr(0, short_pubkey_length) + "..." : pubkey;
}

auto parse_status_category(std::string_view value) -> std::optional<status_category>
{
  if (value == "general") { return status_category::general; }
  if (value == "music") { return status_category::music; }
  return std::nullopt;
}

auto to_string(status_category category) -> std::string_view
{
  switch (category) {
  case status_category::general:
    return "general";
  case status_category::music:
    return "music";
  }
  return "unknown";
}

auto status_data::from_event(const protocol::event_data &event) -> std::optional<status_data>
{
  auto category_tag = get_first_tag_value(event.tags, "d");
  if (not category_tag) { return std::nullopt; }

  auto category = parse_status_category(*category_tag);
  if (not category) { return std::nullopt; }

  status_data status{ .event_id = event.id,
    .category = *category,
    .content = event.content,
    .created_at = event.created_at,
    .expiration = std::nullopt,
    .link_url = get_first_tag_value(event.tags, "r") };

  if (auto expiration_tag = get_first_tag_value(event.tags, "expiration")) {
    status.expiration = parse_unix_time(*expiration_tag);
    if (not status.expiration) {
      spdlog::trace("[models] Ignoring malformed expiration '{}' in event {}", *expiration_tag, event.id);
    }
  }

  return status;
}

auto user_status::slot(status_category category) const -> const std::optional<status_data> &
{
  return category == status_category::general ? general : music;
}

auto user_status::slot(status_category category) -> std::optional<status_data> &
{
  return category == status_category::general ? general : music;
}

auto user_status::last_update_time() const -> std::uint64_t
{
  std::uint64_t latest = 0;
  for (const auto category : all_status_categories) {
    if (const auto &status = slot(category)) { latest = std::max(latest, status->created_at); }
  }
  return latest;
}

auto user_status::content_id() const -> std::string
{
  std::string identifier;
  for (const auto category : all_status_categories) {
    if (const auto &status = slot(category)) {
      identifier += fmt::format("{}:{}@{};", to_string(category), status->event_id, status->created_at);
    }
  }
  return identifier;
}

}// namespace status_feed::nostr::models
