#include <sync/relay_selector.hpp>

#include <algorithm>
#include <cstdint>
#include <nostr/relay_defaults.hpp>
#include <spdlog/spdlog.h>

namespace status_feed::sync {

auto resolve_bootstrap_relays(const std::optional<nostr::relay_list> &reported) -> bootstrap_relays
{
  if (reported) {
    auto urls = nostr::select_relays_by_usage(*reported, nostr::usage::read);
    if (not urls.empty()) {
      spdlog::debug("[relay_selector] Using {} read relays reported by the signer", urls.size());
      return bootstrap_relays{ .urls = std::move(urls), .is_default = false };
    }
    spdlog::debug("[relay_selector] Signer reported no read relays");
  }

  return bootstrap_relays{ .urls = nostr::defaults::bootstrap_relays(), .is_default = true };
}

auto resolve_relay_list_from_events(std::vector<nostr::protocol::event_data> events) -> nostr::relay_list
{
  std::erase_if(events, [](const nostr::protocol::event_data &event) {
    return event.kind != nostr::protocol::kind::contact_list and event.kind != nostr::protocol::kind::relay_list;
  });
  std::ranges::stable_sort(
    events, [](const auto &lhs, const auto &rhs) { return lhs.created_at > rhs.created_at; });

  for (const auto &event : events) {
    if (auto relays = nostr::parse_relay_list_in_event(event)) {
      spdlog::debug("[relay_selector] Relay list taken from event {} (kind {})",
        event.id,
        static_cast<std::uint16_t>(event.kind));
      return *relays;
    }
    spdlog::debug("[relay_selector] Event {} has no usable relay list", event.id);
  }

  spdlog::warn("[relay_selector] No relay list found, using the fallback relays");
  return nostr::defaults::fallback_relay_list();
}

}// namespace status_feed::sync
