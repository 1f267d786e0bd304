#pragma once

#include <map>
#include <nostr/protocol.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace status_feed::nostr {

/**
 * @brief Read/write flags of a single relay in a relay list.
 */
struct relay_usage
{
  bool read{};///< Relay is used to fetch events
  bool write{};///< Relay is used to publish events

  auto operator==(const relay_usage &) const -> bool = default;
};

/// Relay URL to usage flags. Relays with both flags false never appear.
using relay_list = std::map<std::string, relay_usage>;

/// Subset selector for select_relays_by_usage
enum class usage { read, write, read_and_write };

/**
 * @brief Selects the relay URLs matching the requested usage.
 *
 * @param relays Relay list
 * @param wanted read: relays with read set, write: relays with write set, read_and_write: both set
 * @return Relay URLs in list order
 */
[[nodiscard]] auto select_relays_by_usage(const relay_list &relays, usage wanted) -> std::vector<std::string>;

/**
 * @brief Normalizes a relay URL.
 *
 * Lower-cases scheme and host and strips a trailing slash from a bare host.
 *
 * @param url Relay URL as found in an event
 * @return Normalized URL, std::nullopt if it is not a ws:// or wss:// URL with a host
 */
[[nodiscard]] auto normalize_relay_url(std::string_view url) -> std::optional<std::string>;

/**
 * @brief Parses the relay list carried by a contact list (kind 3) or relay list (kind 10002) event.
 *
 * Kind 3 carries a JSON object {url: {"read": bool, "write": bool}} in its content. Kind 10002 carries
 * ["r", url] tags with an optional "read" or "write" marker.
 *
 * @param event Event to parse
 * @return Relay list, std::nullopt if the event has another kind or no usable relay
 */
[[nodiscard]] auto parse_relay_list_in_event(const protocol::event_data &event) -> std::optional<relay_list>;

}// namespace status_feed::nostr
