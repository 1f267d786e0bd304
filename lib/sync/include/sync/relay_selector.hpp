#pragma once

#include <nostr/protocol.hpp>
#include <nostr/relay_list.hpp>
#include <optional>
#include <string>
#include <vector>

namespace status_feed::sync {

/**
 * @brief Relays used to fetch an account's metadata at login.
 */
struct bootstrap_relays
{
  std::vector<std::string> urls;
  bool is_default{};///< True when urls is the hardcoded default set
};

/**
 * @brief Chooses the bootstrap relays.
 *
 * @param reported Relay list reported by the signer, std::nullopt if it is unavailable
 * @return Read relays of the reported list, or the default relays if it has none
 */
[[nodiscard]] auto resolve_bootstrap_relays(const std::optional<nostr::relay_list> &reported) -> bootstrap_relays;

/**
 * @brief Extracts an account's relay list from its contact list and relay list events.
 *
 * The newest event that parses wins regardless of kind. Events of other kinds are ignored.
 *
 * @param events Fetched account events in any order
 * @return Parsed relay list, or the fallback relay list if no event parses
 */
[[nodiscard]] auto resolve_relay_list_from_events(std::vector<nostr::protocol::event_data> events)
  -> nostr::relay_list;

}// namespace status_feed::sync
