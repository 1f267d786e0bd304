#pragma once

#include <chrono>
#include <nostr/relay_list.hpp>
#include <string>
#include <vector>

namespace status_feed::nostr::defaults {

/// Relays queried for account metadata when the signer reports no usable read relay
inline auto bootstrap_relays() -> std::vector<std::string>
{
  return { "wss://relay.nostr.band", "wss://relayable.org", "wss://yabu.me" };
}

/// Relay list used when an account publishes none that parses
inline auto fallback_relay_list() -> relay_list
{
  return {
    { "wss://relay.nostr.band", relay_usage{ .read = true, .write = true } },
    { "wss://relayable.org", relay_usage{ .read = true, .write = true } },
    { "wss://relay.damus.io", relay_usage{ .read = false, .write = true } },
    { "wss://yabu.me", relay_usage{ .read = true, .write = false } },
  };
}

/// Connection timeout applied to every relay network operation
inline constexpr std::chrono::milliseconds connect_timeout{ 3000 };

/// Time to wait for EOSE before treating a relay as exhausted
inline constexpr std::chrono::milliseconds eose_timeout{ 10000 };

/// First wait before reconnecting to a read relay that dropped the connection
inline constexpr std::chrono::milliseconds reconnect_delay{ 1000 };

/// Upper bound of the doubling reconnect wait
inline constexpr std::chrono::seconds max_reconnect_delay{ 60 };

}// namespace status_feed::nostr::defaults
