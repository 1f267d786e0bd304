#pragma once

#include <boost/asio/awaitable.hpp>
#include <chrono>
#include <concepts>
#include <memory>
#include <nostr/event_stream.hpp>
#include <nostr/protocol.hpp>
#include <nostr/relay_list.hpp>
#include <optional>
#include <string>
#include <vector>

namespace status_feed::concepts {

/**
 * @brief Concept defining the relay operations the synchronization engine depends on.
 *
 * Types satisfying this concept fetch stored events from an explicit relay set, hold a switchable
 * set of connected relays for realtime subscriptions, and publish events to write relays.
 */
template<typename T>
concept relay_client = requires(T client,
  const std::vector<std::string> &relays,
  const nostr::protocol::filter &filter,
  std::chrono::milliseconds timeout,
  const nostr::relay_list &relay_list,
  const nostr::protocol::event_data &event,
  const std::string &subscription_id) {
  {
    client.fetch_last_event(relays, filter, timeout)
  } -> std::same_as<boost::asio::awaitable<std::optional<nostr::protocol::event_data>>>;
  { client.fetch_last_event_per_author(relays, filter, timeout) } -> std::same_as<std::shared_ptr<nostr::event_stream>>;
  { client.all_events(relays, filter, timeout) } -> std::same_as<std::shared_ptr<nostr::event_stream>>;
  { client.switch_relays(relay_list) } -> std::same_as<boost::asio::awaitable<void>>;
  { client.subscribe_forward(filter) } -> std::same_as<nostr::forward_subscription>;
  { client.unsubscribe(subscription_id) } -> std::same_as<void>;
  { client.send(event) } -> std::same_as<void>;
};

}// namespace status_feed::concepts
