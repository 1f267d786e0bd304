#pragma once

#include <boost/asio/awaitable.hpp>
#include <chrono>
#include <concepts>
#include <functional>
#include <nostr/protocol.hpp>
#include <string>

namespace status_feed::concepts {

/**
 * @brief Matches relay responses to the requests that caused them.
 *
 * OK responses are keyed by event id, EOSE responses by subscription id. A relay that ends a
 * subscription with CLOSED resolves the same key as EOSE would. cancel_all_pending() fails every
 * outstanding wait, used when the connection drops.
 */
template<typename T>
concept request_tracker = requires(T tracker,
  const std::string &key,
  std::function<void(const nostr::protocol::ok &)> on_ok,
  std::chrono::milliseconds timeout,
  const nostr::protocol::ok &ok_response,
  const nostr::protocol::eose &eose_response) {
  tracker.track(key, on_ok, timeout);
  tracker.resolve(key, ok_response);
  tracker.resolve(key, eose_response);
  tracker.cancel_all_pending();
  {
    tracker.template async_track<nostr::protocol::eose>(key, timeout)
  } -> std::same_as<boost::asio::awaitable<nostr::protocol::eose>>;
};

}// namespace status_feed::concepts
