#pragma once

#include <concepts>
#include <nostr/protocol.hpp>

namespace status_feed::concepts {

/**
 * @brief Concept for the collaborator that decides whether a relay event is authentic.
 *
 * verify() returns false for an event whose id or signature does not match its content.
 */
template<typename T>
concept event_verifier = requires(const T &verifier, const nostr::protocol::event_data &event) {
  { verifier.verify(event) } -> std::convertible_to<bool>;
};

}// namespace status_feed::concepts
