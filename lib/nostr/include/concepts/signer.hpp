#pragma once

#include <concepts>
#include <nostr/protocol.hpp>
#include <nostr/relay_list.hpp>
#include <optional>
#include <string>

namespace status_feed::concepts {

/**
 * @brief Concept for the external signing provider (a NIP-07 style extension or remote signer).
 *
 * sign_event() returns the draft with pubkey, id and sig filled in and throws
 * nostr::signer_error when the provider is absent or the user rejects the request.
 */
template<typename T>
concept signer = requires(T signer, const nostr::protocol::event_data &draft) {
  { signer.is_available() } -> std::convertible_to<bool>;
  { signer.get_public_key() } -> std::convertible_to<std::optional<std::string>>;
  { signer.sign_event(draft) } -> std::convertible_to<nostr::protocol::event_data>;
  { signer.get_relays() } -> std::convertible_to<std::optional<nostr::relay_list>>;
};

}// namespace status_feed::concepts
