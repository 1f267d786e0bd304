#pragma once

#include <nostr/protocol.hpp>
#include <string>

namespace status_feed::nostr {

/**
 * @brief Computes the NIP-01 id of an event.
 *
 * The id is the lowercase hex SHA-256 of the JSON array [0, pubkey, created_at, kind, tags, content].
 *
 * @param event Event whose id and signature fields are ignored
 * @return 64 character hex id
 * @throws std::runtime_error if the digest cannot be computed
 */
[[nodiscard]] auto compute_event_id(const protocol::event_data &event) -> std::string;

/**
 * @brief Checks that the event id matches its content.
 *
 * Signature verification is left to the signing collaborator; a forged id is enough to drop an
 * event before it reaches the status store.
 */
[[nodiscard]] auto verify_event_id(const protocol::event_data &event) -> bool;

}// namespace status_feed::nostr
