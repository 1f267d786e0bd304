#pragma once

#include <nostr/protocol.hpp>
#include <string>

namespace status_feed::nostr {

/**
 * @brief Derives the x-only public key of a secret key.
 *
 * @param secret_key_hex 64 character hex secret key
 * @return 64 character lowercase hex public key
 * @throws std::invalid_argument if the secret key is malformed or out of range
 */
[[nodiscard]] auto derive_public_key(const std::string &secret_key_hex) -> std::string;

/**
 * @brief Signs an event id with BIP-340 Schnorr.
 *
 * @param event_id 64 character hex event id
 * @param secret_key_hex 64 character hex secret key
 * @return 128 character hex signature
 * @throws std::invalid_argument if the id or secret key is malformed
 * @throws std::runtime_error if signing fails
 */
[[nodiscard]] auto sign_event_id(const std::string &event_id, const std::string &secret_key_hex) -> std::string;

/// True if sig is a valid Schnorr signature of id by pubkey; malformed fields are invalid
[[nodiscard]] auto verify_event_signature(const protocol::event_data &event) -> bool;

/**
 * @brief Accepts events whose id commitment and signature both check out.
 */
class schnorr_verifier
{
public:
  [[nodiscard]] auto verify(const protocol::event_data &event) const -> bool;
};

}// namespace status_feed::nostr
