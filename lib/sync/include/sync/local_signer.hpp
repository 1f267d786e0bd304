#pragma once

#include <nostr/protocol.hpp>
#include <nostr/relay_list.hpp>
#include <optional>
#include <string>

namespace status_feed::sync {

/**
 * @brief Signer backed by keys known to this process.
 *
 * Without a secret key it only knows the public key and preferred relays, which is enough to log
 * in and watch statuses; sign_event() then throws nostr::signer_error. With a secret key the
 * public key is derived from it and events are signed locally.
 */
class local_signer
{
public:
  /**
   * @param pubkey Hex public key of the account, may be omitted when a secret key is given
   * @param relays Preferred relays reported to the bootstrap
   * @param secret_key Hex secret key, std::nullopt for a watch-only signer
   * @throws std::invalid_argument if the secret key is malformed or belongs to another public key
   */
  local_signer(std::optional<std::string> pubkey,
    std::optional<nostr::relay_list> relays,
    std::optional<std::string> secret_key = std::nullopt);

  local_signer(const local_signer &) = delete;
  auto operator=(const local_signer &) -> local_signer & = delete;
  local_signer(local_signer &&) = delete;
  auto operator=(local_signer &&) -> local_signer & = delete;
  ~local_signer();

  [[nodiscard]] auto is_available() const -> bool { return pubkey_.has_value(); }

  [[nodiscard]] auto can_sign() const -> bool { return secret_key_.has_value(); }

  [[nodiscard]] auto get_public_key() const -> std::optional<std::string> { return pubkey_; }

  /**
   * @brief Fills in pubkey, id and sig of a draft event.
   *
   * @throws nostr::signer_error without a secret key or if signing fails
   */
  [[nodiscard]] auto sign_event(const nostr::protocol::event_data &draft) const -> nostr::protocol::event_data;

  [[nodiscard]] auto get_relays() const -> std::optional<nostr::relay_list> { return relays_; }

private:
  std::optional<std::string> pubkey_;
  std::optional<nostr::relay_list> relays_;
  std::optional<std::string> secret_key_;
};

}// namespace status_feed::sync
