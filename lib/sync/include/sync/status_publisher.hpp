#pragma once

#include <concepts/relay_client.hpp>
#include <concepts/signer.hpp>
#include <cstdint>
#include <memory>
#include <nostr/models.hpp>
#include <nostr/protocol.hpp>
#include <optional>
#include <platform/time_utils.hpp>
#include <spdlog/spdlog.h>
#include <string>
#include <sync/status_store.hpp>

namespace status_feed::sync {

/**
 * @brief A new general status of the logged in account.
 */
struct status_input
{
  std::string content;///< Status text, empty to clear the status
  std::string link_url;///< Optional link, omitted when empty
  std::optional<std::uint64_t> ttl;///< Seconds until the status expires
};

/**
 * @brief Publishes the general status of the logged in account.
 *
 * The signed event is applied to the local status store before it is sent, so the new status is
 * visible immediately. Relay rejections are only logged.
 */
template<concepts::relay_client Client, concepts::signer Signer> class status_publisher
{
public:
  status_publisher(const std::shared_ptr<Client> &client,
    const std::shared_ptr<Signer> &signer,
    const std::shared_ptr<status_store> &store,
    status_store::clock_fn now = platform::current_unix_time)
    : client_(client), signer_(signer), store_(store), now_(std::move(now))
  {}

  /**
   * @brief Signs, applies locally and sends a general status event.
   *
   * @param input Status content, link and time to live
   * @return The signed event
   * @throws nostr::signer_error if the signer fails; local state is left untouched
   */
  auto publish(const status_input &input) -> nostr::protocol::event_data
  {
    const auto created_at = now_();
    std::optional<std::uint64_t> expiration;
    if (input.ttl) { expiration = created_at + *input.ttl; }

    const auto draft = nostr::protocol::event_data::create_user_status(signer_->get_public_key().value_or(""),
      created_at,
      std::string(nostr::models::to_string(nostr::models::status_category::general)),
      input.content,
      input.link_url,
      expiration);

    auto signed_event = signer_->sign_event(draft);
    spdlog::debug("[status_publisher] Signed status {}", signed_event.id);

    if (not store_->apply_status_update(signed_event)) {
      spdlog::debug("[status_publisher] Status {} did not change the local state", signed_event.id);
    }
    client_->send(signed_event);

    return signed_event;
  }

private:
  std::shared_ptr<Client> client_;
  std::shared_ptr<Signer> signer_;
  std::shared_ptr<status_store> store_;
  status_store::clock_fn now_;
};

}// namespace status_feed::sync
