#include <sync/local_signer.hpp>

#include <concepts/signer.hpp>
#include <nostr/event_id.hpp>
#include <nostr/schnorr.hpp>
#include <nostr/signer_error.hpp>
#include <openssl/crypto.h>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace status_feed::sync {

static_assert(concepts::signer<local_signer>);

local_signer::local_signer(std::optional<std::string> pubkey,
  std::optional<nostr::relay_list> relays,
  std::optional<std::string> secret_key)
  : pubkey_(std::move(pubkey)), relays_(std::move(relays)), secret_key_(std::move(secret_key))
{
  if (not secret_key_) { return; }

  auto derived = nostr::derive_public_key(*secret_key_);
  if (pubkey_ and *pubkey_ != derived) {
    throw std::invalid_argument("Secret key belongs to " + derived + ", not to " + *pubkey_);
  }
  pubkey_ = std::move(derived);
  spdlog::debug("[local_signer] Signing as {}", *pubkey_);
}

local_signer::~local_signer()
{
  if (secret_key_) { OPENSSL_cleanse(secret_key_->data(), secret_key_->size()); }
}

auto local_signer::sign_event(const nostr::protocol::event_data &draft) const -> nostr::protocol::event_data
{
  if (not pubkey_) { throw nostr::signer_error("No signer available"); }
  if (not secret_key_) { throw nostr::signer_error("No secret key configured, this signer can only watch"); }

  auto signed_event = draft;
  signed_event.pubkey = *pubkey_;
  try {
    signed_event.id = nostr::compute_event_id(signed_event);
    signed_event.sig = nostr::sign_event_id(signed_event.id, *secret_key_);
  } catch (const std::exception &e) {
    throw nostr::signer_error(std::string("Signing failed: ") + e.what());
  }
  return signed_event;
}

}// namespace status_feed::sync
