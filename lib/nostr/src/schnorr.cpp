#include <nostr/schnorr.hpp>

#include <array>
#include <boost/algorithm/hex.hpp>
#include <concepts/event_verifier.hpp>
#include <cstddef>
#include <fmt/format.h>
#include <memory>
#include <nostr/event_id.hpp>
#include <openssl/crypto.h>
#include <openssl/rand.h>
#include <optional>
#include <secp256k1.h>
#include <secp256k1_extrakeys.h>
#include <secp256k1_schnorrsig.h>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace status_feed::nostr {

static_assert(concepts::event_verifier<schnorr_verifier>);

namespace {

  constexpr std::size_t key_size = 32;
  constexpr std::size_t signature_size = 64;

  using context_ptr = std::unique_ptr<secp256k1_context, decltype(&secp256k1_context_destroy)>;

  auto make_context() -> context_ptr
  {
    context_ptr context(secp256k1_context_create(SECP256K1_CONTEXT_NONE), &secp256k1_context_destroy);
    if (not context) { throw std::runtime_error("Failed to create secp256k1 context"); }

    std::array<unsigned char, key_size> seed{};
    if (RAND_bytes(seed.data(), static_cast<int>(seed.size())) != 1
        or secp256k1_context_randomize(context.get(), seed.data()) != 1) {
      throw std::runtime_error("Failed to randomize secp256k1 context");
    }
    return context;
  }

  auto shared_context() -> const secp256k1_context *
  {
    static const context_ptr context = make_context();
    return context.get();
  }

  template<std::size_t Size> auto decode_hex(const std::string &hex) -> std::optional<std::array<unsigned char, Size>>
  {
    if (hex.size() != Size * 2) { return std::nullopt; }

    std::array<unsigned char, Size> bytes{};
    try {
      boost::algorithm::unhex(hex.begin(), hex.end(), bytes.begin());
    } catch (const boost::algorithm::hex_decode_error &) {
      return std::nullopt;
    }
    return bytes;
  }

  template<std::size_t Size> auto encode_hex(const std::array<unsigned char, Size> &bytes) -> std::string
  {
    std::string hex;
    hex.reserve(Size * 2);
    for (const auto byte : bytes) { hex += fmt::format("{:02x}", byte); }
    return hex;
  }

  auto make_keypair(const std::string &secret_key_hex) -> secp256k1_keypair
  {
    auto secret = decode_hex<key_size>(secret_key_hex);
    if (not secret) { throw std::invalid_argument("Secret key must be 64 hex characters"); }

    secp256k1_keypair keypair{};
    const int created = secp256k1_keypair_create(shared_context(), &keypair, secret->data());
    OPENSSL_cleanse(secret->data(), secret->size());
    if (created != 1) { throw std::invalid_argument("Secret key is out of range"); }
    return keypair;
  }

}// namespace

auto derive_public_key(const std::string &secret_key_hex) -> std::string
{
  auto keypair = make_keypair(secret_key_hex);

  secp256k1_xonly_pubkey pubkey{};
  std::array<unsigned char, key_size> serialized{};
  const bool derived = secp256k1_keypair_xonly_pub(shared_context(), &pubkey, nullptr, &keypair) == 1
                       and secp256k1_xonly_pubkey_serialize(shared_context(), serialized.data(), &pubkey) == 1;
  OPENSSL_cleanse(&keypair, sizeof(keypair));
  if (not derived) { throw std::runtime_error("Failed to derive public key"); }

  return encode_hex(serialized);
}

auto sign_event_id(const std::string &event_id, const std::string &secret_key_hex) -> std::string
{
  const auto digest = decode_hex<key_size>(event_id);
  if (not digest) { throw std::invalid_argument("Event id must be 64 hex characters"); }

  auto keypair = make_keypair(secret_key_hex);

  std::array<unsigned char, key_size> aux_random{};
  std::array<unsigned char, signature_size> signature{};
  const bool signed_digest =
    RAND_bytes(aux_random.data(), static_cast<int>(aux_random.size())) == 1
    and secp256k1_schnorrsig_sign32(shared_context(), signature.data(), digest->data(), &keypair, aux_random.data())
          == 1;
  OPENSSL_cleanse(&keypair, sizeof(keypair));
  if (not signed_digest) { throw std::runtime_error("Failed to sign event " + event_id); }

  return encode_hex(signature);
}

auto verify_event_signature(const protocol::event_data &event) -> bool
{
  const auto pubkey_bytes = decode_hex<key_size>(event.pubkey);
  const auto id_bytes = decode_hex<key_size>(event.id);
  const auto signature = decode_hex<signature_size>(event.sig);
  if (not pubkey_bytes or not id_bytes or not signature) { return false; }

  secp256k1_xonly_pubkey pubkey{};
  if (secp256k1_xonly_pubkey_parse(shared_context(), &pubkey, pubkey_bytes->data()) != 1) { return false; }

  return secp256k1_schnorrsig_verify(shared_context(), signature->data(), id_bytes->data(), id_bytes->size(), &pubkey)
         == 1;
}

auto schnorr_verifier::verify(const protocol::event_data &event) const -> bool
{
  if (not verify_event_id(event)) {
    spdlog::debug("[schnorr] Event {} has a mismatching id", event.id);
    return false;
  }

  try {
    if (not verify_event_signature(event)) {
      spdlog::debug("[schnorr] Event {} has an invalid signature", event.id);
      return false;
    }
  } catch (const std::runtime_error &e) {
    spdlog::error("[schnorr] Cannot verify event {}: {}", event.id, e.what());
    return false;
  }
  return true;
}

}// namespace status_feed::nostr
