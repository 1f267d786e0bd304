#include <nostr/event_id.hpp>

#include <array>
#include <fmt/format.h>
#include <memory>
#include <nlohmann/json.hpp>
#include <openssl/evp.h>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace status_feed::nostr {

auto compute_event_id(const protocol::event_data &event) -> std::string
{
  nlohmann::json commitment = nlohmann::json::array();
  commitment.push_back(0);
  commitment.push_back(event.pubkey);
  commitment.push_back(event.created_at);
  commitment.push_back(static_cast<std::uint16_t>(event.kind));
  commitment.push_back(event.to_json()["tags"]);
  commitment.push_back(event.content);
  const auto serialized = commitment.dump();

  const std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> context(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
  if (not context) { throw std::runtime_error("Failed to allocate digest context"); }

  std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
  unsigned int digest_length = 0;
  if (EVP_DigestInit_ex(context.get(), EVP_sha256(), nullptr) != 1
      or EVP_DigestUpdate(context.get(), serialized.data(), serialized.size()) != 1
      or EVP_DigestFinal_ex(context.get(), digest.data(), &digest_length) != 1) {
    throw std::runtime_error("Failed to compute SHA-256 of event");
  }

  std::string hex;
  hex.reserve(static_cast<std::size_t>(digest_length) * 2);
  for (unsigned int i = 0; i < digest_length; ++i) {
    hex += fmt::format("{:02x}", digest[i]);// NOLINT(cppcoreguidelines-pro-bounds-constant-array-index)
  }
  return hex;
}

auto verify_event_id(const protocol::event_data &event) -> bool
{
  try {
    return compute_event_id(event) == event.id;
  } catch (const std::runtime_error &e) {
    spdlog::error("[event_id] {}", e.what());
    return false;
  }
}

}// namespace status_feed::nostr
