#include <sync/account_store.hpp>

#include <algorithm>
#include <fstream>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <system_error>

namespace status_feed::sync {

namespace {
  constexpr const char *pubkey_field = "nostr_pubkey";
  constexpr std::size_t pubkey_hex_length = 64;
}// namespace

auto is_hex_pubkey(std::string_view pubkey) -> bool
{
  return pubkey.size() == pubkey_hex_length and std::ranges::all_of(pubkey, [](char character) {
    return (character >= '0' and character <= '9') or (character >= 'a' and character <= 'f');
  });
}

account_store::account_store(std::filesystem::path path) : path_(std::move(path)) {}

auto account_store::load() const -> std::optional<std::string>
{
  std::ifstream file(path_);
  if (not file) {
    spdlog::debug("[account_store] No account file at {}", path_.string());
    return std::nullopt;
  }

  try {
    const auto json = nlohmann::json::parse(file);
    if (not json.is_object() or not json.contains(pubkey_field) or not json[pubkey_field].is_string()) {
      spdlog::warn("[account_store] Account file {} has no public key", path_.string());
      return std::nullopt;
    }

    auto pubkey = json[pubkey_field].get<std::string>();
    if (not is_hex_pubkey(pubkey)) {
      spdlog::warn("[account_store] Account file {} holds an invalid public key", path_.string());
      return std::nullopt;
    }
    return pubkey;
  } catch (const nlohmann::json::exception &e) {
    spdlog::warn("[account_store] Malformed account file {}: {}", path_.string(), e.what());
    return std::nullopt;
  }
}

auto account_store::save(const std::string &pubkey) const -> void
{
  if (not is_hex_pubkey(pubkey)) { throw std::invalid_argument("Not a hex public key: " + pubkey); }

  if (path_.has_parent_path()) {
    std::error_code error;
    std::filesystem::create_directories(path_.parent_path(), error);
    if (error) {
      throw std::runtime_error("Cannot create " + path_.parent_path().string() + ": " + error.message());
    }
  }

  std::ofstream file(path_, std::ios::trunc);
  if (not file) { throw std::runtime_error("Cannot write account file " + path_.string()); }

  file << nlohmann::json{ { pubkey_field, pubkey } }.dump(2) << '\n';
  spdlog::debug("[account_store] Saved account {} to {}", pubkey, path_.string());
}

auto account_store::reset() const -> void
{
  std::error_code error;
  std::filesystem::remove(path_, error);
  if (error) { spdlog::warn("[account_store] Cannot remove {}: {}", path_.string(), error.message()); }
}

}// namespace status_feed::sync
