#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace status_feed::sync {

/// True for a 64 character lowercase hex public key
[[nodiscard]] auto is_hex_pubkey(std::string_view pubkey) -> bool;

/**
 * @brief Persists the public key of the logged in account in a JSON file.
 *
 * File format: {"nostr_pubkey": "<hex>"}
 */
class account_store
{
public:
  explicit account_store(std::filesystem::path path);

  /**
   * @brief Reads the persisted public key.
   *
   * @return Public key, std::nullopt if the file is missing, malformed or holds an invalid key
   */
  [[nodiscard]] auto load() const -> std::optional<std::string>;

  /**
   * @brief Persists a public key, creating parent directories as needed.
   *
   * @throws std::invalid_argument if pubkey is not a hex public key
   * @throws std::runtime_error if the file cannot be written
   */
  auto save(const std::string &pubkey) const -> void;

  /// Removes the persisted key; a missing file is not an error
  auto reset() const -> void;

  [[nodiscard]] auto path() const -> const std::filesystem::path & { return path_; }

private:
  std::filesystem::path path_;
};

}// namespace status_feed::sync
