#pragma once

#include <map>
#include <nostr/models.hpp>
#include <string>

namespace status_feed::sync {

/// Fetched profiles keyed by account public key
using profile_map = std::map<std::string, nostr::models::user_profile>;

/**
 * @brief Looks up a profile, falling back to a placeholder for accounts not fetched yet.
 */
[[nodiscard]] inline auto profile_of(const profile_map &profiles, const std::string &pubkey)
  -> nostr::models::user_profile
{
  auto iter = profiles.find(pubkey);
  if (iter != profiles.end()) { return iter->second; }
  return nostr::models::user_profile::placeholder(pubkey);
}

}// namespace status_feed::sync
