#pragma once

#include <nostr/relay_list.hpp>
#include <string>
#include <vector>

namespace status_feed::sync {

/**
 * @brief What the sync workers fetch: whose data, and from where.
 */
struct sync_target
{
  std::vector<std::string> followings;///< Accounts to fetch
  nostr::relay_list relays;///< Relay list of the logged in account

  auto operator==(const sync_target &) const -> bool = default;
};

}// namespace status_feed::sync
