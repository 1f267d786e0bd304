#pragma once

#include <cstdint>
#include <nostr/models.hpp>
#include <string>
#include <variant>

namespace status_feed::sync::events {

/// The account with this public key logged in
struct login
{
  std::string pubkey;
};

/// The current account logged out
struct logout
{
};

/// Account data fetched for a login
struct account_data_fetched
{
  std::uint64_t login_generation;///< Login the fetch belongs to
  std::string pubkey;
  nostr::models::account_metadata metadata;
};

/// Ends the session run loop
struct shutdown
{
};

using in_t = std::variant<login, logout, account_data_fetched, shutdown>;

}// namespace status_feed::sync::events
