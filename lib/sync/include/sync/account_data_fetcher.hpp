#pragma once

#include <async/when_all.hpp>
#include <boost/asio/awaitable.hpp>
#include <chrono>
#include <concepts/relay_client.hpp>
#include <concepts/signer.hpp>
#include <memory>
#include <nostr/models.hpp>
#include <nostr/protocol.hpp>
#include <nostr/relay_defaults.hpp>
#include <nostr/tags.hpp>
#include <optional>
#include <spdlog/spdlog.h>
#include <string>
#include <sync/relay_selector.hpp>
#include <unordered_set>
#include <vector>

namespace status_feed::sync {

/**
 * @brief Latest account events fetched in one round.
 */
struct account_events
{
  std::optional<nostr::protocol::event_data> profile;
  std::optional<nostr::protocol::event_data> contacts;
  std::optional<nostr::protocol::event_data> relays;

  /// A round is insufficient without a profile or without both relay sources
  [[nodiscard]] auto is_insufficient() const -> bool
  {
    return not profile.has_value() or (not contacts.has_value() and not relays.has_value());
  }
};

/**
 * @brief Builds account metadata from fetched events.
 *
 * @param pubkey Account public key
 * @param events Latest profile, contact list and relay list events, each possibly absent
 * @return Metadata with placeholder profile, empty followings or fallback relays where data is missing
 */
[[nodiscard]] inline auto assemble_account_metadata(const std::string &pubkey, const account_events &events)
  -> nostr::models::account_metadata
{
  nostr::models::account_metadata metadata{ .profile = events.profile
                                                         ? nostr::models::user_profile::from_event(*events.profile)
                                                         : nostr::models::user_profile::placeholder(pubkey),
    .followings = {},
    .relays = {} };

  if (events.contacts) {
    std::unordered_set<std::string> seen;
    for (auto &followee : nostr::get_tag_values(events.contacts->tags, "p")) {
      if (seen.insert(followee).second) { metadata.followings.push_back(std::move(followee)); }
    }
  }

  std::vector<nostr::protocol::event_data> relay_sources;
  if (events.contacts) { relay_sources.push_back(*events.contacts); }
  if (events.relays) { relay_sources.push_back(*events.relays); }
  metadata.relays = resolve_relay_list_from_events(std::move(relay_sources));

  return metadata;
}

/**
 * @brief Fetches profile, followings and relay list of an account in one coordinated round.
 *
 * @tparam Client Relay client
 * @tparam Signer Signing provider, consulted for its preferred relays
 */
template<concepts::relay_client Client, concepts::signer Signer> class account_data_fetcher
{
public:
  account_data_fetcher(const std::shared_ptr<Client> &client,
    const std::shared_ptr<Signer> &signer,
    std::chrono::milliseconds timeout = nostr::defaults::connect_timeout)
    : client_(client), signer_(signer), timeout_(timeout)
  {}

  /**
   * @brief Fetches the metadata of an account.
   *
   * The bootstrap relays come from the signer when it is available. If they yield no profile, or
   * neither a contact list nor a relay list, the fetch is repeated once against the default
   * relays and its results are used.
   *
   * @param pubkey Account public key
   * @param signer_available Whether the signer was detected as available
   * @return Awaitable yielding complete metadata, with placeholders where nothing was found
   */
  auto fetch(std::string pubkey, bool signer_available) -> boost::asio::awaitable<nostr::models::account_metadata>
  {
    const auto reported = signer_available ? signer_->get_relays() : std::nullopt;
    const auto bootstrap = resolve_bootstrap_relays(reported);

    auto events = co_await fetch_round(pubkey, bootstrap.urls);

    if (not bootstrap.is_default and events.is_insufficient()) {
      spdlog::info("[account_data_fetcher] Incomplete account data for {}, retrying with default relays", pubkey);
      events = co_await fetch_round(pubkey, nostr::defaults::bootstrap_relays());
    }

    spdlog::debug("[account_data_fetcher] Fetched {}: profile={} contacts={} relays={}",
      pubkey,
      events.profile.has_value(),
      events.contacts.has_value(),
      events.relays.has_value());

    co_return assemble_account_metadata(pubkey, events);
  }

private:
  auto fetch_round(const std::string &pubkey, const std::vector<std::string> &relays)
    -> boost::asio::awaitable<account_events>
  {
    auto events = std::make_shared<account_events>();

    using nostr::protocol::kind;
    std::vector<boost::asio::awaitable<void>> tasks;
    tasks.push_back(fetch_into(relays, latest_of(pubkey, kind::profile_metadata), events, &account_events::profile));
    tasks.push_back(fetch_into(relays, latest_of(pubkey, kind::contact_list), events, &account_events::contacts));
    tasks.push_back(fetch_into(relays, latest_of(pubkey, kind::relay_list), events, &account_events::relays));
    co_await async::when_all(std::move(tasks));

    co_return *events;
  }

  static auto latest_of(const std::string &pubkey, nostr::protocol::kind event_kind) -> nostr::protocol::filter
  {
    return nostr::protocol::filter{ .ids = {},
      .authors = { pubkey },
      .kinds = { event_kind },
      .tags = {},
      .since = std::nullopt,
      .until = std::nullopt,
      .limit = 1 };
  }

  auto fetch_into(std::vector<std::string> relays,
    nostr::protocol::filter filter,
    std::shared_ptr<account_events> events,
    std::optional<nostr::protocol::event_data> account_events::*field) -> boost::asio::awaitable<void>
  {
    (*events).*field = co_await client_->fetch_last_event(relays, filter, timeout_);
  }

  std::shared_ptr<Client> client_;
  std::shared_ptr<Signer> signer_;
  std::chrono::milliseconds timeout_;
};

}// namespace status_feed::sync
