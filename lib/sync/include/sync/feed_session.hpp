#pragma once

#include <async/async_queue.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/cancellation_signal.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/experimental/channel_error.hpp>
#include <boost/asio/io_context.hpp>
#include <chrono>
#include <concepts/event_verifier.hpp>
#include <concepts/relay_client.hpp>
#include <concepts/signer.hpp>
#include <core/generation_runner.hpp>
#include <core/snapshot.hpp>
#include <cstdint>
#include <memory>
#include <nostr/models.hpp>
#include <nostr/protocol.hpp>
#include <nostr/relay_defaults.hpp>
#include <nostr/schnorr.hpp>
#include <optional>
#include <platform/time_utils.hpp>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string>
#include <sync/account_data_fetcher.hpp>
#include <sync/account_store.hpp>
#include <sync/profile_store.hpp>
#include <sync/profile_sync_worker.hpp>
#include <sync/session_events.hpp>
#include <sync/signer_probe.hpp>
#include <sync/status_publisher.hpp>
#include <sync/status_store.hpp>
#include <sync/status_sync_worker.hpp>
#include <sync/sync_target.hpp>
#include <unordered_set>
#include <variant>
#include <vector>

namespace status_feed::sync {

/**
 * @brief Tunables of a feed_session.
 */
struct feed_session_options
{
  std::chrono::milliseconds connect_timeout{ nostr::defaults::connect_timeout };
  std::chrono::milliseconds signer_check_interval{ 300 };
  std::uint32_t signer_max_checks{ 5 };
  status_store::clock_fn now{ platform::current_unix_time };
};

/**
 * @brief Owns the synchronization flow from login to live status updates.
 *
 * Session events are processed one at a time by run(). A login persists the identity and starts
 * fetching the account data; once it arrives the relay pool is switched to the account's relay
 * list and both sync workers restart against the new followings. A logout tears everything down.
 *
 * Must be owned by a std::shared_ptr.
 */
template<concepts::relay_client Client,
  concepts::signer Signer,
  concepts::event_verifier Verifier = nostr::schnorr_verifier>
class feed_session : public std::enable_shared_from_this<feed_session<Client, Signer, Verifier>>
{
public:
  using profile_selector_t = core::selector<profile_map, nostr::models::user_profile>;
  using status_selector_t = core::selector<status_map, std::optional<nostr::models::user_status>>;

  feed_session(const std::shared_ptr<boost::asio::io_context> &io_context,
    const std::shared_ptr<Client> &client,
    const std::shared_ptr<Signer> &signer,
    const std::shared_ptr<account_store> &accounts,
    const std::shared_ptr<Verifier> &verifier,
    const feed_session_options &options = {})
    : io_context_(io_context), client_(client), signer_(signer), accounts_(accounts),
      in_queue_(std::make_shared<async::async_queue<events::in_t>>(io_context)),
      store_(std::make_shared<status_store>(io_context, options.now)),
      fetcher_(client, signer, options.connect_timeout),
      probe_(io_context, signer, options.signer_check_interval, options.signer_max_checks),
      publisher_(client, signer, store_, options.now),
      profile_worker_(std::make_shared<profile_sync_worker<Client>>(io_context, client, options.connect_timeout)),
      status_worker_(std::make_shared<status_sync_worker<Client, Verifier>>(
        io_context, client, store_, verifier, options.connect_timeout, options.now))
  {}

  [[nodiscard]] auto in_queue() const -> const std::shared_ptr<async::async_queue<events::in_t>> &
  {
    return in_queue_;
  }

  auto post(events::in_t evt) -> void
  {
    if (not in_queue_->push(std::move(evt))) { spdlog::error("[feed_session] Session queue full, event dropped"); }
  }

  // NOLINTNEXTLINE(performance-unnecessary-value-param)
  auto run_once(std::shared_ptr<boost::asio::cancellation_slot> cancel_slot = nullptr) -> boost::asio::awaitable<void>
  {
    auto evt = co_await in_queue_->pop(cancel_slot);
    co_await std::visit([this](auto &&event) { return handle(std::forward<decltype(event)>(event)); }, evt);
  }

  /**
   * @brief Processes session events until shutdown or cancellation.
   *
   * Logs in the persisted identity first, if there is one.
   */
  // NOLINTNEXTLINE(performance-unnecessary-value-param)
  auto run(std::shared_ptr<boost::asio::cancellation_slot> cancel_slot = nullptr) -> boost::asio::awaitable<void>
  {
    running_ = true;
    if (auto persisted = accounts_->load()) {
      spdlog::info("[feed_session] Restoring session of {}", *persisted);
      co_await handle(events::login{ .pubkey = *persisted });
    }

    try {
      while (running_) { co_await run_once(cancel_slot); }
    } catch (const boost::system::system_error &e) {
      if (core::is_cancellation(e.code())) {
        spdlog::debug("[feed_session] Cancelled, exiting run loop");
        co_return;
      }
      spdlog::error("[feed_session] Unexpected error in run loop: {}", e.what());
      throw;
    }
  }

  /**
   * @brief Publishes a new general status for the logged in account.
   *
   * @throws std::runtime_error when logged out
   * @throws nostr::signer_error if the signer fails; local state is left untouched
   */
  auto update_my_status(const status_input &input) -> nostr::protocol::event_data
  {
    if (not account_.get()->has_value()) { throw std::runtime_error("Not logged in"); }
    return publisher_.publish(input);
  }

  [[nodiscard]] auto account() -> core::snapshot<std::optional<std::string>> & { return account_; }

  [[nodiscard]] auto account_data() -> core::snapshot<std::optional<nostr::models::account_metadata>> &
  {
    return account_data_;
  }

  [[nodiscard]] auto profiles() -> core::snapshot<profile_map> & { return profile_worker_->profiles(); }

  [[nodiscard]] auto statuses() -> core::snapshot<status_map> & { return store_->statuses(); }

  [[nodiscard]] auto store() const -> const std::shared_ptr<status_store> & { return store_; }

  [[nodiscard]] auto signer_state() const -> signer_status { return probe_.status(); }

  [[nodiscard]] auto my_account_data_available() const -> bool
  {
    const auto account = account_.get();
    const auto data = account_data_.get();
    return account->has_value() and data->has_value() and (*data)->profile.pubkey == **account;
  }

  /// Profile of the logged in account, a placeholder until its data is fetched
  [[nodiscard]] auto my_profile() const -> std::optional<nostr::models::user_profile>
  {
    const auto account = account_.get();
    if (not account->has_value()) { return std::nullopt; }

    const auto data = account_data_.get();
    if (not data->has_value()) { return nostr::models::user_profile::placeholder(**account); }
    if ((*data)->profile.pubkey != **account) {
      spdlog::error("[feed_session] Account data belongs to {}, not to {}", (*data)->profile.pubkey, **account);
      return nostr::models::user_profile::placeholder(**account);
    }
    return (*data)->profile;
  }

  [[nodiscard]] auto my_general_status() const -> std::optional<nostr::models::status_data>
  {
    const auto account = account_.get();
    if (not account->has_value()) { return std::nullopt; }

    const auto statuses = store_->current();
    auto iter = statuses->find(**account);
    if (iter == statuses->end()) { return std::nullopt; }
    return iter->second.general;
  }

  /// Followed accounts with a live status, most recently updated first
  [[nodiscard]] auto ordered_followings() const -> std::vector<std::string>
  {
    const auto data = account_data_.get();
    if (not data->has_value()) { return {}; }

    const std::unordered_set<std::string> followed((*data)->followings.begin(), (*data)->followings.end());
    auto ordered = pubkeys_by_last_status_update(*store_->current());
    std::erase_if(ordered, [&followed](const std::string &pubkey) { return not followed.contains(pubkey); });
    return ordered;
  }

  [[nodiscard]] auto make_profile_selector(const std::string &pubkey) -> std::unique_ptr<profile_selector_t>
  {
    return std::make_unique<profile_selector_t>(
      profiles(),
      [pubkey](const profile_map &profiles) { return profile_of(profiles, pubkey); },
      [](const nostr::models::user_profile &lhs, const nostr::models::user_profile &rhs) {
        return nostr::models::same_source(lhs, rhs);
      });
  }

  [[nodiscard]] auto make_status_selector(const std::string &pubkey) -> std::unique_ptr<status_selector_t>
  {
    return std::make_unique<status_selector_t>(
      statuses(),
      [pubkey](const status_map &statuses) -> std::optional<nostr::models::user_status> {
        auto iter = statuses.find(pubkey);
        if (iter == statuses.end()) { return std::nullopt; }
        return iter->second;
      },
      [](const std::optional<nostr::models::user_status> &lhs, const std::optional<nostr::models::user_status> &rhs) {
        if (lhs.has_value() != rhs.has_value()) { return false; }
        return not lhs.has_value() or lhs->content_id() == rhs->content_id();
      });
  }

private:
  auto handle(const events::login &evt) -> boost::asio::awaitable<void>
  {
    if (not is_hex_pubkey(evt.pubkey)) {
      spdlog::warn("[feed_session] Ignoring login with invalid public key '{}'", evt.pubkey);
      co_return;
    }
    if (*account_.get() == evt.pubkey) {
      spdlog::debug("[feed_session] {} is already logged in", evt.pubkey);
      co_return;
    }

    try {
      accounts_->save(evt.pubkey);
    } catch (const std::exception &e) {
      spdlog::warn("[feed_session] Could not persist account: {}", e.what());
    }

    const auto login_generation = ++login_generation_;
    account_.publish(evt.pubkey);
    account_data_.publish(std::nullopt);
    spdlog::info("[feed_session] Logged in as {}", evt.pubkey);

    boost::asio::co_spawn(*io_context_,
      fetch_account_data(this->shared_from_this(), login_generation, evt.pubkey),
      boost::asio::detached);
  }

  auto handle(const events::logout & /*evt*/) -> boost::asio::awaitable<void>
  {
    ++login_generation_;
    accounts_->reset();
    account_.publish(std::nullopt);
    account_data_.publish(std::nullopt);
    spdlog::info("[feed_session] Logged out");

    co_await client_->switch_relays({});
    co_await restart_workers(std::nullopt);
  }

  auto handle(const events::account_data_fetched &evt) -> boost::asio::awaitable<void>
  {
    if (evt.login_generation != login_generation_ or *account_.get() != evt.pubkey) {
      spdlog::debug("[feed_session] Dropping account data of superseded login {}", evt.pubkey);
      co_return;
    }

    spdlog::info("[feed_session] Account data ready: {} followings, {} relays",
      evt.metadata.followings.size(),
      evt.metadata.relays.size());
    co_await client_->switch_relays(evt.metadata.relays);
    account_data_.publish(evt.metadata);
    co_await restart_workers(sync_target{ .followings = evt.metadata.followings, .relays = evt.metadata.relays });
  }

  auto handle(const events::shutdown & /*evt*/) -> boost::asio::awaitable<void>
  {
    spdlog::debug("[feed_session] Shutting down");
    running_ = false;
    ++login_generation_;
    co_await restart_workers(std::nullopt);
  }

  auto restart_workers(std::optional<sync_target> target) -> boost::asio::awaitable<void>
  {
    co_await profile_worker_->restart(target);
    co_await status_worker_->restart(target);
  }

  static auto fetch_account_data(std::shared_ptr<feed_session> self, std::uint64_t login_generation, std::string pubkey)
    -> boost::asio::awaitable<void>
  {
    try {
      const bool signer_available = co_await self->probe_.probe();
      auto metadata = co_await self->fetcher_.fetch(pubkey, signer_available);
      self->post(events::account_data_fetched{
        .login_generation = login_generation, .pubkey = std::move(pubkey), .metadata = std::move(metadata) });
    } catch (const std::exception &e) {
      spdlog::error("[feed_session] Fetching account data of {} failed: {}", pubkey, e.what());
    }
  }

  std::shared_ptr<boost::asio::io_context> io_context_;
  std::shared_ptr<Client> client_;
  std::shared_ptr<Signer> signer_;
  std::shared_ptr<account_store> accounts_;
  std::shared_ptr<async::async_queue<events::in_t>> in_queue_;
  std::shared_ptr<status_store> store_;
  account_data_fetcher<Client, Signer> fetcher_;
  signer_probe<Signer> probe_;
  status_publisher<Client, Signer> publisher_;
  std::shared_ptr<profile_sync_worker<Client>> profile_worker_;
  std::shared_ptr<status_sync_worker<Client, Verifier>> status_worker_;
  core::snapshot<std::optional<std::string>> account_;
  core::snapshot<std::optional<nostr::models::account_metadata>> account_data_;
  std::uint64_t login_generation_{ 0 };
  bool running_{ false };
};

}// namespace status_feed::sync
