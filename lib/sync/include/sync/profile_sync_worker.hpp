#pragma once

#include <boost/asio/awaitable.hpp>
#include <boost/asio/cancellation_signal.hpp>
#include <boost/asio/io_context.hpp>
#include <chrono>
#include <concepts/relay_client.hpp>
#include <core/generation_runner.hpp>
#include <core/snapshot.hpp>
#include <cstdint>
#include <memory>
#include <nostr/models.hpp>
#include <nostr/protocol.hpp>
#include <nostr/relay_defaults.hpp>
#include <optional>
#include <spdlog/spdlog.h>
#include <sync/profile_store.hpp>
#include <sync/sync_target.hpp>
#include <unordered_set>

namespace status_feed::sync {

/**
 * @brief Keeps the profiles of followed accounts up to date.
 *
 * Each restart cancels the running fetch, waits for it to unwind, then streams the latest profile
 * metadata event per followed account from the read relays into the profile snapshot.
 */
template<concepts::relay_client Client> class profile_sync_worker
{
public:
  profile_sync_worker(const std::shared_ptr<boost::asio::io_context> &io_context,
    const std::shared_ptr<Client> &client,
    std::chrono::milliseconds timeout = nostr::defaults::connect_timeout)
    : client_(client), timeout_(timeout), runner_(io_context, "profile_sync_worker")
  {}

  /**
   * @brief Points the worker at a new target.
   *
   * Does nothing when the target is unchanged. Without a target, or with no followings, the
   * running fetch is stopped and the profiles are cleared.
   *
   * @param target Followings and relay list, std::nullopt when logged out
   */
  auto restart(std::optional<sync_target> target) -> boost::asio::awaitable<void>
  {
    if (started_ and target == target_) { co_return; }
    started_ = true;
    target_ = target;

    if (not target or target->followings.empty()) {
      co_await runner_.stop();
      spdlog::debug("[profile_sync_worker] No followings, clearing profiles");
      if (not profiles_.get()->empty()) { profiles_.publish(profile_map{}); }
      co_return;
    }

    const std::unordered_set<std::string> followed(target->followings.begin(), target->followings.end());
    profiles_.update([&followed](profile_map &profiles) {
      std::erase_if(profiles, [&followed](const auto &entry) { return not followed.contains(entry.first); });
    });

    co_await runner_.restart(
      [this, fetch_target = std::move(*target)](
        std::uint64_t generation, std::shared_ptr<boost::asio::cancellation_slot> cancel_slot) {
        return run_fetch(generation, fetch_target, std::move(cancel_slot));
      });
  }

  [[nodiscard]] auto profiles() -> core::snapshot<profile_map> & { return profiles_; }

  [[nodiscard]] auto generation() const -> std::uint64_t { return runner_.generation(); }

  [[nodiscard]] auto is_fetching() const -> bool { return runner_.is_running(); }

private:
  auto run_fetch(std::uint64_t generation,
    sync_target target,
    std::shared_ptr<boost::asio::cancellation_slot> cancel_slot) -> boost::asio::awaitable<void>
  {
    const auto read_relays = nostr::select_relays_by_usage(target.relays, nostr::usage::read);
    if (read_relays.empty()) {
      spdlog::warn("[profile_sync_worker] No read relays, profiles not fetched");
      co_return;
    }

    const std::unordered_set<std::string> followed(target.followings.begin(), target.followings.end());
    const nostr::protocol::filter filter{ .ids = {},
      .authors = target.followings,
      .kinds = { nostr::protocol::kind::profile_metadata },
      .tags = {},
      .since = std::nullopt,
      .until = std::nullopt,
      .limit = std::nullopt };

    auto stream = client_->fetch_last_event_per_author(read_relays, filter, timeout_);
    std::size_t received = 0;
    try {
      while (auto event = co_await stream->next(cancel_slot)) {
        if (not runner_.is_current(generation)) { break; }
        if (event->kind != nostr::protocol::kind::profile_metadata or not followed.contains(event->pubkey)) {
          continue;
        }

        auto profile = nostr::models::user_profile::from_event(*event);
        profiles_.update([&profile](profile_map &profiles) { profiles[profile.pubkey] = std::move(profile); });
        ++received;
      }
    } catch (const boost::system::system_error &) {
      stream->abandon();
      throw;
    }

    stream->abandon();
    spdlog::debug("[profile_sync_worker] Generation {} received {} profiles", generation, received);
  }

  std::shared_ptr<Client> client_;
  std::chrono::milliseconds timeout_;
  core::snapshot<profile_map> profiles_;
  std::optional<sync_target> target_;
  bool started_{ false };
  core::generation_runner runner_;
};

}// namespace status_feed::sync
