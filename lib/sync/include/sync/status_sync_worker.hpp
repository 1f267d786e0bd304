#pragma once

#include <boost/asio/awaitable.hpp>
#include <boost/asio/cancellation_signal.hpp>
#include <boost/asio/io_context.hpp>
#include <chrono>
#include <concepts/event_verifier.hpp>
#include <concepts/relay_client.hpp>
#include <core/generation_runner.hpp>
#include <cstdint>
#include <functional>
#include <memory>
#include <nostr/models.hpp>
#include <nostr/protocol.hpp>
#include <nostr/relay_defaults.hpp>
#include <optional>
#include <platform/time_utils.hpp>
#include <spdlog/spdlog.h>
#include <string>
#include <sync/status_store.hpp>
#include <sync/sync_target.hpp>
#include <unordered_set>

namespace status_feed::sync {

/**
 * @brief Feeds the status store with the statuses of followed accounts.
 *
 * Every generation first drains the stored history, then keeps a realtime subscription open
 * until the next restart. Every event must pass the verifier before it reaches the store, and
 * realtime events are de-duplicated by id.
 */
template<concepts::relay_client Client, concepts::event_verifier Verifier> class status_sync_worker
{
public:
  enum class state : std::uint8_t { idle, fetching_history, live };

  status_sync_worker(const std::shared_ptr<boost::asio::io_context> &io_context,
    const std::shared_ptr<Client> &client,
    const std::shared_ptr<status_store> &store,
    const std::shared_ptr<Verifier> &verifier,
    std::chrono::milliseconds timeout = nostr::defaults::connect_timeout,
    status_store::clock_fn now = platform::current_unix_time)
    : client_(client), store_(store), verifier_(verifier), timeout_(timeout), now_(std::move(now)),
      runner_(io_context, "status_sync_worker")
  {}

  /**
   * @brief Points the worker at a new target.
   *
   * The running history fetch is cancelled and the realtime subscription closed before new work
   * starts. Does nothing when the target is unchanged. Without a target, or with no followings,
   * the worker stays idle and the status store is cleared.
   *
   * @param target Followings and relay list, std::nullopt when logged out
   */
  auto restart(std::optional<sync_target> target) -> boost::asio::awaitable<void>
  {
    if (started_ and target == target_) { co_return; }
    started_ = true;
    target_ = target;

    co_await runner_.stop();
    state_ = state::idle;

    if (not target or target->followings.empty()) {
      spdlog::debug("[status_sync_worker] No followings, clearing statuses");
      store_->clear();
      co_return;
    }

    co_await runner_.restart(
      [this, next_target = std::move(*target)](
        std::uint64_t generation, std::shared_ptr<boost::asio::cancellation_slot> cancel_slot) {
        return run_sync(generation, next_target, std::move(cancel_slot));
      });
  }

  [[nodiscard]] auto current_state() const -> state { return state_; }

  [[nodiscard]] auto generation() const -> std::uint64_t { return runner_.generation(); }

  /// Builds the status filter for the given accounts
  [[nodiscard]] static auto status_filter(const std::vector<std::string> &followings) -> nostr::protocol::filter
  {
    std::vector<std::string> categories;
    for (const auto category : nostr::models::all_status_categories) {
      categories.emplace_back(nostr::models::to_string(category));
    }

    return nostr::protocol::filter{ .ids = {},
      .authors = followings,
      .kinds = { nostr::protocol::kind::user_status },
      .tags = { { "d", categories } },
      .since = std::nullopt,
      .until = std::nullopt,
      .limit = std::nullopt };
  }

private:
  auto run_sync(std::uint64_t generation,
    sync_target target,
    std::shared_ptr<boost::asio::cancellation_slot> cancel_slot) -> boost::asio::awaitable<void>
  {
    const auto read_relays = nostr::select_relays_by_usage(target.relays, nostr::usage::read);
    auto filter = status_filter(target.followings);

    state_ = state::fetching_history;
    co_await fetch_history(generation, read_relays, filter, cancel_slot);
    if (not runner_.is_current(generation)) { co_return; }

    filter.since = now_();
    auto subscription = client_->subscribe_forward(filter);
    state_ = state::live;
    spdlog::debug("[status_sync_worker] Generation {} live on subscription {}", generation, subscription.id);

    std::unordered_set<std::string> seen;
    try {
      while (auto event = co_await subscription.events->next(cancel_slot)) {
        if (not runner_.is_current(generation)) { break; }
        if (not seen.insert(event->id).second) { continue; }
        if (not verifier_->verify(*event)) {
          spdlog::debug("[status_sync_worker] Dropping unverified event {}", event->id);
          continue;
        }
        store_->apply_status_update(*event);
      }
    } catch (const boost::system::system_error &) {
      client_->unsubscribe(subscription.id);
      throw;
    }

    client_->unsubscribe(subscription.id);
    if (runner_.is_current(generation)) { state_ = state::idle; }
  }

  auto fetch_history(std::uint64_t generation,
    const std::vector<std::string> &read_relays,
    const nostr::protocol::filter &filter,
    const std::shared_ptr<boost::asio::cancellation_slot> &cancel_slot) -> boost::asio::awaitable<void>
  {
    auto history = client_->all_events(read_relays, filter, timeout_);
    std::size_t applied = 0;
    try {
      while (auto event = co_await history->next(cancel_slot)) {
        if (not runner_.is_current(generation)) { break; }
        if (not verifier_->verify(*event)) {
          spdlog::debug("[status_sync_worker] Dropping unverified historical event {}", event->id);
          continue;
        }
        if (store_->apply_status_update(*event)) { ++applied; }
      }
    } catch (const boost::system::system_error &) {
      history->abandon();
      throw;
    }

    history->abandon();
    spdlog::debug("[status_sync_worker] Generation {} applied {} historical statuses", generation, applied);
  }

  std::shared_ptr<Client> client_;
  std::shared_ptr<status_store> store_;
  std::shared_ptr<Verifier> verifier_;
  std::chrono::milliseconds timeout_;
  status_store::clock_fn now_;
  state state_{ state::idle };
  std::optional<sync_target> target_;
  bool started_{ false };
  core::generation_runner runner_;
};

}// namespace status_feed::sync
