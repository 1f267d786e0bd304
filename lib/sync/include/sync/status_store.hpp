#pragma once

#include <boost/asio/io_context.hpp>
#include <core/snapshot.hpp>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <nostr/models.hpp>
#include <nostr/protocol.hpp>
#include <string>
#include <sync/invalidation_scheduler.hpp>
#include <vector>

namespace status_feed::sync {

/// Live statuses keyed by account public key
using status_map = std::map<std::string, nostr::models::user_status>;

/**
 * @brief Followed accounts ordered by latest status update, newest first.
 *
 * Accounts with equal update times are ordered by ascending public key. Accounts without a live
 * status are not in the map and therefore not in the result.
 */
[[nodiscard]] auto pubkeys_by_last_status_update(const status_map &statuses) -> std::vector<std::string>;

/**
 * @brief Owner of the merged status state.
 *
 * Every incoming status event, whether from history, a realtime subscription or a local publish,
 * goes through apply_status_update(). Each mutation publishes a complete new status_map.
 */
class status_store
{
public:
  /// Returns the current Unix time in seconds
  using clock_fn = std::function<std::uint64_t()>;

  /// Longest delay armed on an expiry timer; a later expiration is re-armed when the timer fires
  static constexpr std::uint64_t max_expiry_delay_seconds{ 7ULL * 24 * 60 * 60 };

  /**
   * @brief Constructs an empty store.
   *
   * @param io_context io_context running the expiry timers
   * @param now Wall clock, injectable for tests
   */
  explicit status_store(const std::shared_ptr<boost::asio::io_context> &io_context, clock_fn now = nullptr);

  status_store(const status_store &) = delete;
  auto operator=(const status_store &) -> status_store & = delete;
  status_store(status_store &&) = delete;
  auto operator=(status_store &&) -> status_store & = delete;
  ~status_store() = default;

  /**
   * @brief Applies the merge policy to one event.
   *
   * Rejects events that are not user statuses, already expired, in an unsupported category, or
   * not newer than what was last applied to their slot. Non-empty content replaces the slot and
   * re-arms its expiry timer; empty content removes the slot.
   *
   * @param event Incoming user status event
   * @return true if the event changed the state
   */
  auto apply_status_update(const nostr::protocol::event_data &event) -> bool;

  /**
   * @brief Removes a slot, and the whole entry once both slots are empty.
   */
  auto invalidate(const std::string &pubkey, nostr::models::status_category category) -> void;

  /// Drops every status and cancels every expiry timer
  auto clear() -> void;

  [[nodiscard]] auto statuses() -> core::snapshot<status_map> & { return statuses_; }

  [[nodiscard]] auto current() const -> std::shared_ptr<const status_map> { return statuses_.get(); }

  [[nodiscard]] auto scheduler() const -> const invalidation_scheduler & { return scheduler_; }

private:
  auto arm_expiry(const std::string &pubkey,
    nostr::models::status_category category,
    std::uint64_t expiration,
    std::uint64_t now) -> void;

  auto on_expired(const std::string &pubkey, nostr::models::status_category category) -> void;

  clock_fn now_;
  core::snapshot<status_map> statuses_;
  invalidation_scheduler scheduler_;
  // Latest created_at applied per "pubkey:category", kept after the slot is removed
  std::map<std::string, std::uint64_t> applied_at_;
};

}// namespace status_feed::sync
