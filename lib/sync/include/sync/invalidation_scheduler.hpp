#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <nostr/models.hpp>
#include <string>
#include <unordered_map>

namespace status_feed::sync {

/**
 * @brief Per (account, category) expiry timers.
 *
 * At most one timer is armed per slot: scheduling a slot again cancels the earlier timer. A timer
 * that fires calls the expire handler once and forgets the slot. Firing never touches the network.
 */
class invalidation_scheduler
{
public:
  using expire_handler_t = std::function<void(const std::string &, nostr::models::status_category)>;

  invalidation_scheduler(const std::shared_ptr<boost::asio::io_context> &io_context, expire_handler_t on_expire);

  invalidation_scheduler(const invalidation_scheduler &) = delete;
  auto operator=(const invalidation_scheduler &) -> invalidation_scheduler & = delete;
  invalidation_scheduler(invalidation_scheduler &&) = delete;
  auto operator=(invalidation_scheduler &&) -> invalidation_scheduler & = delete;
  ~invalidation_scheduler();

  /**
   * @brief Arms the timer of a slot, replacing any timer already armed for it.
   *
   * @param pubkey Account public key
   * @param category Status category
   * @param ttl Time until the slot expires
   */
  auto schedule(const std::string &pubkey,
    nostr::models::status_category category,
    std::chrono::steady_clock::duration ttl) -> void;

  auto cancel(const std::string &pubkey, nostr::models::status_category category) -> void;

  auto cancel_all() -> void;

  /// Number of armed timers
  [[nodiscard]] auto pending() const -> std::size_t;

  [[nodiscard]] auto is_scheduled(const std::string &pubkey, nostr::models::status_category category) const -> bool;

  /// Composite timer key "pubkey:category"
  [[nodiscard]] static auto make_key(const std::string &pubkey, nostr::models::status_category category)
    -> std::string;

private:
  struct timer_state
  {
    std::unordered_map<std::string, std::shared_ptr<boost::asio::steady_timer>> timers;
    expire_handler_t on_expire;
  };

  std::shared_ptr<boost::asio::io_context> io_context_;
  std::shared_ptr<timer_state> state_;
};

}// namespace status_feed::sync
