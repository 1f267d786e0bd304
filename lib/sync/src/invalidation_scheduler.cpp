#include <sync/invalidation_scheduler.hpp>

#include <boost/asio/error.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace status_feed::sync {

invalidation_scheduler::invalidation_scheduler(const std::shared_ptr<boost::asio::io_context> &io_context,
  expire_handler_t on_expire)
  : io_context_(io_context), state_(std::make_shared<timer_state>())
{
  state_->on_expire = std::move(on_expire);
}

invalidation_scheduler::~invalidation_scheduler() { cancel_all(); }

auto invalidation_scheduler::make_key(const std::string &pubkey, nostr::models::status_category category)
  -> std::string
{
  return fmt::format("{}:{}", pubkey, nostr::models::to_string(category));
}

auto invalidation_scheduler::schedule(const std::string &pubkey,
  nostr::models::status_category category,
  std::chrono::steady_clock::duration ttl) -> void
{
  cancel(pubkey, category);

  auto key = make_key(pubkey, category);
  auto timer = std::make_shared<boost::asio::steady_timer>(*io_context_, ttl);
  state_->timers[key] = timer;

  spdlog::trace("[invalidation_scheduler] Scheduled {} in {}ms",
    key,
    std::chrono::duration_cast<std::chrono::milliseconds>(ttl).count());

  timer->async_wait([weak_state = std::weak_ptr<timer_state>(state_), key, pubkey, category, timer](
                      const boost::system::error_code &error) {
    if (error == boost::asio::error::operation_aborted) { return; }

    auto state = weak_state.lock();
    if (not state) { return; }

    // A replaced timer may already have been queued for completion before its cancel
    auto iter = state->timers.find(key);
    if (iter == state->timers.end() or iter->second != timer) { return; }
    state->timers.erase(iter);

    spdlog::debug("[invalidation_scheduler] Status {} expired", key);
    if (state->on_expire) { state->on_expire(pubkey, category); }
  });
}

auto invalidation_scheduler::cancel(const std::string &pubkey, nostr::models::status_category category) -> void
{
  auto iter = state_->timers.find(make_key(pubkey, category));
  if (iter == state_->timers.end()) { return; }

  iter->second->cancel();
  state_->timers.erase(iter);
}

auto invalidation_scheduler::cancel_all() -> void
{
  for (auto &[key, timer] : state_->timers) { timer->cancel(); }
  state_->timers.clear();
}

auto invalidation_scheduler::pending() const -> std::size_t { return state_->timers.size(); }

auto invalidation_scheduler::is_scheduled(const std::string &pubkey, nostr::models::status_category category) const
  -> bool
{
  return state_->timers.contains(make_key(pubkey, category));
}

}// namespace status_feed::sync
