#include <sync/status_store.hpp>

#include <algorithm>
#include <chrono>
#include <platform/time_utils.hpp>
#include <spdlog/spdlog.h>

namespace status_feed::sync {

auto pubkeys_by_last_status_update(const status_map &statuses) -> std::vector<std::string>
{
  std::vector<std::pair<std::uint64_t, std::string>> ordered;
  ordered.reserve(statuses.size());
  for (const auto &[pubkey, status] : statuses) { ordered.emplace_back(status.last_update_time(), pubkey); }

  std::ranges::sort(ordered, [](const auto &lhs, const auto &rhs) {
    if (lhs.first != rhs.first) { return lhs.first > rhs.first; }
    return lhs.second < rhs.second;
  });

  std::vector<std::string> pubkeys;
  pubkeys.reserve(ordered.size());
  for (auto &[update_time, pubkey] : ordered) { pubkeys.push_back(std::move(pubkey)); }
  return pubkeys;
}

status_store::status_store(const std::shared_ptr<boost::asio::io_context> &io_context, clock_fn now)
  : now_(now ? std::move(now) : clock_fn{ platform::current_unix_time }),
    scheduler_(io_context, [this](const std::string &pubkey, nostr::models::status_category category) {
      on_expired(pubkey, category);
    })
{}

auto status_store::apply_status_update(const nostr::protocol::event_data &event) -> bool
{
  if (event.kind != nostr::protocol::kind::user_status) {
    spdlog::trace("[status_store] Ignoring event {} of kind {}", event.id, static_cast<std::uint16_t>(event.kind));
    return false;
  }

  auto status = nostr::models::status_data::from_event(event);
  if (not status) {
    spdlog::trace("[status_store] Ignoring status {} without a supported category", event.id);
    return false;
  }

  const auto now = now_();
  if (status->expiration and *status->expiration <= now) {
    spdlog::trace("[status_store] Ignoring expired status {}", event.id);
    return false;
  }

  const auto category = status->category;
  const auto slot_key = invalidation_scheduler::make_key(event.pubkey, category);
  if (auto applied = applied_at_.find(slot_key); applied != applied_at_.end() and applied->second >= event.created_at) {
    spdlog::trace("[status_store] Ignoring status {}, slot {} is newer", event.id, slot_key);
    return false;
  }
  applied_at_[slot_key] = event.created_at;

  if (status->content.empty()) {
    spdlog::debug("[status_store] Status {} cleared by {}", slot_key, event.id);
    invalidate(event.pubkey, category);
    return true;
  }

  if (status->expiration) {
    arm_expiry(event.pubkey, category, *status->expiration, now);
  } else {
    scheduler_.cancel(event.pubkey, category);
  }

  spdlog::debug("[status_store] Status {} updated by {}", slot_key, event.id);
  statuses_.update([&](status_map &statuses) {
    auto &entry = statuses[event.pubkey];
    entry.pubkey = event.pubkey;
    entry.slot(category) = std::move(*status);
  });
  return true;
}

auto status_store::invalidate(const std::string &pubkey, nostr::models::status_category category) -> void
{
  scheduler_.cancel(pubkey, category);

  const auto current = statuses_.get();
  auto iter = current->find(pubkey);
  if (iter == current->end() or not iter->second.slot(category)) { return; }

  statuses_.update([&](status_map &statuses) {
    auto &entry = statuses[pubkey];
    entry.slot(category).reset();
    if (entry.is_empty()) { statuses.erase(pubkey); }
  });
}

auto status_store::clear() -> void
{
  scheduler_.cancel_all();
  applied_at_.clear();
  if (statuses_.get()->empty()) { return; }
  statuses_.publish(status_map{});
}

auto status_store::arm_expiry(const std::string &pubkey,
  nostr::models::status_category category,
  std::uint64_t expiration,
  std::uint64_t now) -> void
{
  const auto delay = std::min(expiration - now, max_expiry_delay_seconds);
  scheduler_.schedule(pubkey, category, std::chrono::seconds(static_cast<std::chrono::seconds::rep>(delay)));
}

auto status_store::on_expired(const std::string &pubkey, nostr::models::status_category category) -> void
{
  const auto current = statuses_.get();
  auto iter = current->find(pubkey);
  if (iter == current->end()) { return; }

  const auto &slot = iter->second.slot(category);
  if (not slot or not slot->expiration) {
    spdlog::trace("[status_store] Stale expiry for {} ignored", invalidation_scheduler::make_key(pubkey, category));
    return;
  }

  // the wall clock may lag the steady timer, or the delay was capped
  if (const auto now = now_(); *slot->expiration > now) {
    spdlog::trace("[status_store] Status {} not expired yet, re-arming", invalidation_scheduler::make_key(pubkey, category));
    arm_expiry(pubkey, category, *slot->expiration, now);
    return;
  }

  spdlog::debug("[status_store] Status {} expired", invalidation_scheduler::make_key(pubkey, category));
  invalidate(pubkey, category);
}

}// namespace status_feed::sync
