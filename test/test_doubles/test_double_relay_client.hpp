#pragma once

#include <concepts/relay_client.hpp>

#include <algorithm>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <nostr/event_stream.hpp>
#include <nostr/protocol.hpp>
#include <nostr/relay_list.hpp>
#include <nostr/tags.hpp>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace status_feed::test {

/**
 * @brief In-memory relay client.
 *
 * Stored events answer fetches; an event stored for a relay URL is only visible to queries that
 * include that relay. Forward subscriptions receive events pushed with emit_forward(). Every call
 * is recorded for assertions.
 */
class test_double_relay_client
{
public:
  enum class query_type : std::uint8_t { last_event, last_event_per_author, all_events };

  struct query_record
  {
    query_type type;
    std::vector<std::string> relays;
    nostr::protocol::filter filter;
  };

  explicit test_double_relay_client(const std::shared_ptr<boost::asio::io_context> &io_context)
    : io_context_(io_context)
  {}

  /// Stores an event on every relay
  auto add_stored_event(nostr::protocol::event_data event) -> void { stored_.push_back({ "", std::move(event) }); }

  /// Stores an event on one relay only
  auto add_stored_event(std::string relay_url, nostr::protocol::event_data event) -> void
  {
    stored_.push_back({ std::move(relay_url), std::move(event) });
  }

  /// Streams stay open until finish_streams() is called
  auto set_hold_streams(bool hold) -> void { hold_streams_ = hold; }

  auto finish_streams() -> void
  {
    for (const auto &stream : held_streams_) { stream->finish(); }
    held_streams_.clear();
  }

  /// Pushes an event to every open forward subscription whose filter matches it
  auto emit_forward(const nostr::protocol::event_data &event) -> std::size_t
  {
    std::size_t delivered = 0;
    for (const auto &[subscription_id, forward] : forwards_) {
      if (matches(forward.filter, event)) {
        forward.events->push(event);
        ++delivered;
      }
    }
    return delivered;
  }

  auto fetch_last_event(const std::vector<std::string> &relays,
    const nostr::protocol::filter &filter,
    std::chrono::milliseconds /*timeout*/) -> boost::asio::awaitable<std::optional<nostr::protocol::event_data>>
  {
    queries_.push_back({ .type = query_type::last_event, .relays = relays, .filter = filter });

    std::optional<nostr::protocol::event_data> newest;
    for (const auto &event : matching(relays, filter)) {
      if (not newest or event.created_at > newest->created_at) { newest = event; }
    }
    co_return newest;
  }

  auto fetch_last_event_per_author(const std::vector<std::string> &relays,
    const nostr::protocol::filter &filter,
    std::chrono::milliseconds /*timeout*/) -> std::shared_ptr<nostr::event_stream>
  {
    queries_.push_back({ .type = query_type::last_event_per_author, .relays = relays, .filter = filter });

    std::map<std::string, nostr::protocol::event_data> newest;
    for (const auto &event : matching(relays, filter)) {
      auto iter = newest.find(event.pubkey);
      if (iter == newest.end() or event.created_at > iter->second.created_at) { newest[event.pubkey] = event; }
    }

    auto stream = std::make_shared<nostr::event_stream>(io_context_);
    for (auto &[pubkey, event] : newest) { stream->push(std::move(event)); }
    end_stream(stream);
    return stream;
  }

  auto all_events(const std::vector<std::string> &relays,
    const nostr::protocol::filter &filter,
    std::chrono::milliseconds /*timeout*/) -> std::shared_ptr<nostr::event_stream>
  {
    queries_.push_back({ .type = query_type::all_events, .relays = relays, .filter = filter });

    auto stream = std::make_shared<nostr::event_stream>(io_context_);
    for (auto &event : matching(relays, filter)) { stream->push(std::move(event)); }
    end_stream(stream);
    return stream;
  }

  auto switch_relays(const nostr::relay_list &relays) -> boost::asio::awaitable<void>
  {
    relay_switches_.push_back(relays);
    co_return;
  }

  auto subscribe_forward(const nostr::protocol::filter &filter) -> nostr::forward_subscription
  {
    auto subscription_id = "forward-" + std::to_string(++next_subscription_);
    auto stream = std::make_shared<nostr::event_stream>(io_context_);
    forwards_[subscription_id] = forward_record{ .filter = filter, .events = stream };
    forward_filters_.push_back(filter);
    return nostr::forward_subscription{ .id = subscription_id, .events = stream };
  }

  auto unsubscribe(const std::string &subscription_id) -> void
  {
    unsubscribed_.push_back(subscription_id);
    auto iter = forwards_.find(subscription_id);
    if (iter == forwards_.end()) { return; }
    iter->second.events->finish();
    forwards_.erase(iter);
  }

  auto send(const nostr::protocol::event_data &event) -> void { sent_.push_back(event); }

  [[nodiscard]] auto get_queries() const -> const std::vector<query_record> & { return queries_; }
  [[nodiscard]] auto get_relay_switches() const -> const std::vector<nostr::relay_list> & { return relay_switches_; }
  [[nodiscard]] auto get_forward_filters() const -> const std::vector<nostr::protocol::filter> &
  {
    return forward_filters_;
  }
  [[nodiscard]] auto get_unsubscribed() const -> const std::vector<std::string> & { return unsubscribed_; }
  [[nodiscard]] auto get_sent() const -> const std::vector<nostr::protocol::event_data> & { return sent_; }
  [[nodiscard]] auto open_forward_count() const -> std::size_t { return forwards_.size(); }

  [[nodiscard]] auto count_queries(query_type type) const -> std::size_t
  {
    return static_cast<std::size_t>(
      std::ranges::count_if(queries_, [type](const query_record &query) { return query.type == type; }));
  }

  /// Whether an event satisfies a filter's ids, authors, kinds, tags, since and until
  [[nodiscard]] static auto matches(const nostr::protocol::filter &filter, const nostr::protocol::event_data &event)
    -> bool
  {
    if (not filter.ids.empty() and std::ranges::find(filter.ids, event.id) == filter.ids.end()) { return false; }
    if (not filter.authors.empty() and std::ranges::find(filter.authors, event.pubkey) == filter.authors.end()) {
      return false;
    }
    if (not filter.kinds.empty() and std::ranges::find(filter.kinds, event.kind) == filter.kinds.end()) {
      return false;
    }
    for (const auto &[tag_name, accepted] : filter.tags) {
      const auto values = nostr::get_tag_values(event.tags, tag_name);
      const bool any = std::ranges::any_of(
        values, [&accepted](const std::string &value) { return std::ranges::find(accepted, value) != accepted.end(); });
      if (not any) { return false; }
    }
    if (filter.since and event.created_at < *filter.since) { return false; }
    if (filter.until and event.created_at > *filter.until) { return false; }
    return true;
  }

private:
  struct stored_event
  {
    std::string relay_url;
    nostr::protocol::event_data event;
  };

  struct forward_record
  {
    nostr::protocol::filter filter;
    std::shared_ptr<nostr::event_stream> events;
  };

  auto matching(const std::vector<std::string> &relays, const nostr::protocol::filter &filter) const
    -> std::vector<nostr::protocol::event_data>
  {
    std::vector<nostr::protocol::event_data> found;
    std::unordered_set<std::string> seen;
    for (const auto &stored : stored_) {
      if (not stored.relay_url.empty() and std::ranges::find(relays, stored.relay_url) == relays.end()) { continue; }
      if (not matches(filter, stored.event)) { continue; }
      if (seen.insert(stored.event.id).second) { found.push_back(stored.event); }
    }
    return found;
  }

  auto end_stream(const std::shared_ptr<nostr::event_stream> &stream) -> void
  {
    if (hold_streams_) {
      held_streams_.push_back(stream);
      return;
    }
    stream->finish();
  }

  std::shared_ptr<boost::asio::io_context> io_context_;
  std::vector<stored_event> stored_;
  bool hold_streams_{ false };
  std::vector<std::shared_ptr<nostr::event_stream>> held_streams_;
  std::unordered_map<std::string, forward_record> forwards_;
  std::size_t next_subscription_{ 0 };

  std::vector<query_record> queries_;
  std::vector<nostr::relay_list> relay_switches_;
  std::vector<nostr::protocol::filter> forward_filters_;
  std::vector<std::string> unsubscribed_;
  std::vector<nostr::protocol::event_data> sent_;
};

static_assert(status_feed::concepts::relay_client<test_double_relay_client>);

}// namespace status_feed::test
