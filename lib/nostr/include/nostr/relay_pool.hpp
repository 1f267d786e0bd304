#pragma once

#include <algorithm>
#include <async/when_all.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <chrono>
#include <concepts/relay_client.hpp>
#include <concepts/websocket_stream.hpp>
#include <core/id_generator.hpp>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <nostr/event_stream.hpp>
#include <nostr/protocol.hpp>
#include <nostr/relay_connection.hpp>
#include <nostr/relay_defaults.hpp>
#include <nostr/relay_list.hpp>
#include <optional>
#include <spdlog/spdlog.h>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace status_feed::nostr {

/**
 * @brief Relay client over a set of WebSocket relay connections.
 *
 * Queries open connections on demand against the relays they are given. The switchable relay
 * list selects where forward subscriptions are kept open (read relays) and where events are
 * published (write relays).
 *
 * A read relay that drops its connection is reconnected with exponential backoff and gets every
 * open forward subscription again.
 *
 * Must be owned by a std::shared_ptr; background coroutines keep the pool alive.
 */
template<concepts::websocket_stream WebSocketStream>
class relay_pool : public std::enable_shared_from_this<relay_pool<WebSocketStream>>
{
public:
  using connection_t = relay_connection<WebSocketStream>;
  using stream_factory_t = std::function<std::shared_ptr<WebSocketStream>(const std::string &)>;

  relay_pool(const std::shared_ptr<boost::asio::io_context> &io_context,
    stream_factory_t stream_factory,
    std::chrono::milliseconds eose_timeout = defaults::eose_timeout,
    std::chrono::milliseconds reconnect_delay = defaults::reconnect_delay)
    : io_context_(io_context), stream_factory_(std::move(stream_factory)), eose_timeout_(eose_timeout),
      reconnect_delay_(reconnect_delay)
  {}

  relay_pool(const relay_pool &) = delete;
  auto operator=(const relay_pool &) -> relay_pool & = delete;
  relay_pool(relay_pool &&) = delete;
  auto operator=(relay_pool &&) -> relay_pool & = delete;

  ~relay_pool()
  {
    for (auto &[url, connection] : connections_) { connection->disconnect(); }
  }

  /**
   * @brief Fetches the newest stored event matching filter across relays.
   *
   * @param relays Relays to query
   * @param filter Event filter
   * @param timeout Connection timeout per relay
   * @return Awaitable yielding the event with the highest created_at, std::nullopt if none
   */
  auto fetch_last_event(std::vector<std::string> relays, protocol::filter filter, std::chrono::milliseconds timeout)
    -> boost::asio::awaitable<std::optional<protocol::event_data>>
  {
    filter.limit = 1;
    auto stream = all_events(relays, filter, timeout);

    std::optional<protocol::event_data> newest;
    while (auto event = co_await stream->next()) {
      if (not newest or event->created_at > newest->created_at) { newest = std::move(event); }
    }
    co_return newest;
  }

  /**
   * @brief Streams the newest event per author.
   *
   * An author's event is emitted whenever it is newer than the last one emitted for that author.
   */
  auto fetch_last_event_per_author(const std::vector<std::string> &relays,
    const protocol::filter &filter,
    std::chrono::milliseconds timeout) -> std::shared_ptr<event_stream>
  {
    auto stream = std::make_shared<event_stream>(io_context_);
    auto newest_by_author = std::make_shared<std::unordered_map<std::string, std::uint64_t>>();

    start_query(relays, filter, timeout, stream, [stream, newest_by_author](const protocol::event_data &event) {
      auto iter = newest_by_author->find(event.pubkey);
      if (iter != newest_by_author->end() and iter->second >= event.created_at) { return; }
      (*newest_by_author)[event.pubkey] = event.created_at;
      stream->push(event);
    });
    return stream;
  }

  /**
   * @brief Streams every stored event matching filter, de-duplicated by event id.
   */
  auto all_events(const std::vector<std::string> &relays,
    const protocol::filter &filter,
    std::chrono::milliseconds timeout) -> std::shared_ptr<event_stream>
  {
    auto stream = std::make_shared<event_stream>(io_context_);
    auto seen = std::make_shared<std::unordered_set<std::string>>();

    start_query(relays, filter, timeout, stream, [stream, seen](const protocol::event_data &event) {
      if (not seen->insert(event.id).second) { return; }
      stream->push(event);
    });
    return stream;
  }

  /**
   * @brief Replaces the relay list.
   *
   * Connections to relays no longer listed are closed, listed relays are connected and every
   * open forward subscription is opened on the read relays that do not carry it yet.
   */
  auto switch_relays(nostr::relay_list next_relays) -> boost::asio::awaitable<void>
  {
    spdlog::debug("[relay_pool] Switching to {} relays", next_relays.size());
    relays_ = std::move(next_relays);

    for (auto iter = connections_.begin(); iter != connections_.end();) {
      if (relays_.contains(iter->first)) {
        ++iter;
        continue;
      }
      spdlog::debug("[relay_pool] Dropping relay {}", iter->first);
      iter->second->disconnect();
      iter = connections_.erase(iter);
    }

    std::vector<std::string> urls;
    for (const auto &[url, flags] : relays_) { urls.push_back(url); }

    co_await for_each_relay(urls, [self = this->shared_from_this()](std::string url) -> boost::asio::awaitable<void> {
      co_await self->connection_for(url)->connect(defaults::connect_timeout);
    });

    for (const auto &url : select_relays_by_usage(relays_, usage::read)) {
      auto connection = connection_for(url);
      if (connection->is_connected()) { reopen_forwards(connection); }
    }
  }

  /**
   * @brief Opens a realtime subscription on every connected read relay.
   */
  auto subscribe_forward(const protocol::filter &filter) -> forward_subscription
  {
    auto subscription_id = core::generate_subscription_id("forward");
    auto stream = std::make_shared<event_stream>(io_context_);
    forwards_[subscription_id] = forward_entry{ .filter = filter, .events = stream, .seen = {} };

    for (const auto &url : select_relays_by_usage(relays_, usage::read)) {
      auto connection = connection_for(url);
      if (connection->is_connected()) { open_forward(connection, subscription_id, filter); }
    }

    spdlog::debug("[relay_pool] Opened forward subscription {}", subscription_id);
    return forward_subscription{ .id = subscription_id, .events = stream };
  }

  auto unsubscribe(const std::string &subscription_id) -> void
  {
    auto iter = forwards_.find(subscription_id);
    if (iter == forwards_.end()) { return; }

    iter->second.events->finish();
    forwards_.erase(iter);
    for (auto &[url, connection] : connections_) { connection->close_subscription(subscription_id); }
    spdlog::debug("[relay_pool] Closed forward subscription {}", subscription_id);
  }

  /**
   * @brief Publishes a signed event to every write relay.
   */
  auto send(const protocol::event_data &event) -> void
  {
    const auto write_relays = select_relays_by_usage(relays_, usage::write);
    if (write_relays.empty()) {
      spdlog::warn("[relay_pool] No write relays, event {} not sent", event.id);
      return;
    }

    for (const auto &url : write_relays) {
      boost::asio::co_spawn(
        *io_context_,
        // NOLINTNEXTLINE(cppcoreguidelines-avoid-capturing-lambda-coroutines)
        [connection = connection_for(url), event]() -> boost::asio::awaitable<void> {
          if (not co_await connection->connect(defaults::connect_timeout)) {
            spdlog::warn("[relay_pool] Could not publish {} to {}", event.id, connection->url());
            co_return;
          }
          connection->publish(event);
        },
        boost::asio::detached);
    }
  }

  [[nodiscard]] auto relays() const -> const nostr::relay_list & { return relays_; }

  [[nodiscard]] auto connection_count() const -> std::size_t { return connections_.size(); }

private:
  struct forward_entry
  {
    protocol::filter filter;
    std::shared_ptr<event_stream> events;
    std::unordered_set<std::string> seen;
  };

  auto connection_for(const std::string &url) -> std::shared_ptr<connection_t>
  {
    auto iter = connections_.find(url);
    if (iter != connections_.end()) { return iter->second; }

    auto connection = std::make_shared<connection_t>(io_context_, url, stream_factory_(url));
    connection->on_drop([weak_self = this->weak_from_this(), url, dropped = connection.get()]() {
      if (auto self = weak_self.lock()) { self->handle_drop(url, dropped); }
    });
    connections_.emplace(url, connection);
    return connection;
  }

  [[nodiscard]] auto is_read_relay(const std::string &url) const -> bool
  {
    auto iter = relays_.find(url);
    return iter != relays_.end() and iter->second.read;
  }

  auto forget_connection(const std::string &url, const connection_t *connection) -> void
  {
    auto iter = connections_.find(url);
    if (iter != connections_.end() and iter->second.get() == connection) { connections_.erase(iter); }
  }

  /**
   * @brief Replaces a connection the relay dropped.
   *
   * The dropped stream is not reused; the next connection to the relay gets a fresh one.
   */
  auto handle_drop(const std::string &url, const connection_t *dropped) -> void
  {
    forget_connection(url, dropped);
    if (not is_read_relay(url)) {
      spdlog::debug("[relay_pool] Relay {} dropped the connection", url);
      return;
    }

    spdlog::info("[relay_pool] Read relay {} dropped the connection, reconnecting", url);
    boost::asio::co_spawn(*io_context_, reconnect(this->weak_from_this(), url), boost::asio::detached);
  }

  static auto reconnect(std::weak_ptr<relay_pool> weak_self, std::string url) -> boost::asio::awaitable<void>
  {
    auto delay = std::chrono::milliseconds{};
    if (auto self = weak_self.lock()) {
      delay = self->reconnect_delay_;
    } else {
      co_return;
    }

    boost::asio::steady_timer timer(co_await boost::asio::this_coro::executor);
    for (;;) {
      timer.expires_after(delay);
      boost::system::error_code wait_error;
      co_await timer.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, wait_error));

      auto self = weak_self.lock();
      if (not self or not self->is_read_relay(url)) { co_return; }

      auto connection = self->connection_for(url);
      if (co_await connection->connect(defaults::connect_timeout)) {
        spdlog::info("[relay_pool] Reconnected to {}", url);
        self->reopen_forwards(connection);
        co_return;
      }

      self->forget_connection(url, connection.get());
      delay = std::min(delay * 2, std::chrono::milliseconds(defaults::max_reconnect_delay));
      spdlog::debug("[relay_pool] Reconnecting to {} failed, retrying in {}ms", url, delay.count());
    }
  }

  auto reopen_forwards(const std::shared_ptr<connection_t> &connection) -> void
  {
    for (const auto &[subscription_id, subscription] : forwards_) {
      if (not connection->has_subscription(subscription_id)) {
        open_forward(connection, subscription_id, subscription.filter);
      }
    }
  }

  /**
   * @brief Runs task for every relay concurrently and completes when all have finished.
   *
   * A failing relay is logged and does not affect the others.
   */
  static auto for_each_relay(std::vector<std::string> relays,
    std::function<boost::asio::awaitable<void>(std::string)> task) -> boost::asio::awaitable<void>
  {
    std::vector<boost::asio::awaitable<void>> tasks;
    tasks.reserve(relays.size());
    for (auto &url : relays) { tasks.push_back(isolate_relay(task, std::move(url))); }
    co_await async::when_all(std::move(tasks));
  }

  static auto isolate_relay(std::function<boost::asio::awaitable<void>(std::string)> task, std::string url)
    -> boost::asio::awaitable<void>
  {
    try {
      co_await task(url);
    } catch (const std::exception &e) {
      spdlog::warn("[relay_pool] Relay {} failed: {}", url, e.what());
    }
  }

  auto start_query(const std::vector<std::string> &relays,
    const protocol::filter &filter,
    std::chrono::milliseconds timeout,
    std::shared_ptr<event_stream> stream,// NOLINT(performance-unnecessary-value-param)
    std::function<void(const protocol::event_data &)> on_event) -> void
  {
    boost::asio::co_spawn(
      *io_context_,
      run_query(this->shared_from_this(), relays, filter, timeout, std::move(stream), std::move(on_event)),
      boost::asio::detached);
  }

  static auto run_query(std::shared_ptr<relay_pool> self,
    std::vector<std::string> relays,
    protocol::filter filter,
    std::chrono::milliseconds timeout,
    std::shared_ptr<event_stream> stream,
    std::function<void(const protocol::event_data &)> on_event) -> boost::asio::awaitable<void>
  {
    co_await self->for_each_relay(
      relays, [self, filter, timeout, stream, on_event](std::string url) -> boost::asio::awaitable<void> {
        auto connection = self->connection_for(url);
        if (not co_await connection->connect(timeout)) {
          spdlog::debug("[relay_pool] Relay {} excluded from query", url);
          co_return;
        }

        const auto subscription_id = core::generate_subscription_id("query");
        connection->subscribe(subscription_id, filter, [stream, on_event](const protocol::event_data &event) {
          if (not stream->is_abandoned()) { on_event(event); }
        });
        std::ignore = co_await connection->wait_for_eose(subscription_id, self->eose_timeout_);
        connection->close_subscription(subscription_id);
      });

    spdlog::trace("[relay_pool] Query across {} relays finished", relays.size());
    stream->finish();
  }

  auto open_forward(const std::shared_ptr<connection_t> &connection,
    const std::string &subscription_id,
    const protocol::filter &filter) -> void
  {
    connection->subscribe(subscription_id,
      filter,
      [weak_self = this->weak_from_this(), subscription_id](const protocol::event_data &event) {
        auto self = weak_self.lock();
        if (not self) { return; }
        auto iter = self->forwards_.find(subscription_id);
        if (iter == self->forwards_.end()) { return; }
        if (not iter->second.seen.insert(event.id).second) { return; }
        iter->second.events->push(event);
      });
  }

  std::shared_ptr<boost::asio::io_context> io_context_;
  stream_factory_t stream_factory_;
  std::chrono::milliseconds eose_timeout_;
  std::chrono::milliseconds reconnect_delay_;
  nostr::relay_list relays_;
  std::map<std::string, std::shared_ptr<connection_t>> connections_;
  std::unordered_map<std::string, forward_entry> forwards_;
};

}// namespace status_feed::nostr
