#pragma once

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <chrono>
#include <concepts/websocket_stream.hpp>
#include <cstdint>
#include <functional>
#include <memory>
#include <nlohmann/json.hpp>
#include <nostr/protocol.hpp>
#include <nostr/request_tracker.hpp>
#include <optional>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string>
#include <transport/websocket_stream.hpp>
#include <tuple>
#include <unordered_map>

namespace status_feed::nostr {

/**
 * @brief One WebSocket connection to a Nostr relay.
 *
 * Owns the read loop for the relay, routes EVENT messages to the handler registered for their
 * subscription, and resolves EOSE and OK responses through its request tracker.
 */
template<concepts::websocket_stream WebSocketStream>
class relay_connection : public std::enable_shared_from_this<relay_connection<WebSocketStream>>
{
public:
  using event_handler_t = std::function<void(const protocol::event_data &)>;
  using drop_handler_t = std::function<void()>;

  enum class state : std::uint8_t { disconnected, connecting, connected };

  /// Time to wait for OK after publishing
  static constexpr std::chrono::seconds publish_timeout{ 15 };

  relay_connection(const std::shared_ptr<boost::asio::io_context> &io_context,
    std::string url,
    const std::shared_ptr<WebSocketStream> &stream)
    : io_context_(io_context), url_(std::move(url)), stream_(stream), tracker_(io_context)
  {}

  relay_connection(const relay_connection &) = delete;
  auto operator=(const relay_connection &) -> relay_connection & = delete;
  relay_connection(relay_connection &&) = delete;
  auto operator=(relay_connection &&) -> relay_connection & = delete;
  ~relay_connection() = default;

  [[nodiscard]] auto url() const -> const std::string & { return url_; }
  [[nodiscard]] auto is_connected() const -> bool { return state_ == state::connected; }
  [[nodiscard]] auto has_subscription(const std::string &subscription_id) const -> bool
  {
    return subscriptions_.contains(subscription_id);
  }

  /**
   * @brief Registers the handler called when the relay ends a live connection.
   *
   * Not called for a disconnect() requested locally. Subscriptions are forgotten by then.
   */
  auto on_drop(drop_handler_t handler) -> void { on_drop_ = std::move(handler); }

  /**
   * @brief Connects if not connected yet.
   *
   * Concurrent callers share one connection attempt.
   *
   * @param timeout Connection timeout; a relay that does not connect in time is left disconnected
   * @return Awaitable yielding true once connected
   */
  auto connect(std::chrono::milliseconds timeout) -> boost::asio::awaitable<bool>
  {
    if (state_ == state::connected) { co_return true; }

    boost::system::error_code wait_error;
    if (state_ == state::connecting) {
      auto pending = connect_done_;
      co_await pending->async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, wait_error));
      co_return state_ == state::connected;
    }

    auto endpoint = transport::parse_websocket_url(url_);
    if (not endpoint) {
      spdlog::warn("[relay_connection] Unsupported relay URL (only wss:// is supported): {}", url_);
      co_return false;
    }
    endpoint_ = std::move(*endpoint);

    state_ = state::connecting;
    auto done = std::make_shared<boost::asio::steady_timer>(*io_context_, boost::asio::steady_timer::time_point::max());
    auto result = std::make_shared<std::optional<boost::system::error_code>>();
    connect_done_ = done;

    stream_->async_connect({ .host = endpoint_.host, .port = endpoint_.port, .path = endpoint_.path },
      [self = this->shared_from_this(), done, result](const boost::system::error_code &error_code, std::size_t) {
        if (result->has_value()) {
          // Completed after the timeout; the attempt was already abandoned
          if (not error_code) {
            self->stream_->async_close([](const boost::system::error_code &, std::size_t) {});
          }
          return;
        }
        *result = error_code;
        done->cancel();
      });

    boost::asio::steady_timer timeout_timer(*io_context_, timeout);
    timeout_timer.async_wait([done, result](const boost::system::error_code &error_code) {
      if (error_code or result->has_value()) { return; }
      *result = boost::asio::error::timed_out;
      done->cancel();
    });

    co_await done->async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, wait_error));
    timeout_timer.cancel();

    if (connect_done_ == done) { connect_done_.reset(); }

    const auto connect_error = result->value_or(boost::asio::error::timed_out);
    if (connect_error) {
      spdlog::debug("[relay_connection] Connecting to {} failed: {}", url_, connect_error.message());
      state_ = state::disconnected;
      co_return false;
    }

    spdlog::debug("[relay_connection] Connected to {}", url_);
    state_ = state::connected;
    start_read();
    co_return true;
  }

  /**
   * @brief Sends a REQ and routes matching events to on_event.
   *
   * @param subscription_id Subscription id, at most 64 characters
   * @param filter Subscription filter
   * @param on_event Called for every EVENT received for this subscription
   */
  auto subscribe(const std::string &subscription_id, const protocol::filter &filter, event_handler_t on_event) -> void
  {
    protocol::validate_subscription_id(subscription_id);
    subscriptions_[subscription_id] = std::move(on_event);
    send_raw(protocol::req{ .subscription_id = subscription_id, .filters = filter.to_json() }.serialize());
  }

  /**
   * @brief Waits until the relay has sent every stored event for a subscription.
   *
   * @param subscription_id Subscription opened with subscribe()
   * @param timeout Maximum wait
   * @return Awaitable yielding false if the relay timed out or disconnected first
   */
  auto wait_for_eose(std::string subscription_id, std::chrono::milliseconds timeout) -> boost::asio::awaitable<bool>
  {
    try {
      std::ignore = co_await tracker_.template async_track<protocol::eose>(subscription_id, timeout);
      co_return true;
    } catch (const std::runtime_error &e) {
      spdlog::debug("[relay_connection] No EOSE from {} for {}: {}", url_, subscription_id, e.what());
      co_return false;
    }
  }

  auto close_subscription(const std::string &subscription_id) -> void
  {
    if (subscriptions_.erase(subscription_id) == 0) { return; }
    if (state_ == state::connected) { send_raw(protocol::close{ .subscription_id = subscription_id }.serialize()); }
  }

  /**
   * @brief Publishes a signed event and logs the relay's verdict.
   */
  auto publish(const protocol::event_data &event) -> void
  {
    tracker_.track(
      event.id,
      [url = url_](const protocol::ok &response) {
        if (response.accepted) {
          spdlog::debug("[relay_connection] {} accepted event {}", url, response.event_id);
        } else {
          spdlog::warn("[relay_connection] {} rejected event {}: {}", url, response.event_id, response.message);
        }
      },
      publish_timeout);
    send_raw(protocol::event::from_event_data(event).serialize());
  }

  auto disconnect() -> void
  {
    subscriptions_.clear();
    tracker_.cancel_all_pending();
    if (state_ != state::connected) { return; }

    state_ = state::disconnected;
    stream_->async_close([url = url_](const boost::system::error_code &error, std::size_t) {
      if (error) { spdlog::debug("[relay_connection] Closing {} failed: {}", url, error.message()); }
    });
  }

private:
  auto send_raw(const std::string &message) -> void
  {
    if (state_ != state::connected) {
      spdlog::debug("[relay_connection] Not connected to {}, dropping message", url_);
      return;
    }

    spdlog::trace("[relay_connection] -> {}: {}", url_, message);
    stream_->async_write(message, [url = url_](const boost::system::error_code &error, std::size_t) {
      if (error) { spdlog::warn("[relay_connection] Write to {} failed: {}", url, error.message()); }
    });
  }

  auto start_read() -> void
  {
    stream_->async_read([self = this->shared_from_this()](const boost::system::error_code &error, std::string message) {
      self->process_read(error, std::move(message));
    });
  }

  auto process_read(const boost::system::error_code &error, std::string message) -> void
  {
    if (error) {
      const auto dropped = state_ == state::connected;
      if (dropped) {
        spdlog::debug("[relay_connection] Read from {} ended: {}", url_, error.message());
        state_ = state::disconnected;
        subscriptions_.clear();
      }
      tracker_.cancel_all_pending();
      if (dropped and on_drop_) { on_drop_(); }
      return;
    }

    dispatch(message);
    if (state_ == state::connected) { start_read(); }
  }

  auto dispatch(const std::string &message) -> void
  {
    auto json = nlohmann::json::parse(message, nullptr, false);
    if (json.is_discarded() or not json.is_array() or json.empty() or not json[0].is_string()) {
      spdlog::trace("[relay_connection] Ignoring malformed message from {}", url_);
      return;
    }

    const auto type = json[0].get<std::string>();
    if (type == "EVENT") {
      auto evt = protocol::event::deserialize(message);
      if (not evt) { return; }
      auto iter = subscriptions_.find(evt->subscription_id);
      if (iter != subscriptions_.end()) { iter->second(evt->data); }
    } else if (type == "EOSE") {
      if (auto eose = protocol::eose::deserialize(message)) { tracker_.resolve(eose->subscription_id, *eose); }
    } else if (type == "CLOSED") {
      if (auto closed = protocol::closed::deserialize(message)) {
        spdlog::debug("[relay_connection] {} closed {}: {}", url_, closed->subscription_id, closed->message);
        subscriptions_.erase(closed->subscription_id);
        tracker_.resolve(closed->subscription_id, protocol::eose{ .subscription_id = closed->subscription_id });
      }
    } else if (type == "OK") {
      if (auto response = protocol::ok::deserialize(message)) { tracker_.resolve(response->event_id, *response); }
    } else if (type == "NOTICE") {
      if (auto notice = protocol::notice::deserialize(message)) {
        spdlog::info("[relay_connection] Notice from {}: {}", url_, notice->message);
      }
    } else {
      spdlog::trace("[relay_connection] Unhandled message type {} from {}", type, url_);
    }
  }

  std::shared_ptr<boost::asio::io_context> io_context_;
  std::string url_;
  std::shared_ptr<WebSocketStream> stream_;
  request_tracker tracker_;
  transport::websocket_endpoint endpoint_;
  state state_{ state::disconnected };
  std::shared_ptr<boost::asio::steady_timer> connect_done_;
  std::unordered_map<std::string, event_handler_t> subscriptions_;
  drop_handler_t on_drop_;
};

}// namespace status_feed::nostr
