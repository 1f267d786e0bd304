#pragma once

#include <any>
#include <boost/asio.hpp>
#include <chrono>
#include <concepts/request_tracker.hpp>
#include <cstddef>
#include <functional>
#include <memory>
#include <nostr/protocol.hpp>
#include <string>
#include <unordered_map>

namespace status_feed::nostr {

/**
 * @brief Tracks pending Nostr requests and matches them with relay responses.
 *
 * Published events are keyed by event id and resolved by OK; subscriptions are keyed by
 * subscription id and resolved by EOSE. Requests without a response within their timeout are
 * completed as failed.
 */
class request_tracker
{
private:
  /// Internal structure for pending request state
  struct pending_request
  {
    std::function<void(const std::any &)> callback;///< Response callback
    std::shared_ptr<boost::asio::steady_timer> timer;///< Timeout timer
  };

public:
  /**
   * @brief Constructs a request tracker.
   *
   * @param io_context Boost.Asio io_context for timers
   */
  explicit request_tracker(const std::shared_ptr<boost::asio::io_context> &io_context) : io_context_(io_context) {}

  request_tracker(const request_tracker &) = delete;
  auto operator=(const request_tracker &) -> request_tracker & = delete;
  request_tracker(request_tracker &&) = delete;
  auto operator=(request_tracker &&) -> request_tracker & = delete;
  ~request_tracker() { cancel_all_pending(); }

  /**
   * @brief Tracks a published event with callback-based completion.
   *
   * @param event_id Event ID to track
   * @param callback Called with the relay's OK, or with a rejected OK on timeout
   * @param timeout Maximum time to wait for the OK
   */
  auto track(const std::string &event_id,
    std::function<void(const protocol::ok &)> callback,
    std::chrono::milliseconds timeout) -> void
  {
    auto timer = std::make_shared<boost::asio::steady_timer>(*io_context_, timeout);

    timer->async_wait([this, event_id, timer](const boost::system::error_code &error) {
      if (not error) { handle_timeout(event_id, timer); }
    });

    pending_[event_id] = pending_request{ .callback =
                                            [callback = std::move(callback)](const std::any &response_any) {
                                              callback(std::any_cast<const protocol::ok &>(response_any));
                                            },
      .timer = timer };
  }

  /**
   * @brief Checks if a request key has a pending request.
   *
   * @param key Event ID or subscription ID
   * @return true if pending, false otherwise
   */
  [[nodiscard]] auto has_pending(const std::string &key) const -> bool { return pending_.contains(key); }

  [[nodiscard]] auto pending_count() const -> std::size_t { return pending_.size(); }

  /**
   * @brief Cancels all pending requests without invoking their callbacks.
   *
   * Coroutines waiting in async_track() complete with a timeout error.
   */
  auto cancel_all_pending() -> void
  {
    auto pending = std::move(pending_);
    pending_.clear();
    for (auto &[key, request] : pending) { request.timer->cancel(); }
  }

  /**
   * @brief Resolves a pending request with a response.
   *
   * @tparam ResponseType Type of response (ok or eose)
   * @param key Event ID or subscription ID to resolve
   * @param response Response data
   */
  template<typename ResponseType> auto resolve(const std::string &key, const ResponseType &response) -> void
  {
    auto iter = pending_.find(key);
    if (iter != pending_.end()) {
      auto request = std::move(iter->second);
      pending_.erase(iter);
      request.timer->cancel();
      request.callback(response);
    }
  }

  /**
   * @brief Tracks a request with coroutine-based completion.
   *
   * @tparam ResponseType Type of response to await (ok or eose)
   * @param key Event ID or subscription ID to track
   * @param timeout Maximum time to wait for response
   * @return Awaitable that yields the response
   * @throws std::runtime_error on timeout or when the tracker is cancelled
   */
  template<typename ResponseType = protocol::ok>
  [[nodiscard]] auto async_track(std::string key, std::chrono::milliseconds timeout)
    -> boost::asio::awaitable<ResponseType>
  {
    auto executor = co_await boost::asio::this_coro::executor;
    auto timeout_timer = std::make_shared<boost::asio::steady_timer>(executor, timeout);
    auto result = std::make_shared<ResponseType>();
    auto event_done = std::make_shared<bool>(false);

    pending_[key] = pending_request{ .callback =
                                       [result, event_done](const std::any &response_any) {
                                         *result = std::any_cast<ResponseType>(response_any);
                                         *event_done = true;
                                       },
      .timer = timeout_timer };

    boost::system::error_code error_code;
    co_await timeout_timer->async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, error_code));

    auto iter = pending_.find(key);
    if (iter != pending_.end() and iter->second.timer == timeout_timer) { pending_.erase(iter); }

    if (*event_done) { co_return *result; }

    throw std::runtime_error("Request timeout");
  }

private:
  /**
   * @brief Handles timeout for a callback-tracked request.
   *
   * @param event_id Event ID that timed out
   * @param timer Timer that fired, ignored if the key was tracked again since
   */
  auto handle_timeout(const std::string &event_id, const std::shared_ptr<boost::asio::steady_timer> &timer) -> void
  {
    auto iter = pending_.find(event_id);
    if (iter != pending_.end() and iter->second.timer == timer) {
      auto request = std::move(iter->second);
      pending_.erase(iter);

      protocol::ok timeout_response;
      timeout_response.event_id = event_id;
      timeout_response.accepted = false;
      timeout_response.message = "Request timeout";

      request.callback(timeout_response);
    }
  }

  std::shared_ptr<boost::asio::io_context> io_context_;
  std::unordered_map<std::string, pending_request> pending_;
};

static_assert(concepts::request_tracker<request_tracker>);

}// namespace status_feed::nostr
