#pragma once

#include <async/async_queue.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/cancellation_signal.hpp>
#include <boost/asio/io_context.hpp>
#include <memory>
#include <nostr/protocol.hpp>
#include <optional>
#include <spdlog/spdlog.h>
#include <string>
#include <tuple>

namespace status_feed::nostr {

/**
 * @brief Single-consumer stream of events produced by a relay query.
 *
 * Producers push events and call finish() once every relay is exhausted. The consumer pulls with
 * next(), which yields std::nullopt at the end of the stream. A consumer that stops early calls
 * abandon(), after which pushes are dropped.
 */
class event_stream
{
public:
  explicit event_stream(const std::shared_ptr<boost::asio::io_context> &io_context) : queue_(io_context) {}

  auto push(protocol::event_data event) -> void
  {
    if (finished_ or abandoned_) { return; }
    if (not queue_.push(std::move(event))) { spdlog::warn("[event_stream] Stream buffer full, dropping event"); }
  }

  auto finish() -> void
  {
    if (finished_) { return; }
    finished_ = true;
    if (not abandoned_) { std::ignore = queue_.push(std::nullopt); }
  }

  /**
   * @brief Waits for the next event.
   *
   * @param cancel_slot Optional cancellation slot
   * @return Next event, std::nullopt once the stream is finished
   * @throws boost::system::system_error when cancelled
   */
  // NOLINTNEXTLINE(performance-unnecessary-value-param)
  auto next(std::shared_ptr<boost::asio::cancellation_slot> cancel_slot = nullptr)
    -> boost::asio::awaitable<std::optional<protocol::event_data>>
  {
    if (drained_) { co_return std::nullopt; }
    auto item = co_await queue_.pop(cancel_slot);
    if (not item) { drained_ = true; }
    co_return item;
  }

  auto abandon() -> void
  {
    abandoned_ = true;
    const auto dropped = queue_.clear();
    if (dropped > 0) { spdlog::trace("[event_stream] Abandoned with {} unread events", dropped); }
  }

  [[nodiscard]] auto is_finished() const -> bool { return finished_; }
  [[nodiscard]] auto is_abandoned() const -> bool { return abandoned_; }

private:
  async::async_queue<std::optional<protocol::event_data>> queue_;
  bool finished_{ false };
  bool abandoned_{ false };
  bool drained_{ false };
};

/**
 * @brief Handle of an open realtime subscription.
 */
struct forward_subscription
{
  std::string id;///< Subscription id, passed back to unsubscribe()
  std::shared_ptr<event_stream> events;///< Events received after the subscription was opened
};

}// namespace status_feed::nostr
