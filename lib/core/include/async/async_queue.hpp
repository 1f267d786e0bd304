#pragma once

#include <boost/asio/awaitable.hpp>
#include <boost/asio/bind_cancellation_slot.hpp>
#include <boost/asio/cancellation_signal.hpp>
#include <boost/asio/experimental/channel.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <cstddef>
#include <memory>
#include <optional>

namespace status_feed::async {

/**
 * @brief Bounded FIFO between coroutines running on one io_context.
 *
 * @tparam T Element type
 *
 * Producers never suspend: push() drops the value when the buffer is full. Consumers suspend in
 * pop() until a value arrives, the queue is closed, or the bound cancellation slot fires. Not
 * thread-safe; every producer and consumer must run on the io_context given at construction.
 */
template<typename T> class async_queue
{
public:
  /// Default number of buffered elements
  static constexpr std::size_t default_capacity{ 4096 };

  explicit async_queue(const std::shared_ptr<boost::asio::io_context> &io_context,
    std::size_t capacity = default_capacity)
    : channel_(io_context->get_executor(), capacity)
  {}

  async_queue(const async_queue &) = delete;
  auto operator=(const async_queue &) -> async_queue & = delete;
  async_queue(async_queue &&) = delete;
  auto operator=(async_queue &&) -> async_queue & = delete;
  ~async_queue() = default;

  /**
   * @brief Buffers a value, or hands it straight to a waiting consumer.
   *
   * @return false if the queue is full or closed and the value was dropped
   */
  auto push(T value) -> bool
  {
    if (not channel_.try_send(boost::system::error_code{}, std::move(value))) { return false; }
    ++size_;
    return true;
  }

  /**
   * @brief Waits for the next value.
   *
   * @param cancel_slot Slot that aborts the wait, nullptr to wait until a value or close()
   * @return Awaitable yielding the oldest buffered value
   * @throws boost::system::system_error with operation_aborted on cancellation, or
   *         channel_closed once the queue is closed and empty
   */
  // NOLINTNEXTLINE(performance-unnecessary-value-param)
  auto pop(std::shared_ptr<boost::asio::cancellation_slot> cancel_slot = nullptr) -> boost::asio::awaitable<T>
  {
    const auto slot = cancel_slot ? *cancel_slot : boost::asio::cancellation_slot{};

    boost::system::error_code error;
    auto value = co_await channel_.async_receive(
      boost::asio::bind_cancellation_slot(slot, boost::asio::redirect_error(boost::asio::use_awaitable, error)));
    if (error) { throw boost::system::system_error(error); }

    --size_;
    co_return value;
  }

  /// Takes the oldest value if one is buffered
  auto try_pop() -> std::optional<T>
  {
    std::optional<T> value;
    const bool received = channel_.try_receive(
      [&value](boost::system::error_code /*ec*/, T rx_value) { value.emplace(std::move(rx_value)); });
    if (not received) { return std::nullopt; }

    --size_;
    return value;
  }

  /**
   * @brief Discards every buffered value.
   *
   * @return Number of values discarded
   */
  auto clear() -> std::size_t
  {
    std::size_t discarded = 0;
    while (try_pop()) { ++discarded; }
    return discarded;
  }

  [[nodiscard]] auto empty() const -> bool { return size_ == 0; }

  [[nodiscard]] auto size() const -> std::size_t { return size_; }

  [[nodiscard]] auto is_closed() const -> bool { return not channel_.is_open(); }

  /// Pending and later pops fail with channel_closed; later pushes are dropped
  auto close() -> void { channel_.close(); }

private:
  boost::asio::experimental::channel<void(boost::system::error_code, T)> channel_;
  std::size_t size_{ 0 };
};

}// namespace status_feed::async
