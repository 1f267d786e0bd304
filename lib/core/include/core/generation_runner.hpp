#pragma once

#include <boost/asio/awaitable.hpp>
#include <boost/asio/cancellation_signal.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/experimental/channel_error.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <cstdint>
#include <functional>
#include <memory>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>
#include <utility>

namespace status_feed::core {

/**
 * @brief Returns true for the error codes a cancelled coroutine exits with.
 */
[[nodiscard]] inline auto is_cancellation(const boost::system::error_code &error_code) -> bool
{
  return error_code == boost::asio::error::operation_aborted
         or error_code == boost::asio::experimental::error::channel_cancelled
         or error_code == boost::asio::experimental::error::channel_closed;
}

/**
 * @brief Tracks the lifecycle state of a spawned coroutine.
 */
struct coroutine_state
{
  bool started{ false };///< True when coroutine has started execution
  bool done{ false };///< True when coroutine has completed
  std::shared_ptr<boost::asio::steady_timer> teardown;///< Cancelled once the coroutine has completed
};

/**
 * @brief Runs one restartable unit of work at a time, one generation per start.
 *
 * restart() cancels the running generation through its cancellation signal, waits until that
 * coroutine has fully unwound, then spawns the new work with a fresh generation number and
 * cancellation slot. Work compares its generation against is_current() before applying results so
 * anything produced by a superseded generation is discarded.
 *
 * Calls to restart() and stop() must not overlap.
 */
class generation_runner
{
public:
  using work_t =
    std::function<boost::asio::awaitable<void>(std::uint64_t, std::shared_ptr<boost::asio::cancellation_slot>)>;

  generation_runner(const std::shared_ptr<boost::asio::io_context> &io_context, std::string name)
    : io_context_(io_context), name_(std::move(name))
  {}

  generation_runner(const generation_runner &) = delete;
  auto operator=(const generation_runner &) -> generation_runner & = delete;
  generation_runner(generation_runner &&) = delete;
  auto operator=(generation_runner &&) -> generation_runner & = delete;

  ~generation_runner()
  {
    if (signal_) { signal_->emit(boost::asio::cancellation_type::all); }
  }

  /**
   * @brief Stops the current generation and starts a new one running work.
   *
   * @param work Coroutine factory receiving the generation number and its cancellation slot
   * @return Awaitable yielding the new generation number
   */
  auto restart(work_t work) -> boost::asio::awaitable<std::uint64_t>
  {
    co_await stop();

    const auto generation = generation_;
    auto signal = std::make_shared<boost::asio::cancellation_signal>();
    auto slot = std::make_shared<boost::asio::cancellation_slot>(signal->slot());
    auto state = std::make_shared<coroutine_state>();
    state->teardown = std::make_shared<boost::asio::steady_timer>(*io_context_, boost::asio::steady_timer::time_point::max());

    signal_ = signal;
    state_ = state;

    spdlog::debug("[{}] Starting generation {}", name_, generation);
    boost::asio::co_spawn(*io_context_,
      run_generation(std::move(work), generation, signal, std::move(slot), state, name_),
      boost::asio::detached);

    co_return generation;
  }

  /**
   * @brief Cancels the current generation and waits for its teardown.
   *
   * The generation number advances even when nothing is running, so results from any earlier
   * generation are rejected afterwards.
   */
  auto stop() -> boost::asio::awaitable<void>
  {
    ++generation_;

    auto state = std::exchange(state_, nullptr);
    auto signal = std::exchange(signal_, nullptr);
    if (not state or state->done) { co_return; }

    spdlog::debug("[{}] Cancelling running generation", name_);
    signal->emit(boost::asio::cancellation_type::all);

    boost::system::error_code error_code;
    co_await state->teardown->async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, error_code));
    spdlog::trace("[{}] Previous generation torn down", name_);
  }

  [[nodiscard]] auto generation() const -> std::uint64_t { return generation_; }

  [[nodiscard]] auto is_current(std::uint64_t generation) const -> bool { return generation == generation_; }

  [[nodiscard]] auto is_running() const -> bool { return state_ and not state_->done; }

private:
  static auto run_generation(work_t work,
    std::uint64_t generation,
    std::shared_ptr<boost::asio::cancellation_signal> signal,// NOLINT(performance-unnecessary-value-param)
    std::shared_ptr<boost::asio::cancellation_slot> cancel_slot,
    std::shared_ptr<coroutine_state> state,
    std::string name) -> boost::asio::awaitable<void>
  {
    state->started = true;
    spdlog::trace("[{}] Coroutine started", name);
    try {
      co_await work(generation, cancel_slot);
    } catch (const boost::system::system_error &err) {
      if (is_cancellation(err.code())) {
        spdlog::debug("[{}] Generation {} cancelled", name, generation);
      } else {
        spdlog::error("[{}] Unexpected error in generation {}: {}", name, generation, err.what());
      }
    } catch (const std::exception &err) {
      spdlog::error("[{}] Unknown exception in generation {}: {}", name, generation, err.what());
    }
    state->done = true;
    state->teardown->cancel();
    signal.reset();
    spdlog::trace("[{}] Coroutine exiting", name);
  }

  std::shared_ptr<boost::asio::io_context> io_context_;
  std::string name_;
  std::uint64_t generation_{ 0 };
  std::shared_ptr<boost::asio::cancellation_signal> signal_;
  std::shared_ptr<coroutine_state> state_;
};

}// namespace status_feed::core
