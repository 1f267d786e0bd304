#pragma once

#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <cstddef>
#include <exception>
#include <memory>
#include <vector>

namespace status_feed::async {

/**
 * @brief Runs coroutines concurrently and waits until every one has completed.
 *
 * @param tasks Coroutines to run on the current executor
 * @return Awaitable completing after the last task
 * @throws The first exception thrown by any task, after all tasks completed
 */
inline auto when_all(std::vector<boost::asio::awaitable<void>> tasks) -> boost::asio::awaitable<void>
{
  if (tasks.empty()) { co_return; }

  auto executor = co_await boost::asio::this_coro::executor;
  auto remaining = std::make_shared<std::size_t>(tasks.size());
  auto first_error = std::make_shared<std::exception_ptr>();
  auto all_done = std::make_shared<boost::asio::steady_timer>(executor, boost::asio::steady_timer::time_point::max());

  for (auto &task : tasks) {
    boost::asio::co_spawn(executor, std::move(task), [remaining, first_error, all_done](const std::exception_ptr &error) {
      if (error and not *first_error) { *first_error = error; }
      if (--(*remaining) == 0) { all_done->cancel(); }
    });
  }

  boost::system::error_code error_code;
  co_await all_done->async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, error_code));

  if (*first_error) { std::rethrow_exception(*first_error); }
}

}// namespace status_feed::async
