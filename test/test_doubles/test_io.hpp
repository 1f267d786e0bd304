#pragma once

#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <chrono>
#include <exception>
#include <functional>
#include <memory>

namespace status_feed::test {

/**
 * @brief Spawns a coroutine whose exceptions escape from io_context::run().
 */
inline auto spawn(const std::shared_ptr<boost::asio::io_context> &io_context, boost::asio::awaitable<void> work) -> void
{
  boost::asio::co_spawn(*io_context, std::move(work), [](const std::exception_ptr &error) {
    if (error) { std::rethrow_exception(error); }
  });
}

/**
 * @brief Runs the io_context until the predicate holds or the timeout passes.
 *
 * @return Final value of the predicate
 */
inline auto run_until(const std::shared_ptr<boost::asio::io_context> &io_context,
  const std::function<bool()> &done,
  std::chrono::milliseconds timeout = std::chrono::seconds(2)) -> bool
{
  constexpr auto step = std::chrono::milliseconds(5);
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (not done() and std::chrono::steady_clock::now() < deadline) {
    if (io_context->stopped()) { io_context->restart(); }
    io_context->run_for(step);
  }
  return done();
}

/// Runs whatever is ready without waiting for timers
inline auto drain(const std::shared_ptr<boost::asio::io_context> &io_context) -> void
{
  if (io_context->stopped()) { io_context->restart(); }
  io_context->poll();
}

}// namespace status_feed::test
