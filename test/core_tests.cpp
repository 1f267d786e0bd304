#include <boost/asio/awaitable.hpp>
#include <boost/asio/bind_cancellation_slot.hpp>
#include <boost/asio/cancellation_signal.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <functional>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include <core/generation_runner.hpp>
#include <core/snapshot.hpp>
#include <core/id_generator.hpp>

SCENARIO("snapshot publishes complete values", "[core][snapshot]")
{
  GIVEN("A snapshot with an observer")
  {
    status_feed::core::snapshot<std::map<std::string, int>> counts;
    std::vector<std::size_t> seen_sizes;
    const auto observer = counts.subscribe(
      [&seen_sizes](const std::map<std::string, int> &value) { seen_sizes.push_back(value.size()); });

    WHEN("a reader holds the old value while a new one is published")
    {
      auto before = counts.get();
      counts.update([](std::map<std::string, int> &value) { value["a"] = 1; });

      THEN("the old copy is untouched and the observer sees the new value")
      {
        REQUIRE(before->empty());
        REQUIRE(counts.get()->at("a") == 1);
        REQUIRE(counts.version() == 1);
        REQUIRE(seen_sizes == std::vector<std::size_t>{ 1 });
      }
    }

    WHEN("the observer unsubscribes")
    {
      counts.unsubscribe(observer);
      counts.publish({ { "a", 1 }, { "b", 2 } });

      THEN("it is no longer called")
      {
        REQUIRE(seen_sizes.empty());
        REQUIRE(counts.observer_count() == 0);
      }
    }
  }
}

SCENARIO("selector notifies only when the derived value changes", "[core][selector]")
{
  GIVEN("A selector over one key compared by its first character")
  {
    status_feed::core::snapshot<std::map<std::string, std::string>> names;
    auto selector = std::make_unique<status_feed::core::selector<std::map<std::string, std::string>, std::string>>(
      names,
      [](const std::map<std::string, std::string> &value) {
        auto iter = value.find("alice");
        return iter == value.end() ? std::string{} : iter->second;
      },
      [](const std::string &lhs, const std::string &rhs) { return lhs.substr(0, 1) == rhs.substr(0, 1); });

    int notifications = 0;
    selector->on_change([&notifications](const std::string &) { ++notifications; });

    WHEN("other keys change")
    {
      names.publish({ { "bob", "B" } });

      THEN("nothing is reported") { REQUIRE(notifications == 0); }
    }

    WHEN("the key changes in a way the predicate ignores, then in a way it sees")
    {
      names.publish({ { "alice", "Ann" } });
      names.publish({ { "alice", "Anna" } });
      names.publish({ { "alice", "Beth" } });

      THEN("two changes are reported")
      {
        REQUIRE(notifications == 2);
        REQUIRE(selector->change_count() == 2);
        REQUIRE(selector->get() == "Beth");
      }
    }

    WHEN("the selector is destroyed")
    {
      selector.reset();

      THEN("it unsubscribes from the snapshot") { REQUIRE(names.observer_count() == 0); }
    }
  }
}

namespace {

auto wait_forever(std::shared_ptr<std::vector<std::uint64_t>> finished,
  std::uint64_t generation,
  std::shared_ptr<boost::asio::cancellation_slot> cancel_slot) -> boost::asio::awaitable<void>
{
  boost::asio::steady_timer timer(co_await boost::asio::this_coro::executor, std::chrono::hours(1));
  co_await timer.async_wait(boost::asio::bind_cancellation_slot(*cancel_slot, boost::asio::use_awaitable));
  finished->push_back(generation);
}

}// namespace

SCENARIO("generation_runner cancels the previous generation before starting the next", "[core][generation_runner]")
{
  GIVEN("A runner")
  {
    auto io_context = std::make_shared<boost::asio::io_context>();
    status_feed::core::generation_runner runner(io_context, "test_runner");
    auto finished = std::make_shared<std::vector<std::uint64_t>>();
    auto generations = std::make_shared<std::vector<std::uint64_t>>();

    const status_feed::core::generation_runner::work_t work =
      [finished](std::uint64_t generation, std::shared_ptr<boost::asio::cancellation_slot> cancel_slot) {
        return wait_forever(finished, generation, std::move(cancel_slot));
      };

    WHEN("it is restarted twice")
    {
      boost::asio::co_spawn(
        *io_context,
        [](std::reference_wrapper<status_feed::core::generation_runner> runner_ref,
          status_feed::core::generation_runner::work_t task,
          std::shared_ptr<std::vector<std::uint64_t>> generations_ptr) -> boost::asio::awaitable<void> {
          generations_ptr->push_back(co_await runner_ref.get().restart(task));
          generations_ptr->push_back(co_await runner_ref.get().restart(task));
        }(std::ref(runner), work, generations),
        boost::asio::detached);

      io_context->run_for(std::chrono::milliseconds(100));

      THEN("each restart mints a new generation and only the latest one is running")
      {
        REQUIRE(generations->size() == 2);
        REQUIRE(generations->at(1) > generations->at(0));
        REQUIRE(runner.is_current(generations->at(1)));
        REQUIRE_FALSE(runner.is_current(generations->at(0)));
        REQUIRE(runner.is_running());
        REQUIRE(finished->empty());
      }
    }

    WHEN("it is stopped")
    {
      boost::asio::co_spawn(
        *io_context,
        [](std::reference_wrapper<status_feed::core::generation_runner> runner_ref,
          status_feed::core::generation_runner::work_t task) -> boost::asio::awaitable<void> {
          co_await runner_ref.get().restart(task);
          co_await runner_ref.get().stop();
        }(std::ref(runner), work),
        boost::asio::detached);

      io_context->run_for(std::chrono::milliseconds(100));

      THEN("the work unwinds and nothing is running")
      {
        REQUIRE_FALSE(runner.is_running());
        REQUIRE(finished->empty());
        REQUIRE(runner.generation() == 2);
      }
    }
  }
}

TEST_CASE("is_cancellation recognises cancellation codes", "[core][generation_runner]")
{
  CHECK(status_feed::core::is_cancellation(boost::asio::error::operation_aborted));
  CHECK(status_feed::core::is_cancellation(boost::asio::experimental::error::channel_cancelled));
  CHECK_FALSE(status_feed::core::is_cancellation(boost::asio::error::connection_reset));
  CHECK_FALSE(status_feed::core::is_cancellation(boost::system::error_code{}));
}

TEST_CASE("generate_uuid produces distinct ids", "[core][id_generator]")
{
  const auto first = status_feed::core::generate_uuid();
  const auto second = status_feed::core::generate_uuid();

  CHECK(first.size() == 36);
  CHECK(first != second);
}

TEST_CASE("generate_subscription_id stays within the relay limit", "[core][id_generator]")
{
  const auto forward = status_feed::core::generate_subscription_id("forward");
  CHECK(forward.starts_with("forward-"));
  CHECK(forward.size() == 8 + 32);
  CHECK(forward.find('-', 8) == std::string::npos);
  CHECK(forward != status_feed::core::generate_subscription_id("forward"));

  const auto long_purpose = status_feed::core::generate_subscription_id(std::string(100, 'x'));
  CHECK(long_purpose.size() == 64);
}
