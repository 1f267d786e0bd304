#include <boost/asio/io_context.hpp>
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <sync/profile_sync_worker.hpp>
#include <sync/status_store.hpp>
#include <sync/status_sync_worker.hpp>
#include <sync/sync_target.hpp>

#include "test_doubles/test_double_event_verifier.hpp"
#include "test_doubles/test_double_relay_client.hpp"
#include "test_doubles/test_event_factory.hpp"
#include "test_doubles/test_io.hpp"

using status_feed::test::make_status_event;
using status_feed::test::pubkey_of;
using status_feed::test::test_double_event_verifier;
using status_feed::test::test_double_relay_client;

namespace {

constexpr std::uint64_t fixed_now = 120;

auto target_of(std::vector<std::string> followings) -> status_feed::sync::sync_target
{
  return status_feed::sync::sync_target{ .followings = std::move(followings),
    .relays = { { "wss://read.example", { .read = true, .write = false } },
      { "wss://write.example", { .read = false, .write = true } } } };
}

struct status_worker_fixture
{
  using worker_t = status_feed::sync::status_sync_worker<test_double_relay_client, test_double_event_verifier>;

  std::shared_ptr<boost::asio::io_context> io_context = std::make_shared<boost::asio::io_context>();
  std::shared_ptr<test_double_relay_client> client = std::make_shared<test_double_relay_client>(io_context);
  std::shared_ptr<status_feed::sync::status_store> store =
    std::make_shared<status_feed::sync::status_store>(io_context, []() { return fixed_now; });
  std::shared_ptr<test_double_event_verifier> verifier = std::make_shared<test_double_event_verifier>();
  std::shared_ptr<worker_t> worker = std::make_shared<worker_t>(
    io_context, client, store, verifier, std::chrono::milliseconds(100), []() { return fixed_now; });

  auto restart(std::optional<status_feed::sync::sync_target> target) -> void
  {
    status_feed::test::spawn(io_context, worker->restart(std::move(target)));
  }

  auto wait_for_state(worker_t::state wanted) -> bool
  {
    return status_feed::test::run_until(io_context, [this, wanted]() { return worker->current_state() == wanted; });
  }

  [[nodiscard]] auto general_of(const std::string &pubkey) const -> std::optional<std::string>
  {
    const auto statuses = store->current();
    auto iter = statuses->find(pubkey);
    if (iter == statuses->end() or not iter->second.general) { return std::nullopt; }
    return iter->second.general->content;
  }
};

}// namespace

SCENARIO("status_sync_worker drains history then goes live", "[sync][status_sync_worker]")
{
  GIVEN("Relays with a stored status of a followed account")
  {
    status_worker_fixture fixture;
    const auto xavier = pubkey_of('1');
    fixture.client->add_stored_event(make_status_event(xavier, "general", "hello", 100));
    fixture.client->add_stored_event(make_status_event(pubkey_of('2'), "general", "not followed", 100));

    WHEN("the worker starts")
    {
      fixture.restart(target_of({ xavier }));
      REQUIRE(fixture.wait_for_state(status_worker_fixture::worker_t::state::live));

      THEN("history was queried on the read relays and applied")
      {
        const auto &queries = fixture.client->get_queries();
        REQUIRE(queries.size() == 1);
        REQUIRE(queries[0].type == test_double_relay_client::query_type::all_events);
        REQUIRE(queries[0].relays == std::vector<std::string>{ "wss://read.example" });
        REQUIRE(queries[0].filter.tags.at("d") == std::vector<std::string>{ "general", "music" });
        REQUIRE(fixture.general_of(xavier) == "hello");
        REQUIRE_FALSE(fixture.general_of(pubkey_of('2')).has_value());
      }

      THEN("the realtime subscription starts at the current time")
      {
        REQUIRE(fixture.client->get_forward_filters().size() == 1);
        REQUIRE(fixture.client->get_forward_filters()[0].since == fixed_now);
      }

      AND_WHEN("a realtime tombstone arrives")
      {
        REQUIRE(fixture.client->emit_forward(make_status_event(xavier, "general", "", 150)) == 1);
        status_feed::test::run_until(fixture.io_context, [&]() { return not fixture.general_of(xavier).has_value(); });

        THEN("the account has no general status any more")
        {
          REQUIRE_FALSE(fixture.general_of(xavier).has_value());
          REQUIRE(fixture.store->current()->empty());
        }
      }

      AND_WHEN("a realtime event with a forged id arrives")
      {
        auto forged = make_status_event(xavier, "general", "forged", 160);
        forged.content = "tampered";
        REQUIRE(fixture.client->emit_forward(forged) == 1);
        status_feed::test::run_until(fixture.io_context, [&]() { return false; }, std::chrono::milliseconds(50));

        THEN("it is dropped")
        {
          REQUIRE(fixture.general_of(xavier) == "hello");
        }

        AND_WHEN("an event with a valid id but a bad signature arrives")
        {
          auto unsigned_update = make_status_event(xavier, "general", "impostor", 165);
          unsigned_update.sig = std::string(128, '0');
          REQUIRE(fixture.client->emit_forward(unsigned_update) == 1);
          const auto checked_before = fixture.verifier->checked();
          status_feed::test::run_until(
            fixture.io_context, [&]() { return fixture.verifier->checked() > checked_before; });

          THEN("it is dropped as well")
          {
            REQUIRE(fixture.verifier->checked() > checked_before);
            REQUIRE(fixture.general_of(xavier) == "hello");
          }
        }

        AND_WHEN("a valid update arrives twice")
        {
          const auto update = make_status_event(xavier, "general", "update", 170);
          fixture.client->emit_forward(update);
          fixture.client->emit_forward(update);
          status_feed::test::run_until(fixture.io_context, [&]() { return fixture.general_of(xavier) == "update"; });

          THEN("it is applied")
          {
            REQUIRE(fixture.general_of(xavier) == "update");
          }
        }
      }
    }
  }
}

TEST_CASE("status_sync_worker drops stored statuses that fail verification", "[sync][status_sync_worker]")
{
  status_worker_fixture fixture;
  const auto xavier = pubkey_of('1');
  const auto yvonne = pubkey_of('2');
  auto impostor = make_status_event(xavier, "general", "impostor", 110);
  impostor.sig = std::string(128, 'f');
  fixture.client->add_stored_event(impostor);
  fixture.client->add_stored_event(make_status_event(yvonne, "general", "genuine", 100));

  fixture.restart(target_of({ xavier, yvonne }));
  REQUIRE(fixture.wait_for_state(status_worker_fixture::worker_t::state::live));

  CHECK_FALSE(fixture.general_of(xavier).has_value());
  CHECK(fixture.general_of(yvonne) == "genuine");
  CHECK(fixture.verifier->checked() == 2);
}

SCENARIO("status_sync_worker restarts cleanly", "[sync][status_sync_worker]")
{
  GIVEN("A live worker")
  {
    status_worker_fixture fixture;
    const auto xavier = pubkey_of('1');
    const auto yvonne = pubkey_of('2');
    fixture.client->add_stored_event(make_status_event(xavier, "general", "hello", 100));
    fixture.restart(target_of({ xavier }));
    REQUIRE(fixture.wait_for_state(status_worker_fixture::worker_t::state::live));
    const auto first_generation = fixture.worker->generation();

    WHEN("it is restarted with the same target")
    {
      fixture.restart(target_of({ xavier }));
      status_feed::test::drain(fixture.io_context);

      THEN("nothing is refetched")
      {
        REQUIRE(fixture.client->get_queries().size() == 1);
        REQUIRE(fixture.worker->generation() == first_generation);
      }
    }

    WHEN("it is restarted with new followings")
    {
      fixture.restart(target_of({ xavier, yvonne }));
      status_feed::test::run_until(
        fixture.io_context, [&]() { return fixture.client->get_forward_filters().size() == 2; });
      REQUIRE(fixture.wait_for_state(status_worker_fixture::worker_t::state::live));

      THEN("the old subscription is closed and a new generation is live")
      {
        REQUIRE(fixture.client->get_unsubscribed().size() == 1);
        REQUIRE(fixture.client->open_forward_count() == 1);
        REQUIRE(fixture.worker->generation() > first_generation);
        REQUIRE(fixture.client->get_forward_filters()[1].authors == std::vector<std::string>{ xavier, yvonne });
        REQUIRE(fixture.general_of(xavier) == "hello");
      }
    }

    WHEN("it is restarted without a target")
    {
      fixture.restart(std::nullopt);
      status_feed::test::run_until(fixture.io_context, [&]() { return fixture.client->open_forward_count() == 0; });

      THEN("the subscription is closed, the store cleared and the worker idle")
      {
        REQUIRE(fixture.client->get_unsubscribed().size() == 1);
        REQUIRE(fixture.store->current()->empty());
        REQUIRE(fixture.worker->current_state()
                == status_worker_fixture::worker_t::state::idle);
      }
    }
  }

  GIVEN("A worker stuck in a slow history fetch")
  {
    status_worker_fixture fixture;
    fixture.client->set_hold_streams(true);
    fixture.restart(target_of({ pubkey_of('1') }));
    REQUIRE(fixture.wait_for_state(
      status_worker_fixture::worker_t::state::fetching_history));

    WHEN("it is restarted before the history completes")
    {
      fixture.restart(target_of({ pubkey_of('2') }));
      status_feed::test::run_until(fixture.io_context, [&]() { return fixture.client->get_queries().size() == 2; });
      fixture.client->finish_streams();
      REQUIRE(fixture.wait_for_state(status_worker_fixture::worker_t::state::live));

      THEN("only the second generation opened a realtime subscription")
      {
        REQUIRE(fixture.client->get_forward_filters().size() == 1);
        REQUIRE(fixture.client->get_forward_filters()[0].authors == std::vector<std::string>{ pubkey_of('2') });
      }
    }
  }
}

SCENARIO("profile_sync_worker fetches followed profiles", "[sync][profile_sync_worker]")
{
  GIVEN("Relays holding profiles")
  {
    auto io_context = std::make_shared<boost::asio::io_context>();
    auto client = std::make_shared<test_double_relay_client>(io_context);
    auto worker = std::make_shared<status_feed::sync::profile_sync_worker<test_double_relay_client>>(io_context, client);
    const auto xavier = pubkey_of('1');
    const auto yvonne = pubkey_of('2');
    client->add_stored_event(status_feed::test::make_profile_event(xavier, "old xavier", 50));
    client->add_stored_event(status_feed::test::make_profile_event(xavier, "xavier", 100));
    client->add_stored_event(status_feed::test::make_profile_event(yvonne, "yvonne", 100));

    WHEN("the worker starts for both accounts")
    {
      status_feed::test::spawn(io_context, worker->restart(target_of({ xavier, yvonne })));
      status_feed::test::run_until(io_context, [&]() { return worker->profiles().get()->size() == 2; });

      THEN("the latest profile of each account is stored")
      {
        const auto profiles = worker->profiles().get();
        REQUIRE(status_feed::sync::profile_of(*profiles, xavier).name == "xavier");
        REQUIRE(status_feed::sync::profile_of(*profiles, yvonne).name == "yvonne");
        REQUIRE(status_feed::sync::profile_of(*profiles, pubkey_of('3')).is_placeholder());
        REQUIRE(client->get_queries()[0].relays == std::vector<std::string>{ "wss://read.example" });
      }

      AND_WHEN("yvonne is unfollowed")
      {
        status_feed::test::spawn(io_context, worker->restart(target_of({ xavier })));
        status_feed::test::run_until(io_context, [&]() { return client->get_queries().size() == 2; });

        THEN("her profile is pruned")
        {
          const auto profiles = worker->profiles().get();
          REQUIRE(profiles->size() == 1);
          REQUIRE(profiles->contains(xavier));
        }
      }

      AND_WHEN("the worker is restarted without a target")
      {
        status_feed::test::spawn(io_context, worker->restart(std::nullopt));
        status_feed::test::run_until(io_context, [&]() { return worker->profiles().get()->empty(); });

        THEN("every profile is dropped")
        {
          REQUIRE(worker->profiles().get()->empty());
          REQUIRE_FALSE(worker->is_fetching());
        }
      }
    }

    WHEN("the relay list has no read relay")
    {
      status_feed::sync::sync_target target{ .followings = { xavier },
        .relays = { { "wss://write.example", { .read = false, .write = true } } } };
      status_feed::test::spawn(io_context, worker->restart(target));
      status_feed::test::run_until(io_context, [&]() { return not worker->is_fetching(); });

      THEN("nothing is fetched")
      {
        REQUIRE(client->get_queries().empty());
        REQUIRE(worker->profiles().get()->empty());
      }
    }
  }
}
