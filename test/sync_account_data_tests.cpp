#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <catch2/catch_test_macros.hpp>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nostr/models.hpp>
#include <nostr/relay_defaults.hpp>
#include <sync/account_data_fetcher.hpp>
#include <sync/relay_selector.hpp>

#include "test_doubles/test_double_relay_client.hpp"
#include "test_doubles/test_double_signer.hpp"
#include "test_doubles/test_event_factory.hpp"

using status_feed::test::pubkey_of;
using status_feed::test::test_double_relay_client;
using status_feed::test::test_double_signer;

TEST_CASE("resolve_bootstrap_relays", "[sync][relay_selector]")
{
  SECTION("read relays reported by the signer are used")
  {
    const status_feed::nostr::relay_list reported{
      { "wss://read.example", { .read = true, .write = false } },
      { "wss://write.example", { .read = false, .write = true } },
    };

    auto bootstrap = status_feed::sync::resolve_bootstrap_relays(reported);

    CHECK_FALSE(bootstrap.is_default);
    CHECK(bootstrap.urls == std::vector<std::string>{ "wss://read.example" });
  }

  SECTION("a list without read relays falls back to the defaults")
  {
    const status_feed::nostr::relay_list reported{ { "wss://write.example", { .read = false, .write = true } } };

    auto bootstrap = status_feed::sync::resolve_bootstrap_relays(reported);

    CHECK(bootstrap.is_default);
    CHECK(bootstrap.urls == status_feed::nostr::defaults::bootstrap_relays());
  }

  SECTION("no signer falls back to the defaults")
  {
    CHECK(status_feed::sync::resolve_bootstrap_relays(std::nullopt).is_default);
  }
}

TEST_CASE("resolve_relay_list_from_events", "[sync][relay_selector]")
{
  const auto alice = pubkey_of('a');

  SECTION("the newest event that parses wins regardless of kind")
  {
    auto relay_list = status_feed::test::make_relay_list_event(alice, { { "r", "wss://nip65.example" } }, 200);
    auto contacts = status_feed::test::make_contact_list_event(
      alice, {}, 300, R"({"wss://contacts.example":{"read":true,"write":true}})");

    auto relays = status_feed::sync::resolve_relay_list_from_events({ relay_list, contacts });

    REQUIRE(relays.size() == 1);
    CHECK(relays.contains("wss://contacts.example"));
  }

  SECTION("an unparseable newer event does not hide an older one")
  {
    auto relay_list = status_feed::test::make_relay_list_event(alice, { { "r", "wss://nip65.example" } }, 200);
    auto contacts = status_feed::test::make_contact_list_event(alice, { pubkey_of('b') }, 300);

    auto relays = status_feed::sync::resolve_relay_list_from_events({ contacts, relay_list });

    CHECK(relays.contains("wss://nip65.example"));
  }

  SECTION("nothing usable yields the fallback list")
  {
    auto relays = status_feed::sync::resolve_relay_list_from_events(
      { status_feed::test::make_profile_event(alice, "alice", 100) });

    CHECK(relays == status_feed::nostr::defaults::fallback_relay_list());
  }
}

TEST_CASE("assemble_account_metadata", "[sync][account_data]")
{
  const auto alice = pubkey_of('a');

  SECTION("followings keep contact list order without duplicates")
  {
    status_feed::sync::account_events events;
    events.profile = status_feed::test::make_profile_event(alice, "alice", 100);
    events.contacts =
      status_feed::test::make_contact_list_event(alice, { pubkey_of('c'), pubkey_of('b'), pubkey_of('c') }, 100);

    auto metadata = status_feed::sync::assemble_account_metadata(alice, events);

    CHECK(metadata.profile.name == "alice");
    CHECK(metadata.followings == std::vector<std::string>{ pubkey_of('c'), pubkey_of('b') });
    CHECK(metadata.relays == status_feed::nostr::defaults::fallback_relay_list());
  }

  SECTION("missing data becomes placeholders")
  {
    auto metadata = status_feed::sync::assemble_account_metadata(alice, status_feed::sync::account_events{});

    CHECK(metadata.profile.is_placeholder());
    CHECK(metadata.profile.pubkey == alice);
    CHECK(metadata.followings.empty());
    CHECK_FALSE(metadata.relays.empty());
  }
}

namespace {

auto run_fetch(const std::shared_ptr<boost::asio::io_context> &io_context,
  const std::shared_ptr<test_double_relay_client> &client,
  const std::shared_ptr<test_double_signer> &signer,
  const std::string &pubkey,
  bool signer_available) -> std::optional<status_feed::nostr::models::account_metadata>
{
  auto result = std::make_shared<std::optional<status_feed::nostr::models::account_metadata>>();
  auto fetcher =
    std::make_shared<status_feed::sync::account_data_fetcher<test_double_relay_client, test_double_signer>>(
      client, signer);

  boost::asio::co_spawn(
    *io_context,
    [](std::shared_ptr<status_feed::sync::account_data_fetcher<test_double_relay_client, test_double_signer>> fetch,
      std::string account,
      bool available,
      std::shared_ptr<std::optional<status_feed::nostr::models::account_metadata>> result_ptr)
      -> boost::asio::awaitable<void> { *result_ptr = co_await fetch->fetch(account, available); }(
      fetcher, pubkey, signer_available, result),
    boost::asio::detached);

  io_context->run();
  return *result;
}

}// namespace

SCENARIO("account_data_fetcher escalates to the default relays once", "[sync][account_data]")
{
  GIVEN("A signer reporting one custom read relay")
  {
    auto io_context = std::make_shared<boost::asio::io_context>();
    auto client = std::make_shared<test_double_relay_client>(io_context);
    const auto alice = pubkey_of('a');
    const std::string custom = "wss://custom.example";
    const std::string default_relay = status_feed::nostr::defaults::bootstrap_relays().front();
    auto signer = std::make_shared<test_double_signer>(
      alice, status_feed::nostr::relay_list{ { custom, { .read = true, .write = true } } });

    WHEN("the custom relay has the complete account data")
    {
      client->add_stored_event(custom, status_feed::test::make_profile_event(alice, "alice", 100));
      client->add_stored_event(custom, status_feed::test::make_contact_list_event(alice, { pubkey_of('b') }, 100));

      auto metadata = run_fetch(io_context, client, signer, alice, true);

      THEN("one round of three queries against the custom relay is enough")
      {
        REQUIRE(metadata.has_value());
        REQUIRE(client->get_queries().size() == 3);
        for (const auto &query : client->get_queries()) {
          REQUIRE(query.relays == std::vector<std::string>{ custom });
          REQUIRE(query.filter.limit == 1U);
        }
        REQUIRE(metadata->profile.name == "alice");
        REQUIRE(metadata->followings == std::vector<std::string>{ pubkey_of('b') });
      }
    }

    WHEN("the custom relay has nothing but the default relays have it all")
    {
      client->add_stored_event(default_relay, status_feed::test::make_profile_event(alice, "alice", 100));
      client->add_stored_event(default_relay,
        status_feed::test::make_relay_list_event(alice, { { "r", "wss://home.example" } }, 100));

      auto metadata = run_fetch(io_context, client, signer, alice, true);

      THEN("exactly one more round runs against the defaults and its results are used")
      {
        REQUIRE(metadata.has_value());
        REQUIRE(client->get_queries().size() == 6);
        for (std::size_t i = 3; i < 6; ++i) {
          REQUIRE(client->get_queries()[i].relays == status_feed::nostr::defaults::bootstrap_relays());
        }
        REQUIRE(metadata->profile.name == "alice");
        REQUIRE(metadata->relays.contains("wss://home.example"));
      }
    }

    WHEN("neither the custom nor the default relays have anything")
    {
      auto metadata = run_fetch(io_context, client, signer, alice, true);

      THEN("placeholders are used after a single retry")
      {
        REQUIRE(metadata.has_value());
        REQUIRE(client->get_queries().size() == 6);
        REQUIRE(metadata->profile.is_placeholder());
        REQUIRE(metadata->followings.empty());
        REQUIRE(metadata->relays == status_feed::nostr::defaults::fallback_relay_list());
      }
    }
  }

  GIVEN("No usable signer")
  {
    auto io_context = std::make_shared<boost::asio::io_context>();
    auto client = std::make_shared<test_double_relay_client>(io_context);
    const auto alice = pubkey_of('a');
    auto signer = std::make_shared<test_double_signer>(alice);

    WHEN("the default relays have nothing")
    {
      auto metadata = run_fetch(io_context, client, signer, alice, false);

      THEN("there is no retry since the defaults were already used")
      {
        REQUIRE(metadata.has_value());
        REQUIRE(client->get_queries().size() == 3);
        REQUIRE(client->get_queries().front().relays == status_feed::nostr::defaults::bootstrap_relays());
      }
    }
  }
}
