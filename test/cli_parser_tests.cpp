#include <catch2/catch_test_macros.hpp>
#include <filesystem>
#include <fstream>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string>
#include <vector>

#include <cli_utils/app_init.hpp>
#include <cli_utils/cli_parser.hpp>
#include <core/id_generator.hpp>
#include <nostr/models.hpp>
#include <platform/env_utils.hpp>
#include <sync/profile_store.hpp>
#include <sync/status_store.hpp>

namespace {

auto create_argv(std::vector<std::string> &args) -> std::vector<char *>
{
  std::vector<char *> argv;
  argv.reserve(args.size());
  for (auto &arg : args) { argv.push_back(arg.data()); }
  return argv;
}

auto parse(std::vector<std::string> args) -> status_feed::cli_utils::cli_args
{
  auto argv = create_argv(args);
  return status_feed::cli_utils::parse_cli_args(static_cast<int>(args.size()), argv.data());
}

const std::string valid_pubkey(64, 'e');

}// namespace

TEST_CASE("CLI parsing global options", "[cli_utils][cli_parser]")
{
  SECTION("defaults")
  {
    auto parsed = parse({ "status-feed" });
    CHECK_FALSE(parsed.verbose);
    CHECK_FALSE(parsed.show_version);
    CHECK(parsed.connect_timeout_ms == 3000);
    CHECK(parsed.bootstrap_relays.empty());
    CHECK(parsed.account_file.ends_with(".status-feed/account.json"));
    CHECK_FALSE(parsed.watch_parsed);
  }

  SECTION("version and verbose flags")
  {
    auto parsed = parse({ "status-feed", "--version", "-v" });
    CHECK(parsed.show_version);
    CHECK(parsed.verbose);
  }

  SECTION("account file, pubkey and timeout")
  {
    auto parsed =
      parse({ "status-feed", "-a", "/tmp/account.json", "-p", valid_pubkey, "--connect-timeout-ms", "500" });
    CHECK(parsed.account_file == "/tmp/account.json");
    CHECK(parsed.pubkey == valid_pubkey);
    CHECK(parsed.connect_timeout_ms == 500);
  }

  SECTION("repeated bootstrap relays")
  {
    auto parsed = parse({ "status-feed", "-b", "wss://one.example", "--bootstrap-relay", "wss://two.example" });
    CHECK(parsed.bootstrap_relays == std::vector<std::string>{ "wss://one.example", "wss://two.example" });
  }

  SECTION("log level")
  {
    auto parsed = parse({ "status-feed", "--log-level", "warn" });
    CHECK(parsed.log_level == "warn");
  }
}

TEST_CASE("CLI parsing subcommands", "[cli_utils][cli_parser]")
{
  SECTION("login")
  {
    auto parsed = parse({ "status-feed", "login", valid_pubkey });
    CHECK(parsed.login_parsed);
    CHECK(parsed.login_pubkey == valid_pubkey);
  }

  SECTION("logout and whoami")
  {
    CHECK(parse({ "status-feed", "logout" }).logout_parsed);
    CHECK(parse({ "status-feed", "whoami" }).whoami_parsed);
  }

  SECTION("watch with a duration")
  {
    auto parsed = parse({ "status-feed", "watch", "-d", "30" });
    CHECK(parsed.watch_parsed);
    CHECK(parsed.watch_duration_seconds == 30);
  }

  SECTION("post with link and ttl")
  {
    auto parsed = parse({ "status-feed", "post", "Reading", "--link", "https://example.com/book", "-t", "3600" });
    CHECK(parsed.post_parsed);
    CHECK(parsed.post_content == "Reading");
    CHECK(parsed.post_link == "https://example.com/book");
    CHECK(parsed.post_ttl_seconds == 3600);
  }
}

TEST_CASE("validate_cli_args rejects bad input", "[cli_utils][cli_parser]")
{
  status_feed::cli_utils::cli_args args;
  CHECK(status_feed::cli_utils::validate_cli_args(args));

  SECTION("non hex pubkey")
  {
    args.pubkey = "npub1abc";
    CHECK_FALSE(status_feed::cli_utils::validate_cli_args(args));
  }

  SECTION("relay without a websocket scheme")
  {
    args.bootstrap_relays = { "https://relay.example" };
    CHECK_FALSE(status_feed::cli_utils::validate_cli_args(args));
  }

  SECTION("login with an invalid key")
  {
    args.login_parsed = true;
    args.login_pubkey = std::string(64, 'Z');
    CHECK_FALSE(status_feed::cli_utils::validate_cli_args(args));
  }

  SECTION("post with a link lacking a scheme")
  {
    args.post_parsed = true;
    args.post_content = "hi";
    args.post_link = "example.com";
    CHECK_FALSE(status_feed::cli_utils::validate_cli_args(args));
  }

  SECTION("zero timeout")
  {
    args.connect_timeout_ms = 0;
    CHECK_FALSE(status_feed::cli_utils::validate_cli_args(args));
  }
}

TEST_CASE("bootstrap_relay_list normalizes preferred relays", "[cli_utils][cli_parser]")
{
  status_feed::cli_utils::cli_args args;
  CHECK_FALSE(status_feed::cli_utils::bootstrap_relay_list(args).has_value());

  args.bootstrap_relays = { "WSS://Relay.Example/", "wss://other.example" };
  const auto relays = status_feed::cli_utils::bootstrap_relay_list(args);
  REQUIRE(relays.has_value());
  CHECK(relays->size() == 2);
  CHECK(relays->at("wss://relay.example").read);
  CHECK(relays->at("wss://relay.example").write);
  CHECK(relays->contains("wss://other.example"));
}

TEST_CASE("load_secret_key reads the signing key", "[cli_utils][cli_parser]")
{
  const auto key_file = std::filesystem::path(status_feed::platform::get_temp_directory())
                        / ("status_feed_key_" + status_feed::core::generate_uuid());
  const std::string secret_key = std::string(63, '0') + "3";

  SECTION("from the file given with --secret-key-file")
  {
    {
      std::ofstream out(key_file);
      out << "  " << secret_key << "\n";
    }
    auto parsed = parse({ "status-feed", "-k", key_file.string(), "post", "hello" });
    CHECK(parsed.secret_key_file == key_file.string());
    CHECK(status_feed::cli_utils::load_secret_key(parsed) == secret_key);
  }

  SECTION("an empty key file is an error")
  {
    {
      std::ofstream out(key_file);
    }
    auto parsed = parse({ "status-feed", "--secret-key-file", key_file.string() });
    CHECK_THROWS_AS(status_feed::cli_utils::load_secret_key(parsed), std::runtime_error);
  }

  SECTION("a missing key file is an error")
  {
    auto parsed = parse({ "status-feed", "--secret-key-file", (key_file / "missing").string() });
    CHECK_THROWS_AS(status_feed::cli_utils::load_secret_key(parsed), std::runtime_error);
  }

  SECTION("nothing configured")
  {
    if (status_feed::platform::get_env(status_feed::cli_utils::secret_key_env)) {
      SKIP("secret key set in the environment");
    }
    CHECK_FALSE(status_feed::cli_utils::load_secret_key(parse({ "status-feed" })).has_value());
  }

  std::error_code error;
  std::filesystem::remove(key_file, error);
}

TEST_CASE("configure_logging picks the log level", "[cli_utils][app_init]")
{
  status_feed::cli_utils::cli_args args;

  status_feed::cli_utils::configure_logging(args);
  CHECK(spdlog::get_level() == spdlog::level::info);

  args.verbose = true;
  status_feed::cli_utils::configure_logging(args);
  CHECK(spdlog::get_level() == spdlog::level::debug);

  args.log_level = "error";
  status_feed::cli_utils::configure_logging(args);
  CHECK(spdlog::get_level() == spdlog::level::err);

  spdlog::set_level(spdlog::level::info);
}

TEST_CASE("format_feed renders accounts in order", "[cli_utils][app_init]")
{
  using status_feed::nostr::models::status_category;
  using status_feed::nostr::models::status_data;

  const std::string alice(64, 'a');
  const std::string bob(64, 'b');

  status_feed::sync::status_map statuses;
  statuses[alice] = status_feed::nostr::models::user_status{ .pubkey = alice,
    .general = status_data{ .event_id = "1",
      .category = status_category::general,
      .content = "Hiking",
      .created_at = 100,
      .expiration = std::nullopt,
      .link_url = "https://maps.example" },
    .music = std::nullopt };
  statuses[bob] = status_feed::nostr::models::user_status{ .pubkey = bob,
    .general = std::nullopt,
    .music = status_data{ .event_id = "2",
      .category = status_category::music,
      .content = "Song - Artist",
      .created_at = 200,
      .expiration = 300,
      .link_url = std::nullopt } };

  status_feed::sync::profile_map profiles;
  auto named = status_feed::nostr::models::user_profile::placeholder(bob);
  named.display_name = "Bob";
  profiles[bob] = named;

  const auto out = status_feed::cli_utils::format_feed({ bob, alice }, profiles, statuses);

  CHECK(out.find("Bob @ ") == 0);
  CHECK(out.find("  music: Song - Artist [until ") != std::string::npos);
  CHECK(out.find("aaaaaaaaaaaa... @ ") != std::string::npos);
  CHECK(out.find("  general: Hiking (https://maps.example)\n") != std::string::npos);
  CHECK(out.find("Bob") < out.find("aaaaaaaaaaaa..."));
}

TEST_CASE("format_feed skips accounts without a live status", "[cli_utils][app_init]")
{
  const auto out = status_feed::cli_utils::format_feed({ std::string(64, 'c') }, {}, {});
  CHECK(out.empty());
}
