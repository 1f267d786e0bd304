#pragma once

#include <CLI/CLI.hpp>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <nostr/relay_list.hpp>
#include <optional>
#include <platform/env_utils.hpp>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string>
#include <sync/account_store.hpp>
#include <vector>

namespace status_feed::cli_utils {

struct cli_args
{
  std::string account_file = "~/.status-feed/account.json";
  std::string pubkey;
  std::string secret_key_file;
  std::vector<std::string> bootstrap_relays;
  std::uint32_t connect_timeout_ms = 3000;
  bool verbose = false;
  std::string log_level;
  bool show_version = false;

  bool login_parsed = false;
  std::string login_pubkey;

  bool logout_parsed = false;
  bool whoami_parsed = false;

  bool watch_parsed = false;
  std::uint32_t watch_duration_seconds = 0;///< 0 watches until interrupted

  bool post_parsed = false;
  std::string post_content;
  std::string post_link;
  std::uint64_t post_ttl_seconds = 0;///< 0 posts a status without expiration
};

inline auto setup_cli_app(CLI::App &app, cli_args &args) -> void;

inline auto parse_cli_args(int argc, char **argv) -> cli_args
{
  cli_args args;
  CLI::App app{ "Status Feed - Nostr status sync for the accounts you follow", "status-feed" };

  setup_cli_app(app, args);

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError &e) {
    app.exit(e);
    std::exit(e.get_exit_code());// NOLINT(concurrency-mt-unsafe)
  }

  args.account_file = platform::expand_tilde_path(args.account_file);
  if (not args.secret_key_file.empty()) { args.secret_key_file = platform::expand_tilde_path(args.secret_key_file); }

  return args;
}

inline auto setup_cli_app(CLI::App &app, cli_args &args) -> void
{
  app.add_option("-a,--account-file", args.account_file, "Path to the persisted account file");
  app.add_option("-p,--pubkey", args.pubkey, "Log in as this hex public key before running");
  app.add_option("-k,--secret-key-file",
    args.secret_key_file,
    "File holding the hex secret key used to sign (default: $STATUS_FEED_SECRET_KEY)");
  app.add_option("-b,--bootstrap-relay", args.bootstrap_relays, "Preferred relay for account metadata (repeatable)");
  app.add_option("--connect-timeout-ms", args.connect_timeout_ms, "Relay connection timeout in milliseconds")
    ->check(CLI::PositiveNumber);
  app.add_flag("-v,--verbose", args.verbose, "Enable verbose logging");
  app.add_option("--log-level", args.log_level, "Log level: trace, debug, info, warn, error, critical, off")
    ->check(CLI::IsMember({ "trace", "debug", "info", "warn", "error", "critical", "off" }));
  app.add_flag("--version", args.show_version, "Show version information");

  auto *login_cmd = app.add_subcommand("login", "Persist the account to follow statuses for");
  login_cmd->add_option("pubkey", args.login_pubkey, "Hex public key")->required();
  login_cmd->callback([&args]() { args.login_parsed = true; });

  auto *logout_cmd = app.add_subcommand("logout", "Forget the persisted account");
  logout_cmd->callback([&args]() { args.logout_parsed = true; });

  auto *whoami_cmd = app.add_subcommand("whoami", "Show the persisted account");
  whoami_cmd->callback([&args]() { args.whoami_parsed = true; });

  auto *watch_cmd = app.add_subcommand("watch", "Print the status feed of followed accounts as it changes");
  watch_cmd->add_option("-d,--duration-seconds", args.watch_duration_seconds, "Stop after this many seconds");
  watch_cmd->callback([&args]() { args.watch_parsed = true; });

  auto *post_cmd = app.add_subcommand("post", "Publish a general status");
  post_cmd->add_option("content", args.post_content, "Status text, empty clears the status")->required();
  post_cmd->add_option("-l,--link", args.post_link, "Link attached to the status");
  post_cmd->add_option("-t,--ttl", args.post_ttl_seconds, "Seconds until the status expires");
  post_cmd->callback([&args]() { args.post_parsed = true; });
}

inline auto validate_cli_args(const cli_args &args) -> bool
{
  if (not args.pubkey.empty() and not sync::is_hex_pubkey(args.pubkey)) {
    spdlog::error("Invalid public key: {}", args.pubkey);
    return false;
  }

  for (const auto &url : args.bootstrap_relays) {
    if (not nostr::normalize_relay_url(url)) {
      spdlog::error("Invalid relay URL: {}", url);
      return false;
    }
  }

  if (args.connect_timeout_ms == 0) {
    spdlog::error("Connection timeout must be positive");
    return false;
  }

  if (args.login_parsed and not sync::is_hex_pubkey(args.login_pubkey)) {
    spdlog::error("Login requires a 64 character lowercase hex public key");
    return false;
  }

  if (args.post_parsed and not args.post_link.empty() and args.post_link.find("://") == std::string::npos) {
    spdlog::error("Invalid link: {}", args.post_link);
    return false;
  }

  return true;
}

/// Environment variable read when no secret key file is given
constexpr const char *secret_key_env = "STATUS_FEED_SECRET_KEY";

/**
 * @brief Reads the signing key from --secret-key-file or the environment.
 *
 * @return Hex secret key with surrounding whitespace removed, std::nullopt if none is configured
 * @throws std::runtime_error if the key file cannot be read or is empty
 */
[[nodiscard]] inline auto load_secret_key(const cli_args &args) -> std::optional<std::string>
{
  std::string secret_key;
  if (not args.secret_key_file.empty()) {
    std::ifstream file(args.secret_key_file);
    if (not file) { throw std::runtime_error("Cannot read secret key file " + args.secret_key_file); }
    file >> secret_key;
    if (secret_key.empty()) { throw std::runtime_error("Secret key file " + args.secret_key_file + " is empty"); }
    return secret_key;
  }

  auto from_env = platform::get_env(secret_key_env);
  if (not from_env) { return std::nullopt; }

  secret_key = std::move(*from_env);
  const auto first = secret_key.find_first_not_of(" \t\r\n");
  const auto last = secret_key.find_last_not_of(" \t\r\n");
  if (first == std::string::npos) { return std::nullopt; }
  return secret_key.substr(first, last - first + 1);
}

/// Preferred relays given on the command line, read and write
[[nodiscard]] inline auto bootstrap_relay_list(const cli_args &args) -> std::optional<nostr::relay_list>
{
  if (args.bootstrap_relays.empty()) { return std::nullopt; }

  nostr::relay_list relays;
  for (const auto &url : args.bootstrap_relays) {
    if (auto normalized = nostr::normalize_relay_url(url)) {
      relays[*normalized] = nostr::relay_usage{ .read = true, .write = true };
    }
  }
  return relays;
}

}// namespace status_feed::cli_utils
