#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <cli_utils/app_init.hpp>
#include <cli_utils/cli_parser.hpp>
#include <csignal>
#include <exception>
#include <fmt/core.h>
#include <memory>
#include <nostr/relay_pool.hpp>
#include <nostr/schnorr.hpp>
#include <nostr/signer_error.hpp>
#include <optional>
#include <stdexcept>
#include <spdlog/spdlog.h>
#include <string>
#include <sync/account_store.hpp>
#include <sync/feed_session.hpp>
#include <sync/local_signer.hpp>
#include <sync/status_publisher.hpp>
#include <transport/websocket_stream.hpp>

namespace {

using pool_t = status_feed::nostr::relay_pool<status_feed::transport::websocket_stream>;
using session_t = status_feed::sync::feed_session<pool_t, status_feed::sync::local_signer>;

constexpr std::chrono::seconds post_deadline{ 30 };
constexpr std::chrono::seconds publish_grace{ 3 };

/// Signs with the configured secret key, or watches only when there is none
auto make_signer(const status_feed::cli_utils::cli_args &args, const status_feed::sync::account_store &accounts)
  -> std::shared_ptr<status_feed::sync::local_signer>
{
  return std::make_shared<status_feed::sync::local_signer>(
    accounts.load(), status_feed::cli_utils::bootstrap_relay_list(args), status_feed::cli_utils::load_secret_key(args));
}

auto make_session(const std::shared_ptr<boost::asio::io_context> &io_context,
  const status_feed::cli_utils::cli_args &args,
  const std::shared_ptr<status_feed::sync::local_signer> &signer,
  const std::shared_ptr<status_feed::sync::account_store> &accounts) -> std::shared_ptr<session_t>
{
  auto pool = std::make_shared<pool_t>(io_context, [io_context](const std::string & /*url*/) {
    return std::make_shared<status_feed::transport::websocket_stream>(io_context);
  });

  return std::make_shared<session_t>(io_context,
    pool,
    signer,
    accounts,
    std::make_shared<status_feed::nostr::schnorr_verifier>(),
    status_feed::sync::feed_session_options{ .connect_timeout = std::chrono::milliseconds{ args.connect_timeout_ms } });
}

/// Persists --pubkey when given and returns the account to sync, if any
auto select_account(const status_feed::cli_utils::cli_args &args, status_feed::sync::account_store &accounts)
  -> std::optional<std::string>
{
  if (not args.pubkey.empty()) { accounts.save(args.pubkey); }

  auto pubkey = accounts.load();
  if (not pubkey) { spdlog::error("Not logged in. Run 'status-feed login <pubkey>' or pass --pubkey"); }
  return pubkey;
}

/// Runs the session until it shuts down
auto run_session(const std::shared_ptr<boost::asio::io_context> &io_context, const std::shared_ptr<session_t> &session)
  -> void
{
  boost::asio::co_spawn(*io_context, session->run(), [context = io_context.get()](const std::exception_ptr &error) {
    if (error) {
      try {
        std::rethrow_exception(error);
      } catch (const std::exception &e) {
        spdlog::error("Session failed: {}", e.what());
      }
    }
    context->stop();
  });

  io_context->run();
}

auto run_watch(const status_feed::cli_utils::cli_args &args,
  const std::shared_ptr<status_feed::sync::account_store> &accounts) -> int
{
  if (not select_account(args, *accounts)) { return 1; }

  auto io_context = std::make_shared<boost::asio::io_context>();
  auto session = make_session(io_context, args, make_signer(args, *accounts), accounts);

  auto *watched = session.get();
  const auto print = [watched]() {
    status_feed::cli_utils::print_feed(
      watched->ordered_followings(), *watched->profiles().get(), *watched->statuses().get());
  };
  session->statuses().subscribe([print](const status_feed::sync::status_map & /*statuses*/) { print(); });
  session->profiles().subscribe([print](const status_feed::sync::profile_map & /*profiles*/) { print(); });

  boost::asio::signal_set signals(*io_context, SIGINT, SIGTERM);
  signals.async_wait([session](const boost::system::error_code &error_code, int /*signal_number*/) {
    if (not error_code) { session->post(status_feed::sync::events::shutdown{}); }
  });

  boost::asio::steady_timer deadline(*io_context);
  if (args.watch_duration_seconds > 0) {
    deadline.expires_after(std::chrono::seconds{ args.watch_duration_seconds });
    deadline.async_wait([session](const boost::system::error_code &error_code) {
      if (not error_code) { session->post(status_feed::sync::events::shutdown{}); }
    });
  }

  run_session(io_context, session);
  return 0;
}

auto run_post(const status_feed::cli_utils::cli_args &args,
  const std::shared_ptr<status_feed::sync::account_store> &accounts) -> int
{
  if (not select_account(args, *accounts)) { return 1; }

  auto signer = make_signer(args, *accounts);
  if (not signer->can_sign()) {
    spdlog::error("Posting needs a secret key. Pass --secret-key-file or set {}", status_feed::cli_utils::secret_key_env);
    return 1;
  }

  auto io_context = std::make_shared<boost::asio::io_context>();
  auto session = make_session(io_context, args, signer, accounts);
  int exit_code = 1;

  const status_feed::sync::status_input input{ .content = args.post_content,
    .link_url = args.post_link,
    .ttl = args.post_ttl_seconds > 0 ? std::optional<std::uint64_t>{ args.post_ttl_seconds } : std::nullopt };

  auto *posting = session.get();
  const auto shutdown = [posting](const boost::system::error_code &error_code) {
    if (not error_code) { posting->post(status_feed::sync::events::shutdown{}); }
  };

  boost::asio::steady_timer deadline(*io_context, post_deadline);
  deadline.async_wait([shutdown](const boost::system::error_code &error_code) {
    if (not error_code) { spdlog::error("Timed out waiting for account data"); }
    shutdown(error_code);
  });

  session->account_data().subscribe(
    [posting, input, shutdown, &deadline, &exit_code](
      const std::optional<status_feed::nostr::models::account_metadata> &data) {
      if (not data or not posting->my_account_data_available()) { return; }
      try {
        const auto event = posting->update_my_status(input);
        fmt::print("Published status {}\n", event.id);
        exit_code = 0;
        // leave time for the relays to acknowledge
        deadline.expires_after(publish_grace);
        deadline.async_wait(shutdown);
      } catch (const status_feed::nostr::signer_error &e) {
        spdlog::error("Signing failed: {}", e.what());
        posting->post(status_feed::sync::events::shutdown{});
      } catch (const std::runtime_error &e) {
        spdlog::error("Publishing failed: {}", e.what());
        posting->post(status_feed::sync::events::shutdown{});
      }
    });

  run_session(io_context, session);
  return exit_code;
}

}// namespace

// NOLINTNEXTLINE(bugprone-exception-escape)
auto main(int argc, char **argv) -> int
{
  auto args = status_feed::cli_utils::parse_cli_args(argc, argv);

  if (not status_feed::cli_utils::validate_cli_args(args)) { return 1; }

  status_feed::cli_utils::configure_logging(args);

  if (args.show_version) {
    status_feed::cli_utils::print_version();
    return 0;
  }

  auto accounts = std::make_shared<status_feed::sync::account_store>(args.account_file);

  if (args.login_parsed) {
    accounts->save(args.login_pubkey);
    fmt::print("Logged in as {}\n", args.login_pubkey);
    return 0;
  }

  if (args.logout_parsed) {
    accounts->reset();
    fmt::print("Logged out\n");
    return 0;
  }

  if (args.whoami_parsed) {
    if (auto pubkey = accounts->load()) {
      fmt::print("{}\n", *pubkey);
    } else {
      fmt::print("Not logged in\n");
    }
    return 0;
  }

  try {
    if (args.post_parsed) { return run_post(args, accounts); }

    if (args.watch_parsed) { return run_watch(args, accounts); }
  } catch (const std::invalid_argument &e) {
    spdlog::error("Invalid key: {}", e.what());
    return 1;
  } catch (const std::runtime_error &e) {
    spdlog::error("{}", e.what());
    return 1;
  }

  fmt::print("Nothing to do. Run 'status-feed --help' for the available commands.\n");
  return 0;
}
