#pragma once

#include <cli_utils/cli_parser.hpp>
#include <cstddef>
#include <fmt/core.h>
#include <nostr/models.hpp>
#include <optional>
#include <platform/time_utils.hpp>
#include <spdlog/spdlog.h>
#include <string>
#include <sync/profile_store.hpp>
#include <sync/status_store.hpp>
#include <vector>

#include "internal_use_only/config.hpp"

namespace status_feed::cli_utils {

/**
 * @brief Applies the log level requested on the command line.
 *
 * --log-level wins over -v; without either the level is info.
 */
inline auto configure_logging(const cli_args &args) -> void
{
  if (not args.log_level.empty()) {
    spdlog::set_level(spdlog::level::from_str(args.log_level));
    return;
  }

  spdlog::set_level(args.verbose ? spdlog::level::debug : spdlog::level::info);
}

inline auto print_version() -> void
{
  fmt::print("{} v{}\n", status_feed::cmake::project_name, status_feed::cmake::project_version);
}

/**
 * @brief Renders one status slot as "category: content (link) [until time]".
 */
[[nodiscard]] inline auto format_status_slot(const nostr::models::status_data &status) -> std::string
{
  auto line = fmt::format("{}: {}", nostr::models::to_string(status.category), status.content);
  if (status.link_url) { line += fmt::format(" ({})", *status.link_url); }
  if (status.expiration) { line += fmt::format(" [until {}]", platform::format_unix_time(*status.expiration)); }
  return line;
}

/**
 * @brief Renders the status feed, one block per account in the given order.
 *
 * @param ordered Public keys, most recently updated first
 * @param profiles Profiles used for the display label
 * @param statuses Live statuses
 */
[[nodiscard]] inline auto format_feed(const std::vector<std::string> &ordered,
  const sync::profile_map &profiles,
  const sync::status_map &statuses) -> std::string
{
  std::string out;
  for (const auto &pubkey : ordered) {
    auto iter = statuses.find(pubkey);
    if (iter == statuses.end()) { continue; }

    const auto &status = iter->second;
    out += fmt::format("{} @ {}\n",
      sync::profile_of(profiles, pubkey).display_label(),
      platform::format_unix_time(status.last_update_time()));
    for (const auto category : nostr::models::all_status_categories) {
      if (const auto &slot = status.slot(category)) { out += fmt::format("  {}\n", format_status_slot(*slot)); }
    }
  }
  return out;
}

inline auto print_feed(const std::vector<std::string> &ordered,
  const sync::profile_map &profiles,
  const sync::status_map &statuses) -> void
{
  fmt::print("--- {} ({} accounts) ---\n", platform::format_current_time_hms(), ordered.size());
  fmt::print("{}", format_feed(ordered, profiles, statuses));
}

}// namespace status_feed::cli_utils
