#pragma once

#include <array>
#include <cstdint>
#include <nostr/protocol.hpp>
#include <nostr/relay_list.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace status_feed::nostr::models {

/// Source event id of a profile that was never fetched
inline constexpr std::string_view undefined_source_event_id = "undefined";

/**
 * @brief Profile of an account, parsed from its latest profile metadata (kind 0) event.
 *
 * Two profiles are the same iff they come from the same source event.
 */
struct user_profile
{
  std::string source_event_id;///< Id of the kind 0 event, "undefined" for a placeholder
  std::string pubkey;///< Account public key
  std::optional<std::string> name;
  std::optional<std::string> display_name;
  std::optional<std::string> about;
  std::optional<std::string> picture;
  std::optional<std::string> banner;
  std::optional<std::string> website;
  std::optional<std::string> nip05;
  std::optional<std::string> lud16;

  /**
   * @brief Builds a profile from a kind 0 event.
   *
   * Fields that are missing or not strings in the JSON content are left unset. Malformed content
   * yields a profile carrying only the source event id and public key.
   */
  [[nodiscard]] static auto from_event(const protocol::event_data &event) -> user_profile;

  /// Profile shown for an account whose metadata has not been fetched
  [[nodiscard]] static auto placeholder(const std::string &pubkey) -> user_profile;

  [[nodiscard]] auto is_placeholder() const -> bool { return source_event_id == undefined_source_event_id; }

  /// display_name, then name, then a shortened public key
  [[nodiscard]] auto display_label() const -> std::string;
};

/// Identity comparison used by profile selectors
[[nodiscard]] inline auto same_source(const user_profile &lhs, const user_profile &rhs) -> bool
{
  return lhs.source_event_id == rhs.source_event_id;
}

/// Status categories carried in the "d" tag of a user status event
enum class status_category : std::uint8_t { general, music };

inline constexpr std::array<status_category, 2> all_status_categories{ status_category::general,
  status_category::music };

[[nodiscard]] auto parse_status_category(std::string_view value) -> std::optional<status_category>;

[[nodiscard]] auto to_string(status_category category) -> std::string_view;

/**
 * @brief One status of one account in one category.
 */
struct status_data
{
  std::string event_id;///< Id of the source event
  status_category category{};
  std::string content;///< Empty content is a tombstone
  std::uint64_t created_at{};
  std::optional<std::uint64_t> expiration;///< Unix timestamp from the "expiration" tag
  std::optional<std::string> link_url;///< Value of the "r" tag

  /**
   * @brief Builds status data from a user status (kind 30315) event.
   *
   * @return Parsed status, std::nullopt if the "d" tag is missing or not a supported category
   */
  [[nodiscard]] static auto from_event(const protocol::event_data &event) -> std::optional<status_data>;
};

/**
 * @brief Live statuses of one account.
 *
 * A slot is set only while its status is unexpired and non-empty. A user_status with both slots
 * empty is never stored.
 */
struct user_status
{
  std::string pubkey;
  std::optional<status_data> general;
  std::optional<status_data> music;

  [[nodiscard]] auto slot(status_category category) const -> const std::optional<status_data> &;
  [[nodiscard]] auto slot(status_category category) -> std::optional<status_data> &;

  [[nodiscard]] auto is_empty() const -> bool { return not general.has_value() and not music.has_value(); }

  /// Latest created_at over the live slots, 0 when empty
  [[nodiscard]] auto last_update_time() const -> std::uint64_t;

  /// Identifies the slot contents, used to detect changes
  [[nodiscard]] auto content_id() const -> std::string;
};

/**
 * @brief Account data fetched at login, replaced wholesale on refetch.
 */
struct account_metadata
{
  user_profile profile;
  std::vector<std::string> followings;///< Followed public keys in contact list order
  relay_list relays;
};

}// namespace status_feed::nostr::models
