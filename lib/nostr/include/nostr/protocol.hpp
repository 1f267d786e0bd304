#pragma once

#include <cstdint>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace status_feed::nostr::protocol {

/**
 * @brief Nostr event kind identifiers used by the status feed.
 */
enum class kind : std::uint16_t {
  profile_metadata = 0,///< User profile metadata (NIP-01)
  contact_list = 3,///< Contact list, "p" tags are followings (NIP-02)
  relay_list = 10002,///< Relay list metadata (NIP-65)
  user_status = 30315,///< User status, parameterized replaceable (NIP-38)
};

/**
 * @brief Nostr event data structure.
 *
 * Represents a complete Nostr event with all required fields per NIP-01.
 */
struct event_data
{
  std::string id;///< Event ID (32-byte hex hash)
  std::string pubkey;///< Public key of event creator (32-byte hex)
  std::uint64_t created_at{};///< Unix timestamp
  enum kind kind {};///< Event kind identifier
  std::vector<std::vector<std::string>> tags;///< Event tags (arbitrary string arrays)
  std::string content;///< Event content
  std::string sig;///< Schnorr signature (64-byte hex)

  /**
   * @brief Builds event data from an already parsed JSON object.
   *
   * @param json_obj JSON object in NIP-01 event format
   * @return Parsed event_data or std::nullopt if a field is missing or mistyped
   */
  static auto from_json(const nlohmann::json &json_obj) -> std::optional<event_data>;

  /**
   * @brief Converts the event to a NIP-01 JSON object.
   */
  [[nodiscard]] auto to_json() const -> nlohmann::json;

  /**
   * @brief Creates an unsigned user status event.
   *
   * @param sender_pubkey Nostr public key of the author (may be empty, the signer fills it)
   * @param timestamp Unix timestamp used as created_at
   * @param category Status category placed in the "d" tag
   * @param content Status text; empty content clears the status
   * @param link_url Optional link placed in an "r" tag when non-empty
   * @param expiration Optional unix timestamp placed in an "expiration" tag
   * @return Constructed event_data
   */
  [[nodiscard]] static auto create_user_status(const std::string &sender_pubkey,
    std::uint64_t timestamp,
    const std::string &category,
    const std::string &content,
    const std::string &link_url = "",
    std::optional<std::uint64_t> expiration = std::nullopt) -> event_data;

  /**
   * @brief Returns the event kind.
   *
   * @return Event kind or std::nullopt if the kind is not one handled by the status feed
   */
  [[nodiscard]] auto get_kind() const -> std::optional<enum kind>;
};

/**
 * @brief NIP-01 subscription filter.
 *
 * Unset optional members and empty vectors are omitted from the JSON form.
 */
struct filter
{
  std::vector<std::string> ids;///< Event IDs
  std::vector<std::string> authors;///< Author public keys
  std::vector<enum kind> kinds;///< Event kinds
  std::map<std::string, std::vector<std::string>> tags;///< Single-letter tag name to accepted values
  std::optional<std::uint64_t> since;///< Only events with created_at >= since
  std::optional<std::uint64_t> until;///< Only events with created_at <= until
  std::optional<std::uint32_t> limit;///< Maximum number of stored events per relay

  /**
   * @brief Converts the filter to a NIP-01 JSON object.
   *
   * @return JSON object such as {"kinds":[30315],"authors":[...],"#d":["general"]}
   */
  [[nodiscard]] auto to_json() const -> nlohmann::json;
};

/**
 * @brief Nostr OK response message.
 *
 * Sent by relays to indicate acceptance/rejection of a submitted event.
 */
struct ok
{
  std::string event_id;///< ID of the event this responds to
  bool accepted{};///< Whether the event was accepted
  std::string message;///< Human-readable status message

  /**
   * @brief Deserializes OK message from JSON.
   *
   * @param json JSON string in format ["OK", event_id, accepted, message]
   * @return Parsed ok or std::nullopt on failure
   */
  static auto deserialize(const std::string &json) -> std::optional<ok>;
};

/**
 * @brief End of Stored Events marker.
 *
 * Sent by relays to indicate all stored events matching a subscription have been sent.
 */
struct eose
{
  std::string subscription_id;///< Subscription this EOSE applies to

  /**
   * @brief Deserializes EOSE message from JSON.
   *
   * @param json JSON string in format ["EOSE", subscription_id]
   * @return Parsed eose or std::nullopt on failure
   */
  static auto deserialize(const std::string &json) -> std::optional<eose>;
};

/**
 * @brief Subscription closed by the relay.
 */
struct closed
{
  std::string subscription_id;///< Subscription the relay closed
  std::string message;///< Reason given by the relay

  /**
   * @brief Deserializes CLOSED message from JSON.
   *
   * @param json JSON string in format ["CLOSED", subscription_id, message]
   * @return Parsed closed or std::nullopt on failure
   */
  static auto deserialize(const std::string &json) -> std::optional<closed>;
};

/**
 * @brief Human-readable notice sent by a relay.
 */
struct notice
{
  std::string message;///< Notice text

  static auto deserialize(const std::string &json) -> std::optional<notice>;
};

/**
 * @brief Nostr REQ subscription request.
 *
 * Sent to relays to subscribe to events matching filter criteria.
 */
struct req
{
  std::string subscription_id;///< Unique identifier for this subscription
  nlohmann::json filters;///< Filter criteria (NIP-01 format)

  /**
   * @brief Serializes REQ to JSON string.
   *
   * @return JSON string in format ["REQ", subscription_id, ...filters]
   */
  [[nodiscard]] auto serialize() const -> std::string;

  /**
   * @brief Deserializes REQ from JSON.
   *
   * @param json JSON string
   * @return Parsed req or std::nullopt on failure
   */
  static auto deserialize(const std::string &json) -> std::optional<req>;
};

/**
 * @brief Nostr CLOSE request, ends a subscription on the relay.
 */
struct close
{
  std::string subscription_id;///< Subscription to end

  /**
   * @brief Serializes CLOSE to JSON string.
   *
   * @return JSON string in format ["CLOSE", subscription_id]
   */
  [[nodiscard]] auto serialize() const -> std::string;
};

/**
 * @brief Nostr EVENT message wrapper.
 *
 * Wraps event_data with subscription ID for relay-to-client communication.
 */
struct event
{
  std::string subscription_id;///< Subscription this event matches
  event_data data;///< The event itself

  /**
   * @brief Creates an event message from event_data.
   *
   * @param evt Event data to wrap
   * @return Constructed event message
   */
  static auto from_event_data(const event_data &evt) -> event;

  /**
   * @brief Serializes event to JSON string.
   *
   * @return JSON string in format ["EVENT", subscription_id, event_data]
   */
  [[nodiscard]] auto serialize() const -> std::string;

  /**
   * @brief Deserializes event from JSON.
   *
   * @param json JSON string
   * @return Parsed event or std::nullopt on failure
   */
  static auto deserialize(const std::string &json) -> std::optional<event>;
};

/// Maximum allowed subscription ID length
constexpr std::size_t max_subscription_id_length = 64;

/**
 * @brief Validates a subscription ID.
 *
 * @param subscription_id ID to validate
 * @throws std::invalid_argument if ID is empty or exceeds maximum length
 */
inline auto validate_subscription_id(const std::string &subscription_id) -> void
{
  if (subscription_id.empty()) { throw std::invalid_argument("Subscription ID cannot be empty"); }
  if (subscription_id.length() > max_subscription_id_length) {
    throw std::invalid_argument("Subscription ID exceeds maximum length of 64 characters");
  }
}

}// namespace status_feed::nostr::protocol
