#pragma once

#include <string>
#include <string_view>

namespace status_feed::core {

/// Random RFC 4122 UUID in canonical form, e.g. "550e8400-e29b-41d4-a716-446655440000"
[[nodiscard]] auto generate_uuid() -> std::string;

/**
 * @brief Builds a relay subscription id of the form "<purpose>-<32 hex digits>".
 *
 * The purpose is cut short so that the id never exceeds the 64 characters relays accept.
 *
 * @param purpose Readable tag shown in relay logs, e.g. "forward"
 */
[[nodiscard]] auto generate_subscription_id(std::string_view purpose) -> std::string;

}// namespace status_feed::core
