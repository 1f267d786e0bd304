#pragma once

#include <cstdint>
#include <string>

namespace status_feed::platform {

/**
 * @brief Returns the current wall clock time in whole seconds since the Unix epoch.
 */
[[nodiscard]] auto current_unix_time() -> std::uint64_t;

/**
 * @brief Formats the current local time as HH:MM:SS.
 *
 * @return Current time formatted as "HH:MM:SS"
 */
[[nodiscard]] auto format_current_time_hms() -> std::string;

/**
 * @brief Formats a Unix timestamp as local "YYYY-MM-DD HH:MM:SS".
 *
 * @param unix_time Seconds since the Unix epoch
 */
[[nodiscard]] auto format_unix_time(std::uint64_t unix_time) -> std::string;

}// namespace status_feed::platform
