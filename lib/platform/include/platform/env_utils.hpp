#pragma once

#include <optional>
#include <string>

namespace status_feed::platform {

/**
 * @brief Reads an environment variable.
 *
 * @return Value, std::nullopt if unset or empty
 */
[[nodiscard]] auto get_env(const std::string &name) -> std::optional<std::string>;

/// User home directory, empty if unknown
[[nodiscard]] auto get_home_directory() -> std::string;

/// Directory for temporary files, TMPDIR or /tmp
[[nodiscard]] auto get_temp_directory() -> std::string;

/**
 * @brief Replaces a leading "~" with the home directory.
 *
 * Only "~" and "~/..." are expanded; "~user" forms and paths are returned unchanged when the home
 * directory is unknown.
 */
[[nodiscard]] auto expand_tilde_path(const std::string &path) -> std::string;

}// namespace status_feed::platform
