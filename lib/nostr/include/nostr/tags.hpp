#pragma once

#include <algorithm>
#include <optional>
#include <string>
#include <vector>

namespace status_feed::nostr {

using tag_list = std::vector<std::vector<std::string>>;

/**
 * @brief Returns the value of the first tag with the given name.
 *
 * @param tags Event tags array
 * @param name Tag name, e.g. "d"
 * @return Second element of the first matching tag, std::nullopt if none has a value
 */
[[nodiscard]] inline auto get_first_tag_value(const tag_list &tags, const std::string &name)
  -> std::optional<std::string>
{
  auto it = std::find_if(
    tags.begin(), tags.end(), [&name](const auto &tag) { return tag.size() >= 2 and tag[0] == name; });

  if (it != tags.end()) { return (*it)[1]; }
  return std::nullopt;
}

/**
 * @brief Returns the values of every tag with the given name, in tag order.
 *
 * @param tags Event tags array
 * @param name Tag name, e.g. "p"
 * @return Second element of each matching tag
 */
[[nodiscard]] inline auto get_tag_values(const tag_list &tags, const std::string &name) -> std::vector<std::string>
{
  std::vector<std::string> values;
  for (const auto &tag : tags) {
    if (tag.size() >= 2 and tag[0] == name) { values.push_back(tag[1]); }
  }
  return values;
}

}// namespace status_feed::nostr
