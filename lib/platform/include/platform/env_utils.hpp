#pragma once

#include <string>

namespace nostr_pool::platform {

/**
 * @brief Returns the user's home directory path, or an empty string.
 */
[[nodiscard]] auto get_home_directory() -> std::string;

/**
 * @brief Expands a leading "~/" to the home directory.
 *
 * @param path Path possibly starting with ~/
 * @return Expanded path; @p path unchanged when there is no home directory
 */
[[nodiscard]] auto expand_tilde_path(const std::string &path) -> std::string;

}// namespace nostr_pool::platform
