#pragma once

/**
 * @file path_utils.h
 * @brief Path resolution: ~ expansion and config-relative paths
 */

#include <string>

namespace voicegate {

/**
 * Expands leading ~ to $HOME (getenv("HOME")). ~user not supported.
 * Returns path unchanged if path is empty or ~ expansion not applicable.
 */
std::string expand_path(const std::string& path);

/**
 * Resolves path against the directory containing base_file.
 * Absolute paths and ~ paths are only expanded; an empty path stays empty.
 * Example: resolve_relative_to("config/gateway.json", "logs/gw.log") -> "config/logs/gw.log"
 */
std::string resolve_relative_to(const std::string& base_file, const std::string& path);

} // namespace voicegate
