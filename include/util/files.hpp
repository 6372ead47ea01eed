// Copyright (c) 2024 LunaChain
// Distributed under the MIT software license

#ifndef LUNACHAIN_UTIL_FILES_HPP
#define LUNACHAIN_UTIL_FILES_HPP

#include <filesystem>
#include <optional>
#include <string>

namespace lunachain {
namespace util {

/**
 * Crash-safe persistence helpers
 *
 * atomic_write_file writes to a temporary sibling, fsyncs it, then renames it
 * over the destination so a reader sees either the old or the new contents.
 */

// Returns true on success
bool atomic_write_file(const std::filesystem::path &path,
                       const std::string &data);

// Returns nullopt if the file is missing or unreadable
std::optional<std::string> read_file_string(const std::filesystem::path &path);

// Recursive; true if the directory exists afterwards
bool ensure_directory(const std::filesystem::path &dir);

// $HOME/.lunachain, or ./.lunachain when HOME is unset
std::filesystem::path get_default_datadir();

} // namespace util
} // namespace lunachain

#endif // LUNACHAIN_UTIL_FILES_HPP
