// Copyright (c) 2024 Mintnode
// Distributed under the MIT software license

#ifndef MINTNODE_UTIL_DATADIR_HPP
#define MINTNODE_UTIL_DATADIR_HPP

#include <filesystem>
#include <string>

namespace mintnode {
namespace util {

// Create directory if it doesn't exist (recursive).
// Returns true on success or if it already exists.
bool ensure_directory(const std::filesystem::path &dir);

// ~/.mintnode, or ./.mintnode when HOME is unset
std::filesystem::path get_default_datadir();

enum class LockResult {
  SUCCESS,
  ERROR_WRITE, // Could not create the lock file
  ERROR_LOCK,  // Another process holds the lock
};

/**
 * Take an exclusive advisory lock on <directory>/<lockfile_name>. The lock is
 * held until UnlockDirectory() or process exit. Locking a directory this
 * process already holds succeeds.
 */
LockResult LockDirectory(const std::filesystem::path &directory,
                         const std::string &lockfile_name = ".lock");

void UnlockDirectory(const std::filesystem::path &directory,
                     const std::string &lockfile_name = ".lock");

} // namespace util
} // namespace mintnode

#endif // MINTNODE_UTIL_DATADIR_HPP
