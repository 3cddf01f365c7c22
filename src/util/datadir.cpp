// Copyright (c) 2024 Mintnode
// Distributed under the MIT software license

#include "util/datadir.hpp"
#include "util/logging.hpp"
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <map>
#include <mutex>
#include <unistd.h>

namespace mintnode {
namespace util {

namespace {

// Owns an open lock file descriptor
class FileLock {
public:
  explicit FileLock(const std::filesystem::path &file)
      : fd_(open(file.c_str(), O_RDWR | O_CREAT, 0644)) {
    if (fd_ == -1) {
      reason_ = std::strerror(errno);
    }
  }

  ~FileLock() {
    if (fd_ != -1) {
      close(fd_);
    }
  }

  FileLock(const FileLock &) = delete;
  FileLock &operator=(const FileLock &) = delete;

  bool is_open() const { return fd_ != -1; }

  bool TryLock() {
    if (fd_ == -1) {
      return false;
    }
    struct flock lock {};
    lock.l_type = F_WRLCK;
    lock.l_whence = SEEK_SET;
    lock.l_start = 0;
    lock.l_len = 0; // whole file
    if (fcntl(fd_, F_SETLK, &lock) == -1) {
      reason_ = std::strerror(errno);
      return false;
    }
    return true;
  }

  const std::string &reason() const { return reason_; }

private:
  int fd_;
  std::string reason_;
};

std::mutex g_dir_locks_mutex;
std::map<std::string, std::unique_ptr<FileLock>> g_dir_locks;

} // namespace

bool ensure_directory(const std::filesystem::path &dir) {
  std::error_code ec;
  if (std::filesystem::is_directory(dir, ec)) {
    return true;
  }
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    LOG_ERROR("failed to create directory {}: {}", dir.string(), ec.message());
    return false;
  }
  return true;
}

std::filesystem::path get_default_datadir() {
  const char *home = std::getenv("HOME");
  if (home == nullptr || *home == '\0') {
    return std::filesystem::path(".mintnode");
  }
  return std::filesystem::path(home) / ".mintnode";
}

LockResult LockDirectory(const std::filesystem::path &directory,
                         const std::string &lockfile_name) {
  std::lock_guard<std::mutex> lock(g_dir_locks_mutex);

  auto lockfile_path = directory / lockfile_name;
  auto key = lockfile_path.string();
  if (g_dir_locks.count(key) != 0) {
    return LockResult::SUCCESS;
  }

  auto file_lock = std::make_unique<FileLock>(lockfile_path);
  if (!file_lock->is_open()) {
    LOG_ERROR("failed to create lock file {}: {}", key, file_lock->reason());
    return LockResult::ERROR_WRITE;
  }
  if (!file_lock->TryLock()) {
    LOG_ERROR("failed to lock directory {}: {}", directory.string(),
              file_lock->reason());
    return LockResult::ERROR_LOCK;
  }

  g_dir_locks.emplace(key, std::move(file_lock));
  return LockResult::SUCCESS;
}

void UnlockDirectory(const std::filesystem::path &directory,
                     const std::string &lockfile_name) {
  std::lock_guard<std::mutex> lock(g_dir_locks_mutex);
  g_dir_locks.erase((directory / lockfile_name).string());
}

} // namespace util
} // namespace mintnode
