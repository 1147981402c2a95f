// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Unix/POSIX implementation (Linux/macOS only)

#include "util/fs_lock.hpp"

#include "util/logging.hpp"

#include <cerrno>
#include <cstring>
#include <map>
#include <memory>
#include <mutex>

#include <fcntl.h>
#include <unistd.h>

namespace ipbeacon {
namespace util {

namespace fs = std::filesystem;

namespace {

constexpr const char* kLockFileName = ".lock";

// Open descriptor on the lock file; closing it drops the fcntl lock
class LockFile {
public:
  explicit LockFile(const fs::path& file) {
    // O_CLOEXEC: the scp child must not inherit the lock descriptor
    fd_ = open(file.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
  }
  ~LockFile() {
    if (fd_ != -1) {
      close(fd_);
    }
  }
  LockFile(const LockFile&) = delete;
  LockFile& operator=(const LockFile&) = delete;

  int fd() const { return fd_; }

private:
  int fd_{-1};
};

struct flock whole_file(short type) {
  struct flock lock;
  std::memset(&lock, 0, sizeof(lock));
  lock.l_type = type;
  lock.l_whence = SEEK_SET;
  lock.l_start = 0;
  lock.l_len = 0;
  return lock;
}

// Who holds a conflicting lock, as far as F_GETLK can tell
std::string describe_holder(int fd) {
  struct flock probe = whole_file(F_WRLCK);
  if (fcntl(fd, F_GETLK, &probe) == 0 && probe.l_type != F_UNLCK && probe.l_pid > 0) {
    return "held by pid " + std::to_string(probe.l_pid);
  }
  return "held by another process";
}

// Locks held by this process, keyed by lock file path
std::mutex g_dir_locks_mutex;
std::map<std::string, std::unique_ptr<LockFile>> g_dir_locks;

}  // namespace

LockResult LockDirectory(const fs::path& directory, std::string* error) {
  std::lock_guard<std::mutex> guard(g_dir_locks_mutex);

  const fs::path lockfile_path = directory / kLockFileName;
  const std::string key = lockfile_path.string();

  if (g_dir_locks.find(key) != g_dir_locks.end()) {
    return LockResult::Success;
  }

  auto file = std::make_unique<LockFile>(lockfile_path);
  if (file->fd() == -1) {
    if (error) {
      *error = key + ": " + std::strerror(errno);
    }
    return LockResult::ErrorWrite;
  }

  struct flock lock = whole_file(F_WRLCK);
  if (fcntl(file->fd(), F_SETLK, &lock) == -1) {
    if (error) {
      *error = (errno == EACCES || errno == EAGAIN) ? key + " " + describe_holder(file->fd())
                                                    : key + ": " + std::strerror(errno);
    }
    return LockResult::ErrorLock;
  }

  g_dir_locks.emplace(key, std::move(file));
  LOG_TRACE("Acquired directory lock: {}", directory.string());
  return LockResult::Success;
}

void UnlockDirectory(const fs::path& directory) {
  std::lock_guard<std::mutex> guard(g_dir_locks_mutex);

  auto it = g_dir_locks.find((directory / kLockFileName).string());
  if (it != g_dir_locks.end()) {
    LOG_TRACE("Released directory lock: {}", directory.string());
    g_dir_locks.erase(it);
  }
}

}  // namespace util
}  // namespace ipbeacon
