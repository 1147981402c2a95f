// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/files.hpp"

#include "util/logging.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <random>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace ipbeacon {
namespace util {

namespace {

bool sync_file(int fd) {
#if defined(__APPLE__)
  // fsync() on macOS does not flush the drive cache
  return fcntl(fd, F_FULLFSYNC, 0) == 0;
#else
  return fsync(fd) == 0;
#endif
}

bool sync_directory(const std::filesystem::path& dir) {
#if defined(__APPLE__)
  int fd = open(dir.c_str(), O_RDONLY);
  if (fd < 0)
    return false;
  bool result = fcntl(fd, F_FULLFSYNC, 0) == 0;
  close(fd);
  return result;
#else
  int fd = open(dir.c_str(), O_RDONLY | O_DIRECTORY);
  if (fd < 0)
    return false;
  bool result = fsync(fd) == 0;
  close(fd);
  return result;
#endif
}

std::string random_suffix() {
  static thread_local std::mt19937_64 gen(std::random_device{}());
  static thread_local std::uniform_int_distribution<uint64_t> dis;
  char buf[20];
  snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(dis(gen)));
  return std::string(buf);
}

void remove_quietly(const std::filesystem::path& path) {
  std::error_code ec;
  std::filesystem::remove(path, ec);
}

}  // anonymous namespace

bool atomic_write_file(const std::filesystem::path& path, const std::string& data, int mode) {
  auto parent = path.parent_path();
  if (!parent.empty() && !ensure_directory(parent)) {
    LOG_ERROR("atomic_write_file: Failed to create parent directory: {}", parent.string());
    return false;
  }

  auto temp_path = path;
  temp_path += ".tmp." + random_suffix();

  // O_EXCL: never reuse a file someone else created under our temp name
  // O_NOFOLLOW: refuse to write through a symlink planted at the temp name
  int fd = open(temp_path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_NOFOLLOW | O_CLOEXEC, mode);
  if (fd < 0) {
    LOG_ERROR("atomic_write_file: Failed to create temp file {}: {} (errno={})", temp_path.string(),
              std::strerror(errno), errno);
    return false;
  }

  // open() applies the umask; the caller asked for an exact mode
  if (fchmod(fd, static_cast<mode_t>(mode)) != 0) {
    LOG_WARN("atomic_write_file: Failed to set mode {:o} on {}: {}", mode, temp_path.string(), std::strerror(errno));
  }

  size_t total = 0;
  while (total < data.size()) {
    ssize_t n = write(fd, data.data() + total, data.size() - total);
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n <= 0) {
      LOG_ERROR("atomic_write_file: Failed to write to temp file {}: {} (errno={}, written {}/{})", temp_path.string(),
                std::strerror(errno), errno, total, data.size());
      close(fd);
      remove_quietly(temp_path);
      return false;
    }
    total += static_cast<size_t>(n);
  }

  if (!sync_file(fd)) {
    LOG_ERROR("atomic_write_file: Failed to fsync temp file {}: {} (errno={})", temp_path.string(),
              std::strerror(errno), errno);
    close(fd);
    remove_quietly(temp_path);
    return false;
  }

  close(fd);

  std::error_code ec;
  std::filesystem::rename(temp_path, path, ec);
  if (ec) {
    LOG_ERROR("atomic_write_file: Failed to rename {} to {}: {} (code={})", temp_path.string(), path.string(),
              ec.message(), ec.value());
    remove_quietly(temp_path);
    return false;
  }

  // Make the rename itself durable
  if (!parent.empty() && !sync_directory(parent)) {
    LOG_WARN("atomic_write_file: Failed to fsync directory {} after writing {}: {}", parent.string(), path.string(),
             std::strerror(errno));
  }

  return true;
}

bool atomic_write_file(const std::filesystem::path& path, const std::string& data) {
  return atomic_write_file(path, data, 0644);
}

ReadResult read_file_string(const std::filesystem::path& path, std::string& out, std::size_t max_size,
                            std::string* error) {
  out.clear();

  auto fail = [&](ReadResult result, const std::string& reason) {
    out.clear();
    if (error) {
      *error = reason;
    }
    return result;
  };

  int fd = open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd < 0) {
    int err = errno;
    if (err == ENOENT || err == ENOTDIR) {
      return fail(ReadResult::NotFound, std::strerror(err));
    }
    return fail(ReadResult::Error, std::strerror(err));
  }

  struct stat st;
  if (fstat(fd, &st) != 0) {
    int err = errno;
    close(fd);
    return fail(ReadResult::Error, std::strerror(err));
  }
  if (S_ISDIR(st.st_mode)) {
    close(fd);
    return fail(ReadResult::Error, "is a directory");
  }

  // st_size is advisory (the file may be replaced under us); the loop below
  // enforces max_size on what is actually read.
  char buf[4096];
  while (true) {
    ssize_t n = read(fd, buf, sizeof(buf));
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n < 0) {
      int err = errno;
      close(fd);
      return fail(ReadResult::Error, std::strerror(err));
    }
    if (n == 0) {
      break;
    }
    if (out.size() + static_cast<size_t>(n) > max_size) {
      close(fd);
      return fail(ReadResult::Error, "file exceeds " + std::to_string(max_size) + " bytes");
    }
    out.append(buf, static_cast<size_t>(n));
  }

  close(fd);
  return ReadResult::Success;
}

bool ensure_directory(const std::filesystem::path& dir) {
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (!ec) {
    return true;
  }
  std::error_code exists_ec;
  return std::filesystem::is_directory(dir, exists_ec);
}

std::filesystem::path get_default_datadir() {
  const char* home = std::getenv("HOME");
  if (home && *home) {
    return std::filesystem::path(home) / ".ipbeacon";
  }

  LOG_ERROR("get_default_datadir: HOME environment variable not set. "
            "Cannot determine default cache location. "
            "Please set HOME or use --cache-file explicitly.");
  return std::filesystem::path();
}

}  // namespace util
}  // namespace ipbeacon
