// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <filesystem>
#include <string>

namespace ipbeacon {
namespace util {

enum class LockResult {
  Success,     // Lock acquired (or already held by this process)
  ErrorWrite,  // Could not create <directory>/.lock
  ErrorLock,   // Lock held by another process
};

/**
 * Lock a directory so that only one client polls against it.
 * Takes an exclusive fcntl() lock on <directory>/.lock, held until
 * UnlockDirectory() or process exit. On failure *error (when given)
 * describes why, naming the holder's pid for ErrorLock when the kernel
 * reports it.
 */
LockResult LockDirectory(const std::filesystem::path& directory, std::string* error = nullptr);

void UnlockDirectory(const std::filesystem::path& directory);

}  // namespace util
}  // namespace ipbeacon
