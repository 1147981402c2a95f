// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

namespace ipbeacon {
namespace util {

// Write data to path atomically: temp file in the same directory, fsync,
// fsync of the directory, rename over the target. Creates missing parent
// directories. A reader sees either the old content or the new content,
// never a partial write. Returns false (and logs) on any failure; the
// temp file is removed on every failure path.
bool atomic_write_file(const std::filesystem::path& path, const std::string& data, int mode);
bool atomic_write_file(const std::filesystem::path& path, const std::string& data);

enum class ReadResult {
  Success,
  NotFound,  // ENOENT or a missing parent directory
  Error,     // permission denied, is a directory, too large, I/O error
};

// Read a small file in full. On Success, out holds the content. On failure
// out is cleared and, if error is non-null, it receives a description.
// Files larger than max_size are rejected with Error.
ReadResult read_file_string(const std::filesystem::path& path, std::string& out, std::size_t max_size,
                            std::string* error = nullptr);

// create_directories that reports success if the directory already exists.
bool ensure_directory(const std::filesystem::path& dir);

// $HOME/.ipbeacon, or an empty path if HOME is not set.
std::filesystem::path get_default_datadir();

}  // namespace util
}  // namespace ipbeacon
