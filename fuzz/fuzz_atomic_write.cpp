// Fuzz target for atomic file writes
// Tests atomic_write_file and read_file_string with random data, file names
// and modes
//
// The client cache and the served IP file are both replaced through
// atomic_write_file and read back through read_file_string. Bugs can cause:
// - Partial writes visible to a concurrent reader
// - Temp file leaks (disk space exhaustion)
// - Oversized reads when a file grows past its limit
//
// Target code:
// - src/util/files.cpp (atomic_write_file, read_file_string)

#include "util/files.hpp"
#include <algorithm>
#include <cstdint>
#include <cstddef>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <string>

using namespace ipbeacon::util;

// FuzzInput: Parse structured fuzz data
class FuzzInput {
public:
    FuzzInput(const uint8_t *data, size_t size) : data_(data), size_(size), offset_(0) {}

    // Read a string of specified length
    std::string read_string(size_t len) {
        if (offset_ + len > size_) {
            return "";
        }
        std::string result(reinterpret_cast<const char*>(data_ + offset_), len);
        offset_ += len;
        return result;
    }

    // Read remaining data as string
    std::string read_remaining() {
        if (offset_ >= size_) {
            return "";
        }
        std::string result(reinterpret_cast<const char*>(data_ + offset_), size_ - offset_);
        offset_ = size_;
        return result;
    }

    template<typename T>
    T read() {
        if (offset_ + sizeof(T) > size_) {
            return T{};
        }
        T value;
        std::memcpy(&value, data_ + offset_, sizeof(T));
        offset_ += sizeof(T);
        return value;
    }

    bool has_data() const { return offset_ < size_; }
    size_t remaining() const { return size_ - offset_; }

private:
    const uint8_t *data_;
    size_t size_;
    size_t offset_;
};

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    if (size < 4) {
        return 0;
    }

    FuzzInput input(data, size);

    uint16_t filename_len = input.read<uint16_t>() % 64;
    std::string filename = input.read_string(filename_len);

    // Owner must be able to read back what it wrote
    int mode = (input.read<uint16_t>() % 01000) | 0600;

    size_t data_len = std::min(input.remaining(), size_t(10 * 1024));
    std::string payload = input.read_string(data_len);

    auto fuzz_dir = std::filesystem::temp_directory_path() / "ipbeacon_fuzz_atomic";
    std::filesystem::remove_all(fuzz_dir);
    std::filesystem::create_directories(fuzz_dir);

    // Keep the file inside fuzz_dir
    for (char &c : filename) {
        if (c == '/' || c == '\\' || c == '\0' || c == '.' || c < 0x20 || c > 0x7E) {
            c = '_';
        }
    }
    if (filename.empty()) {
        filename = "fuzz";
    }
    auto file_path = fuzz_dir / filename;

    // TEST 1: write then read back exactly
    if (atomic_write_file(file_path, payload, mode)) {
        std::string back;
        std::string error;
        ReadResult result = read_file_string(file_path, back, payload.size() + 1, &error);
        if (result != ReadResult::Success || back != payload) {
            std::abort();
        }

        // TEST 2: a limit below the file size is an error, never a truncated read
        if (!payload.empty()) {
            std::string small;
            if (read_file_string(file_path, small, payload.size() - 1) != ReadResult::Error || !small.empty()) {
                std::abort();
            }
        }
    }

    // TEST 3: overwrite with the tail of the input
    std::string overwrite = input.read_remaining();
    if (atomic_write_file(file_path, overwrite, mode)) {
        std::string back;
        if (read_file_string(file_path, back, overwrite.size() + 1) != ReadResult::Success || back != overwrite) {
            std::abort();
        }
    }

    // TEST 4: no temp files are left behind
    size_t entries = 0;
    for (const auto& entry : std::filesystem::directory_iterator(fuzz_dir)) {
        (void)entry;
        ++entries;
    }
    if (entries > 1) {
        std::abort();
    }

    std::filesystem::remove_all(fuzz_dir);
    return 0;
}
