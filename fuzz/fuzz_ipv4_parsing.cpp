// Fuzz target for IPv4 address parsing and classification
// Tests ParseIPv4, IsValidIPv4, NonRoutableReason, IsRoutableIPv4, Trim and EscapeForLog
//
// Every address the client pushes and the server serves passes through
// these functions, and every one of them comes from an untrusted source
// (echo service bodies, the cache file, the served IP file). Bugs can:
// - Accept a non-address that is then pushed or served
// - Read out of bounds on short or unterminated input
// - Disagree between parse and format (non-canonical forms)
//
// Target code:
// - src/util/netaddress.cpp
// - src/util/string_parsing.cpp

#include "util/netaddress.hpp"
#include "util/string_parsing.hpp"
#include <cstdint>
#include <cstddef>
#include <cstdlib>
#include <cstring>
#include <string>

using namespace ipbeacon::util;

// FuzzInput: Parse structured fuzz data
class FuzzInput {
public:
    FuzzInput(const uint8_t *data, size_t size) : data_(data), size_(size), offset_(0) {}

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

private:
    const uint8_t *data_;
    size_t size_;
    size_t offset_;
};

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    if (size < 1) return 0;

    FuzzInput input(data, size);
    uint8_t mode = input.read<uint8_t>();
    std::string text = input.read_remaining();

    // TEST 1: accepted input is exactly the canonical rendering of its bytes
    auto bytes = ParseIPv4(text);
    if (bytes) {
        std::string canonical = std::to_string((*bytes)[0]) + "." + std::to_string((*bytes)[1]) + "." +
                                std::to_string((*bytes)[2]) + "." + std::to_string((*bytes)[3]);
        if (canonical != text) {
            std::abort();  // non-canonical form accepted
        }
        if (text.size() < 7 || text.size() > 15) {
            std::abort();
        }
    }

    // TEST 2: the boolean helpers agree with the parser
    if (IsValidIPv4(text) != bytes.has_value()) {
        std::abort();
    }
    if (IsRoutableIPv4(text) && !bytes) {
        std::abort();
    }
    if (bytes && IsRoutableIPv4(text) == NonRoutableReason(text).has_value()) {
        std::abort();  // a valid address is routable exactly when no range claims it
    }
    if (!bytes && NonRoutableReason(text)) {
        std::abort();
    }

    // TEST 3: Trim never grows the input and the trimmed value is a substring
    std::string_view trimmed = Trim(text);
    if (trimmed.size() > text.size()) {
        std::abort();
    }
    if (IsValidIPv4(trimmed) && text.find(trimmed) == std::string::npos) {
        std::abort();
    }

    // TEST 4: escaped log text is printable and bounded
    size_t max_len = (mode & 0x7F) + 1;
    std::string escaped = EscapeForLog(text, max_len);
    for (char c : escaped) {
        if (static_cast<unsigned char>(c) < 0x20 || static_cast<unsigned char>(c) >= 0x7F) {
            std::abort();
        }
    }
    if (escaped.size() > max_len * 4 + 3) {
        std::abort();
    }

    return 0;
}
