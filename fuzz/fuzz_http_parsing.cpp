// Fuzz target for HTTP message parsing
// Tests ParseHttpRequest, ParseHttpResponse, FindHeadEnd and ParseHttpUrl
//
// The server parses request heads from anyone who can reach its port, and
// the client parses responses from echo services it does not control. Bugs
// in this code can:
// - Crash the server on a malformed request line or header
// - Read past the end of a truncated chunked body
// - Let a request target escape origin-form
//
// Target code:
// - src/network/http_message.cpp

#include "network/http_message.hpp"
#include <cstdint>
#include <cstddef>
#include <cstdlib>
#include <cstring>
#include <string>

using namespace ipbeacon::network;

// FuzzInput: Parse structured fuzz data
class FuzzInput {
public:
    FuzzInput(const uint8_t *data, size_t size) : data_(data), size_(size), offset_(0) {}

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

    switch (mode % 3) {
    case 0: {
        // Request heads, as the server session hands them over
        size_t head_end = FindHeadEnd(text);
        if (head_end != std::string::npos && head_end > text.size()) {
            std::abort();
        }
        auto request = ParseHttpRequest(text);
        if (request) {
            // Accepted targets are always origin-form and the path is a prefix
            if (request->target.empty() || request->target[0] != '/') {
                std::abort();
            }
            if (request->target.compare(0, request->path.size(), request->path) != 0) {
                std::abort();
            }
            if (request->version != "HTTP/1.0" && request->version != "HTTP/1.1") {
                std::abort();
            }
            (void)request->GetHeader("Host");
        }
        break;
    }
    case 1: {
        // Responses, as the prober receives them
        auto response = ParseHttpResponse(text);
        if (response) {
            if (response->status < 100 || response->status > 599) {
                std::abort();
            }
            if (response->body.size() > text.size()) {
                std::abort();
            }
            // Serializing what was parsed must not crash
            (void)response->Serialize(mode & 0x80);
        }
        break;
    }
    default: {
        auto url = ParseHttpUrl(text);
        if (url) {
            if (url->host.empty() || url->port == 0 || url->path.empty() || url->path[0] != '/') {
                std::abort();
            }
            // The rendered URL parses back to the same parts
            auto again = ParseHttpUrl(url->ToString());
            if (!again || again->tls != url->tls || again->host != url->host || again->port != url->port ||
                again->path != url->path) {
                std::abort();
            }
        }
        break;
    }
    }

    return 0;
}
