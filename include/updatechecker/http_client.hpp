#pragma once

#include "remote_descriptor.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace updatechecker {

// Upper bound on a text body such as an API response.
constexpr std::size_t kMaxTextBytes = 16 * 1024 * 1024;

struct Header {
    std::string name;
    std::string value;
};

// Inclusive byte range, as sent in a "Range: bytes=first-last" header.
struct ByteRange {
    std::uint64_t first{0};
    std::uint64_t last{0};
};

struct HeadResponse {
    long status{0};
    RemoteDescriptor descriptor;
    bool accepts_ranges{false};
};

struct GetRequest {
    std::string url;
    std::optional<ByteRange> range;
    std::vector<Header> headers;
    std::chrono::milliseconds timeout{30000};
};

// Headers of a successful GET, known before the first body byte is delivered.
struct GetResponse {
    long status{0};
    std::optional<std::uint64_t> content_length;
    std::optional<std::string> content_range;
};

struct BodyHandler {
    // Called once per successful response, before the first call to on_data.
    std::function<void(const GetResponse&)> on_response;
    // Return false to abort the transfer.
    std::function<bool(const char* data, std::size_t size)> on_data;
};

/*
 * Transport used by every component that talks to a server.
 *
 * Both calls follow redirects. A transport error or a non-2xx status is a failure and yields
 * std::nullopt; the body handler is never invoked for a failed response.
 */
class HttpClient {
public:
    virtual ~HttpClient() = default;

    [[nodiscard]] virtual std::optional<HeadResponse> head(const std::string& url,
                                                           std::chrono::milliseconds timeout) = 0;

    [[nodiscard]] virtual std::optional<GetResponse> get(const GetRequest& request,
                                                         const BodyHandler& handler) = 0;

    // Whole body as text with surrounding whitespace removed. A body longer than max_bytes
    // aborts the transfer and yields std::nullopt.
    [[nodiscard]] std::optional<std::string> readText(const std::string& url,
                                                      const std::vector<Header>& headers = {},
                                                      std::size_t max_bytes = kMaxTextBytes,
                                                      std::chrono::milliseconds timeout =
                                                          std::chrono::seconds(30));
};

} // namespace updatechecker
