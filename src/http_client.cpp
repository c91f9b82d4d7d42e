#include "updatechecker/http_client.hpp"
#include "updatechecker/detail/string_utils.hpp"

#include <spdlog/spdlog.h>

namespace updatechecker {

std::optional<std::string> HttpClient::readText(const std::string& url,
                                                const std::vector<Header>& headers,
                                                std::size_t max_bytes,
                                                std::chrono::milliseconds timeout) {
    std::string body;
    bool too_large = false;
    BodyHandler handler;
    handler.on_data = [&](const char* data, std::size_t size) {
        if (size > max_bytes - body.size()) {
            too_large = true;
            return false;
        }
        body.append(data, size);
        return true;
    };

    GetRequest request;
    request.url = url;
    request.headers = headers;
    request.timeout = timeout;

    const auto response = get(request, handler);
    if (too_large) {
        spdlog::warn("Response from '{}' exceeds {} bytes", url, max_bytes);
        return std::nullopt;
    }
    if (!response) {
        return std::nullopt;
    }
    return detail::trim(body);
}

} // namespace updatechecker
