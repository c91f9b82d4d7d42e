#include "updatechecker/detail/curl_utils.hpp"
#include "updatechecker/detail/string_utils.hpp"

#include <cstdlib>
#include <mutex>
#include <stdexcept>

namespace updatechecker::detail {

void ensureCurlInitialized() {
    static std::once_flag flag;
    std::call_once(flag, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            throw std::runtime_error("Failed to initialize libcurl");
        }
        std::atexit([] { curl_global_cleanup(); });
    });
}

CurlHandle makeCurlHandle() {
    return CurlHandle{curl_easy_init(), &curl_easy_cleanup};
}

void ResponseHeaders::consumeLine(std::string_view line) {
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.remove_suffix(1);
    }
    if (line.empty()) {
        return;
    }

    if (line.size() >= 5 && toLower(line.substr(0, 5)) == "http/") {
        *this = ResponseHeaders{};
        return;
    }

    const auto colon = line.find(':');
    if (colon == std::string_view::npos) {
        return;
    }

    const std::string key = toLower(trim(line.substr(0, colon)));
    std::string value = trim(line.substr(colon + 1));

    if (key == "etag") {
        etag = std::move(value);
    } else if (key == "last-modified") {
        last_modified = std::move(value);
    } else if (key == "content-length") {
        content_length = parseUnsigned(value);
    } else if (key == "content-range") {
        content_range = std::move(value);
    } else if (key == "accept-ranges") {
        accepts_ranges = toLower(value) == "bytes";
    }
}

} // namespace updatechecker::detail
