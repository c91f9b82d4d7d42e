#pragma once

#include <curl/curl.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace updatechecker::detail {

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using CurlHeaderList = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

// Initializes libcurl once per process and registers global cleanup at exit.
void ensureCurlInitialized();

[[nodiscard]] CurlHandle makeCurlHandle();

// Response headers relevant to the client, parsed line by line from CURLOPT_HEADERFUNCTION.
// A new status line resets the state so that only the final response of a redirect chain counts.
struct ResponseHeaders {
    std::optional<std::string> etag;
    std::optional<std::string> last_modified;
    std::optional<std::uint64_t> content_length;
    std::optional<std::string> content_range;
    bool accepts_ranges{false};

    void consumeLine(std::string_view line);
};

} // namespace updatechecker::detail
