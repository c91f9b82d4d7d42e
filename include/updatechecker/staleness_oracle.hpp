#pragma once

#include "http_client.hpp"
#include "metadata_store.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <string_view>

namespace updatechecker {

enum class Staleness {
    NeedsUpdate,
    UpToDate,
    // Nothing decisive was available; callers must fall back to a content hash.
    Unknown,
};

[[nodiscard]] std::string_view toString(Staleness staleness);

/*
 * Decides from cached and live identity headers whether a target differs from its remote,
 * without downloading the body. Live headers win in priority ETag, Last-Modified,
 * Content-Length; the first field present on both sides settles the answer.
 */
class StalenessOracle {
public:
    StalenessOracle(HttpClient& client, const MetadataStore& store,
                    std::chrono::milliseconds probe_timeout = std::chrono::seconds(30));

    [[nodiscard]] Staleness needsUpdate(const std::string& url,
                                        const std::filesystem::path& target,
                                        bool use_content_length_check) const;

    [[nodiscard]] static Staleness compare(const RemoteDescriptor& cached,
                                           const RemoteDescriptor& live);

private:
    [[nodiscard]] Staleness checkContentLength(const std::string& url,
                                               const std::filesystem::path& target) const;

    HttpClient& client_;
    const MetadataStore& store_;
    std::chrono::milliseconds probe_timeout_;
};

} // namespace updatechecker
