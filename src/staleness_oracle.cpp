#include "updatechecker/staleness_oracle.hpp"

#include <system_error>

#include <spdlog/spdlog.h>

namespace updatechecker {

namespace fs = std::filesystem;

std::string_view toString(Staleness staleness) {
    switch (staleness) {
    case Staleness::NeedsUpdate:
        return "needs-update";
    case Staleness::UpToDate:
        return "up-to-date";
    case Staleness::Unknown:
        return "unknown";
    }
    return "unknown";
}

StalenessOracle::StalenessOracle(HttpClient& client, const MetadataStore& store,
                                 std::chrono::milliseconds probe_timeout)
    : client_(client), store_(store), probe_timeout_(probe_timeout) {}

Staleness StalenessOracle::needsUpdate(const std::string& url, const fs::path& target,
                                       bool use_content_length_check) const {
    std::error_code ec;
    if (!fs::exists(target, ec)) {
        spdlog::debug("Target '{}' doesn't exist - needs update", target.string());
        if (!store_.remove(target)) {
            spdlog::debug("Stale metadata for '{}' left in place", target.string());
        }
        return Staleness::NeedsUpdate;
    }

    const auto cached = store_.load(target);
    if (!cached) {
        if (!use_content_length_check) {
            spdlog::debug("No cached metadata for '{}' - needs update", target.string());
            return Staleness::NeedsUpdate;
        }
        return checkContentLength(url, target);
    }

    if (cached->source_url != url) {
        spdlog::debug("URL changed from '{}' to '{}' - needs update", cached->source_url, url);
        return Staleness::NeedsUpdate;
    }

    const auto live = client_.head(url, probe_timeout_);
    if (!live) {
        spdlog::debug("HEAD request for '{}' failed - can't determine if update needed", url);
        return Staleness::Unknown;
    }

    return compare(cached->descriptor, live->descriptor);
}

Staleness StalenessOracle::compare(const RemoteDescriptor& cached, const RemoteDescriptor& live) {
    if (cached.etag && live.etag) {
        if (*cached.etag != *live.etag) {
            spdlog::debug("ETag changed: '{}' -> '{}' - needs update", *cached.etag, *live.etag);
            return Staleness::NeedsUpdate;
        }
        spdlog::debug("ETag unchanged: '{}' - no update needed", *live.etag);
        return Staleness::UpToDate;
    }

    if (cached.last_modified && live.last_modified) {
        if (*cached.last_modified != *live.last_modified) {
            spdlog::debug("Last-Modified changed: '{}' -> '{}' - needs update",
                          *cached.last_modified, *live.last_modified);
            return Staleness::NeedsUpdate;
        }
        spdlog::debug("Last-Modified unchanged: '{}' - no update needed", *live.last_modified);
        return Staleness::UpToDate;
    }

    if (cached.content_length && live.content_length) {
        if (*cached.content_length != *live.content_length) {
            spdlog::debug("Content-Length changed: {} -> {} - needs update",
                          *cached.content_length, *live.content_length);
            return Staleness::NeedsUpdate;
        }
        spdlog::debug("Content-Length unchanged: {} - no update needed", *live.content_length);
        return Staleness::UpToDate;
    }

    spdlog::debug("No comparable headers found - can't determine if update needed");
    return Staleness::Unknown;
}

Staleness StalenessOracle::checkContentLength(const std::string& url,
                                              const fs::path& target) const {
    const auto live = client_.head(url, probe_timeout_);
    if (!live || !live->descriptor.content_length) {
        spdlog::debug("No Content-Length available for '{}' - deferring to hash check", url);
        return Staleness::Unknown;
    }

    std::error_code ec;
    const auto local_size = fs::file_size(target, ec);
    if (ec) {
        spdlog::debug("Cannot read size of '{}': {} - deferring to hash check", target.string(),
                      ec.message());
        return Staleness::Unknown;
    }

    if (local_size != *live->descriptor.content_length) {
        spdlog::debug("Content-Length {} differs from local size {} - needs update",
                      *live->descriptor.content_length, local_size);
        return Staleness::NeedsUpdate;
    }

    spdlog::debug("Content-Length matches local size {} - no update needed", local_size);
    if (!store_.save(target, live->descriptor, url)) {
        spdlog::debug("Content-Length decision for '{}' not persisted", target.string());
    }
    return Staleness::UpToDate;
}

} // namespace updatechecker
