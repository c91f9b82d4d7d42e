#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace updatechecker {

// Identity of a remote artifact as reported by the server at one point in time.
struct RemoteDescriptor {
    std::optional<std::string> etag;
    std::optional<std::string> last_modified;
    std::optional<std::uint64_t> content_length;
};

// Sidecar record persisted next to a target file.
struct CachedMetadata {
    std::string source_url;
    RemoteDescriptor descriptor;
    std::chrono::system_clock::time_point cached_at{};
};

inline bool operator==(const RemoteDescriptor& lhs, const RemoteDescriptor& rhs) {
    return lhs.etag == rhs.etag && lhs.last_modified == rhs.last_modified &&
           lhs.content_length == rhs.content_length;
}

inline bool operator!=(const RemoteDescriptor& lhs, const RemoteDescriptor& rhs) {
    return !(lhs == rhs);
}

} // namespace updatechecker
