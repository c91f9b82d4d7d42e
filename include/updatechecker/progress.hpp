#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace updatechecker {

struct Progress {
    std::string url;
    std::string filename;
    std::uint64_t total_bytes{0};
    std::uint64_t downloaded_bytes{0};
    bool is_running{false};
    bool has_error{false};
    std::string error_message;
    // Zero for a single-stream transfer.
    std::size_t chunks_total{0};
    std::size_t chunks_done{0};
    // Set when a chunked attempt was abandoned for a single stream.
    bool fell_back{false};
};

/*
 * Shared progress state for every transfer in a run, keyed by destination path.
 * All members are safe to call from any thread.
 */
class ProgressSink {
public:
    // Starts (or restarts) tracking; a restart resets the byte count.
    void begin(const std::string& filename, const std::string& url, std::uint64_t total_bytes);
    // Byte counts never move backwards within one attempt.
    void advance(const std::string& filename, std::uint64_t downloaded_bytes,
                 std::uint64_t total_bytes);
    void finish(const std::string& filename);
    void fail(const std::string& filename, std::string message);

    void beginChunks(const std::string& filename, std::size_t chunk_count);
    void chunkDone(const std::string& filename);
    // Drops chunk state and byte count; the task keeps running as a single stream.
    void fallBack(const std::string& filename);

    // Forgets every task that is no longer running. Returns how many were removed.
    std::size_t clearFinished();

    [[nodiscard]] std::optional<Progress> find(const std::string& filename) const;
    [[nodiscard]] std::vector<Progress> snapshot() const;
    [[nodiscard]] bool hasActiveTasks() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, Progress> tasks_;
};

} // namespace updatechecker
