#pragma once

#include "http_client.hpp"
#include "progress.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace updatechecker {

constexpr std::uint64_t kDefaultChunkSize = 10ull * 1024ull * 1024ull;

// Inclusive byte range fetched by one chunk worker; index fixes the reassembly order.
struct ChunkSpec {
    std::size_t index{0};
    std::uint64_t start_byte{0};
    std::uint64_t end_byte{0};
};

inline bool operator==(const ChunkSpec& lhs, const ChunkSpec& rhs) {
    return lhs.index == rhs.index && lhs.start_byte == rhs.start_byte &&
           lhs.end_byte == rhs.end_byte;
}

// Contiguous, non-overlapping ranges covering [0, file_size); empty for a zero-byte file.
[[nodiscard]] std::vector<ChunkSpec> calculateChunks(std::uint64_t file_size,
                                                     std::uint64_t chunk_size = kDefaultChunkSize);

// Parses "bytes <first>-<last>/<total|*>".
[[nodiscard]] std::optional<ByteRange> parseContentRange(const std::string& value);

// Concatenates files in the given order into destination.
bool assembleChunks(const std::vector<std::filesystem::path>& chunk_files,
                    const std::filesystem::path& destination);

enum class TransferStrategy { Single, Chunked };

struct TransferJob {
    std::string url;
    std::filesystem::path destination;
    std::optional<std::uint64_t> file_size;
    TransferStrategy strategy{TransferStrategy::Single};
};

struct TransferOptions {
    std::uint64_t chunk_size{kDefaultChunkSize};
    // Parent of the private per-job chunk directories; empty selects <tmp>/updatechecker.
    std::filesystem::path temp_root;
    std::chrono::milliseconds probe_timeout{std::chrono::seconds(30)};
    std::chrono::milliseconds chunk_timeout{std::chrono::seconds(300)};
    std::chrono::milliseconds stream_timeout{std::chrono::seconds(3000)};
};

/*
 * Downloads one URL to one path, either as a single stream or as parallel byte-range chunks.
 *
 * The destination is only replaced once the whole body is on disk; a failed fetch leaves
 * whatever was at the destination before. A failed chunk demotes the whole job to a single
 * stream once; chunks are never retried on their own.
 */
class TransferEngine {
public:
    TransferEngine(HttpClient& client, ProgressSink& progress, TransferOptions options = {});
    ~TransferEngine();

    TransferEngine(const TransferEngine&) = delete;
    TransferEngine& operator=(const TransferEngine&) = delete;

    // chunked: unset probes the server, true/false forces the preference.
    [[nodiscard]] std::optional<std::filesystem::path>
    fetch(const std::string& url, const std::filesystem::path& destination,
          std::optional<bool> chunked = std::nullopt);

    [[nodiscard]] TransferJob plan(const std::string& url, const std::filesystem::path& destination,
                                   std::optional<bool> chunked) const;

    [[nodiscard]] const TransferOptions& options() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace updatechecker
