#include "updatechecker/transfer_engine.hpp"

#include <algorithm>
#include <array>
#include <atomic>
#include <cstdio>
#include <exception>
#include <mutex>
#include <random>
#include <system_error>
#include <thread>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <unistd.h>

namespace updatechecker {

namespace fs = std::filesystem;

namespace {

struct FileDeleter {
    void operator()(FILE* fp) const noexcept {
        if (fp) {
            std::fclose(fp);
        }
    }
};

using FilePtr = std::unique_ptr<FILE, FileDeleter>;

FilePtr openFile(const fs::path& path, const char* mode) {
    return FilePtr{std::fopen(path.c_str(), mode)};
}

// Flushes and closes, reporting any deferred write error.
bool closeFile(FilePtr& file) {
    if (!file) {
        return false;
    }
    const bool flushed = std::fflush(file.get()) == 0 && std::ferror(file.get()) == 0;
    const bool closed = std::fclose(file.release()) == 0;
    return flushed && closed;
}

void removeQuietly(const fs::path& path) {
    std::error_code ec;
    fs::remove_all(path, ec);
    if (ec) {
        spdlog::debug("Failed to clean up '{}': {}", path.string(), ec.message());
    }
}

} // namespace

std::vector<ChunkSpec> calculateChunks(std::uint64_t file_size, std::uint64_t chunk_size) {
    std::vector<ChunkSpec> chunks;
    if (file_size == 0) {
        return chunks;
    }
    chunk_size = std::max<std::uint64_t>(1, chunk_size);

    const std::uint64_t count = (file_size + chunk_size - 1) / chunk_size;
    chunks.reserve(static_cast<std::size_t>(count));
    for (std::uint64_t i = 0; i < count; ++i) {
        const std::uint64_t start = i * chunk_size;
        const std::uint64_t end = std::min(start + chunk_size - 1, file_size - 1);
        chunks.push_back({static_cast<std::size_t>(i), start, end});
    }
    return chunks;
}

std::optional<ByteRange> parseContentRange(const std::string& value) {
    unsigned long long first = 0;
    unsigned long long last = 0;
    if (std::sscanf(value.c_str(), "bytes %llu-%llu", &first, &last) != 2 || last < first) {
        return std::nullopt;
    }
    return ByteRange{first, last};
}

bool assembleChunks(const std::vector<fs::path>& chunk_files, const fs::path& destination) {
    auto out = openFile(destination, "wb");
    if (!out) {
        spdlog::error("Cannot create '{}' for reassembly", destination.string());
        return false;
    }

    std::array<char, 64 * 1024> buffer{};
    for (const auto& chunk_file : chunk_files) {
        auto in = openFile(chunk_file, "rb");
        if (!in) {
            spdlog::error("Missing chunk file '{}'", chunk_file.string());
            return false;
        }
        std::size_t read = 0;
        while ((read = std::fread(buffer.data(), 1, buffer.size(), in.get())) > 0) {
            if (std::fwrite(buffer.data(), 1, read, out.get()) != read) {
                spdlog::error("Failed to write '{}' during reassembly", destination.string());
                return false;
            }
        }
        if (std::ferror(in.get())) {
            spdlog::error("Failed to read chunk file '{}'", chunk_file.string());
            return false;
        }
    }

    if (!closeFile(out)) {
        spdlog::error("Failed to flush '{}' after reassembly", destination.string());
        return false;
    }
    return true;
}

class TransferEngine::Impl {
public:
    Impl(HttpClient& client, ProgressSink& progress, TransferOptions options)
        : client_(client), progress_(progress), options_(std::move(options)) {
        if (options_.temp_root.empty()) {
            std::error_code ec;
            const fs::path base = fs::temp_directory_path(ec);
            options_.temp_root = (ec ? fs::path{"."} : base) / "updatechecker";
        }
        options_.chunk_size = std::max<std::uint64_t>(1, options_.chunk_size);
    }

    std::optional<fs::path> fetch(const std::string& url, const fs::path& destination,
                                  std::optional<bool> chunked) {
        const TransferJob job = plan(url, destination, chunked);
        const std::string task = destination.string();

        fs::path partial = destination;
        partial += ".download";
        removeQuietly(partial);

        std::error_code ec;
        if (destination.has_parent_path()) {
            fs::create_directories(destination.parent_path(), ec);
            if (ec) {
                spdlog::error("Error downloading '{}' to '{}': cannot create directory: {}", url,
                              destination.string(), ec.message());
                return std::nullopt;
            }
        }

        progress_.begin(task, url, job.file_size.value_or(0));

        bool ok = false;
        if (job.strategy == TransferStrategy::Chunked) {
            ok = downloadChunked(job, partial);
            if (!ok) {
                spdlog::warn("Falling back to single connection download for '{}'", url);
                removeQuietly(partial);
                progress_.fallBack(task);
            }
        }
        if (!ok) {
            ok = downloadSingle(job, partial);
        }

        if (!ok) {
            removeQuietly(partial);
            progress_.fail(task, "download failed");
            spdlog::error("Error downloading '{}' to '{}'", url, destination.string());
            return std::nullopt;
        }

        fs::rename(partial, destination, ec);
        if (ec) {
            removeQuietly(partial);
            progress_.fail(task, ec.message());
            spdlog::error("Error downloading '{}' to '{}': {}", url, destination.string(),
                          ec.message());
            return std::nullopt;
        }

        progress_.finish(task);
        return destination;
    }

    TransferJob plan(const std::string& url, const fs::path& destination,
                     std::optional<bool> chunked) const {
        TransferJob job{url, destination, std::nullopt, TransferStrategy::Single};
        if (chunked && !*chunked) {
            spdlog::debug("Chunked download disabled for '{}'", url);
            return job;
        }

        const auto head = client_.head(url, options_.probe_timeout);
        if (!head || !head->descriptor.content_length) {
            spdlog::warn("Could not determine file size for '{}', using single connection", url);
            return job;
        }
        job.file_size = head->descriptor.content_length;

        if (!chunked && *job.file_size < options_.chunk_size) {
            spdlog::debug("File size: {} bytes, below chunk size, using single connection",
                          *job.file_size);
            return job;
        }
        if (!head->accepts_ranges) {
            spdlog::debug("Server doesn't support Range requests, using single connection");
            return job;
        }

        spdlog::debug("File size: {} bytes, chunked: true", *job.file_size);
        job.strategy = TransferStrategy::Chunked;
        return job;
    }

    const TransferOptions& options() const { return options_; }

private:
    bool downloadChunked(const TransferJob& job, const fs::path& partial) {
        const std::uint64_t file_size = job.file_size.value_or(0);
        const auto chunks = calculateChunks(file_size, options_.chunk_size);
        if (chunks.empty()) {
            auto empty = openFile(partial, "wb");
            return closeFile(empty);
        }

        const auto job_dir = makeJobDirectory();
        if (!job_dir) {
            return false;
        }

        spdlog::debug("Downloading '{}' in {} parallel chunks", job.url, chunks.size());

        const std::string task = job.destination.string();
        progress_.beginChunks(task, chunks.size());
        std::vector<std::uint64_t> chunk_bytes(chunks.size(), 0);
        std::mutex progress_mutex;
        std::atomic<bool> failed{false};

        std::vector<fs::path> chunk_files;
        chunk_files.reserve(chunks.size());
        for (const auto& chunk : chunks) {
            chunk_files.push_back(*job_dir / fmt::format("chunk_{:04}", chunk.index));
        }

        std::vector<std::thread> workers;
        workers.reserve(chunks.size());
        for (const auto& chunk : chunks) {
            const fs::path chunk_file = chunk_files[chunk.index];
            auto on_progress = [&, index = chunk.index](std::uint64_t bytes) {
                std::lock_guard<std::mutex> lock(progress_mutex);
                chunk_bytes[index] = bytes;
                std::uint64_t total = 0;
                for (const auto value : chunk_bytes) {
                    total += value;
                }
                progress_.advance(task, total, file_size);
            };
            try {
                workers.emplace_back([this, &job, &failed, chunk, chunk_file, on_progress]() {
                    if (downloadChunk(job.url, chunk, chunk_file, failed, on_progress)) {
                        progress_.chunkDone(job.destination.string());
                    } else {
                        failed = true;
                    }
                });
            } catch (const std::system_error& e) {
                spdlog::warn("Cannot start worker for chunk {}: {}", chunk.index, e.what());
                failed = true;
                break;
            }
        }

        for (auto& worker : workers) {
            if (worker.joinable()) {
                worker.join();
            }
        }
        workers.clear();

        bool ok = !failed;
        if (ok) {
            ok = assembleChunks(chunk_files, partial);
        }
        removeQuietly(*job_dir);
        return ok;
    }

    template <typename OnProgress>
    bool downloadChunk(const std::string& url, const ChunkSpec& chunk, const fs::path& chunk_file,
                       const std::atomic<bool>& failed, const OnProgress& on_progress) {
        try {
            auto file = openFile(chunk_file, "wb");
            if (!file) {
                spdlog::warn("Cannot create chunk file '{}'", chunk_file.string());
                return false;
            }

            const std::uint64_t expected = chunk.end_byte - chunk.start_byte + 1;
            std::uint64_t written = 0;
            bool range_ok = false;
            bool write_ok = true;

            GetRequest request;
            request.url = url;
            request.range = ByteRange{chunk.start_byte, chunk.end_byte};
            request.timeout = options_.chunk_timeout;

            BodyHandler handler;
            handler.on_response = [&](const GetResponse& response) {
                const auto range =
                    response.content_range ? parseContentRange(*response.content_range)
                                           : std::nullopt;
                range_ok = response.status == 206 && range && range->first == chunk.start_byte &&
                           range->last == chunk.end_byte;
            };
            handler.on_data = [&](const char* data, std::size_t size) {
                if (!range_ok || failed || written + size > expected) {
                    return false;
                }
                if (std::fwrite(data, 1, size, file.get()) != size) {
                    write_ok = false;
                    return false;
                }
                written += size;
                on_progress(written);
                return true;
            };

            const auto response = client_.get(request, handler);
            const bool closed = closeFile(file);
            if (!response || !range_ok) {
                spdlog::warn("Failed to download chunk {} ({}-{}) of '{}'", chunk.index,
                             chunk.start_byte, chunk.end_byte, url);
                return false;
            }
            if (!write_ok || !closed) {
                spdlog::warn("Failed to write chunk file '{}'", chunk_file.string());
                return false;
            }
            if (written != expected) {
                spdlog::warn("Chunk {} of '{}' incomplete: {} of {} bytes", chunk.index, url,
                             written, expected);
                return false;
            }
            return true;
        } catch (const std::exception& e) {
            spdlog::warn("Chunk {} of '{}' failed: {}", chunk.index, url, e.what());
            return false;
        }
    }

    bool downloadSingle(const TransferJob& job, const fs::path& partial) {
        const std::string task = job.destination.string();
        auto file = openFile(partial, "wb");
        if (!file) {
            spdlog::error("Cannot create '{}'", partial.string());
            return false;
        }

        std::optional<std::uint64_t> total;
        bool buffering = false;
        bool write_ok = true;
        std::uint64_t written = 0;
        std::string buffer;

        GetRequest request;
        request.url = job.url;
        request.timeout = options_.stream_timeout;

        BodyHandler handler;
        handler.on_response = [&](const GetResponse& response) {
            total = response.content_length;
            // Without a length the body is held in memory until its size is known.
            buffering = !total;
            if (total) {
                progress_.advance(task, 0, *total);
            }
        };
        handler.on_data = [&](const char* data, std::size_t size) {
            if (buffering) {
                buffer.append(data, size);
                return true;
            }
            if (std::fwrite(data, 1, size, file.get()) != size) {
                write_ok = false;
                return false;
            }
            written += size;
            progress_.advance(task, written, total.value_or(0));
            return true;
        };

        const auto response = client_.get(request, handler);
        if (!response) {
            return false;
        }

        if (buffering && !buffer.empty()) {
            if (std::fwrite(buffer.data(), 1, buffer.size(), file.get()) != buffer.size()) {
                write_ok = false;
            }
            written = buffer.size();
            progress_.advance(task, written, written);
        }

        if (!closeFile(file) || !write_ok) {
            spdlog::error("Failed to write '{}'", partial.string());
            return false;
        }
        if (total && written != *total) {
            spdlog::error("Transfer of '{}' truncated: {} of {} bytes", job.url, written, *total);
            return false;
        }
        return true;
    }

    std::optional<fs::path> makeJobDirectory() const {
        static std::atomic<std::uint64_t> counter{0};
        std::random_device rd;
        std::mt19937_64 gen(rd());
        std::uniform_int_distribution<unsigned long long> dist;

        for (int attempt = 0; attempt < 5; ++attempt) {
            const fs::path dir = options_.temp_root /
                                 fmt::format("job-{}-{}-{:x}", ::getpid(), counter++, dist(gen));
            std::error_code ec;
            if (fs::create_directories(dir, ec)) {
                return dir;
            }
            if (ec) {
                spdlog::warn("Cannot create chunk directory '{}': {}", dir.string(), ec.message());
                return std::nullopt;
            }
        }
        spdlog::warn("Cannot create a unique chunk directory under '{}'",
                     options_.temp_root.string());
        return std::nullopt;
    }

    HttpClient& client_;
    ProgressSink& progress_;
    TransferOptions options_;
};

TransferEngine::TransferEngine(HttpClient& client, ProgressSink& progress, TransferOptions options)
    : impl_(std::make_unique<Impl>(client, progress, std::move(options))) {}

TransferEngine::~TransferEngine() = default;

std::optional<fs::path> TransferEngine::fetch(const std::string& url, const fs::path& destination,
                                              std::optional<bool> chunked) {
    return impl_->fetch(url, destination, chunked);
}

TransferJob TransferEngine::plan(const std::string& url, const fs::path& destination,
                                 std::optional<bool> chunked) const {
    return impl_->plan(url, destination, chunked);
}

const TransferOptions& TransferEngine::options() const {
    return impl_->options();
}

} // namespace updatechecker
