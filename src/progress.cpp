#include "updatechecker/progress.hpp"

#include <algorithm>
#include <utility>

namespace updatechecker {

void ProgressSink::begin(const std::string& filename, const std::string& url,
                         std::uint64_t total_bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    Progress& progress = tasks_[filename];
    progress.url = url;
    progress.filename = filename;
    progress.total_bytes = total_bytes;
    progress.downloaded_bytes = 0;
    progress.is_running = true;
    progress.has_error = false;
    progress.error_message.clear();
    progress.chunks_total = 0;
    progress.chunks_done = 0;
    progress.fell_back = false;
}

void ProgressSink::advance(const std::string& filename, std::uint64_t downloaded_bytes,
                           std::uint64_t total_bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    Progress& progress = tasks_[filename];
    progress.filename = filename;
    progress.is_running = true;
    progress.total_bytes = std::max(progress.total_bytes, total_bytes);
    progress.downloaded_bytes = std::max(progress.downloaded_bytes, downloaded_bytes);
}

void ProgressSink::finish(const std::string& filename) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = tasks_.find(filename);
    if (it == tasks_.end()) {
        return;
    }
    Progress& progress = it->second;
    if (progress.total_bytes == 0) {
        progress.total_bytes = progress.downloaded_bytes;
    }
    progress.downloaded_bytes = progress.total_bytes;
    progress.is_running = false;
}

void ProgressSink::fail(const std::string& filename, std::string message) {
    std::lock_guard<std::mutex> lock(mutex_);
    Progress& progress = tasks_[filename];
    progress.filename = filename;
    progress.is_running = false;
    progress.has_error = true;
    if (progress.error_message.empty()) {
        progress.error_message = std::move(message);
    }
}

void ProgressSink::beginChunks(const std::string& filename, std::size_t chunk_count) {
    std::lock_guard<std::mutex> lock(mutex_);
    Progress& progress = tasks_[filename];
    progress.chunks_total = chunk_count;
    progress.chunks_done = 0;
}

void ProgressSink::chunkDone(const std::string& filename) {
    std::lock_guard<std::mutex> lock(mutex_);
    Progress& progress = tasks_[filename];
    if (progress.chunks_done < progress.chunks_total) {
        ++progress.chunks_done;
    }
}

void ProgressSink::fallBack(const std::string& filename) {
    std::lock_guard<std::mutex> lock(mutex_);
    Progress& progress = tasks_[filename];
    progress.filename = filename;
    progress.downloaded_bytes = 0;
    progress.chunks_total = 0;
    progress.chunks_done = 0;
    progress.fell_back = true;
    progress.is_running = true;
}

std::size_t ProgressSink::clearFinished() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t removed = 0;
    for (auto it = tasks_.begin(); it != tasks_.end();) {
        if (it->second.is_running) {
            ++it;
        } else {
            it = tasks_.erase(it);
            ++removed;
        }
    }
    return removed;
}

std::optional<Progress> ProgressSink::find(const std::string& filename) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = tasks_.find(filename);
    if (it == tasks_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Progress> ProgressSink::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Progress> out;
    out.reserve(tasks_.size());
    for (const auto& item : tasks_) {
        out.push_back(item.second);
    }
    return out;
}

bool ProgressSink::hasActiveTasks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::any_of(tasks_.begin(), tasks_.end(),
                       [](const auto& item) { return item.second.is_running; });
}

} // namespace updatechecker
