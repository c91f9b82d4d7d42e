#include "updatechecker/progress_panel.hpp"

#include <algorithm>
#include <array>
#include <filesystem>

#include <fmt/format.h>

namespace updatechecker {

namespace {

constexpr std::size_t kNameWidth = 24;

std::string displayName(const std::string& filename) {
    std::string name = std::filesystem::path{filename}.filename().string();
    if (name.empty()) {
        name = filename.empty() ? std::string{"?"} : filename;
    }
    if (name.size() > kNameWidth) {
        name = name.substr(0, kNameWidth - 1) + "~";
    }
    return name;
}

} // namespace

ProgressPanel::ProgressPanel(const ProgressSink& sink, std::ostream& out)
    : sink_(sink), out_(out) {}

void ProgressPanel::redraw() {
    const auto lines = render();
    if (previous_lines_ > 0) {
        out_ << "\033[" << previous_lines_ << "F\033[J";
    }
    for (const auto& line : lines) {
        out_ << line << '\n';
    }
    out_ << std::flush;
    previous_lines_ = lines.size();
}

std::vector<std::string> ProgressPanel::render() const {
    const auto transfers = sink_.snapshot();

    std::vector<std::string> lines;
    lines.reserve(transfers.size() + 1);

    std::size_t active = 0;
    std::size_t finished = 0;
    std::size_t failed = 0;
    std::uint64_t received = 0;
    for (const auto& progress : transfers) {
        lines.push_back(formatTransfer(progress));
        received += progress.downloaded_bytes;
        if (progress.has_error) {
            ++failed;
        } else if (progress.is_running) {
            ++active;
        } else {
            ++finished;
        }
    }

    lines.push_back(fmt::format("{} active, {} finished, {} failed, {} received", active,
                                finished, failed, formatSize(received)));
    return lines;
}

std::string ProgressPanel::formatTransfer(const Progress& progress) {
    std::string amount;
    if (progress.total_bytes > 0) {
        const auto percent = static_cast<int>(
            std::min<std::uint64_t>(100, progress.downloaded_bytes * 100 / progress.total_bytes));
        amount = fmt::format("{:>3}% {:>9} of {}", percent, formatSize(progress.downloaded_bytes),
                             formatSize(progress.total_bytes));
    } else if (progress.downloaded_bytes > 0) {
        amount = fmt::format("  ?% {:>9}", formatSize(progress.downloaded_bytes));
    } else {
        amount = "waiting";
    }

    std::string state;
    if (progress.has_error) {
        state = fmt::format("failed: {}", progress.error_message);
    } else if (!progress.is_running) {
        state = "done";
    }

    return fmt::format("{:<{}} {:<18} {:<28} {}", displayName(progress.filename), kNameWidth,
                       formatStrategy(progress), amount, state);
}

std::string ProgressPanel::formatStrategy(const Progress& progress) {
    if (progress.chunks_total > 0) {
        return fmt::format("chunks {}/{}", progress.chunks_done, progress.chunks_total);
    }
    return progress.fell_back ? "single (fallback)" : "single";
}

std::string ProgressPanel::formatSize(std::uint64_t bytes) {
    static constexpr std::array<const char*, 4> kUnits{"KB", "MB", "GB", "TB"};
    if (bytes < 1024) {
        return fmt::format("{} B", bytes);
    }
    double value = static_cast<double>(bytes) / 1024.0;
    std::size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < kUnits.size()) {
        value /= 1024.0;
        ++unit;
    }
    return fmt::format("{:.1f} {}", value, kUnits[unit]);
}

} // namespace updatechecker
