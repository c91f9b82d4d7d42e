#include "updatechecker/batch_scheduler.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <exception>
#include <thread>
#include <utility>

#include <spdlog/spdlog.h>

namespace updatechecker {

EntryRunner makePipelineRunner(PipelineContext& context) {
    return [&context](const Entry& entry) {
        UpdatePipeline pipeline(context, entry);
        return pipeline.run();
    };
}

BatchScheduler::BatchScheduler(EntryRunner runner, std::size_t concurrency)
    : runner_(std::move(runner)), concurrency_(std::max<std::size_t>(1, concurrency)) {}

std::size_t BatchScheduler::defaultConcurrency() {
    const unsigned int cores = std::thread::hardware_concurrency();
    return cores > 1 ? cores - 1 : 1;
}

std::vector<EntryReport> BatchScheduler::runAll(const std::vector<Entry>& entries) {
    std::vector<EntryReport> reports(entries.size());
    if (entries.empty()) {
        return reports;
    }

    const std::size_t worker_count = std::min(concurrency_, entries.size());
    spdlog::debug("Processing {} entries with {} worker(s)", entries.size(), worker_count);

    std::atomic<std::size_t> next{0};
    std::atomic<std::size_t> remaining{entries.size()};

    std::vector<std::thread> threads;
    threads.reserve(worker_count);
    for (std::size_t i = 0; i < worker_count; ++i) {
        threads.emplace_back([&]() {
            while (true) {
                const std::size_t index = next.fetch_add(1);
                if (index >= entries.size()) {
                    break;
                }
                reports[index] = runOne(entries[index]);
                remaining.fetch_sub(1);
            }
        });
    }

    if (panel_) {
        renderProgressLoop([&remaining]() { return remaining.load() == 0; });
    }

    for (auto& thread : threads) {
        if (thread.joinable()) {
            thread.join();
        }
    }

    if (progress_) {
        const std::size_t cleared = progress_->clearFinished();
        spdlog::debug("Cleared {} finished transfer(s)", cleared);
    }
    return reports;
}

EntryReport BatchScheduler::runOne(const Entry& entry) const {
    try {
        return runner_(entry);
    } catch (const std::exception& e) {
        spdlog::error("[{}] Unhandled error while updating '{}' from '{}': {}", entry.name,
                      entry.target.string(), entry.url, e.what());
        return {entry.name, Outcome::Failed, e.what()};
    } catch (...) {
        spdlog::error("[{}] Unknown error while updating '{}' from '{}'", entry.name,
                      entry.target.string(), entry.url);
        return {entry.name, Outcome::Failed, "unknown error"};
    }
}

void BatchScheduler::renderProgressLoop(const std::function<bool()>& done) {
    while (true) {
        panel_->redraw();
        if (done()) {
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
}

void logSummary(const std::vector<EntryReport>& reports) {
    std::size_t failed = 0;
    for (const auto& report : reports) {
        if (report.succeeded()) {
            spdlog::info("{}: {} ({})", report.name, toString(report.outcome), report.detail);
        } else {
            ++failed;
            spdlog::error("{}: {} ({})", report.name, toString(report.outcome), report.detail);
        }
    }
    spdlog::info("{} entries processed, {} failed", reports.size(), failed);
}

int exitStatus(const std::vector<EntryReport>& reports) {
    const bool any_failed = std::any_of(reports.begin(), reports.end(),
                                        [](const EntryReport& report) { return !report.succeeded(); });
    return any_failed ? 2 : 0;
}

} // namespace updatechecker
