#pragma once

#include "entry.hpp"
#include "progress_panel.hpp"
#include "update_pipeline.hpp"

#include <cstddef>
#include <functional>
#include <vector>

namespace updatechecker {

using EntryRunner = std::function<EntryReport(const Entry&)>;

// Runs every entry through a fresh UpdatePipeline built on the shared context.
[[nodiscard]] EntryRunner makePipelineRunner(PipelineContext& context);

/*
 * Fixed-size worker pool over a batch of independent entries.
 *
 * Workers pull the next entry from a shared index until the batch is drained. An exception
 * escaping the runner turns into a Failed report for that entry only. Reports come back in
 * entry order whatever order the entries finished in.
 */
class BatchScheduler {
public:
    explicit BatchScheduler(EntryRunner runner, std::size_t concurrency = defaultConcurrency());

    // Redrawn every 200 ms while the batch runs; null disables it.
    void setProgressPanel(ProgressPanel* panel) { panel_ = panel; }
    // Finished transfers are dropped from this sink once a batch completes.
    void setProgressSink(ProgressSink* progress) { progress_ = progress; }

    std::vector<EntryReport> runAll(const std::vector<Entry>& entries);

    [[nodiscard]] std::size_t concurrency() const { return concurrency_; }

    // Available parallelism minus one, at least one.
    [[nodiscard]] static std::size_t defaultConcurrency();

private:
    EntryReport runOne(const Entry& entry) const;
    void renderProgressLoop(const std::function<bool()>& done);

    EntryRunner runner_;
    std::size_t concurrency_;
    ProgressPanel* panel_{nullptr};
    ProgressSink* progress_{nullptr};
};

void logSummary(const std::vector<EntryReport>& reports);

// 0 when every entry succeeded, 2 otherwise.
[[nodiscard]] int exitStatus(const std::vector<EntryReport>& reports);

} // namespace updatechecker
