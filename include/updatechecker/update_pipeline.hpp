#pragma once

#include "archive_extractor.hpp"
#include "entry.hpp"
#include "file_replacer.hpp"
#include "http_client.hpp"
#include "launcher.hpp"
#include "metadata_store.hpp"
#include "process_manager.hpp"
#include "staleness_oracle.hpp"
#include "transfer_engine.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace updatechecker {

enum class Outcome {
    Downloaded,
    Updated,
    UpToDate,
    Unchanged,
    Failed,
};

[[nodiscard]] std::string_view toString(Outcome outcome);

struct EntryReport {
    std::string name;
    Outcome outcome{Outcome::Failed};
    std::string detail;

    [[nodiscard]] bool succeeded() const { return outcome != Outcome::Failed; }
};

enum class PipelineState {
    Start,
    CheckExistence,
    DownloadFresh,
    CheckStaleness,
    UpToDate,
    ResolveViaHash,
    NoChange,
    Replace,
    KillLockingProcess,
    RetryBackupAfterKill,
    PostProcess,
    End,
    Failed,
};

[[nodiscard]] std::string_view toString(PipelineState state);

// Collaborators shared by every pipeline of a run. None of them is owned here.
struct PipelineContext {
    HttpClient& client;
    TransferEngine& transfer;
    const MetadataStore& store;
    const StalenessOracle& oracle;
    FileReplacer& replacer;
    ProcessManager& processes;
    Launcher& launcher;
    ArchiveExtractor& extractor;

    std::optional<std::string> github_token;
    // Candidates land in <temp_root>/<entry name>/; empty uses the transfer engine's root.
    std::filesystem::path temp_root;
    // Run-level force mode; an entry may also request it.
    bool force{false};
    std::chrono::milliseconds probe_timeout{std::chrono::seconds(30)};
};

inline constexpr const char* kBackupSuffix = ".bak";

[[nodiscard]] std::filesystem::path backupPath(const std::filesystem::path& target);

/*
 * Brings one entry's target in line with its remote:
 *
 *   Start -> CheckExistence -> DownloadFresh -> PostProcess -> End
 *                           -> CheckStaleness -> UpToDate
 *                                             -> ResolveViaHash -> NoChange
 *                                                               -> Replace -> PostProcess -> End
 *
 * A locked target during Replace goes through KillLockingProcess and RetryBackupAfterKill
 * (one retry only). Every transition is logged at debug level and recorded in history().
 * A pipeline object runs once.
 */
class UpdatePipeline {
public:
    UpdatePipeline(PipelineContext& context, Entry entry);

    EntryReport run();

    [[nodiscard]] const std::vector<PipelineState>& history() const { return history_; }
    [[nodiscard]] bool killed() const { return killed_; }
    [[nodiscard]] const std::filesystem::path& target() const { return target_; }

private:
    void transition(PipelineState next);
    EntryReport fail(std::string detail);

    bool resolveTarget();
    EntryReport downloadFresh();
    EntryReport resolveViaHash();
    EntryReport replace(const std::optional<std::filesystem::path>& candidate);
    void killLockingProcesses();
    void postProcess();
    bool extractArchive();
    void launchIfRequested();
    void refreshMetadata();

    [[nodiscard]] std::optional<std::string> remoteHash();
    [[nodiscard]] std::optional<std::filesystem::path> downloadCandidate();
    // Unset when the entry name is not a single path component.
    [[nodiscard]] std::optional<std::filesystem::path> candidateDirectory() const;
    void discardCandidates() const;

    PipelineContext& context_;
    Entry entry_;
    std::string url_;
    std::filesystem::path target_;
    bool killed_{false};
    bool post_process_stopped_{false};
    std::vector<PipelineState> history_;
};

} // namespace updatechecker
