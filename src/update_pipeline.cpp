#include "updatechecker/update_pipeline.hpp"
#include "updatechecker/detail/string_utils.hpp"
#include "updatechecker/file_hash.hpp"
#include "updatechecker/source_resolver.hpp"

#include <system_error>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace updatechecker {

namespace fs = std::filesystem;

namespace {

// A hash reference holds one digest and maybe a filename.
constexpr std::size_t kMaxHashReferenceBytes = 64 * 1024;

bool pathExists(const fs::path& path) {
    std::error_code ec;
    return fs::exists(path, ec);
}

ProcessQuery queryFor(const std::string& executable) {
    ProcessQuery query;
    const fs::path path{executable};
    if (path.has_parent_path()) {
        query.exe_path = executable;
    } else {
        query.name = executable;
    }
    return query;
}

} // namespace

std::string_view toString(Outcome outcome) {
    switch (outcome) {
    case Outcome::Downloaded:
        return "downloaded";
    case Outcome::Updated:
        return "updated";
    case Outcome::UpToDate:
        return "up to date";
    case Outcome::Unchanged:
        return "unchanged";
    case Outcome::Failed:
        return "failed";
    }
    return "unknown";
}

std::string_view toString(PipelineState state) {
    switch (state) {
    case PipelineState::Start:
        return "Start";
    case PipelineState::CheckExistence:
        return "CheckExistence";
    case PipelineState::DownloadFresh:
        return "DownloadFresh";
    case PipelineState::CheckStaleness:
        return "CheckStaleness";
    case PipelineState::UpToDate:
        return "UpToDate";
    case PipelineState::ResolveViaHash:
        return "ResolveViaHash";
    case PipelineState::NoChange:
        return "NoChange";
    case PipelineState::Replace:
        return "Replace";
    case PipelineState::KillLockingProcess:
        return "KillLockingProcess";
    case PipelineState::RetryBackupAfterKill:
        return "RetryBackupAfterKill";
    case PipelineState::PostProcess:
        return "PostProcess";
    case PipelineState::End:
        return "End";
    case PipelineState::Failed:
        return "Failed";
    }
    return "Unknown";
}

fs::path backupPath(const fs::path& target) {
    fs::path backup = target;
    backup += kBackupSuffix;
    return backup;
}

UpdatePipeline::UpdatePipeline(PipelineContext& context, Entry entry)
    : context_(context), entry_(std::move(entry)) {}

EntryReport UpdatePipeline::run() {
    history_.clear();
    killed_ = false;
    post_process_stopped_ = false;
    history_.push_back(PipelineState::Start);

    if (!isValidEntryName(entry_.name)) {
        return fail("entry name is not usable as a directory name");
    }
    if (!resolveTarget()) {
        return fail("could not resolve a download URL or target file");
    }

    transition(PipelineState::CheckExistence);
    if (!pathExists(target_)) {
        return downloadFresh();
    }

    if (context_.force || entry_.force) {
        spdlog::info("[{}] Force mode: replacing '{}'", entry_.name, target_.string());
        return replace(std::nullopt);
    }

    transition(PipelineState::CheckStaleness);
    const Staleness staleness =
        context_.oracle.needsUpdate(url_, target_, entry_.use_content_length_check);
    spdlog::debug("[{}] Staleness of '{}': {}", entry_.name, target_.string(), toString(staleness));
    if (staleness == Staleness::UpToDate) {
        transition(PipelineState::UpToDate);
        spdlog::info("[{}] No update needed for '{}'", entry_.name, target_.filename().string());
        transition(PipelineState::End);
        return {entry_.name, Outcome::UpToDate, target_.string()};
    }

    return resolveViaHash();
}

void UpdatePipeline::transition(PipelineState next) {
    spdlog::debug("[{}] {} -> {}", entry_.name, toString(history_.back()), toString(next));
    history_.push_back(next);
}

EntryReport UpdatePipeline::fail(std::string detail) {
    transition(PipelineState::Failed);
    spdlog::error("[{}] Update of '{}' from '{}' failed: {}", entry_.name, target_.string(),
                  url_.empty() ? entry_.url : url_, detail);
    return {entry_.name, Outcome::Failed, std::move(detail)};
}

bool UpdatePipeline::resolveTarget() {
    auto resolver = makeSourceResolver(entry_, context_.client, context_.github_token);
    const auto url = resolver->resolve(entry_);
    if (!url) {
        return false;
    }
    url_ = *url;
    target_ = entry_.target;

    std::error_code ec;
    if (fs::is_directory(target_, ec)) {
        const auto filename = urlToFilename(url_);
        if (!filename) {
            spdlog::warn("[{}] Target '{}' is a directory and '{}' names no file", entry_.name,
                         target_.string(), url_);
            return false;
        }
        target_ /= *filename;
        spdlog::debug("[{}] Target directory resolved to '{}'", entry_.name, target_.string());
    }
    return true;
}

EntryReport UpdatePipeline::downloadFresh() {
    transition(PipelineState::DownloadFresh);
    if (!context_.store.remove(target_)) {
        spdlog::debug("[{}] Could not remove stale metadata for '{}'", entry_.name, target_.string());
    }

    spdlog::info("[{}] Downloading '{}'", entry_.name, target_.filename().string());
    if (!context_.transfer.fetch(url_, target_, entry_.chunked_download)) {
        return fail("download failed");
    }
    refreshMetadata();

    postProcess();
    transition(PipelineState::End);
    return {entry_.name, Outcome::Downloaded,
            post_process_stopped_ ? "post-processing stopped" : target_.string()};
}

EntryReport UpdatePipeline::resolveViaHash() {
    transition(PipelineState::ResolveViaHash);

    const auto local = md5File(target_);
    if (!local) {
        spdlog::warn("[{}] Cannot hash '{}', replacing it", entry_.name, target_.string());
        return replace(std::nullopt);
    }

    std::optional<fs::path> candidate;
    std::optional<std::string> remote;
    if (entry_.md5_url) {
        remote = remoteHash();
        if (!remote) {
            spdlog::warn("[{}] Could not read remote hash from '{}', replacing", entry_.name,
                         *entry_.md5_url);
            return replace(std::nullopt);
        }
    } else {
        candidate = downloadCandidate();
        if (!candidate) {
            discardCandidates();
            return fail("download of update candidate failed");
        }
        remote = md5File(*candidate);
        if (!remote) {
            discardCandidates();
            return fail("cannot hash downloaded candidate");
        }
    }

    spdlog::debug("[{}] Local hash {}, remote hash {}", entry_.name, *local, *remote);
    if (*local == *remote) {
        transition(PipelineState::NoChange);
        spdlog::info("[{}] '{}' is unchanged", entry_.name, target_.filename().string());
        discardCandidates();
        refreshMetadata();
        transition(PipelineState::End);
        return {entry_.name, Outcome::Unchanged, target_.string()};
    }

    return replace(candidate);
}

EntryReport UpdatePipeline::replace(const std::optional<fs::path>& candidate) {
    transition(PipelineState::Replace);
    const fs::path backup = backupPath(target_);

    if (!context_.store.remove(target_)) {
        spdlog::debug("[{}] Could not remove stale metadata for '{}'", entry_.name, target_.string());
    }

    std::error_code ec = context_.replacer.backup(target_, backup);
    if (ec) {
        if (!isLockError(ec)) {
            discardCandidates();
            return fail(fmt::format("cannot back up '{}': {}", target_.string(), ec.message()));
        }
        spdlog::warn("[{}] '{}' is locked: {}", entry_.name, target_.string(), ec.message());
        if (!entry_.kill_if_locked) {
            discardCandidates();
            return fail("target is locked and no process to kill is configured");
        }

        transition(PipelineState::KillLockingProcess);
        killLockingProcesses();

        transition(PipelineState::RetryBackupAfterKill);
        ec = context_.replacer.backup(target_, backup);
        if (ec) {
            discardCandidates();
            return fail(fmt::format("target still locked after killing '{}': {}",
                                    *entry_.kill_if_locked, ec.message()));
        }
    }
    spdlog::debug("[{}] Backed up '{}' to '{}'", entry_.name, target_.string(), backup.string());

    bool placed = false;
    if (candidate && pathExists(*candidate)) {
        ec = context_.replacer.moveIntoPlace(*candidate, target_);
        if (ec) {
            spdlog::warn("[{}] Cannot move '{}' into place: {}", entry_.name, candidate->string(),
                         ec.message());
        } else {
            placed = true;
        }
    } else {
        spdlog::info("[{}] Downloading '{}'", entry_.name, target_.filename().string());
        placed = context_.transfer.fetch(url_, target_, entry_.chunked_download).has_value();
    }
    discardCandidates();

    if (!placed) {
        ec = context_.replacer.restore(backup, target_);
        if (ec) {
            spdlog::error("[{}] Cannot restore backup '{}': {}", entry_.name, backup.string(),
                          ec.message());
        } else {
            spdlog::info("[{}] Restored '{}' from backup", entry_.name, target_.string());
        }
        return fail("replacement failed");
    }

    spdlog::info("[{}] Updated '{}'", entry_.name, target_.filename().string());
    refreshMetadata();

    postProcess();
    transition(PipelineState::End);
    return {entry_.name, Outcome::Updated,
            post_process_stopped_ ? "post-processing stopped" : target_.string()};
}

void UpdatePipeline::killLockingProcesses() {
    const std::string& executable = *entry_.kill_if_locked;
    spdlog::warn("[{}] Killing '{}' to unlock '{}'", entry_.name, executable, target_.string());
    const std::size_t count = context_.processes.killMatching(queryFor(executable));
    spdlog::debug("[{}] Killed {} process(es) of '{}'", entry_.name, count, executable);
    killed_ = true;
}

void UpdatePipeline::postProcess() {
    transition(PipelineState::PostProcess);

    if (entry_.unzip_target && isArchiveName(target_.filename().string())) {
        if (!extractArchive()) {
            post_process_stopped_ = true;
        }
    }

    const fs::path backup = backupPath(target_);
    if (!pathExists(target_) && pathExists(backup)) {
        spdlog::warn("[{}] '{}' disappeared, restoring backup", entry_.name, target_.string());
        const std::error_code ec = context_.replacer.restore(backup, target_);
        if (ec) {
            spdlog::error("[{}] Cannot restore backup '{}': {}", entry_.name, backup.string(),
                          ec.message());
        }
        // The sidecar described the new download, not the restored file.
        if (!context_.store.remove(target_)) {
            spdlog::debug("[{}] Could not remove metadata for restored '{}'", entry_.name,
                          target_.string());
        }
    }

    if (post_process_stopped_) {
        spdlog::warn("[{}] Skipping launch after failed post-processing", entry_.name);
        return;
    }
    launchIfRequested();
}

bool UpdatePipeline::extractArchive() {
    const fs::path& destination = *entry_.unzip_target;
    if (context_.extractor.extract(target_, destination, entry_.archive_password, entry_.flatten)) {
        return true;
    }

    spdlog::warn("[{}] Extracting '{}' to '{}' failed", entry_.name, target_.string(),
                 destination.string());
    if (!entry_.kill_if_locked) {
        return false;
    }

    killLockingProcesses();
    if (context_.extractor.extract(target_, destination, entry_.archive_password, entry_.flatten)) {
        return true;
    }
    spdlog::warn("[{}] Extraction failed again after killing '{}'", entry_.name,
                 *entry_.kill_if_locked);
    return false;
}

void UpdatePipeline::launchIfRequested() {
    const std::string arguments = entry_.arguments.value_or("");
    if (killed_) {
        if (entry_.relaunch) {
            context_.launcher.launch(*entry_.kill_if_locked, arguments);
        }
        return;
    }
    if (entry_.launch_command && !entry_.launch_command->empty()) {
        context_.launcher.launch(*entry_.launch_command, arguments);
    }
}

void UpdatePipeline::refreshMetadata() {
    const auto head = context_.client.head(url_, context_.probe_timeout);
    if (!head) {
        spdlog::warn("[{}] Could not fetch headers for '{}', metadata not saved", entry_.name, url_);
        return;
    }
    context_.store.save(target_, head->descriptor, url_);
}

std::optional<std::string> UpdatePipeline::remoteHash() {
    const auto text = context_.client.readText(*entry_.md5_url, {}, kMaxHashReferenceBytes);
    if (!text) {
        return std::nullopt;
    }
    const std::string token = detail::firstToken(*text);
    if (token.empty()) {
        return std::nullopt;
    }
    return detail::toLower(token);
}

std::optional<fs::path> UpdatePipeline::downloadCandidate() {
    discardCandidates();
    const auto directory = candidateDirectory();
    if (!directory) {
        return std::nullopt;
    }
    std::error_code ec;
    fs::create_directories(*directory, ec);
    if (ec) {
        spdlog::warn("[{}] Cannot create '{}': {}", entry_.name, directory->string(), ec.message());
        return std::nullopt;
    }

    const fs::path candidate =
        *directory / urlToFilename(url_).value_or(target_.filename().string());
    spdlog::debug("[{}] Downloading candidate to '{}'", entry_.name, candidate.string());
    return context_.transfer.fetch(url_, candidate, entry_.chunked_download);
}

std::optional<fs::path> UpdatePipeline::candidateDirectory() const {
    if (!isValidEntryName(entry_.name)) {
        return std::nullopt;
    }
    const fs::path& root =
        context_.temp_root.empty() ? context_.transfer.options().temp_root : context_.temp_root;
    return root / entry_.name;
}

void UpdatePipeline::discardCandidates() const {
    const auto directory = candidateDirectory();
    if (!directory) {
        return;
    }
    std::error_code ec;
    fs::remove_all(*directory, ec);
    if (ec) {
        spdlog::debug("[{}] Could not remove '{}': {}", entry_.name, directory->string(),
                      ec.message());
    }
}

} // namespace updatechecker
