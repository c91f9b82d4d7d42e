#include "support/fake_http_client.hpp"
#include "support/fakes.hpp"

#include "updatechecker/file_hash.hpp"
#include "updatechecker/metadata_store.hpp"
#include "updatechecker/progress.hpp"
#include "updatechecker/staleness_oracle.hpp"
#include "updatechecker/transfer_engine.hpp"
#include "updatechecker/update_pipeline.hpp"

#include <gtest/gtest.h>

#include <algorithm>

using namespace updatechecker;
using namespace updatechecker::test;

namespace {

bool visited(const UpdatePipeline& pipeline, PipelineState state) {
    const auto& history = pipeline.history();
    return std::find(history.begin(), history.end(), state) != history.end();
}

} // namespace

class UpdatePipelineTest : public ::testing::Test {
protected:
    UpdatePipelineTest()
        : transfer_(client_, progress_, transferOptions()),
          oracle_(client_, store_),
          context_{client_, transfer_, store_, oracle_, replacer_, processes_, launcher_, extractor_} {
        context_.temp_root = dir_ / "candidates";
    }

    TransferOptions transferOptions() const {
        TransferOptions options;
        options.temp_root = dir_ / "chunks";
        return options;
    }

    Entry makeEntry(const std::string& filename = "tool.exe") const {
        Entry entry;
        entry.name = "tool";
        entry.url = "https://example.com/download/" + filename;
        entry.target = dir_ / filename;
        return entry;
    }

    void serve(const std::string& url, const std::string& body, const std::string& etag = "v2") {
        FakeResource resource;
        resource.body = body;
        resource.etag = etag;
        client_.set(url, resource);
    }

    TempDir dir_;
    FakeHttpClient client_;
    ProgressSink progress_;
    MetadataStore store_;
    TransferEngine transfer_;
    StalenessOracle oracle_;
    LockableReplacer replacer_;
    FakeProcessManager processes_;
    FakeLauncher launcher_;
    FakeExtractor extractor_;
    PipelineContext context_;
};

TEST_F(UpdatePipelineTest, MissingTargetIsDownloadedAndLaunched) {
    Entry entry = makeEntry();
    entry.launch_command = "tool";
    entry.arguments = "--quiet";
    serve(entry.url, "new contents");

    UpdatePipeline pipeline(context_, entry);
    const auto report = pipeline.run();

    EXPECT_EQ(report.outcome, Outcome::Downloaded);
    EXPECT_TRUE(visited(pipeline, PipelineState::DownloadFresh));
    EXPECT_FALSE(visited(pipeline, PipelineState::CheckStaleness));
    EXPECT_EQ(readFile(entry.target), "new contents");

    const auto metadata = store_.load(entry.target);
    ASSERT_TRUE(metadata);
    EXPECT_EQ(metadata->descriptor.etag, std::optional<std::string>("v2"));

    ASSERT_EQ(launcher_.launches.size(), 1u);
    EXPECT_EQ(launcher_.launches[0].first, "tool");
    EXPECT_EQ(launcher_.launches[0].second, "--quiet");
}

TEST_F(UpdatePipelineTest, DirectoryTargetGetsFilenameFromUrl) {
    Entry entry = makeEntry();
    entry.target = dir_ / "bin";
    fs::create_directories(entry.target);
    serve(entry.url, "binary");

    UpdatePipeline pipeline(context_, entry);
    EXPECT_EQ(pipeline.run().outcome, Outcome::Downloaded);
    EXPECT_EQ(pipeline.target(), dir_ / "bin" / "tool.exe");
    EXPECT_EQ(readFile(dir_ / "bin" / "tool.exe"), "binary");
}

TEST_F(UpdatePipelineTest, MatchingEtagLeavesTargetAlone) {
    const Entry entry = makeEntry();
    writeFile(entry.target, "current");
    serve(entry.url, "remote", "v1");
    RemoteDescriptor cached;
    cached.etag = "v1";
    ASSERT_TRUE(store_.save(entry.target, cached, entry.url));

    UpdatePipeline pipeline(context_, entry);
    EXPECT_EQ(pipeline.run().outcome, Outcome::UpToDate);
    EXPECT_EQ(readFile(entry.target), "current");
    EXPECT_EQ(client_.getCalls(entry.url), 0);
    EXPECT_FALSE(fs::exists(backupPath(entry.target)));
}

TEST_F(UpdatePipelineTest, RemoteHashMatchMeansNoChange) {
    Entry entry = makeEntry();
    entry.use_content_length_check = false;
    entry.md5_url = "https://example.com/download/tool.exe.md5";
    writeFile(entry.target, "same bytes");
    serve(entry.url, "same bytes");
    client_.setBody(*entry.md5_url, md5Hex("same bytes") + "  tool.exe\n");

    UpdatePipeline pipeline(context_, entry);
    EXPECT_EQ(pipeline.run().outcome, Outcome::Unchanged);
    EXPECT_TRUE(visited(pipeline, PipelineState::NoChange));
    EXPECT_EQ(client_.getCalls(entry.url), 0);
    EXPECT_TRUE(store_.load(entry.target));
}

TEST_F(UpdatePipelineTest, RemoteHashMismatchReplacesTarget) {
    Entry entry = makeEntry();
    entry.use_content_length_check = false;
    entry.md5_url = "https://example.com/download/tool.exe.md5";
    writeFile(entry.target, "old bytes");
    serve(entry.url, "new bytes");
    client_.setBody(*entry.md5_url, md5Hex("new bytes"));

    UpdatePipeline pipeline(context_, entry);
    EXPECT_EQ(pipeline.run().outcome, Outcome::Updated);
    EXPECT_EQ(readFile(entry.target), "new bytes");
    EXPECT_EQ(readFile(backupPath(entry.target)), "old bytes");
}

TEST_F(UpdatePipelineTest, CandidateHashMatchMeansNoChange) {
    Entry entry = makeEntry();
    entry.use_content_length_check = false;
    writeFile(entry.target, "same bytes");
    serve(entry.url, "same bytes");

    UpdatePipeline pipeline(context_, entry);
    EXPECT_EQ(pipeline.run().outcome, Outcome::Unchanged);
    EXPECT_EQ(client_.getCalls(entry.url), 1);
    EXPECT_FALSE(fs::exists(dir_ / "candidates" / "tool"));
    EXPECT_FALSE(fs::exists(backupPath(entry.target)));
}

TEST_F(UpdatePipelineTest, ChangedCandidateIsMovedIntoPlaceWithoutSecondDownload) {
    const Entry entry = makeEntry();
    writeFile(entry.target, "old");
    serve(entry.url, "a newer and longer body");

    UpdatePipeline pipeline(context_, entry);
    EXPECT_EQ(pipeline.run().outcome, Outcome::Updated);
    EXPECT_EQ(readFile(entry.target), "a newer and longer body");
    EXPECT_EQ(client_.getCalls(entry.url), 1);
    EXPECT_FALSE(fs::exists(dir_ / "candidates" / "tool"));
    EXPECT_TRUE(store_.load(entry.target));
}

TEST_F(UpdatePipelineTest, ForceReplacesIdenticalTarget) {
    const Entry entry = makeEntry();
    writeFile(entry.target, "same");
    serve(entry.url, "same", "v1");
    RemoteDescriptor cached;
    cached.etag = "v1";
    ASSERT_TRUE(store_.save(entry.target, cached, entry.url));
    context_.force = true;

    UpdatePipeline pipeline(context_, entry);
    EXPECT_EQ(pipeline.run().outcome, Outcome::Updated);
    EXPECT_TRUE(visited(pipeline, PipelineState::Replace));
    EXPECT_FALSE(visited(pipeline, PipelineState::CheckStaleness));
    EXPECT_FALSE(visited(pipeline, PipelineState::ResolveViaHash));
    EXPECT_EQ(client_.getCalls(entry.url), 1);
    EXPECT_TRUE(fs::exists(backupPath(entry.target)));
}

TEST_F(UpdatePipelineTest, EntryLevelForceAlsoSkipsChecks) {
    Entry entry = makeEntry();
    entry.force = true;
    writeFile(entry.target, "same");
    serve(entry.url, "same");

    UpdatePipeline pipeline(context_, entry);
    EXPECT_EQ(pipeline.run().outcome, Outcome::Updated);
    EXPECT_FALSE(visited(pipeline, PipelineState::CheckStaleness));
}

TEST_F(UpdatePipelineTest, LockedTargetWithoutKillAborts) {
    Entry entry = makeEntry();
    entry.force = true;
    entry.launch_command = "tool";
    writeFile(entry.target, "original");
    serve(entry.url, "replacement");
    replacer_.locked = true;

    UpdatePipeline pipeline(context_, entry);
    const auto report = pipeline.run();

    EXPECT_EQ(report.outcome, Outcome::Failed);
    EXPECT_EQ(readFile(entry.target), "original");
    EXPECT_EQ(client_.getCalls(entry.url), 0);
    EXPECT_TRUE(processes_.killed.empty());
    EXPECT_TRUE(launcher_.launches.empty());
}

TEST_F(UpdatePipelineTest, LockedTargetIsKilledReplacedAndRelaunched) {
    Entry entry = makeEntry();
    entry.force = true;
    entry.kill_if_locked = "/opt/tool/tool.exe";
    entry.relaunch = true;
    entry.arguments = "--minimized";
    entry.launch_command = "something-else";
    writeFile(entry.target, "original");
    serve(entry.url, "replacement");

    replacer_.locked = true;
    processes_.running = {{4242, "tool.exe", "/opt/tool/tool.exe"}};
    processes_.on_kill = [this]() { replacer_.locked = false; };

    UpdatePipeline pipeline(context_, entry);
    EXPECT_EQ(pipeline.run().outcome, Outcome::Updated);

    EXPECT_TRUE(pipeline.killed());
    EXPECT_TRUE(visited(pipeline, PipelineState::KillLockingProcess));
    EXPECT_TRUE(visited(pipeline, PipelineState::RetryBackupAfterKill));
    EXPECT_EQ(replacer_.backup_calls, 2);
    EXPECT_EQ(readFile(entry.target), "replacement");

    ASSERT_EQ(processes_.killed.size(), 1u);
    EXPECT_EQ(processes_.killed[0].pid, 4242);
    ASSERT_FALSE(processes_.queries.empty());
    EXPECT_EQ(processes_.queries[0].exe_path, std::optional<std::string>("/opt/tool/tool.exe"));

    ASSERT_EQ(launcher_.launches.size(), 1u);
    EXPECT_EQ(launcher_.launches[0].first, "/opt/tool/tool.exe");
    EXPECT_EQ(launcher_.launches[0].second, "--minimized");
}

TEST_F(UpdatePipelineTest, KilledWithoutRelaunchLaunchesNothing) {
    Entry entry = makeEntry();
    entry.force = true;
    entry.kill_if_locked = "tool.exe";
    entry.launch_command = "tool";
    writeFile(entry.target, "original");
    serve(entry.url, "replacement");

    replacer_.locked = true;
    processes_.running = {{7, "tool.exe", "/opt/tool/tool.exe"}};
    processes_.on_kill = [this]() { replacer_.locked = false; };

    UpdatePipeline pipeline(context_, entry);
    EXPECT_EQ(pipeline.run().outcome, Outcome::Updated);
    ASSERT_FALSE(processes_.queries.empty());
    EXPECT_EQ(processes_.queries[0].name, std::optional<std::string>("tool.exe"));
    EXPECT_TRUE(launcher_.launches.empty());
}

TEST_F(UpdatePipelineTest, StillLockedAfterKillAbortsWithTargetUntouched) {
    Entry entry = makeEntry();
    entry.force = true;
    entry.kill_if_locked = "/opt/tool/tool.exe";
    entry.relaunch = true;
    writeFile(entry.target, "original");
    serve(entry.url, "replacement");
    replacer_.locked = true;

    UpdatePipeline pipeline(context_, entry);
    EXPECT_EQ(pipeline.run().outcome, Outcome::Failed);
    EXPECT_EQ(replacer_.backup_calls, 2);
    EXPECT_EQ(readFile(entry.target), "original");
    EXPECT_TRUE(launcher_.launches.empty());
}

TEST_F(UpdatePipelineTest, FailedDownloadRestoresBackup) {
    Entry entry = makeEntry();
    entry.force = true;
    writeFile(entry.target, "original");
    FakeResource resource;
    resource.body = "replacement";
    resource.fail_get = true;
    client_.set(entry.url, resource);

    UpdatePipeline pipeline(context_, entry);
    EXPECT_EQ(pipeline.run().outcome, Outcome::Failed);
    EXPECT_EQ(readFile(entry.target), "original");
    EXPECT_EQ(replacer_.restore_calls, 1);
}

TEST_F(UpdatePipelineTest, TargetRemovedByExtractionIsRestoredFromBackup) {
    Entry entry = makeEntry("pack.zip");
    entry.force = true;
    entry.unzip_target = dir_ / "unpacked";
    writeFile(entry.target, "old archive");
    serve(entry.url, "new archive");
    extractor_.delete_archive = true;

    UpdatePipeline pipeline(context_, entry);
    EXPECT_EQ(pipeline.run().outcome, Outcome::Updated);
    EXPECT_EQ(extractor_.calls, 1);
    EXPECT_EQ(extractor_.last_destination, dir_ / "unpacked");
    EXPECT_EQ(readFile(entry.target), "old archive");
    EXPECT_FALSE(fs::exists(MetadataStore::sidecarPath(entry.target)));
}

TEST_F(UpdatePipelineTest, ExtractionRetriedOnceAfterKill) {
    Entry entry = makeEntry("pack.zip");
    entry.force = true;
    entry.unzip_target = dir_ / "unpacked";
    entry.kill_if_locked = "game";
    entry.launch_command = "game";
    writeFile(entry.target, "old archive");
    serve(entry.url, "new archive");
    extractor_.failures_left = 1;

    UpdatePipeline pipeline(context_, entry);
    EXPECT_EQ(pipeline.run().outcome, Outcome::Updated);
    EXPECT_EQ(extractor_.calls, 2);
    EXPECT_TRUE(pipeline.killed());
}

TEST_F(UpdatePipelineTest, SecondExtractionFailureStopsPostProcessing) {
    Entry entry = makeEntry("pack.zip");
    entry.force = true;
    entry.unzip_target = dir_ / "unpacked";
    entry.kill_if_locked = "game";
    entry.relaunch = true;
    writeFile(entry.target, "old archive");
    serve(entry.url, "new archive");
    extractor_.failures_left = 2;

    UpdatePipeline pipeline(context_, entry);
    const auto report = pipeline.run();
    EXPECT_EQ(report.outcome, Outcome::Updated);
    EXPECT_EQ(report.detail, "post-processing stopped");
    EXPECT_EQ(extractor_.calls, 2);
    EXPECT_EQ(readFile(entry.target), "new archive");
    EXPECT_TRUE(launcher_.launches.empty());
}

TEST_F(UpdatePipelineTest, NonArchiveTargetIsNotExtracted) {
    Entry entry = makeEntry();
    entry.unzip_target = dir_ / "unpacked";
    serve(entry.url, "binary");

    UpdatePipeline pipeline(context_, entry);
    EXPECT_EQ(pipeline.run().outcome, Outcome::Downloaded);
    EXPECT_EQ(extractor_.calls, 0);
}

TEST_F(UpdatePipelineTest, UnreachableUrlFailsFreshDownload) {
    const Entry entry = makeEntry();

    UpdatePipeline pipeline(context_, entry);
    const auto report = pipeline.run();
    EXPECT_EQ(report.outcome, Outcome::Failed);
    EXPECT_EQ(pipeline.history().back(), PipelineState::Failed);
    EXPECT_FALSE(fs::exists(entry.target));
}

TEST_F(UpdatePipelineTest, EntryNameThatIsNotADirectoryComponentIsRejected) {
    const fs::path outside = dir_ / "outside";
    writeFile(outside / "keep.txt", "keep");

    for (const std::string& name : {outside.string(), std::string{"../outside"}, std::string{},
                                    std::string{".."}, std::string{"a/b"}}) {
        Entry entry = makeEntry();
        entry.name = name;
        entry.force = true;
        writeFile(entry.target, "old bytes");
        serve(entry.url, "new bytes");

        UpdatePipeline pipeline(context_, entry);
        const auto report = pipeline.run();

        EXPECT_EQ(report.outcome, Outcome::Failed) << name;
        EXPECT_EQ(readFile(entry.target), "old bytes") << name;
        EXPECT_TRUE(fs::exists(outside / "keep.txt")) << name;
    }
    EXPECT_EQ(client_.getCalls(makeEntry().url), 0);
}

TEST_F(UpdatePipelineTest, CandidateCleanupStaysInsideEntryDirectory) {
    writeFile(dir_ / "candidates" / "other" / "partial.bin", "other entry");
    Entry entry = makeEntry();
    entry.use_content_length_check = false;
    writeFile(entry.target, "old bytes");
    serve(entry.url, "new bytes");

    UpdatePipeline pipeline(context_, entry);
    EXPECT_EQ(pipeline.run().outcome, Outcome::Updated);
    EXPECT_EQ(readFile(dir_ / "candidates" / "other" / "partial.bin"), "other entry");
    EXPECT_FALSE(fs::exists(dir_ / "candidates" / "tool"));
}

TEST_F(UpdatePipelineTest, OversizedHashReferenceFallsBackToReplace) {
    Entry entry = makeEntry();
    entry.use_content_length_check = false;
    entry.md5_url = "https://example.com/download/tool.exe.md5";
    writeFile(entry.target, "same bytes");
    serve(entry.url, "same bytes");
    client_.setBody(*entry.md5_url, md5Hex("same bytes") + std::string(128 * 1024, ' ') + "x");

    UpdatePipeline pipeline(context_, entry);
    EXPECT_EQ(pipeline.run().outcome, Outcome::Updated);
    EXPECT_FALSE(visited(pipeline, PipelineState::NoChange));
}
