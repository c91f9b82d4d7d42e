#include "updatechecker/archive_extractor.hpp"
#include "updatechecker/batch_scheduler.hpp"
#include "updatechecker/cli_options.hpp"
#include "updatechecker/config.hpp"
#include "updatechecker/curl_http_client.hpp"
#include "updatechecker/detail/curl_utils.hpp"
#include "updatechecker/file_replacer.hpp"
#include "updatechecker/launcher.hpp"
#include "updatechecker/metadata_store.hpp"
#include "updatechecker/process_manager.hpp"
#include "updatechecker/progress.hpp"
#include "updatechecker/progress_panel.hpp"
#include "updatechecker/staleness_oracle.hpp"
#include "updatechecker/transfer_engine.hpp"
#include "updatechecker/update_pipeline.hpp"

#include <exception>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>
#include <unistd.h>

int main(int argc, char** argv) {
    using namespace updatechecker;

    try {
        const CliOptions options = parseCommandLine(argc, argv);
        if (options.help) {
            printUsage(argv[0]);
            return 0;
        }

        spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");
        spdlog::set_level(options.verbose ? spdlog::level::debug : spdlog::level::info);

        const auto config_path = options.config_path.value_or(defaultConfigPath());
        spdlog::debug("Using configuration '{}'", config_path.string());
        const Config config = Config::fromFile(config_path);

        std::vector<Entry> entries = selectEntries(config.entries(), options.entries);
        if (entries.empty()) {
            spdlog::warn("No entries to process");
            return 0;
        }

        detail::ensureCurlInitialized();
        CurlHttpClient client;
        ProgressSink progress;
        TransferEngine transfer(client, progress);
        MetadataStore store;
        StalenessOracle oracle(client, store);
        FilesystemReplacer replacer;
        ProcfsProcessManager processes;
        ShellLauncher launcher;
        LibArchiveExtractor extractor;

        PipelineContext context{client,   transfer, store,    oracle,
                                replacer, processes, launcher, extractor};
        context.github_token = resolveGithubToken(options.github_token, config.githubToken());
        context.force = options.force;
        if (context.force) {
            spdlog::info("Force mode enabled for every entry");
        }

        const std::size_t concurrency =
            options.async ? options.threads.value_or(BatchScheduler::defaultConcurrency()) : 1;
        BatchScheduler scheduler(makePipelineRunner(context), concurrency);
        scheduler.setProgressSink(&progress);

        ProgressPanel panel(progress, std::cout);
        if (!options.verbose && ::isatty(STDOUT_FILENO)) {
            scheduler.setProgressPanel(&panel);
        }

        const auto reports = scheduler.runAll(entries);
        logSummary(reports);
        return exitStatus(reports);
    } catch (const std::exception& ex) {
        std::cerr << "Fatal error: " << ex.what() << std::endl;
        return 1;
    }
}
