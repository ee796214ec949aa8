#include <spdlog/spdlog.h>
#include <algorithm>
#include <iostream>
#include <lunafmt/discovery/extension_filter.h>
#include <lunafmt/discovery/path_walker.h>
#include <lunafmt/run/formatting_job.h>
#include <lunafmt/run/result_sink.h>
#include <lunafmt/run/run_controller.h>
#include <lunafmt/run/run_status.h>
#include <lunafmt/runtime/channel.h>
#include <lunafmt/runtime/thread_pool.h>

namespace lunafmt::run {

namespace fs = std::filesystem;

Result<RunSummary> RunController::execute(const RunOptions& options, const RunIo& io) const {
    if (options.files.empty()) {
        return Error{ErrorCode::InvalidArgument, "error: no files provided"};
    }
    if (!formatter_) {
        return Error{ErrorCode::InvalidOperation, "error: no formatter configured"};
    }

    fs::path cwd = io.workingDirectory;
    if (cwd.empty()) {
        std::error_code ec;
        cwd = fs::current_path(ec);
        if (ec) {
            return Error{discovery::errorCodeFromSystem(ec),
                         fmt::format("error: could not determine working directory: {}",
                                     ec.message())};
        }
    }

    config::ConfigSource source;
    source.configPath = options.configPath;
    source.searchParentDirectories = options.searchParentDirectories;
    source.workingDirectory = cwd;
    source.overrides = options.overrides;
    auto config = config::loadConfig(source);
    if (!config) {
        return config.error();
    }

    std::optional<config::FormatRange> range;
    if (options.rangeStart || options.rangeEnd) {
        range = config::FormatRange::fromValues(options.rangeStart, options.rangeEnd);
    }

    discovery::WalkOptions walkOptions;
    walkOptions.roots = options.files;
    if (options.globs) {
        auto overrides = discovery::OverrideSet::build(cwd, *options.globs);
        if (!overrides) {
            return overrides.error();
        }
        walkOptions.overrides = std::move(overrides).value();
    }

    auto context = std::make_shared<JobContext>();
    context->options = std::make_shared<const RunOptions>(options);
    context->config = std::make_shared<const config::FormatConfig>(std::move(config).value());
    context->range = range;
    context->formatter = formatter_;
    context->useColor = common::should_use_color(options.color);
    context->input = io.input ? io.input : &std::cin;
    context->output = io.output ? io.output : &std::cout;

    // Run-level progress is promoted to info when the caller asked for verbose output
    const auto progress = options.verbose ? spdlog::level::info : spdlog::level::debug;
    const size_t workers = std::max<size_t>(1, options.numThreads);
    auto status = std::make_shared<RunStatus>();
    RunSummary summary;

    // One extra thread is reserved for the sink so jobs always have a consumer.
    spdlog::log(progress, "creating a pool with {} threads", workers);
    runtime::ThreadPool pool(workers + 1);

    // The sender must be released before the pool joins, so it is declared after it.
    auto channel = runtime::makeChannel<JobOutcome>();
    auto tx = std::move(channel.first);
    auto sink = std::make_shared<ResultSink>(std::move(channel.second), status, *context->output);
    if (!pool.execute([sink] { sink->run(); })) {
        return Error{ErrorCode::InternalError, "error: could not start result sink"};
    }

    std::shared_ptr<const JobContext> sharedContext = std::move(context);
    discovery::ExtensionFilter filter(!options.globs.has_value());
    discovery::PathWalker walker(std::move(walkOptions));

    walker.walk([&](Result<discovery::DiscoveredEntry> next) {
        if (!next) {
            spdlog::error("error: could not walk: {}", next.error().message);
            status->markFailed();
            ++summary.walkErrors;
            return;
        }
        auto entry = std::move(next).value();
        if (!filter.accepts(entry)) {
            spdlog::log(progress, "skipping {}", entry.path.string());
            ++summary.skipped;
            return;
        }

        FormattingJob job(sharedContext, std::move(entry));
        const bool queued = pool.execute([job, tx] { tx.send(job.run()); });
        if (!queued) {
            tx.send(JobOutcome::failed(Error{
                ErrorCode::InternalError,
                fmt::format("Could not schedule {}", job.entry().isStdin()
                                                          ? std::string("stdin")
                                                          : job.entry().path.string())}));
        }
        ++summary.dispatched;
    });

    tx.reset();
    pool.join();

    summary.outcomes = sink->stats();
    summary.exitCode = status->exitCode();
    spdlog::log(progress, "dispatched {} jobs, skipped {}, {} outcomes", summary.dispatched,
                summary.skipped, summary.outcomes.total());
    return summary;
}

int RunController::run(const RunOptions& options, const RunIo& io) const {
    auto summary = execute(options, io);
    if (!summary) {
        spdlog::error("{}", summary.error().message);
        return RunStatus::kFailure;
    }
    return summary.value().exitCode;
}

} // namespace lunafmt::run
