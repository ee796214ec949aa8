#include <spdlog/spdlog.h>
#include <lunafmt/run/result_sink.h>

namespace lunafmt::run {

void ResultSink::run() {
    while (auto outcome = receiver_.receive()) {
        handle(*outcome);
    }
    spdlog::debug("[ResultSink] drained: {} completed, {} diffs, {} failed", stats_.completed,
                  stats_.diffs, stats_.failures);
}

void ResultSink::handle(const JobOutcome& outcome) {
    if (outcome.isCompleted()) {
        ++stats_.completed;
        return;
    }

    if (outcome.isDiff()) {
        ++stats_.diffs;
        status_->markFailed();

        const auto& diff = outcome.diff();
        out_.write(diff.data(), static_cast<std::streamsize>(diff.size()));
        out_.flush();
        if (!out_) {
            spdlog::error("Could not write diff to output stream");
            out_.clear();
        }
        return;
    }

    ++stats_.failures;
    spdlog::error("{}", outcome.error().message);
    status_->markFailed();
}

} // namespace lunafmt::run
