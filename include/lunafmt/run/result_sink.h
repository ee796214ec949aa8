#pragma once

#include <cstddef>
#include <memory>
#include <ostream>

#include <lunafmt/run/job_outcome.h>
#include <lunafmt/run/run_status.h>
#include <lunafmt/runtime/channel.h>

namespace lunafmt::run {

struct SinkStats {
    size_t completed = 0;
    size_t diffs = 0;
    size_t failures = 0;

    size_t total() const { return completed + diffs + failures; }
};

/**
 * @brief Single consumer of every job outcome in a run.
 *
 * All writes to the output stream for check-mode diffs happen on the thread
 * running run(), one outcome at a time, so two diffs never interleave.
 */
class ResultSink {
public:
    ResultSink(runtime::Receiver<JobOutcome> receiver, std::shared_ptr<RunStatus> status,
               std::ostream& out)
        : receiver_(std::move(receiver)), status_(std::move(status)), out_(out) {}

    /**
     * @brief Drain the channel until every sender is gone and nothing is queued.
     */
    void run();

    /**
     * @brief Act on a single outcome.
     */
    void handle(const JobOutcome& outcome);

    // Only meaningful once run() has returned
    const SinkStats& stats() const { return stats_; }

private:
    runtime::Receiver<JobOutcome> receiver_;
    std::shared_ptr<RunStatus> status_;
    std::ostream& out_;
    SinkStats stats_;
};

} // namespace lunafmt::run
