#pragma once

#include <atomic>

namespace lunafmt::run {

/**
 * Process exit status shared by every job of a run.
 *
 * Starts at 0 and only ever moves to 1. Safe for any number of concurrent writers.
 */
class RunStatus {
public:
    static constexpr int kSuccess = 0;
    static constexpr int kFailure = 1;

    void markFailed() noexcept { code_.store(kFailure); }

    bool failed() const noexcept { return code_.load() != kSuccess; }

    // Read after every writer has been joined
    int exitCode() const noexcept { return code_.load(); }

private:
    std::atomic<int> code_{kSuccess};
};

} // namespace lunafmt::run
