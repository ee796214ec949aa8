#pragma once

#include <filesystem>
#include <iosfwd>
#include <memory>

#include <lunafmt/core/types.h>
#include <lunafmt/format/formatter.h>
#include <lunafmt/run/result_sink.h>
#include <lunafmt/run/run_options.h>

namespace lunafmt::run {

/**
 * @brief Process-level resources a run reads from and writes to.
 * Null streams mean std::cin / std::cout; an empty directory means the current one.
 */
struct RunIo {
    std::istream* input = nullptr;
    std::ostream* output = nullptr;
    std::filesystem::path workingDirectory;
};

struct RunSummary {
    int exitCode = 0;
    size_t dispatched = 0;
    size_t skipped = 0;
    size_t walkErrors = 0;
    SinkStats outcomes;
};

/**
 * @brief Drives one formatting run from options to exit code.
 *
 * Configuration problems (no roots, bad glob, unreadable config) are returned as
 * errors before any file is touched. Everything after that is reported through
 * the summary's exit code: 0 when no file differed or failed and discovery saw no
 * errors, 1 otherwise.
 */
class RunController {
public:
    explicit RunController(
        std::shared_ptr<const format::IFormatter> formatter = format::makeDefaultFormatter())
        : formatter_(std::move(formatter)) {}

    Result<RunSummary> execute(const RunOptions& options, const RunIo& io = {}) const;

    /**
     * @brief execute() with fatal errors logged and mapped to exit code 1.
     */
    int run(const RunOptions& options, const RunIo& io = {}) const;

private:
    std::shared_ptr<const format::IFormatter> formatter_;
};

} // namespace lunafmt::run
