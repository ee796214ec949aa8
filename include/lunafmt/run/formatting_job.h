#pragma once

#include <filesystem>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>

#include <lunafmt/config/format_config.h>
#include <lunafmt/core/types.h>
#include <lunafmt/discovery/path_walker.h>
#include <lunafmt/format/formatter.h>
#include <lunafmt/run/job_outcome.h>
#include <lunafmt/run/run_options.h>

namespace lunafmt::run {

// Unchanged lines shown around each change in check mode
inline constexpr size_t kDiffContextLines = 3;

/**
 * @brief Read-only state shared by every job of a run.
 */
struct JobContext {
    std::shared_ptr<const RunOptions> options;
    std::shared_ptr<const config::FormatConfig> config;
    std::optional<config::FormatRange> range;
    std::shared_ptr<const format::IFormatter> formatter;
    bool useColor = false;
    // Standard streams for the stdin job; not owned
    std::istream* input = nullptr;
    std::ostream* output = nullptr;
};

/**
 * @brief Formats a single discovered entry.
 *
 * run() never throws and always yields exactly one outcome.
 */
class FormattingJob {
public:
    FormattingJob(std::shared_ptr<const JobContext> context, discovery::DiscoveredEntry entry)
        : context_(std::move(context)), entry_(std::move(entry)) {}

    JobOutcome run() const;

    const discovery::DiscoveredEntry& entry() const { return entry_; }

private:
    JobOutcome formatFile(const std::filesystem::path& path) const;
    JobOutcome formatStdin() const;

    std::shared_ptr<const JobContext> context_;
    discovery::DiscoveredEntry entry_;
};

/**
 * @brief Read a whole file, rejecting content that is not valid UTF-8.
 */
Result<std::string> readSourceFile(const std::filesystem::path& path);

/**
 * @brief Replace the contents of a file.
 */
Result<void> writeSourceFile(const std::filesystem::path& path, std::string_view contents);

} // namespace lunafmt::run
