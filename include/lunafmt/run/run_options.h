#pragma once

#include <algorithm>
#include <filesystem>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <lunafmt/common/ansi.h>
#include <lunafmt/config/config_loader.h>

namespace lunafmt::run {

inline size_t defaultThreadCount() {
    return std::max<size_t>(1, std::thread::hardware_concurrency());
}

/**
 * Everything a run needs from the command line. Immutable once the run starts.
 */
struct RunOptions {
    // Files, directories, or "-" for standard input
    std::vector<std::filesystem::path> files;
    // Report a diff instead of writing files
    bool check = false;
    // Include globs replacing the default "**/*.lua" filter
    std::optional<std::vector<std::string>> globs;
    std::optional<size_t> rangeStart;
    std::optional<size_t> rangeEnd;
    size_t numThreads = defaultThreadCount();
    // Log run progress at info instead of debug
    bool verbose = false;
    common::ColorChoice color = common::ColorChoice::Auto;

    std::optional<std::filesystem::path> configPath;
    bool searchParentDirectories = false;
    config::ConfigOverrides overrides;
};

} // namespace lunafmt::run
