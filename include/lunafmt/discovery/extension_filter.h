#pragma once

#include <lunafmt/discovery/path_walker.h>

namespace lunafmt::discovery {

// Files found by recursion must match this when no override globs are given
inline constexpr const char* kDefaultGlob = "**/*.lua";

/**
 * @brief Gate applied to discovered entries before a job is scheduled.
 *
 * Decision table:
 *  - stdin or an entry the walker flagged as an explicit root: always kept
 *  - override globs supplied: kept (the overrides already decided during discovery)
 *  - otherwise: kept only if the path matches kDefaultGlob
 */
class ExtensionFilter {
public:
    explicit ExtensionFilter(bool useDefaultGlob);

    [[nodiscard]] bool accepts(const DiscoveredEntry& entry) const;

private:
    bool useDefaultGlob_;
};

} // namespace lunafmt::discovery
