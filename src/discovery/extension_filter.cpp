#include <lunafmt/common/glob.h>
#include <lunafmt/common/pattern_utils.h>
#include <lunafmt/discovery/extension_filter.h>

namespace lunafmt::discovery {

namespace {

const common::Glob& defaultGlob() {
    static const common::Glob glob = common::Glob::compile(kDefaultGlob).value();
    return glob;
}

} // namespace

ExtensionFilter::ExtensionFilter(bool useDefaultGlob) : useDefaultGlob_(useDefaultGlob) {}

bool ExtensionFilter::accepts(const DiscoveredEntry& entry) const {
    if (!useDefaultGlob_ || entry.isStdin() || entry.explicitRoot) {
        return true;
    }
    return defaultGlob().matches(common::normalize_path(entry.path.generic_string()));
}

} // namespace lunafmt::discovery
