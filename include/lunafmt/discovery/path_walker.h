#pragma once

#include <filesystem>
#include <functional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

#include <lunafmt/core/types.h>
#include <lunafmt/discovery/ignore_rules.h>

namespace lunafmt::discovery {

// Root that stands for standard input
inline constexpr std::string_view kStdinMarker = "-";

/**
 * @brief One candidate produced by discovery.
 */
struct DiscoveredEntry {
    enum class Kind { Stdin, File };

    Kind kind = Kind::File;
    std::filesystem::path path;
    // True when the path was named directly as a root rather than found by recursion
    bool explicitRoot = false;

    bool isStdin() const { return kind == Kind::Stdin; }

    static DiscoveredEntry stdinMarker() {
        DiscoveredEntry e;
        e.kind = Kind::Stdin;
        e.explicitRoot = true;
        return e;
    }

    static DiscoveredEntry file(std::filesystem::path p, bool explicitRoot) {
        DiscoveredEntry e;
        e.kind = Kind::File;
        e.path = std::move(p);
        e.explicitRoot = explicitRoot;
        return e;
    }
};

struct WalkOptions {
    std::vector<std::filesystem::path> roots;
    std::string ignoreFileName = kIgnoreFileName;
    // Honor ignore files found in the ancestors of each root directory
    bool readParentIgnoreFiles = true;
    bool skipHidden = false;
    OverrideSet overrides;
};

/**
 * @brief Depth-first traversal of the configured roots.
 *
 * Emits regular files and the stdin sentinel. Explicit roots are always emitted
 * and never filtered; everything found by recursion is subject to the override
 * set, then to the ignore files in effect for its directory. A path is emitted at
 * most once per walk, keyed by its absolute path; a file that is also named as a
 * root is flagged explicit however it was reached. Per-entry failures are passed to the visitor as errors and
 * the walk continues with the next entry.
 */
class PathWalker {
public:
    using Visitor = std::function<void(Result<DiscoveredEntry>)>;

    explicit PathWalker(WalkOptions options);

    void walk(const Visitor& visit);

private:
    void walkRoot(const std::filesystem::path& root, const Visitor& visit);

    void walkDirectory(const std::filesystem::path& dir, const std::filesystem::path& absDir,
                       const Visitor& visit);

    void loadParentIgnoreFiles(const std::filesystem::path& absRoot, const Visitor& visit);

    bool pushIgnoreFile(const std::filesystem::path& absDir, const Visitor& visit);

    bool isIgnored(const std::filesystem::path& path, const std::filesystem::path& absPath,
                   bool isDir) const;

    void emitFile(const std::filesystem::path& path, const Visitor& visit);

    void emitError(Error error, const Visitor& visit);

    WalkOptions options_;
    std::vector<IgnoreRules> ignoreStack_;
    std::unordered_set<std::string> rootKeys_;
    std::unordered_set<std::string> seen_;
    bool stdinSeen_ = false;
    size_t filesEmitted_ = 0;
    size_t errorsEmitted_ = 0;
};

/**
 * @brief Map a filesystem error to an ErrorCode.
 */
ErrorCode errorCodeFromSystem(const std::error_code& ec);

} // namespace lunafmt::discovery
