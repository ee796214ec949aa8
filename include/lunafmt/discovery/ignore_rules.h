#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include <lunafmt/common/glob.h>
#include <lunafmt/core/types.h>

namespace lunafmt::discovery {

// Name of the per-directory ignore file honored during traversal
inline constexpr const char* kIgnoreFileName = ".lunafmtignore";

/**
 * @brief Outcome of testing a path against a rule set.
 *
 * Ignore means the last matching rule excludes the path, Whitelist means the
 * last matching rule is a negation ("!pattern") that re-includes it.
 */
enum class MatchKind { None, Ignore, Whitelist };

/**
 * @brief gitignore-style rules rooted at one directory.
 *
 * A rule without a '/' (other than a trailing one) matches the basename at any
 * depth below the base directory; a rule containing a '/' is anchored to the base.
 * A trailing '/' restricts the rule to directories. The last matching rule wins.
 */
class IgnoreRules {
public:
    IgnoreRules() = default;
    explicit IgnoreRules(std::filesystem::path base) : base_(std::move(base)) {}

    /**
     * @brief Parse the contents of an ignore file.
     * Malformed lines are skipped and reported through errors.
     */
    static IgnoreRules parse(std::filesystem::path base, std::string_view content,
                             std::vector<Error>& errors);

    /**
     * @brief Load an ignore file from disk; its parent directory becomes the base.
     */
    static Result<IgnoreRules> fromFile(const std::filesystem::path& file,
                                        std::vector<Error>& errors);

    /**
     * @brief Add a single gitignore-syntax line. Blank lines and comments are no-ops.
     */
    Result<void> addLine(std::string_view line);

    /**
     * @brief Match a path (absolute, or relative to the base) against the rules.
     * Paths outside the base never match.
     */
    MatchKind match(const std::filesystem::path& path, bool isDir) const;

    /**
     * @brief Match a '/'-separated path already relative to the base.
     */
    MatchKind matchRelative(std::string_view relative, bool isDir) const;

    const std::filesystem::path& base() const { return base_; }
    bool empty() const { return rules_.empty(); }
    size_t size() const { return rules_.size(); }
    size_t numNegated() const;

private:
    struct Rule {
        common::Glob glob;
        bool negated = false;
        bool directoryOnly = false;
    };

    std::filesystem::path base_;
    std::vector<Rule> rules_;
};

/**
 * @brief User-supplied include globs that replace the default extension filter.
 *
 * Semantics are the inverse of an ignore file: a plain pattern whitelists
 * matching paths and a "!pattern" excludes them. When at least one plain pattern
 * exists, files matching none of the patterns are excluded. Directories are only
 * excluded by an explicit negated match so traversal can still reach whitelisted
 * files beneath them.
 */
class OverrideSet {
public:
    OverrideSet() = default;

    /**
     * @brief Compile the patterns relative to root (normally the working directory).
     * Fails on the first pattern that cannot be parsed.
     */
    static Result<OverrideSet> build(const std::filesystem::path& root,
                                     const std::vector<std::string>& patterns);

    MatchKind match(const std::filesystem::path& path, bool isDir) const;

    bool empty() const { return rules_.empty(); }

private:
    explicit OverrideSet(IgnoreRules rules) : rules_(std::move(rules)) {}

    IgnoreRules rules_;
    size_t numWhitelists_ = 0;
};

} // namespace lunafmt::discovery
