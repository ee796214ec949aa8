#pragma once

#include <regex>
#include <string>
#include <string_view>

#include <lunafmt/core/types.h>

namespace lunafmt::common {

struct GlobOptions {
    // When set, '*' and '?' never match a '/' (gitignore semantics). When clear,
    // they match across directory separators, so "**/*.lua" and "*.lua" are equivalent.
    bool literalSeparator = false;
};

/**
 * Compiled glob pattern.
 *
 * Supported syntax:
 *  - '?' any single character, '*' any run of characters
 *  - '**' as a whole path segment: zero or more directories
 *  - '[abc]', '[a-z]', '[!0-9]' / '[^0-9]' character classes
 *  - '{lua,luau}' alternation (not nested)
 *  - '\x' escapes x
 *
 * Matching is against the whole path, with '/' as the separator.
 */
class Glob {
public:
    [[nodiscard]] static Result<Glob> compile(std::string_view pattern, GlobOptions options = {});

    [[nodiscard]] bool matches(std::string_view path) const;

    const std::string& pattern() const { return pattern_; }

private:
    Glob(std::string pattern, std::regex regex)
        : pattern_(std::move(pattern)), regex_(std::move(regex)) {}

    std::string pattern_;
    std::regex regex_;
};

/**
 * Translate a glob into an ECMAScript regular expression body (unanchored).
 * Exposed for tests; most callers want Glob::compile.
 */
[[nodiscard]] Result<std::string> globToRegex(std::string_view pattern, GlobOptions options = {});

} // namespace lunafmt::common
