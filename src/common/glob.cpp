#include <lunafmt/common/glob.h>

namespace lunafmt::common {

namespace {

void appendLiteral(std::string& re, char c) {
    switch (c) {
        case '.':
        case '^':
        case '$':
        case '|':
        case '(':
        case ')':
        case '[':
        case ']':
        case '{':
        case '}':
        case '*':
        case '+':
        case '?':
        case '\\':
            re += '\\';
            re += c;
            break;
        default:
            re += c;
    }
}

Error globError(std::string_view pattern, std::string_view what) {
    return Error{ErrorCode::ParseError, fmt::format("{} in glob '{}'", what, pattern)};
}

} // namespace

Result<std::string> globToRegex(std::string_view pattern, GlobOptions options) {
    const char* anyRun = options.literalSeparator ? "[^/]*" : ".*";
    const char* anyOne = options.literalSeparator ? "[^/]" : ".";

    std::string re;
    re.reserve(pattern.size() * 2);
    bool inAlternation = false;
    const size_t n = pattern.size();

    for (size_t i = 0; i < n; ++i) {
        const char c = pattern[i];
        switch (c) {
            case '*': {
                if (i + 1 < n && pattern[i + 1] == '*') {
                    const size_t after = i + 2;
                    const bool segmentStart = (i == 0 || pattern[i - 1] == '/');
                    const bool segmentEnd = (after == n || pattern[after] == '/');
                    if (segmentStart && segmentEnd) {
                        if (after == n) {
                            re += ".*";
                            i = after - 1;
                        } else {
                            // "**/": zero or more leading directories
                            re += "(?:.*/)?";
                            i = after;
                        }
                        break;
                    }
                    // "**" inside a segment behaves like '*'
                    re += anyRun;
                    i = after - 1;
                    break;
                }
                re += anyRun;
                break;
            }
            case '?':
                re += anyOne;
                break;
            case '[': {
                size_t j = i + 1;
                std::string cls = "[";
                bool negated = false;
                if (j < n && (pattern[j] == '!' || pattern[j] == '^')) {
                    negated = true;
                    cls += '^';
                    ++j;
                }
                if (negated && options.literalSeparator) {
                    cls += '/';
                }
                bool first = true;
                bool closed = false;
                for (; j < n; ++j) {
                    char d = pattern[j];
                    if (d == ']' && !first) {
                        closed = true;
                        break;
                    }
                    first = false;
                    if (d == '\\' && j + 1 < n) {
                        d = pattern[++j];
                    }
                    if (d == '\\' || d == '[' || d == ']' || d == '^') {
                        cls += '\\';
                    }
                    cls += d;
                }
                if (!closed) {
                    return globError(pattern, "unclosed character class");
                }
                cls += ']';
                re += cls;
                i = j;
                break;
            }
            case '{':
                if (inAlternation) {
                    return globError(pattern, "nested alternate groups are not supported");
                }
                inAlternation = true;
                re += "(?:";
                break;
            case '}':
                if (!inAlternation) {
                    return globError(pattern, "unopened alternate group");
                }
                inAlternation = false;
                re += ')';
                break;
            case ',':
                re += inAlternation ? '|' : ',';
                break;
            case '\\':
                if (i + 1 >= n) {
                    return globError(pattern, "dangling escape");
                }
                appendLiteral(re, pattern[++i]);
                break;
            default:
                appendLiteral(re, c);
        }
    }

    if (inAlternation) {
        return globError(pattern, "unclosed alternate group");
    }
    return re;
}

Result<Glob> Glob::compile(std::string_view pattern, GlobOptions options) {
    auto re = globToRegex(pattern, options);
    if (!re) {
        return re.error();
    }
    try {
        std::regex compiled(re.value(), std::regex::ECMAScript | std::regex::optimize);
        return Glob(std::string(pattern), std::move(compiled));
    } catch (const std::regex_error& e) {
        return globError(pattern, e.what());
    }
}

bool Glob::matches(std::string_view path) const {
    return std::regex_match(path.begin(), path.end(), regex_);
}

} // namespace lunafmt::common
