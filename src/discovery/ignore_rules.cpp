#include <lunafmt/common/pattern_utils.h>
#include <lunafmt/discovery/ignore_rules.h>

#include <algorithm>
#include <fstream>
#include <sstream>

namespace lunafmt::discovery {

namespace {

// Trailing spaces are insignificant unless escaped with a backslash
std::string_view trimTrailingSpaces(std::string_view line) {
    size_t end = line.size();
    while (end > 0 && (line[end - 1] == ' ' || line[end - 1] == '\t')) {
        --end;
    }
    if (end < line.size() && end > 0 && line[end - 1] == '\\') {
        ++end;
    }
    return line.substr(0, end);
}

std::string relativeTo(const std::filesystem::path& path, const std::filesystem::path& base,
                       bool& outside) {
    outside = false;
    if (!path.is_absolute() || base.empty()) {
        return common::normalize_path(path.generic_string());
    }
    auto rel = path.lexically_relative(base).generic_string();
    if (rel.empty() || rel == "." || rel == ".." || rel.starts_with("../")) {
        outside = true;
        return common::normalize_path(path.generic_string());
    }
    return rel;
}

} // namespace

IgnoreRules IgnoreRules::parse(std::filesystem::path base, std::string_view content,
                               std::vector<Error>& errors) {
    IgnoreRules rules(std::move(base));
    size_t lineNo = 0;
    for (auto raw : common::split_lines_keep_ends(content)) {
        ++lineNo;
        auto added = rules.addLine(common::strip_line_end(raw));
        if (!added) {
            errors.push_back(withContext(
                added.error(),
                fmt::format("{}:{}", (rules.base_ / kIgnoreFileName).string(), lineNo)));
        }
    }
    return rules;
}

Result<IgnoreRules> IgnoreRules::fromFile(const std::filesystem::path& file,
                                          std::vector<Error>& errors) {
    std::ifstream in(file, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::IOError, fmt::format("Failed to read {}", file.string())};
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        return Error{ErrorCode::IOError, fmt::format("Failed to read {}", file.string())};
    }
    return parse(file.parent_path(), buffer.str(), errors);
}

Result<void> IgnoreRules::addLine(std::string_view line) {
    line = trimTrailingSpaces(line);
    if (line.empty() || line.front() == '#') {
        return {};
    }

    bool negated = false;
    if (line.front() == '!') {
        negated = true;
        line.remove_prefix(1);
    }

    bool directoryOnly = false;
    if (!line.empty() && line.back() == '/') {
        directoryOnly = true;
        line.remove_suffix(1);
    }
    if (line.empty()) {
        return {};
    }

    std::string pattern;
    if (line.find('/') != std::string_view::npos) {
        if (line.front() == '/') {
            line.remove_prefix(1);
        }
        pattern.assign(line);
    } else {
        pattern = "**/";
        pattern.append(line);
    }

    auto glob = common::Glob::compile(pattern, common::GlobOptions{.literalSeparator = true});
    if (!glob) {
        return glob.error();
    }
    rules_.push_back(Rule{std::move(glob).value(), negated, directoryOnly});
    return {};
}

MatchKind IgnoreRules::match(const std::filesystem::path& path, bool isDir) const {
    if (rules_.empty()) {
        return MatchKind::None;
    }
    bool outside = false;
    auto rel = relativeTo(path, base_, outside);
    if (outside) {
        return MatchKind::None;
    }
    return matchRelative(rel, isDir);
}

MatchKind IgnoreRules::matchRelative(std::string_view relative, bool isDir) const {
    for (auto it = rules_.rbegin(); it != rules_.rend(); ++it) {
        if (it->directoryOnly && !isDir) {
            continue;
        }
        if (it->glob.matches(relative)) {
            return it->negated ? MatchKind::Whitelist : MatchKind::Ignore;
        }
    }
    return MatchKind::None;
}

size_t IgnoreRules::numNegated() const {
    return static_cast<size_t>(
        std::count_if(rules_.begin(), rules_.end(), [](const Rule& r) { return r.negated; }));
}

Result<OverrideSet> OverrideSet::build(const std::filesystem::path& root,
                                       const std::vector<std::string>& patterns) {
    IgnoreRules rules(root);
    for (const auto& pattern : patterns) {
        auto added = rules.addLine(pattern);
        if (!added) {
            return withContext(added.error(),
                               fmt::format("error: cannot parse glob pattern {}", pattern));
        }
    }
    OverrideSet set(std::move(rules));
    set.numWhitelists_ = set.rules_.size() - set.rules_.numNegated();
    return set;
}

MatchKind OverrideSet::match(const std::filesystem::path& path, bool isDir) const {
    if (rules_.empty()) {
        return MatchKind::None;
    }
    bool outside = false;
    auto rel = relativeTo(path, rules_.base(), outside);

    // Plain override patterns include, negated ones exclude
    switch (rules_.matchRelative(rel, isDir)) {
        case MatchKind::Ignore:
            return MatchKind::Whitelist;
        case MatchKind::Whitelist:
            return MatchKind::Ignore;
        case MatchKind::None:
            break;
    }
    if (!isDir && numWhitelists_ > 0) {
        return MatchKind::Ignore;
    }
    return MatchKind::None;
}

} // namespace lunafmt::discovery
