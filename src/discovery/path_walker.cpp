#include <spdlog/spdlog.h>
#include <algorithm>
#include <lunafmt/discovery/path_walker.h>

namespace lunafmt::discovery {

namespace fs = std::filesystem;

ErrorCode errorCodeFromSystem(const std::error_code& ec) {
    if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted) {
        return ErrorCode::PermissionDenied;
    }
    if (ec == std::errc::no_such_file_or_directory) {
        return ErrorCode::FileNotFound;
    }
    return ErrorCode::IOError;
}

namespace {

std::string pathKey(const fs::path& path) {
    std::error_code ec;
    auto abs = fs::absolute(path, ec);
    return (ec ? path : abs).lexically_normal().generic_string();
}

} // namespace

PathWalker::PathWalker(WalkOptions options) : options_(std::move(options)) {
    for (const auto& root : options_.roots) {
        if (root != fs::path(kStdinMarker)) {
            rootKeys_.insert(pathKey(root));
        }
    }
}

void PathWalker::walk(const Visitor& visit) {
    for (const auto& root : options_.roots) {
        walkRoot(root, visit);
    }
    spdlog::debug("[PathWalker] done: {} files, {} errors", filesEmitted_, errorsEmitted_);
}

void PathWalker::walkRoot(const fs::path& root, const Visitor& visit) {
    if (root == fs::path(kStdinMarker)) {
        if (!stdinSeen_) {
            stdinSeen_ = true;
            visit(DiscoveredEntry::stdinMarker());
        }
        return;
    }

    std::error_code ec;
    auto status = fs::status(root, ec);
    if (ec || !fs::exists(status)) {
        if (!ec) {
            ec = std::make_error_code(std::errc::no_such_file_or_directory);
        }
        emitError(Error{errorCodeFromSystem(ec), fmt::format("{}: {}", root.string(), ec.message())},
                  visit);
        return;
    }

    if (fs::is_regular_file(status)) {
        emitFile(root, visit);
        return;
    }
    if (!fs::is_directory(status)) {
        spdlog::debug("[PathWalker] skipping '{}': not a regular file or directory", root.string());
        return;
    }

    auto absRoot = fs::absolute(root, ec);
    if (ec) {
        emitError(Error{errorCodeFromSystem(ec), fmt::format("{}: {}", root.string(), ec.message())},
                  visit);
        return;
    }
    absRoot = absRoot.lexically_normal();
    // "dir/" normalizes with an empty filename
    if (!absRoot.has_filename() && absRoot != absRoot.root_path()) {
        absRoot = absRoot.parent_path();
    }

    ignoreStack_.clear();
    if (options_.readParentIgnoreFiles) {
        loadParentIgnoreFiles(absRoot, visit);
    }
    walkDirectory(root, absRoot, visit);
    ignoreStack_.clear();
}

void PathWalker::loadParentIgnoreFiles(const fs::path& absRoot, const Visitor& visit) {
    std::vector<fs::path> ancestors;
    auto current = absRoot;
    while (current.has_parent_path() && current.parent_path() != current) {
        current = current.parent_path();
        ancestors.push_back(current);
    }
    // Outermost first so deeper directories end up on top of the stack
    for (auto it = ancestors.rbegin(); it != ancestors.rend(); ++it) {
        pushIgnoreFile(*it, visit);
    }
}

bool PathWalker::pushIgnoreFile(const fs::path& absDir, const Visitor& visit) {
    if (options_.ignoreFileName.empty()) {
        return false;
    }
    auto file = absDir / options_.ignoreFileName;
    std::error_code ec;
    if (!fs::is_regular_file(file, ec) || ec) {
        return false;
    }

    std::vector<Error> parseErrors;
    auto rules = IgnoreRules::fromFile(file, parseErrors);
    for (auto& err : parseErrors) {
        emitError(std::move(err), visit);
    }
    if (!rules) {
        emitError(rules.error(), visit);
        return false;
    }
    spdlog::debug("[PathWalker] loaded {} rules from '{}'", rules.value().size(), file.string());
    ignoreStack_.push_back(std::move(rules).value());
    return true;
}

bool PathWalker::isIgnored(const fs::path& path, const fs::path& absPath, bool isDir) const {
    switch (options_.overrides.match(path, isDir)) {
        case MatchKind::Ignore:
            return true;
        case MatchKind::Whitelist:
            return false;
        case MatchKind::None:
            break;
    }
    for (auto it = ignoreStack_.rbegin(); it != ignoreStack_.rend(); ++it) {
        switch (it->match(absPath, isDir)) {
            case MatchKind::Ignore:
                return true;
            case MatchKind::Whitelist:
                return false;
            case MatchKind::None:
                break;
        }
    }
    return false;
}

void PathWalker::walkDirectory(const fs::path& dir, const fs::path& absDir, const Visitor& visit) {
    const bool pushed = pushIgnoreFile(absDir, visit);

    std::vector<fs::directory_entry> children;
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        emitError(Error{errorCodeFromSystem(ec), fmt::format("{}: {}", dir.string(), ec.message())},
                  visit);
    } else {
        fs::directory_iterator end;
        while (it != end) {
            children.push_back(*it);
            it.increment(ec);
            if (ec) {
                emitError(
                    Error{errorCodeFromSystem(ec), fmt::format("{}: {}", dir.string(), ec.message())},
                    visit);
                break;
            }
        }
    }

    std::sort(children.begin(), children.end(),
              [](const fs::directory_entry& a, const fs::directory_entry& b) {
                  return a.path().filename() < b.path().filename();
              });

    for (const auto& child : children) {
        const auto name = child.path().filename();
        const auto nameStr = name.string();
        if (options_.skipHidden && !nameStr.empty() && nameStr.front() == '.') {
            continue;
        }

        std::error_code entryEc;
        const bool isLink = child.is_symlink(entryEc);
        auto status = child.status(entryEc);
        if (entryEc) {
            if (isLink) {
                // Dangling symlink: nothing to format
                spdlog::debug("[PathWalker] skipping broken link '{}'", child.path().string());
            } else {
                emitError(Error{errorCodeFromSystem(entryEc),
                                fmt::format("{}: {}", child.path().string(), entryEc.message())},
                          visit);
            }
            continue;
        }

        const bool isDir = fs::is_directory(status);
        const auto path = dir / name;
        const auto absPath = absDir / name;

        if (isIgnored(path, absPath, isDir)) {
            spdlog::debug("[PathWalker] ignored '{}'", path.string());
            continue;
        }

        if (isDir) {
            if (isLink) {
                continue;
            }
            walkDirectory(path, absPath, visit);
        } else if (fs::is_regular_file(status)) {
            emitFile(path, visit);
        }
    }

    if (pushed) {
        ignoreStack_.pop_back();
    }
}

void PathWalker::emitFile(const fs::path& path, const Visitor& visit) {
    auto key = pathKey(path);
    // A root reached first through a directory still counts as named
    const bool explicitRoot = rootKeys_.contains(key);
    if (!seen_.insert(std::move(key)).second) {
        spdlog::debug("[PathWalker] '{}' already visited", path.string());
        return;
    }
    ++filesEmitted_;
    visit(DiscoveredEntry::file(path, explicitRoot));
}

void PathWalker::emitError(Error error, const Visitor& visit) {
    ++errorsEmitted_;
    visit(std::move(error));
}

} // namespace lunafmt::discovery
