#include <spdlog/spdlog.h>
#include <lunafmt/config/config_loader.h>

namespace lunafmt::config {

namespace fs = std::filesystem;

void ConfigOverrides::applyTo(FormatConfig& config) const {
    if (columnWidth)
        config.columnWidth = *columnWidth;
    if (lineEndings)
        config.lineEndings = *lineEndings;
    if (indentType)
        config.indentType = *indentType;
    if (indentWidth)
        config.indentWidth = *indentWidth;
    if (quoteStyle)
        config.quoteStyle = *quoteStyle;
    if (callParentheses)
        config.callParentheses = *callParentheses;
}

Result<FormatConfig> configFromToml(const TomlTable& table) {
    FormatConfig config;
    for (const auto& [key, value] : table) {
        if (key == "column_width") {
            auto v = parse_size(key, value);
            if (!v)
                return v.error();
            config.columnWidth = v.value();
        } else if (key == "indent_width") {
            auto v = parse_size(key, value);
            if (!v)
                return v.error();
            if (v.value() == 0) {
                return Error{ErrorCode::InvalidArgument, "indent_width must be at least 1"};
            }
            config.indentWidth = v.value();
        } else if (key == "line_endings") {
            auto v = parseLineEndings(value);
            if (!v)
                return v.error();
            config.lineEndings = v.value();
        } else if (key == "indent_type") {
            auto v = parseIndentType(value);
            if (!v)
                return v.error();
            config.indentType = v.value();
        } else if (key == "quote_style") {
            auto v = parseQuoteStyle(value);
            if (!v)
                return v.error();
            config.quoteStyle = v.value();
        } else if (key == "call_parentheses") {
            auto v = parseCallParentheses(value);
            if (!v)
                return v.error();
            config.callParentheses = v.value();
        } else if (key == "no_call_parentheses") {
            // Older spelling of call_parentheses = "None"
            if (value == "true") {
                config.callParentheses = CallParentheses::None;
            } else if (value != "false") {
                return Error{ErrorCode::InvalidArgument,
                             fmt::format("invalid no_call_parentheses '{}'", value)};
            }
        } else {
            spdlog::warn("unknown configuration key '{}' ignored", key);
        }
    }
    return config;
}

std::optional<fs::path> findConfigFile(const fs::path& directory, bool searchParentDirectories) {
    auto current = directory;
    while (true) {
        for (const char* name : kConfigFileNames) {
            auto candidate = current / name;
            std::error_code ec;
            if (fs::is_regular_file(candidate, ec) && !ec) {
                return candidate;
            }
        }
        if (!searchParentDirectories || !current.has_parent_path() ||
            current.parent_path() == current) {
            return std::nullopt;
        }
        current = current.parent_path();
    }
}

Result<FormatConfig> loadConfig(const ConfigSource& source) {
    std::optional<fs::path> path = source.configPath;
    if (!path) {
        auto dir = source.workingDirectory;
        if (dir.empty()) {
            std::error_code ec;
            dir = fs::current_path(ec);
            if (ec) {
                return Error{ErrorCode::IOError,
                             fmt::format("could not determine current directory: {}",
                                         ec.message())};
            }
        }
        path = findConfigFile(dir, source.searchParentDirectories);
    }

    FormatConfig config;
    if (path) {
        spdlog::debug("loading config from {}", path->string());
        auto table = load_simple_toml(*path);
        if (!table) {
            return withContext(table.error(), "error: could not load config");
        }
        auto parsed = configFromToml(table.value());
        if (!parsed) {
            return withContext(parsed.error(),
                               fmt::format("error: invalid config file {}", path->string()));
        }
        config = parsed.value();
    } else {
        spdlog::debug("no config file found, using defaults");
    }

    source.overrides.applyTo(config);
    return config;
}

} // namespace lunafmt::config
