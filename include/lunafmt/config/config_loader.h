#pragma once

#include <array>
#include <filesystem>
#include <optional>

#include <lunafmt/config/config_helpers.h>
#include <lunafmt/config/format_config.h>
#include <lunafmt/core/types.h>

namespace lunafmt::config {

// Searched in this order in each candidate directory
inline constexpr std::array<const char*, 2> kConfigFileNames{"lunafmt.toml", ".lunafmt.toml"};

/**
 * Command-line values that take precedence over the configuration file.
 */
struct ConfigOverrides {
    std::optional<size_t> columnWidth;
    std::optional<LineEndings> lineEndings;
    std::optional<IndentType> indentType;
    std::optional<size_t> indentWidth;
    std::optional<QuoteStyle> quoteStyle;
    std::optional<CallParentheses> callParentheses;

    void applyTo(FormatConfig& config) const;
};

/**
 * Where configuration comes from for one run.
 */
struct ConfigSource {
    // Explicit file; when set, no discovery happens and a missing file is an error
    std::optional<std::filesystem::path> configPath;
    // Walk up from workingDirectory until a config file is found
    bool searchParentDirectories = false;
    std::filesystem::path workingDirectory;
    ConfigOverrides overrides;
};

/**
 * Build a FormatConfig from a parsed lunafmt.toml. Unknown keys are logged and ignored.
 */
Result<FormatConfig> configFromToml(const TomlTable& table);

/**
 * Locate the config file for a directory, optionally searching its ancestors.
 */
std::optional<std::filesystem::path> findConfigFile(const std::filesystem::path& directory,
                                                    bool searchParentDirectories);

/**
 * Resolve the configuration once for a run: file (explicit or discovered), then overrides.
 */
Result<FormatConfig> loadConfig(const ConfigSource& source);

} // namespace lunafmt::config
