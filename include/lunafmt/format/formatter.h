#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <lunafmt/config/format_config.h>
#include <lunafmt/core/types.h>

namespace lunafmt::format {

/**
 * Formatting engine used by every job of a run.
 *
 * Implementations must be safe to call concurrently with the same config.
 */
class IFormatter {
public:
    virtual ~IFormatter() = default;

    virtual std::string name() const = 0;

    virtual Result<std::string> format(std::string_view content,
                                       const config::FormatConfig& config,
                                       const std::optional<config::FormatRange>& range) const = 0;
};

/**
 * Layout normalizer that works line by line without parsing Lua:
 *  - line endings converted to config.lineEndings
 *  - leading indentation rewritten with config.indentType / config.indentWidth
 *  - trailing whitespace removed, runs of blank lines collapsed, leading blank
 *    lines dropped, exactly one line ending at end of file
 *  - short string literals requoted according to config.quoteStyle
 *
 * Long strings and long comments ("[[ ... ]]", "--[==[ ... ]==]") are copied
 * verbatim. An unterminated long bracket is reported as a ParseError.
 */
class WhitespaceFormatter final : public IFormatter {
public:
    std::string name() const override { return "whitespace"; }

    Result<std::string> format(std::string_view content, const config::FormatConfig& config,
                               const std::optional<config::FormatRange>& range) const override;
};

std::shared_ptr<const IFormatter> makeDefaultFormatter();

} // namespace lunafmt::format
