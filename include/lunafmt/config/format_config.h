#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include <lunafmt/core/types.h>

namespace lunafmt::config {

enum class LineEndings { Unix, Windows };
enum class IndentType { Tabs, Spaces };
enum class QuoteStyle { AutoPreferDouble, AutoPreferSingle, ForceDouble, ForceSingle };
enum class CallParentheses { Always, NoSingleString, NoSingleTable, None };

/**
 * Fully resolved formatting configuration.
 *
 * Built once per run and shared read-only by every formatting job.
 */
struct FormatConfig {
    size_t columnWidth = 120;
    LineEndings lineEndings = LineEndings::Unix;
    IndentType indentType = IndentType::Tabs;
    size_t indentWidth = 4;
    QuoteStyle quoteStyle = QuoteStyle::AutoPreferDouble;
    CallParentheses callParentheses = CallParentheses::Always;

    bool operator==(const FormatConfig&) const = default;
};

/**
 * Byte range restricting formatting. Lines whose first byte lies in
 * [start, end) are formatted; a missing bound is open.
 */
struct FormatRange {
    std::optional<size_t> start;
    std::optional<size_t> end;

    static FormatRange fromValues(std::optional<size_t> start, std::optional<size_t> end) {
        return FormatRange{start, end};
    }

    bool contains(size_t offset) const {
        if (start && offset < *start)
            return false;
        if (end && offset >= *end)
            return false;
        return true;
    }
};

// Parsers accept the spelling used in lunafmt.toml ("Unix", "Tabs", ...) case-insensitively
Result<LineEndings> parseLineEndings(std::string_view value);
Result<IndentType> parseIndentType(std::string_view value);
Result<QuoteStyle> parseQuoteStyle(std::string_view value);
Result<CallParentheses> parseCallParentheses(std::string_view value);

const char* toString(LineEndings value);
const char* toString(IndentType value);
const char* toString(QuoteStyle value);
const char* toString(CallParentheses value);

const char* lineEndingSequence(LineEndings value);

} // namespace lunafmt::config
