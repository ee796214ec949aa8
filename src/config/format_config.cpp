#include <lunafmt/config/format_config.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

namespace lunafmt::config {

namespace {

bool equalsIgnoreCase(std::string_view a, std::string_view b) {
    return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

template <typename E, size_t N>
Result<E> lookup(std::string_view value, const std::array<std::pair<const char*, E>, N>& table,
                 std::string_view what) {
    for (const auto& [name, e] : table) {
        if (equalsIgnoreCase(value, name)) {
            return e;
        }
    }
    std::string expected;
    for (const auto& entry : table) {
        if (!expected.empty())
            expected += ", ";
        expected += entry.first;
    }
    return Error{ErrorCode::InvalidArgument,
                 fmt::format("invalid {} '{}' (expected one of: {})", what, value, expected)};
}

constexpr std::array<std::pair<const char*, LineEndings>, 2> kLineEndings{{
    {"Unix", LineEndings::Unix},
    {"Windows", LineEndings::Windows},
}};

constexpr std::array<std::pair<const char*, IndentType>, 2> kIndentTypes{{
    {"Tabs", IndentType::Tabs},
    {"Spaces", IndentType::Spaces},
}};

constexpr std::array<std::pair<const char*, QuoteStyle>, 4> kQuoteStyles{{
    {"AutoPreferDouble", QuoteStyle::AutoPreferDouble},
    {"AutoPreferSingle", QuoteStyle::AutoPreferSingle},
    {"ForceDouble", QuoteStyle::ForceDouble},
    {"ForceSingle", QuoteStyle::ForceSingle},
}};

constexpr std::array<std::pair<const char*, CallParentheses>, 4> kCallParentheses{{
    {"Always", CallParentheses::Always},
    {"NoSingleString", CallParentheses::NoSingleString},
    {"NoSingleTable", CallParentheses::NoSingleTable},
    {"None", CallParentheses::None},
}};

template <typename E, size_t N>
const char* nameOf(E value, const std::array<std::pair<const char*, E>, N>& table) {
    for (const auto& [name, e] : table) {
        if (e == value)
            return name;
    }
    return "Unknown";
}

} // namespace

Result<LineEndings> parseLineEndings(std::string_view value) {
    return lookup(value, kLineEndings, "line_endings");
}

Result<IndentType> parseIndentType(std::string_view value) {
    return lookup(value, kIndentTypes, "indent_type");
}

Result<QuoteStyle> parseQuoteStyle(std::string_view value) {
    return lookup(value, kQuoteStyles, "quote_style");
}

Result<CallParentheses> parseCallParentheses(std::string_view value) {
    return lookup(value, kCallParentheses, "call_parentheses");
}

const char* toString(LineEndings value) {
    return nameOf(value, kLineEndings);
}

const char* toString(IndentType value) {
    return nameOf(value, kIndentTypes);
}

const char* toString(QuoteStyle value) {
    return nameOf(value, kQuoteStyles);
}

const char* toString(CallParentheses value) {
    return nameOf(value, kCallParentheses);
}

const char* lineEndingSequence(LineEndings value) {
    return value == LineEndings::Windows ? "\r\n" : "\n";
}

} // namespace lunafmt::config
