#pragma once

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>

#include <lunafmt/core/types.h>

namespace lunafmt::config {

// String trimming utilities
inline void ltrim(std::string& s) {
    s.erase(s.begin(),
            std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); }));
}

inline void rtrim(std::string& s) {
    s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); })
                .base(),
            s.end());
}

inline void trim(std::string& s) {
    ltrim(s);
    rtrim(s);
}

// Quote handling
inline std::string unquote(std::string val) {
    trim(val);
    if (val.size() >= 2 && ((val.front() == '"' && val.back() == '"') ||
                            (val.front() == '\'' && val.back() == '\''))) {
        return val.substr(1, val.size() - 2);
    }
    return val;
}

// Flattened view of a TOML document: "key" for top-level keys, "section.key" otherwise
using TomlTable = std::map<std::string, std::string>;

// Parse the subset of TOML used by lunafmt.toml: [section] headers, key = value pairs,
// quoted or bare scalar values, and '#' comments. Malformed lines are errors.
Result<TomlTable> parse_simple_toml(std::string_view content);

// Read and parse a TOML file
Result<TomlTable> load_simple_toml(const std::filesystem::path& path);

// Parse an unsigned integer config value
Result<size_t> parse_size(std::string_view key, std::string_view value);

} // namespace lunafmt::config
