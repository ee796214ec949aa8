#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace lunafmt::common {

/**
 * Split text into lines, keeping each line's terminator ("\n" or "\r\n").
 * The last element has no terminator when the text does not end with one.
 */
[[nodiscard]] inline std::vector<std::string_view> split_lines_keep_ends(std::string_view text) {
    std::vector<std::string_view> out;
    size_t start = 0;
    while (start < text.size()) {
        size_t pos = text.find('\n', start);
        if (pos == std::string_view::npos) {
            out.push_back(text.substr(start));
            break;
        }
        out.push_back(text.substr(start, pos - start + 1));
        start = pos + 1;
    }
    return out;
}

/**
 * Strip a trailing "\n" or "\r\n" from a line produced by split_lines_keep_ends.
 */
[[nodiscard]] inline std::string_view strip_line_end(std::string_view line) noexcept {
    if (!line.empty() && line.back() == '\n')
        line.remove_suffix(1);
    if (!line.empty() && line.back() == '\r')
        line.remove_suffix(1);
    return line;
}

/**
 * Normalize a path string for glob matching: forward slashes, no leading "./".
 */
[[nodiscard]] inline std::string normalize_path(std::string_view path) {
    std::string out(path);
    for (auto& c : out) {
        if (c == '\\')
            c = '/';
    }
    while (out.size() >= 2 && out[0] == '.' && out[1] == '/') {
        out.erase(0, 2);
    }
    return out;
}

} // namespace lunafmt::common
