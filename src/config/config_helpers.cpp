#include <charconv>
#include <fstream>
#include <sstream>
#include <lunafmt/config/config_helpers.h>

namespace lunafmt::config {

namespace {

// Strip a '#' comment that is not inside a quoted string
std::string stripComment(const std::string& line) {
    char quote = 0;
    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (quote) {
            if (c == quote)
                quote = 0;
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '#') {
            return line.substr(0, i);
        }
    }
    return line;
}

} // namespace

Result<TomlTable> parse_simple_toml(std::string_view content) {
    TomlTable table;
    std::istringstream in{std::string(content)};
    std::string line;
    std::string currentSection;
    size_t lineNo = 0;

    while (std::getline(in, line)) {
        ++lineNo;
        line = stripComment(line);
        trim(line);

        // Skip empty lines
        if (line.empty()) {
            continue;
        }

        // Check for section headers [section]
        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end == std::string::npos) {
                return Error{ErrorCode::ParseError,
                             fmt::format("line {}: unterminated section header", lineNo)};
            }
            currentSection = line.substr(1, end - 1);
            trim(currentSection);
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            return Error{ErrorCode::ParseError,
                         fmt::format("line {}: expected key = value", lineNo)};
        }

        std::string k = line.substr(0, eq);
        std::string v = line.substr(eq + 1);
        trim(k);
        k = unquote(k);
        if (k.empty()) {
            return Error{ErrorCode::ParseError, fmt::format("line {}: empty key", lineNo)};
        }
        trim(v);
        if (!v.empty() && (v.front() == '"' || v.front() == '\'') &&
            (v.size() < 2 || v.back() != v.front())) {
            return Error{ErrorCode::ParseError,
                         fmt::format("line {}: unterminated string for '{}'", lineNo, k)};
        }

        const std::string fullKey = currentSection.empty() ? k : currentSection + "." + k;
        table[fullKey] = unquote(v);
    }

    return table;
}

Result<TomlTable> load_simple_toml(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return Error{ErrorCode::FileNotFound, fmt::format("Failed to read {}", path.string())};
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    auto parsed = parse_simple_toml(buffer.str());
    if (!parsed) {
        return withContext(parsed.error(), fmt::format("Failed to parse {}", path.string()));
    }
    return parsed;
}

Result<size_t> parse_size(std::string_view key, std::string_view value) {
    size_t out = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), out);
    if (ec != std::errc() || ptr != value.data() + value.size() || value.empty()) {
        return Error{ErrorCode::InvalidArgument,
                     fmt::format("invalid {} '{}': expected a non-negative integer", key, value)};
    }
    return out;
}

} // namespace lunafmt::config
