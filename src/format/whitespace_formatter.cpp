#include <lunafmt/format/formatter.h>

#include <algorithm>
#include <vector>

namespace lunafmt::format {

namespace {

using config::FormatConfig;
using config::IndentType;
using config::QuoteStyle;

struct LexState {
    bool inLong = false;
    size_t level = 0;
    size_t openedAtLine = 0;
};

// Level of a long bracket opening at pos ("[[" -> 0, "[==[" -> 2); consumed receives its length
std::optional<size_t> longBracketLevel(std::string_view s, size_t pos, size_t& consumed) {
    if (pos >= s.size() || s[pos] != '[') {
        return std::nullopt;
    }
    size_t i = pos + 1;
    while (i < s.size() && s[i] == '=') {
        ++i;
    }
    if (i < s.size() && s[i] == '[') {
        consumed = i - pos + 1;
        return i - pos - 1;
    }
    return std::nullopt;
}

char chooseQuote(std::string_view body, char original, QuoteStyle style) {
    size_t doubles = 0;
    size_t singles = 0;
    for (size_t i = 0; i < body.size(); ++i) {
        char c = body[i];
        if (c == '\\' && i + 1 < body.size()) {
            c = body[++i];
        }
        if (c == '"')
            ++doubles;
        else if (c == '\'')
            ++singles;
    }
    switch (style) {
        case QuoteStyle::ForceDouble:
            return '"';
        case QuoteStyle::ForceSingle:
            return '\'';
        case QuoteStyle::AutoPreferDouble:
            return doubles > singles ? '\'' : '"';
        case QuoteStyle::AutoPreferSingle:
            return singles > doubles ? '"' : '\'';
    }
    return original;
}

void appendRequoted(std::string& out, std::string_view body, char original, QuoteStyle style) {
    const char target = chooseQuote(body, original, style);
    out += target;
    if (target == original) {
        out.append(body);
        out += target;
        return;
    }
    for (size_t i = 0; i < body.size(); ++i) {
        const char c = body[i];
        if (c == '\\' && i + 1 < body.size()) {
            const char next = body[++i];
            if (next != original) {
                out += '\\';
            }
            out += next;
        } else if (c == target) {
            out += '\\';
            out += c;
        } else {
            out += c;
        }
    }
    out += target;
}

// Copies one line to out while tracking long brackets across lines. When
// rewrite is set, short string literals outside comments are requoted.
void scanLine(std::string_view line, size_t lineNo, LexState& st, bool rewrite,
              const FormatConfig& config, std::string& out) {
    size_t i = 0;
    while (i < line.size()) {
        if (st.inLong) {
            std::string close = "]" + std::string(st.level, '=') + "]";
            auto pos = line.find(close, i);
            if (pos == std::string_view::npos) {
                out.append(line.substr(i));
                return;
            }
            pos += close.size();
            out.append(line.substr(i, pos - i));
            st.inLong = false;
            i = pos;
            continue;
        }

        const char c = line[i];
        if (c == '-' && i + 1 < line.size() && line[i + 1] == '-') {
            size_t consumed = 0;
            if (auto level = longBracketLevel(line, i + 2, consumed)) {
                st.inLong = true;
                st.level = *level;
                st.openedAtLine = lineNo;
                out.append(line.substr(i, 2 + consumed));
                i += 2 + consumed;
                continue;
            }
            // Line comment runs to end of line
            out.append(line.substr(i));
            return;
        }
        if (c == '"' || c == '\'') {
            size_t j = i + 1;
            while (j < line.size() && line[j] != c) {
                if (line[j] == '\\')
                    ++j;
                ++j;
            }
            if (j >= line.size()) {
                // Unterminated on this line (continuation escape); leave untouched
                out.append(line.substr(i));
                return;
            }
            auto body = line.substr(i + 1, j - i - 1);
            if (rewrite) {
                appendRequoted(out, body, c, config.quoteStyle);
            } else {
                out.append(line.substr(i, j - i + 1));
            }
            i = j + 1;
            continue;
        }
        if (c == '[') {
            size_t consumed = 0;
            if (auto level = longBracketLevel(line, i, consumed)) {
                st.inLong = true;
                st.level = *level;
                st.openedAtLine = lineNo;
                out.append(line.substr(i, consumed));
                i += consumed;
                continue;
            }
        }
        out += c;
        ++i;
    }
}

std::string reindent(std::string_view line, const FormatConfig& config) {
    const size_t width = std::max<size_t>(config.indentWidth, 1);
    size_t columns = 0;
    size_t i = 0;
    for (; i < line.size(); ++i) {
        if (line[i] == ' ') {
            columns += 1;
        } else if (line[i] == '\t') {
            columns += width - (columns % width);
        } else {
            break;
        }
    }
    std::string out;
    if (config.indentType == IndentType::Tabs) {
        out.append(columns / width, '\t');
        out.append(columns % width, ' ');
    } else {
        out.append(columns, ' ');
    }
    out.append(line.substr(i));
    return out;
}

std::string_view trimTrailingBlanks(std::string_view s) {
    size_t end = s.size();
    while (end > 0 && (s[end - 1] == ' ' || s[end - 1] == '\t')) {
        --end;
    }
    return s.substr(0, end);
}

struct OutputLine {
    std::string text;
    bool formatted = false;
};

} // namespace

Result<std::string> WhitespaceFormatter::format(
    std::string_view content, const FormatConfig& config,
    const std::optional<config::FormatRange>& range) const {
    const std::string_view eol = config::lineEndingSequence(config.lineEndings);

    std::vector<OutputLine> lines;
    LexState st;
    size_t offset = 0;
    size_t lineNo = 0;
    bool endsWithNewline = false;

    while (offset < content.size()) {
        ++lineNo;
        auto nl = content.find('\n', offset);
        const size_t next = (nl == std::string_view::npos) ? content.size() : nl + 1;
        std::string_view raw = content.substr(offset, next - offset);
        endsWithNewline = (nl != std::string_view::npos);
        if (!raw.empty() && raw.back() == '\n')
            raw.remove_suffix(1);
        if (!raw.empty() && raw.back() == '\r')
            raw.remove_suffix(1);

        const bool startsInLong = st.inLong;
        const bool inRange = !range || range->contains(offset);
        const bool rewrite = inRange && !startsInLong;

        OutputLine line;
        line.formatted = rewrite;
        if (rewrite) {
            std::string scanned;
            scanLine(reindent(raw, config), lineNo, st, true, config, scanned);
            // Trailing whitespace inside an unterminated long string is content
            line.text = st.inLong ? scanned : std::string(trimTrailingBlanks(scanned));
            if (trimTrailingBlanks(line.text).empty() && !st.inLong) {
                line.text.clear();
            }
        } else {
            scanLine(raw, lineNo, st, false, config, line.text);
        }
        lines.push_back(std::move(line));
        offset = next;
    }

    if (st.inLong) {
        return Error{ErrorCode::ParseError,
                     fmt::format("unterminated long string or comment starting at line {}",
                                 st.openedAtLine)};
    }

    std::vector<const OutputLine*> kept;
    kept.reserve(lines.size());
    for (const auto& line : lines) {
        if (line.formatted && line.text.empty()) {
            if (kept.empty() || kept.back()->text.empty()) {
                continue;
            }
        }
        kept.push_back(&line);
    }
    while (!kept.empty() && kept.back()->formatted && kept.back()->text.empty()) {
        kept.pop_back();
    }

    std::string out;
    out.reserve(content.size() + content.size() / 8);
    for (size_t i = 0; i < kept.size(); ++i) {
        if (i > 0) {
            out.append(eol);
        }
        out.append(kept[i]->text);
    }
    if (!kept.empty() && (kept.back()->formatted || endsWithNewline)) {
        out.append(eol);
    }
    return out;
}

std::shared_ptr<const IFormatter> makeDefaultFormatter() {
    return std::make_shared<WhitespaceFormatter>();
}

} // namespace lunafmt::format
