#include <lunafmt/common/ansi.h>
#include <lunafmt/common/pattern_utils.h>
#include <lunafmt/diff/diff_renderer.h>

#include <algorithm>

namespace lunafmt::diff {

namespace {

using common::Ansi;

void appendLine(std::string& out, char prefix, std::string_view line, const char* color,
                bool useColor) {
    std::string text(1, prefix);
    text.append(common::strip_line_end(line));
    common::append_colored(out, text, color, useColor);
    out += '\n';
    if (line.empty() || line.back() != '\n') {
        out += "\\ No newline at end of file\n";
    }
}

/**
 * Linear-space Myers diff: trims the common prefix and suffix, then splits the
 * remaining rectangle at a point on an optimal path found by searching forward
 * and backward at once, and recurses on both halves.
 */
class LineDiff {
public:
    LineDiff(const std::vector<std::string_view>& a, const std::vector<std::string_view>& b,
             std::vector<Edit>& edits)
        : a_(a), b_(b), edits_(edits) {}

    void run() {
        compare(0, static_cast<long>(a_.size()), 0, static_cast<long>(b_.size()));
    }

private:
    bool same(long x, long y) const {
        return a_[static_cast<size_t>(x)] == b_[static_cast<size_t>(y)];
    }

    void equal(long x, long y) {
        edits_.push_back(Edit{EditKind::Equal, static_cast<size_t>(x), static_cast<size_t>(y)});
    }

    void compare(long aLo, long aHi, long bLo, long bHi) {
        while (aLo < aHi && bLo < bHi && same(aLo, bLo)) {
            equal(aLo++, bLo++);
        }
        long suffix = 0;
        while (aHi - suffix > aLo && bHi - suffix > bLo && same(aHi - suffix - 1, bHi - suffix - 1)) {
            ++suffix;
        }
        aHi -= suffix;
        bHi -= suffix;

        if (aLo == aHi) {
            for (long y = bLo; y < bHi; ++y) {
                edits_.push_back(Edit{EditKind::Insert, 0, static_cast<size_t>(y)});
            }
        } else if (bLo == bHi) {
            for (long x = aLo; x < aHi; ++x) {
                edits_.push_back(Edit{EditKind::Delete, static_cast<size_t>(x), 0});
            }
        } else {
            bisect(aLo, aHi, bLo, bHi);
        }

        for (long i = 0; i < suffix; ++i) {
            equal(aHi + i, bHi + i);
        }
    }

    // Both ranges are non-empty and share no first or last line here.
    void bisect(long aLo, long aHi, long bLo, long bHi) {
        const long n = aHi - aLo;
        const long m = bHi - bLo;
        const long maxD = (n + m + 1) / 2;
        const long offset = maxD;
        const long length = 2 * maxD + 2;
        const long delta = n - m;
        // With an odd delta the paths can only meet during the forward pass
        const bool front = (delta % 2) != 0;

        std::vector<long> forward(static_cast<size_t>(length), -1);
        std::vector<long> backward(static_cast<size_t>(length), -1);
        forward[static_cast<size_t>(offset + 1)] = 0;
        backward[static_cast<size_t>(offset + 1)] = 0;
        auto fwd = [&](long i) -> long& { return forward[static_cast<size_t>(i)]; };
        auto bwd = [&](long i) -> long& { return backward[static_cast<size_t>(i)]; };

        // Diagonals that ran off the grid are not explored again
        long k1start = 0;
        long k1end = 0;
        long k2start = 0;
        long k2end = 0;

        for (long d = 0; d < maxD; ++d) {
            for (long k1 = -d + k1start; k1 <= d - k1end; k1 += 2) {
                const long k1off = offset + k1;
                long x1 = (k1 == -d || (k1 != d && fwd(k1off - 1) < fwd(k1off + 1)))
                              ? fwd(k1off + 1)
                              : fwd(k1off - 1) + 1;
                long y1 = x1 - k1;
                while (x1 < n && y1 < m && same(aLo + x1, bLo + y1)) {
                    ++x1;
                    ++y1;
                }
                fwd(k1off) = x1;
                if (x1 > n) {
                    k1end += 2;
                } else if (y1 > m) {
                    k1start += 2;
                } else if (front) {
                    const long k2off = offset + delta - k1;
                    if (k2off >= 0 && k2off < length && bwd(k2off) != -1 && x1 >= n - bwd(k2off)) {
                        split(aLo, aHi, bLo, bHi, x1, y1);
                        return;
                    }
                }
            }

            for (long k2 = -d + k2start; k2 <= d - k2end; k2 += 2) {
                const long k2off = offset + k2;
                long x2 = (k2 == -d || (k2 != d && bwd(k2off - 1) < bwd(k2off + 1)))
                              ? bwd(k2off + 1)
                              : bwd(k2off - 1) + 1;
                long y2 = x2 - k2;
                while (x2 < n && y2 < m && same(aHi - x2 - 1, bHi - y2 - 1)) {
                    ++x2;
                    ++y2;
                }
                bwd(k2off) = x2;
                if (x2 > n) {
                    k2end += 2;
                } else if (y2 > m) {
                    k2start += 2;
                } else if (!front) {
                    const long k1off = offset + delta - k2;
                    if (k1off >= 0 && k1off < length && fwd(k1off) != -1) {
                        const long x1 = fwd(k1off);
                        const long y1 = offset + x1 - k1off;
                        if (x1 >= n - x2) {
                            split(aLo, aHi, bLo, bHi, x1, y1);
                            return;
                        }
                    }
                }
            }
        }

        // No overlap found; a full replacement is still a valid script
        for (long x = aLo; x < aHi; ++x) {
            edits_.push_back(Edit{EditKind::Delete, static_cast<size_t>(x), 0});
        }
        for (long y = bLo; y < bHi; ++y) {
            edits_.push_back(Edit{EditKind::Insert, 0, static_cast<size_t>(y)});
        }
    }

    void split(long aLo, long aHi, long bLo, long bHi, long x, long y) {
        compare(aLo, aLo + x, bLo, bLo + y);
        compare(aLo + x, aHi, bLo + y, bHi);
    }

    const std::vector<std::string_view>& a_;
    const std::vector<std::string_view>& b_;
    std::vector<Edit>& edits_;
};

} // namespace

std::vector<Edit> diffLines(const std::vector<std::string_view>& a,
                            const std::vector<std::string_view>& b) {
    std::vector<Edit> edits;
    LineDiff(a, b, edits).run();
    return edits;
}

Result<std::optional<std::string>> renderDiff(std::string_view original, std::string_view formatted,
                                              size_t contextLines, std::string_view header,
                                              bool useColor) {
    if (original == formatted) {
        return std::optional<std::string>{};
    }

    try {
        const auto oldLines = common::split_lines_keep_ends(original);
        const auto newLines = common::split_lines_keep_ends(formatted);
        const auto edits = diffLines(oldLines, newLines);

        // Lines of each side consumed before edit i
        std::vector<size_t> oldBefore(edits.size() + 1, 0);
        std::vector<size_t> newBefore(edits.size() + 1, 0);
        for (size_t i = 0; i < edits.size(); ++i) {
            oldBefore[i + 1] = oldBefore[i] + (edits[i].kind != EditKind::Insert ? 1 : 0);
            newBefore[i + 1] = newBefore[i] + (edits[i].kind != EditKind::Delete ? 1 : 0);
        }

        std::string out;
        common::append_colored(out, header, Ansi::BOLD, useColor);
        out += '\n';

        const size_t n = edits.size();
        size_t i = 0;
        while (i < n) {
            while (i < n && edits[i].kind == EditKind::Equal) {
                ++i;
            }
            if (i == n) {
                break;
            }

            const size_t start = i >= contextLines ? i - contextLines : 0;
            size_t changeEnd = i;
            size_t j = i;
            while (j < n) {
                if (edits[j].kind != EditKind::Equal) {
                    changeEnd = ++j;
                    continue;
                }
                size_t k = j;
                while (k < n && edits[k].kind == EditKind::Equal) {
                    ++k;
                }
                // Merge with the next change when the gap fits in both contexts
                if (k == n || k - j > 2 * contextLines) {
                    break;
                }
                j = k;
            }
            const size_t end = std::min(n, changeEnd + contextLines);

            const size_t oldCount = oldBefore[end] - oldBefore[start];
            const size_t newCount = newBefore[end] - newBefore[start];
            const size_t oldStart = oldCount ? oldBefore[start] + 1 : oldBefore[start];
            const size_t newStart = newCount ? newBefore[start] + 1 : newBefore[start];
            common::append_colored(
                out, fmt::format("@@ -{},{} +{},{} @@", oldStart, oldCount, newStart, newCount),
                Ansi::CYAN, useColor);
            out += '\n';

            for (size_t e = start; e < end; ++e) {
                const auto& edit = edits[e];
                switch (edit.kind) {
                    case EditKind::Equal:
                        appendLine(out, ' ', oldLines[edit.oldIndex], nullptr, useColor);
                        break;
                    case EditKind::Delete:
                        appendLine(out, '-', oldLines[edit.oldIndex], Ansi::RED, useColor);
                        break;
                    case EditKind::Insert:
                        appendLine(out, '+', newLines[edit.newIndex], Ansi::GREEN, useColor);
                        break;
                }
            }
            i = end;
        }

        return std::optional<std::string>{std::move(out)};
    } catch (const std::exception& e) {
        return Error{ErrorCode::InternalError, fmt::format("could not render diff: {}", e.what())};
    }
}

} // namespace lunafmt::diff
