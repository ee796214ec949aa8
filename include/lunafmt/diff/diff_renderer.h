#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <lunafmt/core/types.h>

namespace lunafmt::diff {

enum class EditKind { Equal, Delete, Insert };

struct Edit {
    EditKind kind;
    size_t oldIndex; // valid for Equal and Delete
    size_t newIndex; // valid for Equal and Insert
};

/**
 * @brief Shortest edit script between two line sequences.
 *
 * Myers with bisection: O((N+M)D) time, memory linear in N+M.
 */
std::vector<Edit> diffLines(const std::vector<std::string_view>& a,
                            const std::vector<std::string_view>& b);

/**
 * @brief Render a unified diff of two texts.
 *
 * The output starts with header on its own line, followed by "@@ -a,b +c,d @@"
 * hunks with contextLines of unchanged lines around each change. Returns
 * std::nullopt when the texts are identical.
 */
Result<std::optional<std::string>> renderDiff(std::string_view original, std::string_view formatted,
                                              size_t contextLines, std::string_view header,
                                              bool useColor);

} // namespace lunafmt::diff
