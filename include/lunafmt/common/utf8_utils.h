#pragma once

#include <optional>
#include <string_view>

namespace lunafmt::common {

// Offset of the first byte that does not start a valid UTF-8 sequence, or
// std::nullopt when the whole input is valid.
inline std::optional<size_t> firstInvalidUtf8(std::string_view input) {
    const unsigned char* data = reinterpret_cast<const unsigned char*>(input.data());
    size_t i = 0;
    const size_t n = input.size();
    auto cont = [&](size_t at) { return at < n && (data[at] & 0xC0) == 0x80; };

    while (i < n) {
        unsigned char c = data[i];
        if (c < 0x80) { // ASCII
            ++i;
        } else if (c >= 0xC2 && c <= 0xDF && cont(i + 1)) { // 2-byte sequence
            i += 2;
        } else if (c >= 0xE0 && c <= 0xEF && cont(i + 1) && cont(i + 2)) { // 3-byte sequence
            // Reject overlongs (E0 80..9F) and surrogates (ED A0..BF)
            if ((c == 0xE0 && data[i + 1] < 0xA0) || (c == 0xED && data[i + 1] > 0x9F))
                return i;
            i += 3;
        } else if (c >= 0xF0 && c <= 0xF4 && cont(i + 1) && cont(i + 2) &&
                   cont(i + 3)) { // 4-byte sequence
            if ((c == 0xF0 && data[i + 1] < 0x90) || (c == 0xF4 && data[i + 1] > 0x8F))
                return i;
            i += 4;
        } else {
            return i;
        }
    }
    return std::nullopt;
}

} // namespace lunafmt::common
