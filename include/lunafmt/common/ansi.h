#pragma once

// ANSI color support shared by the diff renderer and the command line.
// Header-only, no external dependencies.

#include <cstdio>
#include <cstdlib>
#include <string>
#include <string_view>

#if defined(_WIN32)
#include <io.h>
#define LUNAFMT_ISATTY _isatty
#define LUNAFMT_FILENO _fileno
#else
#include <unistd.h>
#define LUNAFMT_ISATTY isatty
#define LUNAFMT_FILENO fileno
#endif

namespace lunafmt::common {

struct Ansi {
    static constexpr const char* RESET = "\x1b[0m";
    static constexpr const char* BOLD = "\x1b[1m";
    static constexpr const char* RED = "\x1b[31m";
    static constexpr const char* GREEN = "\x1b[32m";
    static constexpr const char* CYAN = "\x1b[36m";
};

enum class ColorChoice { Always, Auto, Never };

// Basic TTY detection on stdout
inline bool stdout_is_tty() {
    return LUNAFMT_ISATTY(LUNAFMT_FILENO(stdout));
}

// Auto enables color when NO_COLOR is unset, TERM is not "dumb" and stdout is a TTY
inline bool should_use_color(ColorChoice choice) {
    if (choice == ColorChoice::Always)
        return true;
    if (choice == ColorChoice::Never)
        return false;
    if (std::getenv("NO_COLOR"))
        return false;
    const char* term = std::getenv("TERM");
    if (term && std::string_view(term) == "dumb")
        return false;
    return stdout_is_tty();
}

inline void append_colored(std::string& out, std::string_view s, const char* code, bool enabled) {
    if (!enabled || code == nullptr || *code == '\0') {
        out.append(s);
        return;
    }
    out.append(code);
    out.append(s);
    out.append(Ansi::RESET);
}

} // namespace lunafmt::common
