#include "umpcore/cli_colors.hpp"

#include <cstdio>
#include <iostream>

#if defined(_WIN32) || defined(_WIN64)
    #include <io.h>
    #include <windows.h>
    #define isatty _isatty
    #define fileno _fileno

    #ifndef ENABLE_VIRTUAL_TERMINAL_PROCESSING
        #define ENABLE_VIRTUAL_TERMINAL_PROCESSING 0x0004
    #endif
#else
    #include <unistd.h>
#endif

namespace umpcore::cli {

namespace {
    bool g_colors_forced = false;
    bool g_colors_enabled = true;
    bool g_stdout_checked = false;
    bool g_stdout_tty = false;
    bool g_stderr_checked = false;
    bool g_stderr_tty = false;

#if defined(_WIN32) || defined(_WIN64)
    bool EnableWindowsAnsiColors(DWORD handle_id) {
        HANDLE handle = GetStdHandle(handle_id);
        if (handle == INVALID_HANDLE_VALUE) {
            return false;
        }
        DWORD mode = 0;
        if (!GetConsoleMode(handle, &mode)) {
            return false;
        }
        mode |= ENABLE_VIRTUAL_TERMINAL_PROCESSING;
        return SetConsoleMode(handle, mode) != 0;
    }
#endif

    bool DetectTty(FILE* stream) {
        bool is_tty = isatty(fileno(stream)) != 0;
#if defined(_WIN32) || defined(_WIN64)
        if (is_tty) {
            is_tty = EnableWindowsAnsiColors(stream == stderr ? STD_ERROR_HANDLE : STD_OUTPUT_HANDLE);
        }
#endif
        return is_tty;
    }
}

bool ColorsEnabled(std::ostream& os) {
    if (g_colors_forced) {
        return g_colors_enabled;
    }
    if (&os == &std::cerr || &os == &std::clog) {
        if (!g_stderr_checked) {
            g_stderr_tty = DetectTty(stderr);
            g_stderr_checked = true;
        }
        return g_stderr_tty;
    }
    if (&os == &std::cout) {
        if (!g_stdout_checked) {
            g_stdout_tty = DetectTty(stdout);
            g_stdout_checked = true;
        }
        return g_stdout_tty;
    }
    // string streams and files
    return false;
}

void SetColorsEnabled(bool enabled) {
    g_colors_enabled = enabled;
    g_colors_forced = true;
}

std::string Colorize(const std::string& text, const char* color, std::ostream& os) {
    if (!ColorsEnabled(os)) {
        return text;
    }
    return std::string(color) + text + color::RESET;
}

}  // namespace umpcore::cli
