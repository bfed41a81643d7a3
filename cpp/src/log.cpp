#include "umpcore/log.hpp"

#include "umpcore/cli_colors.hpp"
#include "umpcore/constants.hpp"
#include "umpcore/env.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>

namespace umpcore::log {

namespace {

bool g_threshold_set = false;
Level g_threshold = Level::kWarn;
std::ostream* g_sink = nullptr;

const char* LevelColor(Level level) {
    switch (level) {
        case Level::kDebug:
            return cli::color::BRIGHT_BLACK;
        case Level::kInfo:
            return cli::color::CYAN;
        case Level::kWarn:
            return cli::color::YELLOW;
        case Level::kError:
        case Level::kOff:
            return cli::color::BOLD_RED;
    }
    return cli::color::RESET;
}

}  // namespace

std::optional<Level> ParseLevel(std::string_view text) {
    std::string value(text);
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    if (value == "debug" || value == "trace") {
        return Level::kDebug;
    }
    if (value == "info") {
        return Level::kInfo;
    }
    if (value == "warn" || value == "warning") {
        return Level::kWarn;
    }
    if (value == "error") {
        return Level::kError;
    }
    if (value == "off" || value == "none") {
        return Level::kOff;
    }
    return std::nullopt;
}

std::string_view LevelName(Level level) {
    switch (level) {
        case Level::kDebug:
            return "debug";
        case Level::kInfo:
            return "info";
        case Level::kWarn:
            return "warn";
        case Level::kError:
            return "error";
        case Level::kOff:
            return "off";
    }
    return "unknown";
}

Level Threshold() {
    if (!g_threshold_set) {
        std::string raw = env::Get(constants::kEnvLogLevel);
        if (!raw.empty()) {
            g_threshold = ParseLevel(raw).value_or(Level::kWarn);
        }
        g_threshold_set = true;
    }
    return g_threshold;
}

void SetThreshold(Level level) {
    g_threshold = level;
    g_threshold_set = true;
}

bool Enabled(Level level) {
    return level != Level::kOff && level >= Threshold();
}

void SetSink(std::ostream* sink) {
    g_sink = sink;
}

void Write(Level level, std::string_view message) {
    if (!Enabled(level)) {
        return;
    }
    std::ostream& out = g_sink ? *g_sink : std::cerr;
    std::string tag = "[umpcore " + std::string(LevelName(level)) + "]";
    out << cli::Colorize(tag, LevelColor(level), out) << ' ' << message << '\n';
}

}  // namespace umpcore::log
