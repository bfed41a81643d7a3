#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace umpcore::log {

enum class Level {
    kDebug = 0,
    kInfo = 1,
    kWarn = 2,
    kError = 3,
    kOff = 4
};

std::optional<Level> ParseLevel(std::string_view text);
std::string_view LevelName(Level level);

// Threshold defaults to UMPCORE_LOG_LEVEL, or warn when unset.
Level Threshold();
void SetThreshold(Level level);
bool Enabled(Level level);

// Redirects output, used by tests. nullptr restores std::cerr.
void SetSink(std::ostream* sink);

void Write(Level level, std::string_view message);

inline void Debug(std::string_view message) { Write(Level::kDebug, message); }
inline void Info(std::string_view message) { Write(Level::kInfo, message); }
inline void Warn(std::string_view message) { Write(Level::kWarn, message); }
inline void Error(std::string_view message) { Write(Level::kError, message); }

}  // namespace umpcore::log
