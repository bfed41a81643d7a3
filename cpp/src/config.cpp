#include "umpcore/config.hpp"

#include "umpcore/env.hpp"

#include <algorithm>
#include <cctype>
#include <string>

namespace umpcore {

std::optional<ContinuationFraming> ParseContinuationFraming(std::string_view text) {
    std::string value(text);
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    if (value == "reframed") {
        return ContinuationFraming::kReframed;
    }
    if (value == "raw") {
        return ContinuationFraming::kRaw;
    }
    return std::nullopt;
}

std::string_view ContinuationFramingName(ContinuationFraming framing) {
    return framing == ContinuationFraming::kRaw ? "raw" : "reframed";
}

Config Config::FromEnv() {
    Config config;
    config.lenient = env::IsEnabled(constants::kEnvLenient, config.lenient);
    std::string framing = env::Get(constants::kEnvContinuation);
    if (!framing.empty()) {
        auto parsed = ParseContinuationFraming(framing);
        if (parsed.has_value()) {
            config.continuation = *parsed;
        } else {
            log::Warn("Ignoring unrecognized " + std::string(constants::kEnvContinuation) + "=" + framing);
        }
    }
    config.retain_media = env::IsEnabled(constants::kEnvRetainMedia, config.retain_media);
    config.chunk_size = env::GetSize(constants::kEnvChunkSize, config.chunk_size);
    std::string level = env::Get(constants::kEnvLogLevel);
    auto parsed_level = log::ParseLevel(level);
    config.log_level = parsed_level ? *parsed_level : log::Threshold();
    return config;
}

}  // namespace umpcore
