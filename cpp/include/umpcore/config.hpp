#pragma once

#include "umpcore/constants.hpp"
#include "umpcore/log.hpp"

#include <cstddef>
#include <optional>
#include <string_view>

namespace umpcore {

enum class ContinuationFraming {
    // Continuation buffers restate a MEDIA_HEADER and a part of the pending type.
    kReframed,
    // Buffers are arbitrary slices of one byte stream.
    kRaw
};

std::optional<ContinuationFraming> ParseContinuationFraming(std::string_view text);
std::string_view ContinuationFramingName(ContinuationFraming framing);

struct Config {
    // Log and recover from protocol violations instead of failing.
    bool lenient = false;
    ContinuationFraming continuation = ContinuationFraming::kReframed;
    // Keep finalized media bytes in memory for NextMedia().
    bool retain_media = true;
    std::size_t chunk_size = constants::kStreamChunkSize;
    log::Level log_level = log::Level::kWarn;

    static Config FromEnv();
};

}  // namespace umpcore
