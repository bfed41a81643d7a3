#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace umpcore::constants {

inline constexpr std::size_t kMaxVarintLen = 5;

inline constexpr std::size_t kOnesieKeyLen = 32;
inline constexpr std::size_t kOnesieAesKeyLen = 16;
inline constexpr std::size_t kOnesieIvLen = 16;

inline constexpr std::size_t kStreamChunkSize = 1u << 16;
inline constexpr std::size_t kInflateChunkSize = 1u << 14;
// Upper bound on the up-front reservation for a part spanning buffers.
inline constexpr std::size_t kMaxPartReserve = 1u << 20;

inline constexpr std::int32_t kHttpStatusOk = 200;

inline constexpr std::string_view kEnvLenient = "UMPCORE_LENIENT";
inline constexpr std::string_view kEnvContinuation = "UMPCORE_CONTINUATION";
inline constexpr std::string_view kEnvRetainMedia = "UMPCORE_RETAIN_MEDIA";
inline constexpr std::string_view kEnvChunkSize = "UMPCORE_CHUNK_SIZE";
inline constexpr std::string_view kEnvLogLevel = "UMPCORE_LOG_LEVEL";

}  // namespace umpcore::constants
