#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace umpcore {

using Bytes = std::vector<std::uint8_t>;

// Documented UMP part ids. Values outside this list are valid on the wire and
// are forwarded as opaque payloads.
enum class PartType : std::uint32_t {
    kUnknown = 0,
    kOnesieHeader = 10,
    kOnesieData = 11,
    kOnesieEncryptedMedia = 12,
    kMediaHeader = 20,
    kMedia = 21,
    kMediaEnd = 22,
    kLiveMetadata = 31,
    kHostnameChangeHint = 32,
    kLiveMetadataPromise = 33,
    kLiveMetadataPromiseCancellation = 34,
    kNextRequestPolicy = 35,
    kUstreamerVideoAndFormatData = 36,
    kFormatSelectionConfig = 37,
    kUstreamerSelectedMediaStream = 38,
    kFormatInitializationMetadata = 42,
    kSabrRedirect = 43,
    kSabrError = 44,
    kSabrSeek = 45,
    kReloadPlayerResponse = 46,
    kPlaybackStartPolicy = 47,
    kAllowedCachedFormats = 48,
    kStartBwSamplingHint = 49,
    kPauseBwSamplingHint = 50,
    kSelectableFormats = 51,
    kRequestIdentifier = 52,
    kRequestCancellationPolicy = 53,
    kOnesiePrefetchRejection = 54,
    kTimelineContext = 55,
    kRequestPipelining = 56,
    kSabrContextUpdate = 57,
    kStreamProtectionStatus = 58,
    kSabrContextSendingPolicy = 59,
    kLawnmowerPolicy = 60,
    kSabrAck = 61,
    kEndOfTrack = 62,
    kCacheLoadPolicy = 63,
    kLawnmowerMessagingPolicy = 64,
    kPrewarmConnection = 65,
    kPlaybackDebugInfo = 66,
    kSnackbarMessage = 67
};

inline constexpr std::uint32_t ToWire(PartType type) noexcept {
    return static_cast<std::uint32_t>(type);
}

bool IsDocumentedPartType(std::uint32_t type) noexcept;
std::string PartTypeName(std::uint32_t type);

struct Part {
    std::uint32_t type = 0;
    Bytes payload;

    bool Is(PartType expected) const noexcept { return type == ToWire(expected); }
    std::size_t size() const noexcept { return payload.size(); }
};

bool operator==(const Part& lhs, const Part& rhs);
bool operator!=(const Part& lhs, const Part& rhs);

void AppendPart(Bytes& out, std::uint32_t type, const std::uint8_t* payload, std::size_t len);
void AppendPart(Bytes& out, std::uint32_t type, const Bytes& payload);
Bytes SerializePart(const Part& part);

}  // namespace umpcore
