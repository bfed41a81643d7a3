#include "umpcore/part.hpp"

#include "umpcore/constants.hpp"
#include "umpcore/varint.hpp"

#include <limits>
#include <stdexcept>

namespace umpcore {

namespace {

struct PartName {
    PartType type;
    const char* name;
};

constexpr PartName kPartNames[] = {
    {PartType::kOnesieHeader, "ONESIE_HEADER"},
    {PartType::kOnesieData, "ONESIE_DATA"},
    {PartType::kOnesieEncryptedMedia, "ONESIE_ENCRYPTED_MEDIA"},
    {PartType::kMediaHeader, "MEDIA_HEADER"},
    {PartType::kMedia, "MEDIA"},
    {PartType::kMediaEnd, "MEDIA_END"},
    {PartType::kLiveMetadata, "LIVE_METADATA"},
    {PartType::kHostnameChangeHint, "HOSTNAME_CHANGE_HINT"},
    {PartType::kLiveMetadataPromise, "LIVE_METADATA_PROMISE"},
    {PartType::kLiveMetadataPromiseCancellation, "LIVE_METADATA_PROMISE_CANCELLATION"},
    {PartType::kNextRequestPolicy, "NEXT_REQUEST_POLICY"},
    {PartType::kUstreamerVideoAndFormatData, "USTREAMER_VIDEO_AND_FORMAT_DATA"},
    {PartType::kFormatSelectionConfig, "FORMAT_SELECTION_CONFIG"},
    {PartType::kUstreamerSelectedMediaStream, "USTREAMER_SELECTED_MEDIA_STREAM"},
    {PartType::kFormatInitializationMetadata, "FORMAT_INITIALIZATION_METADATA"},
    {PartType::kSabrRedirect, "SABR_REDIRECT"},
    {PartType::kSabrError, "SABR_ERROR"},
    {PartType::kSabrSeek, "SABR_SEEK"},
    {PartType::kReloadPlayerResponse, "RELOAD_PLAYER_RESPONSE"},
    {PartType::kPlaybackStartPolicy, "PLAYBACK_START_POLICY"},
    {PartType::kAllowedCachedFormats, "ALLOWED_CACHED_FORMATS"},
    {PartType::kStartBwSamplingHint, "START_BW_SAMPLING_HINT"},
    {PartType::kPauseBwSamplingHint, "PAUSE_BW_SAMPLING_HINT"},
    {PartType::kSelectableFormats, "SELECTABLE_FORMATS"},
    {PartType::kRequestIdentifier, "REQUEST_IDENTIFIER"},
    {PartType::kRequestCancellationPolicy, "REQUEST_CANCELLATION_POLICY"},
    {PartType::kOnesiePrefetchRejection, "ONESIE_PREFETCH_REJECTION"},
    {PartType::kTimelineContext, "TIMELINE_CONTEXT"},
    {PartType::kRequestPipelining, "REQUEST_PIPELINING"},
    {PartType::kSabrContextUpdate, "SABR_CONTEXT_UPDATE"},
    {PartType::kStreamProtectionStatus, "STREAM_PROTECTION_STATUS"},
    {PartType::kSabrContextSendingPolicy, "SABR_CONTEXT_SENDING_POLICY"},
    {PartType::kLawnmowerPolicy, "LAWNMOWER_POLICY"},
    {PartType::kSabrAck, "SABR_ACK"},
    {PartType::kEndOfTrack, "END_OF_TRACK"},
    {PartType::kCacheLoadPolicy, "CACHE_LOAD_POLICY"},
    {PartType::kLawnmowerMessagingPolicy, "LAWNMOWER_MESSAGING_POLICY"},
    {PartType::kPrewarmConnection, "PREWARM_CONNECTION"},
    {PartType::kPlaybackDebugInfo, "PLAYBACK_DEBUG_INFO"},
    {PartType::kSnackbarMessage, "SNACKBAR_MESSAGE"},
};

const char* FindName(std::uint32_t type) {
    for (const auto& entry : kPartNames) {
        if (ToWire(entry.type) == type) {
            return entry.name;
        }
    }
    return nullptr;
}

}  // namespace

bool IsDocumentedPartType(std::uint32_t type) noexcept {
    return FindName(type) != nullptr;
}

std::string PartTypeName(std::uint32_t type) {
    const char* name = FindName(type);
    if (name) {
        return name;
    }
    return "UNKNOWN_" + std::to_string(type);
}

bool operator==(const Part& lhs, const Part& rhs) {
    return lhs.type == rhs.type && lhs.payload == rhs.payload;
}

bool operator!=(const Part& lhs, const Part& rhs) {
    return !(lhs == rhs);
}

void AppendPart(Bytes& out, std::uint32_t type, const std::uint8_t* payload, std::size_t len) {
    if (len > std::numeric_limits<std::uint32_t>::max()) {
        throw std::runtime_error("UMP part payload too large");
    }
    varint::AppendEncoded(out, type);
    varint::AppendEncoded(out, static_cast<std::uint32_t>(len));
    if (payload != nullptr && len > 0) {
        out.insert(out.end(), payload, payload + len);
    }
}

void AppendPart(Bytes& out, std::uint32_t type, const Bytes& payload) {
    AppendPart(out, type, payload.data(), payload.size());
}

Bytes SerializePart(const Part& part) {
    Bytes out;
    out.reserve(part.payload.size() + 2 * constants::kMaxVarintLen);
    AppendPart(out, part.type, part.payload);
    return out;
}

}  // namespace umpcore
