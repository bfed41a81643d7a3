#pragma once

#include "umpcore/part.hpp"
#include "umpcore/schema.hpp"

#include <cstddef>
#include <cstdint>
#include <variant>

namespace umpcore {

// Payload of a part this library does not interpret.
struct OpaquePart {
    Bytes payload;
};

struct OnesieHeaderEvent {
    OnesieHeader header;
    // Set when the header now waits for its ONESIE_DATA part.
    bool awaiting_data = false;
};

struct PlayerResponse {
    OnesieHeader header;
    InnertubeResponse response;
};

struct InnertubeResponsePart {
    OnesieHeader header;
    Bytes plaintext;
};

struct MediaKeyUpdate {
    OnesieHeader header;
    std::size_t key_size = 0;
};

// A player response whose wrapper reported a failure. Decoding continues.
struct UpstreamFailure {
    OnesieHeader header;
    std::uint32_t proxy_status = 0;
    std::int32_t http_status = 0;
    Bytes body;
};

struct MediaHeaderEvent {
    MediaHeader header;
    // false when the header restated an already open stream
    bool opened = true;
};

// Decrypted and decompressed bytes appended to one media stream.
struct MediaChunk {
    std::uint32_t header_id = 0;
    Bytes data;
    bool encrypted = false;
};

struct MediaEnd {
    std::uint32_t header_id = 0;
    std::uint64_t total_bytes = 0;
    bool failed = false;
};

using EventBody = std::variant<OpaquePart,
                               OnesieHeaderEvent,
                               PlayerResponse,
                               InnertubeResponsePart,
                               MediaKeyUpdate,
                               UpstreamFailure,
                               MediaHeaderEvent,
                               MediaChunk,
                               MediaEnd>;

struct Event {
    std::uint32_t part_type = 0;
    EventBody body;

    template <typename T>
    const T* As() const noexcept {
        return std::get_if<T>(&body);
    }

    template <typename T>
    bool Is() const noexcept {
        return std::holds_alternative<T>(body);
    }
};

// One finalized media stream. data is empty when media is not retained.
struct CompletedMedia {
    MediaHeader header;
    Bytes data;
    std::uint64_t total_bytes = 0;
};

}  // namespace umpcore
