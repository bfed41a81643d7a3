#pragma once

#include "umpcore/compression.hpp"
#include "umpcore/config.hpp"
#include "umpcore/crypto.hpp"
#include "umpcore/events.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <optional>
#include <set>
#include <vector>

namespace umpcore {

/**
 * Reassembles media streams keyed by header id.
 *
 * MEDIA_HEADER opens a stream, MEDIA and ONESIE_ENCRYPTED_MEDIA append to it
 * in arrival order, MEDIA_END finalizes it. Streams are independent of each
 * other. Encrypted chunks share one AES-CTR keystream per header id, keyed
 * with the latest media key when the stream's first encrypted chunk arrives;
 * chunks that arrive before any media key are queued until one is set.
 */
class MediaAssembler {
public:
    explicit MediaAssembler(const Config& config = {});

    MediaHeaderEvent OnHeader(const MediaHeader& header);
    std::optional<MediaChunk> OnMedia(const Bytes& payload);
    std::optional<MediaChunk> OnEncryptedMedia(const Bytes& payload);
    MediaEnd OnEnd(const Bytes& payload);

    // Installs the key for streams without a cipher yet and drains queued chunks.
    // A stream that fails while draining is marked failed; the rest still drain.
    std::vector<MediaChunk> SetMediaKey(const Bytes& key);
    bool HasMediaKey() const noexcept { return media_key_.has_value(); }

    std::vector<CompletedMedia> TakeCompleted();

    std::size_t OpenStreams() const noexcept { return streams_.size(); }
    bool IsOpen(std::uint32_t header_id) const;
    // Bytes emitted so far for an open stream.
    std::uint64_t BytesFor(std::uint32_t header_id) const;

private:
    struct StreamState {
        MediaHeader header;
        std::optional<compression::GzipInflater> inflater;
        std::optional<crypto::CtrStream> cipher;
        std::vector<Bytes> queued_ciphertext;
        Bytes accumulated;
        std::uint64_t total_bytes = 0;
        bool failed = false;
    };

    struct Tagged {
        std::uint32_t header_id = 0;
        std::size_t offset = 0;
    };

    static Tagged ReadHeaderId(const Bytes& payload, const char* part_name);
    StreamState* Lookup(std::uint32_t header_id, const char* part_name);
    MediaChunk Append(std::uint32_t header_id, StreamState& stream, Bytes plain, bool encrypted);
    void StartCipher(StreamState& stream) const;

    Config config_;
    std::map<std::uint32_t, StreamState> streams_;
    std::set<std::uint32_t> finalized_;
    std::optional<Bytes> media_key_;
    std::deque<CompletedMedia> completed_;
};

}  // namespace umpcore
