#include "umpcore/media_assembler.hpp"

#include "umpcore/constants.hpp"
#include "umpcore/errors.hpp"
#include "umpcore/log.hpp"
#include "umpcore/varint.hpp"

#include <string>
#include <utility>

namespace umpcore {

namespace {

std::string IdText(std::uint32_t header_id) {
    return "header id " + std::to_string(header_id);
}

}  // namespace

MediaAssembler::MediaAssembler(const Config& config)
    : config_(config) {}

MediaAssembler::Tagged MediaAssembler::ReadHeaderId(const Bytes& payload, const char* part_name) {
    if (payload.empty()) {
        throw UmpError(ErrorKind::kTruncatedInput, std::string(part_name) + " payload has no header id");
    }
    varint::Decoded id = varint::Decode(payload.data(), payload.size());
    return Tagged{id.value, id.size};
}

MediaAssembler::StreamState* MediaAssembler::Lookup(std::uint32_t header_id, const char* part_name) {
    auto it = streams_.find(header_id);
    if (it != streams_.end()) {
        return &it->second;
    }
    const bool finalized = finalized_.count(header_id) > 0;
    std::string message = std::string(part_name) + " for "
        + (finalized ? "finalized " : "unknown ") + IdText(header_id);
    if (config_.lenient) {
        log::Warn(message + ", dropped");
        return nullptr;
    }
    throw UmpError(finalized ? ErrorKind::kProtocolViolation : ErrorKind::kUnknownHeaderId, message);
}

bool MediaAssembler::IsOpen(std::uint32_t header_id) const {
    return streams_.count(header_id) > 0;
}

std::uint64_t MediaAssembler::BytesFor(std::uint32_t header_id) const {
    auto it = streams_.find(header_id);
    return it == streams_.end() ? 0 : it->second.total_bytes;
}

MediaHeaderEvent MediaAssembler::OnHeader(const MediaHeader& header) {
    auto it = streams_.find(header.header_id);
    if (it != streams_.end()) {
        StreamState& stream = it->second;
        if (stream.header.compression != header.compression) {
            log::Warn("MEDIA_HEADER for open " + IdText(header.header_id)
                      + " changes compression; keeping the original");
        }
        const std::uint32_t compression = stream.header.compression;
        stream.header = header;
        stream.header.compression = compression;
        return MediaHeaderEvent{stream.header, false};
    }

    if (finalized_.erase(header.header_id) > 0) {
        log::Debug("reopening finalized " + IdText(header.header_id));
    }
    StreamState& stream = streams_[header.header_id];
    stream.header = header;
    if (header.IsGzip()) {
        stream.inflater.emplace();
    }
    return MediaHeaderEvent{header, true};
}

void MediaAssembler::StartCipher(StreamState& stream) const {
    stream.cipher.emplace(*media_key_, Bytes(constants::kOnesieIvLen, 0));
}

MediaChunk MediaAssembler::Append(std::uint32_t header_id, StreamState& stream, Bytes plain, bool encrypted) {
    MediaChunk chunk;
    chunk.header_id = header_id;
    chunk.encrypted = encrypted;
    if (stream.inflater) {
        try {
            chunk.data = stream.inflater->Update(plain);
        } catch (const UmpError&) {
            stream.failed = true;
            throw;
        }
    } else {
        chunk.data = std::move(plain);
    }
    stream.total_bytes += chunk.data.size();
    if (config_.retain_media) {
        stream.accumulated.insert(stream.accumulated.end(), chunk.data.begin(), chunk.data.end());
    }
    return chunk;
}

std::optional<MediaChunk> MediaAssembler::OnMedia(const Bytes& payload) {
    Tagged tag = ReadHeaderId(payload, "MEDIA");
    StreamState* stream = Lookup(tag.header_id, "MEDIA");
    if (stream == nullptr) {
        return std::nullopt;
    }
    if (stream->failed) {
        log::Warn("MEDIA for failed " + IdText(tag.header_id) + " dropped");
        return std::nullopt;
    }
    return Append(tag.header_id, *stream, Bytes(payload.begin() + tag.offset, payload.end()), false);
}

std::optional<MediaChunk> MediaAssembler::OnEncryptedMedia(const Bytes& payload) {
    Tagged tag = ReadHeaderId(payload, "ONESIE_ENCRYPTED_MEDIA");
    StreamState* stream = Lookup(tag.header_id, "ONESIE_ENCRYPTED_MEDIA");
    if (stream == nullptr) {
        return std::nullopt;
    }
    if (stream->failed) {
        log::Warn("ONESIE_ENCRYPTED_MEDIA for failed " + IdText(tag.header_id) + " dropped");
        return std::nullopt;
    }
    if (!stream->cipher) {
        if (!media_key_) {
            stream->queued_ciphertext.emplace_back(payload.begin() + tag.offset, payload.end());
            log::Debug("queued encrypted chunk for " + IdText(tag.header_id) + " until a media key arrives");
            return std::nullopt;
        }
        StartCipher(*stream);
    }
    Bytes plain = stream->cipher->Update(payload.data() + tag.offset, payload.size() - tag.offset);
    return Append(tag.header_id, *stream, std::move(plain), true);
}

std::vector<MediaChunk> MediaAssembler::SetMediaKey(const Bytes& key) {
    if (crypto::detail::AesCtrForKeyLength(key.size()) == nullptr) {
        throw UmpError(ErrorKind::kInvalidKeyLength,
                       "media decryption key must be 16, 24 or 32 bytes, got " + std::to_string(key.size()));
    }
    media_key_ = key;

    // Streams with queued ciphertext have no cipher yet; a decompression
    // failure in one of them must not keep the others from draining.
    std::vector<MediaChunk> drained;
    for (auto& [header_id, stream] : streams_) {
        if (stream.queued_ciphertext.empty()) {
            continue;
        }
        StartCipher(stream);
        std::vector<Bytes> queued;
        queued.swap(stream.queued_ciphertext);
        for (const Bytes& ciphertext : queued) {
            Bytes plain = stream.cipher->Update(ciphertext);
            if (stream.failed) {
                continue;
            }
            try {
                drained.push_back(Append(header_id, stream, std::move(plain), true));
            } catch (const UmpError& err) {
                log::Error("queued media for " + IdText(header_id) + " failed: " + err.what());
            }
        }
    }
    return drained;
}

MediaEnd MediaAssembler::OnEnd(const Bytes& payload) {
    Tagged tag = ReadHeaderId(payload, "MEDIA_END");
    StreamState* found = Lookup(tag.header_id, "MEDIA_END");
    MediaEnd end;
    end.header_id = tag.header_id;
    if (found == nullptr) {
        end.failed = true;
        return end;
    }

    StreamState stream = std::move(*found);
    streams_.erase(tag.header_id);
    finalized_.insert(tag.header_id);
    end.total_bytes = stream.total_bytes;

    if (stream.failed) {
        log::Warn("MEDIA_END for failed " + IdText(tag.header_id) + ", nothing emitted");
        end.failed = true;
        return end;
    }
    if (!stream.queued_ciphertext.empty()) {
        throw UmpError(ErrorKind::kMissingCryptoParams,
                       "MEDIA_END for " + IdText(tag.header_id) + " with "
                           + std::to_string(stream.queued_ciphertext.size())
                           + " encrypted chunk(s) and no media key");
    }
    if (stream.inflater) {
        stream.inflater->Finish();
    }

    CompletedMedia done;
    done.header = std::move(stream.header);
    done.data = std::move(stream.accumulated);
    done.total_bytes = stream.total_bytes;
    completed_.push_back(std::move(done));
    return end;
}

std::vector<CompletedMedia> MediaAssembler::TakeCompleted() {
    std::vector<CompletedMedia> out;
    out.reserve(completed_.size());
    while (!completed_.empty()) {
        out.push_back(std::move(completed_.front()));
        completed_.pop_front();
    }
    return out;
}

}  // namespace umpcore
