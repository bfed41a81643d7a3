#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace umpcore {

using Bytes = std::vector<std::uint8_t>;

// ONESIE_HEADER.type values this library acts on.
enum class OnesieHeaderType : std::uint32_t {
    kPlayerResponse = 0,
    kMediaDecryptionKey = 2,
    kEncryptedInnertubeResponsePart = 25
};

// Header types followed by an ONESIE_DATA part (0, 2, 25).
bool OnesieHeaderCarriesData(std::uint32_t type) noexcept;
// Header types that stand alone (6, 14, 16).
bool OnesieHeaderIsStandalone(std::uint32_t type) noexcept;
std::string OnesieHeaderTypeName(std::uint32_t type);

// Compression of Onesie-encrypted payloads. Anything but kBrotli is gzip.
enum class OnesieCompression : std::uint32_t {
    kUnspecified = 0,
    kGzip = 1,
    kBrotli = 2
};

// Compression of a media stream, from MEDIA_HEADER.
enum class MediaCompression : std::uint32_t {
    kUnknown = 0,
    kNone = 1,
    kGzip = 2
};

enum class OnesieProxyStatus : std::uint32_t {
    kUnknown = 0,
    kOk = 1
};

struct CryptoParams {
    std::optional<Bytes> hmac;
    std::optional<Bytes> iv;
    std::optional<std::uint32_t> compression_type;

    bool Complete() const noexcept { return hmac.has_value() && iv.has_value() && compression_type.has_value(); }
};

struct OnesieHeader {
    std::uint32_t type = 0;
    std::string video_id;
    std::string itag;
    std::optional<CryptoParams> crypto_params;
    std::optional<std::uint64_t> last_modified;
    std::optional<std::int64_t> expected_media_size_bytes;
};

struct MediaHeader {
    std::uint32_t header_id = 0;
    std::string video_id;
    std::optional<std::int32_t> itag;
    std::optional<std::uint64_t> lmt;
    std::string xtags;
    std::optional<std::int64_t> start_range;
    std::uint32_t compression = static_cast<std::uint32_t>(MediaCompression::kUnknown);
    bool is_init_segment = false;
    std::optional<std::int64_t> sequence_number;
    std::optional<std::int64_t> start_ms;
    std::optional<std::int64_t> duration_ms;
    std::optional<std::int64_t> content_length;

    bool IsGzip() const noexcept { return compression == static_cast<std::uint32_t>(MediaCompression::kGzip); }
};

// Wrapper around an Innertube response carried through Onesie.
struct InnertubeResponse {
    std::uint32_t proxy_status = static_cast<std::uint32_t>(OnesieProxyStatus::kUnknown);
    std::int32_t http_status = 0;
    Bytes body;

    bool Ok() const noexcept;
};

/**
 * Decodes the structured payloads the envelope needs to look inside. Only the
 * envelope fields are decoded; everything else stays opaque for downstream
 * schema handling.
 */
class SchemaDecoder {
public:
    virtual ~SchemaDecoder() = default;

    virtual OnesieHeader DecodeOnesieHeader(const Bytes& payload) const = 0;
    virtual MediaHeader DecodeMediaHeader(const Bytes& payload) const = 0;
    virtual InnertubeResponse DecodeInnertubeResponse(const Bytes& plaintext) const = 0;
    // Returns the raw AES key for ONESIE_ENCRYPTED_MEDIA.
    virtual Bytes DecodeMediaKey(const Bytes& payload) const = 0;
};

// Protobuf wire-format implementation.
class ProtoSchemaDecoder : public SchemaDecoder {
public:
    OnesieHeader DecodeOnesieHeader(const Bytes& payload) const override;
    MediaHeader DecodeMediaHeader(const Bytes& payload) const override;
    InnertubeResponse DecodeInnertubeResponse(const Bytes& plaintext) const override;
    Bytes DecodeMediaKey(const Bytes& payload) const override;
};

}  // namespace umpcore
