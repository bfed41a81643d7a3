#include "umpcore/schema.hpp"

#include "umpcore/constants.hpp"
#include "umpcore/proto_wire.hpp"

namespace umpcore {

namespace {

namespace onesie_header_field {
constexpr std::uint32_t kType = 1;
constexpr std::uint32_t kVideoId = 2;
constexpr std::uint32_t kItag = 3;
constexpr std::uint32_t kCryptoParams = 4;
constexpr std::uint32_t kLastModified = 5;
constexpr std::uint32_t kExpectedMediaSizeBytes = 7;
}  // namespace onesie_header_field

namespace crypto_params_field {
constexpr std::uint32_t kHmac = 4;
constexpr std::uint32_t kIv = 5;
constexpr std::uint32_t kCompressionType = 6;
}  // namespace crypto_params_field

namespace media_header_field {
constexpr std::uint32_t kHeaderId = 1;
constexpr std::uint32_t kVideoId = 2;
constexpr std::uint32_t kItag = 3;
constexpr std::uint32_t kLmt = 4;
constexpr std::uint32_t kXtags = 5;
constexpr std::uint32_t kStartRange = 6;
constexpr std::uint32_t kCompression = 7;
constexpr std::uint32_t kIsInitSegment = 8;
constexpr std::uint32_t kSequenceNumber = 9;
constexpr std::uint32_t kStartMs = 11;
constexpr std::uint32_t kDurationMs = 12;
constexpr std::uint32_t kContentLength = 14;
}  // namespace media_header_field

namespace innertube_field {
constexpr std::uint32_t kProxyStatus = 1;
constexpr std::uint32_t kHttpStatus = 2;
constexpr std::uint32_t kBody = 4;
}  // namespace innertube_field

bool IsVarint(const proto::Field& field) {
    return field.wire_type == proto::WireType::kVarint;
}

bool IsBlob(const proto::Field& field) {
    return field.wire_type == proto::WireType::kLengthDelimited;
}

CryptoParams DecodeCryptoParams(const proto::Field& outer) {
    CryptoParams params;
    proto::WireReader reader(outer.data, outer.size);
    proto::Field field;
    while (reader.Next(field)) {
        if (field.number == crypto_params_field::kHmac && IsBlob(field)) {
            params.hmac = field.AsBytes();
        } else if (field.number == crypto_params_field::kIv && IsBlob(field)) {
            params.iv = field.AsBytes();
        } else if (field.number == crypto_params_field::kCompressionType && IsVarint(field)) {
            params.compression_type = static_cast<std::uint32_t>(field.value);
        }
    }
    return params;
}

}  // namespace

bool OnesieHeaderCarriesData(std::uint32_t type) noexcept {
    return type == 0 || type == 2 || type == 25;
}

bool OnesieHeaderIsStandalone(std::uint32_t type) noexcept {
    return type == 6 || type == 14 || type == 16;
}

std::string OnesieHeaderTypeName(std::uint32_t type) {
    switch (type) {
        case static_cast<std::uint32_t>(OnesieHeaderType::kPlayerResponse):
            return "PLAYER_RESPONSE";
        case static_cast<std::uint32_t>(OnesieHeaderType::kMediaDecryptionKey):
            return "MEDIA_DECRYPTION_KEY";
        case static_cast<std::uint32_t>(OnesieHeaderType::kEncryptedInnertubeResponsePart):
            return "ENCRYPTED_INNERTUBE_RESPONSE_PART";
        default:
            return "ONESIE_HEADER_TYPE_" + std::to_string(type);
    }
}

bool InnertubeResponse::Ok() const noexcept {
    return proxy_status == static_cast<std::uint32_t>(OnesieProxyStatus::kOk)
        && http_status == constants::kHttpStatusOk;
}

OnesieHeader ProtoSchemaDecoder::DecodeOnesieHeader(const Bytes& payload) const {
    OnesieHeader header;
    proto::WireReader reader(payload);
    proto::Field field;
    while (reader.Next(field)) {
        switch (field.number) {
            case onesie_header_field::kType:
                if (IsVarint(field)) header.type = static_cast<std::uint32_t>(field.value);
                break;
            case onesie_header_field::kVideoId:
                if (IsBlob(field)) header.video_id = field.AsString();
                break;
            case onesie_header_field::kItag:
                if (IsBlob(field)) header.itag = field.AsString();
                break;
            case onesie_header_field::kCryptoParams:
                if (IsBlob(field)) header.crypto_params = DecodeCryptoParams(field);
                break;
            case onesie_header_field::kLastModified:
                if (IsVarint(field)) header.last_modified = field.value;
                break;
            case onesie_header_field::kExpectedMediaSizeBytes:
                if (IsVarint(field)) header.expected_media_size_bytes = static_cast<std::int64_t>(field.value);
                break;
            default:
                break;
        }
    }
    return header;
}

MediaHeader ProtoSchemaDecoder::DecodeMediaHeader(const Bytes& payload) const {
    MediaHeader header;
    proto::WireReader reader(payload);
    proto::Field field;
    while (reader.Next(field)) {
        if (IsBlob(field)) {
            if (field.number == media_header_field::kVideoId) {
                header.video_id = field.AsString();
            } else if (field.number == media_header_field::kXtags) {
                header.xtags = field.AsString();
            }
            continue;
        }
        if (!IsVarint(field)) {
            continue;
        }
        const auto signed_value = static_cast<std::int64_t>(field.value);
        switch (field.number) {
            case media_header_field::kHeaderId:
                header.header_id = static_cast<std::uint32_t>(field.value);
                break;
            case media_header_field::kItag:
                header.itag = static_cast<std::int32_t>(field.value);
                break;
            case media_header_field::kLmt:
                header.lmt = field.value;
                break;
            case media_header_field::kStartRange:
                header.start_range = signed_value;
                break;
            case media_header_field::kCompression:
                header.compression = static_cast<std::uint32_t>(field.value);
                break;
            case media_header_field::kIsInitSegment:
                header.is_init_segment = field.AsBool();
                break;
            case media_header_field::kSequenceNumber:
                header.sequence_number = signed_value;
                break;
            case media_header_field::kStartMs:
                header.start_ms = signed_value;
                break;
            case media_header_field::kDurationMs:
                header.duration_ms = signed_value;
                break;
            case media_header_field::kContentLength:
                header.content_length = signed_value;
                break;
            default:
                break;
        }
    }
    return header;
}

InnertubeResponse ProtoSchemaDecoder::DecodeInnertubeResponse(const Bytes& plaintext) const {
    InnertubeResponse response;
    proto::WireReader reader(plaintext);
    proto::Field field;
    while (reader.Next(field)) {
        if (field.number == innertube_field::kProxyStatus && IsVarint(field)) {
            response.proxy_status = static_cast<std::uint32_t>(field.value);
        } else if (field.number == innertube_field::kHttpStatus && IsVarint(field)) {
            response.http_status = static_cast<std::int32_t>(field.value);
        } else if (field.number == innertube_field::kBody && IsBlob(field)) {
            response.body = field.AsBytes();
        }
    }
    return response;
}

Bytes ProtoSchemaDecoder::DecodeMediaKey(const Bytes& payload) const {
    return payload;
}

}  // namespace umpcore
