#pragma once

#include "umpcore/crypto.hpp"
#include "umpcore/log.hpp"
#include "umpcore/part.hpp"
#include "umpcore/proto_wire.hpp"
#include "umpcore/varint.hpp"

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace umpcore::test {

// Routes umpcore log lines into a buffer for the lifetime of the object.
class LogCapture {
public:
    LogCapture() { log::SetSink(&sink_); }
    ~LogCapture() { log::SetSink(nullptr); }
    std::string str() const { return sink_.str(); }

private:
    std::ostringstream sink_;
};

inline Bytes Pattern(std::size_t len, std::uint8_t seed = 0) {
    Bytes out(len);
    for (std::size_t i = 0; i < len; ++i) {
        out[i] = static_cast<std::uint8_t>((i * 31 + seed) & 0xFF);
    }
    return out;
}

inline Bytes Text(const std::string& text) {
    return Bytes(text.begin(), text.end());
}

inline Bytes Concat(std::initializer_list<Bytes> pieces) {
    Bytes out;
    for (const Bytes& piece : pieces) {
        out.insert(out.end(), piece.begin(), piece.end());
    }
    return out;
}

inline Bytes MakePart(PartType type, const Bytes& payload) {
    Bytes out;
    AppendPart(out, ToWire(type), payload);
    return out;
}

inline Bytes MakePart(std::uint32_t type, const Bytes& payload) {
    Bytes out;
    AppendPart(out, type, payload);
    return out;
}

// Part header only, for continuations whose body follows separately.
inline Bytes PartHeaderBytes(std::uint32_t type, std::uint32_t length) {
    Bytes out;
    varint::AppendEncoded(out, type);
    varint::AppendEncoded(out, length);
    return out;
}

// MEDIA / ONESIE_ENCRYPTED_MEDIA / MEDIA_END payload: header id varint, then data.
inline Bytes Tagged(std::uint32_t header_id, const Bytes& data = {}) {
    Bytes out;
    varint::AppendEncoded(out, header_id);
    out.insert(out.end(), data.begin(), data.end());
    return out;
}

inline Bytes MediaHeaderPayload(std::uint32_t header_id,
                                std::uint32_t compression = 0,
                                const std::string& video_id = "") {
    proto::WireWriter writer;
    writer.Varint(1, header_id);
    if (!video_id.empty()) {
        writer.String(2, video_id);
    }
    writer.Varint(3, 251);
    if (compression != 0) {
        writer.Varint(7, compression);
    }
    return writer.Take();
}

struct TestCryptoParams {
    std::optional<Bytes> hmac;
    std::optional<Bytes> iv;
    std::optional<std::uint32_t> compression_type;
};

inline Bytes OnesieHeaderPayload(std::uint32_t type,
                                 const std::optional<TestCryptoParams>& params = std::nullopt,
                                 const std::string& video_id = "dQw4w9WgXcQ") {
    proto::WireWriter writer;
    writer.Varint(1, type);
    writer.String(2, video_id);
    writer.String(3, "251");
    if (params) {
        proto::WireWriter inner;
        if (params->hmac) inner.Blob(4, *params->hmac);
        if (params->iv) inner.Blob(5, *params->iv);
        if (params->compression_type) inner.Varint(6, *params->compression_type);
        writer.Blob(4, inner.Take());
    }
    return writer.Take();
}

inline Bytes InnertubeWrapper(std::uint32_t proxy_status, std::uint32_t http_status, const Bytes& body) {
    proto::WireWriter writer;
    writer.Varint(1, proxy_status);
    writer.Varint(2, http_status);
    writer.Blob(4, body);
    return writer.Take();
}

inline Bytes OnesieKey() {
    return Pattern(32, 7);
}

inline Bytes ZeroIvCtr(const Bytes& key, const Bytes& data) {
    return crypto::AesCtrTransform(key, Bytes(16, 0), data);
}

inline std::vector<Bytes> SplitAt(const Bytes& data, std::initializer_list<std::size_t> cuts) {
    std::vector<Bytes> out;
    std::size_t start = 0;
    for (std::size_t cut : cuts) {
        out.emplace_back(data.begin() + start, data.begin() + cut);
        start = cut;
    }
    out.emplace_back(data.begin() + start, data.end());
    return out;
}

}  // namespace umpcore::test
