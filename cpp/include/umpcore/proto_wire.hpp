#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace umpcore::proto {

using Bytes = std::vector<std::uint8_t>;

enum class WireType : std::uint8_t {
    kVarint = 0,
    kFixed64 = 1,
    kLengthDelimited = 2,
    kFixed32 = 5
};

struct Field {
    std::uint32_t number = 0;
    WireType wire_type = WireType::kVarint;
    // kVarint, kFixed64 and kFixed32 values
    std::uint64_t value = 0;
    // kLengthDelimited payload, points into the reader's buffer
    const std::uint8_t* data = nullptr;
    std::size_t size = 0;

    Bytes AsBytes() const { return Bytes(data, data + size); }
    std::string AsString() const { return std::string(reinterpret_cast<const char*>(data), size); }
    bool AsBool() const noexcept { return value != 0; }
};

// Iterates the top-level fields of one protobuf message. Throws UmpError
// (kProtocolViolation) on malformed input; groups are not supported.
class WireReader {
public:
    WireReader(const std::uint8_t* data, std::size_t len) noexcept;
    explicit WireReader(const Bytes& data) noexcept : WireReader(data.data(), data.size()) {}

    bool Next(Field& field);

private:
    std::uint64_t ReadVarint();

    const std::uint8_t* data_;
    std::size_t len_;
    std::size_t pos_ = 0;
};

// Builds protobuf messages; LEB128 varints, not UMP varints.
class WireWriter {
public:
    WireWriter& Varint(std::uint32_t number, std::uint64_t value);
    WireWriter& Blob(std::uint32_t number, const std::uint8_t* data, std::size_t len);
    WireWriter& Blob(std::uint32_t number, const proto::Bytes& data);
    WireWriter& String(std::uint32_t number, std::string_view value);

    const proto::Bytes& data() const noexcept { return out_; }
    proto::Bytes Take() { return std::move(out_); }

private:
    void Tag(std::uint32_t number, WireType wire_type);
    void RawVarint(std::uint64_t value);

    proto::Bytes out_;
};

}  // namespace umpcore::proto
