#include "umpcore/proto_wire.hpp"

#include "umpcore/errors.hpp"

namespace umpcore::proto {

namespace {

[[noreturn]] void Malformed(const std::string& what) {
    throw UmpError(ErrorKind::kProtocolViolation, "Malformed protobuf: " + what);
}

}  // namespace

WireReader::WireReader(const std::uint8_t* data, std::size_t len) noexcept
    : data_(data),
      len_(data ? len : 0) {}

std::uint64_t WireReader::ReadVarint() {
    std::uint64_t value = 0;
    for (unsigned shift = 0; shift < 64; shift += 7) {
        if (pos_ >= len_) {
            Malformed("truncated varint");
        }
        std::uint8_t byte = data_[pos_++];
        value |= static_cast<std::uint64_t>(byte & 0x7F) << shift;
        if ((byte & 0x80) == 0) {
            return value;
        }
    }
    Malformed("varint longer than 10 bytes");
}

bool WireReader::Next(Field& field) {
    if (pos_ >= len_) {
        return false;
    }
    std::uint64_t tag = ReadVarint();
    std::uint64_t number = tag >> 3;
    if (number == 0 || number > 0x1FFFFFFF) {
        Malformed("invalid field number " + std::to_string(number));
    }
    field = Field{};
    field.number = static_cast<std::uint32_t>(number);
    field.wire_type = static_cast<WireType>(tag & 0x07);

    switch (field.wire_type) {
        case WireType::kVarint:
            field.value = ReadVarint();
            return true;
        case WireType::kFixed64:
        case WireType::kFixed32: {
            std::size_t width = field.wire_type == WireType::kFixed64 ? 8 : 4;
            if (len_ - pos_ < width) {
                Malformed("truncated fixed-width field");
            }
            for (std::size_t i = 0; i < width; ++i) {
                field.value |= static_cast<std::uint64_t>(data_[pos_ + i]) << (8 * i);
            }
            pos_ += width;
            return true;
        }
        case WireType::kLengthDelimited: {
            std::uint64_t size = ReadVarint();
            if (size > len_ - pos_) {
                Malformed("length-delimited field overruns message");
            }
            field.data = data_ + pos_;
            field.size = static_cast<std::size_t>(size);
            pos_ += field.size;
            return true;
        }
    }
    Malformed("unsupported wire type " + std::to_string(static_cast<int>(tag & 0x07)));
}

void WireWriter::RawVarint(std::uint64_t value) {
    while (value >= 0x80) {
        out_.push_back(static_cast<std::uint8_t>((value & 0x7F) | 0x80));
        value >>= 7;
    }
    out_.push_back(static_cast<std::uint8_t>(value));
}

void WireWriter::Tag(std::uint32_t number, WireType wire_type) {
    RawVarint((static_cast<std::uint64_t>(number) << 3) | static_cast<std::uint64_t>(wire_type));
}

WireWriter& WireWriter::Varint(std::uint32_t number, std::uint64_t value) {
    Tag(number, WireType::kVarint);
    RawVarint(value);
    return *this;
}

WireWriter& WireWriter::Blob(std::uint32_t number, const std::uint8_t* data, std::size_t len) {
    Tag(number, WireType::kLengthDelimited);
    RawVarint(len);
    if (data != nullptr && len > 0) {
        out_.insert(out_.end(), data, data + len);
    }
    return *this;
}

WireWriter& WireWriter::Blob(std::uint32_t number, const proto::Bytes& data) {
    return Blob(number, data.data(), data.size());
}

WireWriter& WireWriter::String(std::uint32_t number, std::string_view value) {
    return Blob(number, reinterpret_cast<const std::uint8_t*>(value.data()), value.size());
}

}  // namespace umpcore::proto
