#include "umpcore/framer.hpp"

#include "umpcore/constants.hpp"
#include "umpcore/errors.hpp"
#include "umpcore/log.hpp"
#include "umpcore/varint.hpp"

#include <algorithm>
#include <string>

namespace umpcore {

PartFramer::PartFramer(const Config& config)
    : config_(config) {}

std::optional<PartFramer::PartHeader> PartFramer::TryReadHeader(const std::uint8_t* data,
                                                                std::size_t len) noexcept {
    auto type = varint::TryDecode(data, len);
    if (!type) {
        return std::nullopt;
    }
    auto length = varint::TryDecode(data + type->size, len - type->size);
    if (!length) {
        return std::nullopt;
    }
    return PartHeader{type->value, length->value, type->size + length->size};
}

std::optional<std::uint32_t> PartFramer::ExpectedType() const noexcept {
    if (!partial_) {
        return std::nullopt;
    }
    return partial_->expected_type;
}

std::size_t PartFramer::RemainingBytes() const noexcept {
    return partial_ ? partial_->remaining : 0;
}

std::size_t PartFramer::PendingBytes() const noexcept {
    return carry_.size() + (partial_ ? partial_->accumulated.size() : 0);
}

std::vector<Part> PartFramer::Feed(const Bytes& chunk) {
    return Feed(chunk.data(), chunk.size());
}

std::vector<Part> PartFramer::Feed(const std::uint8_t* data, std::size_t len) {
    std::vector<Part> out;
    if (data == nullptr || len == 0) {
        return out;
    }
    // A fresh buffer in reframed mode restates the continuation from the top.
    if (partial_ && config_.continuation == ContinuationFraming::kReframed && carry_.empty()) {
        step_ = ContinuationStep::kMediaHeader;
        continuation_left_ = 0;
        skip_ = 0;
    }

    Bytes joined;
    const std::uint8_t* cursor = data;
    std::size_t avail = len;
    if (!carry_.empty()) {
        joined.swap(carry_);
        joined.insert(joined.end(), data, data + len);
        cursor = joined.data();
        avail = joined.size();
    }

    std::size_t pos = 0;
    while (pos < avail) {
        // Excess continuation bytes follow the body they were declared with.
        if (skip_ > 0 && !(partial_ && step_ == ContinuationStep::kBody)) {
            std::size_t take = std::min(skip_, avail - pos);
            skip_ -= take;
            pos += take;
            continue;
        }
        std::size_t consumed = 0;
        if (!partial_) {
            consumed = ReadPart(cursor + pos, avail - pos, out);
        } else if (config_.continuation == ContinuationFraming::kRaw) {
            consumed = ReadRawContinuation(cursor + pos, avail - pos, out);
        } else {
            consumed = ReadReframedContinuation(cursor + pos, avail - pos, out);
        }
        if (consumed == 0) {
            carry_.assign(cursor + pos, cursor + avail);
            break;
        }
        pos += consumed;
    }
    return out;
}

std::size_t PartFramer::ReadPart(const std::uint8_t* data, std::size_t len, std::vector<Part>& out) {
    auto header = TryReadHeader(data, len);
    if (!header) {
        return 0;
    }
    const std::uint8_t* body = data + header->size;
    const std::size_t body_avail = len - header->size;
    if (header->length <= body_avail) {
        Part part;
        part.type = header->type;
        part.payload.assign(body, body + header->length);
        out.push_back(std::move(part));
        return header->size + header->length;
    }

    PartialPart partial;
    partial.expected_type = header->type;
    partial.remaining = header->length - body_avail;
    partial.accumulated.reserve(std::min<std::size_t>(header->length, constants::kMaxPartReserve));
    partial.accumulated.assign(body, body + body_avail);
    partial_ = std::move(partial);
    step_ = ContinuationStep::kMediaHeader;
    continuation_left_ = 0;
    log::Debug("Part " + PartTypeName(header->type) + " spans buffers, "
               + std::to_string(partial_->remaining) + " bytes outstanding");
    return len;
}

std::size_t PartFramer::ReadRawContinuation(const std::uint8_t* data, std::size_t len, std::vector<Part>& out) {
    std::size_t take = std::min(partial_->remaining, len);
    AppendContinuation(data, take, out);
    return take;
}

std::size_t PartFramer::ReadReframedContinuation(const std::uint8_t* data,
                                                 std::size_t len,
                                                 std::vector<Part>& out) {
    if (step_ == ContinuationStep::kBody) {
        std::size_t take = std::min(continuation_left_, len);
        continuation_left_ -= take;
        AppendContinuation(data, take, out);
        if (partial_ && continuation_left_ == 0) {
            step_ = ContinuationStep::kMediaHeader;
        }
        return take;
    }

    auto header = TryReadHeader(data, len);
    if (!header) {
        return 0;
    }

    if (step_ == ContinuationStep::kMediaHeader) {
        if (header->type == ToWire(PartType::kMediaHeader)) {
            if (header->length > len - header->size) {
                return 0;
            }
            Part part;
            part.type = header->type;
            part.payload.assign(data + header->size, data + header->size + header->length);
            out.push_back(std::move(part));
            step_ = ContinuationStep::kPartHeader;
            return header->size + header->length;
        }
        Violation("Continuation of " + PartTypeName(partial_->expected_type)
                  + " does not start with MEDIA_HEADER (got " + PartTypeName(header->type) + ")");
    }

    if (header->type != partial_->expected_type) {
        Violation("Continuation type mismatch: expected " + PartTypeName(partial_->expected_type)
                  + ", got " + PartTypeName(header->type));
    }
    BeginContinuationBody(*header);
    return header->size;
}

void PartFramer::BeginContinuationBody(const PartHeader& header) {
    std::size_t declared = header.length;
    if (declared > partial_->remaining) {
        Violation("Continuation declares " + std::to_string(declared) + " bytes, only "
                  + std::to_string(partial_->remaining) + " outstanding");
        skip_ = declared - partial_->remaining;
        declared = partial_->remaining;
    }
    continuation_left_ = declared;
    step_ = declared > 0 ? ContinuationStep::kBody : ContinuationStep::kMediaHeader;
}

void PartFramer::AppendContinuation(const std::uint8_t* data, std::size_t len, std::vector<Part>& out) {
    partial_->accumulated.insert(partial_->accumulated.end(), data, data + len);
    partial_->remaining -= len;
    if (partial_->remaining > 0) {
        return;
    }
    Part part;
    part.type = partial_->expected_type;
    part.payload = std::move(partial_->accumulated);
    partial_.reset();
    step_ = ContinuationStep::kMediaHeader;
    continuation_left_ = 0;
    out.push_back(std::move(part));
}

void PartFramer::Violation(const std::string& message) const {
    if (!config_.lenient) {
        throw UmpError(ErrorKind::kProtocolViolation, message);
    }
    log::Warn(message + "; continuing in lenient mode");
}

void PartFramer::Finish() const {
    if (partial_) {
        throw UmpError(ErrorKind::kTruncatedInput,
                       "Input ended with " + std::to_string(partial_->remaining) + " bytes outstanding for "
                           + PartTypeName(partial_->expected_type));
    }
    if (!carry_.empty()) {
        throw UmpError(ErrorKind::kTruncatedInput,
                       "Input ended inside a part header (" + std::to_string(carry_.size()) + " bytes)");
    }
    if (skip_ > 0) {
        log::Warn("Input ended while skipping " + std::to_string(skip_) + " excess continuation bytes");
    }
}

}  // namespace umpcore
