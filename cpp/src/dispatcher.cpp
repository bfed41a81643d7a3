#include "umpcore/dispatcher.hpp"

#include "umpcore/errors.hpp"
#include "umpcore/log.hpp"
#include "umpcore/onesie.hpp"

#include <string>
#include <utility>

namespace umpcore {

namespace {

Event MakeEvent(std::uint32_t type, EventBody body) {
    Event event;
    event.part_type = type;
    event.body = std::move(body);
    return event;
}

Event Opaque(Part& part) {
    return MakeEvent(part.type, OpaquePart{std::move(part.payload)});
}

}  // namespace

Dispatcher::Dispatcher(const Config& config, const SchemaDecoder& decoder, const Bytes* onesie_key)
    : config_(config),
      decoder_(decoder),
      onesie_key_(onesie_key),
      assembler_(config) {}

std::vector<Event> Dispatcher::Dispatch(Part part) {
    std::vector<Event> out;
    switch (static_cast<PartType>(part.type)) {
        case PartType::kOnesieHeader:
            OnOnesieHeader(part, out);
            break;
        case PartType::kOnesieData:
            OnOnesieData(part, out);
            break;
        case PartType::kMediaHeader:
            out.push_back(MakeEvent(part.type, assembler_.OnHeader(decoder_.DecodeMediaHeader(part.payload))));
            break;
        case PartType::kMedia:
            if (auto chunk = assembler_.OnMedia(part.payload)) {
                out.push_back(MakeEvent(part.type, std::move(*chunk)));
            }
            break;
        case PartType::kOnesieEncryptedMedia:
            if (auto chunk = assembler_.OnEncryptedMedia(part.payload)) {
                out.push_back(MakeEvent(part.type, std::move(*chunk)));
            }
            break;
        case PartType::kMediaEnd:
            out.push_back(MakeEvent(part.type, assembler_.OnEnd(part.payload)));
            break;
        default:
            if (!IsDocumentedPartType(part.type)) {
                log::Debug("forwarding undocumented part " + PartTypeName(part.type));
            }
            out.push_back(Opaque(part));
            break;
    }
    return out;
}

void Dispatcher::OnOnesieHeader(const Part& part, std::vector<Event>& out) {
    OnesieHeader header = decoder_.DecodeOnesieHeader(part.payload);
    OnesieHeaderEvent event;
    event.header = header;

    if (!OnesieHeaderIsStandalone(header.type)) {
        if (const OnesieHeader* held = pending_.Peek()) {
            std::string message = "ONESIE_HEADER " + OnesieHeaderTypeName(header.type)
                + " while " + OnesieHeaderTypeName(held->type) + " is still pending";
            if (!OnesieHeaderCarriesData(held->type)) {
                log::Debug(message + ", replaced");
            } else if (config_.lenient) {
                log::Warn(message + ", replaced");
            } else {
                throw UmpError(ErrorKind::kProtocolViolation, message);
            }
        }
        pending_.Put(std::move(header));
        event.awaiting_data = true;
    } else if (const OnesieHeader* held = pending_.Peek()) {
        if (OnesieHeaderCarriesData(held->type)) {
            log::Warn("ONESIE_HEADER " + OnesieHeaderTypeName(header.type) + " arrived while "
                      + OnesieHeaderTypeName(held->type) + " is still waiting for its data");
        }
    }
    out.push_back(MakeEvent(part.type, std::move(event)));
}

const Bytes& Dispatcher::RequireKey(const OnesieHeader& header) const {
    if (onesie_key_ == nullptr) {
        throw UmpError(ErrorKind::kMissingCryptoParams,
                       "no Onesie key supplied for " + OnesieHeaderTypeName(header.type));
    }
    return *onesie_key_;
}

void Dispatcher::OnOnesieData(Part& part, std::vector<Event>& out) {
    std::optional<OnesieHeader> header = pending_.Take();
    if (!header) {
        if (!config_.lenient) {
            throw UmpError(ErrorKind::kProtocolViolation, "ONESIE_DATA without a pending ONESIE_HEADER");
        }
        log::Warn("ONESIE_DATA without a pending ONESIE_HEADER, forwarded as opaque");
        out.push_back(Opaque(part));
        return;
    }

    switch (static_cast<OnesieHeaderType>(header->type)) {
        case OnesieHeaderType::kPlayerResponse: {
            Bytes plaintext = onesie::OpenPayload(RequireKey(*header), *header, part.payload);
            InnertubeResponse response = decoder_.DecodeInnertubeResponse(plaintext);
            if (response.Ok()) {
                out.push_back(MakeEvent(part.type, PlayerResponse{std::move(*header), std::move(response)}));
                return;
            }
            log::Warn("player response failed upstream: proxy status " + std::to_string(response.proxy_status)
                      + ", HTTP " + std::to_string(response.http_status));
            UpstreamFailure failure;
            failure.header = std::move(*header);
            failure.proxy_status = response.proxy_status;
            failure.http_status = response.http_status;
            failure.body = std::move(response.body);
            out.push_back(MakeEvent(part.type, std::move(failure)));
            return;
        }
        case OnesieHeaderType::kEncryptedInnertubeResponsePart: {
            Bytes plaintext = onesie::OpenPayload(RequireKey(*header), *header, part.payload);
            out.push_back(MakeEvent(part.type, InnertubeResponsePart{std::move(*header), std::move(plaintext)}));
            return;
        }
        case OnesieHeaderType::kMediaDecryptionKey:
            OnMediaKey(*header, part, out);
            return;
    }
    log::Debug("ONESIE_DATA for " + OnesieHeaderTypeName(header->type) + " forwarded as opaque");
    out.push_back(Opaque(part));
}

void Dispatcher::OnMediaKey(const OnesieHeader& header, const Part& part, std::vector<Event>& out) {
    Bytes key = decoder_.DecodeMediaKey(part.payload);
    std::vector<MediaChunk> drained = assembler_.SetMediaKey(key);
    out.push_back(MakeEvent(part.type, MediaKeyUpdate{header, key.size()}));
    for (MediaChunk& chunk : drained) {
        out.push_back(MakeEvent(ToWire(PartType::kOnesieEncryptedMedia), std::move(chunk)));
    }
}

}  // namespace umpcore
