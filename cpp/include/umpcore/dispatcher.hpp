#pragma once

#include "umpcore/config.hpp"
#include "umpcore/events.hpp"
#include "umpcore/media_assembler.hpp"
#include "umpcore/part.hpp"
#include "umpcore/schema.hpp"

#include <optional>
#include <utility>
#include <vector>

namespace umpcore {

// Holds at most one ONESIE_HEADER until the ONESIE_DATA part that consumes it.
class PendingHeaderSlot {
public:
    void Put(OnesieHeader header) { header_ = std::move(header); }
    std::optional<OnesieHeader> Take() {
        std::optional<OnesieHeader> out;
        out.swap(header_);
        return out;
    }

    bool Occupied() const noexcept { return header_.has_value(); }
    const OnesieHeader* Peek() const noexcept { return header_ ? &*header_ : nullptr; }

private:
    std::optional<OnesieHeader> header_;
};

/**
 * Routes framed parts to the Onesie envelope, the media assembler or the
 * opaque pass-through. The Onesie key is borrowed from the caller and may be
 * null when no Onesie payloads are expected.
 */
class Dispatcher {
public:
    Dispatcher(const Config& config, const SchemaDecoder& decoder, const Bytes* onesie_key = nullptr);

    std::vector<Event> Dispatch(Part part);

    bool HasPendingHeader() const noexcept { return pending_.Occupied(); }
    MediaAssembler& assembler() noexcept { return assembler_; }
    const MediaAssembler& assembler() const noexcept { return assembler_; }

private:
    void OnOnesieHeader(const Part& part, std::vector<Event>& out);
    void OnOnesieData(Part& part, std::vector<Event>& out);
    void OnMediaKey(const OnesieHeader& header, const Part& part, std::vector<Event>& out);
    const Bytes& RequireKey(const OnesieHeader& header) const;

    Config config_;
    const SchemaDecoder& decoder_;
    const Bytes* onesie_key_;
    PendingHeaderSlot pending_;
    MediaAssembler assembler_;
};

}  // namespace umpcore
