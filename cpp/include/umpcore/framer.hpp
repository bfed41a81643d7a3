#pragma once

#include "umpcore/config.hpp"
#include "umpcore/part.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace umpcore {

/**
 * Splits an ordered sequence of byte buffers into UMP parts.
 *
 * Parts whose declared length runs past the end of a buffer are held as a
 * partial part and completed from later buffers. In reframed mode each such
 * buffer restates a MEDIA_HEADER part followed by a part of the pending type;
 * in raw mode buffers are treated as plain slices of one byte stream.
 *
 * Part headers cut by a buffer boundary are carried over in both modes.
 */
class PartFramer {
public:
    explicit PartFramer(const Config& config = {});

    std::vector<Part> Feed(const Bytes& chunk);
    std::vector<Part> Feed(const std::uint8_t* data, std::size_t len);

    // End of input. Throws UmpError(kTruncatedInput) if a part is unfinished.
    void Finish() const;

    bool AwaitingContinuation() const noexcept { return partial_.has_value(); }
    std::optional<std::uint32_t> ExpectedType() const noexcept;
    // Bytes still owed to the partial part.
    std::size_t RemainingBytes() const noexcept;
    // Bytes held back from the caller: carried header bytes and partial payload.
    std::size_t PendingBytes() const noexcept;

private:
    struct PartHeader {
        std::uint32_t type = 0;
        std::uint32_t length = 0;
        std::size_t size = 0;
    };

    struct PartialPart {
        std::uint32_t expected_type = 0;
        std::size_t remaining = 0;
        Bytes accumulated;
    };

    enum class ContinuationStep {
        kMediaHeader,
        kPartHeader,
        kBody
    };

    static std::optional<PartHeader> TryReadHeader(const std::uint8_t* data, std::size_t len) noexcept;

    std::size_t ReadPart(const std::uint8_t* data, std::size_t len, std::vector<Part>& out);
    std::size_t ReadRawContinuation(const std::uint8_t* data, std::size_t len, std::vector<Part>& out);
    std::size_t ReadReframedContinuation(const std::uint8_t* data, std::size_t len, std::vector<Part>& out);
    void BeginContinuationBody(const PartHeader& header);
    void AppendContinuation(const std::uint8_t* data, std::size_t len, std::vector<Part>& out);
    void Violation(const std::string& message) const;

    Config config_;
    Bytes carry_;
    std::optional<PartialPart> partial_;
    ContinuationStep step_ = ContinuationStep::kMediaHeader;
    std::size_t continuation_left_ = 0;
    std::size_t skip_ = 0;
};

}  // namespace umpcore
