#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

namespace umpcore::compression {

using Bytes = std::vector<std::uint8_t>;

Bytes GzipCompress(const Bytes& data, int level = 6);
// Accepts gzip or zlib framing, including concatenated gzip members.
Bytes GzipDecompress(const Bytes& data);
Bytes BrotliDecompress(const Bytes& data);

// Incremental gunzip for payloads that arrive in pieces.
class GzipInflater {
public:
    GzipInflater();
    ~GzipInflater();

    GzipInflater(GzipInflater&&) noexcept;
    GzipInflater& operator=(GzipInflater&&) noexcept;
    GzipInflater(const GzipInflater&) = delete;
    GzipInflater& operator=(const GzipInflater&) = delete;

    Bytes Update(const std::uint8_t* data, std::size_t len);
    Bytes Update(const Bytes& data) { return Update(data.data(), data.size()); }
    // Throws UmpError(kDecompressionFailed) if the stream stopped mid-member.
    void Finish() const;

    std::uint64_t TotalIn() const noexcept { return total_in_; }
    std::uint64_t TotalOut() const noexcept { return total_out_; }

private:
    struct State;
    std::unique_ptr<State> state_;
    std::uint64_t total_in_ = 0;
    std::uint64_t total_out_ = 0;
};

}  // namespace umpcore::compression
