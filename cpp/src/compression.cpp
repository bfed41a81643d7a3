#include "umpcore/compression.hpp"

#include "umpcore/constants.hpp"
#include "umpcore/errors.hpp"

#include <brotli/decode.h>
#include <zlib.h>

#include <array>
#include <limits>
#include <stdexcept>
#include <string>

namespace umpcore::compression {

namespace {

// 15 window bits, +32 to detect gzip or zlib headers
constexpr int kInflateWindowBits = 15 + 32;
// 15 window bits, +16 to write a gzip header
constexpr int kGzipWindowBits = 15 + 16;

void EnsureFitsZlib(std::size_t len) {
    if (len > std::numeric_limits<uInt>::max()) {
        throw UmpError(ErrorKind::kDecompressionFailed, "Input too large for zlib");
    }
}

}  // namespace

struct GzipInflater::State {
    z_stream zs{};
    bool initialized = false;
    bool started = false;
    // set between members of a multi-member stream and after the last one
    bool member_done = false;

    ~State() {
        if (initialized) {
            inflateEnd(&zs);
        }
    }
};

GzipInflater::GzipInflater()
    : state_(std::make_unique<State>()) {
    if (inflateInit2(&state_->zs, kInflateWindowBits) != Z_OK) {
        throw UmpError(ErrorKind::kDecompressionFailed, "zlib inflate init failed");
    }
    state_->initialized = true;
}

GzipInflater::~GzipInflater() = default;
GzipInflater::GzipInflater(GzipInflater&&) noexcept = default;
GzipInflater& GzipInflater::operator=(GzipInflater&&) noexcept = default;

Bytes GzipInflater::Update(const std::uint8_t* data, std::size_t len) {
    Bytes out;
    if (data == nullptr || len == 0) {
        return out;
    }
    EnsureFitsZlib(len);
    z_stream& zs = state_->zs;
    zs.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(data));
    zs.avail_in = static_cast<uInt>(len);
    std::array<std::uint8_t, constants::kInflateChunkSize> buffer{};

    if (state_->member_done && state_->started) {
        // next gzip member
        if (inflateReset(&zs) != Z_OK) {
            throw UmpError(ErrorKind::kDecompressionFailed, "zlib inflate reset failed");
        }
    }
    state_->member_done = false;
    state_->started = true;

    for (;;) {
        zs.next_out = buffer.data();
        zs.avail_out = static_cast<uInt>(buffer.size());
        int rc = inflate(&zs, Z_NO_FLUSH);
        if (rc != Z_OK && rc != Z_STREAM_END && rc != Z_BUF_ERROR) {
            std::string detail = zs.msg ? zs.msg : std::to_string(rc);
            throw UmpError(ErrorKind::kDecompressionFailed, "gzip inflate failed: " + detail);
        }
        std::size_t produced = buffer.size() - zs.avail_out;
        if (produced > 0) {
            out.insert(out.end(), buffer.begin(), buffer.begin() + static_cast<std::ptrdiff_t>(produced));
        }
        if (rc == Z_STREAM_END) {
            state_->member_done = true;
            if (zs.avail_in == 0) {
                break;
            }
            if (inflateReset(&zs) != Z_OK) {
                throw UmpError(ErrorKind::kDecompressionFailed, "zlib inflate reset failed");
            }
            state_->member_done = false;
            continue;
        }
        // Z_BUF_ERROR: no progress possible until more input arrives
        if (rc == Z_BUF_ERROR || (zs.avail_in == 0 && zs.avail_out != 0)) {
            break;
        }
    }
    total_in_ += len;
    total_out_ += out.size();
    return out;
}

void GzipInflater::Finish() const {
    if (state_->started && !state_->member_done) {
        throw UmpError(ErrorKind::kDecompressionFailed, "gzip stream is truncated");
    }
}

Bytes GzipCompress(const Bytes& data, int level) {
    EnsureFitsZlib(data.size());
    z_stream zs{};
    if (deflateInit2(&zs, level, Z_DEFLATED, kGzipWindowBits, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
        throw std::runtime_error("zlib deflate init failed");
    }
    zs.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(data.data()));
    zs.avail_in = static_cast<uInt>(data.size());
    Bytes out;
    std::array<std::uint8_t, constants::kInflateChunkSize> buffer{};
    int rc = Z_OK;
    while (rc == Z_OK) {
        zs.next_out = buffer.data();
        zs.avail_out = static_cast<uInt>(buffer.size());
        rc = deflate(&zs, Z_FINISH);
        if (rc != Z_OK && rc != Z_STREAM_END) {
            deflateEnd(&zs);
            throw std::runtime_error("zlib deflate failed");
        }
        std::size_t produced = buffer.size() - zs.avail_out;
        out.insert(out.end(), buffer.begin(), buffer.begin() + static_cast<std::ptrdiff_t>(produced));
    }
    deflateEnd(&zs);
    return out;
}

Bytes GzipDecompress(const Bytes& data) {
    if (data.empty()) {
        throw UmpError(ErrorKind::kDecompressionFailed, "gzip input is empty");
    }
    GzipInflater inflater;
    Bytes out = inflater.Update(data);
    inflater.Finish();
    return out;
}

Bytes BrotliDecompress(const Bytes& data) {
    BrotliDecoderState* state = BrotliDecoderCreateInstance(nullptr, nullptr, nullptr);
    if (!state) {
        throw UmpError(ErrorKind::kDecompressionFailed, "Brotli decoder allocation failed");
    }
    Bytes out;
    std::array<std::uint8_t, constants::kInflateChunkSize> buffer{};
    const std::uint8_t* next_in = data.data();
    std::size_t avail_in = data.size();
    BrotliDecoderResult result = BROTLI_DECODER_RESULT_NEEDS_MORE_OUTPUT;
    while (result == BROTLI_DECODER_RESULT_NEEDS_MORE_OUTPUT) {
        std::uint8_t* next_out = buffer.data();
        std::size_t avail_out = buffer.size();
        result = BrotliDecoderDecompressStream(state, &avail_in, &next_in, &avail_out, &next_out, nullptr);
        std::size_t produced = buffer.size() - avail_out;
        out.insert(out.end(), buffer.begin(), buffer.begin() + static_cast<std::ptrdiff_t>(produced));
    }
    if (result != BROTLI_DECODER_RESULT_SUCCESS) {
        std::string detail = result == BROTLI_DECODER_RESULT_NEEDS_MORE_INPUT
            ? "truncated input"
            : BrotliDecoderErrorString(BrotliDecoderGetErrorCode(state));
        BrotliDecoderDestroyInstance(state);
        throw UmpError(ErrorKind::kDecompressionFailed, "Brotli decompress failed: " + detail);
    }
    BrotliDecoderDestroyInstance(state);
    return out;
}

}  // namespace umpcore::compression
