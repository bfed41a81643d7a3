#pragma once

#include "umpcore/config.hpp"
#include "umpcore/dispatcher.hpp"
#include "umpcore/events.hpp"
#include "umpcore/framer.hpp"
#include "umpcore/schema.hpp"

#include <cstddef>
#include <deque>
#include <istream>
#include <optional>
#include <vector>

namespace umpcore {

// Pull interface over the ordered input buffers. Empty optional ends input.
class ChunkSource {
public:
    virtual ~ChunkSource() = default;
    virtual std::optional<Bytes> NextChunk() = 0;
};

class VectorChunkSource : public ChunkSource {
public:
    explicit VectorChunkSource(std::vector<Bytes> chunks);
    std::optional<Bytes> NextChunk() override;

private:
    std::vector<Bytes> chunks_;
    std::size_t next_ = 0;
};

// Reads fixed-size chunks from a stream; the last one may be short.
class StreamChunkSource : public ChunkSource {
public:
    StreamChunkSource(std::istream& in, std::size_t chunk_size);
    std::optional<Bytes> NextChunk() override;

private:
    std::istream& in_;
    std::size_t chunk_size_;
};

/**
 * Lazy decoder over a ChunkSource. Input is pulled only when no decoded
 * event is waiting, so a caller that stops pulling leaves the source unread.
 *
 * Exceptions from decoding a part leave the reader usable: the part is
 * consumed and the next call continues with the one after it.
 */
class UmpReader {
public:
    UmpReader(ChunkSource& source,
              const Config& config = {},
              const Bytes* onesie_key = nullptr,
              const SchemaDecoder* decoder = nullptr);

    UmpReader(const UmpReader&) = delete;
    UmpReader& operator=(const UmpReader&) = delete;

    std::optional<Event> Next();
    // Next finalized media stream. Events decoded on the way stay queued for
    // Next(), except MediaChunk events: their bytes already belong to the stream.
    std::optional<CompletedMedia> NextMedia();
    // A media stream finalized by earlier Next() calls, without reading input.
    std::optional<CompletedMedia> PollMedia();
    // Drains the input and checks that nothing was left mid-part.
    void Finish();

    bool Exhausted() const noexcept { return exhausted_; }
    std::size_t OpenStreams() const noexcept { return dispatcher_.assembler().OpenStreams(); }
    const PartFramer& framer() const noexcept { return framer_; }

private:
    // Advances by one part or one input chunk. false once everything is drained.
    bool Step(bool queue_chunks = true);

    ChunkSource& source_;
    Config config_;
    ProtoSchemaDecoder default_decoder_;
    const SchemaDecoder& decoder_;
    PartFramer framer_;
    Dispatcher dispatcher_;
    std::deque<Part> parts_;
    std::deque<Event> events_;
    std::deque<CompletedMedia> media_;
    bool exhausted_ = false;
};

}  // namespace umpcore
