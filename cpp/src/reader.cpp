#include "umpcore/reader.hpp"

#include "umpcore/errors.hpp"

#include <stdexcept>
#include <utility>

namespace umpcore {

VectorChunkSource::VectorChunkSource(std::vector<Bytes> chunks)
    : chunks_(std::move(chunks)) {}

std::optional<Bytes> VectorChunkSource::NextChunk() {
    if (next_ >= chunks_.size()) {
        return std::nullopt;
    }
    return std::move(chunks_[next_++]);
}

StreamChunkSource::StreamChunkSource(std::istream& in, std::size_t chunk_size)
    : in_(in),
      chunk_size_(chunk_size == 0 ? constants::kStreamChunkSize : chunk_size) {}

std::optional<Bytes> StreamChunkSource::NextChunk() {
    if (!in_) {
        return std::nullopt;
    }
    Bytes chunk(chunk_size_);
    in_.read(reinterpret_cast<char*>(chunk.data()), static_cast<std::streamsize>(chunk.size()));
    std::streamsize got = in_.gcount();
    if (got <= 0) {
        if (in_.bad()) {
            throw std::runtime_error("Failed to read input stream");
        }
        return std::nullopt;
    }
    chunk.resize(static_cast<std::size_t>(got));
    return chunk;
}

UmpReader::UmpReader(ChunkSource& source,
                     const Config& config,
                     const Bytes* onesie_key,
                     const SchemaDecoder* decoder)
    : source_(source),
      config_(config),
      decoder_(decoder != nullptr ? *decoder : default_decoder_),
      framer_(config),
      dispatcher_(config, decoder_, onesie_key) {}

bool UmpReader::Step(bool queue_chunks) {
    if (!parts_.empty()) {
        Part part = std::move(parts_.front());
        parts_.pop_front();
        std::vector<Event> events = dispatcher_.Dispatch(std::move(part));
        for (Event& event : events) {
            if (!queue_chunks && event.Is<MediaChunk>()) {
                continue;
            }
            events_.push_back(std::move(event));
        }
        for (CompletedMedia& done : dispatcher_.assembler().TakeCompleted()) {
            media_.push_back(std::move(done));
        }
        return true;
    }
    if (exhausted_) {
        return false;
    }
    std::optional<Bytes> chunk = source_.NextChunk();
    if (!chunk) {
        exhausted_ = true;
        framer_.Finish();
        return false;
    }
    for (Part& part : framer_.Feed(*chunk)) {
        parts_.push_back(std::move(part));
    }
    return true;
}

std::optional<Event> UmpReader::Next() {
    while (events_.empty()) {
        if (!Step()) {
            return std::nullopt;
        }
    }
    Event event = std::move(events_.front());
    events_.pop_front();
    return event;
}

std::optional<CompletedMedia> UmpReader::NextMedia() {
    while (media_.empty()) {
        if (!Step(false)) {
            return std::nullopt;
        }
    }
    return PollMedia();
}

std::optional<CompletedMedia> UmpReader::PollMedia() {
    if (media_.empty()) {
        return std::nullopt;
    }
    CompletedMedia done = std::move(media_.front());
    media_.pop_front();
    return done;
}

void UmpReader::Finish() {
    while (Step()) {
    }
}

}  // namespace umpcore
