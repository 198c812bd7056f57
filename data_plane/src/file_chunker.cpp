#include "bolster/file_chunker.hpp"

#include <algorithm>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace bolster {

FileChunker::FileChunker(std::size_t chunk_size_bytes) : chunk_size_bytes_(chunk_size_bytes) {
    if (chunk_size_bytes_ == 0) {
        throw std::invalid_argument("chunk size must be > 0");
    }
    if (chunk_size_bytes_ > std::numeric_limits<std::uint32_t>::max()) {
        throw std::invalid_argument("chunk size must fit in 32 bits");
    }
}

std::uint32_t FileChunker::chunk_count(std::uint64_t size_bytes) const {
    const std::uint64_t count =
        size_bytes / chunk_size_bytes_ + ((size_bytes % chunk_size_bytes_) ? 1 : 0);
    if (count > std::numeric_limits<std::uint32_t>::max()) {
        std::ostringstream oss;
        oss << size_bytes << " bytes in chunks of " << chunk_size_bytes_
            << " bytes would need " << count << " chunks, more than 32-bit indices allow";
        throw std::invalid_argument(oss.str());
    }
    return static_cast<std::uint32_t>(count);
}

ChunkSpan FileChunker::span_at(std::uint64_t size_bytes, std::uint32_t index) const noexcept {
    const std::uint64_t offset = static_cast<std::uint64_t>(index) * chunk_size_bytes_;
    const auto length = static_cast<std::uint32_t>(
        std::min<std::uint64_t>(size_bytes - offset, chunk_size_bytes_));
    return ChunkSpan{index, offset, length};
}

ChunkReader::ChunkReader(const LocalFile &source, std::uint64_t expected_size,
                         std::size_t chunk_size_bytes)
    : source_(source), expected_size_(expected_size), chunker_(chunk_size_bytes),
      count_(chunker_.chunk_count(expected_size)) {}

bool ChunkReader::has_next() const noexcept { return next_ < count_; }

Chunk ChunkReader::next() {
    if (!has_next()) {
        throw std::out_of_range("chunk reader is exhausted");
    }
    const ChunkSpan span = chunker_.span_at(expected_size_, next_);
    Chunk chunk{span.index, span.offset, span.length, std::vector<char>(span.length)};
    const std::size_t read = source_.read_at(span.offset, chunk.payload.data(), span.length);
    if (read != span.length) {
        std::ostringstream oss;
        oss << "'" << source_.path().string() << "' is shorter than the recorded "
            << expected_size_ << " bytes (chunk " << span.index << " read " << read << " of "
            << span.length << " bytes)";
        throw SizeMismatchError(oss.str());
    }
    digest_.update(chunk.payload.data(), chunk.payload.size());
    ++next_;
    return chunk;
}

void ChunkReader::verify_exhausted() const {
    const std::uint64_t actual = source_.size();
    if (actual != expected_size_) {
        std::ostringstream oss;
        oss << "'" << source_.path().string() << "' changed size during transfer (recorded "
            << expected_size_ << " bytes, now " << actual << ")";
        throw SizeMismatchError(oss.str());
    }
}

void ChunkReader::rewind() {
    next_ = 0;
    digest_.reset();
}

std::string ChunkReader::digest_hex() const { return digest_.hex(); }

} // namespace bolster
