#pragma once

#include "bolster/checksum.hpp"
#include "bolster/local_file.hpp"
#include "bolster/transfer_types.hpp"

#include <cstddef>
#include <cstdint>

namespace bolster {

// Chunk boundaries for a byte size. Never touches content, so the same
// arithmetic serves a local source and a remote object of known size.
class FileChunker {
  public:
    explicit FileChunker(std::size_t chunk_size_bytes);

    // Throws std::invalid_argument when the chunks of `size_bytes` cannot be
    // numbered with 32-bit indices.
    std::uint32_t chunk_count(std::uint64_t size_bytes) const;

    // `index` must be below chunk_count(size_bytes).
    ChunkSpan span_at(std::uint64_t size_bytes, std::uint32_t index) const noexcept;

    std::size_t chunk_size_bytes() const noexcept { return chunk_size_bytes_; }

  private:
    std::size_t chunk_size_bytes_;
};

// Lazy, restartable sequence of chunks read from a local file in index order.
// Every chunk handed out is folded into a running MD5, so the digest does not
// depend on when callers finish with the chunks.
class ChunkReader {
  public:
    ChunkReader(const LocalFile &source, std::uint64_t expected_size,
                std::size_t chunk_size_bytes);

    bool has_next() const noexcept;

    std::uint32_t next_index() const noexcept { return next_; }

    // Throws IoError on a failed read and SizeMismatchError when the file is
    // shorter than the expected size.
    Chunk next();

    // Throws SizeMismatchError when the file grew past the expected size.
    void verify_exhausted() const;

    void rewind();

    std::uint32_t chunk_count() const noexcept { return count_; }

    std::string digest_hex() const;

  private:
    const LocalFile &source_;
    std::uint64_t expected_size_;
    FileChunker chunker_;
    std::uint32_t count_;
    std::uint32_t next_{0};
    Checksum::Md5Accumulator digest_;
};

} // namespace bolster
