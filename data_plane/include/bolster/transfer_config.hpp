#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

namespace bolster {

constexpr std::size_t kDefaultChunkSizeBytes = 16 * 1024 * 1024;
constexpr std::size_t kDefaultMaxConcurrentFiles = 4;
constexpr std::size_t kDefaultMaxConcurrentChunksPerFile = 10;
// 10000 parts of 512 MiB, about 4.88 TB: the storage provider's ceiling.
constexpr std::uint64_t kDefaultMaxObjectSizeBytes = 10000ULL * 512 * 1024 * 1024;

struct TransferConfig {
    std::size_t chunk_size_bytes{kDefaultChunkSizeBytes};
    std::size_t max_concurrent_files{kDefaultMaxConcurrentFiles};
    std::size_t max_concurrent_chunks_per_file{kDefaultMaxConcurrentChunksPerFile};
    std::uint64_t max_object_size_bytes{kDefaultMaxObjectSizeBytes};
    // Object key of a file is "<key_prefix>/<relative_path>".
    std::string key_prefix;
    // Uploads read from and downloads write to "<local_root>/<relative_path>".
    std::filesystem::path local_root{"."};

    // Throws std::invalid_argument, including when the chunk size is too small
    // to number the chunks of a maximum-size object with 32-bit indices.
    void validate() const;

    // Reads BOLSTER__CHUNK_SIZE_BYTES, BOLSTER__MAX_CONCURRENT_FILES and
    // BOLSTER__MAX_CONCURRENT_CHUNKS_PER_FILE when set.
    void apply_environment_overrides();

    std::uint64_t memory_ceiling_bytes() const noexcept;

    std::string object_key(const std::string &relative_path) const;
};

// Parses a positive integer with an optional K/M/G (binary) suffix, e.g. "16M".
std::uint64_t parse_size(const std::string &text);

} // namespace bolster
