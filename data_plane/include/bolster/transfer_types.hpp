#pragma once

#include "bolster/errors.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace bolster {

enum class Direction { Upload, Download };

struct TransferItem {
    std::string relative_path;
    std::uint64_t size_bytes;
    Direction direction;
};

struct ChunkSpan {
    std::uint32_t index;
    std::uint64_t offset;
    std::uint32_t length;
};

struct Chunk {
    std::uint32_t index;
    std::uint64_t offset;
    std::uint32_t length;
    std::vector<char> payload;
};

struct ChunkResult {
    std::uint32_t index;
    std::uint64_t bytes_transferred;
    std::string remote_part_id;
};

enum class Outcome { Success, Failed };

struct FileResult {
    TransferItem item;
    std::uint64_t total_bytes{0};
    std::string checksum_hex;
    std::vector<std::string> part_ids;
    Outcome outcome{Outcome::Success};
    std::optional<TransferFailure> error;

    bool succeeded() const noexcept { return outcome == Outcome::Success; }
};

struct BatchResult {
    std::vector<FileResult> results;
    std::optional<TransferFailure> first_fatal_error;

    std::size_t failed_count() const noexcept;

    bool all_succeeded() const noexcept { return failed_count() == 0; }
};

} // namespace bolster
