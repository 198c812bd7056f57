#pragma once

#include "bolster/cancellation.hpp"
#include "bolster/chunk_transporter.hpp"
#include "bolster/transfer_config.hpp"
#include "bolster/transfer_types.hpp"

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace bolster {

// Transfers one file with at most `max_concurrent_chunks_per_file` chunk
// operations in flight. Chunks complete in any order; completions land in an
// index-keyed slot array, and the digest and part list come out in index
// order. The first chunk failure becomes the file's outcome: chunks not yet
// issued never are, and chunk calls in flight are told through the file's
// cancellation token to give up rather than finish. A run never throws.
class FileTransferPipeline {
  public:
    FileTransferPipeline(std::size_t item_id, TransferItem item, const TransferConfig &config,
                         ChunkTransporter &transporter);

    FileTransferPipeline(const FileTransferPipeline &) = delete;
    FileTransferPipeline &operator=(const FileTransferPipeline &) = delete;

    FileResult run();

  private:
    void upload(FileResult &result);
    void download(FileResult &result);

    void record_completion(const ChunkResult &chunk);
    void record_failure(TransferFailure failure);
    bool cancelled() const noexcept { return cancel_.cancelled(); }

    std::size_t item_id_;
    TransferItem item_;
    const TransferConfig &config_;
    ChunkTransporter &transporter_;

    std::mutex mutex_;
    CancellationToken cancel_;
    std::set<std::uint32_t> completed_;
    std::vector<std::string> part_ids_;
    std::uint64_t transferred_bytes_{0};
    std::optional<TransferFailure> first_error_;
};

} // namespace bolster
