#pragma once

#include "bolster/cancellation.hpp"
#include "bolster/local_file.hpp"
#include "bolster/object_store.hpp"
#include "bolster/progress.hpp"
#include "bolster/transfer_types.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace bolster {

// The engine's only path to the object store. One store operation per call.
// Chunk calls carry everything they need (session token, index, offset), so
// replaying one never disturbs another chunk.
class ChunkTransporter {
  public:
    ChunkTransporter(ObjectStore &store, ProgressSink &progress);

    std::string begin_multipart(const std::string &key);

    // Throws CommitError when the store rejects the part list.
    void commit_multipart(const std::string &session_token,
                          const std::vector<std::string> &ordered_part_ids);

    std::uint64_t object_size(const std::string &key);

    ChunkResult upload_part(std::size_t item_id, const std::string &session_token,
                            const Chunk &chunk, const CancellationToken &cancel);

    ChunkResult put_single(std::size_t item_id, const std::string &key, const Chunk &chunk);

    // Writes the fetched range at `span.offset` of `sink`.
    ChunkResult download_range(std::size_t item_id, const std::string &key,
                               const ChunkSpan &span, const LocalFile &sink,
                               const CancellationToken &cancel);

  private:
    ObjectStore &store_;
    ProgressSink &progress_;
};

} // namespace bolster
