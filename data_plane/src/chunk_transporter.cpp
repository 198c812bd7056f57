#include "bolster/chunk_transporter.hpp"

#include "bolster/errors.hpp"

#include <exception>
#include <sstream>
#include <utility>
#include <vector>

namespace bolster {

namespace {

// Stores are expected to throw TransportError; anything else they throw is
// reported as a transport failure without a status.
template <typename Call> auto call_store(Call &&call) -> decltype(call()) {
    try {
        return call();
    } catch (const TransferError &) {
        throw;
    } catch (const std::exception &err) {
        throw TransportError(0, err.what());
    }
}

} // namespace

ChunkTransporter::ChunkTransporter(ObjectStore &store, ProgressSink &progress)
    : store_(store), progress_(progress) {}

std::string ChunkTransporter::begin_multipart(const std::string &key) {
    return call_store([&] { return store_.initiate_multipart_upload(key); });
}

void ChunkTransporter::commit_multipart(const std::string &session_token,
                                        const std::vector<std::string> &ordered_part_ids) {
    try {
        call_store([&] { store_.commit_multipart_upload(session_token, ordered_part_ids); });
    } catch (const TransferError &err) {
        throw CommitError(err.status(), err.what());
    }
}

std::uint64_t ChunkTransporter::object_size(const std::string &key) {
    return call_store([&] { return store_.head_object(key); });
}

ChunkResult ChunkTransporter::upload_part(std::size_t item_id, const std::string &session_token,
                                          const Chunk &chunk, const CancellationToken &cancel) {
    std::string part_id = call_store(
        [&] { return store_.upload_part(session_token, chunk.index, chunk.payload, cancel); });
    progress_.on_bytes(item_id, chunk.payload.size());
    return ChunkResult{chunk.index, chunk.payload.size(), std::move(part_id)};
}

ChunkResult ChunkTransporter::put_single(std::size_t item_id, const std::string &key,
                                         const Chunk &chunk) {
    call_store([&] { store_.put_object(key, chunk.payload); });
    progress_.on_bytes(item_id, chunk.payload.size());
    return ChunkResult{chunk.index, chunk.payload.size(), std::string()};
}

ChunkResult ChunkTransporter::download_range(std::size_t item_id, const std::string &key,
                                             const ChunkSpan &span, const LocalFile &sink,
                                             const CancellationToken &cancel) {
    std::vector<char> bytes = call_store(
        [&] { return store_.get_object_range(key, span.offset, span.length, cancel); });
    if (bytes.size() != span.length) {
        std::ostringstream oss;
        oss << "object '" << key << "' returned " << bytes.size() << " bytes at offset "
            << span.offset << ", expected " << span.length;
        throw SizeMismatchError(oss.str());
    }
    sink.write_at(span.offset, bytes.data(), bytes.size());
    progress_.on_bytes(item_id, bytes.size());
    return ChunkResult{span.index, bytes.size(), std::string()};
}

} // namespace bolster
