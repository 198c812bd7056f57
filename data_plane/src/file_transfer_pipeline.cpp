#include "bolster/file_transfer_pipeline.hpp"

#include "bolster/file_chunker.hpp"
#include "bolster/local_file.hpp"
#include "bolster/task_group.hpp"

#include <exception>
#include <filesystem>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace bolster {

namespace {

void fail(FileResult &result, TransferFailure failure) {
    result.outcome = Outcome::Failed;
    result.error = std::move(failure);
    result.checksum_hex.clear();
    result.part_ids.clear();
}

TransferFailure unexpected_failure(const std::exception &err,
                                   std::optional<std::uint32_t> chunk_index = std::nullopt) {
    return TransferFailure{ErrorKind::Io, 0, err.what(), chunk_index};
}

} // namespace

FileTransferPipeline::FileTransferPipeline(std::size_t item_id, TransferItem item,
                                           const TransferConfig &config,
                                           ChunkTransporter &transporter)
    : item_id_(item_id), item_(std::move(item)), config_(config), transporter_(transporter) {}

FileResult FileTransferPipeline::run() {
    FileResult result;
    result.item = item_;
    try {
        if (item_.size_bytes > config_.max_object_size_bytes) {
            std::ostringstream oss;
            oss << "'" << item_.relative_path << "' is " << item_.size_bytes
                << " bytes, above the " << config_.max_object_size_bytes
                << " byte object size limit";
            throw SizeMismatchError(oss.str());
        }
        if (item_.direction == Direction::Upload) {
            upload(result);
        } else {
            download(result);
        }
    } catch (const TransferError &err) {
        fail(result, err.failure());
    } catch (const std::exception &err) {
        fail(result, unexpected_failure(err));
    }
    return result;
}

void FileTransferPipeline::upload(FileResult &result) {
    const std::string key = config_.object_key(item_.relative_path);
    LocalFile source = LocalFile::open_for_read(config_.local_root / item_.relative_path);
    const std::uint64_t actual_size = source.size();
    if (actual_size != item_.size_bytes) {
        std::ostringstream oss;
        oss << "'" << item_.relative_path << "' is " << actual_size << " bytes, recorded as "
            << item_.size_bytes;
        throw SizeMismatchError(oss.str());
    }

    ChunkReader reader(source, item_.size_bytes, config_.chunk_size_bytes);

    // Small files skip multipart negotiation entirely.
    if (reader.chunk_count() <= 1) {
        Chunk chunk = reader.has_next() ? reader.next() : Chunk{0, 0, 0, {}};
        reader.verify_exhausted();
        const ChunkResult sent = transporter_.put_single(item_id_, key, chunk);
        result.total_bytes = sent.bytes_transferred;
        result.checksum_hex = reader.digest_hex();
        return;
    }

    const std::string session_token = transporter_.begin_multipart(key);
    part_ids_.assign(reader.chunk_count(), std::string());
    {
        BoundedTaskGroup chunks(config_.max_concurrent_chunks_per_file);
        while (reader.has_next() && !cancelled()) {
            // Take the slot before reading so buffered payloads never exceed
            // the per-file bound.
            chunks.wait_for_slot();
            if (cancelled()) {
                break;
            }
            const std::uint32_t index = reader.next_index();
            Chunk chunk{};
            try {
                chunk = reader.next();
            } catch (const TransferError &err) {
                record_failure(err.failure(index));
                break;
            }
            chunks.spawn([this, &session_token, chunk = std::move(chunk)] {
                try {
                    record_completion(
                        transporter_.upload_part(item_id_, session_token, chunk, cancel_));
                } catch (const TransferError &err) {
                    record_failure(err.failure(chunk.index));
                } catch (const std::exception &err) {
                    record_failure(unexpected_failure(err, chunk.index));
                }
            });
        }
        chunks.wait();
    }

    if (first_error_) {
        // The multipart session is left for the store's own expiry.
        fail(result, *first_error_);
        return;
    }
    reader.verify_exhausted();
    if (completed_.size() != part_ids_.size()) {
        throw std::logic_error("multipart upload finished with missing parts");
    }

    transporter_.commit_multipart(session_token, part_ids_);
    result.total_bytes = transferred_bytes_;
    result.checksum_hex = reader.digest_hex();
    result.part_ids = part_ids_;
}

void FileTransferPipeline::download(FileResult &result) {
    const std::string key = config_.object_key(item_.relative_path);
    const std::uint64_t remote_size = transporter_.object_size(key);
    if (remote_size != item_.size_bytes) {
        std::ostringstream oss;
        oss << "object '" << key << "' is " << remote_size << " bytes, recorded as "
            << item_.size_bytes;
        throw SizeMismatchError(oss.str());
    }

    const FileChunker chunker(config_.chunk_size_bytes);
    const std::uint32_t chunk_count = chunker.chunk_count(remote_size);

    const std::filesystem::path destination = config_.local_root / item_.relative_path;
    LocalFile sink = LocalFile::create_for_write(destination);
    const auto discard_partial = [&] {
        std::error_code ignored;
        std::filesystem::remove(destination, ignored);
    };

    try {
        // Chunks finish out of order, so the file must have its final length
        // before the first write.
        sink.presize(remote_size);
        {
            BoundedTaskGroup chunks(config_.max_concurrent_chunks_per_file);
            for (std::uint32_t index = 0; index < chunk_count; ++index) {
                chunks.wait_for_slot();
                if (cancelled()) {
                    break;
                }
                const ChunkSpan span = chunker.span_at(remote_size, index);
                chunks.spawn([this, &key, &sink, span] {
                    try {
                        record_completion(
                            transporter_.download_range(item_id_, key, span, sink, cancel_));
                    } catch (const TransferError &err) {
                        record_failure(err.failure(span.index));
                    } catch (const std::exception &err) {
                        record_failure(unexpected_failure(err, span.index));
                    }
                });
            }
            chunks.wait();
        }

        if (first_error_) {
            // The descriptor is released by the LocalFile destructor so a
            // close error cannot replace the chunk failure.
            discard_partial();
            fail(result, *first_error_);
            return;
        }
        if (completed_.size() != chunk_count) {
            throw std::logic_error("download finished with missing chunks");
        }

        // Fold the digest over the finished file in index order.
        ChunkReader reader(sink, remote_size, config_.chunk_size_bytes);
        while (reader.has_next()) {
            reader.next();
        }
        reader.verify_exhausted();
        sink.close();
        result.total_bytes = transferred_bytes_;
        result.checksum_hex = reader.digest_hex();
    } catch (const std::exception &) {
        discard_partial();
        throw;
    }
}

void FileTransferPipeline::record_completion(const ChunkResult &chunk) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (cancelled()) {
        return;
    }
    if (!part_ids_.empty()) {
        part_ids_[chunk.index] = chunk.remote_part_id;
    }
    completed_.insert(chunk.index);
    transferred_bytes_ += chunk.bytes_transferred;
}

void FileTransferPipeline::record_failure(TransferFailure failure) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!first_error_) {
        first_error_ = std::move(failure);
    }
    cancel_.cancel();
}

} // namespace bolster
