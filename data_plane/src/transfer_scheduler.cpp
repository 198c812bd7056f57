#include "bolster/transfer_scheduler.hpp"

#include "bolster/chunk_transporter.hpp"
#include "bolster/file_transfer_pipeline.hpp"
#include "bolster/task_group.hpp"

#include <exception>
#include <mutex>
#include <optional>
#include <utility>

namespace bolster {

TransferScheduler::TransferScheduler(TransferConfig config, ObjectStore &store)
    : config_(std::move(config)), store_(store) {
    config_.validate();
}

void TransferScheduler::attach_progress(ProgressSink &sink) { progress_.attach(sink); }

void TransferScheduler::detach_progress() { progress_.detach(); }

BatchResult TransferScheduler::run(const std::vector<TransferItem> &items) {
    BatchResult batch;
    std::vector<std::optional<FileResult>> slots(items.size());
    std::mutex mutex;
    ChunkTransporter transporter(store_, progress_);

    {
        BoundedTaskGroup files(config_.max_concurrent_files);
        for (std::size_t i = 0; i < items.size(); ++i) {
            files.spawn([&, i] {
                progress_.on_file_started(i, items[i]);
                FileResult result;
                try {
                    FileTransferPipeline pipeline(i, items[i], config_, transporter);
                    result = pipeline.run();
                } catch (const std::exception &err) {
                    result.item = items[i];
                    result.outcome = Outcome::Failed;
                    result.error = TransferFailure{ErrorKind::Io, 0, err.what(), std::nullopt};
                }
                progress_.on_file_finished(i, result);
                std::lock_guard<std::mutex> lock(mutex);
                if (!result.succeeded() && !batch.first_fatal_error) {
                    batch.first_fatal_error = result.error;
                }
                slots[i] = std::move(result);
            });
        }
        files.wait();
    }

    batch.results.reserve(slots.size());
    for (auto &slot : slots) {
        batch.results.push_back(std::move(*slot));
    }
    return batch;
}

} // namespace bolster
