#pragma once

#include "bolster/object_store.hpp"
#include "bolster/progress.hpp"
#include "bolster/transfer_config.hpp"
#include "bolster/transfer_types.hpp"

#include <vector>

namespace bolster {

// Runs a batch of files with at most `max_concurrent_files` pipelines active.
// Files are admitted in input order as slots free up. A failed file never
// stops the others; every file reaches a terminal outcome before run()
// returns.
class TransferScheduler {
  public:
    // Throws std::invalid_argument for an invalid config.
    TransferScheduler(TransferConfig config, ObjectStore &store);

    // May be called while a batch is running.
    void attach_progress(ProgressSink &sink);
    void detach_progress();

    // Results come back in input order; first_fatal_error is the first
    // failure in completion order.
    BatchResult run(const std::vector<TransferItem> &items);

    const TransferConfig &config() const noexcept { return config_; }

  private:
    TransferConfig config_;
    ObjectStore &store_;
    ProgressRelay progress_;
};

} // namespace bolster
