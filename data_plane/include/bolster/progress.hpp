#pragma once

#include "bolster/transfer_types.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <ostream>
#include <string>
#include <unordered_map>

namespace bolster {

// Receives events from many pipeline threads at once. Implementations must be
// thread-safe and must not throw.
class ProgressSink {
  public:
    virtual ~ProgressSink() = default;

    virtual void on_file_started(std::size_t item_id, const TransferItem &item) = 0;

    virtual void on_bytes(std::size_t item_id, std::uint64_t bytes) = 0;

    virtual void on_file_finished(std::size_t item_id, const FileResult &result) = 0;
};

// Forwards events to whichever sink is currently attached, if any. Events are
// delivered outside the relay's lock, so chunk threads reach the sink
// concurrently. Detaching waits for events already being delivered, so a
// detached sink may be destroyed right away.
class ProgressRelay : public ProgressSink {
  public:
    void attach(ProgressSink &sink);
    void detach();

    void on_file_started(std::size_t item_id, const TransferItem &item) override;
    void on_bytes(std::size_t item_id, std::uint64_t bytes) override;
    void on_file_finished(std::size_t item_id, const FileResult &result) override;

  private:
    // Returns the attached sink, counted as in use until release().
    ProgressSink *acquire();
    void release();

    std::mutex mutex_;
    std::condition_variable idle_;
    ProgressSink *sink_{nullptr};
    std::size_t deliveries_{0};
};

class ProgressAggregator : public ProgressSink {
  public:
    // Rendering is optional; a null stream only accumulates counters.
    explicit ProgressAggregator(std::ostream *out = nullptr,
                                std::chrono::milliseconds render_interval =
                                    std::chrono::milliseconds(500));

    void on_file_started(std::size_t item_id, const TransferItem &item) override;
    void on_bytes(std::size_t item_id, std::uint64_t bytes) override;
    void on_file_finished(std::size_t item_id, const FileResult &result) override;

    std::uint64_t item_bytes(std::size_t item_id) const;
    std::uint64_t total_bytes() const;
    std::uint64_t expected_bytes() const;
    std::size_t files_started() const;
    std::size_t files_finished() const;
    std::size_t files_failed() const;

    // Writes the aggregate line now, ignoring the render interval.
    void render();

  private:
    struct ItemProgress {
        std::string relative_path;
        std::uint64_t size_bytes{0};
        std::uint64_t bytes{0};
    };

    void render_locked();

    std::ostream *out_;
    std::chrono::milliseconds render_interval_;
    std::chrono::steady_clock::time_point started_at_;
    std::chrono::steady_clock::time_point last_render_;

    mutable std::mutex mutex_;
    std::unordered_map<std::size_t, ItemProgress> items_;
    std::uint64_t total_bytes_{0};
    std::uint64_t expected_bytes_{0};
    std::size_t files_started_{0};
    std::size_t files_finished_{0};
    std::size_t files_failed_{0};
};

std::string format_bytes(std::uint64_t bytes);

} // namespace bolster
