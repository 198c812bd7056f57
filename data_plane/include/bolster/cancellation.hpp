#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace bolster {

// Per-file cancellation flag. Chunk calls receive it so that a store blocked
// in a long operation can give up once a sibling chunk has failed.
class CancellationToken {
  public:
    CancellationToken() = default;
    CancellationToken(const CancellationToken &) = delete;
    CancellationToken &operator=(const CancellationToken &) = delete;

    void cancel();

    bool cancelled() const noexcept { return cancelled_.load(); }

    // Sleeps for up to `timeout`. Returns true as soon as the token is
    // cancelled, false when the full timeout elapsed.
    bool wait_for(std::chrono::milliseconds timeout) const;

    // Throws CancelledError when cancelled.
    void throw_if_cancelled() const;

  private:
    std::atomic<bool> cancelled_{false};
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
};

} // namespace bolster
