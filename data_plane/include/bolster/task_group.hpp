#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <vector>

namespace bolster {

// Bounded admission of independent tasks. Each admitted task runs on its own
// thread; at most `limit` run at once, and a finishing task frees its slot for
// the next spawn immediately. Whatever a task captured is destroyed before its
// slot is freed, so captured buffers count against the limit. Tasks must not
// throw.
class BoundedTaskGroup {
  public:
    explicit BoundedTaskGroup(std::size_t limit);
    ~BoundedTaskGroup();

    BoundedTaskGroup(const BoundedTaskGroup &) = delete;
    BoundedTaskGroup &operator=(const BoundedTaskGroup &) = delete;

    // Blocks until fewer than `limit` tasks are running.
    void wait_for_slot();

    // Blocks for a slot, then starts `task`.
    void spawn(std::function<void()> task);

    // Blocks until every spawned task has finished.
    void wait();

    std::size_t in_flight() const;

    std::size_t peak_in_flight() const;

    std::size_t limit() const noexcept { return limit_; }

  private:
    void reap_finished(std::unique_lock<std::mutex> &lock);

    std::size_t limit_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::size_t active_{0};
    std::size_t peak_{0};
    std::uint64_t next_id_{0};
    std::unordered_map<std::uint64_t, std::thread> threads_;
    std::vector<std::uint64_t> finished_;
};

} // namespace bolster
