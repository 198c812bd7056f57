#include "bolster/task_group.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace bolster {

BoundedTaskGroup::BoundedTaskGroup(std::size_t limit) : limit_(limit) {
    if (limit_ == 0) {
        throw std::invalid_argument("concurrency limit must be > 0");
    }
}

BoundedTaskGroup::~BoundedTaskGroup() { wait(); }

void BoundedTaskGroup::wait_for_slot() {
    std::unique_lock<std::mutex> lock(mutex_);
    reap_finished(lock);
    cv_.wait(lock, [&] { return active_ < limit_; });
}

void BoundedTaskGroup::spawn(std::function<void()> task) {
    std::unique_lock<std::mutex> lock(mutex_);
    reap_finished(lock);
    cv_.wait(lock, [&] { return active_ < limit_; });
    const std::uint64_t id = next_id_++;
    // The new thread blocks on mutex_ before reporting completion, so it is
    // registered in threads_ before finished_ can name it. The task and its
    // captures are destroyed before the slot is released.
    std::thread thread([this, id, task = std::move(task)]() mutable {
        task();
        task = nullptr;
        std::lock_guard<std::mutex> done(mutex_);
        --active_;
        finished_.push_back(id);
        cv_.notify_all();
    });
    ++active_;
    peak_ = std::max(peak_, active_);
    threads_.emplace(id, std::move(thread));
}

void BoundedTaskGroup::wait() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [&] { return active_ == 0; });
    reap_finished(lock);
}

std::size_t BoundedTaskGroup::in_flight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_;
}

std::size_t BoundedTaskGroup::peak_in_flight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return peak_;
}

void BoundedTaskGroup::reap_finished(std::unique_lock<std::mutex> &lock) {
    if (finished_.empty()) {
        return;
    }
    std::vector<std::thread> done;
    done.reserve(finished_.size());
    for (std::uint64_t id : finished_) {
        auto it = threads_.find(id);
        done.push_back(std::move(it->second));
        threads_.erase(it);
    }
    finished_.clear();
    lock.unlock();
    for (auto &thread : done) {
        thread.join();
    }
    lock.lock();
}

} // namespace bolster
