#include "bolster/cancellation.hpp"

#include "bolster/errors.hpp"

namespace bolster {

void CancellationToken::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = true;
    }
    cv_.notify_all();
}

bool CancellationToken::wait_for(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this] { return cancelled_.load(); });
}

void CancellationToken::throw_if_cancelled() const {
    if (cancelled()) {
        throw CancelledError("chunk abandoned after another chunk of the file failed");
    }
}

} // namespace bolster
