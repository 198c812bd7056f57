#include "bolster/progress.hpp"

#include <iomanip>
#include <sstream>

namespace bolster {

void ProgressRelay::attach(ProgressSink &sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = &sink;
}

void ProgressRelay::detach() {
    std::unique_lock<std::mutex> lock(mutex_);
    sink_ = nullptr;
    idle_.wait(lock, [this] { return deliveries_ == 0; });
}

ProgressSink *ProgressRelay::acquire() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (sink_ != nullptr) {
        ++deliveries_;
    }
    return sink_;
}

void ProgressRelay::release() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        --deliveries_;
    }
    idle_.notify_all();
}

void ProgressRelay::on_file_started(std::size_t item_id, const TransferItem &item) {
    if (ProgressSink *sink = acquire()) {
        sink->on_file_started(item_id, item);
        release();
    }
}

void ProgressRelay::on_bytes(std::size_t item_id, std::uint64_t bytes) {
    if (ProgressSink *sink = acquire()) {
        sink->on_bytes(item_id, bytes);
        release();
    }
}

void ProgressRelay::on_file_finished(std::size_t item_id, const FileResult &result) {
    if (ProgressSink *sink = acquire()) {
        sink->on_file_finished(item_id, result);
        release();
    }
}

ProgressAggregator::ProgressAggregator(std::ostream *out,
                                       std::chrono::milliseconds render_interval)
    : out_(out), render_interval_(render_interval),
      started_at_(std::chrono::steady_clock::now()), last_render_(started_at_) {}

void ProgressAggregator::on_file_started(std::size_t item_id, const TransferItem &item) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto &progress = items_[item_id];
    progress.relative_path = item.relative_path;
    progress.size_bytes = item.size_bytes;
    expected_bytes_ += item.size_bytes;
    ++files_started_;
}

void ProgressAggregator::on_bytes(std::size_t item_id, std::uint64_t bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    items_[item_id].bytes += bytes;
    total_bytes_ += bytes;
    if (out_ != nullptr && std::chrono::steady_clock::now() - last_render_ >= render_interval_) {
        render_locked();
    }
}

void ProgressAggregator::on_file_finished(std::size_t, const FileResult &result) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++files_finished_;
    if (!result.succeeded()) {
        ++files_failed_;
    }
    if (out_ == nullptr) {
        return;
    }
    if (result.succeeded()) {
        *out_ << "done   " << result.item.relative_path << " ("
              << format_bytes(result.total_bytes) << ")\n";
    } else {
        *out_ << "FAILED " << result.item.relative_path << ": "
              << (result.error ? result.error->describe() : std::string("unknown error"))
              << '\n';
    }
    out_->flush();
}

std::uint64_t ProgressAggregator::item_bytes(std::size_t item_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = items_.find(item_id);
    return it == items_.end() ? 0 : it->second.bytes;
}

std::uint64_t ProgressAggregator::total_bytes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return total_bytes_;
}

std::uint64_t ProgressAggregator::expected_bytes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return expected_bytes_;
}

std::size_t ProgressAggregator::files_started() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return files_started_;
}

std::size_t ProgressAggregator::files_finished() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return files_finished_;
}

std::size_t ProgressAggregator::files_failed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return files_failed_;
}

void ProgressAggregator::render() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (out_ != nullptr) {
        render_locked();
    }
}

void ProgressAggregator::render_locked() {
    const auto now = std::chrono::steady_clock::now();
    const auto elapsed =
        std::chrono::duration_cast<std::chrono::milliseconds>(now - started_at_).count();
    const double seconds = static_cast<double>(elapsed) / 1000.0;
    const auto rate =
        seconds > 0 ? static_cast<std::uint64_t>(static_cast<double>(total_bytes_) / seconds) : 0;
    *out_ << "[" << std::fixed << std::setprecision(1) << seconds << "s] "
          << format_bytes(total_bytes_) << '/' << format_bytes(expected_bytes_) << ' '
          << format_bytes(rate) << "/s, files " << files_finished_ << '/' << files_started_
          << " done" << std::endl;
    last_render_ = now;
}

std::string format_bytes(std::uint64_t bytes) {
    static const char *const units[] = {"B", "KiB", "MiB", "GiB", "TiB"};
    double value = static_cast<double>(bytes);
    std::size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < sizeof(units) / sizeof(units[0])) {
        value /= 1024.0;
        ++unit;
    }
    std::ostringstream oss;
    if (unit == 0) {
        oss << bytes << ' ' << units[unit];
    } else {
        oss << std::fixed << std::setprecision(2) << value << ' ' << units[unit];
    }
    return oss.str();
}

} // namespace bolster
