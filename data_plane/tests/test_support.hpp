#pragma once

#include "bolster/cancellation.hpp"
#include "bolster/errors.hpp"
#include "bolster/object_store.hpp"
#include "bolster/progress.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <unistd.h>

namespace bolster_test {

namespace fs = std::filesystem;

class TempDir {
  public:
    explicit TempDir(const std::string &name) {
        static std::atomic<int> counter{0};
        path_ = fs::temp_directory_path() /
                ("bolster_" + name + "_" + std::to_string(::getpid()) + "_" +
                 std::to_string(counter++));
        fs::remove_all(path_);
        fs::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ignored;
        fs::remove_all(path_, ignored);
    }

    const fs::path &path() const { return path_; }

  private:
    fs::path path_;
};

inline std::vector<char> pattern(std::size_t size, unsigned seed = 1) {
    std::vector<char> data(size);
    std::uint32_t state = seed * 2654435761u + 12345u;
    for (auto &byte : data) {
        state = state * 1103515245u + 12345u;
        byte = static_cast<char>(state >> 16);
    }
    return data;
}

inline void write_file(const fs::path &path, const std::vector<char> &data) {
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path());
    }
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    file.write(data.data(), static_cast<std::streamsize>(data.size()));
}

inline std::vector<char> read_file(const fs::path &path) {
    std::ifstream file(path, std::ios::binary);
    return std::vector<char>(std::istreambuf_iterator<char>(file),
                             std::istreambuf_iterator<char>());
}

// In-memory object store that can delay or fail individual chunk calls and
// records concurrency, call counts and completion order.
class ScriptedStore : public bolster::ObjectStore {
  public:
    // Chunk size used to turn a range offset back into a chunk index.
    explicit ScriptedStore(std::uint32_t chunk_size) : chunk_size_(chunk_size) {}

    void set_delay(std::uint32_t index, std::chrono::milliseconds delay) {
        std::lock_guard<std::mutex> lock(mutex_);
        delays_[index] = delay;
    }

    void set_default_delay(std::chrono::milliseconds delay) {
        std::lock_guard<std::mutex> lock(mutex_);
        default_delay_ = delay;
    }

    void fail_chunk(const std::string &key, std::uint32_t index, int status) {
        std::lock_guard<std::mutex> lock(mutex_);
        failures_[{key, index}] = status;
    }

    void fail_commit(int status) {
        std::lock_guard<std::mutex> lock(mutex_);
        commit_failure_ = status;
    }

    void seed_object(const std::string &key, std::vector<char> bytes) {
        std::lock_guard<std::mutex> lock(mutex_);
        objects_[key] = std::move(bytes);
    }

    std::string initiate_multipart_upload(const std::string &key) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++initiate_calls_;
        const std::string token = "session-" + std::to_string(sessions_.size());
        sessions_[token] = key;
        return token;
    }

    std::string upload_part(const std::string &session_token, std::uint32_t index,
                            const std::vector<char> &bytes,
                            const bolster::CancellationToken &cancel) override {
        const std::string key = session_key(session_token);
        Flight flight(*this, key);
        pause(index, &cancel);
        std::lock_guard<std::mutex> lock(mutex_);
        ++calls_[{key, index}];
        auto failure = failures_.find({key, index});
        if (failure != failures_.end()) {
            throw bolster::TransportError(failure->second,
                                          "injected failure for chunk " + std::to_string(index));
        }
        parts_[session_token][index] = bytes;
        completion_order_[key].push_back(index);
        return "etag-" + std::to_string(index);
    }

    void commit_multipart_upload(const std::string &session_token,
                                 const std::vector<std::string> &ordered_part_ids) override {
        const std::string key = session_key(session_token);
        std::lock_guard<std::mutex> lock(mutex_);
        committed_[key] = ordered_part_ids;
        if (commit_failure_ != 0) {
            throw bolster::TransportError(commit_failure_, "commit rejected");
        }
        std::vector<char> object;
        for (const auto &part_id : ordered_part_ids) {
            const auto index = static_cast<std::uint32_t>(std::stoul(part_id.substr(5)));
            const auto &part = parts_[session_token][index];
            object.insert(object.end(), part.begin(), part.end());
        }
        objects_[key] = std::move(object);
    }

    void put_object(const std::string &key, const std::vector<char> &bytes) override {
        Flight flight(*this, key);
        pause(0, nullptr);
        std::lock_guard<std::mutex> lock(mutex_);
        ++put_calls_;
        ++calls_[{key, 0}];
        auto failure = failures_.find({key, 0});
        if (failure != failures_.end()) {
            throw bolster::TransportError(failure->second, "injected failure for put");
        }
        objects_[key] = bytes;
    }

    std::uint64_t head_object(const std::string &key) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++head_calls_;
        auto it = objects_.find(key);
        if (it == objects_.end()) {
            throw bolster::TransportError(404, "no such object: " + key);
        }
        return it->second.size();
    }

    std::vector<char> get_object_range(const std::string &key, std::uint64_t offset,
                                       std::uint32_t length,
                                       const bolster::CancellationToken &cancel) override {
        const auto index = static_cast<std::uint32_t>(offset / chunk_size_);
        Flight flight(*this, key);
        pause(index, &cancel);
        std::lock_guard<std::mutex> lock(mutex_);
        ++range_calls_;
        ++calls_[{key, index}];
        auto failure = failures_.find({key, index});
        if (failure != failures_.end()) {
            throw bolster::TransportError(failure->second,
                                          "injected failure for chunk " + std::to_string(index));
        }
        const auto &object = objects_.at(key);
        const auto begin = std::min<std::uint64_t>(offset, object.size());
        const auto end = std::min<std::uint64_t>(offset + length, object.size());
        completion_order_[key].push_back(index);
        return std::vector<char>(object.begin() + static_cast<std::ptrdiff_t>(begin),
                                 object.begin() + static_cast<std::ptrdiff_t>(end));
    }

    std::size_t peak_in_flight() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return peak_in_flight_;
    }

    std::size_t peak_in_flight(const std::string &key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = peak_per_key_.find(key);
        return it == peak_per_key_.end() ? 0 : it->second;
    }

    std::size_t calls(const std::string &key, std::uint32_t index) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = calls_.find({key, index});
        return it == calls_.end() ? 0 : it->second;
    }

    std::vector<std::uint32_t> completion_order(const std::string &key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = completion_order_.find(key);
        return it == completion_order_.end() ? std::vector<std::uint32_t>() : it->second;
    }

    std::vector<std::string> committed(const std::string &key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = committed_.find(key);
        return it == committed_.end() ? std::vector<std::string>() : it->second;
    }

    bool has_object(const std::string &key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return objects_.count(key) != 0;
    }

    std::vector<char> object(const std::string &key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return objects_.at(key);
    }

    std::size_t initiate_calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return initiate_calls_;
    }

    std::size_t put_calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return put_calls_;
    }

    std::size_t range_calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return range_calls_;
    }

    std::size_t head_calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return head_calls_;
    }

    std::size_t abandoned_calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return abandoned_calls_;
    }

  private:
    class Flight {
      public:
        Flight(ScriptedStore &store, std::string key) : store_(store), key_(std::move(key)) {
            std::lock_guard<std::mutex> lock(store_.mutex_);
            ++store_.in_flight_;
            store_.peak_in_flight_ = std::max(store_.peak_in_flight_, store_.in_flight_);
            auto &count = store_.in_flight_per_key_[key_];
            ++count;
            auto &peak = store_.peak_per_key_[key_];
            peak = std::max(peak, count);
        }

        ~Flight() {
            std::lock_guard<std::mutex> lock(store_.mutex_);
            --store_.in_flight_;
            --store_.in_flight_per_key_[key_];
        }

      private:
        ScriptedStore &store_;
        std::string key_;
    };

    std::string session_key(const std::string &session_token) {
        std::lock_guard<std::mutex> lock(mutex_);
        return sessions_.at(session_token);
    }

    // Sleeps for the scripted delay. A chunk call gives up as soon as its
    // file is cancelled, the way a real store aborts its request.
    void pause(std::uint32_t index, const bolster::CancellationToken *cancel) {
        std::chrono::milliseconds delay;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = delays_.find(index);
            delay = it == delays_.end() ? default_delay_ : it->second;
        }
        if (cancel == nullptr) {
            std::this_thread::sleep_for(delay);
            return;
        }
        if (cancel->wait_for(delay)) {
            std::lock_guard<std::mutex> lock(mutex_);
            ++abandoned_calls_;
            throw bolster::CancelledError("scripted call abandoned");
        }
    }

    std::uint32_t chunk_size_;
    mutable std::mutex mutex_;
    std::map<std::uint32_t, std::chrono::milliseconds> delays_;
    std::chrono::milliseconds default_delay_{0};
    std::map<std::pair<std::string, std::uint32_t>, int> failures_;
    int commit_failure_{0};

    std::map<std::string, std::string> sessions_;
    std::map<std::string, std::map<std::uint32_t, std::vector<char>>> parts_;
    std::map<std::string, std::vector<char>> objects_;
    std::map<std::string, std::vector<std::string>> committed_;
    std::map<std::string, std::vector<std::uint32_t>> completion_order_;
    std::map<std::pair<std::string, std::uint32_t>, std::size_t> calls_;

    std::size_t in_flight_{0};
    std::size_t peak_in_flight_{0};
    std::map<std::string, std::size_t> in_flight_per_key_;
    std::map<std::string, std::size_t> peak_per_key_;
    std::size_t initiate_calls_{0};
    std::size_t put_calls_{0};
    std::size_t range_calls_{0};
    std::size_t head_calls_{0};
    std::size_t abandoned_calls_{0};
};

// Records byte events and the start/finish order of files.
class RecordingSink : public bolster::ProgressSink {
  public:
    void on_file_started(std::size_t item_id, const bolster::TransferItem &) override {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back("start:" + std::to_string(item_id));
        ++active_;
        peak_active_ = std::max(peak_active_, active_);
    }

    void on_bytes(std::size_t item_id, std::uint64_t bytes) override {
        std::lock_guard<std::mutex> lock(mutex_);
        bytes_[item_id] += bytes;
        ++byte_events_;
    }

    void on_file_finished(std::size_t item_id, const bolster::FileResult &) override {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back("finish:" + std::to_string(item_id));
        --active_;
    }

    std::vector<std::string> events() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_;
    }

    std::uint64_t bytes(std::size_t item_id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = bytes_.find(item_id);
        return it == bytes_.end() ? 0 : it->second;
    }

    std::size_t byte_events() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return byte_events_;
    }

    std::size_t peak_active() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return peak_active_;
    }

  private:
    mutable std::mutex mutex_;
    std::vector<std::string> events_;
    std::map<std::size_t, std::uint64_t> bytes_;
    std::size_t byte_events_{0};
    std::size_t active_{0};
    std::size_t peak_active_{0};
};

} // namespace bolster_test
