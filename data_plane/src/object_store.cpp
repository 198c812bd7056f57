#include "bolster/object_store.hpp"

#include "bolster/checksum.hpp"
#include "bolster/errors.hpp"

#include <algorithm>
#include <chrono>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace bolster {

namespace fs = std::filesystem;

namespace {

constexpr const char *kStagingDir = ".multipart";
constexpr const char *kTempSuffix = ".bolster-tmp";
constexpr std::size_t kCopyBufferSize = 1 << 20;

bool is_valid_key(const std::string &key) {
    if (key.empty() || key.front() == '/') {
        return false;
    }
    for (const auto &part : fs::path(key)) {
        if (part == "..") {
            return false;
        }
    }
    return fs::path(key).begin()->string() != kStagingDir;
}

// Part ids look like "<index>-<md5 hex>", the index making order checkable.
std::string make_part_id(std::uint32_t index, const std::vector<char> &bytes) {
    return std::to_string(index) + '-' + Checksum::md5_hex(bytes);
}

} // namespace

DirectoryObjectStore::DirectoryObjectStore(fs::path root) : root_(std::move(root)) {
    std::error_code ec;
    fs::create_directories(root_ / kStagingDir, ec);
    if (ec) {
        throw std::invalid_argument("cannot create object store at '" + root_.string() +
                                    "': " + ec.message());
    }
}

fs::path DirectoryObjectStore::object_path(const std::string &key) const {
    if (!is_valid_key(key)) {
        throw TransportError(400, "invalid object key: " + key);
    }
    return root_ / fs::path(key);
}

fs::path DirectoryObjectStore::session_dir(const std::string &session_token) const {
    return root_ / kStagingDir / session_token;
}

void DirectoryObjectStore::write_object(const std::string &key, const std::string &tag,
                                        const std::function<void(const LocalFile &)> &fill) {
    const fs::path destination = object_path(key);
    fs::path temp = destination;
    temp += kTempSuffix + tag;
    try {
        LocalFile file = LocalFile::create_for_write(temp);
        fill(file);
        file.close();
    } catch (const IoError &err) {
        std::error_code ignored;
        fs::remove(temp, ignored);
        throw TransportError(500, err.what());
    }
    std::error_code ec;
    fs::rename(temp, destination, ec);
    if (ec) {
        fs::remove(temp, ec);
        throw TransportError(500, "failed to store object '" + key + "': " + ec.message());
    }
}

std::string DirectoryObjectStore::initiate_multipart_upload(const std::string &key) {
    object_path(key);
    std::string token;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto now = std::chrono::system_clock::now().time_since_epoch();
        std::ostringstream oss;
        oss << std::hex << std::chrono::duration_cast<std::chrono::nanoseconds>(now).count()
            << '-' << next_session_++;
        token = oss.str();
        sessions_.emplace(token, Session{key, {}});
    }
    std::error_code ec;
    fs::create_directories(session_dir(token), ec);
    if (ec) {
        std::lock_guard<std::mutex> lock(mutex_);
        sessions_.erase(token);
        throw TransportError(500, "failed to start multipart upload for '" + key +
                                      "': " + ec.message());
    }
    return token;
}

std::string DirectoryObjectStore::upload_part(const std::string &session_token,
                                              std::uint32_t index,
                                              const std::vector<char> &bytes,
                                              const CancellationToken &cancel) {
    cancel.throw_if_cancelled();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (sessions_.find(session_token) == sessions_.end()) {
            throw TransportError(404, "no such multipart upload: " + session_token);
        }
    }
    try {
        LocalFile part =
            LocalFile::create_for_write(session_dir(session_token) / ("part-" + std::to_string(index)));
        part.write_at(0, bytes.data(), bytes.size());
        part.close();
    } catch (const IoError &err) {
        throw TransportError(500, err.what());
    }
    cancel.throw_if_cancelled();
    std::string part_id = make_part_id(index, bytes);
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_token);
    if (it == sessions_.end()) {
        throw TransportError(404, "multipart upload ended during part upload: " + session_token);
    }
    it->second.part_ids[index] = part_id;
    return part_id;
}

void DirectoryObjectStore::commit_multipart_upload(
    const std::string &session_token, const std::vector<std::string> &ordered_part_ids) {
    Session session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(session_token);
        if (it == sessions_.end()) {
            throw TransportError(404, "no such multipart upload: " + session_token);
        }
        session = it->second;
    }
    if (ordered_part_ids.empty()) {
        throw TransportError(400, "multipart upload needs at least one part");
    }

    std::vector<std::uint32_t> indices;
    indices.reserve(ordered_part_ids.size());
    for (const auto &part_id : ordered_part_ids) {
        const auto dash = part_id.find('-');
        std::uint32_t index = 0;
        try {
            index = static_cast<std::uint32_t>(std::stoul(part_id.substr(0, dash)));
        } catch (const std::exception &) {
            throw TransportError(400, "malformed part id: " + part_id);
        }
        auto staged = session.part_ids.find(index);
        if (staged == session.part_ids.end() || staged->second != part_id) {
            throw TransportError(400, "unknown part id: " + part_id);
        }
        if (!indices.empty() && index <= indices.back()) {
            throw TransportError(400, "part list is not in ascending order at " + part_id);
        }
        indices.push_back(index);
    }

    write_object(session.key, '-' + session_token, [&](const LocalFile &out) {
        std::vector<char> buffer(kCopyBufferSize);
        std::uint64_t out_offset = 0;
        for (std::uint32_t index : indices) {
            LocalFile part = LocalFile::open_for_read(session_dir(session_token) /
                                                      ("part-" + std::to_string(index)));
            std::uint64_t in_offset = 0;
            while (true) {
                const std::size_t read = part.read_at(in_offset, buffer.data(), buffer.size());
                if (read == 0) {
                    break;
                }
                out.write_at(out_offset, buffer.data(), read);
                in_offset += read;
                out_offset += read;
            }
        }
    });

    {
        std::lock_guard<std::mutex> lock(mutex_);
        sessions_.erase(session_token);
    }
    std::error_code ignored;
    fs::remove_all(session_dir(session_token), ignored);
}

void DirectoryObjectStore::put_object(const std::string &key, const std::vector<char> &bytes) {
    std::ostringstream tag;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        tag << "-put-" << next_session_++;
    }
    write_object(key, tag.str(),
                 [&](const LocalFile &out) { out.write_at(0, bytes.data(), bytes.size()); });
}

std::uint64_t DirectoryObjectStore::head_object(const std::string &key) {
    const fs::path path = object_path(key);
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        throw TransportError(404, "no such object: " + key);
    }
    const auto size = fs::file_size(path, ec);
    if (ec) {
        throw TransportError(500, "failed to stat object '" + key + "': " + ec.message());
    }
    return static_cast<std::uint64_t>(size);
}

std::vector<char> DirectoryObjectStore::get_object_range(const std::string &key,
                                                         std::uint64_t offset,
                                                         std::uint32_t length,
                                                         const CancellationToken &cancel) {
    cancel.throw_if_cancelled();
    const fs::path path = object_path(key);
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        throw TransportError(404, "no such object: " + key);
    }
    try {
        LocalFile object = LocalFile::open_for_read(path);
        if (offset > object.size()) {
            throw TransportError(416, "range starts past the end of '" + key + "'");
        }
        std::vector<char> bytes(length);
        bytes.resize(object.read_at(offset, bytes.data(), length));
        return bytes;
    } catch (const IoError &err) {
        throw TransportError(500, err.what());
    }
}

std::vector<ObjectInfo> DirectoryObjectStore::list_objects(const std::string &prefix) const {
    std::vector<ObjectInfo> objects;
    std::error_code ec;
    fs::recursive_directory_iterator it(root_, ec);
    if (ec) {
        throw TransportError(500, "failed to list '" + root_.string() + "': " + ec.message());
    }
    fs::recursive_directory_iterator end;
    for (; it != end; it.increment(ec)) {
        if (ec) {
            throw TransportError(500, "failed to list '" + root_.string() + "': " + ec.message());
        }
        const auto relative = it->path().lexically_relative(root_).generic_string();
        if (it.depth() == 0 && it->path().filename() == kStagingDir) {
            it.disable_recursion_pending();
            continue;
        }
        if (!it->is_regular_file(ec) || relative.find(kTempSuffix) != std::string::npos) {
            continue;
        }
        if (relative.compare(0, prefix.size(), prefix) != 0) {
            continue;
        }
        const auto size = it->file_size(ec);
        if (ec) {
            throw TransportError(500, "failed to stat '" + relative + "': " + ec.message());
        }
        objects.push_back(ObjectInfo{relative, static_cast<std::uint64_t>(size)});
    }
    std::sort(objects.begin(), objects.end(),
              [](const ObjectInfo &a, const ObjectInfo &b) { return a.key < b.key; });
    return objects;
}

} // namespace bolster
