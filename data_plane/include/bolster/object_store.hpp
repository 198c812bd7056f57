#pragma once

#include "bolster/cancellation.hpp"
#include "bolster/local_file.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace bolster {

// Remote object storage as seen by the transfer engine. Implementations
// report every failure by throwing TransportError and must be safe to call
// from many threads at once. Chunk calls get the file's cancellation token;
// an implementation that blocks must watch it and throw CancelledError once
// it is cancelled instead of finishing the call.
class ObjectStore {
  public:
    virtual ~ObjectStore() = default;

    virtual std::string initiate_multipart_upload(const std::string &key) = 0;

    // Re-uploading the same index replaces the earlier part.
    virtual std::string upload_part(const std::string &session_token, std::uint32_t index,
                                    const std::vector<char> &bytes,
                                    const CancellationToken &cancel) = 0;

    virtual void commit_multipart_upload(const std::string &session_token,
                                         const std::vector<std::string> &ordered_part_ids) = 0;

    virtual void put_object(const std::string &key, const std::vector<char> &bytes) = 0;

    virtual std::uint64_t head_object(const std::string &key) = 0;

    virtual std::vector<char> get_object_range(const std::string &key, std::uint64_t offset,
                                               std::uint32_t length,
                                               const CancellationToken &cancel) = 0;
};

struct ObjectInfo {
    std::string key;
    std::uint64_t size_bytes;
};

// Object store backed by a local directory: `root/<key>` holds each object and
// `root/.multipart/<token>/part-<index>` holds staged parts until commit.
class DirectoryObjectStore : public ObjectStore {
  public:
    explicit DirectoryObjectStore(std::filesystem::path root);

    std::string initiate_multipart_upload(const std::string &key) override;

    std::string upload_part(const std::string &session_token, std::uint32_t index,
                            const std::vector<char> &bytes,
                            const CancellationToken &cancel) override;

    void commit_multipart_upload(const std::string &session_token,
                                 const std::vector<std::string> &ordered_part_ids) override;

    void put_object(const std::string &key, const std::vector<char> &bytes) override;

    std::uint64_t head_object(const std::string &key) override;

    std::vector<char> get_object_range(const std::string &key, std::uint64_t offset,
                                       std::uint32_t length,
                                       const CancellationToken &cancel) override;

    // Keys under `prefix`, sorted. Staging data is never listed.
    std::vector<ObjectInfo> list_objects(const std::string &prefix) const;

    const std::filesystem::path &root() const noexcept { return root_; }

  private:
    struct Session {
        std::string key;
        std::map<std::uint32_t, std::string> part_ids;
    };

    std::filesystem::path object_path(const std::string &key) const;
    std::filesystem::path session_dir(const std::string &session_token) const;
    void write_object(const std::string &key, const std::string &tag,
                      const std::function<void(const LocalFile &)> &fill);

    std::filesystem::path root_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Session> sessions_;
    std::uint64_t next_session_{0};
};

} // namespace bolster
