#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>

namespace bolster {

// Owns a POSIX file descriptor. Positioned reads and writes do not move a
// shared offset, so chunk tasks may use one LocalFile concurrently as long as
// their byte ranges are disjoint.
class LocalFile {
  public:
    static LocalFile open_for_read(const std::filesystem::path &path);

    // Opens read-write, creating parent directories and truncating any
    // existing file.
    static LocalFile create_for_write(const std::filesystem::path &path);

    LocalFile(LocalFile &&other) noexcept;
    LocalFile &operator=(LocalFile &&other) noexcept;
    LocalFile(const LocalFile &) = delete;
    LocalFile &operator=(const LocalFile &) = delete;
    ~LocalFile();

    // Returns fewer than `length` bytes only at end of file.
    std::size_t read_at(std::uint64_t offset, char *buffer, std::size_t length) const;

    void write_at(std::uint64_t offset, const char *data, std::size_t length) const;

    void presize(std::uint64_t size) const;

    std::uint64_t size() const;

    void close();

    const std::filesystem::path &path() const noexcept { return path_; }

  private:
    LocalFile(int fd, std::filesystem::path path);

    int fd_;
    std::filesystem::path path_;
};

} // namespace bolster
