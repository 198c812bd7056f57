#include "bolster/local_file.hpp"

#include "bolster/errors.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <sstream>
#include <system_error>
#include <utility>

namespace bolster {

namespace {

[[noreturn]] void throw_errno(const char *what, const std::filesystem::path &path) {
    std::ostringstream oss;
    oss << what << " '" << path.string() << "': " << std::strerror(errno);
    throw IoError(oss.str());
}

} // namespace

LocalFile LocalFile::open_for_read(const std::filesystem::path &path) {
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        throw_errno("failed to open source file", path);
    }
    return LocalFile(fd, path);
}

LocalFile LocalFile::create_for_write(const std::filesystem::path &path) {
    if (path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            throw IoError("failed to create directory '" + path.parent_path().string() +
                          "': " + ec.message());
        }
    }
    int fd = ::open(path.c_str(), O_CREAT | O_TRUNC | O_RDWR | O_CLOEXEC, 0644);
    if (fd < 0) {
        throw_errno("failed to open destination file", path);
    }
    return LocalFile(fd, path);
}

LocalFile::LocalFile(int fd, std::filesystem::path path) : fd_(fd), path_(std::move(path)) {}

LocalFile::LocalFile(LocalFile &&other) noexcept : fd_(other.fd_), path_(std::move(other.path_)) {
    other.fd_ = -1;
}

LocalFile &LocalFile::operator=(LocalFile &&other) noexcept {
    if (this != &other) {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = other.fd_;
        path_ = std::move(other.path_);
        other.fd_ = -1;
    }
    return *this;
}

LocalFile::~LocalFile() {
    if (fd_ >= 0) {
        ::close(fd_);
    }
}

std::size_t LocalFile::read_at(std::uint64_t offset, char *buffer, std::size_t length) const {
    std::size_t total = 0;
    while (total < length) {
        ssize_t rc = ::pread(fd_, buffer + total, length - total,
                             static_cast<off_t>(offset + total));
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw_errno("read failed on", path_);
        }
        if (rc == 0) {
            break;
        }
        total += static_cast<std::size_t>(rc);
    }
    return total;
}

void LocalFile::write_at(std::uint64_t offset, const char *data, std::size_t length) const {
    std::size_t written = 0;
    while (written < length) {
        ssize_t rc = ::pwrite(fd_, data + written, length - written,
                              static_cast<off_t>(offset + written));
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw_errno("write failed on", path_);
        }
        written += static_cast<std::size_t>(rc);
    }
}

void LocalFile::presize(std::uint64_t size) const {
    if (::ftruncate(fd_, static_cast<off_t>(size)) != 0) {
        throw_errno("failed to resize", path_);
    }
}

std::uint64_t LocalFile::size() const {
    struct stat st;
    if (::fstat(fd_, &st) != 0) {
        throw_errno("failed to stat", path_);
    }
    return static_cast<std::uint64_t>(st.st_size);
}

void LocalFile::close() {
    if (fd_ < 0) {
        return;
    }
    int fd = fd_;
    fd_ = -1;
    if (::close(fd) != 0) {
        throw_errno("failed to close", path_);
    }
}

} // namespace bolster
