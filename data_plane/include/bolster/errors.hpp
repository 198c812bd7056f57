#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace bolster {

enum class ErrorKind { Io, SizeMismatch, Transport, Commit, Cancelled };

const char *error_kind_name(ErrorKind kind) noexcept;

// Value form of a failure, kept in FileResult after the exception is gone.
struct TransferFailure {
    ErrorKind kind;
    int status;
    std::string message;
    std::optional<std::uint32_t> chunk_index;

    std::string describe() const;
};

class TransferError : public std::runtime_error {
  public:
    TransferError(ErrorKind kind, const std::string &message, int status = 0);

    ErrorKind kind() const noexcept { return kind_; }

    int status() const noexcept { return status_; }

    TransferFailure failure(std::optional<std::uint32_t> chunk_index = std::nullopt) const;

  private:
    ErrorKind kind_;
    int status_;
};

class IoError : public TransferError {
  public:
    explicit IoError(const std::string &message) : TransferError(ErrorKind::Io, message) {}
};

class SizeMismatchError : public TransferError {
  public:
    explicit SizeMismatchError(const std::string &message)
        : TransferError(ErrorKind::SizeMismatch, message) {}
};

class TransportError : public TransferError {
  public:
    TransportError(int status, const std::string &message)
        : TransferError(ErrorKind::Transport, message, status) {}
};

class CommitError : public TransferError {
  public:
    CommitError(int status, const std::string &message)
        : TransferError(ErrorKind::Commit, message, status) {}
};

// Thrown by a chunk call that gave up because its file was cancelled.
class CancelledError : public TransferError {
  public:
    explicit CancelledError(const std::string &message)
        : TransferError(ErrorKind::Cancelled, message) {}
};

} // namespace bolster
