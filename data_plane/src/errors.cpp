#include "bolster/errors.hpp"

#include <sstream>

namespace bolster {

const char *error_kind_name(ErrorKind kind) noexcept {
    switch (kind) {
    case ErrorKind::Io:
        return "IoError";
    case ErrorKind::SizeMismatch:
        return "SizeMismatchError";
    case ErrorKind::Transport:
        return "TransportError";
    case ErrorKind::Commit:
        return "CommitError";
    case ErrorKind::Cancelled:
        return "CancelledError";
    }
    return "TransferError";
}

std::string TransferFailure::describe() const {
    std::ostringstream oss;
    oss << error_kind_name(kind);
    if (status != 0) {
        oss << " (status " << status << ')';
    }
    if (chunk_index) {
        oss << " in chunk " << *chunk_index;
    }
    oss << ": " << message;
    return oss.str();
}

TransferError::TransferError(ErrorKind kind, const std::string &message, int status)
    : std::runtime_error(message), kind_(kind), status_(status) {}

TransferFailure TransferError::failure(std::optional<std::uint32_t> chunk_index) const {
    return TransferFailure{kind_, status_, what(), chunk_index};
}

} // namespace bolster
