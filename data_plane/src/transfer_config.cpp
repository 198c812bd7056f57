#include "bolster/transfer_config.hpp"

#include <cctype>
#include <cstdlib>
#include <limits>
#include <stdexcept>
#include <string>

namespace bolster {

namespace {

void override_from_env(const char *name, std::size_t &value) {
    const char *raw = std::getenv(name);
    if (raw == nullptr || *raw == '\0') {
        return;
    }
    try {
        value = static_cast<std::size_t>(parse_size(raw));
    } catch (const std::invalid_argument &err) {
        throw std::invalid_argument(std::string(name) + ": " + err.what());
    }
}

} // namespace

void TransferConfig::validate() const {
    if (chunk_size_bytes == 0) {
        throw std::invalid_argument("chunk size must be > 0");
    }
    if (chunk_size_bytes > std::numeric_limits<std::uint32_t>::max()) {
        throw std::invalid_argument("chunk size must be below 4 GiB");
    }
    if (max_concurrent_files == 0) {
        throw std::invalid_argument("max concurrent files must be > 0");
    }
    if (max_concurrent_chunks_per_file == 0) {
        throw std::invalid_argument("max concurrent chunks per file must be > 0");
    }
    if (max_object_size_bytes == 0) {
        throw std::invalid_argument("max object size must be > 0");
    }
    // Chunk indices are 32-bit, so the largest object must fit in that many chunks.
    const std::uint64_t max_chunks = max_object_size_bytes / chunk_size_bytes +
                                     ((max_object_size_bytes % chunk_size_bytes) ? 1 : 0);
    if (max_chunks > std::numeric_limits<std::uint32_t>::max()) {
        throw std::invalid_argument("chunk size of " + std::to_string(chunk_size_bytes) +
                                    " bytes is too small for objects of up to " +
                                    std::to_string(max_object_size_bytes) + " bytes");
    }
}

void TransferConfig::apply_environment_overrides() {
    override_from_env("BOLSTER__CHUNK_SIZE_BYTES", chunk_size_bytes);
    override_from_env("BOLSTER__MAX_CONCURRENT_FILES", max_concurrent_files);
    override_from_env("BOLSTER__MAX_CONCURRENT_CHUNKS_PER_FILE", max_concurrent_chunks_per_file);
}

std::uint64_t TransferConfig::memory_ceiling_bytes() const noexcept {
    return static_cast<std::uint64_t>(max_concurrent_files) * max_concurrent_chunks_per_file *
           chunk_size_bytes;
}

std::string TransferConfig::object_key(const std::string &relative_path) const {
    if (key_prefix.empty()) {
        return relative_path;
    }
    if (key_prefix.back() == '/') {
        return key_prefix + relative_path;
    }
    return key_prefix + '/' + relative_path;
}

std::uint64_t parse_size(const std::string &text) {
    std::size_t pos = 0;
    unsigned long long value = 0;
    if (text.empty() || !std::isdigit(static_cast<unsigned char>(text.front()))) {
        throw std::invalid_argument("not a size: '" + text + "'");
    }
    try {
        value = std::stoull(text, &pos);
    } catch (const std::out_of_range &) {
        throw std::invalid_argument("size out of range: '" + text + "'");
    }
    std::uint64_t multiplier = 1;
    if (pos < text.size()) {
        switch (std::toupper(static_cast<unsigned char>(text[pos]))) {
        case 'K':
            multiplier = 1ULL << 10;
            break;
        case 'M':
            multiplier = 1ULL << 20;
            break;
        case 'G':
            multiplier = 1ULL << 30;
            break;
        default:
            throw std::invalid_argument("unknown size suffix in '" + text + "'");
        }
        ++pos;
        if (pos < text.size() && (text[pos] == 'i' || text[pos] == 'B')) {
            ++pos;
        }
        if (pos < text.size() && text[pos] == 'B') {
            ++pos;
        }
    }
    if (pos != text.size()) {
        throw std::invalid_argument("trailing characters in size '" + text + "'");
    }
    if (value == 0) {
        throw std::invalid_argument("size must be > 0: '" + text + "'");
    }
    if (value > std::numeric_limits<std::uint64_t>::max() / multiplier) {
        throw std::invalid_argument("size out of range: '" + text + "'");
    }
    return static_cast<std::uint64_t>(value) * multiplier;
}

} // namespace bolster
