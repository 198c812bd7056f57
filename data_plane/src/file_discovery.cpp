#include "bolster/file_discovery.hpp"

#include <map>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace bolster {

namespace fs = std::filesystem;

bool is_valid_utf8(const std::string &text) noexcept {
    std::size_t i = 0;
    while (i < text.size()) {
        const auto lead = static_cast<unsigned char>(text[i]);
        std::size_t extra = 0;
        std::uint32_t code_point = 0;
        if (lead < 0x80) {
            ++i;
            continue;
        } else if ((lead & 0xE0) == 0xC0) {
            extra = 1;
            code_point = lead & 0x1F;
        } else if ((lead & 0xF0) == 0xE0) {
            extra = 2;
            code_point = lead & 0x0F;
        } else if ((lead & 0xF8) == 0xF0) {
            extra = 3;
            code_point = lead & 0x07;
        } else {
            return false;
        }
        if (i + extra >= text.size()) {
            return false;
        }
        for (std::size_t k = 1; k <= extra; ++k) {
            const auto next = static_cast<unsigned char>(text[i + k]);
            if ((next & 0xC0) != 0x80) {
                return false;
            }
            code_point = (code_point << 6) | (next & 0x3F);
        }
        // Overlong forms, surrogates and values past U+10FFFF.
        static const std::uint32_t minimum[] = {0, 0x80, 0x800, 0x10000};
        if (code_point < minimum[extra] || code_point > 0x10FFFF ||
            (code_point >= 0xD800 && code_point <= 0xDFFF)) {
            return false;
        }
        i += extra + 1;
    }
    return true;
}

namespace {

void add_file(std::map<std::string, TransferItem> &items, const fs::path &file,
              const fs::path &base, std::uint64_t max_object_size) {
    const std::string relative = file.lexically_relative(base).generic_string();
    if (!is_valid_utf8(relative)) {
        throw std::invalid_argument("All file/folder names must be valid UTF-8: " + relative);
    }
    std::error_code ec;
    const auto size = fs::file_size(file, ec);
    if (ec) {
        throw std::invalid_argument("cannot read size of '" + relative + "': " + ec.message());
    }
    if (size > max_object_size) {
        throw std::invalid_argument("'" + relative + "' exceeds the maximum object size of " +
                                    std::to_string(max_object_size) + " bytes");
    }
    items[relative] = TransferItem{relative, static_cast<std::uint64_t>(size), Direction::Upload};
}

} // namespace

std::vector<TransferItem> discover_upload_items(const std::vector<fs::path> &paths,
                                                std::uint64_t max_object_size,
                                                const fs::path &base) {
    std::map<std::string, TransferItem> items;
    for (const auto &raw : paths) {
        if (raw.is_absolute()) {
            throw std::invalid_argument("File/folder paths must be relative: " + raw.string());
        }
        const fs::path normal = raw.lexically_normal();
        if (normal.empty() || *normal.begin() == "..") {
            throw std::invalid_argument("File/folder paths must not leave the current directory: " +
                                        raw.string());
        }
        const fs::path full = base / normal;
        std::error_code ec;
        const auto status = fs::symlink_status(full, ec);
        if (ec || !fs::exists(status)) {
            throw std::invalid_argument("path does not exist: " + raw.string());
        }
        if (fs::is_regular_file(status)) {
            add_file(items, full, base, max_object_size);
            continue;
        }
        if (!fs::is_directory(status)) {
            continue;
        }
        for (fs::recursive_directory_iterator it(full, ec), end; it != end; it.increment(ec)) {
            if (ec) {
                break;
            }
            if (it->is_regular_file(ec) && !it->is_symlink(ec)) {
                add_file(items, it->path(), base, max_object_size);
            }
        }
        if (ec) {
            throw std::invalid_argument("cannot walk '" + raw.string() + "': " + ec.message());
        }
    }

    std::vector<TransferItem> result;
    result.reserve(items.size());
    for (auto &entry : items) {
        result.push_back(std::move(entry.second));
    }
    return result;
}

} // namespace bolster
