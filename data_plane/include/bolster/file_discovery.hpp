#pragma once

#include "bolster/transfer_types.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace bolster {

bool is_valid_utf8(const std::string &text) noexcept;

// Expands relative paths (files or directories, resolved against `base`) into
// upload items. Directories are walked recursively; symlinks and other
// non-regular entries are skipped. Throws std::invalid_argument for absolute
// paths, paths escaping `base`, non-UTF-8 names, missing paths and files
// larger than `max_object_size`. The result is sorted by path.
std::vector<TransferItem> discover_upload_items(const std::vector<std::filesystem::path> &paths,
                                                std::uint64_t max_object_size,
                                                const std::filesystem::path &base = ".");

} // namespace bolster
