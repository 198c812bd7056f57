#include "bolster/transfer_types.hpp"

#include <algorithm>

namespace bolster {

std::size_t BatchResult::failed_count() const noexcept {
    return static_cast<std::size_t>(
        std::count_if(results.begin(), results.end(),
                      [](const FileResult &result) { return !result.succeeded(); }));
}

} // namespace bolster
