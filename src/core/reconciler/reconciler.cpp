#include "reconciler.hpp"
#include <spdlog/spdlog.h>

namespace rsprog::core {

auto reconcile(std::uint64_t total_so_far,
               std::uint64_t current_reading_bytes,
               std::uint64_t previous_reading_bytes,
               bool previous_reading_was_completed) -> std::uint64_t
{
    if (total_so_far == 0 && previous_reading_bytes == 0) {
        return current_reading_bytes;
    }

    if (previous_reading_was_completed) {
        return total_so_far + current_reading_bytes;
    }

    // previous уже входит в total
    if (previous_reading_bytes > total_so_far) {
        spdlog::warn("Previous reading ({}) exceeds running total ({})",
                     previous_reading_bytes, total_so_far);
        return current_reading_bytes;
    }

    const auto total = total_so_far - previous_reading_bytes + current_reading_bytes;
    if (total < total_so_far) {
        spdlog::warn("Transfer total went backwards: {} -> {}", total_so_far, total);
    }
    return total;
}

} // namespace rsprog::core
