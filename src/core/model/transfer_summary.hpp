#pragma once

#include <cstdint>
#include <optional>

namespace rsprog::core {

// Итоговые строки в конце вывода rsync:
//   sent 600,565,034 bytes  received 35 bytes  171,600,171.43 bytes/sec
//   total size is 600,417,190  speedup is 1.00
struct TransferSummary {
    std::optional<std::uint64_t> sent_bytes;
    std::optional<std::uint64_t> received_bytes;
    std::optional<double> bytes_per_second;
    std::optional<std::uint64_t> total_size;
    std::optional<double> speedup;
    bool dry_run = false;

    bool operator==(const TransferSummary&) const = default;
};

} // namespace rsprog::core
