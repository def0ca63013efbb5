#include "transfer_stats.hpp"
#include <cmath>
#include <fmt/core.h>

namespace rsprog::core {

auto rate_unit_multiplier(std::string_view unit) -> std::optional<std::uint64_t> {
    if (unit == "B/s") return 1ULL;
    if (unit == "kB/s" || unit == "KB/s") return 1024ULL;
    if (unit == "MB/s") return 1024ULL * 1024;
    if (unit == "GB/s") return 1024ULL * 1024 * 1024;
    if (unit == "TB/s") return 1024ULL * 1024 * 1024 * 1024;
    return std::nullopt;
}

auto TransferStats::transfer_rate_bytes() const -> infra::Result<std::uint64_t> {
    const auto multiplier = rate_unit_multiplier(transfer_rate_unit);
    if (!multiplier) {
        return std::unexpected(infra::make_error(infra::ErrorCode::UnsupportedUnit,
            fmt::format("Unsupported transfer rate unit '{}'", transfer_rate_unit)));
    }

    // std::llround округляет .5 от нуля, для неотрицательных это half-up
    const double bytes = transfer_rate * static_cast<double>(*multiplier);
    return static_cast<std::uint64_t>(std::llround(bytes));
}

} // namespace rsprog::core
