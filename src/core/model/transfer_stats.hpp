#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include "../../infra/error_handler/error.hpp"

namespace rsprog::core {

/// Одно показание прогресса rsync (строка вида
/// "600,417,190 100%  100.56MB/s    0:00:05").
struct TransferStats {
    std::uint64_t transferred_bytes = 0;
    int percent = 0;
    std::string time;                 // H:MM:SS, как печатает rsync
    double transfer_rate = 0.0;
    std::string transfer_rate_unit;   // "MB/s", "kB/s", ...
    bool is_completed_stats = false;

    // Скорость в байтах/сек, округление half-up.
    // UnsupportedUnit, если единица не распознана.
    [[nodiscard]] auto transfer_rate_bytes() const -> infra::Result<std::uint64_t>;

    bool operator==(const TransferStats&) const = default;
};

/// Множитель для единицы скорости rsync (двоичные кратные).
[[nodiscard]] auto rate_unit_multiplier(std::string_view unit) -> std::optional<std::uint64_t>;

} // namespace rsprog::core
