#pragma once

#include <cstdint>

namespace rsprog::core {

/// Пересчёт суммарного числа переданных байт по очередному показанию.
///
/// rsync печатает байты по каждому файлу, а не нарастающим итогом:
///  - первое показание сессии (total == 0 и previous == 0) - total = current;
///  - предыдущее показание было завершающим - начался новый файл, total + current;
///  - иначе это тот же файл, новое показание заменяет старое:
///    total - previous + current.
[[nodiscard]] auto reconcile(std::uint64_t total_so_far,
                             std::uint64_t current_reading_bytes,
                             std::uint64_t previous_reading_bytes = 0,
                             bool previous_reading_was_completed = false) -> std::uint64_t;

} // namespace rsprog::core
