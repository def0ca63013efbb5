#pragma once

#include <string_view>
#include "../model/transfer_stats.hpp"
#include "../model/transfer_summary.hpp"
#include "../../infra/error_handler/error.hpp"

namespace rsprog::core {

/// Отбрасывает хвостовую группу " (xfr#1, to-chk=0/2)" и пробелы по краям.
/// Строку без группы возвращает просто обрезанной.
[[nodiscard]] auto strip_summary_group(std::string_view fragment) -> std::string_view;

/// Проверка формы строки статистики: ровно четыре токена
/// <байты> <проценты%> <скорость/s> <H:MM:SS> после отбрасывания группы.
/// Подходит и для промежуточных, и для завершающих строк.
[[nodiscard]] auto is_stats_shape(std::string_view fragment) -> bool;

/// Разбирает строку, уже прошедшую is_stats_shape().
/// StatsFormat, если какой-то токен не разобрался.
[[nodiscard]] auto parse_stats(std::string_view fragment, bool is_completed)
    -> infra::Result<TransferStats>;

[[nodiscard]] auto is_summary_line(std::string_view fragment) -> bool;

/// Дополняет summary данными из строки "sent ..." или "total size is ...".
[[nodiscard]] auto apply_summary_line(TransferSummary summary, std::string_view fragment)
    -> infra::Result<TransferSummary>;

[[nodiscard]] auto trim(std::string_view s) -> std::string_view;

} // namespace rsprog::core
