#pragma once

#include <optional>
#include "snapshot.hpp"
#include "../line_classifier/line_classifier.hpp"
#include "../../infra/error_handler/error.hpp"

namespace rsprog::core {

struct AggregatorOptions {
    bool include_raw_output = false;
};

/// Следующий снимок из предыдущего и очередной классифицированной строки.
/// Зависит только от аргументов.
///
/// Ошибки:
///  - ProtocolViolation: строка не классифицирована, либо пришла статистика
///    до первой строки с путём;
///  - StatsFormat: статистика прошла проверку формы, но не разобралась.
[[nodiscard]] auto advance(const std::optional<Snapshot>& previous,
                           const ClassifiedLine& line,
                           const AggregatorOptions& options = {})
    -> infra::Result<Snapshot>;

} // namespace rsprog::core
