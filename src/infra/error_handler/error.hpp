#pragma once

#include <string>
#include <string_view>
#include <system_error>
#include <source_location>
#include <expected>
#include <spdlog/spdlog.h>

namespace rsprog::infra {

enum class ErrorCode {
    // Нарушения протокола вывода rsync (сессия прерывается)
    MalformedLine,      // фрагмент без \r или \n
    ProtocolViolation,  // строка не попала ни в одну категорию
    StatsFormat,        // строка прошла проверку формы, но поля не разобрались
    InvalidPath,
    ConfigError,

    // Локальные (сессия продолжается)
    UnsupportedUnit,    // неизвестная единица скорости

    // Системные
    IoError,
    Interrupted,
    Unknown,
};

struct Error {
    ErrorCode code;
    std::string message;
    std::string file;
    int line;
    std::string function;

    // Конструктор с автоматическим захватом location
    Error(ErrorCode c, std::string_view msg,
          const std::source_location& loc = std::source_location::current())
        : code(c)
        , message(msg)
        , file(loc.file_name())
        , line(static_cast<int>(loc.line()))
        , function(loc.function_name())
    {}

    [[nodiscard]] auto is_fatal() const -> bool;
    [[nodiscard]] auto to_exit_code() const -> int;
    [[nodiscard]] auto what() const -> const char*;
};

template<typename T>
using Result = std::expected<T, Error>;

using VoidResult = Result<void>;

[[nodiscard]] auto make_error(
    ErrorCode code,
    std::string_view message,
    const std::source_location& loc = std::source_location::current()
) -> Error;

// Логирование ошибки и возврат
[[nodiscard]] auto log_and_return(Error&& err) -> Error;

[[nodiscard]] auto to_string(ErrorCode code) -> std::string_view;

const auto RSP_ERR = ::rsprog::infra::make_error;

} // namespace rsprog::infra
