#include "error.hpp"
#include <cstdlib>
#include <fmt/core.h>

namespace rsprog::infra {

bool Error::is_fatal() const {
    switch (code) {
        case ErrorCode::MalformedLine:
        case ErrorCode::ProtocolViolation:
        case ErrorCode::StatsFormat:
        case ErrorCode::InvalidPath:
        case ErrorCode::ConfigError:
            return true;
        default:
            return false;
    }
}

int Error::to_exit_code() const {
    if (is_fatal()) return EXIT_FAILURE;
    switch (code) {
        case ErrorCode::UnsupportedUnit: return 23;
        case ErrorCode::IoError:         return 24;
        case ErrorCode::Interrupted:     return 130; // SIGINT
        default:                         return EXIT_FAILURE;
    }
}

const char* Error::what() const {
    return message.c_str();
}

Error make_error(ErrorCode code, std::string_view message,
                 const std::source_location& loc) {
    return Error{code, std::string(message), loc};
}

Error log_and_return(Error&& err) {
    auto level = err.is_fatal() ? spdlog::level::err : spdlog::level::warn;
    spdlog::log(level,
        "[{}:{} in {}] {}: {}",
        err.file, err.line, err.function,
        to_string(err.code), err.message
    );
    return std::move(err);
}

std::string_view to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::MalformedLine:     return "MalformedLine";
        case ErrorCode::ProtocolViolation: return "ProtocolViolation";
        case ErrorCode::StatsFormat:       return "StatsFormat";
        case ErrorCode::InvalidPath:       return "InvalidPath";
        case ErrorCode::ConfigError:       return "ConfigError";
        case ErrorCode::UnsupportedUnit:   return "UnsupportedUnit";
        case ErrorCode::IoError:           return "IoError";
        case ErrorCode::Interrupted:       return "Interrupted";
        case ErrorCode::Unknown:           return "Unknown";
    }
    return "Unknown";
}

} // namespace rsprog::infra
