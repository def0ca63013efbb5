#include "transfer_session.hpp"
#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace rsprog::core {

TransferSession::TransferSession(std::filesystem::path source_root,
                                 SessionOptions options)
    : TransferSession(std::move(source_root),
                      std::make_shared<StatsShapeCache>(options.cache_capacity),
                      options)
{}

TransferSession::TransferSession(std::filesystem::path source_root,
                                 std::shared_ptr<StatsShapeCache> cache,
                                 SessionOptions options)
    : classifier_(std::move(source_root), std::move(cache))
    , aggregator_options_{.include_raw_output = options.include_raw_output}
{}

auto TransferSession::feed(std::string_view fragment) -> infra::Result<Snapshot> {
    if (failure_) {
        return std::unexpected(*failure_);
    }
    if (exit_status_) {
        return std::unexpected(fail(infra::make_error(infra::ErrorCode::ProtocolViolation,
            fmt::format("Output after rsync exited with code {}", exit_status_->code))));
    }

    auto line = classifier_.classify(fragment);
    if (!line) {
        return std::unexpected(fail(std::move(line.error())));
    }

    auto next = advance(current_, *line, aggregator_options_);
    if (!next) {
        return std::unexpected(fail(std::move(next.error())));
    }

    ++lines_processed_;
    current_ = *next;
    return next;
}

auto TransferSession::consume(const RunnerItem& item) -> infra::Result<SessionUpdate> {
    if (const auto* status = std::get_if<ExitStatus>(&item)) {
        if (failure_) {
            return std::unexpected(*failure_);
        }
        spdlog::debug("rsync exited with code {} after {} lines", status->code, lines_processed_);
        exit_status_ = *status;
        return SessionUpdate{*status};
    }

    auto snapshot = feed(std::get<std::string>(item));
    if (!snapshot) {
        return std::unexpected(std::move(snapshot.error()));
    }
    return SessionUpdate{*std::move(snapshot)};
}

auto TransferSession::fail(infra::Error error) -> infra::Error {
    spdlog::debug("Session for {} aborted after {} lines: {}",
                  source_root().string(), lines_processed_, error.message);
    failure_ = error;
    return error;
}

} // namespace rsprog::core
