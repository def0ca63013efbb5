#include "aggregator.hpp"
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include "../reconciler/reconciler.hpp"
#include "../stats_parser/stats_parser.hpp"

namespace rsprog::core {

namespace {

auto protocol_violation(std::string_view message) -> infra::Error {
    return infra::make_error(infra::ErrorCode::ProtocolViolation, message);
}

} // namespace

auto advance(const std::optional<Snapshot>& previous,
             const ClassifiedLine& line,
             const AggregatorOptions& options)
    -> infra::Result<Snapshot>
{
    Snapshot next{};
    if (previous) {
        next.transferring_path = previous->transferring_path;
        next.last_completed_path = previous->last_completed_path;
        next.last_completed_path_stats = previous->last_completed_path_stats;
        next.total_transferred = previous->total_transferred;
        next.summary = previous->summary;
        next.last_reading = previous->last_reading;
        next.ledger = previous->ledger;
        next.history = previous->history;
    }

    switch (line.kind) {
        case LineKind::Unclassifiable:
            return std::unexpected(protocol_violation(fmt::format(
                "Unexpected line in rsync output: '{}'", trim(line.raw_line))));

        case LineKind::ProgressStats:
        case LineKind::CompletedStats: {
            // Статистика всегда относится к уже объявленному пути
            if (!next.transferring_path) {
                return std::unexpected(protocol_violation(
                    "Have a stats line, but do not know the currently transferring path"));
            }

            const bool completed = line.is_completed_stats();
            auto stats = parse_stats(line.raw_line, completed);
            if (!stats) {
                return std::unexpected(std::move(stats.error()));
            }

            const auto previous_bytes = next.last_reading ? next.last_reading->transferred_bytes : 0;
            const bool previous_completed = next.last_reading && next.last_reading->is_completed_stats;
            next.total_transferred = reconcile(next.total_transferred,
                                               stats->transferred_bytes,
                                               previous_bytes,
                                               previous_completed);
            next.last_reading = *stats;

            if (completed) {
                next.last_completed_path = next.transferring_path;
                next.last_completed_path_stats = *stats;

                // copy-on-write: предыдущие снимки держат старую версию
                auto ledger = next.ledger ? std::make_shared<Ledger>(*next.ledger)
                                          : std::make_shared<Ledger>();
                ledger->insert_or_assign(*next.transferring_path, *stats);
                next.ledger = std::move(ledger);

                spdlog::debug("Completed {} ({} bytes, total {})",
                              next.transferring_path->string(),
                              stats->transferred_bytes, next.total_transferred);
            } else {
                next.in_progress_stats = *std::move(stats);
            }
            break;
        }

        case LineKind::SourceRoot:
        case LineKind::RelativePath:
            if (!line.path) {
                return std::unexpected(protocol_violation(fmt::format(
                    "Path line without a resolved path: '{}'", trim(line.raw_line))));
            }
            next.transferring_path = line.path;
            spdlog::debug("Transferring {}", line.path->string());
            break;

        case LineKind::TransferSummary: {
            auto summary = apply_summary_line(next.summary.value_or(TransferSummary{}), line.raw_line);
            if (!summary) {
                return std::unexpected(std::move(summary.error()));
            }
            next.summary = *std::move(summary);
            break;
        }

        case LineKind::Irrelevant:
            break;
    }

    if (options.include_raw_output) {
        next.history = next.history.append(line.raw_line);
    } else {
        next.history = RawHistory{};
    }

    return next;
}

} // namespace rsprog::core
