#include <iostream>
#include <fstream>
#include <fmt/core.h>

#include "infra/config/config.hpp"
#include "infra/error_handler/error.hpp"
#include "infra/interrupt.hpp"
#include "infra/monitoring/monitoring.hpp"
#include "cli/args_parser/args_parser.hpp"
#include "adapters/stream.hpp"
#include "core/session/transfer_session.hpp"
#include "extensions/report.hpp"
#include <git_info.hpp>
#include <spdlog/spdlog.h>
#include <chrono>

using GIT = rsprog::build_info::GitInfo;
using ARGS = rsprog::args_parser::CLIArgs;

constexpr auto load_from_cli = rsprog::infra::config_from_cli;
constexpr auto load_config_file = rsprog::infra::load_config_from_file;
constexpr auto args_parser = rsprog::args_parser::parse_args;
constexpr auto git =  rsprog::build_info::get_git_info();

static auto
__out_git_verse(const GIT& git)
-> void {
    fmt::print("rsprog {}\n", git.version);
    fmt::print("Git branch: {}\n", git.branch);
    fmt::print("Git commit: {}\n", git.commit);
    fmt::print("Git commit short: {}\n", git.commit_short);
    fmt::print("Git dirty: {}\n", git.dirty ? "yes" : "no");
    fmt::print("Build timestamp (UTC): {}\n", git.timestamp);
}

[[nodiscard]]
static auto
__describe(const rsprog::core::Snapshot& s)
-> std::string {
    std::string progress = "-";
    if (s.in_progress_stats) {
        progress = fmt::format("{}% {} {}{}",
                               s.in_progress_stats->percent,
                               s.in_progress_stats->transferred_bytes,
                               s.in_progress_stats->transfer_rate,
                               s.in_progress_stats->transfer_rate_unit);
    }
    return fmt::format("total={} completed={} progress=[{}] path={} last_completed={}",
                       s.total_transferred,
                       s.completed_paths().size(),
                       progress,
                       s.transferring_path ? s.transferring_path->string() : "-",
                       s.last_completed_path ? s.last_completed_path->string() : "-");
}

static auto
__report_to_monitor(rsprog::infra::ProgressMonitor& monitor, const rsprog::core::Snapshot& s)
-> void {
    monitor.update(s.completed_paths().size(), s.total_transferred);
    if (!s.transferring_path) return;

    int percent = 0;
    std::optional<std::uint64_t> rate;
    if (s.in_progress_stats) {
        percent = s.in_progress_stats->percent;
        // Неизвестная единица скорости - показываем среднюю
        if (auto r = s.in_progress_stats->transfer_rate_bytes()) rate = *r;
    } else if (s.last_completed_path == s.transferring_path) {
        percent = 100;
    }
    monitor.update_file(s.transferring_path->string(), percent, rate);
}

static auto
__write_report(const rsprog::infra::Config& config,
               const rsprog::core::TransferSession& session)
-> void {
    if (!config.report_path || !session.current()) return;
    auto exit_code = session.exit_status()
        ? std::optional<int>(session.exit_status()->code) : std::nullopt;
    auto res = rsprog::extensions::save_report(session.source_root(), *session.current(),
                                               exit_code, *config.report_path);
    if (!res) {
        (void)rsprog::infra::log_and_return(std::move(res.error()));
    }
}

int main(int argc, char** argv)
{
    try {
        spdlog::set_level(spdlog::level::info);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S] [%l] %v");

        rsprog::infra::install_signal_handler();

        auto args_opt = args_parser(argc, argv);
        if (!args_opt) {
            return args_opt.error(); // --help или ошибка разбора
        }
        const auto& args = *args_opt;

        if (args.version) {
            __out_git_verse(git);
            return 0;
        }

        // 1. Загрузить из файла
        auto config_res = load_config_file();
        if (!config_res) {
            spdlog::error("Config error: {}", config_res.error());
            return 1;
        }
        auto config = config_res.value();

        // 2. Переопределить из CLI
        config.merge_with(load_from_cli(args)); // CLI имеет приоритет

        if (config.log_level) {
            auto level = rsprog::infra::parse_log_level(*config.log_level);
            if (!level) {
                return rsprog::infra::log_and_return(std::move(level.error())).to_exit_code();
            }
            spdlog::set_level(*level);
        } else if (config.quiet) {
            spdlog::set_level(spdlog::level::err);
        }

        const std::filesystem::path source_root(args.source);
        if (!source_root.is_absolute()) {
            auto err = rsprog::infra::log_and_return(rsprog::infra::make_error(
                rsprog::infra::ErrorCode::InvalidPath,
                fmt::format("'{}' is not an absolute path", args.source)));
            return err.to_exit_code();
        }

        std::ifstream file_input;
        if (args.input) {
            file_input.open(*args.input, std::ios::binary);
            if (!file_input) {
                spdlog::error("Cannot open input {}", *args.input);
                return 1;
            }
        } else {
            std::ios::sync_with_stdio(false);
        }
        std::istream& input = args.input ? file_input : std::cin;

        spdlog::debug("Parsing rsync output for source {}", source_root.string());

        rsprog::core::SessionOptions options{.include_raw_output = config.include_raw_output};
        if (config.cache_capacity) options.cache_capacity = *config.cache_capacity;
        rsprog::core::TransferSession session(source_root, options);

        auto start_time = std::chrono::steady_clock::now();
        {
            // Снимки в stdout и прогресс-бар друг другу мешают
            rsprog::infra::ProgressMonitor monitor(config.progress && !config.print_snapshots,
                                                   config.quiet);
            rsprog::adapters::stream::FragmentReader reader(input);

            while (auto fragment = reader.next()) {
                if (rsprog::infra::is_interrupted()) {
                    spdlog::warn("Received interrupt signal. Stopping...");
                    __write_report(config, session);
                    return rsprog::infra::make_error(rsprog::infra::ErrorCode::Interrupted,
                                                     "User interrupted").to_exit_code();
                }

                auto update = session.consume(rsprog::core::RunnerItem{std::move(*fragment)});
                if (!update) {
                    auto err = rsprog::infra::log_and_return(std::move(update.error()));
                    __write_report(config, session);
                    return err.to_exit_code();
                }

                const auto& snapshot = std::get<rsprog::core::Snapshot>(*update);
                __report_to_monitor(monitor, snapshot);
                if (config.print_snapshots) {
                    fmt::print("{}\n", __describe(snapshot));
                }
            }

            auto end = session.consume(rsprog::core::ExitStatus{reader.exit_code().value_or(1)});
            if (!end) {
                auto err = rsprog::infra::log_and_return(std::move(end.error()));
                return err.to_exit_code();
            }
        }
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);

        __write_report(config, session);

        const int exit_code = session.exit_status()->code;
        if (!config.quiet && session.current()) {
            const auto& last = *session.current();
            spdlog::info("Lines processed: {}", session.lines_processed());
            spdlog::info("Paths completed: {}", last.completed_paths().size());
            spdlog::info("Bytes transferred: {} ({:.2f} MB)",
                        last.total_transferred,
                        last.total_transferred / 1024.0 / 1024.0);
            spdlog::info("Time elapsed: {:.2f} seconds", duration.count() / 1000.0);
            if (last.summary && last.summary->total_size) {
                spdlog::info("Total size reported by rsync: {}", *last.summary->total_size);
            }
        }

        return exit_code;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
