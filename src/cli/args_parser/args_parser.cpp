#include "args_parser.hpp"
#include <cstdlib>
#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>

namespace rsprog::args_parser {

std::expected<CLIArgs, int> parse_args(int argc, char const* const* argv)
{
    CLIArgs args{};
    CLI::App app{"rsprog - structured progress from `rsync --archive --progress` output"};

    std::string input;
    std::string report;
    std::string log_level;
    std::size_t cache_capacity = 0;
    bool no_progress = false;

    app.add_option("-s,--source", args.source,
                   "Absolute path of the transfer source root");
    app.add_option("-i,--input", input,
                   "Read rsync output from FILE instead of stdin")
        ->check(CLI::ExistingFile);
    app.add_option("--report", report,
                   "Write the completed-path ledger as YAML to FILE");
    app.add_flag("--raw-output", args.raw_output,
                 "Keep raw rsync output in every snapshot");
    app.add_flag("--print-snapshots", args.print_snapshots,
                 "Print one line per snapshot to stdout");
    app.add_flag("--no-progress", no_progress, "Disable the progress bar");
    app.add_flag("-q,--quiet", args.quiet, "Only report errors");
    app.add_option("--log-level", log_level,
                   "trace, debug, info, warn, err, critical, off");
    app.add_option("--cache-capacity", cache_capacity,
                   "Entries kept in the stats line cache")
        ->check(CLI::PositiveNumber);
    app.add_flag("--version", args.version, "Print build information and exit");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return std::unexpected(app.exit(e));
    }

    if (!args.version && args.source.empty()) {
        spdlog::error("--source is required");
        return std::unexpected(EXIT_FAILURE);
    }

    args.progress = !no_progress;
    if (!input.empty()) args.input = input;
    if (!report.empty()) args.report = report;
    if (!log_level.empty()) args.log_level = log_level;
    if (cache_capacity > 0) args.cache_capacity = cache_capacity;

    return args;
}

} // namespace rsprog::args_parser
