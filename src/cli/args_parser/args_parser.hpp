#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <optional>
#include <expected>



namespace rsprog::args_parser {
    struct CLIArgs
{
    std::string source;                       // -s, --source (абсолютный путь корня)
    std::optional<std::string> input;         // -i, --input (по умолчанию stdin)
    std::optional<std::string> report;        // --report=FILE
    bool raw_output{false};                   // --raw-output
    bool print_snapshots{false};              // --print-snapshots
    bool progress{true};                      // --no-progress
    bool quiet{false};                        // -q, --quiet
    std::optional<std::string> log_level;     // --log-level=LEVEL
    std::optional<std::size_t> cache_capacity;// --cache-capacity=N
    bool version{false};                      // --version
};



/// Parses command-line arguments and returns a CLIArgs struct.
/// On --help or a parse error returns the process exit code instead
/// (0 for --help); CLI11 has already printed the message.
std::expected<CLIArgs, int> parse_args(int argc, char const* const* argv);

} // namespace rsprog::args_parser

using __CLI = rsprog::args_parser::CLIArgs;
