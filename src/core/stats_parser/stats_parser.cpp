#include "stats_parser.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <iterator>
#include <regex>
#include <string>
#include <vector>
#include <fmt/core.h>

namespace rsprog::core {

namespace {

constexpr std::string_view kWhitespace = " \t\r\n\v\f";

auto split_whitespace(std::string_view s) -> std::vector<std::string_view> {
    std::vector<std::string_view> tokens;
    std::size_t pos = 0;
    while (pos < s.size()) {
        const auto start = s.find_first_not_of(kWhitespace, pos);
        if (start == std::string_view::npos) break;
        auto end = s.find_first_of(kWhitespace, start);
        if (end == std::string_view::npos) end = s.size();
        tokens.push_back(s.substr(start, end - start));
        pos = end;
    }
    return tokens;
}

auto is_digits_and_commas(std::string_view token) -> bool {
    return !token.empty() && std::all_of(token.begin(), token.end(), [](char c) {
        return std::isdigit(static_cast<unsigned char>(c)) || c == ',';
    });
}

auto without_commas(std::string_view token) -> std::string {
    std::string out;
    out.reserve(token.size());
    std::copy_if(token.begin(), token.end(), std::back_inserter(out),
                 [](char c) { return c != ','; });
    return out;
}

auto parse_u64(std::string_view token) -> std::optional<std::uint64_t> {
    const auto digits = without_commas(token);
    std::uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (ec != std::errc{} || ptr != digits.data() + digits.size() || digits.empty()) {
        return std::nullopt;
    }
    return value;
}

auto parse_decimal(std::string_view token) -> std::optional<double> {
    const auto digits = without_commas(token);
    double value = 0.0;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (ec != std::errc{} || ptr != digits.data() + digits.size() || digits.empty()) {
        return std::nullopt;
    }
    return value;
}

auto matches(std::string_view token, const std::regex& re) -> bool {
    return std::regex_match(token.begin(), token.end(), re);
}

const std::regex& time_pattern() {
    static const std::regex re{R"(^\d+:\d\d:\d\d$)"};
    return re;
}

const std::regex& rate_pattern() {
    static const std::regex re{R"(^([\d,]+\.\d+)([^\d]+)$)"};
    return re;
}

const std::regex& sent_pattern() {
    static const std::regex re{
        R"(^sent ([\d,]+) bytes\s+received ([\d,]+) bytes\s+([\d,]+(?:\.\d+)?) bytes/sec$)"};
    return re;
}

const std::regex& total_size_pattern() {
    static const std::regex re{
        R"(^total size is ([\d,]+)\s+speedup is ([\d,]+(?:\.\d+)?)( \(DRY RUN\))?$)"};
    return re;
}

auto stats_error(std::string_view what, std::string_view fragment) -> infra::Error {
    return infra::make_error(infra::ErrorCode::StatsFormat,
        fmt::format("{} in stats line '{}'", what, trim(fragment)));
}

} // namespace

auto trim(std::string_view s) -> std::string_view {
    const auto start = s.find_first_not_of(kWhitespace);
    if (start == std::string_view::npos) return {};
    const auto end = s.find_last_not_of(kWhitespace);
    return s.substr(start, end - start + 1);
}

auto strip_summary_group(std::string_view fragment) -> std::string_view {
    return trim(fragment.substr(0, fragment.find(" (")));
}

auto is_stats_shape(std::string_view fragment) -> bool {
    const auto tokens = split_whitespace(strip_summary_group(fragment));
    if (tokens.size() != 4) return false;
    if (!is_digits_and_commas(tokens[0])) return false;
    if (!tokens[1].ends_with('%')) return false;
    if (!tokens[2].ends_with("/s")) return false;
    if (!matches(tokens[3], time_pattern())) return false;
    return true;
}

auto parse_stats(std::string_view fragment, bool is_completed)
    -> infra::Result<TransferStats>
{
    const auto body = is_completed ? strip_summary_group(fragment) : trim(fragment);
    const auto tokens = split_whitespace(body);
    if (tokens.size() != 4) {
        return std::unexpected(stats_error(
            fmt::format("Expected 4 fields, got {}", tokens.size()), fragment));
    }

    TransferStats stats{};
    stats.is_completed_stats = is_completed;

    // 1. Байты: "600,417,190"
    if (!is_digits_and_commas(tokens[0])) {
        return std::unexpected(stats_error("Bad byte count", fragment));
    }
    const auto bytes = parse_u64(tokens[0]);
    if (!bytes) {
        return std::unexpected(stats_error("Byte count out of range", fragment));
    }
    stats.transferred_bytes = *bytes;

    // 2. Проценты: "11%"
    auto percent_token = tokens[1];
    if (!percent_token.ends_with('%')) {
        return std::unexpected(stats_error("Bad percent", fragment));
    }
    percent_token.remove_suffix(1);
    int percent = -1;
    auto [ptr, ec] = std::from_chars(percent_token.data(),
                                     percent_token.data() + percent_token.size(), percent);
    if (ec != std::errc{} || ptr != percent_token.data() + percent_token.size()
        || percent < 0 || percent > 100) {
        return std::unexpected(stats_error("Bad percent", fragment));
    }
    stats.percent = percent;

    // 3. Скорость: "100.56MB/s" -> 100.56 + "MB/s"
    std::match_results<std::string_view::const_iterator> rate_match;
    if (!std::regex_match(tokens[2].begin(), tokens[2].end(), rate_match, rate_pattern())) {
        return std::unexpected(stats_error("Bad transfer rate", fragment));
    }
    const auto rate = parse_decimal(rate_match[1].str());
    if (!rate) {
        return std::unexpected(stats_error("Bad transfer rate", fragment));
    }
    stats.transfer_rate = *rate;
    stats.transfer_rate_unit = rate_match[2].str();

    // 4. Время: "0:00:05"
    if (!matches(tokens[3], time_pattern())) {
        return std::unexpected(stats_error("Bad elapsed time", fragment));
    }
    stats.time = std::string(tokens[3]);

    return stats;
}

auto is_summary_line(std::string_view fragment) -> bool {
    const auto line = trim(fragment);
    return matches(line, sent_pattern()) || matches(line, total_size_pattern());
}

auto apply_summary_line(TransferSummary summary, std::string_view fragment)
    -> infra::Result<TransferSummary>
{
    const auto line = trim(fragment);
    std::match_results<std::string_view::const_iterator> m;

    auto group = [&m](std::size_t i) { return m[i].str(); };

    if (std::regex_match(line.begin(), line.end(), m, sent_pattern())) {
        summary.sent_bytes = parse_u64(group(1));
        summary.received_bytes = parse_u64(group(2));
        summary.bytes_per_second = parse_decimal(group(3));
        if (!summary.sent_bytes || !summary.received_bytes || !summary.bytes_per_second) {
            return std::unexpected(stats_error("Bad transfer summary", fragment));
        }
        return summary;
    }

    if (std::regex_match(line.begin(), line.end(), m, total_size_pattern())) {
        summary.total_size = parse_u64(group(1));
        summary.speedup = parse_decimal(group(2));
        summary.dry_run = m[3].matched;
        if (!summary.total_size || !summary.speedup) {
            return std::unexpected(stats_error("Bad transfer summary", fragment));
        }
        return summary;
    }

    return std::unexpected(stats_error("Not a transfer summary", fragment));
}

} // namespace rsprog::core
