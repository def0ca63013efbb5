#include "report.hpp"
#include <fstream>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

namespace rsprog::extensions {

namespace {

auto stats_node(const core::TransferStats& stats) -> YAML::Node {
    YAML::Node node;
    node["bytes"] = stats.transferred_bytes;
    node["percent"] = stats.percent;
    node["time"] = stats.time;
    node["rate"] = stats.transfer_rate;
    node["rate_unit"] = stats.transfer_rate_unit;
    // Неизвестная единица - просто без rate_bytes
    if (auto rate = stats.transfer_rate_bytes()) {
        node["rate_bytes"] = *rate;
    }
    return node;
}

auto summary_node(const core::TransferSummary& summary) -> YAML::Node {
    YAML::Node node(YAML::NodeType::Map);
    if (summary.sent_bytes) node["sent_bytes"] = *summary.sent_bytes;
    if (summary.received_bytes) node["received_bytes"] = *summary.received_bytes;
    if (summary.bytes_per_second) node["bytes_per_second"] = *summary.bytes_per_second;
    if (summary.total_size) node["total_size"] = *summary.total_size;
    if (summary.speedup) node["speedup"] = *summary.speedup;
    node["dry_run"] = summary.dry_run;
    return node;
}

} // namespace

auto save_report(const std::filesystem::path& source_root,
                 const core::Snapshot& snapshot,
                 std::optional<int> exit_code,
                 const std::filesystem::path& report_file)
    -> infra::VoidResult
{
    YAML::Node node;
    node["source"] = source_root.string();
    node["total_transferred"] = snapshot.total_transferred;
    if (exit_code) node["exit_code"] = *exit_code;

    YAML::Node completed(YAML::NodeType::Sequence);
    for (const auto& [path, stats] : snapshot.completed_paths()) {
        auto entry = stats_node(stats);
        entry["path"] = path.string();
        completed.push_back(entry);
    }
    node["completed"] = completed;

    if (snapshot.summary) {
        node["summary"] = summary_node(*snapshot.summary);
    }
    if (!snapshot.history.empty()) {
        node["raw_output"] = snapshot.raw_output();
    }

    std::ofstream ofs(report_file);
    if (!ofs) {
        return std::unexpected(infra::make_error(infra::ErrorCode::IoError,
            fmt::format("Cannot open report file {}", report_file.string())));
    }
    ofs << node << '\n';
    if (!ofs) {
        return std::unexpected(infra::make_error(infra::ErrorCode::IoError,
            fmt::format("Failed to write report file {}", report_file.string())));
    }

    spdlog::debug("Wrote report with {} completed paths to {}",
                  snapshot.completed_paths().size(), report_file.string());
    return {};
}

} // namespace rsprog::extensions
