#include "line_classifier.hpp"
#include <algorithm>
#include <cctype>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include "../stats_parser/stats_parser.hpp"

namespace rsprog::core {

namespace {

constexpr std::string_view kFileListMarker = "sending incremental file list";

auto iequals(std::string_view a, std::string_view b) -> bool {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

// "/home/the_source/" -> "the_source"
auto root_name_of(const std::filesystem::path& root) -> std::string {
    auto s = root.string();
    while (s.size() > 1 && s.back() == '/') s.pop_back();
    return std::filesystem::path(s).filename().string();
}

auto count_groups(std::string_view fragment) -> std::size_t {
    std::size_t n = 0;
    for (auto pos = fragment.find(" ("); pos != std::string_view::npos;
         pos = fragment.find(" (", pos + 2)) {
        ++n;
    }
    return n;
}

} // namespace

auto to_string(LineKind kind) -> std::string_view {
    switch (kind) {
        case LineKind::Irrelevant:      return "irrelevant";
        case LineKind::CompletedStats:  return "completed-stats";
        case LineKind::ProgressStats:   return "progress-stats";
        case LineKind::SourceRoot:      return "source-root";
        case LineKind::TransferSummary: return "transfer-summary";
        case LineKind::RelativePath:    return "relative-path";
        case LineKind::Unclassifiable:  return "unclassifiable";
    }
    return "unclassifiable";
}

// =============== StatsShapeCache ===============

StatsShapeCache::StatsShapeCache(std::size_t capacity)
    : capacity_(std::max<std::size_t>(capacity, 1)) {}

auto StatsShapeCache::test(std::string_view fragment) -> bool {
    std::string key(fragment);
    if (auto it = entries_.find(key); it != entries_.end()) {
        ++hits_;
        return it->second;
    }

    if (entries_.size() >= capacity_) {
        spdlog::debug("Stats shape cache reached {} entries, resetting", capacity_);
        entries_.clear();
    }

    const bool result = is_stats_shape(fragment);
    entries_.emplace(std::move(key), result);
    return result;
}

// =============== LineClassifier ===============

LineClassifier::LineClassifier(std::filesystem::path source_root,
                               std::shared_ptr<StatsShapeCache> cache)
    : source_root_(std::move(source_root))
    , root_name_(root_name_of(source_root_))
    , cache_(cache ? std::move(cache) : std::make_shared<StatsShapeCache>())
{}

auto LineClassifier::classify(std::string_view fragment) const -> infra::Result<ClassifiedLine> {
    if (fragment.empty() || (fragment.back() != '\n' && fragment.back() != '\r')) {
        return std::unexpected(infra::make_error(infra::ErrorCode::MalformedLine,
            fmt::format("Fragment must include its line ending: '{}'", fragment)));
    }

    ClassifiedLine line{.raw_line = std::string(fragment)};
    const auto text = trim(fragment);
    const bool newline = fragment.back() == '\n';

    // Порядок проверок важен: путь проверяется только после статистики и корня
    if (text.empty() || iequals(text, kFileListMarker)) {
        line.kind = LineKind::Irrelevant;
    } else if (is_completed_stats_line(fragment)) {
        line.kind = LineKind::CompletedStats;
    } else if (is_progress_stats_line(fragment)) {
        line.kind = LineKind::ProgressStats;
    } else if (is_source_root_line(fragment)) {
        line.kind = LineKind::SourceRoot;
        line.path = source_root_;
    } else if (newline && is_summary_line(fragment)) {
        line.kind = LineKind::TransferSummary;
    } else if (newline && is_relative_path_line(text) && !cache_->test(fragment)) {
        line.kind = LineKind::RelativePath;
        line.path = resolve(text);
    } else {
        line.kind = LineKind::Unclassifiable;
    }

    spdlog::trace("{}: '{}'", to_string(line.kind), text);
    return line;
}

auto LineClassifier::resolve(std::string_view line) const -> std::filesystem::path {
    const std::filesystem::path reported{std::string(trim(line))};

    std::filesystem::path relative;
    bool first = true;
    for (const auto& part : reported) {
        if (first) {
            first = false;
            continue;
        }
        if (!part.empty()) relative /= part;
    }

    return relative.empty() ? source_root_ : source_root_ / relative;
}

auto LineClassifier::is_completed_stats_line(std::string_view fragment) const -> bool {
    if (fragment.back() != '\n') return false;
    if (fragment.find("xfr#") == std::string_view::npos) return false;
    if (fragment.find("ir-chk=") == std::string_view::npos &&
        fragment.find("to-chk=") == std::string_view::npos) {
        return false;
    }
    if (!cache_->test(fragment)) return false;
    return count_groups(fragment) == 1;
}

auto LineClassifier::is_progress_stats_line(std::string_view fragment) const -> bool {
    return fragment.back() == '\r' &&
           fragment.find(" (") == std::string_view::npos &&
           cache_->test(fragment);
}

// rsync всегда печатает путь с разделителем: "/dir/file" или "<корень>/dir/file"
auto LineClassifier::is_relative_path_line(std::string_view text) const -> bool {
    if (text.starts_with('/')) return true;
    return !root_name_.empty() &&
           text.size() > root_name_.size() &&
           text.starts_with(root_name_) &&
           text[root_name_.size()] == '/';
}

auto LineClassifier::is_source_root_line(std::string_view fragment) const -> bool {
    if (fragment.back() != '\n' || root_name_.empty()) return false;
    auto text = trim(fragment);
    while (text.size() > 1 && text.back() == '/') text.remove_suffix(1);
    return text == root_name_;
}

} // namespace rsprog::core
