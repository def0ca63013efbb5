#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include "../../infra/error_handler/error.hpp"

namespace rsprog::core {

enum class LineKind {
    Irrelevant,       // пустая строка или "sending incremental file list"
    CompletedStats,   // "... 0:00:05 (xfr#1, to-chk=0/2)\n"
    ProgressStats,    // "... 0:00:05\r"
    SourceRoot,       // имя корня источника, "the_source/\n"
    TransferSummary,  // "sent ... bytes  received ..." / "total size is ..."
    RelativePath,     // путь относительно корня
    Unclassifiable,
};

[[nodiscard]] auto to_string(LineKind kind) -> std::string_view;

/// Кэш результатов проверки формы строки статистики.
/// Ключ - точный текст фрагмента. Не синхронизирован.
class StatsShapeCache {
public:
    static constexpr std::size_t kDefaultCapacity = 4096;

    explicit StatsShapeCache(std::size_t capacity = kDefaultCapacity);

    // is_stats_shape() с мемоизацией
    [[nodiscard]] auto test(std::string_view fragment) -> bool;

    [[nodiscard]] auto size() const -> std::size_t { return entries_.size(); }
    [[nodiscard]] auto capacity() const -> std::size_t { return capacity_; }
    [[nodiscard]] auto hits() const -> std::size_t { return hits_; }

private:
    std::unordered_map<std::string, bool> entries_;
    std::size_t capacity_;
    std::size_t hits_ = 0;
};

struct ClassifiedLine {
    std::string raw_line;                       // вместе с \r или \n
    LineKind kind = LineKind::Unclassifiable;
    std::optional<std::filesystem::path> path;  // абсолютный путь для RelativePath и SourceRoot

    [[nodiscard]] auto is_irrelevant() const -> bool { return kind == LineKind::Irrelevant; }
    [[nodiscard]] auto is_completed_stats() const -> bool { return kind == LineKind::CompletedStats; }
    [[nodiscard]] auto is_progress_stats() const -> bool { return kind == LineKind::ProgressStats; }
    [[nodiscard]] auto is_stats() const -> bool { return is_completed_stats() || is_progress_stats(); }
    [[nodiscard]] auto is_source_root() const -> bool { return kind == LineKind::SourceRoot; }
    [[nodiscard]] auto is_summary() const -> bool { return kind == LineKind::TransferSummary; }
    [[nodiscard]] auto is_path() const -> bool { return kind == LineKind::RelativePath; }
    [[nodiscard]] auto is_unclassifiable() const -> bool { return kind == LineKind::Unclassifiable; }
};

class LineClassifier {
public:
    explicit LineClassifier(std::filesystem::path source_root,
                            std::shared_ptr<StatsShapeCache> cache = nullptr);

    /// MalformedLine, если фрагмент не заканчивается на \r или \n.
    [[nodiscard]] auto classify(std::string_view fragment) const -> infra::Result<ClassifiedLine>;

    [[nodiscard]] auto source_root() const -> const std::filesystem::path& { return source_root_; }
    [[nodiscard]] auto cache() const -> const StatsShapeCache& { return *cache_; }

    /// Путь из строки rsync относительно корня: первый компонент
    /// (ведущий "/" или имя корня) отбрасывается, остальное - к корню.
    /// Строка должна начинаться с "/" или с "<имя корня>/".
    [[nodiscard]] auto resolve(std::string_view line) const -> std::filesystem::path;

private:
    [[nodiscard]] auto is_completed_stats_line(std::string_view fragment) const -> bool;
    [[nodiscard]] auto is_progress_stats_line(std::string_view fragment) const -> bool;
    [[nodiscard]] auto is_source_root_line(std::string_view fragment) const -> bool;
    [[nodiscard]] auto is_relative_path_line(std::string_view text) const -> bool;

    std::filesystem::path source_root_;
    std::string root_name_;
    std::shared_ptr<StatsShapeCache> cache_;
};

} // namespace rsprog::core
