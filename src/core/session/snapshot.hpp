#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "../model/transfer_stats.hpp"
#include "../model/transfer_summary.hpp"

namespace rsprog::core {

// Завершённый путь -> его итоговая статистика
using Ledger = std::map<std::filesystem::path, TransferStats>;

/// Неизменяемая история сырых фрагментов. append() не копирует
/// предыдущие элементы: новые снимки разделяют общий хвост.
class RawHistory {
public:
    RawHistory() = default;
    RawHistory(const RawHistory&) = default;
    RawHistory(RawHistory&&) noexcept = default;
    RawHistory& operator=(const RawHistory&) = default;
    RawHistory& operator=(RawHistory&&) noexcept = default;
    ~RawHistory();

    [[nodiscard]] auto append(std::string fragment) const -> RawHistory;
    [[nodiscard]] auto to_vector() const -> std::vector<std::string>;
    [[nodiscard]] auto size() const -> std::size_t { return size_; }
    [[nodiscard]] auto empty() const -> bool { return size_ == 0; }

private:
    struct Node {
        std::string fragment;
        std::shared_ptr<const Node> previous;
    };

    std::shared_ptr<const Node> head_;
    std::size_t size_ = 0;
};

/// Состояние передачи после обработки одного фрагмента.
/// Создаётся только advance(), после создания не меняется.
struct Snapshot {
    std::optional<TransferStats> in_progress_stats;   // только для progress-строки
    std::optional<std::filesystem::path> transferring_path;
    std::optional<std::filesystem::path> last_completed_path;
    std::optional<TransferStats> last_completed_path_stats;
    std::uint64_t total_transferred = 0;
    std::optional<TransferSummary> summary;

    // Последнее показание (progress или completed), нужно для reconcile()
    std::optional<TransferStats> last_reading;

    std::shared_ptr<const Ledger> ledger;   // общий между снимками, пока не изменился
    RawHistory history;

    [[nodiscard]] auto completed_paths() const -> const Ledger&;
    [[nodiscard]] auto raw_output() const -> std::vector<std::string> { return history.to_vector(); }

    bool operator==(const Snapshot& other) const;
};

} // namespace rsprog::core
