#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include "aggregator.hpp"
#include "snapshot.hpp"
#include "../line_classifier/line_classifier.hpp"
#include "../../infra/error_handler/error.hpp"

namespace rsprog::core {

// Код завершения rsync, последний элемент потока
struct ExitStatus {
    int code = 0;

    bool operator==(const ExitStatus&) const = default;
};

using RunnerItem = std::variant<std::string, ExitStatus>;
using SessionUpdate = std::variant<Snapshot, ExitStatus>;

struct SessionOptions {
    bool include_raw_output = false;
    std::size_t cache_capacity = StatsShapeCache::kDefaultCapacity;
};

/// Разбор вывода одного запуска rsync: фрагмент -> классификация -> снимок.
///
/// Фрагменты подаются строго по порядку. Первая ошибка прерывает сессию:
/// все последующие вызовы возвращают ту же ошибку.
class TransferSession {
public:
    explicit TransferSession(std::filesystem::path source_root,
                             SessionOptions options = {});

    // Общий кэш для нескольких сессий в одном потоке
    TransferSession(std::filesystem::path source_root,
                    std::shared_ptr<StatsShapeCache> cache,
                    SessionOptions options = {});

    [[nodiscard]] auto feed(std::string_view fragment) -> infra::Result<Snapshot>;
    [[nodiscard]] auto consume(const RunnerItem& item) -> infra::Result<SessionUpdate>;

    [[nodiscard]] auto current() const -> const std::optional<Snapshot>& { return current_; }
    [[nodiscard]] auto exit_status() const -> const std::optional<ExitStatus>& { return exit_status_; }
    [[nodiscard]] auto failed() const -> bool { return failure_.has_value(); }
    [[nodiscard]] auto lines_processed() const -> std::uint64_t { return lines_processed_; }
    [[nodiscard]] auto source_root() const -> const std::filesystem::path& { return classifier_.source_root(); }
    [[nodiscard]] auto classifier() const -> const LineClassifier& { return classifier_; }

private:
    auto fail(infra::Error error) -> infra::Error;

    LineClassifier classifier_;
    AggregatorOptions aggregator_options_;
    std::optional<Snapshot> current_;
    std::optional<infra::Error> failure_;
    std::optional<ExitStatus> exit_status_;
    std::uint64_t lines_processed_ = 0;
};

} // namespace rsprog::core
