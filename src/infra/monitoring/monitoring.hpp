#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <memory>
#include <thread>

namespace rsprog::infra {

class ProgressMonitor {
public:
    struct Stats {
        std::uint64_t completed_files = 0;
        std::uint64_t transferred_bytes = 0;
        int file_percent = 0;
        std::optional<std::uint64_t> rate_bytes;  // байт/сек из последнего показания
        std::string current_path;
        std::chrono::steady_clock::time_point start_time{};
    };

    explicit ProgressMonitor(bool enabled = true, bool quiet = false);
    ~ProgressMonitor();

    void update(std::uint64_t completed_files, std::uint64_t transferred_bytes);
    void update_file(std::string_view path, int percent, std::optional<std::uint64_t> rate_bytes);

    [[nodiscard]] auto get_stats() const -> Stats;
    [[nodiscard]] auto is_enabled() const -> bool { return enabled_; }

    [[nodiscard]] static auto format_bytes(double bytes) -> std::string;

private:
    void render_() const;
    void start_rendering_thread_();
    void stop_rendering_thread_();

    // Атомики для thread-safe обновления
    std::atomic<std::uint64_t> completed_files_{0};
    std::atomic<std::uint64_t> transferred_bytes_{0};
    std::atomic<int> file_percent_{0};

    // Путь и скорость меняются вместе
    mutable std::mutex file_mutex_;
    std::string current_path_;
    std::optional<std::uint64_t> rate_bytes_;

    const bool enabled_;
    const bool quiet_;
    std::chrono::steady_clock::time_point start_time_;
    mutable std::atomic<bool> shutdown_{false};
    mutable std::unique_ptr<std::jthread> render_thread_;
};

} // namespace rsprog::infra
