#include "monitoring.hpp"
#include <fmt/core.h>
#include <algorithm>
#include <iostream>
#include <cmath>
#include <thread>

namespace rsprog::infra {

ProgressMonitor::ProgressMonitor(bool enabled, bool quiet)
    : enabled_(enabled && !quiet)
    , quiet_(quiet)
    , start_time_(std::chrono::steady_clock::now())
{
    if (enabled_) {
        start_rendering_thread_();
    }
}

ProgressMonitor::~ProgressMonitor() {
    if (render_thread_) {
        stop_rendering_thread_();
        render_thread_.reset(); // join
    }
    if (enabled_ && !quiet_) {
        render_();
        std::cout << "\n"; // финальный перенос
    }
}

void ProgressMonitor::update(std::uint64_t completed_files, std::uint64_t transferred_bytes) {
    completed_files_.store(completed_files);
    transferred_bytes_.store(transferred_bytes);
}

void ProgressMonitor::update_file(std::string_view path, int percent,
                                  std::optional<std::uint64_t> rate_bytes) {
    file_percent_.store(percent);
    std::lock_guard lock(file_mutex_);
    current_path_.assign(path);
    rate_bytes_ = rate_bytes;
}

auto ProgressMonitor::get_stats() const -> Stats {
    std::lock_guard lock(file_mutex_);
    return Stats{
        .completed_files = completed_files_.load(),
        .transferred_bytes = transferred_bytes_.load(),
        .file_percent = file_percent_.load(),
        .rate_bytes = rate_bytes_,
        .current_path = current_path_,
        .start_time = start_time_
    };
}

auto ProgressMonitor::format_bytes(double bytes) -> std::string {
    const char* unit = "B";
    if (bytes > 1024.0*1024*1024) { bytes /= 1024.0*1024*1024; unit = "GB"; }
    else if (bytes > 1024*1024) { bytes /= 1024*1024; unit = "MB"; }
    else if (bytes > 1024) { bytes /= 1024; unit = "KB"; }
    return fmt::format("{:.1f} {}", bytes, unit);
}

void ProgressMonitor::start_rendering_thread_() {
    render_thread_ = std::make_unique<std::jthread>([this](std::stop_token st) {
        while (!st.stop_requested() && !shutdown_.load()) {
            render_();
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });
}

void ProgressMonitor::stop_rendering_thread_() {
    shutdown_.store(true);
    if (render_thread_) {
        render_thread_->request_stop();
    }
}

void ProgressMonitor::render_() const {
    if (quiet_ || !enabled_) return;

    auto stats = get_stats();
    if (stats.current_path.empty()) return;

    const int bar_width = 20;
    const int filled = std::clamp(stats.file_percent, 0, 100) * bar_width / 100;

    // Скорость: из rsync, иначе средняя с начала
    double bytes_per_sec = 0.0;
    if (stats.rate_bytes) {
        bytes_per_sec = static_cast<double>(*stats.rate_bytes);
    } else {
        auto elapsed_sec = std::chrono::duration<double>(
            std::chrono::steady_clock::now() - stats.start_time).count();
        bytes_per_sec = elapsed_sec > 0 ? stats.transferred_bytes / elapsed_sec : 0.0;
    }

    // Очистка строки и вывод
    std::cout << "\r\033[K"; // ANSI: очистить строку

    std::string bar;
    for (int i = 0; i < bar_width; ++i) bar += i < filled ? "█" : "░";
    fmt::print(
        "[{}] {:3d}% | {} | {}/s | {} done | {}",
        bar,
        stats.file_percent,
        format_bytes(static_cast<double>(stats.transferred_bytes)),
        format_bytes(bytes_per_sec),
        stats.completed_files,
        stats.current_path
    );
    std::cout << std::flush;
}

} // namespace rsprog::infra
