#pragma once

#include <atomic>
#include <csignal>

namespace rsprog::infra {

extern std::atomic<bool> g_interrupted;

// SIGINT/SIGTERM: перестать читать вывод rsync и завершиться
void install_signal_handler();

inline bool is_interrupted() {
    return g_interrupted.load(std::memory_order_relaxed);
}

} // namespace rsprog::infra
