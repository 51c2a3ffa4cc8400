#pragma once

#include <atomic>
#include <csignal>
#include <signal.h>

namespace lazycp::infra {

extern std::atomic<bool> g_interrupted;

void install_signal_handler();

inline bool is_interrupted() {
    return g_interrupted.load(std::memory_order_relaxed);
}

// Для тестов и повторного запуска в одном процессе
inline void reset_interrupted() {
    g_interrupted.store(false, std::memory_order_relaxed);
}

} // namespace lazycp::infra
