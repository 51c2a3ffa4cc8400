#include "interrupt.hpp"

namespace lazycp::infra {

std::atomic<bool> g_interrupted{false};

// Обработчик должен оставаться async-signal-safe: только атомарный флаг.
static void signal_handler(int sig) {
    if (sig == SIGINT || sig == SIGTERM) {
        g_interrupted.store(true, std::memory_order_relaxed);
    }
}

void install_signal_handler() {
    // Без SA_RESTART: блокирующее чтение ответа на запрос завершается с EINTR
    struct sigaction action{};
    action.sa_handler = signal_handler;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    ::sigaction(SIGINT, &action, nullptr);
    ::sigaction(SIGTERM, &action, nullptr);
}

} // namespace lazycp::infra
