#include "interrupt.hpp"

namespace fdup::infra {

std::atomic<bool> g_interrupted{false};

namespace {

// Только async-signal-safe операции: сообщение пишет тот, кто увидит флаг.
// Повторный сигнал обрабатывается по умолчанию и завершает процесс.
void signal_handler(int sig) {
    if (sig == SIGINT || sig == SIGTERM) {
        g_interrupted.store(true, std::memory_order_relaxed);
        std::signal(sig, SIG_DFL);
    }
}

} // namespace

void install_signal_handler() {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
}

} // namespace fdup::infra
