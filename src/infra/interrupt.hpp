#pragma once

#include <atomic>
#include <csignal>

namespace fdup::infra {

extern std::atomic<bool> g_interrupted;

// Первый SIGINT/SIGTERM выставляет флаг: воркеры перестают брать новые задачи,
// упаковка бросает текущий архив. Второй сигнал завершает процесс.
void install_signal_handler();

inline bool is_interrupted() {
    return g_interrupted.load(std::memory_order_relaxed);
}

inline void request_interrupt() {
    g_interrupted.store(true, std::memory_order_relaxed);
}

inline void clear_interrupt() {
    g_interrupted.store(false, std::memory_order_relaxed);
}

} // namespace fdup::infra
