#pragma once

#include <atomic>
#include <chrono>
#include <csignal>
#include <stop_token>

namespace rmirror::infra {

extern std::atomic<bool> g_interrupted;

void install_signal_handler();

inline bool is_interrupted() {
    return g_interrupted.load(std::memory_order_relaxed);
}

/// Спит не дольше duration. Возвращает false, если сон прерван запросом остановки.
[[nodiscard]] bool sleep_for(std::chrono::nanoseconds duration, std::stop_token stop);

} // namespace rmirror::infra
