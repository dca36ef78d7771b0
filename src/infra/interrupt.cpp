#include "interrupt.hpp"
#include <condition_variable>
#include <mutex>

namespace rmirror::infra {

std::atomic<bool> g_interrupted{false};

namespace {

// Только async-signal-safe операции: логирование делает наблюдатель в main.
void signal_handler(int sig) {
    if (sig == SIGINT || sig == SIGTERM) {
        g_interrupted.store(true, std::memory_order_relaxed);
    }
}

} // namespace

void install_signal_handler() {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
}

bool sleep_for(std::chrono::nanoseconds duration, std::stop_token stop) {
    if (duration <= std::chrono::nanoseconds::zero()) {
        return !stop.stop_requested();
    }
    std::mutex mutex;
    std::condition_variable_any cv;
    std::unique_lock lock(mutex);
    // Никто не вызывает notify: просыпаемся по таймауту или по stop_token
    (void)cv.wait_for(lock, stop, duration, [] { return false; });
    return !stop.stop_requested();
}

} // namespace rmirror::infra
