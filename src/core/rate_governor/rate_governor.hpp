#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <stop_token>
#include "../../infra/config/config.hpp"
#include "../../infra/error_handler/error.hpp"

namespace rmirror::core {

struct RateGovernorOptions {
    double initial_delay = 2.0;     // seconds
    double min_delay = 0.5;
    double max_delay = 30.0;
    double backoff_factor = 2.0;
    std::optional<std::uint32_t> max_requests_per_minute;

    [[nodiscard]] static auto from_config(const infra::Config& config) -> RateGovernorOptions;
};

struct RateStats {
    double current_delay = 0.0;
    double initial_delay = 0.0;
    double min_delay = 0.0;
    double max_delay = 0.0;
    std::optional<std::uint32_t> max_requests_per_minute;
    std::size_t requests_in_window = 0;
    std::optional<double> seconds_since_last_request;  // nullopt до первого запроса
    std::uint64_t consecutive_successes = 0;
    std::uint64_t consecutive_errors = 0;
    std::uint64_t total_requests = 0;
};

/// Общий для всех воркеров ограничитель частоты запросов.
///
/// wait() выдерживает паузу не меньше текущей задержки с момента последнего
/// запроса и, если задан лимит, не больше max_requests_per_minute запросов
/// в скользящем окне 60 с. Задержка адаптируется: 5 успехов подряд умножают
/// её на 0.9 (не ниже min_delay), каждая ошибка умножает на backoff_factor
/// (не выше max_delay).
class RateGovernor {
public:
    explicit RateGovernor(RateGovernorOptions options = {});

    RateGovernor(const RateGovernor&) = delete;
    RateGovernor& operator=(const RateGovernor&) = delete;

    /// Блокирует до разрешённого момента. false — ожидание прервано через stop.
    [[nodiscard]] auto wait(std::stop_token stop = {}) -> bool;

    void on_success();
    void on_error(infra::ErrorCode kind);

    /// Возврат к начальной задержке и обнуление счётчиков (между независимыми запусками).
    void reset();

    [[nodiscard]] auto stats() const -> RateStats;

private:
    using Clock = std::chrono::steady_clock;

    static constexpr auto kWindow = std::chrono::seconds(60);
    static constexpr int kSuccessStreak = 5;
    static constexpr double kRecoveryFactor = 0.9;

    void evict_expired_(Clock::time_point now) const;

    const RateGovernorOptions options_;

    // turn_mutex_ выстраивает ожидающих в очередь; state_mutex_ защищает
    // состояние и освобождается на время сна
    std::mutex turn_mutex_;
    mutable std::mutex state_mutex_;
    std::condition_variable_any cv_;

    double delay_;
    std::optional<Clock::time_point> last_request_;
    mutable std::deque<Clock::time_point> window_;
    std::uint64_t consecutive_successes_ = 0;
    std::uint64_t consecutive_errors_ = 0;
    std::uint64_t total_requests_ = 0;
    std::uint64_t delay_generation_ = 0;  // растёт при уменьшении задержки, будит ожидающих
};

} // namespace rmirror::core
