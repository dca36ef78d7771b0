#include "rate_governor.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace rmirror::core {

auto RateGovernorOptions::from_config(const infra::Config& config) -> RateGovernorOptions {
    RateGovernorOptions options;
    options.min_delay = config.rate_limit.min_delay;
    options.max_delay = std::max(config.rate_limit.max_delay, options.min_delay);
    options.initial_delay = std::clamp(config.download.rate_limit_delay, options.min_delay, options.max_delay);
    options.backoff_factor = config.rate_limit.backoff_factor;
    options.max_requests_per_minute = config.rate_limit.max_requests_per_minute;
    return options;
}

RateGovernor::RateGovernor(RateGovernorOptions options)
    : options_(std::move(options))
    , delay_(options_.initial_delay)
{}

void RateGovernor::evict_expired_(Clock::time_point now) const {
    while (!window_.empty() && now - window_.front() >= kWindow) {
        window_.pop_front();
    }
}

auto RateGovernor::wait(std::stop_token stop) -> bool {
    std::lock_guard turn(turn_mutex_);
    std::unique_lock lock(state_mutex_);

    while (true) {
        if (stop.stop_requested()) {
            return false;
        }

        const auto now = Clock::now();
        evict_expired_(now);

        Clock::duration pause = Clock::duration::zero();
        if (last_request_) {
            const auto min_gap = std::chrono::duration_cast<Clock::duration>(
                std::chrono::duration<double>(delay_));
            pause = std::max(pause, *last_request_ + min_gap - now);
        }
        if (options_.max_requests_per_minute && *options_.max_requests_per_minute > 0 &&
            window_.size() >= *options_.max_requests_per_minute) {
            const auto window_pause = window_.front() + kWindow - now;
            if (window_pause > pause) {
                spdlog::debug("Request window full ({} per minute), sleeping {:.2f}s",
                              *options_.max_requests_per_minute,
                              std::chrono::duration<double>(window_pause).count());
            }
            pause = std::max(pause, window_pause);
        }

        if (pause <= Clock::duration::zero()) {
            last_request_ = now;
            window_.push_back(now);
            ++total_requests_;
            return true;
        }

        // Пробуждение по stop, таймауту или изменению задержки; пауза пересчитывается
        const auto seen = delay_generation_;
        (void)cv_.wait_for(lock, stop, pause, [&] { return delay_generation_ != seen; });
    }
}

void RateGovernor::on_success() {
    std::lock_guard lock(state_mutex_);
    consecutive_errors_ = 0;
    if (++consecutive_successes_ < kSuccessStreak) {
        return;
    }
    consecutive_successes_ = 0;

    const double old_delay = delay_;
    delay_ = std::max(options_.min_delay, delay_ * kRecoveryFactor);
    if (delay_ != old_delay) {
        spdlog::debug("Reduced request delay to {:.2f}s after {} successes", delay_, kSuccessStreak);
        ++delay_generation_;
        cv_.notify_all();
    }
}

void RateGovernor::on_error(infra::ErrorCode kind) {
    std::lock_guard lock(state_mutex_);
    ++consecutive_errors_;
    consecutive_successes_ = 0;

    const double old_delay = delay_;
    delay_ = std::min(options_.max_delay, delay_ * options_.backoff_factor);
    spdlog::warn("Error #{} ({}): increased request delay from {:.2f}s to {:.2f}s",
                 consecutive_errors_, infra::to_string(kind), old_delay, delay_);
}

void RateGovernor::reset() {
    std::lock_guard lock(state_mutex_);
    delay_ = options_.initial_delay;
    consecutive_successes_ = 0;
    consecutive_errors_ = 0;
    spdlog::info("Rate governor reset to {:.2f}s", delay_);
    ++delay_generation_;
    cv_.notify_all();
}

auto RateGovernor::stats() const -> RateStats {
    std::lock_guard lock(state_mutex_);
    const auto now = Clock::now();
    evict_expired_(now);

    RateStats stats;
    stats.current_delay = delay_;
    stats.initial_delay = options_.initial_delay;
    stats.min_delay = options_.min_delay;
    stats.max_delay = options_.max_delay;
    stats.max_requests_per_minute = options_.max_requests_per_minute;
    stats.requests_in_window = window_.size();
    if (last_request_) {
        stats.seconds_since_last_request = std::chrono::duration<double>(now - *last_request_).count();
    }
    stats.consecutive_successes = consecutive_successes_;
    stats.consecutive_errors = consecutive_errors_;
    stats.total_requests = total_requests_;
    return stats;
}

} // namespace rmirror::core
