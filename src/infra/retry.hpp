#pragma once

#include "error_handler/error.hpp"
#include "interrupt.hpp"
#include <chrono>
#include <cmath>
#include <functional>
#include <stop_token>
#include <thread>
#include <type_traits>
#include <utility>

namespace rmirror::infra {
/*

auto res = infra::with_retry([&](int attempt) {
    return fetch_once(task, attempt);
}, infra::RetryPolicy{ .max_attempts = 5 }, stop,
   [&](int attempt, const infra::Error& err) { rate.on_error(err.code); });

*/
struct RetryPolicy {
    int max_attempts = 3;
    std::chrono::milliseconds initial_delay = std::chrono::milliseconds(1000);
    double backoff_factor = 2.0; // exponential backoff

    // initial_delay * backoff_factor^attempt; при значениях по умолчанию 2^attempt секунд
    [[nodiscard]] auto delay_for(int attempt) const -> std::chrono::milliseconds {
        const auto scaled = static_cast<double>(initial_delay.count()) * std::pow(backoff_factor, attempt);
        return std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(scaled));
    }
};

/// Повторяет operation(attempt) до policy.max_attempts раз.
/// Не повторяет нетранзиентные ошибки (DiskFull, Interrupted, конфигурация);
/// on_failure вызывается после каждой неудачной попытки, до паузы.
template<typename F, typename OnFailure>
[[nodiscard]] auto with_retry(F&& operation, const RetryPolicy& policy,
                              std::stop_token stop, OnFailure&& on_failure)
    -> std::invoke_result_t<F&, int>
{
    using ResultType = std::invoke_result_t<F&, int>;

    const int attempts = policy.max_attempts > 0 ? policy.max_attempts : 1;
    for (int attempt = 0; attempt < attempts; ++attempt) {
        if (stop.stop_requested()) {
            return ResultType{std::unexpect, make_error(ErrorCode::Interrupted, "Cancelled before attempt")};
        }

        auto result = operation(attempt);
        if (result.has_value()) {
            return result; // успех
        }

        std::invoke(on_failure, attempt, std::as_const(result.error()));

        if (!result.error().is_transient() || attempt == attempts - 1) {
            return result; // нетранзиентная ошибка или последняя попытка
        }

        if (!sleep_for(policy.delay_for(attempt), stop)) {
            return ResultType{std::unexpect, make_error(ErrorCode::Interrupted, "Cancelled during retry backoff")};
        }
    }

    // Недостижимо: цикл всегда возвращает на последней попытке
    return ResultType{std::unexpect, make_error(ErrorCode::Unknown, "Retry loop exhausted")};
}

template<typename F>
[[nodiscard]] auto with_retry(F&& operation, const RetryPolicy& policy = {},
                              std::stop_token stop = {})
    -> std::invoke_result_t<F&, int>
{
    return with_retry(std::forward<F>(operation), policy, std::move(stop),
                      [](int, const Error&) {});
}

} // namespace rmirror::infra
