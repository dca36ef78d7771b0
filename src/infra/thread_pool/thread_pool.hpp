#pragma once

#include <cstddef>
#include <functional>
#include <future>
#include <thread>
#include <mutex>
#include <queue>
#include <condition_variable>
#include <stop_token>
#include <vector>
#include <stdexcept>
#include <atomic>
#include <memory>
#include <tuple>

namespace rmirror::infra {

/// Пул фиксированного размера: очередь задач + N рабочих потоков.
/// wait() — барьер: возвращается, когда очередь пуста и ни одна задача не выполняется.
class ThreadPool {
public:
    explicit ThreadPool(std::size_t nthreads = std::jthread::hardware_concurrency());
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Запуск задачи без возврата
    template<typename F, typename... Args>
    auto enqueue(F&& f, Args&&... args) -> void;

    // Запуск задачи с возвратом (future); исключение задачи попадает в future
    template<typename F, typename... Args>
    auto enqueue_with_future(F&& f, Args&&... args)
        -> std::future<std::invoke_result_t<std::decay_t<F>, std::decay_t<Args>...>>;

    // Блокирующее ожидание завершения всех задач
    void wait();

    [[nodiscard]] auto size() const -> std::size_t { return workers_.size(); }
    [[nodiscard]] auto running() const -> std::size_t { return running_.load(std::memory_order_relaxed); }

private:
    using Task = std::packaged_task<void()>;

    void worker_loop_(std::stop_token st);

    std::vector<std::jthread> workers_;
    std::queue<Task> tasks_;
    mutable std::mutex queue_mutex_;
    std::condition_variable_any cv_;
    std::condition_variable_any idle_cv_;
    bool stop_ = false;
    std::size_t outstanding_ = 0;          // в очереди + выполняются, под queue_mutex_
    std::atomic<std::size_t> running_{0};  // только выполняющиеся
};

// =============== Реализация шаблонов ===============

template<typename F, typename... Args>
void ThreadPool::enqueue(F&& f, Args&&... args) {
    // future не нужен: исключения задачи остаются в нём и отбрасываются
    (void)enqueue_with_future(std::forward<F>(f), std::forward<Args>(args)...);
}

template<typename F, typename... Args>
auto ThreadPool::enqueue_with_future(F&& f, Args&&... args)
    -> std::future<std::invoke_result_t<std::decay_t<F>, std::decay_t<Args>...>>
{
    using ReturnType = std::invoke_result_t<std::decay_t<F>, std::decay_t<Args>...>;

    auto task = std::make_shared<std::packaged_task<ReturnType()>>(
        [fn = std::forward<F>(f), tup = std::make_tuple(std::forward<Args>(args)...)]() mutable {
            return std::apply(fn, std::move(tup));
        }
    );

    auto future = task->get_future();
    {
        std::lock_guard lock(queue_mutex_);
        if (stop_) {
            throw std::runtime_error("ThreadPool is stopped");
        }
        ++outstanding_;
        tasks_.emplace([task]() { (*task)(); });
    }
    cv_.notify_one();
    return future;
}

inline ThreadPool::ThreadPool(std::size_t nthreads)
{
    if (nthreads == 0) nthreads = 1;
    workers_.reserve(nthreads);

    for (std::size_t i = 0; i < nthreads; ++i) {
        workers_.emplace_back([this](std::stop_token st) { worker_loop_(st); });
    }
}

inline ThreadPool::~ThreadPool() {
    {
        std::lock_guard lock(queue_mutex_);
        stop_ = true;
    }
    cv_.notify_all();
    // join до разрушения мьютекса и cv; оставшиеся задачи будут выполнены
    workers_.clear();
}

inline void ThreadPool::worker_loop_(std::stop_token st) {
    while (true) {
        Task task;
        {
            std::unique_lock lock(queue_mutex_);
            cv_.wait(lock, [this, &st] {
                return st.stop_requested() || stop_ || !tasks_.empty();
            });

            if (tasks_.empty()) {
                break; // остановка и очередь пуста
            }
            task = std::move(tasks_.front());
            tasks_.pop();
        }

        running_.fetch_add(1, std::memory_order_relaxed);
        task();
        running_.fetch_sub(1, std::memory_order_relaxed);

        {
            std::lock_guard lock(queue_mutex_);
            --outstanding_;
        }
        idle_cv_.notify_all();
    }
}

inline void ThreadPool::wait() {
    std::unique_lock lock(queue_mutex_);
    idle_cv_.wait(lock, [this] { return outstanding_ == 0; });
}

} // namespace rmirror::infra
