#pragma once

#include <cstddef>
#include <functional>
#include <future>
#include <thread>
#include <mutex>
#include <deque>
#include <condition_variable>
#include <stop_token>
#include <vector>
#include <stdexcept>
#include <type_traits>

namespace fdup::infra {

// Пул фиксированного размера с общей очередью.
// Порядок завершения задач не гарантируется.
class ThreadPool {
public:
    explicit ThreadPool(std::size_t nthreads = std::jthread::hardware_concurrency());
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Запуск задачи без возврата
    template<typename F, typename... Args>
    auto enqueue(F&& f, Args&&... args) -> void;

    // Запуск задачи с возвратом (future)
    template<typename F, typename... Args>
    auto enqueue_with_future(F&& f, Args&&... args)
        -> std::future<std::invoke_result_t<std::decay_t<F>, std::decay_t<Args>...>>;

    // Блокирующее ожидание: очередь пуста и ни одна задача не выполняется
    void wait();

    // Выбрасывает ещё не начатые задачи; выполняющиеся доработают.
    // Возвращает число отменённых задач.
    auto cancel_pending() -> std::size_t;

    [[nodiscard]] auto size() const -> std::size_t { return workers_.size(); }

private:
    using Task = std::function<void()>;

    void worker_loop_(std::stop_token st);

    std::vector<std::jthread> workers_;
    std::deque<Task> tasks_;
    mutable std::mutex queue_mutex_;
    std::condition_variable_any cv_;
    std::condition_variable_any idle_cv_;
    bool stop_ = false;
    std::size_t active_tasks_ = 0; // под queue_mutex_
};

// =============== Реализация шаблонов ===============

template<typename F, typename... Args>
void ThreadPool::enqueue(F&& f, Args&&... args) {
    // future не нужен: задача запущена
    (void)enqueue_with_future(std::forward<F>(f), std::forward<Args>(args)...);
}

template<typename F, typename... Args>
auto ThreadPool::enqueue_with_future(F&& f, Args&&... args)
    -> std::future<std::invoke_result_t<std::decay_t<F>, std::decay_t<Args>...>>
{
    using ReturnType = std::invoke_result_t<std::decay_t<F>, std::decay_t<Args>...>;

    auto task = std::make_shared<std::packaged_task<ReturnType()>>(
        std::bind(std::forward<F>(f), std::forward<Args>(args)...)
    );

    auto future = task->get_future();
    {
        std::lock_guard lock(queue_mutex_);
        if (stop_) {
            throw std::runtime_error("ThreadPool is stopped");
        }
        tasks_.emplace_back([task]() { (*task)(); });
    }
    cv_.notify_one();
    return future;
}

inline ThreadPool::ThreadPool(std::size_t nthreads) {
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
    for (auto& worker : workers_) {
        worker.request_stop();
    }
    // jthread сам сделает join в деструкторе
}

inline void ThreadPool::worker_loop_(std::stop_token st) {
    while (true) {
        Task task;
        {
            std::unique_lock lock(queue_mutex_);
            cv_.wait(lock, st, [this] { return stop_ || !tasks_.empty(); });

            // При остановке оставшиеся задачи дорабатываются
            if (tasks_.empty()) {
                if (stop_ || st.stop_requested()) {
                    return;
                }
                continue;
            }

            task = std::move(tasks_.front());
            tasks_.pop_front();
            ++active_tasks_;
        }

        task();

        {
            std::lock_guard lock(queue_mutex_);
            --active_tasks_;
        }
        idle_cv_.notify_all();
    }
}

inline void ThreadPool::wait() {
    std::unique_lock lock(queue_mutex_);
    idle_cv_.wait(lock, [this] {
        return tasks_.empty() && active_tasks_ == 0;
    });
}

inline auto ThreadPool::cancel_pending() -> std::size_t {
    std::size_t dropped = 0;
    {
        std::lock_guard lock(queue_mutex_);
        dropped = tasks_.size();
        tasks_.clear();
    }
    idle_cv_.notify_all();
    return dropped;
}

} // namespace fdup::infra
