// ============= include/database/thread_pool.hpp =============
/*
 * Worker pool behind PersonaStore::submit()
 *
 * - FIFO task queue, fixed number of workers
 * - submit() returns a std::future; exceptions thrown by the task
 *   surface from future::get()
 * - stop() drains the queue before joining
 */

#pragma once
#include <vector>
#include <queue>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <atomic>
#include <future>
#include <stdexcept>

class ThreadPool {
public:
    explicit ThreadPool(size_t num_threads = std::thread::hardware_concurrency());
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    template<typename F, typename... Args>
    auto submit(F&& f, Args&&... args) -> std::future<decltype(f(args...))>;

    size_t pending_tasks() const;
    size_t active_threads() const { return workers.size(); }

    void wait_all();
    void stop();

private:
    std::vector<std::thread> workers;
    std::queue<std::function<void()>> tasks;

    mutable std::mutex queue_mutex;
    std::condition_variable condition;
    std::condition_variable idle_condition;
    std::atomic<bool> stop_flag{false};
    std::atomic<size_t> active_count{0};

    void worker_thread();
};

// ==================== IMPLEMENTATION ====================

template<typename F, typename... Args>
auto ThreadPool::submit(F&& f, Args&&... args) -> std::future<decltype(f(args...))> {
    using return_type = decltype(f(args...));

    auto task = std::make_shared<std::packaged_task<return_type()>>(
        std::bind(std::forward<F>(f), std::forward<Args>(args)...)
    );

    std::future<return_type> result = task->get_future();

    {
        std::unique_lock<std::mutex> lock(queue_mutex);
        if (stop_flag) {
            throw std::runtime_error("ThreadPool is stopped");
        }

        tasks.push([task]() { (*task)(); });
    }

    condition.notify_one();
    return result;
}
