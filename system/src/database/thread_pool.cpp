// ============= src/database/thread_pool.cpp =============
#include "database/thread_pool.hpp"
#include <spdlog/spdlog.h>

ThreadPool::ThreadPool(size_t num_threads) {
    if (num_threads == 0) {
        num_threads = 1;
    }

    spdlog::debug("ThreadPool starting {} workers", num_threads);

    for (size_t i = 0; i < num_threads; ++i) {
        workers.emplace_back(&ThreadPool::worker_thread, this);
    }
}

ThreadPool::~ThreadPool() {
    stop();
}

void ThreadPool::worker_thread() {
    while (true) {
        std::function<void()> task;

        {
            std::unique_lock<std::mutex> lock(queue_mutex);

            condition.wait(lock, [this] {
                return stop_flag || !tasks.empty();
            });

            if (stop_flag && tasks.empty()) {
                return;
            }

            task = std::move(tasks.front());
            tasks.pop();
            active_count++;
        }

        // packaged_task stores the exception in its future; anything reaching
        // here escaped a raw std::function
        try {
            task();
        } catch (const std::exception& e) {
            spdlog::error("Task exception: {}", e.what());
        }

        {
            std::lock_guard<std::mutex> lock(queue_mutex);
            active_count--;
        }
        idle_condition.notify_all();
    }
}

size_t ThreadPool::pending_tasks() const {
    std::lock_guard<std::mutex> lock(queue_mutex);
    return tasks.size();
}

void ThreadPool::wait_all() {
    std::unique_lock<std::mutex> lock(queue_mutex);
    idle_condition.wait(lock, [this] {
        return tasks.empty() && active_count == 0;
    });
}

void ThreadPool::stop() {
    {
        std::unique_lock<std::mutex> lock(queue_mutex);
        if (stop_flag && workers.empty()) {
            return;
        }
        stop_flag = true;
    }

    condition.notify_all();

    for (auto& worker : workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }

    if (!workers.empty()) {
        spdlog::debug("ThreadPool stopped");
    }
    workers.clear();
}
