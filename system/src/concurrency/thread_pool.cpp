// ============= src/concurrency/thread_pool.cpp =============
#include "concurrency/thread_pool.hpp"
#include <spdlog/spdlog.h>
#include <chrono>

namespace rollcall {

ThreadPool::ThreadPool(size_t num_threads, std::string name)
    : pool_name(std::move(name))
{
    if (num_threads == 0) num_threads = 1;

    spdlog::info("🔧 Inicializando ThreadPool '{}' con {} threads", pool_name, num_threads);

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

        try {
            task();
        } catch (const std::exception& e) {
            spdlog::error("[{}] Task exception: {}", pool_name, e.what());
        }

        active_count--;
    }
}

void ThreadPool::enqueue(std::function<void()> task) {
    {
        std::unique_lock<std::mutex> lock(queue_mutex);
        if (stop_flag) {
            throw std::runtime_error("ThreadPool '" + pool_name + "' is stopped");
        }
        tasks.push(std::move(task));
    }
    condition.notify_one();
}

void ThreadPool::post(std::function<void()> task) {
    enqueue(std::move(task));
}

size_t ThreadPool::pending_tasks() const {
    std::lock_guard<std::mutex> lock(queue_mutex);
    return tasks.size();
}

void ThreadPool::wait_all() {
    while (pending_tasks() > 0 || active_count > 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

void ThreadPool::stop() {
    {
        std::unique_lock<std::mutex> lock(queue_mutex);
        if (stop_flag && workers.empty()) return;
        stop_flag = true;
    }

    condition.notify_all();

    for (auto& worker : workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }

    workers.clear();
}

}  // namespace rollcall
