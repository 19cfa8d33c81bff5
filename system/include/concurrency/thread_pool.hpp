// ============= include/concurrency/thread_pool.hpp =============
/*
 * Thread Pool - FIFO
 *
 * CARACTERÍSTICAS:
 * - submit(): tarea con future (las excepciones viajan en el future)
 * - post():   fire-and-forget (excepciones se loguean, nunca se pierden)
 * - Pools separados por tipo de trabajo (session / matcher / provider)
 *   para que una tarea nunca espere a otra del mismo pool
 */

#pragma once
#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace rollcall {

class ThreadPool {
public:
    explicit ThreadPool(size_t num_threads = std::thread::hardware_concurrency(),
                        std::string name = "pool");
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Submit task (returns future)
    template<typename F, typename... Args>
    auto submit(F&& f, Args&&... args) -> std::future<decltype(f(args...))>;

    // Fire-and-forget
    void post(std::function<void()> task);

    // Stats
    size_t pending_tasks() const;
    size_t active_threads() const { return workers.size(); }
    const std::string& name() const { return pool_name; }

    // Control
    void wait_all();
    void stop();

private:
    std::string pool_name;
    std::vector<std::thread> workers;
    std::queue<std::function<void()>> tasks;

    mutable std::mutex queue_mutex;
    std::condition_variable condition;
    std::atomic<bool> stop_flag{false};
    std::atomic<size_t> active_count{0};

    void worker_thread();
    void enqueue(std::function<void()> task);
};

// Detiene los pools (en orden) al salir de scope. Declarar después del
// último objeto que referencian sus tareas: se destruye antes que ellos
struct PoolShutdown {
    std::vector<ThreadPool*> pools;

    ~PoolShutdown() {
        for (auto* pool : pools) pool->stop();
    }
};

// ==================== IMPLEMENTATION ====================

template<typename F, typename... Args>
auto ThreadPool::submit(F&& f, Args&&... args) -> std::future<decltype(f(args...))> {
    using return_type = decltype(f(args...));

    auto task = std::make_shared<std::packaged_task<return_type()>>(
        std::bind(std::forward<F>(f), std::forward<Args>(args)...)
    );

    std::future<return_type> result = task->get_future();
    enqueue([task]() { (*task)(); });
    return result;
}

}  // namespace rollcall
