// thread_pool.h
#pragma once
#include <functional>
#include <vector>
#include <queue>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <future>
#include <memory>
#include <stdexcept>

/// Fixed set of workers running queued transfers in FIFO order.
class ThreadPool {
public:
    explicit ThreadPool(size_t num_threads);

    // Runs every task already queued, then joins the workers.
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Queue a callable; its result or exception is delivered via the future.
    template<typename F>
    auto submit(F&& func) -> std::future<decltype(func())>;

    // Stop accepting work, finish what is queued and join. Idempotent.
    void shutdown();

    size_t size() const;

    // Tasks queued but not yet picked up by a worker.
    size_t pending() const;

private:
    void workerLoop();

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool stopped_ = false;
};

// ── Template implementation (must live in the header) ──────────

template<typename F>
auto ThreadPool::submit(F&& func) -> std::future<decltype(func())> {
    using ReturnType = decltype(func());

    auto task = std::make_shared<std::packaged_task<ReturnType()>>(
        std::forward<F>(func));

    std::future<ReturnType> future = task->get_future();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_) {
            throw std::runtime_error("submit() called on a stopped ThreadPool");
        }
        tasks_.emplace([task]() { (*task)(); });
    }

    cv_.notify_one();
    return future;
}
