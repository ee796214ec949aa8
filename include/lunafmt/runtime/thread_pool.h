#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace lunafmt::runtime {

/**
 * Fixed-size thread pool for executing tasks asynchronously.
 *
 * Tasks run in submission order as workers become free. join() stops accepting
 * work, lets the queue drain, and waits for every worker to exit.
 *
 * Thread-safe and follows RAII principles.
 */
class ThreadPool {
public:
    /**
     * Create a thread pool with the specified number of threads.
     * @param num_threads Number of worker threads (0 means hardware concurrency)
     */
    explicit ThreadPool(size_t num_threads = std::thread::hardware_concurrency());

    /**
     * Destructor - drains the queue and joins all threads.
     */
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;
    ThreadPool(ThreadPool&&) = delete;
    ThreadPool& operator=(ThreadPool&&) = delete;

    /**
     * Submit a task without expecting a result (fire-and-forget).
     * @param f Function to execute
     * @return false if the pool is no longer accepting work
     */
    template <typename F> bool execute(F&& f);

    /**
     * Stop accepting tasks, run everything already queued, and join the workers.
     * Calling it again is a no-op.
     */
    void join();

private:
    // Shared state that worker threads can safely access
    struct ThreadPoolState {
        std::queue<std::function<void()>> tasks;
        mutable std::mutex queue_mutex;
        std::condition_variable condition;
        std::atomic<bool> stopping{false};
    };

    static void worker_thread(std::shared_ptr<ThreadPoolState> state);

    std::vector<std::thread> workers_;
    std::shared_ptr<ThreadPoolState> state_;
};

// Template implementations

template <typename F> bool ThreadPool::execute(F&& f) {
    {
        std::unique_lock<std::mutex> lock(state_->queue_mutex);

        if (state_->stopping) {
            return false;
        }

        state_->tasks.emplace(std::forward<F>(f));
    }

    state_->condition.notify_one();
    return true;
}

} // namespace lunafmt::runtime
