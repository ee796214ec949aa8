#include <spdlog/spdlog.h>
#include <lunafmt/runtime/thread_pool.h>

namespace lunafmt::runtime {

ThreadPool::ThreadPool(size_t num_threads) : state_(std::make_shared<ThreadPoolState>()) {
    if (num_threads == 0) {
        num_threads = std::thread::hardware_concurrency();
        if (num_threads == 0) {
            num_threads = 4; // Fallback to 4 threads
        }
    }

    workers_.reserve(num_threads);

    for (size_t i = 0; i < num_threads; ++i) {
        // Capture shared state by value so threads have their own shared_ptr
        workers_.emplace_back([state = state_]() { worker_thread(state); });
    }
}

ThreadPool::~ThreadPool() {
    join();
}

void ThreadPool::join() {
    {
        std::unique_lock<std::mutex> lock(state_->queue_mutex);
        state_->stopping = true;
    }

    state_->condition.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }

    workers_.clear();
}

void ThreadPool::worker_thread(std::shared_ptr<ThreadPoolState> state) {
    while (true) {
        std::function<void()> task;

        {
            std::unique_lock<std::mutex> lock(state->queue_mutex);

            // Wait for work or stop signal
            state->condition.wait(lock,
                                  [&state] { return state->stopping || !state->tasks.empty(); });

            // Exit only once stopping and the queue is drained
            if (state->stopping && state->tasks.empty()) {
                return;
            }

            task = std::move(state->tasks.front());
            state->tasks.pop();
        }

        // Execute task outside of lock; tasks report their own failures
        try {
            task();
        } catch (const std::exception& e) {
            spdlog::error("[ThreadPool] task threw: {}", e.what());
        }
    }
}

} // namespace lunafmt::runtime
