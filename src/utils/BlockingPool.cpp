#include "BlockingPool.hpp"
#include <stdexcept>

BlockingPool::BlockingPool(size_t num_threads) {
    if (num_threads == 0) {
        num_threads = 1;
    }
    for (size_t i = 0; i < num_threads; ++i) {
        workers.emplace_back(&BlockingPool::worker_loop, this);
    }
}

BlockingPool::~BlockingPool() {
    shutdown();
}

void BlockingPool::worker_loop() {
    while (true) {
        std::function<void()> job;
        {
            std::unique_lock<std::mutex> lock(mtx);
            cv.wait(lock, [this] { return !jobs.empty() || finished; });
            if (jobs.empty()) {
                return; // finished and drained
            }
            job = std::move(jobs.front());
            jobs.pop();
        }
        // packaged_task stores any exception in the future
        job();
    }
}

void BlockingPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mtx);
        finished = true;
    }
    cv.notify_all();
    for (auto& worker : workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

