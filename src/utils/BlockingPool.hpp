#pragma once
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

// Fixed set of worker threads for slow synchronous work (hashing, file
// resizing) so it never runs on the announce or sampling threads.
class BlockingPool {
private:
    std::queue<std::function<void()>> jobs;
    std::vector<std::thread> workers;
    mutable std::mutex mtx;
    std::condition_variable cv;
    bool finished = false;

    void worker_loop();

public:
    explicit BlockingPool(size_t num_threads);
    ~BlockingPool();

    BlockingPool(const BlockingPool&) = delete;
    BlockingPool& operator=(const BlockingPool&) = delete;

    template <typename F>
    auto submit(F&& fn) -> std::future<std::invoke_result_t<F>>;

    // Runs fn on a worker and waits for it; exceptions are rethrown here.
    template <typename F>
    auto run(F&& fn) -> std::invoke_result_t<F> {
        return submit(std::forward<F>(fn)).get();
    }

    // Drains queued jobs, then joins the workers. Idempotent.
    void shutdown();
    size_t size() const { return workers.size(); }
};

template <typename F>
auto BlockingPool::submit(F&& fn) -> std::future<std::invoke_result_t<F>> {
    using Result = std::invoke_result_t<F>;
    auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<F>(fn));
    std::future<Result> result = task->get_future();
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (finished) {
            throw std::runtime_error("BlockingPool is shut down");
        }
        jobs.push([task] { (*task)(); });
    }
    cv.notify_one();
    return result;
}
