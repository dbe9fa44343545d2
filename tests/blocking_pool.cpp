#include "utils/BlockingPool.hpp"

#include <atomic>
#include <cassert>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

int main() {
    BlockingPool pool(3);
    assert(pool.size() == 3);

    assert(pool.run([] { return 6 * 7; }) == 42);

    // work really runs off the calling thread
    auto caller = std::this_thread::get_id();
    auto worker = pool.run([] { return std::this_thread::get_id(); });
    assert(worker != caller);

    std::atomic<int> done{0};
    std::vector<std::future<void>> futures;
    for (int i = 0; i < 50; ++i) {
        futures.push_back(pool.submit([&done] { done++; }));
    }
    for (auto& f : futures) {
        f.get();
    }
    assert(done == 50);

    bool rethrown = false;
    try {
        pool.run([]() -> int { throw std::runtime_error("boom"); });
    } catch (const std::runtime_error& e) {
        rethrown = std::string(e.what()) == "boom";
    }
    assert(rethrown);

    pool.shutdown();
    pool.shutdown();
    bool refused = false;
    try {
        pool.submit([] {});
    } catch (const std::runtime_error&) {
        refused = true;
    }
    assert(refused);

    return 0;
}
