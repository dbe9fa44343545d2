#include "Sleeper.hpp"

bool CancellableSleeper::sleep_for(std::chrono::milliseconds duration) {
    std::unique_lock<std::mutex> lock(mtx);
    cv.wait_for(lock, duration, [this] { return cancelled; });
    return !cancelled;
}

void CancellableSleeper::cancel() {
    {
        std::lock_guard<std::mutex> lock(mtx);
        cancelled = true;
    }
    cv.notify_all();
}

bool CancellableSleeper::is_cancelled() const {
    std::lock_guard<std::mutex> lock(mtx);
    return cancelled;
}
