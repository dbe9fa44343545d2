#pragma once
#include <chrono>
#include <condition_variable>
#include <mutex>

// Delay source for background loops. Injected so retry policies can be
// exercised in tests without real timers.
class Sleeper {
public:
    virtual ~Sleeper() = default;

    // Returns false if the sleeper was cancelled before or during the wait.
    virtual bool sleep_for(std::chrono::milliseconds duration) = 0;
    virtual void cancel() = 0;
    virtual bool is_cancelled() const = 0;
};

// Real sleeper; cancel() wakes every thread currently waiting on it.
class CancellableSleeper : public Sleeper {
private:
    mutable std::mutex mtx;
    std::condition_variable cv;
    bool cancelled = false;

public:
    bool sleep_for(std::chrono::milliseconds duration) override;
    void cancel() override;
    bool is_cancelled() const override;
};
