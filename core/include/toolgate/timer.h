#pragma once
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

namespace toolgate {

// One-shot timer running its callback on a private thread unless cancelled
// first. Exactly one of {callback runs, cancel() returns true} happens.
// The destructor cancels and joins, so a timer never outlives its owner.
class CancellableTimer {
public:
    CancellableTimer(std::chrono::milliseconds delay, std::function<void()> on_fire);
    ~CancellableTimer();

    CancellableTimer(const CancellableTimer&) = delete;
    CancellableTimer& operator=(const CancellableTimer&) = delete;

    // Safe from any thread. True if this call prevented the callback.
    bool cancel();

    bool fired() const;
    bool pending() const;

    std::chrono::milliseconds delay() const { return delay_; }

private:
    void run();

    const std::chrono::milliseconds delay_;
    std::function<void()> on_fire_;
    mutable std::mutex mu_;
    std::condition_variable cv_;
    bool cancelled_{false};
    bool fired_{false};
    std::thread th_;
};

} // namespace toolgate
