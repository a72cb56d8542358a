#include "toolgate/timer.h"

namespace toolgate {

CancellableTimer::CancellableTimer(std::chrono::milliseconds delay, std::function<void()> on_fire)
    : delay_(delay), on_fire_(std::move(on_fire)) {
    th_ = std::thread([this] { run(); });
}

CancellableTimer::~CancellableTimer() {
    cancel();
    if (th_.joinable()) {
        if (th_.get_id() == std::this_thread::get_id()) th_.detach();
        else th_.join();
    }
}

void CancellableTimer::run() {
    const auto deadline = std::chrono::steady_clock::now() + delay_;
    std::unique_lock<std::mutex> lk(mu_);
    cv_.wait_until(lk, deadline, [this] { return cancelled_; });
    if (cancelled_) return;
    fired_ = true;
    lk.unlock();
    if (on_fire_) on_fire_();
}

bool CancellableTimer::cancel() {
    std::lock_guard<std::mutex> lk(mu_);
    if (fired_ || cancelled_) return false;
    cancelled_ = true;
    cv_.notify_all();
    return true;
}

bool CancellableTimer::fired() const {
    std::lock_guard<std::mutex> lk(mu_);
    return fired_;
}

bool CancellableTimer::pending() const {
    std::lock_guard<std::mutex> lk(mu_);
    return !fired_ && !cancelled_;
}

} // namespace toolgate
