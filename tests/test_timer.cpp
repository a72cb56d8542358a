#include "test_common.h"
#include "toolgate/timer.h"

#include <atomic>
#include <chrono>
#include <thread>

using namespace toolgate;
using namespace std::chrono_literals;

int main() {
    // Test 1: Fires after the delay
    {
        std::atomic<int> calls{0};
        CancellableTimer t(50ms, [&] { calls++; });
        expect_true(t.pending(), "pending before the deadline");
        std::this_thread::sleep_for(300ms);
        expect_eq_ll(calls.load(), 1, "fired once");
        expect_true(t.fired(), "fired flag");
        expect_true(!t.cancel(), "cancel after firing reports false");
    }

    // Test 2: Cancel before the deadline
    {
        std::atomic<int> calls{0};
        CancellableTimer t(5s, [&] { calls++; });
        expect_true(t.cancel(), "cancel prevents the callback");
        expect_true(!t.cancel(), "second cancel reports false");
        expect_true(!t.pending(), "no longer pending");
        expect_eq_ll(calls.load(), 0, "never fired");
    }

    // Test 3: Destruction cancels and does not wait for the deadline
    {
        std::atomic<int> calls{0};
        auto start = std::chrono::steady_clock::now();
        {
            CancellableTimer t(10s, [&] { calls++; });
        }
        auto took = std::chrono::steady_clock::now() - start;
        expect_true(took < 2s, "destructor returned promptly");
        expect_eq_ll(calls.load(), 0, "callback suppressed");
    }

    std::cerr << "test_timer: ALL PASSED" << std::endl;
    return 0;
}
