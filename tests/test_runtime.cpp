#include "test_common.h"
#include "toolgate/runtime.h"

#include <atomic>
#include <thread>
#include <vector>

using namespace toolgate;

int main() {
    // Test 1: Reserve, admit, release
    {
        ClientRuntime rt(2);
        auto t = AdmissionTicket::reserve(rt);
        expect_true(static_cast<bool>(t), "reserved");
        expect_eq_ll(rt.reserved_count(), 1, "one reservation");
        expect_eq_ll(rt.active_count(), 0, "not yet active");

        t.admit();
        expect_true(t.admitted(), "admitted");
        expect_eq_ll(rt.reserved_count(), 0, "reservation consumed");
        expect_eq_ll(rt.active_count(), 1, "active");

        expect_true(t.release(), "first release decrements");
        expect_true(!t.release(), "second release is a no-op");
        expect_eq_ll(rt.active_count(), 0, "back to zero");
    }

    // Test 2: Budget exhausted leaves the counter untouched
    {
        ClientRuntime rt(2);
        auto a = AdmissionTicket::reserve(rt);
        auto b = AdmissionTicket::reserve(rt);
        a.admit();
        auto c = AdmissionTicket::reserve(rt);
        expect_true(!c, "third ticket refused (active + reserved at max)");
        expect_true(c.state() == AdmissionTicket::State::EMPTY, "empty ticket");
        expect_eq_ll(rt.active_count(), 1, "active unchanged");
        expect_eq_ll(rt.reserved_count(), 1, "reserved unchanged");
        expect_true(!c.release(), "empty ticket release is a no-op");
    }

    // Test 3: Destructor returns a reservation, moves transfer ownership
    {
        ClientRuntime rt(1);
        {
            auto t = AdmissionTicket::reserve(rt);
            expect_eq_ll(rt.reserved_count(), 1, "held");
        }
        expect_eq_ll(rt.reserved_count(), 0, "returned on destruction");

        auto t = AdmissionTicket::reserve(rt);
        t.admit();
        AdmissionTicket moved = std::move(t);
        expect_true(!t.release(), "moved-from ticket holds nothing");
        expect_eq_ll(rt.active_count(), 1, "still active");
        expect_true(moved.release(), "moved-to ticket releases");
        expect_eq_ll(rt.active_count(), 0, "released once");
    }

    // Test 4: Concurrent reservations never exceed the maximum
    {
        ClientRuntime rt(8);
        std::atomic<int> granted{0};
        std::vector<std::thread> threads;
        std::vector<AdmissionTicket> tickets(32);
        for (int i = 0; i < 32; i++) {
            threads.emplace_back([&, i] {
                tickets[i] = AdmissionTicket::reserve(rt);
                if (tickets[i]) {
                    tickets[i].admit();
                    granted++;
                }
            });
        }
        for (auto& th : threads) th.join();
        expect_eq_ll(granted.load(), 8, "exactly max admitted");
        expect_eq_ll(rt.active_count(), 8, "active at max");
        tickets.clear();
        expect_eq_ll(rt.active_count(), 0, "all released");
    }

    // Test 5: Registry holds weak references
    {
        ClientRuntime rt;
        expect_eq_ll(rt.max_concurrent(), DEFAULT_MAX_CONCURRENT, "default max");
        expect_eq_ll((long long)rt.registered_count(), 0, "empty registry");
        expect_eq_ll((long long)rt.snapshot().size(), 0, "empty snapshot");
    }

    std::cerr << "test_runtime: ALL PASSED" << std::endl;
    return 0;
}
