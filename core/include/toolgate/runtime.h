#pragma once

// Process-wide coordination point for the connection manager.
//
// One mutex guards both pieces of shared mutable state:
//   - admission: how many connections are live (and how many connects are
//     in flight holding a reservation), bounded by max_concurrent
//   - registry: every Client constructed and not yet closed
//
// Invariant: 0 <= active <= max_concurrent and active + reserved <= max.
// A connect reserves a slot before spawning and commits it only when the
// handshake completes, so concurrent connects can never admit past max.

#include <cstddef>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace toolgate {

constexpr int DEFAULT_MAX_CONCURRENT = 8;

class Client;

class ClientRuntime {
public:
    explicit ClientRuntime(int max_concurrent = DEFAULT_MAX_CONCURRENT);

    ClientRuntime(const ClientRuntime&) = delete;
    ClientRuntime& operator=(const ClientRuntime&) = delete;

    // Shared instance used by Client::create() and the shutdown hook.
    // Sized from TOOLGATE_MAX_CONCURRENT on first use.
    static ClientRuntime& global();

    int max_concurrent() const { return max_; }

    // Admission. try_reserve() is the atomic check-then-reserve step.
    bool try_reserve();
    void cancel_reservation();
    void commit_reservation();
    void release();

    int active_count() const;
    int reserved_count() const;

    // Registry.
    void add(const std::shared_ptr<Client>& c);
    void remove(const Client* c);
    bool contains(const Client* c) const;
    size_t registered_count() const;

    // Live members at the time of the call. Clients being destroyed are skipped.
    std::vector<std::shared_ptr<Client>> snapshot() const;

private:
    mutable std::mutex mu_;
    const int max_;
    int active_{0};
    int reserved_{0};
    std::unordered_map<const Client*, std::weak_ptr<Client>> clients_;
};

// Move-only claim on one admission slot.
//
//   RESERVED --admit()--> ADMITTED --release()--> RELEASED
//   RESERVED --release()------------------------> RELEASED
//
// release() is idempotent and decrements the active count only when the
// ticket had been admitted; the destructor releases whatever is held.
// Not synchronized: the owner serializes access.
class AdmissionTicket {
public:
    enum class State { EMPTY, RESERVED, ADMITTED, RELEASED };

    AdmissionTicket() = default;
    ~AdmissionTicket() { release(); }

    AdmissionTicket(const AdmissionTicket&) = delete;
    AdmissionTicket& operator=(const AdmissionTicket&) = delete;

    AdmissionTicket(AdmissionTicket&& other) noexcept
        : rt_(other.rt_), state_(other.state_) {
        other.rt_ = nullptr;
        other.state_ = State::EMPTY;
    }
    AdmissionTicket& operator=(AdmissionTicket&& other) noexcept {
        if (this != &other) {
            release();
            rt_ = other.rt_;
            state_ = other.state_;
            other.rt_ = nullptr;
            other.state_ = State::EMPTY;
        }
        return *this;
    }

    // EMPTY ticket when the budget is exhausted.
    static AdmissionTicket reserve(ClientRuntime& rt);

    explicit operator bool() const { return state_ == State::RESERVED || state_ == State::ADMITTED; }
    State state() const { return state_; }
    bool admitted() const { return state_ == State::ADMITTED; }

    void admit();

    // Returns true if this call decremented the active count.
    bool release();

private:
    ClientRuntime* rt_{nullptr};
    State state_{State::EMPTY};
};

} // namespace toolgate
