#include "toolgate/runtime.h"
#include "toolgate/config.h"

namespace toolgate {

ClientRuntime::ClientRuntime(int max_concurrent)
    : max_(max_concurrent > 0 ? max_concurrent : DEFAULT_MAX_CONCURRENT) {}

ClientRuntime& ClientRuntime::global() {
    static ClientRuntime rt(load_runtime_options().max_concurrent);
    return rt;
}

bool ClientRuntime::try_reserve() {
    std::lock_guard<std::mutex> lk(mu_);
    if (active_ + reserved_ >= max_) return false;
    reserved_++;
    return true;
}

void ClientRuntime::cancel_reservation() {
    std::lock_guard<std::mutex> lk(mu_);
    if (reserved_ > 0) reserved_--;
}

void ClientRuntime::commit_reservation() {
    std::lock_guard<std::mutex> lk(mu_);
    if (reserved_ > 0) reserved_--;
    if (active_ < max_) active_++;
}

void ClientRuntime::release() {
    std::lock_guard<std::mutex> lk(mu_);
    if (active_ > 0) active_--;
}

int ClientRuntime::active_count() const {
    std::lock_guard<std::mutex> lk(mu_);
    return active_;
}

int ClientRuntime::reserved_count() const {
    std::lock_guard<std::mutex> lk(mu_);
    return reserved_;
}

void ClientRuntime::add(const std::shared_ptr<Client>& c) {
    if (!c) return;
    std::lock_guard<std::mutex> lk(mu_);
    clients_[c.get()] = c;
}

void ClientRuntime::remove(const Client* c) {
    std::lock_guard<std::mutex> lk(mu_);
    clients_.erase(c);
}

bool ClientRuntime::contains(const Client* c) const {
    std::lock_guard<std::mutex> lk(mu_);
    return clients_.count(c) > 0;
}

size_t ClientRuntime::registered_count() const {
    std::lock_guard<std::mutex> lk(mu_);
    return clients_.size();
}

std::vector<std::shared_ptr<Client>> ClientRuntime::snapshot() const {
    std::vector<std::shared_ptr<Client>> out;
    std::lock_guard<std::mutex> lk(mu_);
    out.reserve(clients_.size());
    for (const auto& kv : clients_) {
        if (auto c = kv.second.lock()) out.push_back(std::move(c));
    }
    return out;
}

// --- AdmissionTicket ---

AdmissionTicket AdmissionTicket::reserve(ClientRuntime& rt) {
    AdmissionTicket t;
    if (rt.try_reserve()) {
        t.rt_ = &rt;
        t.state_ = State::RESERVED;
    }
    return t;
}

void AdmissionTicket::admit() {
    if (state_ != State::RESERVED || !rt_) return;
    rt_->commit_reservation();
    state_ = State::ADMITTED;
}

bool AdmissionTicket::release() {
    if (!rt_) return false;
    bool decremented = false;
    if (state_ == State::RESERVED) {
        rt_->cancel_reservation();
    } else if (state_ == State::ADMITTED) {
        rt_->release();
        decremented = true;
    }
    if (state_ != State::EMPTY) state_ = State::RELEASED;
    return decremented;
}

} // namespace toolgate
