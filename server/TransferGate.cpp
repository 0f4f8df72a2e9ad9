#include "TransferGate.hpp"

void TransferGate::enter() {
    lock_guard<mutex> lk(mtx_);
    active_ = true;
}

void TransferGate::leave() {
    {
        lock_guard<mutex> lk(mtx_);
        active_ = false;
    }
    cv_.notify_all();
}

bool TransferGate::active() const {
    lock_guard<mutex> lk(mtx_);
    return active_;
}

void TransferGate::wait_idle() {
    unique_lock<mutex> lk(mtx_);
    cv_.wait(lk, [this] { return !active_; });
}

bool TransferGate::wait_idle_for(chrono::milliseconds timeout) {
    unique_lock<mutex> lk(mtx_);
    return cv_.wait_for(lk, timeout, [this] { return !active_; });
}
