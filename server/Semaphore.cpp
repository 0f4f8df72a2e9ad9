#include "Semaphore.hpp"

void Semaphore::acquire() {
    unique_lock<mutex> lk(mtx_);
    cv_.wait(lk, [this] { return permits_ > 0; });
    --permits_;
}

bool Semaphore::try_acquire() {
    lock_guard<mutex> lk(mtx_);
    if (permits_ <= 0) return false;
    --permits_;
    return true;
}

bool Semaphore::try_acquire_for(chrono::milliseconds timeout) {
    unique_lock<mutex> lk(mtx_);
    if (!cv_.wait_for(lk, timeout, [this] { return permits_ > 0; })) return false;
    --permits_;
    return true;
}

void Semaphore::release() {
    {
        lock_guard<mutex> lk(mtx_);
        ++permits_;
    }
    cv_.notify_one();
}

int Semaphore::available() const {
    lock_guard<mutex> lk(mtx_);
    return permits_;
}
