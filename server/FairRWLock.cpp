#include "FairRWLock.hpp"

void FairRWLock::lock_shared() {
    unique_lock<mutex> lk(mtx_);
    uint64_t ticket = next_ticket_++;
    cv_.wait(lk, [&] { return ticket == serving_ && !writer_; });
    ++readers_;
    ++serving_;
    // the next ticket may be another reader
    cv_.notify_all();
}

void FairRWLock::unlock_shared() {
    lock_guard<mutex> lk(mtx_);
    if (readers_ > 0) --readers_;
    if (readers_ == 0) cv_.notify_all();
}

void FairRWLock::lock() {
    unique_lock<mutex> lk(mtx_);
    uint64_t ticket = next_ticket_++;
    cv_.wait(lk, [&] { return ticket == serving_ && !writer_ && readers_ == 0; });
    writer_ = true;
    ++serving_;
}

void FairRWLock::unlock() {
    lock_guard<mutex> lk(mtx_);
    writer_ = false;
    cv_.notify_all();
}

int FairRWLock::readers() const {
    lock_guard<mutex> lk(mtx_);
    return readers_;
}

uint64_t FairRWLock::waiting() const {
    lock_guard<mutex> lk(mtx_);
    return next_ticket_ - serving_;
}
