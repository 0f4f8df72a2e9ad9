#pragma once
#include <condition_variable>
#include <cstdint>
#include <mutex>

using namespace std;

// Reader/writer lock that grants requests strictly in arrival order.
// Each request draws a ticket; only the request holding the current ticket may
// proceed, so a queued writer holds back every reader that arrived after it.
// Consecutive readers are admitted together.
class FairRWLock {
public:
    FairRWLock() = default;
    FairRWLock(const FairRWLock&) = delete;
    FairRWLock& operator=(const FairRWLock&) = delete;

    void lock_shared();
    void unlock_shared();

    void lock();
    void unlock();

    int readers() const;
    uint64_t waiting() const;

private:
    mutable mutex mtx_;
    condition_variable cv_;
    uint64_t next_ticket_ = 0;
    uint64_t serving_ = 0;
    int readers_ = 0;
    bool writer_ = false;
};
