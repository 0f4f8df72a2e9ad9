#pragma once
#include <chrono>
#include <condition_variable>
#include <mutex>

using namespace std;

// Counting semaphore; waiters are woken in no particular order.
class Semaphore {
public:
    explicit Semaphore(int permits) : permits_(permits) {}

    void acquire();
    bool try_acquire();
    bool try_acquire_for(chrono::milliseconds timeout);
    void release();

    int available() const;

private:
    mutable mutex mtx_;
    condition_variable cv_;
    int permits_;
};

// Releases one permit on scope exit.
class SemaphorePermit {
public:
    explicit SemaphorePermit(Semaphore &sem) : sem_(sem) { sem_.acquire(); }
    ~SemaphorePermit() { sem_.release(); }

    SemaphorePermit(const SemaphorePermit&) = delete;
    SemaphorePermit& operator=(const SemaphorePermit&) = delete;

private:
    Semaphore &sem_;
};
