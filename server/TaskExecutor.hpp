#pragma once
#include "Semaphore.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <queue>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace std;

// Thrown by TaskFuture::get(timeout) when the deadline passes first.
class TimeoutError : public runtime_error {
public:
    explicit TimeoutError(const string &what) : runtime_error(what) {}
};

class TaskFuture {
public:
    TaskFuture() = default;
    explicit TaskFuture(shared_future<bool> fut) : fut_(move(fut)) {}

    bool valid() const { return fut_.valid(); }
    bool ready() const;

    // Wait at most timeout. Throws TimeoutError if the task is still running;
    // the task is not cancelled. Rethrows whatever the task threw.
    bool get(chrono::milliseconds timeout) const;
    bool get() const;

private:
    shared_future<bool> fut_;
};

// Fixed pool of worker threads plus an admission semaphore of the same size.
// A task holds one permit for as long as it runs, so at most capacity() file
// operations are in flight however many sessions submit work.
class BoundedTaskExecutor {
public:
    using Task = function<bool()>;

    explicit BoundedTaskExecutor(size_t workers = 10);
    ~BoundedTaskExecutor();

    BoundedTaskExecutor(const BoundedTaskExecutor&) = delete;
    BoundedTaskExecutor& operator=(const BoundedTaskExecutor&) = delete;

    TaskFuture submit(Task task);

    // Run what is queued, then join the workers. Idempotent.
    void shutdown();

    int available_permits() const { return permits_.available(); }
    size_t pending() const;
    size_t capacity() const { return capacity_; }
    uint64_t completed() const { return completed_.load(); }

private:
    void worker_routine();

    size_t capacity_;
    vector<thread> workers_;
    queue<shared_ptr<packaged_task<bool()>>> tasks_;
    mutable mutex mtx_;
    condition_variable cv_;
    bool stop_ = false;
    Semaphore permits_;
    atomic<uint64_t> completed_{0};
};
