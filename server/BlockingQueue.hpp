#pragma once
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>

using namespace std;

// Bounded FIFO with timed offer/poll.
template <typename T>
class BlockingQueue {
public:
    explicit BlockingQueue(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

    // false if still full after timeout
    bool offer(T item, chrono::milliseconds timeout) {
        unique_lock<mutex> lk(mtx_);
        if (!not_full_.wait_for(lk, timeout, [this] { return items_.size() < capacity_; })) {
            return false;
        }
        items_.push_back(move(item));
        lk.unlock();
        not_empty_.notify_one();
        return true;
    }

    // false if still empty after timeout
    bool poll(T &out, chrono::milliseconds timeout) {
        unique_lock<mutex> lk(mtx_);
        if (!not_empty_.wait_for(lk, timeout, [this] { return !items_.empty(); })) {
            return false;
        }
        out = move(items_.front());
        items_.pop_front();
        lk.unlock();
        not_full_.notify_one();
        return true;
    }

    bool try_poll(T &out) {
        return poll(out, chrono::milliseconds(0));
    }

    size_t size() const {
        lock_guard<mutex> lk(mtx_);
        return items_.size();
    }

    size_t capacity() const { return capacity_; }

private:
    size_t capacity_;
    deque<T> items_;
    mutable mutex mtx_;
    condition_variable not_empty_;
    condition_variable not_full_;
};
