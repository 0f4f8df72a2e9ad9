#include "TaskExecutor.hpp"

bool TaskFuture::ready() const {
    return fut_.valid() &&
           fut_.wait_for(chrono::milliseconds(0)) == future_status::ready;
}

bool TaskFuture::get(chrono::milliseconds timeout) const {
    if (!fut_.valid()) throw runtime_error("TaskFuture has no task");
    if (fut_.wait_for(timeout) != future_status::ready) {
        throw TimeoutError("task did not finish within " +
                           to_string(timeout.count()) + " ms");
    }
    return fut_.get();
}

bool TaskFuture::get() const {
    if (!fut_.valid()) throw runtime_error("TaskFuture has no task");
    return fut_.get();
}

BoundedTaskExecutor::BoundedTaskExecutor(size_t workers)
    : capacity_(workers == 0 ? 1 : workers),
      permits_((int)capacity_) {
    workers_.reserve(capacity_);
    for (size_t i = 0; i < capacity_; i++) {
        workers_.emplace_back([this] { worker_routine(); });
    }
}

BoundedTaskExecutor::~BoundedTaskExecutor() {
    shutdown();
}

TaskFuture BoundedTaskExecutor::submit(Task task) {
    auto job = make_shared<packaged_task<bool()>>(move(task));
    shared_future<bool> fut = job->get_future().share();
    {
        lock_guard<mutex> lock(mtx_);
        if (stop_) {
            promise<bool> rejected;
            rejected.set_value(false);
            return TaskFuture(rejected.get_future().share());
        }
        tasks_.push(move(job));
    }
    cv_.notify_one();
    return TaskFuture(move(fut));
}

void BoundedTaskExecutor::shutdown() {
    {
        lock_guard<mutex> lock(mtx_);
        if (stop_ && workers_.empty()) return;
        stop_ = true;
    }
    cv_.notify_all();
    for (auto &t : workers_) {
        if (t.joinable()) t.join();
    }
    workers_.clear();
}

size_t BoundedTaskExecutor::pending() const {
    lock_guard<mutex> lock(mtx_);
    return tasks_.size();
}

void BoundedTaskExecutor::worker_routine() {
    while (true) {
        shared_ptr<packaged_task<bool()>> job;
        {
            unique_lock<mutex> lock(mtx_);
            cv_.wait(lock, [this] { return stop_ || !tasks_.empty(); });
            if (stop_ && tasks_.empty()) return;
            job = move(tasks_.front());
            tasks_.pop();
        }

        // permit is taken before the task touches any file lock
        SemaphorePermit permit(permits_);
        (*job)();
        completed_++;
    }
}
