#include "FileLockRegistry.hpp"

FileLockRegistry::Guard::Guard(shared_ptr<FileLockEntry> entry, Mode mode, const string &path)
    : entry_(move(entry)),
      mode_(mode),
      path_(path) {}

FileLockRegistry::Guard::~Guard() {
    release();
}

FileLockRegistry::Guard::Guard(Guard &&other) noexcept
    : entry_(move(other.entry_)),
      mode_(other.mode_),
      path_(move(other.path_)) {
    other.mode_ = Mode::None;
}

FileLockRegistry::Guard& FileLockRegistry::Guard::operator=(Guard &&other) noexcept {
    if (this != &other) {
        release();
        entry_ = move(other.entry_);
        mode_  = other.mode_;
        path_  = move(other.path_);
        other.mode_ = Mode::None;
    }
    return *this;
}

void FileLockRegistry::Guard::release() {
    if (mode_ == Mode::None || !entry_) return;

    entry_->active.fetch_sub(1);
    if (mode_ == Mode::Read)
        entry_->lock.unlock_shared();
    else
        entry_->lock.unlock();

    mode_ = Mode::None;
    entry_.reset();
}

shared_ptr<FileLockEntry> FileLockRegistry::entry_for(const string &path) {
    lock_guard<mutex> lock(mtx_);
    auto &slot = locks_[path];
    if (!slot) slot = make_shared<FileLockEntry>();
    return slot;
}

shared_ptr<FileLockEntry> FileLockRegistry::find(const string &path) const {
    lock_guard<mutex> lock(mtx_);
    auto it = locks_.find(path);
    if (it == locks_.end()) return nullptr;
    return it->second;
}

FileLockRegistry::Guard FileLockRegistry::acquire_read(const string &path) {
    shared_ptr<FileLockEntry> entry = entry_for(path);
    entry->lock.lock_shared();
    entry->active.fetch_add(1);
    return Guard(entry, Mode::Read, path);
}

FileLockRegistry::Guard FileLockRegistry::acquire_write(const string &path) {
    shared_ptr<FileLockEntry> entry = entry_for(path);
    entry->lock.lock();
    entry->active.fetch_add(1);
    return Guard(entry, Mode::Write, path);
}

bool FileLockRegistry::is_in_use(const string &path) const {
    return active_count(path) > 0;
}

int FileLockRegistry::active_count(const string &path) const {
    shared_ptr<FileLockEntry> entry = find(path);
    return entry ? entry->active.load() : 0;
}

size_t FileLockRegistry::lock_count() const {
    lock_guard<mutex> lock(mtx_);
    return locks_.size();
}

int FileLockRegistry::total_active() const {
    lock_guard<mutex> lock(mtx_);
    int total = 0;
    for (auto &p : locks_) total += p.second->active.load();
    return total;
}

size_t FileLockRegistry::files_in_use() const {
    lock_guard<mutex> lock(mtx_);
    size_t n = 0;
    for (auto &p : locks_) {
        if (p.second->active.load() > 0) n++;
    }
    return n;
}
