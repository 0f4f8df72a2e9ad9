#pragma once
#include "FairRWLock.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

using namespace std;

struct FileLockEntry {
    FairRWLock lock;
    atomic<int> active{0};
};

// Per-path reader/writer locks, created on first use and kept for the
// lifetime of the registry. Keys are canonical paths.
class FileLockRegistry {
public:
    enum class Mode { None, Read, Write };

    // Holds one lock on one path; releases on destruction.
    class Guard {
    public:
        Guard() = default;
        ~Guard();

        Guard(Guard &&other) noexcept;
        Guard& operator=(Guard &&other) noexcept;
        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;

        void release();
        bool owns() const { return mode_ != Mode::None; }
        Mode mode() const { return mode_; }
        const string& path() const { return path_; }

    private:
        friend class FileLockRegistry;
        Guard(shared_ptr<FileLockEntry> entry, Mode mode, const string &path);

        shared_ptr<FileLockEntry> entry_;
        Mode mode_ = Mode::None;
        string path_;
    };

    FileLockRegistry() = default;
    FileLockRegistry(const FileLockRegistry&) = delete;
    FileLockRegistry& operator=(const FileLockRegistry&) = delete;

    // Block until the lock is granted (FIFO with other requests on path).
    Guard acquire_read(const string &path);
    Guard acquire_write(const string &path);

    bool is_in_use(const string &path) const;
    int active_count(const string &path) const;

    size_t lock_count() const;
    int total_active() const;
    size_t files_in_use() const;

private:
    shared_ptr<FileLockEntry> entry_for(const string &path);
    shared_ptr<FileLockEntry> find(const string &path) const;

    mutable mutex mtx_;
    unordered_map<string, shared_ptr<FileLockEntry>> locks_;
};
