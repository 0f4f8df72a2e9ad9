#pragma once
#include "DataStream.hpp"
#include "FileLockRegistry.hpp"
#include "Logger.hpp"
#include "NotificationBroadcaster.hpp"
#include "TaskExecutor.hpp"
#include <atomic>
#include <chrono>
#include <ctime>
#include <memory>
#include <string>
#include <vector>

using namespace std;

enum class TransferError {
    None,
    NotFound,
    SizeMismatch,
    Timeout,
    IOError,
    InvalidPath,
    ProtocolDesync
};

const char* transfer_error_name(TransferError e);

struct TransferResult {
    bool success = false;
    string message;
    string path;
    TransferError error = TransferError::None;
    uint64_t bytes = 0;
};

struct SharedFileInfo {
    string name;
    uint64_t size = 0;
    time_t modified = 0;
};

struct CoordinatorStats {
    size_t total_file_locks = 0;
    int total_active_operations = 0;
    int available_permits = 0;
    size_t files_in_use = 0;
    size_t pending_tasks = 0;
    uint64_t uploads_ok = 0;
    uint64_t downloads_ok = 0;
    uint64_t deletes_ok = 0;
    uint64_t failures = 0;
};

// Runs uploads, downloads and deletes on the executor under per-file locks,
// bounded by a deadline. A timed-out call returns while the task finishes
// (and releases its lock and permit) in the background.
class TransferCoordinator {
public:
    TransferCoordinator(const string &root, FileLockRegistry &registry,
                        BoundedTaskExecutor &executor, Logger &logger,
                        NotificationBroadcaster *broadcaster = nullptr,
                        chrono::milliseconds timeout = chrono::milliseconds(30000));

    TransferResult handle_upload(const string &name, shared_ptr<DataSource> source,
                                 uint64_t declared_size, const string &uploader = "",
                                 uint64_t origin = 0);

    TransferResult handle_download(const string &name, shared_ptr<DataSink> sink);

    TransferResult handle_delete(const string &name, const string &requester = "",
                                 uint64_t origin = 0);

    bool can_delete(const string &name) const;

    // Poll every 100 ms until name has no active operation. false on timeout.
    bool await_idle(const string &name, int64_t timeout_ms) const;

    bool resolve(const string &name, string &path, string &err) const;

    bool list_files(vector<SharedFileInfo> &out, string &err) const;

    CoordinatorStats statistics() const;

    const string& root() const { return root_; }
    chrono::milliseconds timeout() const { return timeout_; }
    void set_timeout(chrono::milliseconds t) { timeout_ = t; }

private:
    TransferResult fail(TransferError error, const string &message, const string &path = "");

    string root_;
    FileLockRegistry &registry_;
    BoundedTaskExecutor &executor_;
    Logger &logger_;
    NotificationBroadcaster *broadcaster_;
    chrono::milliseconds timeout_;

    atomic<uint64_t> uploads_ok_{0};
    atomic<uint64_t> downloads_ok_{0};
    atomic<uint64_t> deletes_ok_{0};
    atomic<uint64_t> failures_{0};
};
