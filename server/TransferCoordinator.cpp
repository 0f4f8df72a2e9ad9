#include "TransferCoordinator.hpp"
#include "../common/Protocol.hpp"
#include "../common/Utils.hpp"
#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <sys/stat.h>
#include <thread>

namespace {

struct TaskOutcome {
    TransferError error = TransferError::None;
    string message;
    uint64_t bytes = 0;

    // caller gave up waiting / file renamed into place; guarded by mtx
    mutex mtx;
    bool abandoned = false;
    bool committed = false;

    // true if the caller had already timed out
    bool commit() {
        lock_guard<mutex> lk(mtx);
        committed = true;
        return abandoned;
    }
    // true if the file was already in place
    bool abandon() {
        lock_guard<mutex> lk(mtx);
        abandoned = true;
        return committed;
    }
};

// Calls end() on the stream when the task is done with it.
template <typename Stream>
struct EndOnExit {
    shared_ptr<Stream> stream;
    ~EndOnExit() { if (stream) stream->end(); }
};

string parent_dir(const string &path) {
    size_t pos = path.find_last_of('/');
    if (pos == string::npos || pos == 0) return "/";
    return path.substr(0, pos);
}

} // namespace

const char* transfer_error_name(TransferError e) {
    switch (e) {
    case TransferError::None:           return "None";
    case TransferError::NotFound:       return "NotFound";
    case TransferError::SizeMismatch:   return "SizeMismatch";
    case TransferError::Timeout:        return "Timeout";
    case TransferError::IOError:        return "IOError";
    case TransferError::InvalidPath:    return "InvalidPath";
    case TransferError::ProtocolDesync: return "ProtocolDesync";
    }
    return "Unknown";
}

TransferCoordinator::TransferCoordinator(const string &root, FileLockRegistry &registry,
                                         BoundedTaskExecutor &executor, Logger &logger,
                                         NotificationBroadcaster *broadcaster,
                                         chrono::milliseconds timeout)
    : root_(root),
      registry_(registry),
      executor_(executor),
      logger_(logger),
      broadcaster_(broadcaster),
      timeout_(timeout) {}

TransferResult TransferCoordinator::fail(TransferError error, const string &message,
                                         const string &path) {
    failures_++;
    TransferResult r;
    r.success = false;
    r.error = error;
    r.message = message;
    r.path = path;
    return r;
}

bool TransferCoordinator::resolve(const string &name, string &path, string &err) const {
    return utils::resolve_under_root(root_, name, path, err);
}

TransferResult TransferCoordinator::handle_upload(const string &name,
                                                  shared_ptr<DataSource> source,
                                                  uint64_t declared_size,
                                                  const string &uploader,
                                                  uint64_t origin) {
    string path, err;
    if (!resolve(name, path, err)) {
        if (source) source->end();
        logger_.warn("transfer", "upload rejected '" + name + "': " + err);
        return fail(TransferError::InvalidPath, "Invalid file name: " + err);
    }
    if (!source) return fail(TransferError::IOError, "No data source", path);

    if (registry_.is_in_use(path)) {
        logger_.log("transfer", "upload of " + name + " waits for " +
                                to_string(registry_.active_count(path)) + " active operation(s)");
    }

    auto outcome = make_shared<TaskOutcome>();
    FileLockRegistry &registry = registry_;
    Logger &logger = logger_;

    TaskFuture fut = executor_.submit([&registry, &logger, path, source, declared_size, outcome]() -> bool {
        EndOnExit<DataSource> end_guard{source};
        FileLockRegistry::Guard lock = registry.acquire_write(path);

        if (!utils::ensure_dir(parent_dir(path))) {
            outcome->error = TransferError::IOError;
            outcome->message = "Cannot create directory";
            return false;
        }

        string tmp = utils::temp_path_for(path);
        ofstream out(tmp, ios::binary | ios::trunc);
        if (!out) {
            outcome->error = TransferError::IOError;
            outcome->message = "Cannot open file for writing";
            return false;
        }

        vector<char> buf(proto::CHUNK_SIZE);
        uint64_t total = 0;
        bool ok = true;
        while (total < declared_size) {
            size_t want = (size_t)min<uint64_t>(buf.size(), declared_size - total);
            ssize_t n = source->read_some(buf.data(), want);
            if (n == 0) {
                outcome->error = TransferError::SizeMismatch;
                outcome->message = "Size mismatch: expected " + to_string(declared_size) +
                                   " bytes, received " + to_string(total);
                ok = false;
                break;
            }
            if (n < 0) {
                outcome->error = TransferError::IOError;
                outcome->message = "Read failed: " + source->error();
                ok = false;
                break;
            }
            out.write(buf.data(), n);
            if (!out) {
                outcome->error = TransferError::IOError;
                outcome->message = "Write failed";
                ok = false;
                break;
            }
            total += (uint64_t)n;
        }

        if (ok && !source->finish()) {
            outcome->error = TransferError::SizeMismatch;
            outcome->message = "Size mismatch: more than " + to_string(declared_size) +
                               " bytes sent";
            ok = false;
        }

        out.close();
        if (ok && out.fail()) {
            outcome->error = TransferError::IOError;
            outcome->message = "Write failed";
            ok = false;
        }
        if (!ok) {
            ::remove(tmp.c_str());
            logger.warn("transfer", "upload " + path + " failed: " + outcome->message);
            return false;
        }

        if (::rename(tmp.c_str(), path.c_str()) != 0) {
            outcome->error = TransferError::IOError;
            outcome->message = string("Cannot move file into place: ") + strerror(errno);
            ::remove(tmp.c_str());
            return false;
        }
        outcome->bytes = total;
        if (outcome->commit()) {
            logger.warn("transfer", "upload " + path + " committed after its caller timed out (" +
                                    to_string(total) + " bytes, no NEW_FILE sent)");
        }
        return true;
    });

    bool ok = false;
    try {
        ok = fut.get(timeout_);
    } catch (const TimeoutError &) {
        logger_.warn("transfer", "upload " + name + " timed out after " +
                                 to_string(timeout_.count()) + " ms");
        if (outcome->abandon()) {
            logger_.warn("transfer", "upload " + path + " committed after its caller timed out (" +
                                     to_string(outcome->bytes) + " bytes, no NEW_FILE sent)");
        }
        return fail(TransferError::Timeout, "Upload timeout", path);
    } catch (const exception &e) {
        source->end();
        logger_.error("transfer", "upload " + name + " threw: " + e.what());
        return fail(TransferError::IOError, e.what(), path);
    }
    source->end();

    if (!ok) {
        TransferError e = outcome->error == TransferError::None ? TransferError::IOError
                                                                : outcome->error;
        string msg = outcome->message.empty() ? "Upload failed" : outcome->message;
        return fail(e, msg, path);
    }

    uploads_ok_++;
    logger_.log("transfer", "uploaded " + name + " (" + to_string(outcome->bytes) + " bytes)" +
                            (uploader.empty() ? "" : " by " + uploader));
    if (broadcaster_) {
        broadcaster_->notify_new_file(name, uploader.empty() ? "anonymous" : uploader, origin);
    }

    TransferResult r;
    r.success = true;
    r.message = "File uploaded successfully";
    r.path = path;
    r.bytes = outcome->bytes;
    return r;
}

TransferResult TransferCoordinator::handle_download(const string &name, shared_ptr<DataSink> sink) {
    string path, err;
    if (!resolve(name, path, err)) {
        if (sink) sink->end();
        return fail(TransferError::InvalidPath, "Invalid file name: " + err);
    }
    if (!utils::file_exists(path)) {
        if (sink) sink->end();
        return fail(TransferError::NotFound, "File not found", path);
    }
    if (!sink) return fail(TransferError::IOError, "No data sink", path);

    auto outcome = make_shared<TaskOutcome>();
    FileLockRegistry &registry = registry_;

    TaskFuture fut = executor_.submit([&registry, path, sink, outcome]() -> bool {
        EndOnExit<DataSink> end_guard{sink};
        FileLockRegistry::Guard lock = registry.acquire_read(path);

        // may have been deleted while we waited for the lock
        if (!utils::file_exists(path)) {
            outcome->error = TransferError::NotFound;
            outcome->message = "File not found";
            return false;
        }
        ifstream in(path, ios::binary);
        if (!in) {
            outcome->error = TransferError::IOError;
            outcome->message = "Cannot open file";
            return false;
        }
        uint64_t size = utils::file_size(path);
        if (!sink->begin(size)) {
            outcome->error = TransferError::IOError;
            outcome->message = "Transfer aborted: " + sink->error();
            return false;
        }

        vector<char> buf(proto::CHUNK_SIZE);
        uint64_t total = 0;
        while (total < size) {
            size_t want = (size_t)min<uint64_t>(buf.size(), size - total);
            in.read(buf.data(), (streamsize)want);
            streamsize n = in.gcount();
            if (n <= 0) {
                outcome->error = TransferError::IOError;
                outcome->message = "Short read";
                return false;
            }
            if (!sink->write_all(buf.data(), (size_t)n)) {
                outcome->error = TransferError::IOError;
                outcome->message = "Send failed: " + sink->error();
                return false;
            }
            total += (uint64_t)n;
        }
        outcome->bytes = total;
        return true;
    });

    bool ok = false;
    try {
        ok = fut.get(timeout_);
    } catch (const TimeoutError &) {
        logger_.warn("transfer", "download " + name + " timed out after " +
                                 to_string(timeout_.count()) + " ms");
        return fail(TransferError::Timeout, "Download timeout", path);
    } catch (const exception &e) {
        sink->end();
        logger_.error("transfer", "download " + name + " threw: " + e.what());
        return fail(TransferError::IOError, e.what(), path);
    }
    sink->end();

    if (!ok) {
        TransferError e = outcome->error == TransferError::None ? TransferError::IOError
                                                                : outcome->error;
        string msg = outcome->message.empty() ? "Download failed" : outcome->message;
        logger_.warn("transfer", "download " + name + " failed: " + msg);
        return fail(e, msg, path);
    }

    downloads_ok_++;
    logger_.log("transfer", "downloaded " + name + " (" + to_string(outcome->bytes) + " bytes)");

    TransferResult r;
    r.success = true;
    r.message = "File downloaded successfully";
    r.path = path;
    r.bytes = outcome->bytes;
    return r;
}

TransferResult TransferCoordinator::handle_delete(const string &name, const string &requester,
                                                  uint64_t origin) {
    string path, err;
    if (!resolve(name, path, err)) {
        return fail(TransferError::InvalidPath, "Invalid file name: " + err);
    }
    if (!utils::file_exists(path)) {
        return fail(TransferError::NotFound, "File not found", path);
    }
    if (!await_idle(name, 5000)) {
        return fail(TransferError::Timeout, "File is in use", path);
    }

    auto outcome = make_shared<TaskOutcome>();
    FileLockRegistry &registry = registry_;

    TaskFuture fut = executor_.submit([&registry, path, outcome]() -> bool {
        FileLockRegistry::Guard lock = registry.acquire_write(path);
        if (!utils::file_exists(path)) {
            outcome->error = TransferError::NotFound;
            outcome->message = "File not found";
            return false;
        }
        if (::remove(path.c_str()) != 0) {
            outcome->error = TransferError::IOError;
            outcome->message = string("Cannot delete file: ") + strerror(errno);
            return false;
        }
        return true;
    });

    bool ok = false;
    try {
        ok = fut.get(timeout_);
    } catch (const TimeoutError &) {
        return fail(TransferError::Timeout, "Delete timeout", path);
    } catch (const exception &e) {
        return fail(TransferError::IOError, e.what(), path);
    }
    if (!ok) {
        TransferError e = outcome->error == TransferError::None ? TransferError::IOError
                                                                : outcome->error;
        return fail(e, outcome->message.empty() ? "Delete failed" : outcome->message, path);
    }

    deletes_ok_++;
    logger_.log("transfer", "deleted " + name + (requester.empty() ? "" : " by " + requester));
    if (broadcaster_) {
        broadcaster_->notify_file_deleted(name, requester.empty() ? "anonymous" : requester, origin);
    }

    TransferResult r;
    r.success = true;
    r.message = "File deleted successfully";
    r.path = path;
    return r;
}

bool TransferCoordinator::can_delete(const string &name) const {
    string path, err;
    if (!resolve(name, path, err)) return false;
    return !registry_.is_in_use(path);
}

bool TransferCoordinator::await_idle(const string &name, int64_t timeout_ms) const {
    string path, err;
    if (!resolve(name, path, err)) return false;

    auto deadline = chrono::steady_clock::now() + chrono::milliseconds(timeout_ms);
    while (registry_.is_in_use(path)) {
        if (chrono::steady_clock::now() >= deadline) return false;
        this_thread::sleep_for(chrono::milliseconds(100));
    }
    return true;
}

bool TransferCoordinator::list_files(vector<SharedFileInfo> &out, string &err) const {
    namespace fs = std::filesystem;
    out.clear();

    error_code ec;
    fs::directory_iterator it(root_, ec);
    if (ec) {
        err = "Cannot read shared directory: " + ec.message();
        return false;
    }
    for (const auto &entry : it) {
        string name = entry.path().filename().string();
        if (utils::is_hidden_name(name)) continue;

        struct stat st {};
        if (::stat(entry.path().c_str(), &st) != 0 || !S_ISREG(st.st_mode)) continue;

        SharedFileInfo info;
        info.name = name;
        info.size = (uint64_t)st.st_size;
        info.modified = st.st_mtime;
        out.push_back(info);
    }
    sort(out.begin(), out.end(),
         [](const SharedFileInfo &a, const SharedFileInfo &b) { return a.name < b.name; });
    return true;
}

CoordinatorStats TransferCoordinator::statistics() const {
    CoordinatorStats st;
    st.total_file_locks = registry_.lock_count();
    st.total_active_operations = registry_.total_active();
    st.available_permits = executor_.available_permits();
    st.files_in_use = registry_.files_in_use();
    st.pending_tasks = executor_.pending();
    st.uploads_ok = uploads_ok_;
    st.downloads_ok = downloads_ok_;
    st.deletes_ok = deletes_ok_;
    st.failures = failures_;
    return st;
}
