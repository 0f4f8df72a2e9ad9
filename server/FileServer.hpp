#pragma once
#include <string>
#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <unordered_set>
#include "ChatHandler.hpp"
#include "Db.hpp"
#include "FileLockRegistry.hpp"
#include "Logger.hpp"
#include "NotificationBroadcaster.hpp"
#include "ServerConfig.hpp"
#include "TaskExecutor.hpp"
#include "TransferCoordinator.hpp"

using namespace std;

// Server context: owns every registry a session needs. No globals.
class FileServer {
public:
    explicit FileServer(const ServerConfig &cfg);
    ~FileServer();

    FileServer(const FileServer&) = delete;
    FileServer& operator=(const FileServer&) = delete;

    // Create the shared root, bind, listen, start the broadcaster.
    bool start(string &err);

    // Accept loop; returns after stop().
    void run();

    // Announce shutdown, close sessions, stop the broadcaster. Idempotent.
    void stop();

    bool running() const { return running_.load(); }
    int port() const { return bound_port_; }

    const ServerConfig& config() const { return config_; }
    Logger& logger() { return logger_; }
    Db& db() { return *db_; }
    FileLockRegistry& locks() { return registry_; }
    BoundedTaskExecutor& executor() { return executor_; }
    NotificationBroadcaster& broadcaster() { return broadcaster_; }
    TransferCoordinator& coordinator() { return coordinator_; }

    void add_bytes_in(uint64_t n)  { bytes_in_  += n; }
    void add_bytes_out(uint64_t n) { bytes_out_ += n; }

    uint64_t bytes_in()  const { return bytes_in_.load(); }
    uint64_t bytes_out() const { return bytes_out_.load(); }

    const string& root_dir() const { return config_.root_dir; }

    uint64_t next_channel_id() { return ++channel_seq_; }
    size_t session_count() const;

    // ===== ONLINE USER MANAGEMENT =====
    bool is_user_online(const string &user) const;
    void user_login(const string &user);
    void user_logout(const string &user);
    int online_users_count() const;

    void set_chat_handler(shared_ptr<ChatHandler> handler);
    shared_ptr<ChatHandler> chat_handler() const;

    // key=value|key=value... for STATS and the console
    string stats_summary() const;

private:
    void serve(int connfd, const string &remote);
    void session_started(int fd);
    void session_finished(int fd);

    ServerConfig config_;
    Logger logger_;
    unique_ptr<Db> db_;
    FileLockRegistry registry_;
    BoundedTaskExecutor executor_;
    NotificationBroadcaster broadcaster_;
    TransferCoordinator coordinator_;

    int listen_fd_ = -1;
    int bound_port_ = 0;
    atomic<bool> running_{false};
    atomic<bool> stopped_{false};
    mutex stop_mtx_;

    atomic<uint64_t> bytes_in_{0};
    atomic<uint64_t> bytes_out_{0};
    atomic<uint64_t> channel_seq_{0};

    mutable mutex sessions_mtx_;
    condition_variable sessions_cv_;
    unordered_set<int> session_fds_;

    // user -> number of logged-in sessions
    mutable mutex online_mtx_;
    unordered_map<string, int> online_users_;

    mutable mutex chat_mtx_;
    shared_ptr<ChatHandler> chat_;
};
