#include "FileServer.hpp"
#include "ClientSession.hpp"
#include "DbSqlite.hpp"
#include "../common/Utils.hpp"
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <poll.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <thread>
#include <iostream>

using namespace std;

namespace {
BroadcasterOptions broadcaster_options(const ServerConfig &cfg) {
    BroadcasterOptions opts;
    opts.udp_enabled = cfg.udp_enabled;
    opts.udp_port = cfg.udp_port;
    opts.udp_address = cfg.udp_address;
    return opts;
}

// Accept loop wakes up this often to notice stop()
const int ACCEPT_POLL_MS = 200;
} // namespace

FileServer::FileServer(const ServerConfig &cfg)
    : config_(cfg),
      logger_(cfg.log_path, cfg.log_echo),
      db_(make_unique<DbSqlite>(cfg.db_path)),
      executor_(cfg.worker_count),
      broadcaster_(logger_, broadcaster_options(cfg)),
      coordinator_(cfg.root_dir, registry_, executor_, logger_, &broadcaster_,
                   chrono::milliseconds(cfg.op_timeout_ms)) {
    string err;
    if (!db_->init_schema(err)) {
        cerr << "DB init failed: " << err << "\n";
        logger_.error("server", "DB init failed: " + err);
    }
}

FileServer::~FileServer() {
    stop();
    // queued transfer tasks still reference the registry and the logger
    executor_.shutdown();
    if (listen_fd_ >= 0) {
        ::close(listen_fd_);
        listen_fd_ = -1;
    }
}

bool FileServer::start(string &err) {
    if (!utils::ensure_dir(config_.root_dir)) {
        err = "cannot create shared directory " + config_.root_dir;
        return false;
    }

    int listenfd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (listenfd < 0) {
        err = string("socket: ") + strerror(errno);
        return false;
    }
    int opt = 1;
    setsockopt(listenfd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));
    sockaddr_in addr{};
    addr.sin_family      = AF_INET;
    addr.sin_addr.s_addr = INADDR_ANY;
    addr.sin_port        = htons((uint16_t)config_.port);
    if (::bind(listenfd, (sockaddr*)&addr, sizeof(addr)) < 0) {
        err = string("bind: ") + strerror(errno);
        close(listenfd);
        return false;
    }
    if (::listen(listenfd, 16) < 0) {
        err = string("listen: ") + strerror(errno);
        close(listenfd);
        return false;
    }

    sockaddr_in bound{};
    socklen_t blen = sizeof(bound);
    if (::getsockname(listenfd, (sockaddr*)&bound, &blen) == 0) {
        bound_port_ = ntohs(bound.sin_port);
    } else {
        bound_port_ = config_.port;
    }

    if (!broadcaster_.start(err)) {
        close(listenfd);
        return false;
    }

    listen_fd_ = listenfd;
    running_ = true;
    logger_.log("server", "listening on port " + to_string(bound_port_) +
                          ", shared root " + config_.root_dir +
                          ", " + to_string(executor_.capacity()) + " workers");
    int64_t users = 0;
    string db_err;
    if (db_->count_users(users, db_err)) {
        logger_.log("server", to_string(users) + " registered user(s)");
    } else {
        logger_.warn("server", "cannot count users: " + db_err);
    }
    broadcaster_.notify_server_message("Server started on port " + to_string(bound_port_));
    return true;
}

void FileServer::run() {
    while (running_) {
        pollfd p{};
        p.fd = listen_fd_;
        p.events = POLLIN;
        int rc = ::poll(&p, 1, ACCEPT_POLL_MS);
        if (rc < 0) {
            if (errno == EINTR) continue;
            perror("poll");
            break;
        }
        if (rc == 0 || !(p.revents & POLLIN)) continue;

        sockaddr_in cli{};
        socklen_t len = sizeof(cli);
        int connfd = ::accept(listen_fd_, (sockaddr*)&cli, &len);
        if (connfd < 0) {
            if (errno != EINTR && errno != EAGAIN) perror("accept");
            continue;
        }
        if (!running_) {
            close(connfd);
            break;
        }

        char ip[INET_ADDRSTRLEN] = {0};
        inet_ntop(AF_INET, &cli.sin_addr, ip, sizeof(ip));
        string remote = string(ip) + ":" + to_string(ntohs(cli.sin_port));

        session_started(connfd);
        thread([this, connfd, remote]() { serve(connfd, remote); }).detach();
    }

    if (listen_fd_ >= 0) {
        ::close(listen_fd_);
        listen_fd_ = -1;
    }
}

void FileServer::serve(int connfd, const string &remote) {
    {
        ClientSession session(connfd, remote, *this);
        session.run();
    }
    session_finished(connfd);
}

void FileServer::session_started(int fd) {
    lock_guard<mutex> lk(sessions_mtx_);
    session_fds_.insert(fd);
    if (stopped_) ::shutdown(fd, SHUT_RDWR);
}

void FileServer::session_finished(int fd) {
    // erase before close so the fd number cannot be reused while still in
    // the set; notify under the lock since stop() may destroy us right after
    lock_guard<mutex> lk(sessions_mtx_);
    session_fds_.erase(fd);
    close(fd);
    sessions_cv_.notify_all();
}

size_t FileServer::session_count() const {
    lock_guard<mutex> lk(sessions_mtx_);
    return session_fds_.size();
}

void FileServer::stop() {
    // a second caller waits until the first one is done
    lock_guard<mutex> stop_lock(stop_mtx_);
    if (stopped_.exchange(true)) return;
    bool was_running = running_.exchange(false);

    if (was_running) {
        broadcaster_.notify_server_message("Server shutting down");
        // give the broadcaster one round to deliver it
        for (int i = 0; i < 10 && broadcaster_.statistics().queue_depth > 0; i++) {
            this_thread::sleep_for(chrono::milliseconds(50));
        }
        this_thread::sleep_for(chrono::milliseconds(100));
    }

    {
        unique_lock<mutex> lk(sessions_mtx_);
        for (int fd : session_fds_) ::shutdown(fd, SHUT_RDWR);
        while (!session_fds_.empty()) {
            if (!sessions_cv_.wait_for(lk, chrono::seconds(5),
                                       [this] { return session_fds_.empty(); })) {
                logger_.warn("server", "waiting for " + to_string(session_fds_.size()) +
                                       " session(s) to finish");
            }
        }
    }

    broadcaster_.stop();
    if (was_running) logger_.log("server", "stopped");
}

bool FileServer::is_user_online(const string &user) const {
    lock_guard<mutex> lk(online_mtx_);
    auto it = online_users_.find(user);
    return it != online_users_.end() && it->second > 0;
}

void FileServer::user_login(const string &user) {
    lock_guard<mutex> lk(online_mtx_);
    online_users_[user]++;
}

void FileServer::user_logout(const string &user) {
    lock_guard<mutex> lk(online_mtx_);
    auto it = online_users_.find(user);
    if (it == online_users_.end()) return;
    if (--it->second <= 0) online_users_.erase(it);
}

int FileServer::online_users_count() const {
    lock_guard<mutex> lk(online_mtx_);
    return (int)online_users_.size();
}

void FileServer::set_chat_handler(shared_ptr<ChatHandler> handler) {
    lock_guard<mutex> lk(chat_mtx_);
    chat_ = move(handler);
}

shared_ptr<ChatHandler> FileServer::chat_handler() const {
    lock_guard<mutex> lk(chat_mtx_);
    return chat_;
}

string FileServer::stats_summary() const {
    CoordinatorStats cs = coordinator_.statistics();
    BroadcasterStats bs = broadcaster_.statistics();

    string s;
    s += "sessions=" + to_string(session_count());
    s += "|online=" + to_string(online_users_count());
    s += "|bytes_in=" + to_string(bytes_in());
    s += "|bytes_out=" + to_string(bytes_out());
    s += "|file_locks=" + to_string(cs.total_file_locks);
    s += "|active_operations=" + to_string(cs.total_active_operations);
    s += "|files_in_use=" + to_string(cs.files_in_use);
    s += "|available_permits=" + to_string(cs.available_permits);
    s += "|pending_tasks=" + to_string(cs.pending_tasks);
    s += "|uploads=" + to_string(cs.uploads_ok);
    s += "|downloads=" + to_string(cs.downloads_ok);
    s += "|deletes=" + to_string(cs.deletes_ok);
    s += "|failures=" + to_string(cs.failures);
    s += "|registered_clients=" + to_string(bs.registered_clients);
    s += "|notifications_sent=" + to_string(bs.notifications_sent);
    s += "|broadcasts_sent=" + to_string(bs.broadcasts_sent);
    s += "|queue_depth=" + to_string(bs.queue_depth);
    s += string("|udp=") + (bs.udp_enabled ? "on" : "off");
    return s;
}
