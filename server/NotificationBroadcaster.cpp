#include "NotificationBroadcaster.hpp"
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <exception>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

const char* notification_type_name(NotificationType type) {
    switch (type) {
    case NotificationType::NewFile:            return "NEW_FILE";
    case NotificationType::FileUpdated:        return "FILE_UPDATED";
    case NotificationType::FileDeleted:        return "FILE_DELETED";
    case NotificationType::ServerMessage:      return "SERVER_MESSAGE";
    case NotificationType::ClientConnected:    return "CLIENT_CONNECTED";
    case NotificationType::ClientDisconnected: return "CLIENT_DISCONNECTED";
    }
    return "UNKNOWN";
}

NotificationMessage::NotificationMessage(NotificationType type, const string &message,
                                         const string &details, uint64_t origin)
    : type_(type), message_(message), details_(details),
      created_(chrono::system_clock::now()), origin_(origin) {}

string NotificationMessage::to_line() const {
    return string("NOTIFICATION:[") + notification_type_name(type_) + "]" +
           message_ + "|" + details_;
}

string NotificationMessage::to_datagram() const {
    return string("[") + notification_type_name(type_) + "] " +
           message_ + " | " + details_;
}

NotificationBroadcaster::NotificationBroadcaster(Logger &logger, const BroadcasterOptions &opts)
    : logger_(logger), opts_(opts), queue_(opts.queue_capacity),
      clients_(make_shared<const ChannelList>()),
      listeners_(make_shared<const ListenerList>()) {}

NotificationBroadcaster::~NotificationBroadcaster() {
    stop();
}

bool NotificationBroadcaster::start(string &err) {
    if (running_) {
        err = "already running";
        return false;
    }

    if (opts_.udp_enabled) {
        udp_fd_ = ::socket(AF_INET, SOCK_DGRAM, 0);
        int yes = 1;
        if (udp_fd_ < 0 ||
            setsockopt(udp_fd_, SOL_SOCKET, SO_BROADCAST, &yes, sizeof(yes)) < 0) {
            logger_.warn("notify", string("UDP broadcast disabled: ") + strerror(errno));
            if (udp_fd_ >= 0) ::close(udp_fd_);
            udp_fd_ = -1;
        } else {
            udp_enabled_ = true;
            logger_.log("notify", "UDP broadcast on " + opts_.udp_address + ":" +
                                  to_string(opts_.udp_port));
        }
    }

    running_ = true;
    worker_ = thread([this] { run(); });
    logger_.log("notify", "broadcaster started");
    return true;
}

void NotificationBroadcaster::stop() {
    if (!running_.exchange(false)) return;
    if (worker_.joinable()) worker_.join();

    if (udp_fd_ >= 0) {
        ::close(udp_fd_);
        udp_fd_ = -1;
    }
    udp_enabled_ = false;
    logger_.log("notify", "broadcaster stopped, sent " + to_string(notifications_sent_.load()) +
                          " notifications, " + to_string(broadcasts_sent_.load()) + " datagrams");
}

shared_ptr<const NotificationBroadcaster::ChannelList> NotificationBroadcaster::snapshot() const {
    lock_guard<mutex> lk(clients_mtx_);
    return clients_;
}

void NotificationBroadcaster::register_client(const shared_ptr<ClientChannel> &channel,
                                              const string &identity) {
    if (!channel) return;
    lock_guard<mutex> lk(clients_mtx_);
    auto next = make_shared<ChannelList>(*clients_);
    for (auto &r : *next) {
        if (r.channel->id() == channel->id()) {
            r.identity = identity;
            clients_ = next;
            return;
        }
    }
    next->push_back(Registered{channel, identity});
    clients_ = next;
    logger_.log("notify", "registered " + identity + " (" + channel->remote() + "), " +
                          to_string(next->size()) + " clients");
}

void NotificationBroadcaster::unregister_client(const shared_ptr<ClientChannel> &channel) {
    if (!channel) return;
    remove_channel(channel->id(), "unregistered");
}

void NotificationBroadcaster::remove_channel(uint64_t id, const string &why) {
    string identity;
    size_t left = 0;
    {
        lock_guard<mutex> lk(clients_mtx_);
        auto next = make_shared<ChannelList>();
        bool found = false;
        for (auto &r : *clients_) {
            if (r.channel->id() == id) {
                identity = r.identity;
                found = true;
            } else {
                next->push_back(r);
            }
        }
        if (!found) return;
        left = next->size();
        clients_ = next;
    }
    logger_.log("notify", "removed " + identity + ": " + why + ", " +
                          to_string(left) + " clients");
}

bool NotificationBroadcaster::is_registered(uint64_t channel_id) const {
    auto list = snapshot();
    for (auto &r : *list) {
        if (r.channel->id() == channel_id) return true;
    }
    return false;
}

void NotificationBroadcaster::add_listener(const shared_ptr<NotificationListener> &listener) {
    if (!listener) return;
    lock_guard<mutex> lk(clients_mtx_);
    auto next = make_shared<ListenerList>(*listeners_);
    next->push_back(listener);
    listeners_ = next;
}

void NotificationBroadcaster::remove_listener(const shared_ptr<NotificationListener> &listener) {
    lock_guard<mutex> lk(clients_mtx_);
    auto next = make_shared<ListenerList>();
    for (auto &l : *listeners_) {
        if (l != listener) next->push_back(l);
    }
    listeners_ = next;
}

vector<string> NotificationBroadcaster::registered_identities() const {
    vector<string> out;
    auto list = snapshot();
    for (auto &r : *list) out.push_back(r.identity);
    return out;
}

bool NotificationBroadcaster::enqueue(const NotificationMessage &msg) {
    if (!queue_.offer(msg, opts_.enqueue_timeout)) {
        dropped_++;
        logger_.warn("notify", string("queue full, dropped ") +
                               notification_type_name(msg.type()) + ": " + msg.message());
        return false;
    }
    return true;
}

bool NotificationBroadcaster::notify_new_file(const string &file_name, const string &uploader,
                                              uint64_t origin) {
    return enqueue(NotificationMessage(NotificationType::NewFile,
                                       "New file available: " + file_name,
                                       "Uploaded by: " + uploader, origin));
}

bool NotificationBroadcaster::notify_file_updated(const string &file_name, const string &updater,
                                                  uint64_t origin) {
    return enqueue(NotificationMessage(NotificationType::FileUpdated,
                                       "File updated: " + file_name,
                                       "Updated by: " + updater, origin));
}

bool NotificationBroadcaster::notify_file_deleted(const string &file_name, const string &deleter,
                                                  uint64_t origin) {
    return enqueue(NotificationMessage(NotificationType::FileDeleted,
                                       "File deleted: " + file_name,
                                       "Deleted by: " + deleter, origin));
}

bool NotificationBroadcaster::notify_server_message(const string &message) {
    return enqueue(NotificationMessage(NotificationType::ServerMessage, message, ""));
}

bool NotificationBroadcaster::notify_client_connected(const string &identity, const string &remote,
                                                      uint64_t origin) {
    return enqueue(NotificationMessage(NotificationType::ClientConnected,
                                       "New client connected: " + identity, remote, origin));
}

bool NotificationBroadcaster::notify_client_disconnected(const string &identity, const string &remote,
                                                         uint64_t origin) {
    return enqueue(NotificationMessage(NotificationType::ClientDisconnected,
                                       "Client disconnected: " + identity, remote, origin));
}

BroadcasterStats NotificationBroadcaster::statistics() const {
    BroadcasterStats st;
    st.running = running_;
    st.udp_enabled = udp_enabled_;
    st.registered_clients = snapshot()->size();
    st.queue_depth = queue_.size();
    st.notifications_sent = notifications_sent_;
    st.broadcasts_sent = broadcasts_sent_;
    st.dropped = dropped_;
    return st;
}

void NotificationBroadcaster::run() {
    const int flush_ms = (int)(opts_.poll_interval.count() / 2);

    while (running_) {
        NotificationMessage msg;
        if (queue_.poll(msg, opts_.poll_interval)) {
            dispatch(msg);
            // drain a burst without waiting again
            for (int i = 0; i < 64 && queue_.try_poll(msg); i++) dispatch(msg);
        }
        flush_channels(flush_ms);
    }

    // best effort for what was queued before stop()
    NotificationMessage msg;
    while (queue_.try_poll(msg)) dispatch(msg);
    flush_channels(flush_ms);
}

void NotificationBroadcaster::dispatch(const NotificationMessage &msg) {
    string line = msg.to_line();
    auto list = snapshot();

    for (auto &r : *list) {
        if (msg.origin() != 0 && r.channel->id() == msg.origin()) continue;
        if (r.channel->closed()) {
            remove_channel(r.channel->id(), "channel closed");
            continue;
        }
        if (!r.channel->queue_notification(line)) {
            remove_channel(r.channel->id(), "notification backlog full");
            continue;
        }
        notifications_sent_++;
    }

    send_udp(msg);

    shared_ptr<const ListenerList> listeners;
    {
        lock_guard<mutex> lk(clients_mtx_);
        listeners = listeners_;
    }
    for (auto &l : *listeners) {
        try {
            l->on_notification(msg);
        } catch (const exception &e) {
            logger_.warn("notify", string("listener failed: ") + e.what());
        }
    }
}

void NotificationBroadcaster::send_udp(const NotificationMessage &msg) {
    if (!udp_enabled_ || udp_fd_ < 0) return;

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons((uint16_t)opts_.udp_port);
    if (inet_pton(AF_INET, opts_.udp_address.c_str(), &addr.sin_addr) != 1) {
        logger_.warn("notify", "bad UDP address " + opts_.udp_address + ", UDP disabled");
        udp_enabled_ = false;
        return;
    }

    string dgram = msg.to_datagram();
    ssize_t n = ::sendto(udp_fd_, dgram.data(), dgram.size(), 0,
                         (sockaddr*)&addr, sizeof(addr));
    if (n < 0) {
        logger_.warn("notify", string("UDP send failed: ") + strerror(errno));
        return;
    }
    broadcasts_sent_++;
}

void NotificationBroadcaster::flush_channels(int timeout_ms) {
    auto list = snapshot();
    vector<pollfd> pfds;
    vector<shared_ptr<ClientChannel>> targets;

    for (auto &r : *list) {
        if (r.channel->closed()) {
            remove_channel(r.channel->id(), "channel closed");
            continue;
        }
        if (!r.channel->flushable()) continue;
        pollfd p{};
        p.fd = r.channel->fd();
        p.events = POLLOUT;
        pfds.push_back(p);
        targets.push_back(r.channel);
    }
    if (pfds.empty()) return;

    int rc = ::poll(pfds.data(), pfds.size(), timeout_ms);
    if (rc <= 0) return;  // nothing ready (or EINTR): retry next iteration

    for (size_t i = 0; i < pfds.size(); i++) {
        short re = pfds[i].revents;
        if (re & (POLLERR | POLLHUP | POLLNVAL)) {
            targets[i]->mark_closed();
            remove_channel(targets[i]->id(), "socket error");
            continue;
        }
        if (!(re & POLLOUT)) continue;
        if (targets[i]->flush_nonblocking() == ClientChannel::FlushResult::Error) {
            remove_channel(targets[i]->id(), "write failed");
        }
    }
}
