#pragma once
#include "BlockingQueue.hpp"
#include "ClientChannel.hpp"
#include "Logger.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace std;

enum class NotificationType {
    NewFile,
    FileUpdated,
    FileDeleted,
    ServerMessage,
    ClientConnected,
    ClientDisconnected
};

// "NEW_FILE", "FILE_UPDATED", ...
const char* notification_type_name(NotificationType type);

class NotificationMessage {
public:
    NotificationMessage() = default;
    NotificationMessage(NotificationType type, const string &message,
                        const string &details, uint64_t origin = 0);

    NotificationType type() const { return type_; }
    const string& message() const { return message_; }
    const string& details() const { return details_; }
    chrono::system_clock::time_point created() const { return created_; }

    // id of the channel that caused the event, 0 = none
    uint64_t origin() const { return origin_; }

    // NOTIFICATION:[TYPE]message|details
    string to_line() const;

    // [TYPE] message | details
    string to_datagram() const;

private:
    NotificationType type_ = NotificationType::ServerMessage;
    string message_;
    string details_;
    chrono::system_clock::time_point created_;
    uint64_t origin_ = 0;
};

// In-process observer of every dispatched event (console, UI front-ends).
// Called on the broadcaster thread; must not block.
class NotificationListener {
public:
    virtual ~NotificationListener() = default;
    virtual void on_notification(const NotificationMessage &msg) = 0;
};

struct BroadcasterOptions {
    size_t queue_capacity = 1000;
    chrono::milliseconds enqueue_timeout{1000};
    chrono::milliseconds poll_interval{100};
    bool udp_enabled = true;
    int udp_port = 9876;
    string udp_address = "255.255.255.255";
};

struct BroadcasterStats {
    bool running = false;
    bool udp_enabled = false;
    size_t registered_clients = 0;
    size_t queue_depth = 0;
    uint64_t notifications_sent = 0;
    uint64_t broadcasts_sent = 0;
    uint64_t dropped = 0;
};

// Fans server events out to every registered client channel and to a UDP
// broadcast address. One background thread; producers only touch the queue.
class NotificationBroadcaster {
public:
    NotificationBroadcaster(Logger &logger, const BroadcasterOptions &opts);
    ~NotificationBroadcaster();

    NotificationBroadcaster(const NotificationBroadcaster&) = delete;
    NotificationBroadcaster& operator=(const NotificationBroadcaster&) = delete;

    // Opens the UDP socket (if enabled) and starts the worker thread.
    // A UDP setup failure only disables UDP.
    bool start(string &err);
    void stop();
    bool running() const { return running_.load(); }

    void register_client(const shared_ptr<ClientChannel> &channel, const string &identity);
    void unregister_client(const shared_ptr<ClientChannel> &channel);
    bool is_registered(uint64_t channel_id) const;
    vector<string> registered_identities() const;

    void add_listener(const shared_ptr<NotificationListener> &listener);
    void remove_listener(const shared_ptr<NotificationListener> &listener);

    // Blocks up to enqueue_timeout when the queue is full, then drops.
    bool enqueue(const NotificationMessage &msg);

    bool notify_new_file(const string &file_name, const string &uploader, uint64_t origin = 0);
    bool notify_file_updated(const string &file_name, const string &updater, uint64_t origin = 0);
    bool notify_file_deleted(const string &file_name, const string &deleter, uint64_t origin = 0);
    bool notify_server_message(const string &message);
    bool notify_client_connected(const string &identity, const string &remote, uint64_t origin = 0);
    bool notify_client_disconnected(const string &identity, const string &remote, uint64_t origin = 0);

    BroadcasterStats statistics() const;

private:
    struct Registered {
        shared_ptr<ClientChannel> channel;
        string identity;
    };
    using ChannelList = vector<Registered>;
    using ListenerList = vector<shared_ptr<NotificationListener>>;

    void run();
    void dispatch(const NotificationMessage &msg);
    void send_udp(const NotificationMessage &msg);
    void flush_channels(int timeout_ms);
    void remove_channel(uint64_t id, const string &why);

    shared_ptr<const ChannelList> snapshot() const;

    Logger &logger_;
    BroadcasterOptions opts_;
    BlockingQueue<NotificationMessage> queue_;

    mutable mutex clients_mtx_;
    shared_ptr<const ChannelList> clients_;
    shared_ptr<const ListenerList> listeners_;

    int udp_fd_ = -1;
    atomic<bool> udp_enabled_{false};
    atomic<bool> running_{false};
    thread worker_;

    atomic<uint64_t> notifications_sent_{0};
    atomic<uint64_t> broadcasts_sent_{0};
    atomic<uint64_t> dropped_{0};
};
