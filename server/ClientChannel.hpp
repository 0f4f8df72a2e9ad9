#pragma once
#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>

using namespace std;

// Outbound side of one client connection.
//
// Replies and payload bytes are written by the session (blocking). Notifications
// are appended to pending_ by the broadcaster and drained with non-blocking
// sends, so a slow client never stalls the broadcaster. All writes go through
// mtx_, which keeps a reply, a payload chunk and a notification from
// interleaving on the wire. A blocking write that makes no progress for
// stall_ms closes the channel.
class ClientChannel {
public:
    enum class FlushResult { Done, Partial, Busy, Error };

    ClientChannel(int fd, uint64_t id, const string &remote,
                  size_t max_pending = 256 * 1024, int stall_ms = -1);

    int fd() const { return fd_; }
    uint64_t id() const { return id_; }
    const string& remote() const { return remote_; }

    bool framed() const;

    // Send ack as a plain line and switch to framed mode in one step, so no
    // notification is queued in the old format after the ack.
    bool enter_framed_mode(const string &ack);

    // One protocol reply ("\n"-terminated line, or an R frame in framed mode)
    bool send_reply(const string &line);

    // Payload bytes: raw in line mode (caller must hold()), D frames in framed mode
    bool send_data(const char *buf, size_t len);

    // End of payload marker (framed mode only; no-op in line mode)
    bool send_data_end();

    // Reserve the wire for a raw payload. Pending notifications are flushed
    // first and then deferred until unhold().
    bool hold();
    void unhold();
    bool held() const;

    // Broadcaster side. false if the channel is closed or over its backlog.
    bool queue_notification(const string &text);
    bool flushable() const;
    FlushResult flush_nonblocking();

    // Takes the write lock, so no write is in flight once this returns and
    // the fd may be closed.
    void mark_closed();
    bool closed() const { return closed_.load(); }

    // true if a blocking write gave up because the peer stopped reading
    bool stalled() const { return stalled_.load(); }

    uint64_t notifications_queued() const { return notifications_.load(); }

private:
    bool flush_pending_locked();
    bool write_locked(const void *buf, size_t len);

    int fd_;
    uint64_t id_;
    string remote_;
    size_t max_pending_;
    int stall_ms_;

    mutable mutex mtx_;
    string pending_;
    bool held_ = false;
    bool framed_ = false;
    atomic<bool> closed_{false};
    atomic<bool> stalled_{false};
    atomic<uint64_t> notifications_{0};
};
