#include "ClientChannel.hpp"
#include "../common/Protocol.hpp"
#include <cerrno>
#include <sys/socket.h>

ClientChannel::ClientChannel(int fd, uint64_t id, const string &remote,
                             size_t max_pending, int stall_ms)
    : fd_(fd), id_(id), remote_(remote), max_pending_(max_pending), stall_ms_(stall_ms) {}

bool ClientChannel::framed() const {
    lock_guard<mutex> lk(mtx_);
    return framed_;
}

bool ClientChannel::enter_framed_mode(const string &ack) {
    lock_guard<mutex> lk(mtx_);
    if (!flush_pending_locked()) return false;
    string out = ack;
    if (out.empty() || out.back() != '\n') out.push_back('\n');
    if (!write_locked(out.data(), out.size())) return false;
    framed_ = true;
    return true;
}

bool ClientChannel::write_locked(const void *buf, size_t len) {
    if (closed_) return false;
    if (!proto::send_all(fd_, buf, len, stall_ms_)) {
        if (errno == ETIMEDOUT) stalled_ = true;
        closed_ = true;
        return false;
    }
    return true;
}

bool ClientChannel::flush_pending_locked() {
    if (pending_.empty()) return true;
    string out;
    out.swap(pending_);
    return write_locked(out.data(), out.size());
}

bool ClientChannel::send_reply(const string &line) {
    lock_guard<mutex> lk(mtx_);
    if (!held_ && !flush_pending_locked()) return false;

    if (framed_) {
        string frame = proto::encode_frame(proto::FrameType::Reply, line);
        return write_locked(frame.data(), frame.size());
    }
    string out = line;
    if (out.empty() || out.back() != '\n') out.push_back('\n');
    return write_locked(out.data(), out.size());
}

bool ClientChannel::send_data(const char *buf, size_t len) {
    lock_guard<mutex> lk(mtx_);
    if (framed_) {
        if (!flush_pending_locked()) return false;
        string frame = proto::encode_frame(proto::FrameType::Data, buf, len);
        return write_locked(frame.data(), frame.size());
    }
    return write_locked(buf, len);
}

bool ClientChannel::send_data_end() {
    lock_guard<mutex> lk(mtx_);
    if (!framed_) return true;
    if (!flush_pending_locked()) return false;
    string frame = proto::encode_frame(proto::FrameType::End, "");
    return write_locked(frame.data(), frame.size());
}

bool ClientChannel::hold() {
    lock_guard<mutex> lk(mtx_);
    if (!flush_pending_locked()) return false;
    held_ = true;
    return true;
}

void ClientChannel::unhold() {
    lock_guard<mutex> lk(mtx_);
    held_ = false;
}

bool ClientChannel::held() const {
    lock_guard<mutex> lk(mtx_);
    return held_;
}

bool ClientChannel::queue_notification(const string &text) {
    lock_guard<mutex> lk(mtx_);
    if (closed_) return false;

    string out;
    if (framed_) {
        out = proto::encode_frame(proto::FrameType::Notify, text);
    } else {
        out = text;
        if (out.empty() || out.back() != '\n') out.push_back('\n');
    }
    if (pending_.size() + out.size() > max_pending_) return false;

    pending_ += out;
    notifications_++;
    return true;
}

void ClientChannel::mark_closed() {
    lock_guard<mutex> lk(mtx_);
    closed_ = true;
}

bool ClientChannel::flushable() const {
    lock_guard<mutex> lk(mtx_);
    return !pending_.empty() && !held_ && !closed_;
}

ClientChannel::FlushResult ClientChannel::flush_nonblocking() {
    unique_lock<mutex> lk(mtx_, try_to_lock);
    if (!lk.owns_lock() || held_) return FlushResult::Busy;
    if (closed_) return FlushResult::Error;

    while (!pending_.empty()) {
        ssize_t n = ::send(fd_, pending_.data(), pending_.size(),
                           MSG_DONTWAIT | MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) return FlushResult::Partial;
            closed_ = true;
            return FlushResult::Error;
        }
        pending_.erase(0, (size_t)n);
    }
    return FlushResult::Done;
}
