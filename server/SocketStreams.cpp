#include "SocketStreams.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <sys/socket.h>

// ===== SocketSource =====

SocketSource::SocketSource(int fd, uint64_t declared, bool framed, int stall_ms,
                           shared_ptr<TransferGate> gate)
    : fd_(fd), declared_(declared), framed_(framed), stall_ms_(stall_ms),
      gate_(move(gate)) {}

SocketSource::~SocketSource() {
    end();
}

void SocketSource::fail(const string &msg, bool desync) {
    lock_guard<mutex> lk(mtx_);
    err_ = msg;
    if (desync) desync_ = true;
}

bool SocketSource::wait_input() {
    int rc = proto::wait_readable(fd_, stall_ms_);
    if (rc == 0) {
        fail("client stalled for " + to_string(stall_ms_) + " ms", true);
        return false;
    }
    if (rc < 0) {
        fail("connection lost", true);
        return false;
    }
    return true;
}

ssize_t SocketSource::read_some(char *buf, size_t max_len) {
    uint64_t left = declared_ - consumed_;
    if (left == 0 || max_len == 0) return 0;
    size_t want = (size_t)min<uint64_t>(left, max_len);
    return framed_ ? read_framed(buf, want) : read_raw(buf, want);
}

ssize_t SocketSource::read_raw(char *buf, size_t want) {
    if (!wait_input()) return -1;
    while (true) {
        ssize_t n = ::recv(fd_, buf, want, 0);
        if (n < 0 && errno == EINTR) continue;
        if (n < 0) {
            fail(string("recv: ") + strerror(errno), true);
            return -1;
        }
        // n == 0: peer closed before sending everything
        consumed_ += (uint64_t)n;
        return n;
    }
}

ssize_t SocketSource::read_framed(char *buf, size_t want) {
    while (frame_off_ >= frame_buf_.size()) {
        if (saw_end_) return 0;
        if (!wait_input()) return -1;

        proto::Frame f;
        if (!proto::recv_frame(fd_, f)) {
            fail("bad or truncated frame", true);
            return -1;
        }
        if (f.type == proto::FrameType::End) {
            saw_end_ = true;
            return 0;
        }
        if (f.type != proto::FrameType::Data) {
            fail("unexpected frame during upload", true);
            return -1;
        }
        frame_buf_ = move(f.payload);
        frame_off_ = 0;
    }

    size_t n = min(want, frame_buf_.size() - frame_off_);
    memcpy(buf, frame_buf_.data() + frame_off_, n);
    frame_off_ += n;
    consumed_ += n;
    return (ssize_t)n;
}

bool SocketSource::finish() {
    if (!framed_) return true;

    if (frame_off_ < frame_buf_.size()) {
        fail("more data than declared", true);
        return false;
    }
    if (saw_end_) return true;

    // the E frame that closes the payload
    if (!wait_input()) return false;
    proto::Frame f;
    if (!proto::recv_frame(fd_, f) || f.type != proto::FrameType::End) {
        fail("more data than declared", true);
        return false;
    }
    saw_end_ = true;
    return true;
}

void SocketSource::end() {
    {
        lock_guard<mutex> lk(mtx_);
        if (ended_) return;
        ended_ = true;
    }
    if (gate_) gate_->leave();
}

string SocketSource::error() const {
    lock_guard<mutex> lk(mtx_);
    return err_;
}

bool SocketSource::aligned() const {
    lock_guard<mutex> lk(mtx_);
    if (desync_) return false;
    if (framed_) return saw_end_;
    return consumed_ == declared_;
}

// ===== SocketSink =====

SocketSink::SocketSink(shared_ptr<ClientChannel> channel, shared_ptr<TransferGate> gate)
    : channel_(move(channel)), gate_(move(gate)) {}

SocketSink::~SocketSink() {
    end();
}

bool SocketSink::begin(uint64_t size) {
    lock_guard<mutex> lk(mtx_);
    if (abandoned_) {
        err_ = "abandoned by session";
        return false;
    }
    started_ = true;
    size_ = size;

    if (!channel_->framed()) {
        if (!channel_->hold()) {
            err_ = "client connection lost";
            return false;
        }
        held_ = true;
    }
    if (!channel_->send_reply("FILE_SIZE:" + to_string(size))) {
        err_ = "client connection lost";
        return false;
    }
    return true;
}

bool SocketSink::write_all(const char *buf, size_t len) {
    if (!channel_->send_data(buf, len)) {
        lock_guard<mutex> lk(mtx_);
        err_ = channel_->stalled() ? "client stopped reading" : "client connection lost";
        return false;
    }
    sent_ += len;
    return true;
}

void SocketSink::end() {
    {
        lock_guard<mutex> lk(mtx_);
        if (ended_) return;
        ended_ = true;

        if (started_ && sent_ == size_ && channel_->framed()) {
            if (!channel_->send_data_end()) err_ = "client connection lost";
        }
        if (held_) {
            channel_->unhold();
            held_ = false;
        }
    }
    if (gate_) gate_->leave();
}

bool SocketSink::abandon() {
    {
        lock_guard<mutex> lk(mtx_);
        if (started_) return false;
        abandoned_ = true;
        if (ended_) return true;
        ended_ = true;
    }
    if (gate_) gate_->leave();
    return true;
}

string SocketSink::error() const {
    lock_guard<mutex> lk(mtx_);
    return err_;
}

bool SocketSink::started() const {
    lock_guard<mutex> lk(mtx_);
    return started_;
}

bool SocketSink::complete() const {
    lock_guard<mutex> lk(mtx_);
    return started_ && sent_ == size_;
}
