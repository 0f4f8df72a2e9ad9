#pragma once
#include "ClientChannel.hpp"
#include "DataStream.hpp"
#include "TransferGate.hpp"
#include "../common/Protocol.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <string>

using namespace std;

// Upload payload read straight from the client socket, raw bytes in line mode
// or D/E frames in framed mode. Never reads past the declared size.
// Leaves the session's transfer gate on end().
class SocketSource : public DataSource {
public:
    SocketSource(int fd, uint64_t declared, bool framed, int stall_ms,
                 shared_ptr<TransferGate> gate);
    ~SocketSource() override;

    ssize_t read_some(char *buf, size_t max_len) override;
    bool finish() override;
    void end() override;
    string error() const override;

    uint64_t consumed() const { return consumed_.load(); }

    // true if the next byte on the socket is the start of a command
    bool aligned() const;

private:
    ssize_t read_raw(char *buf, size_t want);
    ssize_t read_framed(char *buf, size_t want);
    bool wait_input();
    void fail(const string &msg, bool desync);

    int fd_;
    uint64_t declared_;
    bool framed_;
    int stall_ms_;
    shared_ptr<TransferGate> gate_;

    atomic<uint64_t> consumed_{0};
    string frame_buf_;
    size_t frame_off_ = 0;
    bool saw_end_ = false;
    bool desync_ = false;

    mutable mutex mtx_;
    string err_;
    bool ended_ = false;
};

// Download payload written to the client: FILE_SIZE reply, then the bytes.
// In line mode the channel is held for the whole payload so no notification
// lands inside it.
class SocketSink : public DataSink {
public:
    SocketSink(shared_ptr<ClientChannel> channel, shared_ptr<TransferGate> gate);
    ~SocketSink() override;

    bool begin(uint64_t size) override;
    bool write_all(const char *buf, size_t len) override;
    void end() override;
    string error() const override;

    // Give up before begin(). false if the header is already out.
    bool abandon();

    bool started() const;
    bool complete() const;

private:
    shared_ptr<ClientChannel> channel_;
    shared_ptr<TransferGate> gate_;

    mutable mutex mtx_;
    bool started_ = false;
    bool abandoned_ = false;
    bool ended_ = false;
    bool held_ = false;
    uint64_t size_ = 0;
    atomic<uint64_t> sent_{0};
    string err_;
};
