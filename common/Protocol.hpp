#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include <sys/socket.h>
#include <unistd.h>

using namespace std;

namespace proto {

// Longest command line accepted before the stream is considered desynchronized.
constexpr size_t MAX_LINE_LEN = 8 * 1024;

// Chunk size for payload streaming (socket <-> file).
constexpr size_t CHUNK_SIZE = 64 * 1024;

constexpr uint32_t MAX_FRAME_PAYLOAD = 1024 * 1024;

enum class LineStatus {
    Ok,
    Closed,     // peer closed or socket error
    TooLong,    // more than max_len bytes without '\n'
    Binary      // NUL or control byte inside the line
};

// Read one line terminated by '\n' ('\r' is dropped)
bool recv_line(int sockfd, string &line);

// Same as recv_line but rejects what cannot be a command line
LineStatus recv_command_line(int sockfd, string &line, size_t max_len = MAX_LINE_LEN);

// Send exactly len bytes
bool send_all(int sockfd, const void *buf, size_t len);

// send_all that gives up when the peer accepts nothing for stall_ms
// (errno = ETIMEDOUT). stall_ms < 0 blocks like send_all.
bool send_all(int sockfd, const void *buf, size_t len, int stall_ms);

// Receive exactly len bytes
bool recv_exact(int sockfd, void *buf, size_t len);

// Send one text line, appending '\n' if missing
bool send_line(int sockfd, const string &line);

// 1 = readable, 0 = timeout, -1 = error/hangup without data
int wait_readable(int sockfd, int timeout_ms);
int wait_writable(int sockfd, int timeout_ms);

// Split on space/tab
vector<string> split_tokens(const string &s);

// Split on sep. With max_parts > 0 the last field keeps the remainder
// ("a:b:c:d" with max_parts 3 -> "a", "b", "c:d").
vector<string> split_fields(const string &s, char sep, size_t max_parts = 0);

// ===== Framed mode =====
// [1 byte type][4 byte big-endian length][payload]
enum class FrameType : uint8_t {
    Command = 'C',
    Reply   = 'R',
    Data    = 'D',
    End     = 'E',
    Notify  = 'N'
};

constexpr size_t FRAME_HEADER_LEN = 5;

struct Frame {
    FrameType type = FrameType::Command;
    string payload;
};

bool is_frame_type(uint8_t b);

string encode_frame(FrameType type, const void *data, size_t len);
string encode_frame(FrameType type, const string &payload);

bool send_frame(int sockfd, FrameType type, const void *data, size_t len);
bool send_frame(int sockfd, FrameType type, const string &payload);

// false on close, unknown type or oversized payload
bool recv_frame(int sockfd, Frame &out);

} // namespace proto
