#include "Protocol.hpp"
#include <arpa/inet.h>
#include <poll.h>
#include <errno.h>
#include <cstring>

using namespace std;

namespace proto {

bool recv_line(int sockfd, string &line) {
    line.clear();
    char c;
    while (true) {
        ssize_t n = ::recv(sockfd, &c, 1, 0);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;      // error or connection closed
        if (c == '\n') break;
        if (c != '\r') line.push_back(c);
    }
    return true;
}

LineStatus recv_command_line(int sockfd, string &line, size_t max_len) {
    line.clear();
    char c;
    while (true) {
        ssize_t n = ::recv(sockfd, &c, 1, 0);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return LineStatus::Closed;
        if (c == '\n') break;
        if (c == '\r') continue;
        unsigned char uc = static_cast<unsigned char>(c);
        if (uc < 0x20 && c != '\t') return LineStatus::Binary;
        if (uc == 0x7f) return LineStatus::Binary;
        line.push_back(c);
        if (line.size() > max_len) return LineStatus::TooLong;
    }
    return LineStatus::Ok;
}

bool send_all(int sockfd, const void *buf, size_t len) {
    const char *p = static_cast<const char*>(buf);
    size_t total = 0;
    while (total < len) {
        ssize_t n = ::send(sockfd, p + total, len - total, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        total += (size_t)n;
    }
    return true;
}

bool recv_exact(int sockfd, void *buf, size_t len) {
    char *p = static_cast<char*>(buf);
    size_t total = 0;
    while (total < len) {
        ssize_t n = ::recv(sockfd, p + total, len - total, 0);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        total += (size_t)n;
    }
    return true;
}

bool send_line(int sockfd, const string &line) {
    string tmp = line;
    if (tmp.empty() || tmp.back() != '\n') tmp.push_back('\n');
    return send_all(sockfd, tmp.data(), tmp.size());
}

static int wait_for(int sockfd, short events, int timeout_ms) {
    pollfd pfd{};
    pfd.fd = sockfd;
    pfd.events = events;
    while (true) {
        int rc = ::poll(&pfd, 1, timeout_ms);
        if (rc < 0 && errno == EINTR) continue;
        if (rc < 0) return -1;
        if (rc == 0) return 0;
        if (pfd.revents & events) return 1;
        return -1;     // POLLERR / POLLHUP / POLLNVAL only
    }
}

int wait_readable(int sockfd, int timeout_ms) {
    return wait_for(sockfd, POLLIN, timeout_ms);
}

int wait_writable(int sockfd, int timeout_ms) {
    return wait_for(sockfd, POLLOUT, timeout_ms);
}

bool send_all(int sockfd, const void *buf, size_t len, int stall_ms) {
    if (stall_ms < 0) return send_all(sockfd, buf, len);

    const char *p = static_cast<const char*>(buf);
    size_t total = 0;
    while (total < len) {
        int rc = wait_writable(sockfd, stall_ms);
        if (rc == 0) {
            errno = ETIMEDOUT;
            return false;
        }
        if (rc < 0) return false;

        ssize_t n = ::send(sockfd, p + total, len - total, MSG_DONTWAIT | MSG_NOSIGNAL);
        if (n < 0 && (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK)) continue;
        if (n <= 0) return false;
        total += (size_t)n;
    }
    return true;
}

vector<string> split_tokens(const string &s) {
    vector<string> tokens;
    string cur;
    for (char c : s) {
        if (c == ' ' || c == '\t') {
            if (!cur.empty()) {
                tokens.push_back(cur);
                cur.clear();
            }
        } else {
            cur.push_back(c);
        }
    }
    if (!cur.empty()) tokens.push_back(cur);
    return tokens;
}

vector<string> split_fields(const string &s, char sep, size_t max_parts) {
    vector<string> fields;
    size_t start = 0;
    while (true) {
        if (max_parts > 0 && fields.size() + 1 == max_parts) {
            fields.push_back(s.substr(start));
            break;
        }
        size_t pos = s.find(sep, start);
        if (pos == string::npos) {
            fields.push_back(s.substr(start));
            break;
        }
        fields.push_back(s.substr(start, pos - start));
        start = pos + 1;
    }
    return fields;
}

bool is_frame_type(uint8_t b) {
    switch (static_cast<FrameType>(b)) {
    case FrameType::Command:
    case FrameType::Reply:
    case FrameType::Data:
    case FrameType::End:
    case FrameType::Notify:
        return true;
    }
    return false;
}

string encode_frame(FrameType type, const void *data, size_t len) {
    string out;
    out.resize(FRAME_HEADER_LEN + len);
    out[0] = static_cast<char>(type);
    uint32_t be_len = htonl(static_cast<uint32_t>(len));
    memcpy(&out[1], &be_len, sizeof(be_len));
    if (len > 0) memcpy(&out[FRAME_HEADER_LEN], data, len);
    return out;
}

string encode_frame(FrameType type, const string &payload) {
    return encode_frame(type, payload.data(), payload.size());
}

bool send_frame(int sockfd, FrameType type, const void *data, size_t len) {
    if (len > MAX_FRAME_PAYLOAD) return false;
    string buf = encode_frame(type, data, len);
    return send_all(sockfd, buf.data(), buf.size());
}

bool send_frame(int sockfd, FrameType type, const string &payload) {
    return send_frame(sockfd, type, payload.data(), payload.size());
}

bool recv_frame(int sockfd, Frame &out) {
    unsigned char header[FRAME_HEADER_LEN];
    if (!recv_exact(sockfd, header, sizeof(header))) return false;
    if (!is_frame_type(header[0])) return false;

    uint32_t be_len = 0;
    memcpy(&be_len, header + 1, sizeof(be_len));
    uint32_t len = ntohl(be_len);
    if (len > MAX_FRAME_PAYLOAD) return false;

    out.type = static_cast<FrameType>(header[0]);
    out.payload.assign(len, '\0');
    if (len > 0 && !recv_exact(sockfd, &out.payload[0], len)) return false;
    return true;
}

} // namespace proto
