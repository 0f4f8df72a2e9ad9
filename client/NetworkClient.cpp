#include "NetworkClient.hpp"
#include "../common/Protocol.hpp"
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <vector>
#include <cstdint>

using namespace std;
using namespace proto;

namespace {
const char *NOTIFY_PREFIX = "NOTIFICATION:";

bool starts_with(const string &s, const string &prefix) {
    return s.rfind(prefix, 0) == 0;
}

// "FILE_SIZE:123" -> 123
bool parse_file_size(const string &line, uint64_t &size) {
    if (!starts_with(line, "FILE_SIZE:")) return false;
    try {
        size_t used = 0;
        string num = line.substr(10);
        size = stoull(num, &used);
        return used == num.size();
    } catch (const exception &) {
        return false;
    }
}
} // namespace

NetworkClient::NetworkClient() {}

NetworkClient::~NetworkClient() {
    close();
}

bool NetworkClient::connect_to(const string &host, int port, string &err) {
    close();
    sockfd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    if (sockfd_ < 0) {
        err = "socket failed";
        return false;
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port   = htons(port);
    if (::inet_pton(AF_INET, host.c_str(), &addr.sin_addr) <= 0) {
        close();
        err = "Invalid address " + host;
        return false;
    }

    if (::connect(sockfd_, (sockaddr*)&addr, sizeof(addr)) < 0) {
        close();
        err = "Cannot connect to " + host + ":" + to_string(port);
        return false;
    }

    string line;
    if (!recv_line(sockfd_, line) || !starts_with(line, "CONNECTED:")) {
        close();
        err = "No greeting from server";
        return false;
    }
    banner_ = line.substr(10);
    return true;
}

void NetworkClient::close() {
    if (sockfd_ >= 0) {
        ::close(sockfd_);
        sockfd_ = -1;
    }
    framed_ = false;
}

bool NetworkClient::send_command(const string &cmd, string &err) {
    if (sockfd_ < 0) {
        err = "Not connected";
        return false;
    }
    bool ok = framed_ ? send_frame(sockfd_, FrameType::Command, cmd)
                      : send_line(sockfd_, cmd);
    if (!ok) {
        err = "Send error";
        return false;
    }
    return true;
}

bool NetworkClient::read_message(string &line, bool &is_notification, string &err) {
    if (framed_) {
        Frame f;
        if (!recv_frame(sockfd_, f)) {
            err = "No response";
            close();
            return false;
        }
        if (f.type == FrameType::Notify) {
            line = f.payload;
            is_notification = true;
            return true;
        }
        if (f.type != FrameType::Reply) {
            err = "Unexpected frame";
            return false;
        }
        line = f.payload;
        is_notification = false;
        return true;
    }

    if (!recv_line(sockfd_, line)) {
        err = "No response";
        close();
        return false;
    }
    is_notification = starts_with(line, NOTIFY_PREFIX);
    return true;
}

bool NetworkClient::read_reply(string &line, string &err) {
    while (true) {
        bool note = false;
        if (!read_message(line, note, err)) return false;
        if (!note) return true;
        notifications_.push_back(line);
    }
}

bool NetworkClient::send_raw_command(const string &cmd, string &out, string &err) {
    if (!send_command(cmd, err)) return false;
    return read_reply(out, err);
}

bool NetworkClient::login(const string &email, const string &pass, string &name_out,
                          string &err) {
    string line;
    if (!send_raw_command("LOGIN:" + email + ":" + pass, line, err)) return false;
    if (starts_with(line, "LOGIN_SUCCESS:")) {
        name_out = line.substr(14);
        return true;
    }
    err = line;
    return false;
}

bool NetworkClient::signup(const string &name, const string &email, const string &pass,
                           string &err) {
    string line;
    if (!send_raw_command("SIGNUP:" + name + ":" + email + ":" + pass, line, err)) return false;
    if (line == "SIGNUP_SUCCESS") return true;
    err = line;
    return false;
}

bool NetworkClient::logout(string &err) {
    string line;
    if (!send_raw_command("LOGOUT", line, err)) return false;
    if (line == "LOGOUT_SUCCESS") return true;
    err = line;
    return false;
}

bool NetworkClient::list_files(vector<RemoteFile> &out, string &err) {
    string line;
    if (!send_raw_command("LIST_FILES", line, err)) return false;
    if (!starts_with(line, "FILE_LIST:")) {
        err = line;
        return false;
    }

    out.clear();
    for (const string &entry : split_fields(line.substr(10), '|')) {
        if (entry.empty()) continue;
        // name:size:date (the date itself contains ':')
        vector<string> f = split_fields(entry, ':', 3);
        if (f.size() < 3) continue;
        RemoteFile rf;
        rf.name = f[0];
        try {
            rf.size = stoull(f[1]);
        } catch (const exception &) {
            err = "Invalid file list entry: " + entry;
            return false;
        }
        rf.modified = f[2];
        out.push_back(rf);
    }
    return true;
}

bool NetworkClient::upload_stream(const string &remote_name, istream &in, uint64_t size,
                                  string &err) {
    string line;
    if (!send_raw_command("UPLOAD:" + remote_name + ":" + to_string(size), line, err)) {
        return false;
    }
    if (!starts_with(line, "READY:")) {
        err = line;
        return false;
    }

    const size_t BUF = CHUNK_SIZE;
    vector<char> buf(BUF);
    uint64_t remaining = size;
    while (remaining > 0) {
        size_t chunk = remaining > BUF ? BUF : (size_t)remaining;
        in.read(buf.data(), (streamsize)chunk);
        streamsize n = in.gcount();
        if (n <= 0) {
            err = "Local read error";
            return false;
        }
        bool ok = framed_ ? send_frame(sockfd_, FrameType::Data, buf.data(), (size_t)n)
                          : send_all(sockfd_, buf.data(), (size_t)n);
        if (!ok) {
            err = "Send data error";
            return false;
        }
        remaining -= (uint64_t)n;
    }
    if (framed_ && !send_frame(sockfd_, FrameType::End, "")) {
        err = "Send data error";
        return false;
    }

    if (!read_reply(line, err)) {
        err = "No final response";
        return false;
    }
    if (!starts_with(line, "UPLOAD_SUCCESS:")) {
        err = line;
        return false;
    }
    return true;
}

bool NetworkClient::upload_file(const string &local_path, const string &remote_name,
                                string &err) {
    ifstream ifs(local_path, ios::binary);
    if (!ifs) {
        err = "Cannot open local file";
        return false;
    }
    ifs.seekg(0, ios::end);
    uint64_t size = (uint64_t)ifs.tellg();
    ifs.seekg(0);
    return upload_stream(remote_name, ifs, size, err);
}

bool NetworkClient::upload_bytes(const string &remote_name, const string &data, string &err) {
    istringstream in(data);
    return upload_stream(remote_name, in, data.size(), err);
}

bool NetworkClient::download_stream(const string &remote_name, ostream &out, uint64_t &size,
                                    string &err) {
    string line;
    if (!send_raw_command("DOWNLOAD:" + remote_name, line, err)) return false;
    if (!parse_file_size(line, size)) {
        err = line;
        return false;
    }

    const size_t BUF = CHUNK_SIZE;
    vector<char> buf(BUF);
    uint64_t received = 0;

    if (!framed_) {
        while (received < size) {
            size_t chunk = size - received > BUF ? BUF : (size_t)(size - received);
            if (!recv_exact(sockfd_, buf.data(), chunk)) {
                err = "Receive data error";
                return false;
            }
            out.write(buf.data(), (streamsize)chunk);
            if (!out) {
                err = "Write local file error";
                return false;
            }
            received += chunk;
        }
        return true;
    }

    while (true) {
        Frame f;
        if (!recv_frame(sockfd_, f)) {
            err = "Receive data error";
            return false;
        }
        if (f.type == FrameType::Notify) {
            notifications_.push_back(f.payload);
            continue;
        }
        if (f.type == FrameType::End) break;
        if (f.type != FrameType::Data) {
            err = "Unexpected frame during download";
            return false;
        }
        out.write(f.payload.data(), (streamsize)f.payload.size());
        if (!out) {
            err = "Write local file error";
            return false;
        }
        received += f.payload.size();
    }
    if (received != size) {
        err = "Size mismatch: expected " + to_string(size) + ", got " + to_string(received);
        return false;
    }
    return true;
}

bool NetworkClient::download_file(const string &remote_name, const string &local_path,
                                  string &err) {
    ofstream ofs(local_path, ios::binary);
    if (!ofs) {
        err = "Cannot open local path";
        return false;
    }
    uint64_t size = 0;
    return download_stream(remote_name, ofs, size, err);
}

bool NetworkClient::download_bytes(const string &remote_name, string &data, string &err) {
    ostringstream out;
    uint64_t size = 0;
    if (!download_stream(remote_name, out, size, err)) return false;
    data = out.str();
    return true;
}

bool NetworkClient::delete_file(const string &remote_name, string &err) {
    string line;
    if (!send_raw_command("DELETE:" + remote_name, line, err)) return false;
    if (starts_with(line, "DELETE_SUCCESS:")) return true;
    err = line;
    return false;
}

bool NetworkClient::stats(string &summary, string &err) {
    string line;
    if (!send_raw_command("STATS", line, err)) return false;
    if (!starts_with(line, "STATS:")) {
        err = line;
        return false;
    }
    summary = line.substr(6);
    return true;
}

bool NetworkClient::chat(const string &text, string &err) {
    string line;
    if (!send_raw_command("CHAT:" + text, line, err)) return false;
    if (line == "CHAT_SENT") return true;
    err = line;
    return false;
}

bool NetworkClient::use_framed(string &err) {
    if (framed_) return true;
    string line;
    if (!send_raw_command("PROTO:FRAMED", line, err)) return false;
    if (line != "PROTO:FRAMED") {
        err = line;
        return false;
    }
    framed_ = true;
    return true;
}

vector<string> NetworkClient::take_notifications() {
    vector<string> out(notifications_.begin(), notifications_.end());
    notifications_.clear();
    return out;
}

bool NetworkClient::wait_notification(string &out, int timeout_ms) {
    if (!notifications_.empty()) {
        out = notifications_.front();
        notifications_.pop_front();
        return true;
    }
    if (sockfd_ < 0 || wait_readable(sockfd_, timeout_ms) != 1) return false;

    string line, err;
    bool note = false;
    if (!read_message(line, note, err) || !note) return false;
    out = line;
    return true;
}
