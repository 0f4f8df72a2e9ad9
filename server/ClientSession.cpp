#include "ClientSession.hpp"
#include "FileServer.hpp"
#include "SocketStreams.hpp"
#include "../common/Protocol.hpp"
#include "../common/Utils.hpp"
#include <sys/socket.h>
#include <unistd.h>
#include <sstream>
#include <iomanip>
#include <stdexcept>

using namespace std;
using namespace proto;

namespace {
// Simple hash so passwords are not stored in plain text (not real security).
string hash_password(const string &raw) {
    std::hash<string> hasher;
    size_t h = hasher(raw);
    stringstream ss;
    ss << hex << h;
    return ss.str();
}

// FILE_LIST shows top-level files only and uses ':' and '|' as separators
bool is_listable_name(const string &name) {
    return !name.empty() &&
           name.find('/') == string::npos &&
           name.find(':') == string::npos &&
           name.find('|') == string::npos;
}

bool parse_size(const string &s, uint64_t &out) {
    if (s.empty() || s[0] == '-' || s[0] == '+') return false;
    try {
        size_t pos = 0;
        out = stoull(s, &pos);
        return pos == s.size();
    } catch (const invalid_argument &) {
        return false;
    } catch (const out_of_range &) {
        return false;
    }
}

const char *GREETING = "CONNECTED:Welcome to File Sharing Server";
} // namespace

ClientSession::ClientSession(int sockfd, const string &remote, FileServer &server)
    : sockfd_(sockfd),
      remote_(remote),
      server_(server),
      channel_(make_shared<ClientChannel>(sockfd, server.next_channel_id(), remote,
                                          256 * 1024,
                                          (int)server.config().stall_timeout_ms)),
      gate_(make_shared<TransferGate>()) {}

ClientSession::~ClientSession() {
    disconnect();
}

void ClientSession::run() {
    server_.logger().log(remote_, "connected");
    if (!reply(GREETING)) return;

    string line;
    while (read_command(line)) {
        if (!handle_command(line)) break;
    }
    disconnect();
}

bool ClientSession::read_command(string &line) {
    // a transfer task may still own the socket
    gate_->wait_idle();

    if (channel_->framed()) {
        Frame f;
        if (!recv_frame(sockfd_, f)) {
            return false;
        }
        if (f.type != FrameType::Command) {
            server_.logger().warn(remote_, "protocol desync: unexpected frame type");
            return false;
        }
        line = f.payload;
        return true;
    }

    LineStatus st = recv_command_line(sockfd_, line);
    switch (st) {
    case LineStatus::Ok:
        return true;
    case LineStatus::Closed:
        return false;
    case LineStatus::TooLong:
        server_.logger().warn(remote_, "protocol desync: command line too long");
        return false;
    case LineStatus::Binary:
        server_.logger().warn(remote_, "protocol desync: binary data in command line");
        return false;
    }
    return false;
}

bool ClientSession::reply(const string &line) {
    return channel_->send_reply(line);
}

void ClientSession::audit(const string &action, const string &detail) {
    string err;
    if (!server_.db().insert_log(user_id_, action, detail, remote_, err)) {
        server_.logger().warn(remote_, "audit log failed: " + err);
    }
}

bool ClientSession::handle_command(const string &line) {
    size_t colon = line.find(':');
    string cmd  = colon == string::npos ? line : line.substr(0, colon);
    string args = colon == string::npos ? "" : line.substr(colon + 1);

    if (cmd == "LOGIN")  return cmd_login(args);
    if (cmd == "SIGNUP") return cmd_signup(args);

    if (state_ != State::Authenticated) {
        return reply("ERROR:Not authenticated");
    }

    if (cmd == "LIST_FILES") return cmd_list_files();
    if (cmd == "UPLOAD")     return cmd_upload(args);
    if (cmd == "DOWNLOAD")   return cmd_download(args);
    if (cmd == "DELETE")     return cmd_delete(args);
    if (cmd == "CHAT")       return cmd_chat(args);
    if (cmd == "STATS")      return cmd_stats();
    if (cmd == "PROTO")      return cmd_proto(args);
    if (cmd == "LOGOUT")     return cmd_logout();

    return reply("ERROR:Unknown command");
}

bool ClientSession::cmd_login(const string &args) {
    vector<string> f = split_fields(args, ':', 2);
    if (f.size() < 2 || f[0].empty()) {
        return reply("ERROR:Usage: LOGIN:<email>:<password>");
    }
    const string &email = f[0];
    const string &pass  = f[1];

    UserRecord rec;
    string err;
    if (!server_.db().get_user_by_email(email, rec, err)) {
        if (!err.empty()) {
            server_.logger().error(remote_, "login lookup failed: " + err);
            return reply("LOGIN_FAILED:Server error");
        }
        server_.logger().log(email, "Login failed (user not found)");
        return reply("LOGIN_FAILED:Invalid credentials");
    }
    if (hash_password(pass) != rec.password_hash) {
        server_.logger().log(email, "Login failed (wrong password)");
        return reply("LOGIN_FAILED:Invalid credentials");
    }

    if (state_ == State::Authenticated) leave_authenticated();

    name_    = rec.name;
    email_   = rec.email;
    user_id_ = rec.id;

    // reply first so the client sees LOGIN_SUCCESS before any notification
    if (!reply("LOGIN_SUCCESS:" + name_)) return false;
    enter_authenticated();

    server_.logger().log(email_, "Login success");
    audit("login", "Login success");
    return true;
}

bool ClientSession::cmd_signup(const string &args) {
    vector<string> f = split_fields(args, ':', 3);
    if (f.size() < 3 || f[0].empty() || f[1].empty() || f[2].empty()) {
        return reply("ERROR:Usage: SIGNUP:<name>:<email>:<password>");
    }
    const string &name  = f[0];
    const string &email = f[1];
    const string &pass  = f[2];

    UserRecord rec;
    string err;
    if (server_.db().get_user_by_email(email, rec, err)) {
        return reply("SIGNUP_FAILED:EMAIL_EXISTS");
    }
    if (!err.empty()) {
        server_.logger().error(remote_, "signup lookup failed: " + err);
        return reply("SIGNUP_FAILED:" + err);
    }

    if (!server_.db().create_user(name, email, hash_password(pass), err)) {
        if (err.find("UNIQUE") != string::npos) {
            return reply("SIGNUP_FAILED:EMAIL_EXISTS");
        }
        server_.logger().error(remote_, "signup failed: " + err);
        return reply("SIGNUP_FAILED:" + err);
    }

    server_.logger().log(email, "SIGNUP success");
    return reply("SIGNUP_SUCCESS");
}

bool ClientSession::cmd_list_files() {
    vector<SharedFileInfo> files;
    string err;
    if (!server_.coordinator().list_files(files, err)) {
        server_.logger().warn(remote_, err);
        return reply("ERROR:" + err);
    }

    string msg = "FILE_LIST:";
    for (auto &fi : files) {
        msg += fi.name + ":" + to_string(fi.size) + ":" + utils::format_time(fi.modified) + "|";
    }
    server_.logger().log(name_, "LIST_FILES (" + to_string(files.size()) + " files)");
    return reply(msg);
}

bool ClientSession::cmd_upload(const string &args) {
    size_t pos = args.rfind(':');
    if (pos == string::npos) {
        return reply("ERROR:Usage: UPLOAD:<name>:<size>");
    }
    string name = args.substr(0, pos);
    uint64_t size = 0;
    if (!parse_size(args.substr(pos + 1), size)) {
        return reply("ERROR:Invalid size");
    }

    string path, err;
    if (!is_listable_name(name) || !server_.coordinator().resolve(name, path, err)) {
        server_.logger().warn(name_, "UPLOAD rejected: " + name);
        return reply("UPLOAD_FAILED:Invalid file name");
    }

    if (!reply("READY:Ready to receive file")) return false;

    gate_->enter();
    auto source = make_shared<SocketSource>(sockfd_, size, channel_->framed(),
                                            (int)server_.config().stall_timeout_ms, gate_);
    TransferResult res = server_.coordinator().handle_upload(name, source, size, name_,
                                                            channel_->id());

    if (res.error == TransferError::Timeout) {
        // the task still owns the socket; answer now, then wait for it
        bool sent = reply("UPLOAD_FAILED:" + res.message);
        gate_->wait_idle();
        server_.add_bytes_in(source->consumed());
        if (!sent || !source->aligned()) {
            server_.logger().warn(name_, "UPLOAD " + name + " timed out mid-payload, closing");
            return false;
        }
        return true;
    }
    server_.add_bytes_in(source->consumed());

    if (res.success) {
        server_.logger().log(name_, "UPLOAD " + name + " size=" + to_string(size));
        audit("upload", name + " size=" + to_string(size));
        return reply("UPLOAD_SUCCESS:File uploaded successfully");
    }

    server_.logger().warn(name_, "UPLOAD " + name + " failed: " + res.message);
    bool sent = reply("UPLOAD_FAILED:" + res.message);
    if (!source->aligned()) {
        server_.logger().warn(name_, "UPLOAD " + name + " left the stream unusable (" +
                                     source->error() + "), closing");
        return false;
    }
    return sent;
}

bool ClientSession::cmd_download(const string &args) {
    const string &name = args;
    if (name.empty()) {
        return reply("ERROR:Usage: DOWNLOAD:<name>");
    }

    gate_->enter();
    auto sink = make_shared<SocketSink>(channel_, gate_);
    TransferResult res = server_.coordinator().handle_download(name, sink);

    if (res.success) {
        server_.add_bytes_out(res.bytes);
        server_.logger().log(name_, "DOWNLOAD " + name + " size=" + to_string(res.bytes));
        audit("download", name + " size=" + to_string(res.bytes));
        return true;
    }

    if (res.error == TransferError::Timeout) {
        if (sink->abandon()) {
            return reply("ERROR:Download timeout");
        }
        // FILE_SIZE is out; the task finishes the payload or the stream is lost
        gate_->wait_idle();
        if (sink->complete()) return true;
        server_.logger().warn(name_, "DOWNLOAD " + name + " timed out mid-payload, closing");
        return false;
    }

    if (sink->started()) {
        server_.logger().warn(name_, "DOWNLOAD " + name + " failed mid-payload (" +
                                     res.message + "), closing");
        return false;
    }

    switch (res.error) {
    case TransferError::NotFound:
        return reply("ERROR:File not found");
    case TransferError::InvalidPath:
        return reply("ERROR:Invalid file name");
    default:
        server_.logger().warn(name_, "DOWNLOAD " + name + " failed: " + res.message);
        return reply("ERROR:" + res.message);
    }
}

bool ClientSession::cmd_delete(const string &args) {
    const string &name = args;
    if (name.empty()) {
        return reply("ERROR:Usage: DELETE:<name>");
    }

    TransferResult res = server_.coordinator().handle_delete(name, name_, channel_->id());
    if (!res.success) {
        server_.logger().warn(name_, "DELETE " + name + " failed: " + res.message);
        return reply("DELETE_FAILED:" + res.message);
    }

    server_.logger().log(name_, "DELETE " + name);
    audit("delete", name);
    return reply("DELETE_SUCCESS:" + name);
}

bool ClientSession::cmd_chat(const string &text) {
    shared_ptr<ChatHandler> chat = server_.chat_handler();
    if (!chat) {
        return reply("ERROR:Chat not available");
    }
    string err;
    if (!chat->on_message(name_, text, err)) {
        return reply("ERROR:" + err);
    }
    return reply("CHAT_SENT");
}

bool ClientSession::cmd_stats() {
    server_.logger().log(name_, "STATS");
    return reply("STATS:" + server_.stats_summary());
}

bool ClientSession::cmd_proto(const string &args) {
    if (args != "FRAMED") {
        return reply("ERROR:Unsupported protocol");
    }
    if (channel_->framed()) {
        return reply("PROTO:FRAMED");
    }
    if (!channel_->enter_framed_mode("PROTO:FRAMED")) return false;
    server_.logger().log(name_, "switched to framed protocol");
    return true;
}

bool ClientSession::cmd_logout() {
    if (state_ == State::Authenticated) {
        server_.logger().log(name_, "Logout");
        audit("logout", "");
        leave_authenticated();
    }
    return reply("LOGOUT_SUCCESS");
}

void ClientSession::enter_authenticated() {
    state_ = State::Authenticated;
    server_.user_login(name_);
    server_.broadcaster().register_client(channel_, name_);
    registered_ = true;
    server_.broadcaster().notify_client_connected(name_, remote_, channel_->id());
}

void ClientSession::leave_authenticated() {
    if (state_ != State::Authenticated) return;
    state_ = State::Unauthenticated;

    if (registered_) {
        server_.broadcaster().unregister_client(channel_);
        registered_ = false;
        server_.broadcaster().notify_client_disconnected(name_, remote_, channel_->id());
    }
    server_.user_logout(name_);
    user_id_ = 0;
}

void ClientSession::disconnect() {
    if (state_ == State::Disconnected) return;

    leave_authenticated();

    // unblock a transfer task that still reads or writes the socket
    ::shutdown(sockfd_, SHUT_RDWR);
    channel_->mark_closed();
    gate_->wait_idle();

    state_ = State::Disconnected;
    server_.logger().log(remote_, "disconnected");
}
