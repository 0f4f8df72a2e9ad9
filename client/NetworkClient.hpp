#pragma once
#include <string>
#include <cstdint>
#include <deque>
#include <iosfwd>
#include <vector>

using namespace std;

// Blocking client for the file-sharing protocol. NOTIFICATION messages that
// arrive while a reply is awaited are kept and handed out by
// take_notifications() / wait_notification().
class NetworkClient {
public:
    struct RemoteFile {
        string name;
        uint64_t size = 0;
        string modified;
    };

    NetworkClient();
    ~NetworkClient();

    // Connects and reads the CONNECTED greeting
    bool connect_to(const string &host, int port, string &err);
    void close();
    bool connected() const { return sockfd_ >= 0; }
    const string& banner() const { return banner_; }

    bool login(const string &email, const string &pass, string &name_out, string &err);
    bool signup(const string &name, const string &email, const string &pass, string &err);
    bool logout(string &err);

    bool list_files(vector<RemoteFile> &out, string &err);

    bool upload_file(const string &local_path, const string &remote_name, string &err);
    bool upload_bytes(const string &remote_name, const string &data, string &err);
    bool upload_stream(const string &remote_name, istream &in, uint64_t size, string &err);

    bool download_file(const string &remote_name, const string &local_path, string &err);
    bool download_bytes(const string &remote_name, string &data, string &err);
    bool download_stream(const string &remote_name, ostream &out, uint64_t &size, string &err);

    bool delete_file(const string &remote_name, string &err);
    bool stats(string &summary, string &err);
    bool chat(const string &text, string &err);

    // Switch this connection to length-prefixed frames
    bool use_framed(string &err);
    bool framed() const { return framed_; }

    // Send one command, return the first non-notification reply
    bool send_raw_command(const string &cmd, string &out, string &err);

    vector<string> take_notifications();

    // Oldest buffered notification, or the next one to arrive within timeout_ms
    bool wait_notification(string &out, int timeout_ms);

private:
    bool send_command(const string &cmd, string &err);
    bool read_message(string &line, bool &is_notification, string &err);
    bool read_reply(string &line, string &err);

    int sockfd_ = -1;
    bool framed_ = false;
    string banner_;
    deque<string> notifications_;
};
