#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "ClientChannel.hpp"
#include "TransferGate.hpp"

using namespace std;

class FileServer;

// One connected client: greeting, command loop, transfers. Runs on its own
// thread; only the transfer gate and the channel are shared with other threads.
class ClientSession {
public:
    enum class State { Unauthenticated, Authenticated, Disconnected };

    ClientSession(int sockfd, const string &remote, FileServer &server);
    ~ClientSession();

    void run();

    State state() const { return state_; }

private:
    // false: connection closed or stream desynchronized
    bool read_command(string &line);

    // false: close the session
    bool handle_command(const string &line);

    bool cmd_login(const string &args);
    bool cmd_signup(const string &args);
    bool cmd_list_files();
    bool cmd_upload(const string &args);
    bool cmd_download(const string &args);
    bool cmd_delete(const string &args);
    bool cmd_chat(const string &text);
    bool cmd_stats();
    bool cmd_proto(const string &args);
    bool cmd_logout();

    bool reply(const string &line);
    void audit(const string &action, const string &detail);

    void enter_authenticated();
    void leave_authenticated();
    void disconnect();

    int sockfd_;
    string remote_;
    FileServer &server_;
    shared_ptr<ClientChannel> channel_;
    shared_ptr<TransferGate> gate_;

    State state_ = State::Unauthenticated;
    string name_;
    string email_;
    int user_id_ = 0;
    bool registered_ = false;
};
