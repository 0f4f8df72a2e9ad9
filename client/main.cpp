#include "NetworkClient.hpp"
#include "../common/Protocol.hpp"
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>

using namespace std;

namespace {

void print_help() {
    cout << "commands:\n"
            "  login <email> <password>\n"
            "  signup <name> <email> <password>\n"
            "  list\n"
            "  upload <local> [remote]\n"
            "  download <remote> [local]\n"
            "  delete <remote>\n"
            "  stats\n"
            "  chat <text>\n"
            "  framed\n"
            "  notes          show notifications received so far\n"
            "  raw <line>     send a protocol line as is\n"
            "  logout\n"
            "  exit\n";
}

string base_name(const string &path) {
    size_t pos = path.find_last_of('/');
    return pos == string::npos ? path : path.substr(pos + 1);
}

void show_notifications(NetworkClient &client) {
    for (const string &n : client.take_notifications()) {
        cout << "[NOTIFY] " << n << "\n";
    }
}

void report(bool ok, const string &what, const string &err) {
    if (ok) cout << what << "\n";
    else    cout << "failed: " << err << "\n";
}

} // namespace

int main(int argc, char *argv[]) {
    if (argc < 3) {
        cout << "Usage: " << argv[0] << " <ip> <port>\n";
        return 1;
    }
    signal(SIGPIPE, SIG_IGN);

    string ip = argv[1];
    int port = atoi(argv[2]);

    NetworkClient client;
    string err;
    if (!client.connect_to(ip, port, err)) {
        cerr << err << "\n";
        return 1;
    }
    cout << "Connected to server " << ip << ":" << port << " (" << client.banner() << ")\n";
    print_help();

    string input;
    while (true) {
        cout << "> " << flush;
        if (!getline(cin, input)) break;

        vector<string> tok = proto::split_tokens(input);
        if (tok.empty()) {
            show_notifications(client);
            continue;
        }
        const string &cmd = tok[0];

        if (cmd == "exit" || cmd == "quit") {
            cout << "Bye.\n";
            break;
        } else if (cmd == "help") {
            print_help();
        } else if (cmd == "login" && tok.size() >= 3) {
            string name;
            bool ok = client.login(tok[1], tok[2], name, err);
            report(ok, "logged in as " + name, err);
        } else if (cmd == "signup" && tok.size() >= 4) {
            report(client.signup(tok[1], tok[2], tok[3], err), "account created", err);
        } else if (cmd == "list") {
            vector<NetworkClient::RemoteFile> files;
            if (client.list_files(files, err)) {
                for (auto &f : files) {
                    cout << "  " << f.name << "  " << f.size << " bytes  " << f.modified << "\n";
                }
                cout << files.size() << " file(s)\n";
            } else {
                cout << "failed: " << err << "\n";
            }
        } else if (cmd == "upload" && tok.size() >= 2) {
            string remote = tok.size() >= 3 ? tok[2] : base_name(tok[1]);
            report(client.upload_file(tok[1], remote, err), "uploaded " + remote, err);
        } else if (cmd == "download" && tok.size() >= 2) {
            string local = tok.size() >= 3 ? tok[2] : base_name(tok[1]);
            report(client.download_file(tok[1], local, err), "saved to " + local, err);
        } else if (cmd == "delete" && tok.size() >= 2) {
            report(client.delete_file(tok[1], err), "deleted " + tok[1], err);
        } else if (cmd == "stats") {
            string summary;
            if (client.stats(summary, err)) {
                for (const string &kv : proto::split_fields(summary, '|')) cout << "  " << kv << "\n";
            } else {
                cout << "failed: " << err << "\n";
            }
        } else if (cmd == "chat" && tok.size() >= 2) {
            report(client.chat(input.substr(input.find(tok[1])), err), "sent", err);
        } else if (cmd == "framed") {
            report(client.use_framed(err), "framed protocol on", err);
        } else if (cmd == "notes") {
            show_notifications(client);
        } else if (cmd == "raw" && tok.size() >= 2) {
            string resp;
            if (client.send_raw_command(input.substr(input.find(tok[1])), resp, err)) {
                cout << "[SERVER]: " << resp << "\n";
            } else {
                cout << "failed: " << err << "\n";
            }
        } else if (cmd == "logout") {
            report(client.logout(err), "logged out", err);
        } else {
            cout << "unknown command or missing arguments (try help)\n";
        }

        if (!client.connected()) {
            cout << "Server closed connection.\n";
            break;
        }
        show_notifications(client);
    }

    client.close();
    return 0;
}
