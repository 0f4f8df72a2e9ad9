#include "FileServer.hpp"
#include "ServerConfig.hpp"
#include <csignal>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

using namespace std;

namespace {
// Echoes server events on the operator console.
class ConsoleListener : public NotificationListener {
public:
    void on_notification(const NotificationMessage &msg) override {
        lock_guard<mutex> lk(mtx_);
        cout << msg.to_datagram() << "\n" << flush;
    }

private:
    mutex mtx_;
};

// stdin console: "stats", "quit". EOF on stdin leaves the server running.
void console_loop(FileServer &server) {
    string line;
    while (server.running() && getline(cin, line)) {
        if (line == "stats") {
            cout << server.stats_summary() << "\n";
        } else if (line == "quit" || line == "exit") {
            server.stop();
            return;
        } else if (!line.empty()) {
            cout << "commands: stats, quit\n";
        }
    }
}
} // namespace

int main(int argc, char *argv[]) {
    // a client closing mid-transfer must not kill the server
    signal(SIGPIPE, SIG_IGN);

    ServerConfig cfg;
    string err;
    if (!cfg.load_from_env(err)) {
        cerr << "Bad environment: " << err << "\n";
        return 1;
    }
    if (!cfg.apply_args(argc, argv, err)) {
        cerr << "Usage: " << argv[0] << " [port] [root]\n" << err << "\n";
        return 1;
    }

    FileServer server(cfg);
    server.broadcaster().add_listener(make_shared<ConsoleListener>());
    if (!server.start(err)) {
        cerr << "Cannot start server: " << err << "\n";
        return 1;
    }
    cout << "Server listening on port " << server.port()
         << ", sharing " << cfg.root_dir << "\n";

    thread console([&server] { console_loop(server); });
    console.detach();
    server.run();
    server.stop();
    cout << "Server stopped\n";
    return 0;
}
