#pragma once
#include <string>
#include <cstdint>

using namespace std;

struct ServerConfig {
    string root_dir        = "./shared_files";
    int port               = 8080;          // 0 = pick an ephemeral port

    bool udp_enabled       = true;
    int udp_port           = 9876;
    string udp_address     = "255.255.255.255";

    size_t worker_count    = 10;
    int64_t op_timeout_ms  = 30000;
    int64_t stall_timeout_ms = 30000;        // max silence from a peer mid-transfer

    string log_path        = "server.log";
    string db_path         = "fileshare.db";
    bool log_echo          = true;

    // Override fields from FS_* environment variables.
    // Returns false (and err) on a malformed value; other fields are kept.
    bool load_from_env(string &err);

    // fileshare_server [port] [root]
    bool apply_args(int argc, char *argv[], string &err);
};
