#include "ServerConfig.hpp"
#include <cstdlib>
#include <stdexcept>

using namespace std;

namespace {

bool parse_int(const char *name, const string &value, int64_t lo, int64_t hi,
               int64_t &out, string &err) {
    try {
        size_t used = 0;
        long long v = stoll(value, &used);
        if (used != value.size() || v < lo || v > hi) {
            err = string(name) + ": out of range: " + value;
            return false;
        }
        out = v;
        return true;
    } catch (const exception &) {
        err = string(name) + ": not a number: " + value;
        return false;
    }
}

bool parse_bool(const char *name, const string &value, bool &out, string &err) {
    if (value == "1" || value == "true" || value == "on" || value == "yes") {
        out = true;
        return true;
    }
    if (value == "0" || value == "false" || value == "off" || value == "no") {
        out = false;
        return true;
    }
    err = string(name) + ": expected a boolean: " + value;
    return false;
}

} // namespace

bool ServerConfig::load_from_env(string &err) {
    bool ok = true;
    int64_t v = 0;

    if (const char *p = ::getenv("FS_ROOT")) root_dir = p;
    if (const char *p = ::getenv("FS_LOG_PATH")) log_path = p;
    if (const char *p = ::getenv("FS_DB_PATH")) db_path = p;
    if (const char *p = ::getenv("FS_UDP_ADDR")) udp_address = p;

    if (const char *p = ::getenv("FS_PORT")) {
        if (parse_int("FS_PORT", p, 0, 65535, v, err)) port = (int)v;
        else ok = false;
    }
    if (const char *p = ::getenv("FS_UDP_ENABLED")) {
        if (!parse_bool("FS_UDP_ENABLED", p, udp_enabled, err)) ok = false;
    }
    if (const char *p = ::getenv("FS_UDP_PORT")) {
        if (parse_int("FS_UDP_PORT", p, 1, 65535, v, err)) udp_port = (int)v;
        else ok = false;
    }
    if (const char *p = ::getenv("FS_WORKERS")) {
        if (parse_int("FS_WORKERS", p, 1, 1024, v, err)) worker_count = (size_t)v;
        else ok = false;
    }
    if (const char *p = ::getenv("FS_TIMEOUT_MS")) {
        if (parse_int("FS_TIMEOUT_MS", p, 1, 24LL * 3600 * 1000, v, err)) op_timeout_ms = v;
        else ok = false;
    }
    if (const char *p = ::getenv("FS_STALL_MS")) {
        if (parse_int("FS_STALL_MS", p, 1, 24LL * 3600 * 1000, v, err)) stall_timeout_ms = v;
        else ok = false;
    }
    return ok;
}

bool ServerConfig::apply_args(int argc, char *argv[], string &err) {
    if (argc > 1) {
        int64_t v = 0;
        if (!parse_int("port", argv[1], 0, 65535, v, err)) return false;
        port = (int)v;
    }
    if (argc > 2) root_dir = argv[2];
    return true;
}
