#include "Utils.hpp"
#include <sys/stat.h>
#include <unistd.h>
#include <errno.h>
#include <filesystem>
#include <iomanip>
#include <sstream>

using namespace std;

namespace utils {

string join_path(const string &a, const string &b) {
    if (a.empty()) return b;
    if (b.empty()) return a;

    bool a_slash_end = (!a.empty() && a.back() == '/');
    bool b_slash_start = (!b.empty() && b.front() == '/');

    if (a_slash_end && b_slash_start) {
        return a + b.substr(1);
    } else if (!a_slash_end && !b_slash_start) {
        return a + "/" + b;
    } else {
        return a + b;
    }
}

static bool mkdir_single(const string &path) {
    if (path.empty()) return true;
    int rc = ::mkdir(path.c_str(), 0755);
    if (rc == 0) return true;
    if (errno == EEXIST) return true;
    return false;
}

vector<string> split_path(const string &path) {
    vector<string> parts;
    string cur;
    for (char c : path) {
        if (c == '/') {
            if (!cur.empty()) {
                parts.push_back(cur);
                cur.clear();
            }
        } else {
            cur.push_back(c);
        }
    }
    if (!cur.empty()) parts.push_back(cur);
    return parts;
}

bool ensure_dir(const string &path) {
    if (path.empty()) return true;

    vector<string> parts = split_path(path);
    string cur;
    if (path.front() == '/') {
        cur = "/";
    }

    for (size_t i = 0; i < parts.size(); ++i) {
        if (cur == "/" || cur.empty())
            cur += parts[i];
        else
            cur = join_path(cur, parts[i]);

        if (!mkdir_single(cur)) {
            struct stat st{};
            if (::stat(cur.c_str(), &st) != 0 || !S_ISDIR(st.st_mode)) {
                return false;
            }
        }
    }
    return true;
}

bool file_exists(const string &path) {
    struct stat st{};
    return (::stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode));
}

uint64_t file_size(const string &path) {
    struct stat st{};
    if (::stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode)) {
        return (uint64_t)st.st_size;
    }
    return 0;
}

bool is_hidden_name(const string &name) {
    return !name.empty() && name.front() == '.';
}

bool resolve_under_root(const string &root, const string &name,
                        string &out_path, string &err) {
    namespace fs = std::filesystem;

    if (name.empty()) {
        err = "Empty file name";
        return false;
    }
    if (name.front() == '/') {
        err = "Absolute paths are not allowed";
        return false;
    }
    for (const string &part : split_path(name)) {
        if (is_hidden_name(part)) {
            err = "Invalid file name";
            return false;
        }
    }

    std::error_code ec;
    fs::path root_canon = fs::weakly_canonical(fs::absolute(root, ec), ec);
    if (ec) {
        err = "Cannot resolve shared root: " + ec.message();
        return false;
    }
    if (root_canon.has_parent_path() && root_canon.filename().empty()) {
        root_canon = root_canon.parent_path();
    }
    fs::path target = fs::weakly_canonical(root_canon / name, ec);
    if (ec) {
        err = "Cannot resolve path: " + ec.message();
        return false;
    }

    // target must be strictly below root
    auto r = root_canon.begin();
    auto t = target.begin();
    for (; r != root_canon.end(); ++r, ++t) {
        if (t == target.end() || *r != *t) {
            err = "Path escapes shared root";
            return false;
        }
    }
    if (t == target.end()) {
        err = "Path escapes shared root";
        return false;
    }

    out_path = target.string();
    return true;
}

string format_time(time_t t) {
    tm tmv{};
    localtime_r(&t, &tmv);
    stringstream ss;
    ss << put_time(&tmv, "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

string temp_path_for(const string &path) {
    size_t pos = path.find_last_of('/');
    if (pos == string::npos) return "." + path + ".part";
    return path.substr(0, pos + 1) + "." + path.substr(pos + 1) + ".part";
}

} // namespace utils
