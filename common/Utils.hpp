#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <ctime>

using namespace std;

namespace utils {

// Join 2 paths with exactly one '/'
string join_path(const string &a, const string &b);

// "mkdir -p": true if the directory exists or was created
bool ensure_dir(const string &path);

// Regular file exists
bool file_exists(const string &path);

// Size in bytes, 0 if missing / not a regular file
uint64_t file_size(const string &path);

// Split a path on '/', dropping empty components
vector<string> split_path(const string &path);

// Names starting with '.' are private to the server (temp files, etc.)
bool is_hidden_name(const string &name);

// Resolve name under root. Fails for empty names, absolute names and anything
// that escapes root once "." / ".." and symlinks are resolved.
bool resolve_under_root(const string &root, const string &name,
                        string &out_path, string &err);

// "YYYY-mm-dd HH:MM:SS" local time
string format_time(time_t t);

// Hidden sibling used while a file is being written: dir/.name.part
string temp_path_for(const string &path);

} // namespace utils
