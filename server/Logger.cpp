#include "Logger.hpp"
#include <iostream>

Logger::Logger(const string &filename, bool echo) : echo_(echo) {
    if (!filename.empty()) out_.open(filename, ios::app);
}

void Logger::log(const string &tag, const string &msg) {
    write(nullptr, tag, msg);
}

void Logger::warn(const string &tag, const string &msg) {
    write("WARN", tag, msg);
}

void Logger::error(const string &tag, const string &msg) {
    write("ERROR", tag, msg);
}

void Logger::write(const char *level, const string &tag, const string &msg) {
    if (!out_ && !echo_) return;

    auto now = chrono::system_clock::now();
    auto tt  = chrono::system_clock::to_time_t(now);
    tm tmv{};
    localtime_r(&tt, &tmv);

    lock_guard<mutex> lock(mtx_);
    if (out_) {
        out_ << put_time(&tmv, "%Y-%m-%d %H:%M:%S")
             << " [" << tag << "] ";
        if (level) out_ << level << ": ";
        out_ << msg << "\n";
        out_.flush();
    }
    if (echo_) {
        cerr << put_time(&tmv, "%H:%M:%S") << " [" << tag << "] ";
        if (level) cerr << level << ": ";
        cerr << msg << "\n";
    }
}
