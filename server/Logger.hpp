#pragma once
#include <fstream>
#include <mutex>
#include <string>
#include <chrono>
#include <iomanip>

using namespace std;

class Logger {
public:
    // Empty filename: no file output (echo only)
    explicit Logger(const string &filename, bool echo = false);

    void log(const string &tag, const string &msg);
    void warn(const string &tag, const string &msg);
    void error(const string &tag, const string &msg);

private:
    void write(const char *level, const string &tag, const string &msg);

    ofstream out_;
    mutex mtx_;
    bool echo_ = false;
};
