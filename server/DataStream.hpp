#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <sys/types.h>

using namespace std;

// Byte source for uploads.
class DataSource {
public:
    virtual ~DataSource() = default;

    // > 0: bytes read, 0: end of stream, < 0: error (see error())
    virtual ssize_t read_some(char *buf, size_t max_len) = 0;

    // Called once the declared byte count has been read. false means the
    // stream carried more than was declared.
    virtual bool finish() { return true; }

    // Called by the transfer task when it stops using the source,
    // whatever the outcome. Must be idempotent.
    virtual void end() {}

    virtual string error() const { return ""; }
};

// Byte sink for downloads.
class DataSink {
public:
    virtual ~DataSink() = default;

    // Called under the reader lock with the exact size about to be streamed.
    // false aborts the transfer before any byte is written.
    virtual bool begin(uint64_t size) { (void)size; return true; }

    virtual bool write_all(const char *buf, size_t len) = 0;

    virtual void end() {}

    virtual string error() const { return ""; }
};
