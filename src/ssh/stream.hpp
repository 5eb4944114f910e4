#pragma once

#include <string>

// Duplex byte channel to a remote shell (stdin/stdout of the far end).
//
// read() blocks until at least one byte is available and returns the count,
// 0 on EOF or after close(), negative on error. write() returns the number
// of bytes accepted (possibly fewer than len) or negative on error.
// close() may be called from another thread while read() is blocked and
// must make that read return.
class Stream {
public:
    virtual ~Stream() = default;

    virtual int read(char* buf, int len) = 0;
    virtual int write(const char* data, int len) = 0;
    virtual void close() = 0;
};

// Write all of `data`, looping over partial writes. False on error.
inline bool write_all(Stream& stream, const std::string& data) {
    int total = static_cast<int>(data.size());
    int sent = 0;
    while (sent < total) {
        int w = stream.write(data.data() + sent, total - sent);
        if (w <= 0) return false;
        sent += w;
    }
    return true;
}
