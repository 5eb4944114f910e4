#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <platform/socket_util.hpp>
#include "stream.hpp"

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;
typedef struct _LIBSSH2_CHANNEL LIBSSH2_CHANNEL;

// Stream over a non-blocking libssh2 shell channel. Does not own the
// channel; SessionManager frees it after close(). Every libssh2 call holds
// io_mutex briefly, and waits on the socket happen without it, so the
// reader thread and the writer never block each other for long.
class ChannelStream : public Stream {
public:
    ChannelStream(LIBSSH2_CHANNEL* channel, std::shared_ptr<std::mutex> io_mutex,
                  socket_t sock);
    ~ChannelStream() override;

    int read(char* buf, int len) override;
    int write(const char* data, int len) override;

    // Send EOF on the channel and make pending/future reads return 0.
    void close() override;

    ChannelStream(const ChannelStream&) = delete;
    ChannelStream& operator=(const ChannelStream&) = delete;

private:
    LIBSSH2_CHANNEL* ch_;
    std::shared_ptr<std::mutex> io_mutex_;
    socket_t sock_;
    std::atomic<bool> closed_{false};
};
