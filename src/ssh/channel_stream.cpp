#include "channel_stream.hpp"
#include <core/constants.hpp>
#include <platform/platform.hpp>
#include <libssh2.h>

ChannelStream::ChannelStream(LIBSSH2_CHANNEL* channel, std::shared_ptr<std::mutex> io_mutex,
                             socket_t sock)
    : ch_(channel), io_mutex_(std::move(io_mutex)), sock_(sock) {}

ChannelStream::~ChannelStream() {
    close();
}

int ChannelStream::read(char* buf, int len) {
    while (true) {
        ssize_t n;
        bool eof = false;
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            if (closed_ || !ch_) return 0;
            n = libssh2_channel_read(ch_, buf, len);
            if (n == LIBSSH2_ERROR_EAGAIN || n == 0) {
                eof = libssh2_channel_eof(ch_) != 0;
            }
        }

        if (n > 0) return static_cast<int>(n);
        if (eof) return 0;
        if (n != LIBSSH2_ERROR_EAGAIN && n != 0) return static_cast<int>(n);

        // Nothing buffered: wait on the socket without holding io_mutex_,
        // in short slices so close() is noticed promptly.
        platform::poll_socket(sock_, POLLIN, SSH_IO_SLICE_MS);
    }
}

int ChannelStream::write(const char* data, int len) {
    int retries = 0;
    while (true) {
        ssize_t w;
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            if (closed_ || !ch_) return -1;
            w = libssh2_channel_write(ch_, data, len);
        }
        if (w == LIBSSH2_ERROR_EAGAIN) {
            if (++retries > SSH_WRITE_STALL_RETRIES) return -1;
            platform::poll_socket(sock_, POLLOUT, 10);
            continue;
        }
        return static_cast<int>(w);
    }
}

void ChannelStream::close() {
    std::lock_guard<std::mutex> lock(*io_mutex_);
    if (closed_) return;
    closed_ = true;
    if (ch_) {
        libssh2_channel_send_eof(ch_);
    }
    ch_ = nullptr;
}
