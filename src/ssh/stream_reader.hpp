#pragma once

#include <atomic>
#include <memory>
#include <thread>
#include <core/constants.hpp>
#include "stream.hpp"
#include "handoff_channel.hpp"

// Background producer: reads the stream in a dedicated thread and hands each
// non-empty read to the channel as one chunk. Never touches the consumer's
// buffer. Exits when the stream reports EOF/error or the channel is closed,
// closing the channel on the way out so the consumer can tell.
class StreamReader {
public:
    StreamReader(Stream& stream, std::shared_ptr<HandoffChannel> channel,
                 int chunk_size = SSH_READ_CHUNK_SIZE);
    ~StreamReader();

    void start();

    // Close the channel and join. The owner closes the Stream first so a
    // read blocked inside the thread returns.
    void stop();

    bool running() const { return running_; }

    // Return code of the read that ended the loop (0 = EOF).
    int exit_code() const { return exit_code_; }

    StreamReader(const StreamReader&) = delete;
    StreamReader& operator=(const StreamReader&) = delete;

private:
    Stream& stream_;
    std::shared_ptr<HandoffChannel> channel_;
    int chunk_size_;
    std::thread thread_;
    std::atomic<bool> running_{false};
    std::atomic<int> exit_code_{0};

    void run();
};
