#pragma once

#include <string>
#include <memory>
#include <chrono>
#include <core/constants.hpp>
#include "handoff_channel.hpp"

// Owns the receive buffer: bytes that arrived from the stream and have not
// yet been handed back to a caller. Only the consumer thread touches it; the
// reader thread talks to the HandoffChannel and nothing else.
class BufferedMatcher {
public:
    using Clock = std::chrono::steady_clock;

    explicit BufferedMatcher(std::shared_ptr<HandoffChannel> channel);

    // Move one pending chunk into the buffer. If none is ready, wait for one
    // for at most one poll quantum, never past `deadline`. Returns true if
    // the buffer grew.
    bool drain_available(Clock::time_point deadline);

    // Remove and return the first n bytes (clamped to the buffer size).
    std::string consume(size_t n);

    // Remove and return the whole buffer.
    std::string take_all();

    void clear() { buffer_.clear(); }
    const std::string& buffer() const { return buffer_; }

    // The reader has stopped and every chunk it produced has been drained.
    bool source_closed() const;

    void set_poll_quantum(std::chrono::milliseconds quantum);
    std::chrono::milliseconds poll_quantum() const { return quantum_; }

private:
    std::shared_ptr<HandoffChannel> channel_;
    std::string buffer_;
    std::chrono::milliseconds quantum_{DEFAULT_POLL_MS};
};
