#pragma once

#include <string>
#include <deque>
#include <mutex>
#include <condition_variable>
#include <optional>
#include <chrono>
#include <core/constants.hpp>

// FIFO of raw chunks from the StreamReader thread to the consumer.
//
// push() blocks while the queue holds `capacity` chunks, so a slow consumer
// throttles the reader. close() ends the conduit from either side: pending
// chunks stay poppable, further pushes are rejected, and every waiter wakes.
class HandoffChannel {
public:
    explicit HandoffChannel(size_t capacity = HANDOFF_CAPACITY);

    // Queue a chunk. Empty chunks are ignored. Returns false once closed.
    bool push(std::string chunk);

    // Take the oldest chunk without waiting.
    std::optional<std::string> try_pop();

    // Take the oldest chunk, waiting up to `wait` for one to arrive.
    std::optional<std::string> pop_for(std::chrono::milliseconds wait);

    void close();
    bool closed() const;

    // Closed and nothing left to pop.
    bool drained() const;

    size_t size() const;

    HandoffChannel(const HandoffChannel&) = delete;
    HandoffChannel& operator=(const HandoffChannel&) = delete;

private:
    const size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::deque<std::string> chunks_;
    bool closed_ = false;

    std::string pop_front_locked();
};
