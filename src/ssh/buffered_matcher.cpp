#include "buffered_matcher.hpp"

BufferedMatcher::BufferedMatcher(std::shared_ptr<HandoffChannel> channel)
    : channel_(std::move(channel)) {}

bool BufferedMatcher::drain_available(Clock::time_point deadline) {
    if (auto chunk = channel_->try_pop()) {
        buffer_ += *chunk;
        return true;
    }

    auto now = Clock::now();
    if (now >= deadline) return false;

    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
    // Round up so a sub-millisecond remainder still waits instead of spinning
    if (remaining.count() == 0) remaining = std::chrono::milliseconds(1);
    auto wait = remaining < quantum_ ? remaining : quantum_;

    if (auto chunk = channel_->pop_for(wait)) {
        buffer_ += *chunk;
        return true;
    }
    return false;
}

std::string BufferedMatcher::consume(size_t n) {
    if (n >= buffer_.size()) {
        return take_all();
    }
    std::string prefix = buffer_.substr(0, n);
    buffer_.erase(0, n);
    return prefix;
}

std::string BufferedMatcher::take_all() {
    std::string out;
    out.swap(buffer_);
    return out;
}

bool BufferedMatcher::source_closed() const {
    return channel_->drained();
}

void BufferedMatcher::set_poll_quantum(std::chrono::milliseconds quantum) {
    quantum_ = quantum.count() > 0 ? quantum : std::chrono::milliseconds(1);
}
