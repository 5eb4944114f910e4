#include "handoff_channel.hpp"

HandoffChannel::HandoffChannel(size_t capacity)
    : capacity_(capacity > 0 ? capacity : 1) {}

bool HandoffChannel::push(std::string chunk) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (closed_) return false;
    if (chunk.empty()) return true;

    not_full_.wait(lock, [this] { return closed_ || chunks_.size() < capacity_; });
    if (closed_) return false;

    chunks_.push_back(std::move(chunk));
    lock.unlock();
    not_empty_.notify_one();
    return true;
}

std::string HandoffChannel::pop_front_locked() {
    std::string chunk = std::move(chunks_.front());
    chunks_.pop_front();
    return chunk;
}

std::optional<std::string> HandoffChannel::try_pop() {
    std::unique_lock<std::mutex> lock(mutex_);
    if (chunks_.empty()) return std::nullopt;
    std::string chunk = pop_front_locked();
    lock.unlock();
    not_full_.notify_one();
    return chunk;
}

std::optional<std::string> HandoffChannel::pop_for(std::chrono::milliseconds wait) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!not_empty_.wait_for(lock, wait, [this] { return closed_ || !chunks_.empty(); })) {
        return std::nullopt;
    }
    if (chunks_.empty()) return std::nullopt;  // closed while waiting
    std::string chunk = pop_front_locked();
    lock.unlock();
    not_full_.notify_one();
    return chunk;
}

void HandoffChannel::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    not_empty_.notify_all();
    not_full_.notify_all();
}

bool HandoffChannel::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

bool HandoffChannel::drained() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_ && chunks_.empty();
}

size_t HandoffChannel::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return chunks_.size();
}
