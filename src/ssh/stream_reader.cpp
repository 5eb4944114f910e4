#include "stream_reader.hpp"
#include <core/log.hpp>
#include <vector>

StreamReader::StreamReader(Stream& stream, std::shared_ptr<HandoffChannel> channel,
                           int chunk_size)
    : stream_(stream), channel_(std::move(channel)),
      chunk_size_(chunk_size > 0 ? chunk_size : SSH_READ_CHUNK_SIZE) {}

StreamReader::~StreamReader() {
    stop();
}

void StreamReader::start() {
    if (thread_.joinable()) return;
    running_ = true;
    thread_ = std::thread(&StreamReader::run, this);
}

void StreamReader::stop() {
    channel_->close();
    if (thread_.joinable()) {
        thread_.join();
    }
    running_ = false;
}

void StreamReader::run() {
    std::vector<char> buf(chunk_size_);

    while (true) {
        int n = stream_.read(buf.data(), chunk_size_);
        if (n <= 0) {
            exit_code_ = n;
            if (n == 0) {
                sshexpect_log("reader: stream closed (EOF)");
            } else {
                sshexpect_log(fmt::format("reader: stream read error {}", n));
            }
            break;
        }
        if (!channel_->push(std::string(buf.data(), n))) {
            sshexpect_log("reader: handoff closed, exiting");
            break;
        }
    }

    channel_->close();
    running_ = false;
}
