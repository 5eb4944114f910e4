#include "expect.hpp"
#include <core/log.hpp>

std::optional<Pattern> Pattern::compile(const std::string& raw, std::string* error) {
    RE2::Options options;
    options.set_log_errors(false);
    auto regex = std::make_shared<const RE2>(raw, options);
    if (!regex->ok()) {
        if (error) *error = regex->error();
        return std::nullopt;
    }
    return Pattern{std::move(regex), raw};
}

std::optional<MatchSpan> find_first_pattern(const std::string& text,
                                            const std::vector<Pattern>& patterns) {
    re2::StringPiece input(text);
    for (size_t i = 0; i < patterns.size(); ++i) {
        re2::StringPiece match;
        if (patterns[i].regex->Match(input, 0, input.size(), RE2::UNANCHORED, &match, 1)) {
            MatchSpan span;
            span.end = static_cast<size_t>(match.data() - input.data()) + match.size();
            span.pattern_index = i;
            return span;
        }
    }
    return std::nullopt;
}

ExpectMatcher::ExpectMatcher(BufferedMatcher& buffer) : buffer_(buffer) {}

ReadResult ExpectMatcher::read_until(const std::string& literal,
                                     std::chrono::milliseconds timeout) {
    auto find = [&literal](const std::string& buf) -> std::optional<MatchSpan> {
        auto pos = buf.find(literal);
        if (pos == std::string::npos) return std::nullopt;
        return MatchSpan{pos + literal.size(), 0};
    };
    return expect(find, timeout, fmt::format("literal '{}'", log_preview(literal)));
}

ReadResult ExpectMatcher::read_until_regex(const std::string& pattern,
                                           std::chrono::milliseconds timeout) {
    std::string error;
    auto compiled = Pattern::compile(pattern, &error);
    if (!compiled) {
        sshexpect_log(fmt::format("expect: invalid pattern '{}': {}", pattern, error));
        ReadResult result;
        result.status = Status::InvalidPattern;
        result.error = fmt::format("invalid pattern '{}': {}", pattern, error);
        return result;
    }

    std::vector<Pattern> patterns{std::move(*compiled)};
    auto find = [&patterns](const std::string& buf) {
        return find_first_pattern(buf, patterns);
    };
    return expect(find, timeout, fmt::format("pattern '{}'", pattern));
}

ReadResult ExpectMatcher::read_until_any(const std::vector<std::string>& patterns,
                                         std::chrono::milliseconds timeout) {
    std::vector<Pattern> compiled;
    std::vector<size_t> caller_index;
    compiled.reserve(patterns.size());

    for (size_t i = 0; i < patterns.size(); ++i) {
        std::string error;
        auto p = Pattern::compile(patterns[i], &error);
        if (!p) {
            sshexpect_log(fmt::format("expect: skipping invalid pattern [{}] '{}': {}",
                                      i, patterns[i], error));
            continue;
        }
        compiled.push_back(std::move(*p));
        caller_index.push_back(i);
    }

    auto result = read_until_any(compiled, timeout);
    // Report the index in the caller's list, not the filtered one
    if (result.matched() && result.pattern_index < caller_index.size()) {
        result.pattern_index = caller_index[result.pattern_index];
    }
    return result;
}

ReadResult ExpectMatcher::read_until_any(const std::vector<Pattern>& patterns,
                                         std::chrono::milliseconds timeout) {
    auto find = [&patterns](const std::string& buf) {
        return find_first_pattern(buf, patterns);
    };
    return expect(find, timeout, fmt::format("{} pattern(s)", patterns.size()));
}

ReadResult ExpectMatcher::expect(const Finder& find, std::chrono::milliseconds timeout,
                                 const std::string& what) {
    auto deadline = BufferedMatcher::Clock::now() + timeout;
    ReadResult result;

    while (true) {
        if (auto span = find(buffer_.buffer())) {
            result.status = Status::Ok;
            result.pattern_index = span->pattern_index;
            result.text = buffer_.consume(span->end);
            return result;
        }

        if (BufferedMatcher::Clock::now() >= deadline) {
            break;
        }

        if (!buffer_.drain_available(deadline) && buffer_.source_closed()) {
            result.status = Status::StreamClosed;
            result.error = "stream closed before " + what + " was seen";
            result.text = buffer_.take_all();
            sshexpect_log(fmt::format("expect: {}; returning {} buffered bytes",
                                      result.error, result.text.size()));
            return result;
        }
    }

    result.status = Status::NoMatch;
    result.error = fmt::format("timed out after {}ms waiting for {}", timeout.count(), what);
    result.text = buffer_.take_all();
    sshexpect_log(fmt::format("expect: {}; buffer={}", result.error, log_preview(result.text)));
    return result;
}
