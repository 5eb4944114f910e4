#pragma once

#include <string>
#include <vector>
#include <memory>
#include <re2/re2.h>
#include <chrono>
#include <optional>
#include <functional>
#include <core/types.hpp>
#include "buffered_matcher.hpp"

// A compiled regular expression plus the source text it came from.
// RE2 syntax (`\d`, `\s`, `(?:...)`, lazy quantifiers, no backreferences);
// `$` anchors at the end of the buffer. Search is linear in the buffer size.
struct Pattern {
    std::shared_ptr<const re2::RE2> regex;
    std::string raw;

    // Compile `raw`. On failure returns nullopt and, if given, fills `error`.
    static std::optional<Pattern> compile(const std::string& raw,
                                          std::string* error = nullptr);
};

// Where a target was found in the buffer: the prefix [0, end) is consumed.
struct MatchSpan {
    size_t end = 0;
    size_t pattern_index = 0;
};

// Match strategies layered over a BufferedMatcher. Every call re-scans the
// whole buffer on each poll, so a delimiter split across chunks is found as
// soon as its last byte lands.
//
// On a match the consumed prefix ends at the end of the match and the
// remainder stays buffered for the next call. On deadline expiry the whole
// buffer is returned with Status::NoMatch and the buffer is left empty. If
// the reader has stopped and nothing is left to drain, the call returns
// Status::StreamClosed right away instead of waiting out the deadline.
//
// One read-until call at a time per buffer.
class ExpectMatcher {
public:
    explicit ExpectMatcher(BufferedMatcher& buffer);

    // Until `literal` appears. An empty literal matches at once and
    // returns "" without consuming anything.
    ReadResult read_until(const std::string& literal, std::chrono::milliseconds timeout);

    // Until `pattern` matches anywhere. InvalidPattern (no wait) if it
    // doesn't compile.
    ReadResult read_until_regex(const std::string& pattern, std::chrono::milliseconds timeout);

    // Until any of `patterns` matches. Patterns that fail to compile are
    // skipped. On each poll the list is tried in order and the first
    // pattern that matches wins, wherever its match starts.
    ReadResult read_until_any(const std::vector<std::string>& patterns,
                              std::chrono::milliseconds timeout);
    ReadResult read_until_any(const std::vector<Pattern>& patterns,
                              std::chrono::milliseconds timeout);

private:
    using Finder = std::function<std::optional<MatchSpan>(const std::string&)>;

    BufferedMatcher& buffer_;

    ReadResult expect(const Finder& find, std::chrono::milliseconds timeout,
                      const std::string& what);
};

// First match of `patterns` (in list order) against `text`.
std::optional<MatchSpan> find_first_pattern(const std::string& text,
                                            const std::vector<Pattern>& patterns);
