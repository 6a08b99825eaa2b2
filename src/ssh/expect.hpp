#pragma once

#include <chrono>
#include <functional>
#include <string>
#include <vector>
#include <core/cancel_token.hpp>

class ShellStream;

enum class MatchStatus {
    SUCCESS,     // a success pattern appeared
    FAILURE,     // a failure pattern appeared
    TIMED_OUT,
    CANCELLED,
    STREAM_ERROR,
};

struct MatchResult {
    MatchStatus status;
    size_t pattern_index;
    std::string matched_text;
    std::string before_text;

    bool matched() const { return status == MatchStatus::SUCCESS || status == MatchStatus::FAILURE; }
};

// Accumulates shell output and watches it for literal, case-insensitive
// markers. Failure patterns are checked before success patterns, against
// everything received since the last clear_buffer().
class ExpectMatcher {
public:
    ExpectMatcher(std::vector<std::string> success_patterns,
                  std::vector<std::string> failure_patterns);

    // Append output and check it. TIMED_OUT means "no match yet".
    MatchResult feed(const std::string& data);

    // Poll the stream every poll_interval until a pattern matches, the
    // timeout elapses or the token is cancelled. on_data sees each chunk.
    MatchResult expect(ShellStream& stream,
                       const CancelToken& cancel,
                       std::chrono::milliseconds timeout,
                       std::chrono::milliseconds poll_interval,
                       const std::function<void(const std::string&)>& on_data = nullptr);

    void clear_buffer() { buffer_.clear(); }
    const std::string& get_buffer() const { return buffer_; }

private:
    std::vector<std::string> success_;
    std::vector<std::string> failure_;
    std::string buffer_;

    bool check_patterns(const std::vector<std::string>& patterns, MatchStatus status,
                        MatchResult& result) const;
};
