#include "expect.hpp"
#include "transport.hpp"
#include <core/utils.hpp>

ExpectMatcher::ExpectMatcher(std::vector<std::string> success_patterns,
                             std::vector<std::string> failure_patterns)
    : success_(std::move(success_patterns)), failure_(std::move(failure_patterns)) {}

MatchResult ExpectMatcher::feed(const std::string& data) {
    buffer_ += data;

    MatchResult result{MatchStatus::TIMED_OUT, 0, "", ""};
    if (check_patterns(failure_, MatchStatus::FAILURE, result)) return result;
    if (check_patterns(success_, MatchStatus::SUCCESS, result)) return result;
    return result;
}

MatchResult ExpectMatcher::expect(ShellStream& stream,
                                  const CancelToken& cancel,
                                  std::chrono::milliseconds timeout,
                                  std::chrono::milliseconds poll_interval,
                                  const std::function<void(const std::string&)>& on_data) {
    auto start = std::chrono::steady_clock::now();

    while (std::chrono::steady_clock::now() - start < timeout) {
        if (cancel.is_cancelled()) {
            return MatchResult{MatchStatus::CANCELLED, 0, "", buffer_};
        }

        if (stream.data_available()) {
            auto chunk = stream.read();
            if (chunk.is_err()) {
                return MatchResult{MatchStatus::STREAM_ERROR, 0, "", buffer_};
            }
            if (on_data && !chunk.value.empty()) on_data(chunk.value);

            auto result = feed(chunk.value);
            if (result.matched()) return result;
        }

        if (cancel.wait_for(poll_interval)) {
            return MatchResult{MatchStatus::CANCELLED, 0, "", buffer_};
        }
    }

    return MatchResult{MatchStatus::TIMED_OUT, 0, "", buffer_};
}

bool ExpectMatcher::check_patterns(const std::vector<std::string>& patterns, MatchStatus status,
                                   MatchResult& result) const {
    std::string lowered = to_lower(buffer_);
    for (size_t i = 0; i < patterns.size(); ++i) {
        if (patterns[i].empty()) continue;
        auto pos = lowered.find(to_lower(patterns[i]));
        if (pos != std::string::npos) {
            result.status = status;
            result.pattern_index = i;
            result.matched_text = buffer_.substr(pos, patterns[i].size());
            result.before_text = buffer_.substr(0, pos);
            return true;
        }
    }
    return false;
}
