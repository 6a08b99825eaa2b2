#include <gtest/gtest.h>
#include <chrono>
#include <ssh/expect.hpp>
#include "fake_transport.hpp"

using namespace std::chrono_literals;

TEST(ExpectMatcher, NoMatchYet) {
    ExpectMatcher matcher({"done"}, {"error"});
    auto result = matcher.feed("working...");
    EXPECT_EQ(result.status, MatchStatus::TIMED_OUT);
    EXPECT_FALSE(result.matched());
}

TEST(ExpectMatcher, MatchesAcrossChunks) {
    ExpectMatcher matcher({"load complete"}, {});
    EXPECT_FALSE(matcher.feed("Program Lo").matched());
    auto result = matcher.feed("ad Complete\r\n");

    EXPECT_EQ(result.status, MatchStatus::SUCCESS);
    EXPECT_EQ(result.matched_text, "Load Complete");
    EXPECT_EQ(result.before_text, "Program ");
}

TEST(ExpectMatcher, FailureCheckedFirst) {
    ExpectMatcher matcher({"ok", "done"}, {"fail"});
    auto result = matcher.feed("done, but FAILED");
    EXPECT_EQ(result.status, MatchStatus::FAILURE);
    EXPECT_EQ(result.pattern_index, 0u);
}

TEST(ExpectMatcher, EmptyPatternsNeverMatch) {
    ExpectMatcher matcher({""}, {""});
    EXPECT_FALSE(matcher.feed("anything").matched());
}

TEST(ExpectMatcher, ClearBufferForgetsOutput) {
    ExpectMatcher matcher({"prompt>"}, {});
    matcher.feed("prom");
    matcher.clear_buffer();
    EXPECT_FALSE(matcher.feed("pt>").matched());
    EXPECT_EQ(matcher.get_buffer(), "pt>");
}

TEST(ExpectMatcher, ExpectReadsStream) {
    FakeShellStream stream;
    stream.push_output("booting\r\nCP4N>");

    std::string echoed;
    ExpectMatcher matcher({"cp4n>"}, {});
    auto result = matcher.expect(stream, CancelToken::none(), 1000ms, 10ms,
                                 [&](const std::string& data) { echoed += data; });

    EXPECT_EQ(result.status, MatchStatus::SUCCESS);
    EXPECT_EQ(echoed, "booting\r\nCP4N>");
}

TEST(ExpectMatcher, ExpectTimesOut) {
    FakeShellStream stream;
    ExpectMatcher matcher({"never"}, {});
    auto result = matcher.expect(stream, CancelToken::none(), 50ms, 10ms);
    EXPECT_EQ(result.status, MatchStatus::TIMED_OUT);
}

TEST(ExpectMatcher, ExpectReportsClosedStream) {
    FakeShellStream stream;
    stream.push_output("partial");
    stream.close();

    ExpectMatcher matcher({"never"}, {});
    auto result = matcher.expect(stream, CancelToken::none(), 500ms, 10ms);
    EXPECT_EQ(result.status, MatchStatus::STREAM_ERROR);
}

TEST(ExpectMatcher, ExpectHonoursCancel) {
    FakeShellStream stream;
    CancelToken cancel;
    cancel.cancel();

    ExpectMatcher matcher({"never"}, {});
    auto result = matcher.expect(stream, cancel, 1000ms, 10ms);
    EXPECT_EQ(result.status, MatchStatus::CANCELLED);
}
