#include <gtest/gtest.h>
#include <core/utils.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>

// ── String helpers ──────────────────────────────────────────

TEST(StringUtils, SplitKeepsEmptyFields) {
    auto parts = StringUtils::split("a,,b,", ',');
    ASSERT_EQ(parts.size(), 4u);
    EXPECT_EQ(parts[0], "a");
    EXPECT_EQ(parts[1], "");
    EXPECT_EQ(parts[2], "b");
    EXPECT_EQ(parts[3], "");
    EXPECT_EQ(StringUtils::join(parts, ","), "a,,b,");
}

TEST(StringUtils, Trim) {
    EXPECT_EQ(StringUtils::trim("  hi there \r\n"), "hi there");
    EXPECT_EQ(StringUtils::trim(" \t "), "");

    std::string s = "\tx ";
    trim(s);
    EXPECT_EQ(s, "x");
}

TEST(StringUtils, SplitWordsHonoursQuotes) {
    auto words = StringUtils::split_words(R"(:expect '[y/n] $' "a b"  c)");
    ASSERT_EQ(words.size(), 4u);
    EXPECT_EQ(words[0], ":expect");
    EXPECT_EQ(words[1], "[y/n] $");
    EXPECT_EQ(words[2], "a b");
    EXPECT_EQ(words[3], "c");
}

TEST(StringUtils, SplitWordsEmptyQuotes) {
    auto words = StringUtils::split_words("a '' b");
    ASSERT_EQ(words.size(), 3u);
    EXPECT_EQ(words[1], "");
}

TEST(Utils, SafeStoi) {
    EXPECT_EQ(safe_stoi("42"), 42);
    EXPECT_EQ(safe_stoi("nope", -1), -1);
    EXPECT_EQ(safe_stoi("", 7), 7);
}

// ── Echo stripping ──────────────────────────────────────────

TEST(StripCommandEcho, DropsEchoedLine) {
    EXPECT_EQ(strip_command_echo("ls -la\r\ntotal 0\r\n$ ", "ls -la"), "total 0\r\n$ ");
}

TEST(StripCommandEcho, EchoWithPromptPrefix) {
    EXPECT_EQ(strip_command_echo("$ uptime\nup 3 days\n", "uptime"), "up 3 days\n");
}

TEST(StripCommandEcho, LeavesOutputWithoutEcho) {
    EXPECT_EQ(strip_command_echo("total 0\r\n$ ", "ls"), "total 0\r\n$ ");
    EXPECT_EQ(strip_command_echo("", "ls"), "");
}

TEST(StripCommandEcho, OnlyFirstLineIsChecked) {
    EXPECT_EQ(strip_command_echo("out\nls\n", "ls"), "out\nls\n");
}

// ── Log helpers ─────────────────────────────────────────────

TEST(Log, PreviewEscapesLineBreaks) {
    EXPECT_EQ(log_preview("a\r\nb"), "a\\r\\nb");
}

TEST(Log, PreviewTruncates) {
    EXPECT_EQ(log_preview("abcdefgh", 3), "abc...(+5)");
}

TEST(Log, WritesToConfiguredPath) {
    auto previous = log_path();
    auto path = platform::temp_dir() / "sshexpect-log-test.log";
    std::error_code ec;
    std::filesystem::remove(path, ec);

    set_log_path(path.string());
    sshexpect_log("hello from test");
    set_log_path(previous);

    std::ifstream in(path);
    std::string line;
    ASSERT_TRUE(std::getline(in, line));
    EXPECT_NE(line.find("] hello from test"), std::string::npos);
    std::filesystem::remove(path, ec);
}

TEST(Platform, ExpandUser) {
    EXPECT_EQ(platform::expand_user("~/x"), platform::home_dir() / "x");
    EXPECT_EQ(platform::expand_user("/abs/path"), std::filesystem::path("/abs/path"));
}
