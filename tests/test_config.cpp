#include <gtest/gtest.h>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <fmt/format.h>
#include <core/config.hpp>
#include <platform/platform.hpp>

TEST(Config, EmptyDocumentGivesDefaults) {
    auto config = Config::parse("");
    ASSERT_TRUE(config.is_ok()) << config.error;
    EXPECT_EQ(config.value.connection().max_reconnect_attempts, 0);
    EXPECT_EQ(config.value.connection().connect_timeout, 30);
    EXPECT_EQ(config.value.connection().keepalive_interval, 3);
    EXPECT_EQ(config.value.terminal().columns, 80);
    EXPECT_EQ(config.value.terminal().rows, 24);
    EXPECT_FALSE(config.value.log_file().has_value());
}

TEST(Config, ParsesAllSections) {
    auto config = Config::parse(R"(
connection:
  max_reconnect_attempts: -1
  connect_timeout: 10
  keepalive_interval: 0
terminal:
  width: 132
  height: 50
log_file: /var/tmp/avlink.log
)");
    ASSERT_TRUE(config.is_ok()) << config.error;
    EXPECT_EQ(config.value.connection().max_reconnect_attempts, -1);
    EXPECT_EQ(config.value.connection().connect_timeout, 10);
    EXPECT_EQ(config.value.connection().keepalive_interval, 0);
    EXPECT_EQ(config.value.terminal().columns, 132);
    EXPECT_EQ(config.value.terminal().rows, 50);
    EXPECT_EQ(config.value.terminal().type, "xterm");
    ASSERT_TRUE(config.value.log_file().has_value());
    EXPECT_EQ(*config.value.log_file(), "/var/tmp/avlink.log");
}

TEST(Config, RejectsCeilingBelowUnlimited) {
    auto config = Config::parse("connection:\n  max_reconnect_attempts: -2\n");
    ASSERT_TRUE(config.is_err());
    EXPECT_EQ(config.kind, ErrorKind::INVALID_ARGUMENT);
}

TEST(Config, RejectsNonPositiveTimeout) {
    EXPECT_TRUE(Config::parse("connection:\n  connect_timeout: 0\n").is_err());
    EXPECT_TRUE(Config::parse("connection:\n  keepalive_interval: -1\n").is_err());
}

TEST(Config, MalformedYamlIsAnError) {
    auto config = Config::parse("connection: [unclosed\n");
    ASSERT_TRUE(config.is_err());
    EXPECT_NE(config.error.find("Failed to parse config"), std::string::npos);
}

TEST(Config, LoadFileRequiresExistingFile) {
    auto missing = platform::temp_dir() / "avlink_no_such_config.yaml";
    std::filesystem::remove(missing);
    EXPECT_TRUE(Config::load_file(missing).is_err());
}

TEST(Config, LoadFileReadsYaml) {
    auto path = platform::temp_dir() / fmt::format("avlink_config_{}.yaml", std::time(nullptr));
    {
        std::ofstream out(path);
        out << "connection:\n  max_reconnect_attempts: 4\n";
    }

    auto config = Config::load_file(path);
    std::filesystem::remove(path);

    ASSERT_TRUE(config.is_ok()) << config.error;
    EXPECT_EQ(config.value.connection().max_reconnect_attempts, 4);
}
