// =============================================================================
// Configuration Tests
// =============================================================================

#include <gtest/gtest.h>
#include "cellwidth/cellwidth.hpp"
#include "cellwidth/config.hpp"
#include "cellwidth/logging.hpp"
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <string>

using namespace cellwidth;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        unsetenv("UNICODE_VERSION");
        unsetenv("CELLWIDTH_LOG_LEVEL");
        unsetenv("CELLWIDTH_LOG_FILE");
        Config::getInstance().clear();
        saved_level_ = Logger::getInstance().level();
        set_log_level(LogLevel::INFO);
        set_log_output(log_);
    }

    void TearDown() override {
        unsetenv("UNICODE_VERSION");
        Config::getInstance().clear();
        set_log_level(saved_level_);
        set_log_output(std::cerr);
    }

    static std::string data_file(const std::string& name) {
        return std::string(CELLWIDTH_TEST_DATA_DIR) + "/" + name;
    }

    std::ostringstream log_;

private:
    LogLevel saved_level_ = LogLevel::INFO;
};

TEST_F(ConfigTest, DefaultsWithoutFile) {
    Config& config = Config::getInstance();
    ASSERT_TRUE(config.load());

    EXPECT_EQ(config.get<std::string>("log.level"), "info");
    EXPECT_EQ(config.get<std::string>("log.file"), "");
    EXPECT_FALSE(config.has("unicode.version"));

    WidthOptions options = config.width_options();
    EXPECT_EQ(options.unicode_version, "auto");
    EXPECT_FALSE(options.auto_version.has_value());
}

TEST_F(ConfigTest, LoadsFile) {
    Config& config = Config::getInstance();
    ASSERT_TRUE(config.load(data_file("cellwidth.env")));

    EXPECT_EQ(config.get<std::string>("unicode.version"), "9.0");
    EXPECT_EQ(config.get<std::string>("log.level"), "warn");
    EXPECT_EQ(config.get<std::string>("log.file"), "");

    WidthOptions options = config.width_options();
    ASSERT_TRUE(options.auto_version.has_value());
    EXPECT_EQ(*options.auto_version, "9.0");
    EXPECT_EQ(WidthCalculator(options).resolved_version(), "9.0.0");
}

TEST_F(ConfigTest, MissingFileIsNotAnError) {
    Config& config = Config::getInstance();
    EXPECT_TRUE(config.load(data_file("does_not_exist.env")));
    EXPECT_EQ(config.get<std::string>("log.level"), "info");
}

TEST_F(ConfigTest, UnknownLogLevelResetsToInfo) {
    Config& config = Config::getInstance();
    ASSERT_TRUE(config.load(data_file("bad_level.env")));

    EXPECT_EQ(config.get<std::string>("log.level"), "info");
    EXPECT_EQ(config.get<std::string>("unicode.version"), "12.1.0");
    EXPECT_NE(log_.str().find("loud"), std::string::npos);
}

TEST_F(ConfigTest, EnvironmentSetsAutoVersion) {
    setenv("UNICODE_VERSION", "8.0", 1);
    Config& config = Config::getInstance();
    ASSERT_TRUE(config.load());

    WidthOptions options = config.width_options();
    ASSERT_TRUE(options.auto_version.has_value());
    EXPECT_EQ(*options.auto_version, "8.0");

    WidthCalculator calc(options);
    EXPECT_EQ(calc.resolved_version(), "8.0.0");
    EXPECT_EQ(calc.char_width(0x1F600), 1);
}

// An explicit version ignores UNICODE_VERSION
TEST_F(ConfigTest, ExplicitVersionIgnoresEnvironment) {
    setenv("UNICODE_VERSION", "8.0", 1);
    Config::getInstance().load();
    EXPECT_EQ(width_of_char(0x1F600), 2);
    EXPECT_EQ(width_of_char(0x1F600, "9.0.0"), 2);
}

TEST_F(ConfigTest, EmptyEnvironmentValueIsIgnored) {
    setenv("UNICODE_VERSION", "", 1);
    Config& config = Config::getInstance();
    ASSERT_TRUE(config.load());
    EXPECT_FALSE(config.width_options().auto_version.has_value());
}

TEST_F(ConfigTest, TypedGetters) {
    Config& config = Config::getInstance();
    config.set("flag.a", "Yes");
    config.set("flag.b", "0");
    config.set("count", "42");
    config.set("bad.count", "forty-two");

    EXPECT_TRUE(config.get<bool>("flag.a"));
    EXPECT_FALSE(config.get<bool>("flag.b"));
    EXPECT_TRUE(config.get<bool>("missing", true));
    EXPECT_EQ(config.get<int>("count"), 42);
    EXPECT_EQ(config.get<int>("bad.count", 7), 7);

    config.unset("count");
    EXPECT_FALSE(config.has("count"));
}

TEST_F(ConfigTest, InitConfigAppliesLogLevel) {
    ASSERT_TRUE(init_config(data_file("cellwidth.env")));
    EXPECT_EQ(Logger::getInstance().level(), LogLevel::WARN);
}

TEST_F(ConfigTest, ParseLogLevel) {
    LogLevel level = LogLevel::INFO;
    EXPECT_TRUE(parse_log_level("debug", level));
    EXPECT_EQ(level, LogLevel::DEBUG);
    EXPECT_TRUE(parse_log_level("error", level));
    EXPECT_EQ(level, LogLevel::ERROR);
    EXPECT_TRUE(parse_log_level("warn", level));
    EXPECT_EQ(level, LogLevel::WARN);
    EXPECT_FALSE(parse_log_level("verbose", level));
    EXPECT_FALSE(parse_log_level("fatal", level));
    EXPECT_EQ(level, LogLevel::WARN);
}
