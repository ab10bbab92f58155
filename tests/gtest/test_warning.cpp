// =============================================================================
// Warning Channel Tests
// =============================================================================

#include <gtest/gtest.h>
#include "cellwidth/cellwidth.hpp"
#include "cellwidth/logging.hpp"
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using namespace cellwidth;

class WarningTest : public ::testing::Test {
protected:
    void SetUp() override {
        saved_level_ = Logger::getInstance().level();
        set_log_level(LogLevel::INFO);
        set_log_output(log_);
    }

    void TearDown() override {
        set_log_level(saved_level_);
        set_log_output(std::cerr);
    }

    std::ostringstream log_;

private:
    LogLevel saved_level_ = LogLevel::INFO;
};

TEST_F(WarningTest, KindNames) {
    EXPECT_STREQ(to_string(WarningKind::DecodeError), "decode-error");
    EXPECT_STREQ(to_string(WarningKind::InvalidVersion), "invalid-version");
    EXPECT_STREQ(to_string(WarningKind::VersionTooLow), "version-too-low");
}

TEST_F(WarningTest, HandlerReceivesWarnings) {
    std::vector<WarningKind> kinds;
    std::vector<std::string> messages;
    ScopedWarningHandler scope([&](WarningKind kind, const std::string& message) {
        kinds.push_back(kind);
        messages.push_back(message);
    });

    width_of_char(U'A', "2.0");
    width_of_char(U'A', "bogus");
    width_of_string(std::string_view("\xFF"));

    ASSERT_EQ(kinds.size(), 3u);
    EXPECT_EQ(kinds[0], WarningKind::VersionTooLow);
    EXPECT_EQ(kinds[1], WarningKind::InvalidVersion);
    EXPECT_EQ(kinds[2], WarningKind::DecodeError);
    EXPECT_NE(messages[1].find("bogus"), std::string::npos);
}

TEST_F(WarningTest, WarningsAreLogged) {
    report_warning(WarningKind::InvalidVersion, "something odd");
    std::string out = log_.str();
    EXPECT_NE(out.find("WARN"), std::string::npos);
    EXPECT_NE(out.find("[invalid-version] something odd"), std::string::npos);
    // Directory stripped from the source location
    EXPECT_NE(out.find(" warning.cpp:"), std::string::npos);
    EXPECT_NE(out.find("report_warning() - "), std::string::npos);
}

TEST_F(WarningTest, LogLevelFiltersWarnings) {
    set_log_level(LogLevel::ERROR);
    report_warning(WarningKind::DecodeError, "quiet");
    EXPECT_TRUE(log_.str().empty());
}

TEST_F(WarningTest, ScopedHandlerRestoresPrevious) {
    int outer = 0;
    int inner = 0;
    ScopedWarningHandler outer_scope([&](WarningKind, const std::string&) { ++outer; });
    {
        ScopedWarningHandler inner_scope([&](WarningKind, const std::string&) { ++inner; });
        report_warning(WarningKind::DecodeError, "first");
    }
    report_warning(WarningKind::DecodeError, "second");

    EXPECT_EQ(inner, 1);
    EXPECT_EQ(outer, 1);
}

TEST_F(WarningTest, NoHandlerIsFine) {
    WarningHandler previous = set_warning_handler(nullptr);
    EXPECT_NO_THROW(report_warning(WarningKind::VersionTooLow, "unhandled"));
    set_warning_handler(previous);
}
