// =============================================================================
// Unicode Version Resolution Tests
// =============================================================================

#include <gtest/gtest.h>
#include "cellwidth/range_table.hpp"
#include "cellwidth/version.hpp"
#include "cellwidth/warning.hpp"
#include "synthetic_store.hpp"
#include <algorithm>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace cellwidth;

class VersionTest : public ::testing::Test {
protected:
    void SetUp() override {
        capture_ = std::make_unique<ScopedWarningHandler>(
            [this](WarningKind kind, const std::string&) { warnings.push_back(kind); });
    }
    void TearDown() override { capture_.reset(); }

    std::string resolve(const std::string& requested,
                        const std::optional<std::string>& auto_override = std::nullopt) {
        return VersionResolver(BuiltinTableStore::instance()).resolve(requested, auto_override);
    }

    std::vector<WarningKind> warnings;

private:
    std::unique_ptr<ScopedWarningHandler> capture_;
};

TEST_F(VersionTest, ParseVersion) {
    EXPECT_EQ(parse_version("9.0"), (std::vector<int>{9, 0}));
    EXPECT_EQ(parse_version("15.1.0"), (std::vector<int>{15, 1, 0}));
    EXPECT_EQ(parse_version("7"), (std::vector<int>{7}));

    EXPECT_FALSE(parse_version(""));
    EXPECT_FALSE(parse_version("latest"));
    EXPECT_FALSE(parse_version("9."));
    EXPECT_FALSE(parse_version(".9"));
    EXPECT_FALSE(parse_version("9..0"));
    EXPECT_FALSE(parse_version("-1"));
    EXPECT_FALSE(parse_version("9.0a"));
    EXPECT_FALSE(parse_version("99999999999"));
}

TEST_F(VersionTest, LatestIsLastEntry) {
    EXPECT_EQ(resolve("latest"), "17.0.0");
    EXPECT_TRUE(warnings.empty());
}

TEST_F(VersionTest, ExactMatchUnchanged) {
    for (const auto& v : BuiltinTableStore::instance().versions()) {
        EXPECT_EQ(resolve(v), v);
    }
    EXPECT_TRUE(warnings.empty());
}

TEST_F(VersionTest, PrefixSelectsNextTabulatedVersion) {
    EXPECT_EQ(resolve("9"), "9.0.0");
    EXPECT_EQ(resolve("9.0"), "9.0.0");
    EXPECT_EQ(resolve("12.1"), "12.1.0");
    EXPECT_EQ(resolve("15"), "15.0.0");
    EXPECT_TRUE(warnings.empty());
}

TEST_F(VersionTest, UntabulatedVersionFallsBackToPrevious) {
    EXPECT_EQ(resolve("8.5"), "8.0.0");
    EXPECT_EQ(resolve("6.2.5"), "6.2.0");
    EXPECT_EQ(resolve("5.1.0.1"), "5.1.0");
    EXPECT_EQ(resolve("12.0.9"), "12.0.0");
    EXPECT_TRUE(warnings.empty());
}

TEST_F(VersionTest, FutureVersionResolvesToLatest) {
    EXPECT_EQ(resolve("18.0.0"), "17.0.0");
    EXPECT_EQ(resolve("100"), "17.0.0");
    EXPECT_TRUE(warnings.empty());
}

TEST_F(VersionTest, LowVersionWarnsAndUsesEarliest) {
    EXPECT_EQ(resolve("1.0"), "4.1.0");
    EXPECT_EQ(resolve("4.1"), "4.1.0");
    ASSERT_EQ(warnings.size(), 2u);
    EXPECT_EQ(warnings[0], WarningKind::VersionTooLow);
    EXPECT_EQ(warnings[1], WarningKind::VersionTooLow);
}

TEST_F(VersionTest, GarbageWarnsAndUsesLatest) {
    EXPECT_EQ(resolve("not-a-version"), "17.0.0");
    EXPECT_EQ(resolve(""), "17.0.0");
    ASSERT_EQ(warnings.size(), 2u);
    EXPECT_EQ(warnings[0], WarningKind::InvalidVersion);
    EXPECT_EQ(warnings[1], WarningKind::InvalidVersion);
}

// Only bare dotted digits parse; padded, signed or oversized input is invalid
TEST_F(VersionTest, LooseNumericFormsWarnAndUseLatest) {
    EXPECT_EQ(resolve(" 9"), "17.0.0");
    EXPECT_EQ(resolve("+9"), "17.0.0");
    EXPECT_EQ(resolve("9.0 "), "17.0.0");
    EXPECT_EQ(resolve("99999999999"), "17.0.0");
    ASSERT_EQ(warnings.size(), 4u);
    for (WarningKind kind : warnings) {
        EXPECT_EQ(kind, WarningKind::InvalidVersion);
    }
}

TEST_F(VersionTest, AutoUsesOverride) {
    EXPECT_EQ(resolve("auto"), "17.0.0");
    EXPECT_EQ(resolve("auto", std::string("9.0")), "9.0.0");
    EXPECT_EQ(resolve("auto", std::string("latest")), "17.0.0");
    EXPECT_EQ(resolve("auto", std::string("auto")), "17.0.0");
    EXPECT_TRUE(warnings.empty());
}

TEST_F(VersionTest, AutoWithBadOverrideWarns) {
    EXPECT_EQ(resolve("auto", std::string("xyz")), "17.0.0");
    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_EQ(warnings[0], WarningKind::InvalidVersion);
}

// Whatever comes in, the answer is a tabulated version
TEST_F(VersionTest, ResolutionIsTotal) {
    const auto& versions = BuiltinTableStore::instance().versions();
    std::vector<std::string> inputs = {"", "auto", "latest", "0", "0.0.0", "4", "4.1.0",
                                       "10", "10.0", "11.5", "16.1", "17", "17.0.0.0",
                                       "999.999", "a.b", "1..2", " 9.0", "9.0 ", "+9"};
    for (const auto& in : inputs) {
        std::string out;
        EXPECT_NO_THROW(out = resolve(in)) << in;
        EXPECT_NE(std::find(versions.begin(), versions.end(), out), versions.end())
            << in << " -> " << out;
    }
}

TEST_F(VersionTest, SyntheticStore) {
    test_support::SyntheticStore store;
    VersionResolver resolver(store);

    EXPECT_EQ(resolver.latest(), "3.0");
    EXPECT_EQ(resolver.earliest(), "1.0");
    EXPECT_EQ(resolver.resolve("2"), "2.0");
    EXPECT_EQ(resolver.resolve("2.5"), "2.0");
    EXPECT_EQ(resolver.resolve("7"), "3.0");
    EXPECT_EQ(resolver.resolve("0.9"), "1.0");
}
