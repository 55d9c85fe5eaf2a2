#include <gtest/gtest.h>

#include "utils/ActivityLog.hpp"

TEST(ActivityLogTest, PrefixesSeverity) {
    ActivityLog log(10, false);
    log.Info("probing");
    log.Warning("short response");
    log.Error("connection refused");

    auto lines = log.GetRecent(10);
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0], "probing");
    EXPECT_EQ(lines[1], "WARNING: short response");
    EXPECT_EQ(lines[2], "ERROR: connection refused");
}

TEST(ActivityLogTest, KeepsOnlyMostRecentLines) {
    ActivityLog log(3, false);
    for (int i = 0; i < 5; ++i) {
        log.Info(std::to_string(i));
    }

    EXPECT_EQ(log.GetRecent(10), (std::vector<std::string>{ "2", "3", "4" }));
    EXPECT_EQ(log.GetRecent(1), (std::vector<std::string>{ "4" }));
}
