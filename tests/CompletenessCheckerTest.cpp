#include <gtest/gtest.h>

#include "CompletenessChecker.hpp"
#include "TestTree.hpp"
#include "TimeUtils.hpp"

using namespace std::chrono_literals;

TEST(CompletenessChecker, MissingSentinelIsNotComplete)
{
    TestTree Tree;
    Tree.AddExperiment("E1", -1s);

    CompletenessChecker Checker(Tree.Source(), ConfigGlobal::MinimumAge);
    EXPECT_FALSE(Checker.IsComplete("E1"));
}

TEST(CompletenessChecker, FreshSentinelIsNotComplete)
{
    TestTree Tree;
    Tree.AddExperiment("E1", 30s);

    CompletenessChecker Checker(Tree.Source(), ConfigGlobal::MinimumAge);
    EXPECT_FALSE(Checker.IsComplete("E1"));
}

TEST(CompletenessChecker, SentinelJustUnderThresholdIsNotComplete)
{
    TestTree Tree;
    Tree.AddExperiment("E1", 290s);

    CompletenessChecker Checker(Tree.Source(), 300s);
    EXPECT_FALSE(Checker.IsComplete("E1"));
}

TEST(CompletenessChecker, SettledSentinelIsComplete)
{
    TestTree Tree;
    Tree.AddExperiment("E1", 10min);

    CompletenessChecker Checker(Tree.Source(), ConfigGlobal::MinimumAge);
    EXPECT_TRUE(Checker.IsComplete("E1"));
}

TEST(CompletenessChecker, SentinelDirectoryIsNotComplete)
{
    TestTree Tree;
    Tree.AddExperiment("E1", -1s);
    FS::create_directories(ExperimentPaths::SentinelPath(Tree.Source(), "E1"));

    CompletenessChecker Checker(Tree.Source(), ConfigGlobal::MinimumAge);
    EXPECT_FALSE(Checker.IsComplete("E1"));
}

TEST(CompletenessChecker, SentinelFromTheFutureIsNotComplete)
{
    TestTree Tree;
    Tree.AddExperiment("E1");
    FS::last_write_time(ExperimentPaths::SentinelPath(Tree.Source(), "E1"), FS::file_time_type::clock::now() + 1h);

    CompletenessChecker Checker(Tree.Source(), ConfigGlobal::MinimumAge);
    EXPECT_FALSE(Checker.IsComplete("E1"));
}

TEST(TimeUtils, FormatDurationMatchesClockNotation)
{
    EXPECT_EQ("0:00:00", FormatDuration(0));
    EXPECT_EQ("0:04:59", FormatDuration(299));
    EXPECT_EQ("1:01:01", FormatDuration(3661));
    EXPECT_EQ("26:00:00", FormatDuration(26 * 3600));
    EXPECT_EQ("-0:00:05", FormatDuration(-5));
}
