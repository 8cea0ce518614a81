#include <gtest/gtest.h>

#include "ControlFlow.hpp"
#include "TestTree.hpp"

#include <vector>

namespace
{
    std::vector<std::string> ExpectedDeleted(const TestTree& Tree, const std::string& Name)
    {
        std::vector<std::string> Paths;
        for (Category Cat : ExperimentPaths::Categories)
        {
            Paths.push_back(ExperimentPaths::ExperimentPath(Tree.Source(), Cat, Name).string());
        }
        Paths.push_back(ExperimentPaths::SecondaryPath(Tree.Secondary(), Name).string());
        return Paths;
    }

    std::string ExpectedBody(const TestTree& Tree, const std::string& Name, bool Simulated)
    {
        std::string Body = "The following experiments have been transferred:\n";
        if (Simulated)
        {
            Body += "--- TRANSFER mode was not enabled - no files were transferred ---\n";
        }
        Body += Name + "\n\n";
        Body += "The following directories have been deleted:\n";
        if (Simulated)
        {
            Body += "--- DELETE mode was not enabled - no files were deleted ---\n";
        }
        std::vector<std::string> Paths = ExpectedDeleted(Tree, Name);
        for (size_t i = 0; i < Paths.size(); ++i)
        {
            Body += Paths[i] + (i + 1 < Paths.size() ? "\n" : "\n\n");
        }
        return Body;
    }
}

TEST(ControlFlow, TransferAndDeleteEndToEnd)
{
    TestTree Tree;
    Tree.AddExperiment("E1");
    Tree.AddSecondary("E1");
    RecordingReporter Notifier;

    RunOptions Options;
    Options.TransferEnabled = true;
    Options.DeleteEnabled = true;
    EXPECT_EQ(0, ControlFlow::Execute(Tree.Config(), Options, Notifier));

    for (Category Cat : ExperimentPaths::Categories)
    {
        EXPECT_TRUE(FS::exists(ExperimentPaths::ExperimentPath(Tree.Target(), Cat, "E1") / (ExperimentPaths::CategoryName(Cat) + ".dat")));
        EXPECT_FALSE(FS::exists(ExperimentPaths::ExperimentPath(Tree.Source(), Cat, "E1")));
    }
    EXPECT_FALSE(FS::exists(ExperimentPaths::SecondaryPath(Tree.Secondary(), "E1")));

    ASSERT_EQ(1, Notifier.Calls);
    EXPECT_EQ(ConfigGlobal::MailSubject, Notifier.LastSubject);
    EXPECT_EQ(ExpectedBody(Tree, "E1", false), Notifier.LastBody);
}

TEST(ControlFlow, DryRunEndToEnd)
{
    TestTree Tree;
    Tree.AddExperiment("E1");
    Tree.AddSecondary("E1");
    RecordingReporter Notifier;

    EXPECT_EQ(0, ControlFlow::Execute(Tree.Config(), RunOptions{}, Notifier));

    EXPECT_TRUE(FS::is_empty(Tree.Target()));
    for (Category Cat : ExperimentPaths::Categories)
    {
        EXPECT_TRUE(FS::exists(ExperimentPaths::ExperimentPath(Tree.Source(), Cat, "E1")));
    }
    EXPECT_TRUE(FS::exists(ExperimentPaths::SecondaryPath(Tree.Secondary(), "E1")));

    ASSERT_EQ(1, Notifier.Calls);
    EXPECT_EQ(ExpectedBody(Tree, "E1", true), Notifier.LastBody);
}

TEST(ControlFlow, NothingToReportSendsNoMail)
{
    TestTree Tree;
    Tree.AddExperiment("E1", std::chrono::seconds(10));
    RecordingReporter Notifier;

    EXPECT_EQ(0, ControlFlow::Execute(Tree.Config(), RunOptions{}, Notifier));
    EXPECT_EQ(0, Notifier.Calls);
}

TEST(ControlFlow, EmptyListingWithMissingTargetSendsNoMail)
{
    TestTree Tree;
    FS::create_directories(ExperimentPaths::ListingRoot(Tree.Source()));
    FS::remove_all(Tree.Target());
    RecordingReporter Notifier;

    EXPECT_EQ(0, ControlFlow::Execute(Tree.Config(), RunOptions{}, Notifier));
    EXPECT_EQ(0, Notifier.Calls);
}

TEST(ControlFlow, PartialErrorsStillExitCleanly)
{
    TestTree Tree;
    Tree.AddExperiment("E1");
    RecordingReporter Notifier;

    RunOptions Options;
    Options.TransferEnabled = true;
    Options.DeleteEnabled = true;
    EXPECT_EQ(0, ControlFlow::Execute(Tree.Config(), Options, Notifier));

    ASSERT_EQ(1, Notifier.Calls);
    EXPECT_NE(std::string::npos, Notifier.LastBody.find("The following errors have occurred:\n"));
    EXPECT_NE(std::string::npos, Notifier.LastBody.find("Deletion for E1 is incomplete"));
}

TEST(ControlFlow, MissingListingDirectoryIsFatal)
{
    TestTree Tree;
    RecordingReporter Notifier;

    EXPECT_EQ(1, ControlFlow::Execute(Tree.Config(), RunOptions{}, Notifier));
    EXPECT_EQ(0, Notifier.Calls);
}

TEST(ControlFlow, MailFailureIsFatal)
{
    TestTree Tree;
    Tree.AddExperiment("E1");
    Tree.AddSecondary("E1");
    RecordingReporter Notifier;
    Notifier.FailSend = true;

    EXPECT_EQ(1, ControlFlow::Execute(Tree.Config(), RunOptions{}, Notifier));
    EXPECT_EQ(1, Notifier.Calls);
}

TEST(ControlFlow, InvalidConfigFileIsFatal)
{
    TestTree Tree;
    ConfigGlobal::InitializeDefaults();
    ConfigGlobal::ConfigFile = (Tree.Root() / "missing.json").string();

    ControlFlow Flow;
    EXPECT_EQ(1, Flow.Run(RunOptions{}));

    ConfigGlobal::InitializeDefaults();
}
