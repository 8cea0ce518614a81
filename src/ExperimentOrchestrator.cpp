#include "ExperimentOrchestrator.hpp"
#include "ExperimentPaths.hpp"
#include "Logger.hpp"

#include <algorithm>
#include <exception>

namespace FS = std::filesystem;

ExperimentOrchestrator::ExperimentOrchestrator(const TransferConfig& Config, const CompletenessChecker& Checker, TransferEngine& Transfer, DeletionEngine& Deletion)
    : Config(Config), Checker(Checker), Transfer(Transfer), Deletion(Deletion)
{
}

bool ExperimentOrchestrator::CheckTargetRoot(RunReport& Report) const
{
    std::error_code ec;
    if (!FS::exists(Config.Target, ec))
    {
        Report.AddError("Could not find target path " + Config.Target.string());
        return false;
    }
    return true;
}

bool ExperimentOrchestrator::HasAllCategories(const std::string& Experiment) const
{
    std::error_code ec;
    for (Category Cat : ExperimentPaths::Categories)
    {
        if (!FS::exists(ExperimentPaths::ExperimentPath(Config.Source, Cat, Experiment), ec))
        {
            return false;
        }
    }
    return true;
}

FsResult ExperimentOrchestrator::ListExperiments(std::vector<std::string>& Experiments) const
{
    const FS::path Listing = ExperimentPaths::ListingRoot(Config.Source);
    Log.Info("Reading experiments from " + Listing.string());

    std::error_code ec;
    FS::directory_iterator It(Listing, ec);
    if (ec)
    {
        if (ec == std::errc::no_such_file_or_directory)
        {
            return FsResult::Failure(FsStatus::NotFound, ec, Listing.string());
        }
        return FsResult::Failure(FsStatus::ListFailed, ec, Listing.string());
    }

    for (; It != FS::directory_iterator(); It.increment(ec))
    {
        if (ec)
        {
            break;
        }
        Experiments.push_back(It->path().filename().string());
    }
    if (ec)
    {
        return FsResult::Failure(FsStatus::ListFailed, ec, Listing.string());
    }

    std::sort(Experiments.begin(), Experiments.end());
    return FsResult::Success();
}

void ExperimentOrchestrator::ProcessExperiment(const std::string& Experiment, RunReport& Report)
{
    if (!CheckTargetRoot(Report))
    {
        return;
    }

    if (!HasAllCategories(Experiment))
    {
        Log.Debug(Experiment + " is not in the required subfolders");
        return;
    }

    Log.Info(Experiment);
    if (!Checker.IsComplete(Experiment))
    {
        return;
    }

    if (Transfer.Transfer(Experiment, Report))
    {
        Deletion.DeleteExperiment(Experiment, Report);
    }
}

FsResult ExperimentOrchestrator::Run(RunReport& Report)
{
    std::vector<std::string> Experiments;
    FsResult Listing = ListExperiments(Experiments);
    if (!Listing.Ok())
    {
        return Listing;
    }

    Log.Info("Found " + std::to_string(Experiments.size()) + " experiment(s)");

    // A missing target root is a configuration problem, reported once for the whole run
    if (!Experiments.empty() && !CheckTargetRoot(Report))
    {
        return FsResult::Success();
    }

    for (const auto& Experiment : Experiments)
    {
        try
        {
            ProcessExperiment(Experiment, Report);
        }
        catch (const std::exception& e)
        {
            Report.AddError("Unexpected failure while processing " + Experiment + ": " + e.what());
        }
    }
    return FsResult::Success();
}
