#include "TransferEngine.hpp"
#include "ExperimentPaths.hpp"
#include "Logger.hpp"

#include <utility>

namespace FS = std::filesystem;

TransferEngine::TransferEngine(FS::path Source, FS::path Target, bool Enabled)
    : SourceRoot(std::move(Source)), TargetRoot(std::move(Target)), TransferEnabled(Enabled)
{
}

bool TransferEngine::Transfer(const std::string& Experiment, RunReport& Report)
{
    for (Category Cat : ExperimentPaths::Categories)
    {
        FS::path Src = ExperimentPaths::ExperimentPath(SourceRoot, Cat, Experiment);
        FS::path Tgt = ExperimentPaths::ExperimentPath(TargetRoot, Cat, Experiment);
        Log.Info("Copy " + Src.string() + " to " + Tgt.string());

        if (!TransferEnabled)
        {
            continue;
        }

        FsResult Result = CopyTree(Src, Tgt);
        if (!Result.Ok())
        {
            Report.AddError("Could not copy " + Src.string() + "\n" + Result.Describe());
            return false;
        }
    }

    Report.Transferred.push_back(Experiment);
    return true;
}

FsResult TransferEngine::CopyTree(const FS::path& From, const FS::path& To)
{
    std::error_code ec;

    FS::create_directories(To.parent_path(), ec);
    if (ec)
    {
        return FsResult::Failure(FsStatus::CopyFailed, ec, To.parent_path().string());
    }

    FS::copy(From, To, FS::copy_options::recursive | FS::copy_options::overwrite_existing, ec);
    if (ec)
    {
        return FsResult::Failure(FsStatus::CopyFailed, ec, From.string());
    }

    Log.Debug(std::string("[TransferEngine] Copied ") + From.string() + " -> " + To.string());
    return FsResult::Success();
}
