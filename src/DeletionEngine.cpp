#include "DeletionEngine.hpp"
#include "ExperimentPaths.hpp"
#include "Logger.hpp"

#include <utility>

namespace FS = std::filesystem;

DeletionEngine::DeletionEngine(FS::path Source, FS::path Secondary, bool Enabled)
    : SourceRoot(std::move(Source)), SecondaryRoot(std::move(Secondary)), DeleteEnabled(Enabled)
{
}

bool DeletionEngine::DeleteExperiment(const std::string& Experiment, RunReport& Report)
{
    bool DeleteDone = true;

    for (Category Cat : ExperimentPaths::Categories)
    {
        if (!DeleteDirectory(ExperimentPaths::ExperimentPath(SourceRoot, Cat, Experiment), Report))
        {
            DeleteDone = false;
            break;
        }
    }

    if (DeleteDone)
    {
        FS::path Secondary = ExperimentPaths::SecondaryPath(SecondaryRoot, Experiment);
        if (!PathExists(Secondary))
        {
            Report.AddError("Secondary delete path " + Secondary.string() + " does not exist");
            DeleteDone = false;
        }
        else
        {
            DeleteDone = DeleteDirectory(Secondary, Report);
        }
    }

    if (!DeleteDone)
    {
        Report.AddError("Deletion for " + Experiment + " is incomplete");
    }
    return DeleteDone;
}

bool DeletionEngine::DeleteDirectory(const FS::path& Dir, RunReport& Report)
{
    if (DeleteEnabled)
    {
        FsResult Tree = RemoveTree(Dir);
        if (!Tree.Ok())
        {
            Report.AddError("Could not rmtree delete " + Dir.string() + "\n" + Tree.Describe());
            return false;
        }

        // Some filesystems leave the emptied top-level directory behind
        if (PathExists(Dir))
        {
            FsResult Top = RemoveEmptyDirectory(Dir);
            if (!Top.Ok())
            {
                Report.AddError("Could not rmdir delete " + Dir.string() + "\n" + Top.Describe());
            }
        }
        if (PathExists(Dir))
        {
            Report.AddError("Despite attempts to delete it, " + Dir.string() + " still exists");
        }
    }

    Log.Warning("Deleted " + Dir.string());
    Report.Deleted.push_back(Dir.string());
    return true;
}

FsResult DeletionEngine::RemoveTree(const FS::path& Dir)
{
    std::error_code ec;

    FS::file_status Status = FS::symlink_status(Dir, ec);
    if (Status.type() == FS::file_type::not_found)
    {
        return FsResult::Failure(FsStatus::NotFound, ec ? ec : std::make_error_code(std::errc::no_such_file_or_directory), Dir.string());
    }
    if (ec)
    {
        return FsResult::Failure(FsStatus::RemoveFailed, ec, Dir.string());
    }
    // remove_all would only unlink the link and leave the data behind
    if (FS::is_symlink(Status))
    {
        return FsResult::Failure(FsStatus::RemoveFailed, std::make_error_code(std::errc::not_a_directory), Dir.string() + " is a symbolic link");
    }

    FS::remove_all(Dir, ec);
    if (ec)
    {
        return FsResult::Failure(FsStatus::RemoveFailed, ec, Dir.string());
    }
    return FsResult::Success();
}

FsResult DeletionEngine::RemoveEmptyDirectory(const FS::path& Dir)
{
    std::error_code ec;

    FS::remove(Dir, ec);
    if (ec)
    {
        return FsResult::Failure(FsStatus::RemoveFailed, ec, Dir.string());
    }
    return FsResult::Success();
}

bool DeletionEngine::PathExists(const FS::path& Path) const
{
    std::error_code ec;
    return FS::exists(Path, ec);
}
