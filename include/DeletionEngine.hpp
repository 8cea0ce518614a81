#pragma once

#include <string>
#include <filesystem>

#include "FsResult.hpp"
#include "RunReport.hpp"

class DeletionEngine
{
public:
    DeletionEngine(std::filesystem::path Source, std::filesystem::path Secondary, bool Enabled);
    virtual ~DeletionEngine() = default;

    // Removes the local categories in copy order, then the secondary copy.
    // Only called once the experiment has been transferred.
    bool DeleteExperiment(const std::string& Experiment, RunReport& Report);

    // Tree removal with a plain rmdir fallback for a lingering top directory.
    // A lingering directory is reported but does not fail the call.
    bool DeleteDirectory(const std::filesystem::path& Dir, RunReport& Report);

protected:
    virtual FsResult RemoveTree(const std::filesystem::path& Dir);
    virtual FsResult RemoveEmptyDirectory(const std::filesystem::path& Dir);
    virtual bool PathExists(const std::filesystem::path& Path) const;

private:
    std::filesystem::path SourceRoot;
    std::filesystem::path SecondaryRoot;
    bool DeleteEnabled;
};
