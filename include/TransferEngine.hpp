#pragma once

#include <string>
#include <filesystem>

#include "FsResult.hpp"
#include "RunReport.hpp"

class TransferEngine
{
public:
    TransferEngine(std::filesystem::path Source, std::filesystem::path Target, bool Enabled);
    virtual ~TransferEngine() = default;

    // Copies every category of the experiment, stopping at the first failure.
    // With transfer disabled nothing is copied but the experiment is still reported.
    // Returns false when the local copies must not be deleted.
    bool Transfer(const std::string& Experiment, RunReport& Report);

protected:
    // Recursive copy that merges into an existing destination and overwrites files
    virtual FsResult CopyTree(const std::filesystem::path& From, const std::filesystem::path& To);

private:
    std::filesystem::path SourceRoot;
    std::filesystem::path TargetRoot;
    bool TransferEnabled;
};
