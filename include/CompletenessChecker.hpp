#pragma once

#include <string>
#include <chrono>
#include <filesystem>

class CompletenessChecker
{
public:
    CompletenessChecker(std::filesystem::path Source, std::chrono::seconds Threshold);

    // True once the MERLIN_FINISHED sentinel exists and is older than the minimum age
    bool IsComplete(const std::string& Experiment) const;

private:
    std::filesystem::path SourceRoot;
    std::chrono::seconds MinimumAge;
};
