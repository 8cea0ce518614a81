#pragma once

#include <string>
#include <vector>

// Accumulated outcome of one run, flushed once through the Reporter
struct RunReport
{
    std::vector<std::string> Transferred;
    std::vector<std::string> Deleted;
    std::vector<std::string> Errors;

    void AddError(const std::string& Message);
    bool IsEmpty() const;
};
