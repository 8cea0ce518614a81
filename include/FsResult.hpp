#pragma once

#include <string>
#include <system_error>

enum class FsStatus
{
    Ok,
    NotFound,
    CopyFailed,
    RemoveFailed,
    ListFailed
};

// Outcome of a single filesystem primitive, returned instead of thrown
struct FsResult
{
    FsStatus Status = FsStatus::Ok;
    std::error_code Code;
    std::string Detail;

    bool Ok() const { return Status == FsStatus::Ok; }

    // "An exception of type <kind> occurred. Arguments:\n(<errno>, '<message>', '<detail>')"
    std::string Describe() const;

    static FsResult Success();
    static FsResult Failure(FsStatus Status, std::error_code Code, std::string Detail);
};

std::string FsStatusToString(FsStatus Status);
