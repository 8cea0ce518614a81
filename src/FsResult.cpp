#include "FsResult.hpp"

#include <utility>

std::string FsStatusToString(FsStatus Status)
{
    switch (Status)
    {
    case FsStatus::Ok:           return "Ok";
    case FsStatus::NotFound:     return "NotFound";
    case FsStatus::CopyFailed:   return "CopyFailed";
    case FsStatus::RemoveFailed: return "RemoveFailed";
    case FsStatus::ListFailed:   return "ListFailed";
    default:                     return "Unknown";
    }
}

std::string FsResult::Describe() const
{
    return "An exception of type " + FsStatusToString(Status) + " occurred. Arguments:\n(" + std::to_string(Code.value()) + ", '" + Code.message() + "', '" + Detail + "')";
}

FsResult FsResult::Success()
{
    return FsResult{};
}

FsResult FsResult::Failure(FsStatus Status, std::error_code Code, std::string Detail)
{
    FsResult Result;
    Result.Status = Status;
    Result.Code = Code;
    Result.Detail = std::move(Detail);
    return Result;
}
