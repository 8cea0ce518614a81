#include "CompletenessChecker.hpp"
#include "ExperimentPaths.hpp"
#include "TimeUtils.hpp"
#include "Logger.hpp"

#include <utility>

namespace FS = std::filesystem;

CompletenessChecker::CompletenessChecker(FS::path Source, std::chrono::seconds Threshold)
    : SourceRoot(std::move(Source)), MinimumAge(Threshold)
{
}

bool CompletenessChecker::IsComplete(const std::string& Experiment) const
{
    const FS::path Sentinel = ExperimentPaths::SentinelPath(SourceRoot, Experiment);

    std::error_code ec;
    if (!FS::is_regular_file(Sentinel, ec))
    {
        Log.Info(Experiment + " is in process");
        return false;
    }

    FS::file_time_type ModTime = FS::last_write_time(Sentinel, ec);
    if (ec)
    {
        Log.Warning(std::string("[Completeness] Could not read modification time of ") + Sentinel.string() + " - " + ec.message());
        return false;
    }

    int64_t Age = FileAgeSeconds(ModTime);
    if (Age <= MinimumAge.count())
    {
        Log.Info(Experiment + " is only " + FormatDuration(Age) + " old");
        return false;
    }
    return true;
}
