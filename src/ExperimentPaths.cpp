#include "ExperimentPaths.hpp"
#include "ConfigGlobal.hpp"

namespace FS = std::filesystem;

namespace ExperimentPaths
{
    std::string CategoryName(Category Cat)
    {
        switch (Cat)
        {
        case Category::Analysis: return "analysis";
        case Category::Output:   return "output";
        case Category::RawData:  return "raw_data";
        default:                 return "unknown";
        }
    }

    FS::path CategoryRoot(const FS::path& Root, Category Cat)
    {
        return Root / ("merfish_" + CategoryName(Cat));
    }

    FS::path ExperimentPath(const FS::path& Root, Category Cat, const std::string& Experiment)
    {
        return CategoryRoot(Root, Cat) / Experiment;
    }

    FS::path ListingRoot(const FS::path& SourceRoot)
    {
        return CategoryRoot(SourceRoot, Category::Output);
    }

    FS::path SentinelPath(const FS::path& SourceRoot, const std::string& Experiment)
    {
        return ExperimentPath(SourceRoot, Category::RawData, Experiment) / ConfigGlobal::SentinelFileName;
    }

    FS::path SecondaryPath(const FS::path& SecondaryRoot, const std::string& Experiment)
    {
        return SecondaryRoot / Experiment;
    }
}
