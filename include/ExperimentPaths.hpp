#pragma once

#include <array>
#include <string>
#include <filesystem>

enum class Category
{
    Analysis,
    Output,
    RawData
};

namespace ExperimentPaths
{
    // Copy and delete both walk the categories in this order
    inline constexpr std::array<Category, 3> Categories = { Category::Analysis, Category::Output, Category::RawData };

    std::string CategoryName(Category Cat);

    // <Root>/merfish_<category>
    std::filesystem::path CategoryRoot(const std::filesystem::path& Root, Category Cat);
    // <Root>/merfish_<category>/<Experiment>
    std::filesystem::path ExperimentPath(const std::filesystem::path& Root, Category Cat, const std::string& Experiment);

    std::filesystem::path ListingRoot(const std::filesystem::path& SourceRoot);
    std::filesystem::path SentinelPath(const std::filesystem::path& SourceRoot, const std::string& Experiment);
    std::filesystem::path SecondaryPath(const std::filesystem::path& SecondaryRoot, const std::string& Experiment);
}
