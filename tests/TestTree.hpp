#pragma once

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <vector>

#include "ConfigParser.hpp"
#include "ConfigGlobal.hpp"
#include "ExperimentPaths.hpp"
#include "Reporter.hpp"

namespace FS = std::filesystem;

// Scratch directory with a source/target/secondary layout, removed on destruction
class TestTree
{
public:
    TestTree()
    {
        std::string Pattern = (FS::temp_directory_path() / "merscope_test_XXXXXX").string();
        if (mkdtemp(Pattern.data()) == nullptr)
        {
            throw std::runtime_error("mkdtemp failed");
        }
        RootDir = Pattern;
        FS::create_directories(Source());
        FS::create_directories(Target());
        FS::create_directories(Secondary());
    }

    ~TestTree()
    {
        std::error_code ec;
        FS::remove_all(RootDir, ec);
    }

    FS::path Root() const { return RootDir; }
    FS::path Source() const { return RootDir / "src"; }
    FS::path Target() const { return RootDir / "tgt"; }
    FS::path Secondary() const { return RootDir / "sec"; }

    TransferConfig Config() const
    {
        TransferConfig Config;
        Config.Source = Source();
        Config.Target = Target();
        Config.Secondary = Secondary();
        Config.Sender = "merscope@example.org";
        Config.Receivers = { "lab@example.org", "ops@example.org" };
        Config.MailServer = "mail.example.org";
        Config.MinimumAge = ConfigGlobal::MinimumAge;
        return Config;
    }

    static void WriteFile(const FS::path& Path, const std::string& Content)
    {
        FS::create_directories(Path.parent_path());
        std::ofstream Out(Path, std::ios::trunc);
        Out << Content;
    }

    static std::string ReadFile(const FS::path& Path)
    {
        std::ifstream In(Path);
        return std::string((std::istreambuf_iterator<char>(In)), std::istreambuf_iterator<char>());
    }

    static void SetAge(const FS::path& Path, std::chrono::seconds Age)
    {
        FS::last_write_time(Path, FS::file_time_type::clock::now() - Age);
    }

    // Creates the three category folders with a file each. The sentinel is only
    // written when Age is non-negative.
    void AddExperiment(const std::string& Name, std::chrono::seconds Age = std::chrono::minutes(10)) const
    {
        for (Category Cat : ExperimentPaths::Categories)
        {
            FS::path Dir = ExperimentPaths::ExperimentPath(Source(), Cat, Name);
            WriteFile(Dir / (ExperimentPaths::CategoryName(Cat) + ".dat"), Name + ":" + ExperimentPaths::CategoryName(Cat));
        }
        WriteFile(ExperimentPaths::ExperimentPath(Source(), Category::RawData, Name) / "images" / "tile_000.tif", "pixels");

        if (Age.count() >= 0)
        {
            FS::path Sentinel = ExperimentPaths::SentinelPath(Source(), Name);
            WriteFile(Sentinel, "");
            SetAge(Sentinel, Age);
        }
    }

    void AddSecondary(const std::string& Name) const
    {
        WriteFile(ExperimentPaths::SecondaryPath(Secondary(), Name) / "copy.dat", Name);
    }

private:
    FS::path RootDir;
};

class RecordingReporter : public Reporter
{
public:
    bool Send(const std::string& Subject, const std::string& Body) override
    {
        Calls++;
        LastSubject = Subject;
        LastBody = Body;
        if (FailSend)
        {
            LastError = "relay refused the message";
            return false;
        }
        return true;
    }

    int Calls = 0;
    bool FailSend = false;
    std::string LastSubject;
    std::string LastBody;
};
