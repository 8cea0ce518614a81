#pragma once

#include <string>
#include <chrono>

namespace ConfigGlobal
{
    extern std::string ConfigFile;
    extern std::string LogDir;
    extern unsigned short int MaxLogFiles;

    // Fixed policy, not read from the config file
    inline constexpr std::chrono::seconds MinimumAge{ 5 * 60 };

    inline constexpr const char* MailSubject = "MERSCOPE experiments transferred";
    inline constexpr const char* SentinelFileName = "MERLIN_FINISHED";

    void InitializeDefaults();
}
