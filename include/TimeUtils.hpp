#pragma once

#include <filesystem>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <string>

//Seconds elapsed since the given modification time, negative if it lies in the future
inline int64_t FileAgeSeconds(std::filesystem::file_time_type FTime)
{
    using namespace std::chrono;
    return duration_cast<seconds>(std::filesystem::file_time_type::clock::now() - FTime).count();
}

//H:MM:SS, hours are not wrapped into days
inline std::string FormatDuration(int64_t TotalSeconds)
{
    bool Negative = TotalSeconds < 0;
    if (Negative)
    {
        TotalSeconds = -TotalSeconds;
    }

    char Buffer[32];
    std::snprintf(Buffer, sizeof(Buffer), "%s%lld:%02lld:%02lld", Negative ? "-" : "",
        static_cast<long long>(TotalSeconds / 3600),
        static_cast<long long>((TotalSeconds / 60) % 60),
        static_cast<long long>(TotalSeconds % 60));
    return Buffer;
}
