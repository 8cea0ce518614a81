#include "Logger.hpp"
#include <chrono>
#include <iomanip>
#include <sstream>
#include <filesystem>
#include <iostream>
#include <vector>
#include <algorithm>

Logger Log;
namespace FS = std::filesystem;

static const std::string LogFilePrefix = "Transfer_Log";

void Logger::Init(const std::string& logDir, unsigned short int MaxLogFiles)
{
    if (logDir.empty())
    {
        return;
    }

    std::error_code ec;
    if (!FS::exists(logDir, ec))
    {
        FS::create_directories(logDir, ec);
        if (ec)
        {
            std::cerr << "Logger: Failed to create log directory: " << logDir << " - " << ec.message() << "\n";
            return;
        }
    }

    CurrentLogFilePath = (FS::path(logDir) / (LogFilePrefix + GetTimestampForFilename() + ".txt")).string();

    OpenLogFile(CurrentLogFilePath);
    CleanupOldLogs(logDir, MaxLogFiles);

    Log(LogLevel::INFO, "Run Started at " + GetTimestamp());
}

Logger::~Logger()
{
    if (LogFile.is_open())
    {
        Log(LogLevel::INFO, "Run Complete at " + GetTimestamp());
        LogFile.close();
    }
}

void Logger::SetLevel(LogLevel Level)
{
    Threshold = Level;
}

LogLevel Logger::GetLevel() const
{
    return Threshold;
}

void Logger::OpenLogFile(const std::string& FilePath)
{
    LogFile.open(FilePath, std::ios::out);

    if (!LogFile.is_open())
    {
        std::cerr << "Logger: Failed to open log file: " << FilePath << "\n";
    }
}

void Logger::CleanupOldLogs(const std::string& logDir, unsigned short int MaxLogFiles)
{
    if (MaxLogFiles == 0)
    {
        return;
    }

    std::vector<FS::directory_entry> Logs;
    std::error_code ec;

    for (const auto& Entry : FS::directory_iterator(logDir, ec))
    {
        if (Entry.is_regular_file(ec) && Entry.path().filename().string().find(LogFilePrefix) == 0)
        {
            Logs.push_back(Entry);
        }
    }

    if (Logs.size() <= MaxLogFiles)
    {
        return;
    }

    // Timestamped names sort chronologically
    std::sort(Logs.begin(), Logs.end(), [](const FS::directory_entry& A, const FS::directory_entry& B)
    {
            return A.path().filename().string() < B.path().filename().string();
    });

    while (Logs.size() > MaxLogFiles)
    {
        if (!FS::remove(Logs.front().path(), ec))
        {
            std::cerr << "Logger: Failed to remove old log file: " << Logs.front().path().string() << " - " << ec.message() << "\n";
        }
        Logs.erase(Logs.begin());
    }
}

void Logger::Log(LogLevel Level, const std::string& Message)
{
    if (Level < Threshold)
    {
        return;
    }

    std::string Line = "[" + GetTimestamp() + "] [" + LevelToString(Level) + "] " + Message + "\n";

    std::cerr << Line;

    if (LogFile.is_open())
    {
        LogFile << Line;
        LogFile.flush();
    }
}

void Logger::Debug(const std::string& Message)
{
    Log(LogLevel::DEBUG, Message);
}

void Logger::Info(const std::string& Message)
{
    Log(LogLevel::INFO, Message);
}

void Logger::Warning(const std::string& Message)
{
    Log(LogLevel::WARNING, Message);
}

void Logger::Error(const std::string& Message)
{
    Log(LogLevel::ERROR, Message);
}

void Logger::Critical(const std::string& Message)
{
    Log(LogLevel::CRITICAL, Message);
}

std::string Logger::GetTimestampForFilename()
{
    auto Now = std::chrono::system_clock::now();
    std::time_t Time = std::chrono::system_clock::to_time_t(Now);
    std::tm Local{};
    localtime_r(&Time, &Local);

    std::ostringstream Stream;
    Stream << std::put_time(&Local, "%Y%m%d_%H%M%S");
    return Stream.str();
}

std::string Logger::GetTimestamp() const
{
    auto Now = std::chrono::system_clock::now();
    std::time_t Time = std::chrono::system_clock::to_time_t(Now);
    std::tm Local{};
    localtime_r(&Time, &Local);

    std::ostringstream Stream;
    Stream << std::put_time(&Local, "%Y-%m-%d %H:%M:%S");
    return Stream.str();
}

std::string Logger::LevelToString(LogLevel Level) const
{
    switch (Level)
    {
    case LogLevel::DEBUG:    return "DEBUG";
    case LogLevel::INFO:     return "INFO";
    case LogLevel::WARNING:  return "WARNING";
    case LogLevel::ERROR:    return "ERROR";
    case LogLevel::CRITICAL: return "CRITICAL";
    default:                 return "UNKNOWN";
    }
}
