#pragma once

#include <string>
#include <fstream>

enum class LogLevel
{
    DEBUG,
    INFO,
    WARNING,
    ERROR,
    CRITICAL
};

class Logger
{
public:
    Logger() = default;
    ~Logger();

    void Init(const std::string& logDir, unsigned short int MaxLogFiles);
    void SetLevel(LogLevel Level);
    LogLevel GetLevel() const;

    void Log(LogLevel Level, const std::string& Message);
    void Debug(const std::string& Message);
    void Info(const std::string& Message);
    void Warning(const std::string& Message);
    void Error(const std::string& Message);
    void Critical(const std::string& Message);
    void CleanupOldLogs(const std::string& logDir, unsigned short int MaxLogFiles);

    static std::string GetTimestampForFilename();

    std::string CurrentLogFilePath;

private:
    std::ofstream LogFile;
    LogLevel Threshold = LogLevel::WARNING;

    std::string GetTimestamp() const;
    std::string LevelToString(LogLevel Level) const;

    void OpenLogFile(const std::string& FilePath);
};

extern Logger Log;
