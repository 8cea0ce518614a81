#pragma once

#include "ConfigParser.hpp"
#include "Logger.hpp"
#include "Reporter.hpp"

struct RunOptions
{
    bool TransferEnabled = false;
    bool DeleteEnabled = false;
    bool Verbose = false;
    bool Debug = false;
};

class ControlFlow
{
public:
    ControlFlow() = default;

    // Exit code: 0 after a complete pass (per-experiment errors included), 1 on fatal errors
    int Run(const RunOptions& Options);

    // --debug wins over --verbose; the default only shows warnings and worse
    static LogLevel SelectLogLevel(const RunOptions& Options);

    static int Execute(const TransferConfig& Config, const RunOptions& Options, Reporter& Notifier);

private:
    ConfigParser Parser;

    void LogConfiguration(const RunOptions& Options);
};
