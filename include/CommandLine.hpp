#pragma once

#include "ControlFlow.hpp"

enum class CommandLineAction
{
    Run,
    Help,
    Error
};

namespace CommandLine
{
    // Fills Options from argv; --config overrides ConfigGlobal::ConfigFile
    CommandLineAction Parse(int argc, char* argv[], RunOptions& Options);
    void PrintUsage();
}
