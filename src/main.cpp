#include <iostream>

#include <curl/curl.h>

#include "CommandLine.hpp"
#include "ControlFlow.hpp"
#include "ConfigGlobal.hpp"

int main(int argc, char* argv[])
{
    ConfigGlobal::InitializeDefaults();
    RunOptions Options;

    switch (CommandLine::Parse(argc, argv, Options))
    {
    case CommandLineAction::Help:
        CommandLine::PrintUsage();
        return 0;
    case CommandLineAction::Error:
        CommandLine::PrintUsage();
        return 1;
    case CommandLineAction::Run:
        break;
    }

    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK)
    {
        std::cerr << "Failed to initialise libcurl\n";
        return 1;
    }

    ControlFlow Flow;
    int ExitCode = Flow.Run(Options);

    curl_global_cleanup();
    return ExitCode;
}
