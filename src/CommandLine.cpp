#include <getopt.h>
#include <iostream>

#include "CommandLine.hpp"
#include "ConfigGlobal.hpp"

namespace CommandLine
{
    CommandLineAction Parse(int argc, char* argv[], RunOptions& Options)
    {
        static struct option LongOptions[] = { {"transfer", no_argument, 0, 't'},
                                               {"delete", no_argument, 0, 'd'},
                                               {"verbose", no_argument, 0, 'v'},
                                               {"debug", no_argument, 0, 'D'},
                                               {"config", required_argument, 0, 'c'},
                                               {"help", no_argument, 0, 'h'},
                                               {0, 0, 0, 0} };

        int Opt;
        int OptionIndex = 0;

        // Zero makes glibc reinitialise its scan state between calls
        optind = 0;
        while ((Opt = getopt_long(argc, argv, "c:h", LongOptions, &OptionIndex)) != -1)
        {
            switch (Opt)
            {
            case 't':
                Options.TransferEnabled = true;
                break;
            case 'd':
                Options.DeleteEnabled = true;
                break;
            case 'v':
                Options.Verbose = true;
                break;
            case 'D':
                Options.Debug = true;
                break;
            case 'c':
                ConfigGlobal::ConfigFile = optarg;
                break;
            case 'h':
                return CommandLineAction::Help;
            default:
                return CommandLineAction::Error;
            }
        }

        if (optind < argc)
        {
            std::cerr << "Unexpected argument: " << argv[optind] << "\n";
            return CommandLineAction::Error;
        }
        return CommandLineAction::Run;
    }

    void PrintUsage()
    {
        std::cout << "Usage: MerscopeTransfer [OPTIONS]\n\n";
        std::cout << "Transfer finished MERSCOPE experiments to centralized storage and optionally\n";
        std::cout << "delete the local and secondary copies. Without --transfer and --delete the run\n";
        std::cout << "only simulates and reports what it would do.\n\n";
        std::cout << "Options:\n";
        std::cout << "  --transfer          Copy experiments to the target\n";
        std::cout << "  --delete            Delete transferred experiments from source and secondary\n";
        std::cout << "  --verbose           Info-level logging\n";
        std::cout << "  --debug             Debug-level logging\n";
        std::cout << "  -c, --config FILE   Config file (default: " << ConfigGlobal::ConfigFile << ")\n";
        std::cout << "  -h, --help          Show this help\n";
    }
}
