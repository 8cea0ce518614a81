#include "ConfigGlobal.hpp"

namespace ConfigGlobal
{
    std::string ConfigFile;
    std::string LogDir;
    unsigned short int MaxLogFiles;

    void InitializeDefaults()
    {
        ConfigFile = "config.json"; //Looked up in the working directory unless --config is given
        LogDir = ""; //Empty keeps logging on the console only
        MaxLogFiles = 10;
    }
}
