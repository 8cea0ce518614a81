#include <fstream>
#include <sstream>
#include <filesystem>
#include <string>
#include <unordered_set>

#include "ConfigParser.hpp"
#include "ConfigGlobal.hpp"

namespace FS = std::filesystem;
using json = nlohmann::json;

static const std::unordered_set<std::string> KnownKeys =
{
    "source", "target", "secondary", "sender", "receivers", "mail_server", "minimum_age", "log_dir", "max_log_files"
};

const std::vector<std::string>& ConfigParser::GetErrors() const
{
    return Errors;
}

const std::vector<std::string>& ConfigParser::GetInfos() const
{
    return Infos;
}

const TransferConfig& ConfigParser::GetConfig() const
{
    return Config;
}

void ConfigParser::Reset()
{
    Config = TransferConfig{};
    Errors.clear();
    Infos.clear();
}

void ConfigParser::AddError(const std::string& Message)
{
    Errors.push_back(Message);
}

void ConfigParser::AddInfo(const std::string& Message)
{
    Infos.push_back(Message);
}

bool ConfigParser::Parse(const std::string& FilePath)
{
    std::error_code ec;
    if (!FS::exists(FilePath, ec))
    {
        AddError("Config file does not exist: " + FilePath);
        return false;
    }

    std::ifstream File(FilePath);
    if (!File.is_open())
    {
        AddError("Failed to open config file: " + FilePath);
        return false;
    }

    std::stringstream Buffer;
    Buffer << File.rdbuf();
    return ParseText(Buffer.str());
}

bool ConfigParser::ParseText(const std::string& Text)
{
    json Document = json::parse(Text, nullptr, false);
    if (Document.is_discarded())
    {
        AddError("Config file is not valid JSON.");
        return false;
    }
    if (!Document.is_object())
    {
        AddError("Config file must contain a JSON object.");
        return false;
    }
    return Load(Document);
}

bool ConfigParser::ReadRequiredString(const json& Document, const std::string& Key, std::string& Value)
{
    auto It = Document.find(Key);
    if (It == Document.end())
    {
        AddError("Missing required key '" + Key + "'.");
        return false;
    }
    if (!It->is_string())
    {
        AddError("Key '" + Key + "' must be a string.");
        return false;
    }
    Value = It->get<std::string>();
    if (Value.empty())
    {
        AddError("Key '" + Key + "' must not be empty.");
        return false;
    }
    return true;
}

bool ConfigParser::ReadRequiredPath(const json& Document, const std::string& Key, FS::path& Value)
{
    std::string Raw;
    if (!ReadRequiredString(Document, Key, Raw))
    {
        return false;
    }
    Value = FS::path(Raw);
    if (!Value.is_absolute())
    {
        AddInfo("Path for '" + Key + "' is relative and resolves against the working directory: " + Raw);
    }
    return true;
}

void ConfigParser::ReadReceivers(const json& Document)
{
    auto It = Document.find("receivers");
    if (It == Document.end())
    {
        AddError("Missing required key 'receivers'.");
        return;
    }
    if (!It->is_array())
    {
        AddError("Key 'receivers' must be a list of addresses.");
        return;
    }

    for (const auto& Entry : *It)
    {
        if (!Entry.is_string() || Entry.get<std::string>().empty())
        {
            AddError("Every entry of 'receivers' must be a non-empty string.");
            return;
        }
        Config.Receivers.push_back(Entry.get<std::string>());
    }

    if (Config.Receivers.empty())
    {
        AddError("Key 'receivers' must name at least one address.");
    }
}

void ConfigParser::ReadOptionalKeys(const json& Document)
{
    if (Document.contains("minimum_age"))
    {
        AddInfo("Key 'minimum_age' is ignored. Experiments must be finished for at least " + std::to_string(ConfigGlobal::MinimumAge.count()) + " seconds.");
    }

    auto LogDirIt = Document.find("log_dir");
    if (LogDirIt != Document.end())
    {
        if (LogDirIt->is_string())
        {
            Config.LogDir = LogDirIt->get<std::string>();
            AddInfo("Log files are written to " + Config.LogDir);
        }
        else
        {
            AddError("Key 'log_dir' must be a string.");
        }
    }

    auto MaxLogsIt = Document.find("max_log_files");
    if (MaxLogsIt != Document.end())
    {
        if (MaxLogsIt->is_number_integer() && MaxLogsIt->get<long long>() > 0 && MaxLogsIt->get<long long>() <= 65535)
        {
            Config.MaxLogFiles = static_cast<unsigned short int>(MaxLogsIt->get<long long>());
            AddInfo("MaxLogFiles set to " + std::to_string(Config.MaxLogFiles));
        }
        else
        {
            AddError("Invalid number for 'max_log_files'. Select between 1 and 65,535");
        }
    }

    for (const auto& Item : Document.items())
    {
        if (KnownKeys.find(Item.key()) == KnownKeys.end())
        {
            AddInfo("Unknown key '" + Item.key() + "' ignored.");
        }
    }
}

bool ConfigParser::Load(const json& Document)
{
    Config = TransferConfig{};
    Config.MinimumAge = ConfigGlobal::MinimumAge;
    Config.LogDir = ConfigGlobal::LogDir;
    Config.MaxLogFiles = ConfigGlobal::MaxLogFiles;

    ReadRequiredPath(Document, "source", Config.Source);
    ReadRequiredPath(Document, "target", Config.Target);
    ReadRequiredPath(Document, "secondary", Config.Secondary);
    ReadRequiredString(Document, "sender", Config.Sender);
    ReadRequiredString(Document, "mail_server", Config.MailServer);
    ReadReceivers(Document);
    ReadOptionalKeys(Document);

    return Errors.empty();
}
