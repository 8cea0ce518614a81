#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <filesystem>

#include <nlohmann/json.hpp>

struct TransferConfig
{
    std::filesystem::path Source;
    std::filesystem::path Target;
    std::filesystem::path Secondary;
    std::string Sender;
    std::vector<std::string> Receivers;
    std::string MailServer;
    std::chrono::seconds MinimumAge{ 0 };

    std::string LogDir;
    unsigned short int MaxLogFiles = 0;
};

class ConfigParser
{
public:
    ConfigParser() = default;
    bool Parse(const std::string& FilePath);
    bool ParseText(const std::string& Text);

    const std::vector<std::string>& GetErrors() const;
    const std::vector<std::string>& GetInfos() const;
    const TransferConfig& GetConfig() const;
    void Reset();

private:
    void AddError(const std::string& Message);
    void AddInfo(const std::string& Message);

    bool Load(const nlohmann::json& Document);
    bool ReadRequiredString(const nlohmann::json& Document, const std::string& Key, std::string& Value);
    bool ReadRequiredPath(const nlohmann::json& Document, const std::string& Key, std::filesystem::path& Value);
    void ReadReceivers(const nlohmann::json& Document);
    void ReadOptionalKeys(const nlohmann::json& Document);

    TransferConfig Config;
    std::vector<std::string> Errors;
    std::vector<std::string> Infos;
};
