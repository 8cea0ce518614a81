#include <string>

#include "ControlFlow.hpp"
#include "ConfigGlobal.hpp"
#include "CompletenessChecker.hpp"
#include "DeletionEngine.hpp"
#include "ExperimentOrchestrator.hpp"
#include "ReportFormatter.hpp"
#include "RunReport.hpp"
#include "TransferEngine.hpp"
#include "Logger.hpp"

LogLevel ControlFlow::SelectLogLevel(const RunOptions& Options)
{
    if (Options.Debug)
    {
        return LogLevel::DEBUG;
    }
    if (Options.Verbose)
    {
        return LogLevel::INFO;
    }
    return LogLevel::WARNING;
}

int ControlFlow::Run(const RunOptions& Options)
{
    Log.SetLevel(SelectLogLevel(Options));

    if (!Parser.Parse(ConfigGlobal::ConfigFile))
    {
        for (const auto& Error : Parser.GetErrors())
        {
            Log.Error("Config Error: " + Error);
        }
        Log.Critical("Check Errors in " + ConfigGlobal::ConfigFile + " and Fix Them, Exiting");
        return 1;
    }

    const TransferConfig& Config = Parser.GetConfig();
    Log.Init(Config.LogDir, Config.MaxLogFiles);
    Log.Info("Config Parsed Successfully.");

    for (const auto& Info : Parser.GetInfos())
    {
        Log.Info("Config Info: " + Info);
    }
    LogConfiguration(Options);

    MailReporter Mail(Config.MailServer, Config.Sender, Config.Receivers);
    return Execute(Config, Options, Mail);
}

int ControlFlow::Execute(const TransferConfig& Config, const RunOptions& Options, Reporter& Notifier)
{
    RunReport Report;
    CompletenessChecker Checker(Config.Source, Config.MinimumAge);
    TransferEngine Transfer(Config.Source, Config.Target, Options.TransferEnabled);
    DeletionEngine Deletion(Config.Source, Config.Secondary, Options.DeleteEnabled);
    ExperimentOrchestrator Orchestrator(Config, Checker, Transfer, Deletion);

    FsResult Listing = Orchestrator.Run(Report);
    if (Listing.Status == FsStatus::NotFound)
    {
        Log.Critical("Could not find source directory " + Listing.Detail);
        return 1;
    }
    if (!Listing.Ok())
    {
        Log.Critical(Listing.Describe());
        return 1;
    }

    if (Report.IsEmpty())
    {
        Log.Info("Nothing was transferred, deleted or reported. No mail sent.");
        return 0;
    }

    Log.Info("Sending mail for transferred/deleted experiments");
    std::string Body = ReportFormatter::FormatBody(Report, Options.TransferEnabled, Options.DeleteEnabled);
    if (!Notifier.Send(ConfigGlobal::MailSubject, Body))
    {
        Log.Critical(Notifier.GetLastError());
        return 1;
    }
    return 0;
}

void ControlFlow::LogConfiguration(const RunOptions& Options)
{
    const TransferConfig& Config = Parser.GetConfig();

    Log.Info("Source:    " + Config.Source.string());
    Log.Info("Target:    " + Config.Target.string());
    Log.Info("Secondary: " + Config.Secondary.string());
    Log.Info("Mail:      " + Config.Sender + " via " + Config.MailServer + " to " + std::to_string(Config.Receivers.size()) + " receiver(s)");
    Log.Info(std::string("Transfer:  ") + (Options.TransferEnabled ? "enabled" : "simulated"));
    Log.Info(std::string("Delete:    ") + (Options.DeleteEnabled ? "enabled" : "simulated"));
}
