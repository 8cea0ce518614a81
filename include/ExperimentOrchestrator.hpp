#pragma once

#include <string>
#include <vector>
#include <filesystem>

#include "ConfigParser.hpp"
#include "CompletenessChecker.hpp"
#include "TransferEngine.hpp"
#include "DeletionEngine.hpp"
#include "FsResult.hpp"
#include "RunReport.hpp"

class ExperimentOrchestrator
{
public:
    ExperimentOrchestrator(const TransferConfig& Config, const CompletenessChecker& Checker, TransferEngine& Transfer, DeletionEngine& Deletion);

    // Names under <source>/merfish_output, sorted. NotFound and ListFailed are fatal to the run.
    FsResult ListExperiments(std::vector<std::string>& Experiments) const;

    // Gate sequence for one experiment: target root, category folders, completeness,
    // transfer, then deletion. Benign skips leave the report untouched.
    void ProcessExperiment(const std::string& Experiment, RunReport& Report);

    // Lists and processes every experiment. Only a listing failure is returned as an error;
    // everything else lands in the report.
    FsResult Run(RunReport& Report);

private:
    const TransferConfig& Config;
    const CompletenessChecker& Checker;
    TransferEngine& Transfer;
    DeletionEngine& Deletion;

    bool CheckTargetRoot(RunReport& Report) const;
    bool HasAllCategories(const std::string& Experiment) const;
};
