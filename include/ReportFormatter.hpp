#pragma once

#include <string>

#include "RunReport.hpp"

namespace ReportFormatter
{
    // Plain-text notification body. Sections for empty lists are left out and
    // simulated sections carry a notice that nothing was changed on disk.
    std::string FormatBody(const RunReport& Report, bool TransferEnabled, bool DeleteEnabled);
}
