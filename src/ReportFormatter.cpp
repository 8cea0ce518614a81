#include "ReportFormatter.hpp"

#include <vector>

namespace
{
    std::string JoinLines(const std::vector<std::string>& Lines)
    {
        std::string Joined;
        for (size_t i = 0; i < Lines.size(); ++i)
        {
            if (i > 0)
            {
                Joined += "\n";
            }
            Joined += Lines[i];
        }
        return Joined;
    }
}

namespace ReportFormatter
{
    std::string FormatBody(const RunReport& Report, bool TransferEnabled, bool DeleteEnabled)
    {
        std::string Text;

        if (!Report.Transferred.empty())
        {
            Text += "The following experiments have been transferred:\n";
            if (!TransferEnabled)
            {
                Text += "--- TRANSFER mode was not enabled - no files were transferred ---\n";
            }
            Text += JoinLines(Report.Transferred) + "\n\n";
        }

        if (!Report.Deleted.empty())
        {
            Text += "The following directories have been deleted:\n";
            if (!DeleteEnabled)
            {
                Text += "--- DELETE mode was not enabled - no files were deleted ---\n";
            }
            Text += JoinLines(Report.Deleted) + "\n\n";
        }

        if (!Report.Errors.empty())
        {
            Text += "The following errors have occurred:\n";
            Text += JoinLines(Report.Errors);
        }
        return Text;
    }
}
